#include <pinch/cli.hpp>
#include <pinch/config.hpp>
#include <pinch/conflict.hpp>
#include <pinch/log.hpp>
#include <pinch/report.hpp>
#include <pinch/specifier.hpp>
#include <optional>
#include <ostream>

namespace pinch {

std::string usage() {
    return
        "usage: pinch [options] <pkg1> <pkg2>\n"
        "       pinch -1 <pkg1> -2 <pkg2>\n"
        "\n"
        "Check whether two package version constraints can be satisfied\n"
        "together, e.g. pinch 'requests>=2.0.0' 'requests<3.0.0'\n"
        "\n"
        "options:\n"
        "  -1, --pkg1 <spec>   first package with version constraint\n"
        "  -2, --pkg2 <spec>   second package with version constraint\n"
        "      --config <path> config file (default: $PINCH_CONFIG or\n"
        "                      ~/.pinch/config.toml)\n"
        "  -v, --verbose       debug logging, show the matching version\n"
        "      --no-color      disable coloured output\n"
        "  -h, --help          show this help\n"
        "  -V, --version       show version\n";
}

static PinchError arg_error(const std::string& msg) {
    return PinchError{PinchError::InvalidArg, msg, "run 'pinch --help' for usage"};
}

Result<CliOptions> parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        // --name=value
        std::string key = arg;
        std::optional<std::string> inline_value;
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            key = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        auto take_value = [&]() -> Result<std::string> {
            if (inline_value) return Result<std::string>::ok(*inline_value);
            if (i + 1 >= args.size()) {
                return arg_error("option '" + key + "' requires a value");
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (key == "--") {
            options_done = true;
        } else if (key == "-1" || key == "--pkg1") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            opts.pkg1 = v.value();
        } else if (key == "-2" || key == "--pkg2") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            opts.pkg2 = v.value();
        } else if (key == "--config") {
            auto v = take_value();
            if (v.is_err()) return std::move(v).error();
            opts.config_path = v.value();
        } else if (key == "-v" || key == "--verbose") {
            opts.verbose = true;
        } else if (key == "--no-color") {
            opts.no_color = true;
        } else if (key == "-h" || key == "--help") {
            opts.help = true;
        } else if (key == "-V" || key == "--version") {
            opts.show_version = true;
        } else {
            return arg_error("unknown option '" + arg + "'");
        }
    }

    for (const auto& p : positional) {
        if (!opts.pkg1) {
            opts.pkg1 = p;
        } else if (!opts.pkg2) {
            opts.pkg2 = p;
        } else {
            return arg_error("unexpected argument '" + p + "'");
        }
    }

    if (opts.help || opts.show_version) {
        return Result<CliOptions>::ok(std::move(opts));
    }

    if (!opts.pkg1 || !opts.pkg2) {
        return arg_error("two package specifiers are required");
    }

    return Result<CliOptions>::ok(std::move(opts));
}

int run(const CliOptions& opts, std::ostream& out, std::ostream& err) {
    if (opts.help) {
        out << usage();
        return 0;
    }
    if (opts.show_version) {
        out << "pinch " << kPinchVersion << "\n";
        return 0;
    }

    auto file_cfg = discover_config(opts.config_path);
    if (file_cfg.is_err()) {
        err << file_cfg.error().format() << "\n";
        return 1;
    }

    Config cli_cfg;
    if (opts.verbose) cli_cfg.log_level = log::Debug;
    if (opts.no_color) cli_cfg.color = false;

    Config cfg = Config::effective(file_cfg.value(), cli_cfg);
    if (cfg.log_level) log::set_level(*cfg.log_level);
    if (cfg.color) log::set_color_enabled(*cfg.color);

    auto first = PackageSpecifier::parse(opts.pkg1.value_or(""));
    if (first.is_err()) {
        err << first.error().format() << "\n";
        return 1;
    }
    auto second = PackageSpecifier::parse(opts.pkg2.value_or(""));
    if (second.is_err()) {
        err << second.error().format() << "\n";
        return 1;
    }

    ConflictDetector detector(cfg.extra_probes);
    ConflictReport analysis = detector.analyze(first.value(), second.value());
    log::debug("result: %s", result_name(analysis.result));

    ReportOptions report;
    report.color = cfg.color.value_or(opts.stdout_tty);
    report.verbose = opts.verbose;
    out << format_report(first.value(), second.value(), analysis.result,
                         analysis.witness, report);
    return 0;
}

} // namespace pinch
