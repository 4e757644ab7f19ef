#include <pinch/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pinch {

Result<Config> Config::parse(const std::string& toml_str,
                             const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return PinchError{PinchError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto lvl = (*lg)["level"].value<std::string>()) {
            auto parsed = log::parse_level(*lvl);
            if (parsed.is_err()) {
                auto err = std::move(parsed).error();
                err.file = source;
                return err;
            }
            cfg.log_level = parsed.value();
        }
        if (auto c = (*lg)["color"].value<bool>()) {
            cfg.color = *c;
        }
    }

    // [probe] section
    if (auto probe = doc["probe"].as_table()) {
        if (auto arr = (*probe)["extra-versions"].as_array()) {
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return PinchError{PinchError::Config,
                        "probe.extra-versions entries must be strings",
                        "example: extra-versions = [\"2.5.0\"]", source,
                        static_cast<int>(elem.source().begin.line)};
                }
                auto v = Version::parse(*s);
                if (v.is_err()) {
                    return PinchError{PinchError::Config,
                        "invalid probe version '" + *s + "'",
                        v.error().message, source,
                        static_cast<int>(elem.source().begin.line)};
                }
                cfg.extra_probes.push_back(std::move(v).value());
            }
        } else if ((*probe).contains("extra-versions")) {
            return PinchError{PinchError::Config,
                "probe.extra-versions must be an array of version strings",
                "", source, 0};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PinchError{PinchError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.log_level.has_value()) log_level = other.log_level;
    if (other.color.has_value()) color = other.color;
    extra_probes.insert(extra_probes.end(),
                        other.extra_probes.begin(), other.extra_probes.end());
}

Config Config::effective(const std::optional<Config>& file,
                         const std::optional<Config>& cli) {
    Config result;
    if (file.has_value()) result.merge(file.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pinch/config.toml";
}

Result<std::optional<Config>> discover_config(const std::string& explicit_path) {
    using Found = Result<std::optional<Config>>;

    std::string path = explicit_path;
    if (path.empty()) {
        if (const char* env = std::getenv("PINCH_CONFIG")) {
            path = env;
        }
    }

    if (path.empty()) {
        std::string global = global_config_path();
        std::error_code ec;
        if (global.empty() || !std::filesystem::exists(global, ec)) {
            log::trace("no config file found");
            return Found::ok(std::nullopt);
        }
        path = global;
    }

    log::debug("loading config from %s", path.c_str());
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Found::ok(std::move(cfg).value());
}

} // namespace pinch
