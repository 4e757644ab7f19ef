#include <catch2/catch.hpp>
#include <pinch/config.hpp>
#include <filesystem>
#include <fstream>

using namespace pinch;
namespace fs = std::filesystem;

static fs::path write_temp_config(const std::string& name, const std::string& body) {
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream out(p);
    out << body;
    return p;
}

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().color == false);
}

TEST_CASE("parse config with extra probe versions", "[config]") {
    auto r = Config::parse(R"(
[probe]
extra-versions = ["2.5.0", "3.1.4-rc.1"]
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().extra_probes.size() == 2);
    REQUIRE(r.value().extra_probes[0].to_string() == "2.5.0");
    REQUIRE(r.value().extra_probes[1].pre == "rc.1");
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().color.has_value());
    REQUIRE(r.value().extra_probes.empty());
}

TEST_CASE("unknown keys are ignored", "[config]") {
    auto r = Config::parse(R"(
[log]
format = "json"

[output]
width = 80
)");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml", "bad.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::Parse);
    REQUIRE(r.error().file == "bad.toml");
    REQUIRE(r.error().line == 1);
}

TEST_CASE("bad log level is a config error", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "chatty"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::Config);
}

TEST_CASE("bad probe version is a config error", "[config]") {
    auto r = Config::parse("[probe]\nextra-versions = [\"2.5\"]\n", "pinch.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::Config);
    REQUIRE(r.error().message.find("2.5") != std::string::npos);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("non-string probe entry is a config error", "[config]") {
    auto r = Config::parse("[probe]\nextra-versions = [250]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::Config);
}

TEST_CASE("probe extra-versions must be an array", "[config]") {
    auto r = Config::parse("[probe]\nextra-versions = \"2.5.0\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::Config);
}

// ===== Merge / effective =====

TEST_CASE("merge overrides only set fields", "[config]") {
    auto base = Config::parse(R"(
[log]
level = "warn"
color = true
)").value();

    Config overlay;
    overlay.log_level = log::Debug;

    base.merge(overlay);
    REQUIRE(base.log_level == log::Debug);  // overridden
    REQUIRE(base.color == true);            // preserved
}

TEST_CASE("merge appends probe versions", "[config]") {
    auto base = Config::parse("[probe]\nextra-versions = [\"2.5.0\"]\n").value();
    auto overlay = Config::parse("[probe]\nextra-versions = [\"3.5.0\"]\n").value();
    base.merge(overlay);
    REQUIRE(base.extra_probes.size() == 2);
    REQUIRE(base.extra_probes[1].to_string() == "3.5.0");
}

TEST_CASE("effective config layering", "[config]") {
    auto file = Config::parse(R"(
[log]
level = "trace"
color = true
)").value();

    Config cli;
    cli.color = false;

    auto eff = Config::effective(file, cli);
    REQUIRE(eff.log_level == log::Trace);
    REQUIRE(eff.color == false);
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective({}, {});
    REQUIRE_FALSE(eff.log_level.has_value());
    REQUIRE(eff.extra_probes.empty());
}

// ===== Loading / discovery =====

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/pinch/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::IO);
}

TEST_CASE("discover_config with explicit path", "[config]") {
    auto path = write_temp_config("pinch_test_config.toml",
                                  "[log]\nlevel = \"error\"\n");
    auto r = discover_config(path.string());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_value());
    REQUIRE(r.value()->log_level == log::Error);
    fs::remove(path);
}

TEST_CASE("discover_config with missing explicit path fails", "[config]") {
    auto r = discover_config("/nonexistent/pinch/explicit.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinchError::IO);
}

TEST_CASE("global config path contains .pinch", "[config]") {
    auto path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.find(".pinch/config.toml") != std::string::npos);
    }
}
