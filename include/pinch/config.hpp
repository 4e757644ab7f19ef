#pragma once

#include <pinch/result.hpp>
#include <pinch/log.hpp>
#include <pinch/version.hpp>
#include <string>
#include <vector>
#include <optional>

namespace pinch {

// Layered settings: config file first, command line on top.
// Unset fields leave the lower layer (or the built-in default) alone.
struct Config {
    std::optional<log::Level> log_level;   // [log] level
    std::optional<bool> color;             // [log] color
    std::vector<Version> extra_probes;     // [probe] extra-versions

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; source names the file in error locations
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& file,
                            const std::optional<Config>& cli);
};

// ~/.pinch/config.toml, or "" if no home directory is known
std::string global_config_path();

// Explicit path (must exist), else $PINCH_CONFIG (must exist), else the
// global file if present. Returns nullopt when no file applies.
Result<std::optional<Config>> discover_config(const std::string& explicit_path);

} // namespace pinch
