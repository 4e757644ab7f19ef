#pragma once

#include <pinch/result.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pinch {

constexpr const char* kPinchVersion = "0.1.0";

struct CliOptions {
    // Unset until given; an empty string is still a (malformed) specifier
    std::optional<std::string> pkg1;
    std::optional<std::string> pkg2;
    std::string config_path;   // --config, empty = discover
    bool verbose = false;
    bool no_color = false;
    bool help = false;
    bool show_version = false;
    bool stdout_tty = false;   // colour default for the report
};

std::string usage();

// args excludes the program name. Package specifiers may be given as
// -1/--pkg1 and -2/--pkg2 or positionally; "--" ends option parsing.
Result<CliOptions> parse_cli(const std::vector<std::string>& args);

// Loads config, parses both specifiers and writes the report to out.
// Errors are written to err. Returns the process exit code.
int run(const CliOptions& opts, std::ostream& out, std::ostream& err);

} // namespace pinch
