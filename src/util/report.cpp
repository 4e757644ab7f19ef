#include <pinch/report.hpp>

namespace pinch {

static const char* kGreen = "\033[32m";
static const char* kBoldRed = "\033[1;31m";
static const char* kReset = "\033[0m";

static std::string paint(const std::string& text, const char* style, bool color) {
    if (!color) return text;
    return std::string(style) + text + kReset;
}

std::string format_report(const PackageSpecifier& first,
                          const PackageSpecifier& second,
                          ConflictResult result,
                          const std::optional<Version>& witness,
                          const ReportOptions& options) {
    std::string out;
    out += "\nAnalyzing potential conflicts between:\n";
    out += "  Package 1: " + first.to_string() + "\n";
    out += "  Package 2: " + second.to_string() + "\n\n";

    switch (result) {
    case ConflictResult::DifferentPackages:
        out += paint("No conflict: Different packages", kGreen, options.color) + "\n";
        break;

    case ConflictResult::NoConflict:
        out += paint("No conflict detected", kGreen, options.color) + "\n";
        out += "The version requirements are compatible.\n";
        if (options.verbose && witness) {
            out += "  satisfied by: " + witness->to_string() + "\n";
        }
        break;

    case ConflictResult::Conflict:
        out += paint("CONFLICT DETECTED!", kBoldRed, options.color) + "\n";
        out += "The version requirements are mutually exclusive.\n";
        break;
    }

    return out;
}

} // namespace pinch
