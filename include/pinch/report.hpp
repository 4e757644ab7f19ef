#pragma once

#include <pinch/conflict.hpp>
#include <pinch/specifier.hpp>
#include <optional>
#include <string>

namespace pinch {

struct ReportOptions {
    bool color = false;    // ANSI colour on the verdict line
    bool verbose = false;  // show the version that satisfied both sides
};

// Human-readable analysis of one comparison, newline terminated
std::string format_report(const PackageSpecifier& first,
                          const PackageSpecifier& second,
                          ConflictResult result,
                          const std::optional<Version>& witness,
                          const ReportOptions& options = {});

} // namespace pinch
