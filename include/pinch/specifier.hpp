#pragma once

#include <pinch/result.hpp>
#include <pinch/name.hpp>
#include <pinch/version.hpp>
#include <string>

namespace pinch {

// Python-style package specifier: "requests", "django==3.2.0",
// "numpy>=1.20,<2.0"
struct PackageSpecifier {
    PkgName name;
    VersionReq requirement;  // "*" when no constraint is given

    // Leading [a-zA-Z0-9_-]+ is the name, the remainder the constraint.
    // Errors: InvalidFormat (no leading name), InvalidRequirement.
    static Result<PackageSpecifier> parse(const std::string& raw);

    // "<name> <requirement>"
    std::string to_string() const;
};

// Rewrites Python comparison operators into comparator syntax:
// "==" -> "=", "~=" -> "~", "!=" -> "!". ">=" and "<=" are unchanged.
// "!" is not a comparator, so "!=" constraints are rejected later.
std::string translate_python_ops(const std::string& constraint);

} // namespace pinch
