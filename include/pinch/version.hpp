#pragma once

#include <pinch/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pinch {

// Full version: major.minor.patch[-pre][+build]
struct Version {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::string pre;    // dot-separated prerelease identifiers, e.g. "rc.1"
    std::string build;  // build metadata, ignored for precedence

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// SemVer 2.0 prerelease precedence. An empty prerelease ranks above any
// non-empty one. Returns <0, 0 or >0.
int compare_prerelease(const std::string& a, const std::string& b);

// Partial version for comparators: "1", "1.2", "1.2.3", "1.2.3-beta".
// Build metadata after a full version ("1.2.3+cu118") is accepted and
// dropped.
struct PartialVersion {
    std::uint64_t major = 0;
    std::optional<std::uint64_t> minor;
    std::optional<std::uint64_t> patch;
    std::string pre; // only allowed when patch is set

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    Greater,     // >1.2.3
    GreaterEq,   // >=1.2.3
    Less,        // <1.2.3
    LessEq,      // <=1.2.3
    Tilde,       // ~1.2.3 (patch-level changes)
    Caret,       // ^1.2.3 (compatible with), also the default
    Wildcard,    // 1.*, 1.2.*
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Caret;
    PartialVersion version;

    static Result<VersionConstraint> parse(const std::string& s);

    // Ignores the prerelease opt-in rule; see VersionReq::matches
    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound constraint: ">=1.0.0, <2.0.0". All constraints must match.
// An empty constraint list is the unconstrained requirement "*".
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static VersionReq any();
    static Result<VersionReq> parse(const std::string& s);

    bool is_any() const { return constraints.empty(); }
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace pinch
