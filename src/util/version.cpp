#include <pinch/version.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace pinch {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Split on sep, keeping empty fields ("1..2" -> {"1", "", "2"})
static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// Spaces only; a tab is not valid inside a requirement
static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(' ');
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(' ');
    return s.substr(b, e - b + 1);
}

static bool is_all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

static bool is_wildcard(const std::string& s) {
    return s == "*" || s == "x" || s == "X";
}

// Non-negative decimal without leading zeros, must fit in 64 bits
static bool parse_numeric(const std::string& s, std::uint64_t& out) {
    if (!is_all_digits(s)) return false;
    if (s.size() > 1 && s[0] == '0') return false;

    constexpr std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t n = 0;
    for (char c : s) {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (n > (max - digit) / 10) return false;
        n = n * 10 + digit;
    }
    out = n;
    return true;
}

static Result<std::uint64_t> parse_component(const std::string& part,
                                             const char* what,
                                             const std::string& full) {
    std::uint64_t n = 0;
    if (!parse_numeric(part, n)) {
        if (part.size() > 1 && part[0] == '0' && is_all_digits(part)) {
            return PinchError{PinchError::Version,
                std::string("invalid leading zero in ") + what +
                " version number in '" + full + "'"};
        }
        return PinchError{PinchError::Version,
            std::string("invalid ") + what + " version '" + part +
            "' in '" + full + "'"};
    }
    return Result<std::uint64_t>::ok(n);
}

// Prerelease and build identifiers: non-empty runs of [0-9A-Za-z-] joined
// by dots. Numeric prerelease identifiers may not have leading zeros.
static Status check_identifiers(const std::string& s, const char* what,
                                const std::string& full, bool is_prerelease) {
    if (s.empty()) {
        return PinchError{PinchError::Version,
            std::string("empty ") + what + " in '" + full + "'"};
    }

    for (const auto& id : split(s, '.')) {
        if (id.empty()) {
            return PinchError{PinchError::Version,
                std::string("empty identifier in ") + what + " of '" + full + "'"};
        }
        for (char c : id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
                return PinchError{PinchError::Version,
                    "invalid character '" + std::string(1, c) + "' in " +
                    what + " of '" + full + "'",
                    "allowed: [0-9A-Za-z-]"};
            }
        }
        if (is_prerelease && is_all_digits(id) && id.size() > 1 && id[0] == '0') {
            return PinchError{PinchError::Version,
                "invalid leading zero in prerelease identifier '" + id +
                "' of '" + full + "'"};
        }
    }
    return ok_status();
}

int compare_prerelease(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    auto ia = split(a, '.');
    auto ib = split(b, '.');
    size_t n = std::min(ia.size(), ib.size());

    for (size_t i = 0; i < n; ++i) {
        const std::string& x = ia[i];
        const std::string& y = ib[i];
        if (x == y) continue;

        bool xn = is_all_digits(x);
        bool yn = is_all_digits(y);
        if (xn && yn) {
            // No leading zeros, so longer means larger
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            return x < y ? -1 : 1;
        }
        if (xn) return -1;  // numeric identifiers sort first
        if (yn) return 1;
        return x < y ? -1 : 1;
    }

    if (ia.size() == ib.size()) return 0;
    return ia.size() < ib.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return PinchError{PinchError::Version, "empty version string"};
    }

    Version v;
    std::string core = s;

    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        v.build = core.substr(plus + 1);
        core = core.substr(0, plus);
        PINCH_TRY(check_identifiers(v.build, "build metadata", s, false));
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.pre = core.substr(dash + 1);
        core = core.substr(0, dash);
        PINCH_TRY(check_identifiers(v.pre, "prerelease", s, true));
    }

    auto parts = split(core, '.');
    if (parts.size() != 3) {
        return PinchError{PinchError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-pre][+build]"};
    }

    auto major = parse_component(parts[0], "major", s);
    if (major.is_err()) return std::move(major).error();
    auto minor = parse_component(parts[1], "minor", s);
    if (minor.is_err()) return std::move(minor).error();
    auto patch = parse_component(parts[2], "patch", s);
    if (patch.is_err()) return std::move(patch).error();

    v.major = major.value();
    v.minor = minor.value();
    v.patch = patch.value();
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!pre.empty()) s += "-" + pre;
    if (!build.empty()) s += "+" + build;
    return s;
}

// Build metadata does not take part in precedence
bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && pre == o.pre;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    return compare_prerelease(pre, o.pre) < 0;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return PinchError{PinchError::Version, "empty partial version string"};
    }

    PartialVersion pv;
    std::string core = s;

    // Build metadata is validated, then dropped: it never affects matching
    bool has_build = false;
    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        PINCH_TRY(check_identifiers(core.substr(plus + 1), "build metadata",
                                    s, false));
        core = core.substr(0, plus);
        has_build = true;
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        pv.pre = core.substr(dash + 1);
        core = core.substr(0, dash);
        PINCH_TRY(check_identifiers(pv.pre, "prerelease", s, true));
    }

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return PinchError{PinchError::Version,
            "too many components in partial version '" + s + "'"};
    }

    auto major = parse_component(parts[0], "major", s);
    if (major.is_err()) return std::move(major).error();
    pv.major = major.value();

    if (parts.size() > 1) {
        auto minor = parse_component(parts[1], "minor", s);
        if (minor.is_err()) return std::move(minor).error();
        pv.minor = minor.value();
    }

    if (parts.size() > 2) {
        auto patch = parse_component(parts[2], "patch", s);
        if (patch.is_err()) return std::move(patch).error();
        pv.patch = patch.value();
    }

    if (!pv.pre.empty() && !pv.patch) {
        return PinchError{PinchError::Version,
            "prerelease without patch version in '" + s + "'",
            "a prerelease needs a full major.minor.patch version"};
    }
    if (has_build && !pv.patch) {
        return PinchError{PinchError::Version,
            "unexpected build metadata in '" + s + "'",
            "build metadata needs a full major.minor.patch version"};
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor) {
        s += "." + std::to_string(*minor);
        if (patch) {
            s += "." + std::to_string(*patch);
            if (!pre.empty()) s += "-" + pre;
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------
//
// Unset components follow Cargo: "=1.2" is any 1.2.x, ">1.2" starts at
// 1.3.0, "<=1" stays below 2.0.0. Prerelease fields compare with the empty
// prerelease ranking highest.

static bool matches_exact(const PartialVersion& c, const Version& v) {
    if (v.major != c.major) return false;
    if (c.minor && v.minor != *c.minor) return false;
    if (c.patch && v.patch != *c.patch) return false;
    return v.pre == c.pre;
}

static bool matches_greater(const PartialVersion& c, const Version& v) {
    if (v.major != c.major) return v.major > c.major;
    if (!c.minor) return false;
    if (v.minor != *c.minor) return v.minor > *c.minor;
    if (!c.patch) return false;
    if (v.patch != *c.patch) return v.patch > *c.patch;
    return compare_prerelease(v.pre, c.pre) > 0;
}

static bool matches_less(const PartialVersion& c, const Version& v) {
    if (v.major != c.major) return v.major < c.major;
    if (!c.minor) return false;
    if (v.minor != *c.minor) return v.minor < *c.minor;
    if (!c.patch) return false;
    if (v.patch != *c.patch) return v.patch < *c.patch;
    return compare_prerelease(v.pre, c.pre) < 0;
}

// ~X.Y.Z: >=X.Y.Z, <X.(Y+1).0
static bool matches_tilde(const PartialVersion& c, const Version& v) {
    if (v.major != c.major) return false;
    if (c.minor && v.minor != *c.minor) return false;
    if (c.patch && v.patch != *c.patch) return v.patch > *c.patch;
    return compare_prerelease(v.pre, c.pre) >= 0;
}

// ^X.Y.Z (X>0): >=X.Y.Z, <(X+1).0.0
// ^0.Y.Z (Y>0): >=0.Y.Z, <0.(Y+1).0
// ^0.0.Z:       only 0.0.Z
static bool matches_caret(const PartialVersion& c, const Version& v) {
    if (v.major != c.major) return false;
    if (!c.minor) return true;

    if (!c.patch) {
        if (c.major > 0) return v.minor >= *c.minor;
        return v.minor == *c.minor;
    }

    if (c.major > 0) {
        if (v.minor != *c.minor) return v.minor > *c.minor;
        if (v.patch != *c.patch) return v.patch > *c.patch;
    } else if (*c.minor > 0) {
        if (v.minor != *c.minor) return false;
        if (v.patch != *c.patch) return v.patch > *c.patch;
    } else if (v.minor != *c.minor || v.patch != *c.patch) {
        return false;
    }
    return compare_prerelease(v.pre, c.pre) >= 0;
}

bool VersionConstraint::matches(const Version& v) const {
    switch (op) {
    case ConstraintOp::Exact:
    case ConstraintOp::Wildcard:
        return matches_exact(version, v);
    case ConstraintOp::Greater:
        return matches_greater(version, v);
    case ConstraintOp::GreaterEq:
        return matches_exact(version, v) || matches_greater(version, v);
    case ConstraintOp::Less:
        return matches_less(version, v);
    case ConstraintOp::LessEq:
        return matches_exact(version, v) || matches_less(version, v);
    case ConstraintOp::Tilde:
        return matches_tilde(version, v);
    case ConstraintOp::Caret:
        return matches_caret(version, v);
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Wildcard:
        return version.to_string() + ".*";
    }
    return prefix + version.to_string();
}

Result<VersionConstraint> VersionConstraint::parse(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size() && s[pos] == ' ') ++pos;

    ConstraintOp op = ConstraintOp::Caret; // default, like Cargo
    bool explicit_op = true;
    if (pos + 1 < s.size() && s[pos] == '>' && s[pos + 1] == '=') {
        op = ConstraintOp::GreaterEq;
        pos += 2;
    } else if (pos + 1 < s.size() && s[pos] == '<' && s[pos + 1] == '=') {
        op = ConstraintOp::LessEq;
        pos += 2;
    } else if (pos < s.size() && s[pos] == '>') {
        op = ConstraintOp::Greater;
        ++pos;
    } else if (pos < s.size() && s[pos] == '<') {
        op = ConstraintOp::Less;
        ++pos;
    } else if (pos < s.size() && s[pos] == '=') {
        op = ConstraintOp::Exact;
        ++pos;
    } else if (pos < s.size() && s[pos] == '~') {
        op = ConstraintOp::Tilde;
        ++pos;
    } else if (pos < s.size() && s[pos] == '^') {
        op = ConstraintOp::Caret;
        ++pos;
    } else {
        explicit_op = false;
    }

    std::string ver_str = trim(s.substr(pos));
    if (ver_str.empty()) {
        return PinchError{PinchError::Version,
            "missing version in constraint '" + trim(s) + "'"};
    }

    // Wildcards: "1.*", "1.2.x". Everything after the first wildcard must
    // also be a wildcard. After an explicit operator the wildcard parts are
    // simply left unset: "=3.*" is "=3", ">=1.2.*" is ">=1.2".
    std::string core = ver_str.substr(0, ver_str.find_first_of("-+"));
    auto parts = split(core, '.');
    auto first_wild = std::find_if(parts.begin(), parts.end(), is_wildcard);

    if (first_wild != parts.end()) {
        if (first_wild == parts.begin()) {
            return PinchError{PinchError::Version,
                "wildcard '*' must be the only comparator in a requirement"};
        }
        if (core.size() != ver_str.size() ||
            !std::all_of(first_wild, parts.end(), is_wildcard)) {
            return PinchError{PinchError::Version,
                "unexpected text after wildcard in '" + trim(s) + "'"};
        }

        std::string prefix;
        for (auto it = parts.begin(); it != first_wild; ++it) {
            if (!prefix.empty()) prefix += ".";
            prefix += *it;
        }

        auto pv = PartialVersion::parse(prefix);
        if (pv.is_err()) return std::move(pv).error();

        VersionConstraint vc;
        vc.op = explicit_op ? op : ConstraintOp::Wildcard;
        vc.version = std::move(pv).value();
        return Result<VersionConstraint>::ok(std::move(vc));
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();

    VersionConstraint vc;
    vc.op = op;
    vc.version = std::move(pv).value();
    return Result<VersionConstraint>::ok(std::move(vc));
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

VersionReq VersionReq::any() {
    return VersionReq{};
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty()) {
        return PinchError{PinchError::Version, "empty version requirement"};
    }

    if (is_wildcard(text)) {
        return Result<VersionReq>::ok(any());
    }

    VersionReq req;
    for (const auto& token : split(text, ',')) {
        std::string piece = trim(token);
        if (piece.empty()) {
            return PinchError{PinchError::Version,
                "empty comparator in version requirement '" + text + "'"};
        }
        if (is_wildcard(piece)) {
            return PinchError{PinchError::Version,
                "wildcard '" + piece + "' must be the only comparator in '" +
                text + "'"};
        }

        auto c = VersionConstraint::parse(piece);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    bool all = std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
    if (!all) return false;
    if (v.pre.empty()) return true;

    // A prerelease only matches when some comparator opts in to
    // prereleases of that exact major.minor.patch
    return std::any_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) {
            return c.version.major == v.major &&
                   c.version.minor == v.minor &&
                   c.version.patch == v.patch &&
                   !c.version.pre.empty();
        });
}

std::string VersionReq::to_string() const {
    if (constraints.empty()) return "*";

    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace pinch
