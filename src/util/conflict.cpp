#include <pinch/conflict.hpp>
#include <pinch/log.hpp>

namespace pinch {

const char* result_name(ConflictResult r) {
    switch (r) {
        case ConflictResult::DifferentPackages: return "different-packages";
        case ConflictResult::NoConflict:        return "no-conflict";
        case ConflictResult::Conflict:          return "conflict";
    }
    return "unknown";
}

static Version release(std::uint64_t major, std::uint64_t minor,
                       std::uint64_t patch) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    return v;
}

const std::vector<Version>& probe_versions() {
    static const std::vector<Version> probes = {
        release(0, 1, 0), release(1, 0, 0), release(2, 0, 0),
        release(3, 0, 0), release(4, 0, 0), release(5, 0, 0),
        release(6, 0, 0), release(7, 0, 0),
        release(1, 2, 3), release(2, 3, 4), release(3, 4, 5),
        release(4, 5, 6), release(5, 6, 7),
        release(1, 0, 1), release(2, 0, 1), release(3, 0, 1),
        release(4, 0, 1), release(5, 0, 1),
    };
    return probes;
}

ConflictDetector::ConflictDetector()
    : probes_(probe_versions()) {}

ConflictDetector::ConflictDetector(const std::vector<Version>& extra_probes)
    : probes_(probe_versions())
{
    probes_.insert(probes_.end(), extra_probes.begin(), extra_probes.end());
}

std::optional<Version> ConflictDetector::find_common_version(
    const PackageSpecifier& a,
    const PackageSpecifier& b) const
{
    for (const auto& v : probes_) {
        bool in_a = a.requirement.matches(v);
        bool in_b = b.requirement.matches(v);
        log::trace("probe %s: first=%s second=%s", v.to_string().c_str(),
                   in_a ? "yes" : "no", in_b ? "yes" : "no");
        if (in_a && in_b) {
            return v;
        }
    }
    return std::nullopt;
}

bool ConflictDetector::packages_conflict(const PackageSpecifier& a,
                                         const PackageSpecifier& b) const {
    if (a.name != b.name) return false;
    return !find_common_version(a, b).has_value();
}

ConflictReport ConflictDetector::analyze(const PackageSpecifier& a,
                                         const PackageSpecifier& b) const {
    ConflictReport report;
    if (a.name != b.name) {
        log::debug("'%s' and '%s' are different packages",
                   a.name.str().c_str(), b.name.str().c_str());
        report.result = ConflictResult::DifferentPackages;
        return report;
    }

    report.witness = find_common_version(a, b);
    if (report.witness) {
        log::debug("%s satisfies both requirements",
                   report.witness->to_string().c_str());
        report.result = ConflictResult::NoConflict;
        return report;
    }

    log::debug("none of %zu probe versions satisfies both requirements",
               probes_.size());
    report.result = ConflictResult::Conflict;
    return report;
}

ConflictResult ConflictDetector::check(const PackageSpecifier& a,
                                       const PackageSpecifier& b) const {
    return analyze(a, b).result;
}

bool packages_conflict(const PackageSpecifier& a, const PackageSpecifier& b) {
    return ConflictDetector{}.packages_conflict(a, b);
}

} // namespace pinch
