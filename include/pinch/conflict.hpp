#pragma once

#include <pinch/specifier.hpp>
#include <pinch/version.hpp>
#include <optional>
#include <vector>

namespace pinch {

enum class ConflictResult {
    DifferentPackages,  // names differ, nothing was compared
    NoConflict,         // some probe version satisfies both
    Conflict,           // no probe version satisfies both
};

const char* result_name(ConflictResult r);

struct ConflictReport {
    ConflictResult result = ConflictResult::DifferentPackages;
    std::optional<Version> witness;  // set only for NoConflict
};

// Fixed candidate set used to sample both requirements, in probe order
const std::vector<Version>& probe_versions();

// Decides whether two requirements on the same package can both be met by
// testing them against a finite set of candidate versions. This is a
// heuristic: ranges that only overlap between probes are reported as
// conflicting.
class ConflictDetector {
public:
    ConflictDetector();

    // Extra versions are tried after the built-in probe set
    explicit ConflictDetector(const std::vector<Version>& extra_probes);

    // First probe accepted by both requirements. Names are not checked.
    std::optional<Version> find_common_version(const PackageSpecifier& a,
                                               const PackageSpecifier& b) const;

    // False when names differ
    bool packages_conflict(const PackageSpecifier& a,
                           const PackageSpecifier& b) const;

    // Outcome plus the version that satisfied both, from a single pass
    // over the candidates
    ConflictReport analyze(const PackageSpecifier& a,
                           const PackageSpecifier& b) const;

    ConflictResult check(const PackageSpecifier& a,
                         const PackageSpecifier& b) const;

    const std::vector<Version>& probes() const { return probes_; }

private:
    std::vector<Version> probes_;
};

// Same as ConflictDetector{}.packages_conflict(a, b)
bool packages_conflict(const PackageSpecifier& a, const PackageSpecifier& b);

} // namespace pinch
