#include <catch2/catch.hpp>
#include <pinch/conflict.hpp>

using namespace pinch;

static PackageSpecifier P(const std::string& s) {
    auto r = PackageSpecifier::parse(s);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Probe set =====

TEST_CASE("probe set is the fixed 18-version list in order", "[conflict]") {
    const char* expected[] = {
        "0.1.0", "1.0.0", "2.0.0", "3.0.0", "4.0.0", "5.0.0", "6.0.0", "7.0.0",
        "1.2.3", "2.3.4", "3.4.5", "4.5.6", "5.6.7",
        "1.0.1", "2.0.1", "3.0.1", "4.0.1", "5.0.1",
    };
    const auto& probes = probe_versions();
    REQUIRE(probes.size() == 18);
    for (size_t i = 0; i < probes.size(); ++i) {
        REQUIRE(probes[i].to_string() == expected[i]);
    }
}

TEST_CASE("extra probes are appended after the built-in set", "[conflict]") {
    ConflictDetector detector({Version::parse("2.5.0").value()});
    REQUIRE(detector.probes().size() == 19);
    REQUIRE(detector.probes().front().to_string() == "0.1.0");
    REQUIRE(detector.probes().back().to_string() == "2.5.0");
}

// ===== Basic scenarios =====

TEST_CASE("overlapping ranges do not conflict", "[conflict]") {
    REQUIRE_FALSE(packages_conflict(P("requests>=2.0.0"), P("requests<3.0.0")));
    REQUIRE_FALSE(packages_conflict(P("django>=2.0.0"), P("django<5.0.0")));
}

TEST_CASE("disjoint ranges conflict", "[conflict]") {
    REQUIRE(packages_conflict(P("django>=4.0.0"), P("django<3.0.0")));
    REQUIRE(packages_conflict(P("django>=5.0.0"), P("django<4.0.0")));
}

TEST_CASE("exact requirements", "[conflict]") {
    REQUIRE_FALSE(packages_conflict(P("pytest==6.0.0"), P("pytest==6.0.0")));
    REQUIRE(packages_conflict(P("pytest==7.0.0"), P("pytest==6.0.0")));
}

TEST_CASE("boundary: exact version at lower bound", "[conflict]") {
    REQUIRE_FALSE(packages_conflict(P("django==3.0.0"), P("django>=3.0.0")));
}

TEST_CASE("different packages never conflict", "[conflict]") {
    REQUIRE_FALSE(packages_conflict(P("requests>=2.0.0"), P("flask>=2.0.0")));
    REQUIRE_FALSE(packages_conflict(P("a==1.0.0"), P("b==2.0.0")));
}

TEST_CASE("unconstrained side matches anything in the probe set", "[conflict]") {
    REQUIRE_FALSE(packages_conflict(P("requests"), P("requests==5.6.7")));
    REQUIRE_FALSE(packages_conflict(P("requests"), P("requests")));
}

TEST_CASE("conflict is symmetric", "[conflict]") {
    const char* specs[] = {
        "django", "django>=4.0.0", "django<3.0.0", "django==3.0.0",
        "django~=1.2", "django>=2.0,<2.1", "django==2.3.4",
    };
    for (const char* a : specs) {
        for (const char* b : specs) {
            INFO(a << " vs " << b);
            REQUIRE(packages_conflict(P(a), P(b)) == packages_conflict(P(b), P(a)));
        }
    }
}

// ===== Heuristic behaviour =====

TEST_CASE("overlap between probes is reported as a conflict", "[conflict]") {
    // 2.5.x satisfies both, but no probe lies in [2.5.0, 2.6.0)
    auto a = P("lib>=2.5.0");
    auto b = P("lib<2.6.0");
    REQUIRE(packages_conflict(a, b));
}

TEST_CASE("extra probe closes the gap", "[conflict]") {
    auto a = P("lib>=2.5.0");
    auto b = P("lib<2.6.0");
    ConflictDetector detector({Version::parse("2.5.0").value()});
    REQUIRE_FALSE(detector.packages_conflict(a, b));
    REQUIRE(detector.find_common_version(a, b)->to_string() == "2.5.0");
}

TEST_CASE("find_common_version returns the first matching probe", "[conflict]") {
    auto w = ConflictDetector{}.find_common_version(P("requests>=2.0.0"), P("requests<3.0.0"));
    REQUIRE(w.has_value());
    REQUIRE(w->to_string() == "2.0.0");

    auto tilde = ConflictDetector{}.find_common_version(P("x~=1.2"), P("x>=1.0"));
    REQUIRE(tilde.has_value());
    REQUIRE(tilde->to_string() == "1.2.3");

    REQUIRE_FALSE(ConflictDetector{}.find_common_version(P("x==9.0.0"), P("x")).has_value());
}

// ===== check() =====

TEST_CASE("check reports all three outcomes", "[conflict]") {
    ConflictDetector detector;
    REQUIRE(detector.check(P("requests>=2"), P("flask<1")) == ConflictResult::DifferentPackages);
    REQUIRE(detector.check(P("requests>=2.0.0"), P("requests<3.0.0")) == ConflictResult::NoConflict);
    REQUIRE(detector.check(P("django>=4.0.0"), P("django<3.0.0")) == ConflictResult::Conflict);
}

TEST_CASE("analyze returns the outcome with its witness", "[conflict]") {
    ConflictDetector detector;

    auto ok = detector.analyze(P("requests>=2.0.0"), P("requests<3.0.0"));
    REQUIRE(ok.result == ConflictResult::NoConflict);
    REQUIRE(ok.witness.has_value());
    REQUIRE(ok.witness->to_string() == "2.0.0");

    auto bad = detector.analyze(P("django>=4.0.0"), P("django<3.0.0"));
    REQUIRE(bad.result == ConflictResult::Conflict);
    REQUIRE_FALSE(bad.witness.has_value());

    auto diff = detector.analyze(P("a==7.0.0"), P("b==7.0.0"));
    REQUIRE(diff.result == ConflictResult::DifferentPackages);
    REQUIRE_FALSE(diff.witness.has_value());
}

TEST_CASE("wildcard with explicit operator takes part in checks", "[conflict]") {
    auto r = ConflictDetector{}.analyze(P("django==3.*"), P("django>=3.0"));
    REQUIRE(r.result == ConflictResult::NoConflict);
    REQUIRE(r.witness->to_string() == "3.0.0");

    REQUIRE(ConflictDetector{}.check(P("django==3.*"), P("django>=4.0")) ==
            ConflictResult::Conflict);
}

TEST_CASE("check does not probe when names differ", "[conflict]") {
    // Would conflict if the names matched
    REQUIRE(ConflictDetector{}.check(P("a==7.0.0"), P("b==6.0.0")) ==
            ConflictResult::DifferentPackages);
}

TEST_CASE("result_name", "[conflict]") {
    REQUIRE(std::string(result_name(ConflictResult::DifferentPackages)) == "different-packages");
    REQUIRE(std::string(result_name(ConflictResult::NoConflict)) == "no-conflict");
    REQUIRE(std::string(result_name(ConflictResult::Conflict)) == "conflict");
}
