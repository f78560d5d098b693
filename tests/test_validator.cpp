#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

#include "TestSupport.hpp"
#include "nlohmann/json.hpp"
#include "placement/Solver.hpp"
#include "placement/Validator.hpp"

using namespace placement;
using testsupport::candidate;
using testsupport::slot;

namespace {

struct Fixture {
    std::vector<Candidate> cs{candidate("X", "rural"), candidate("Y"), candidate("Z")};
    std::vector<Slot> ss{slot("S", 2, {{"rural", 1}})};
    AllocationArtifact artifact;

    Fixture() {
        const ScoreMatrix m = testsupport::matrix(cs, ss, {{0.4}, {0.9}, {0.8}});
        artifact.schedule = testsupport::plan(cs, ss, m);
        artifact.allocation = solve_allocation("r1", cs, ss, m, artifact.schedule);
    }

    ValidationReport check() const { return validate_allocation(cs, ss, artifact); }

    AllocationEntry& entry_of(const std::string& id) {
        for (auto& e : artifact.allocation.entries) {
            if (e.candidate_id == id) return e;
        }
        FAIL("no entry for " << id);
        throw std::logic_error("unreachable");
    }
};

bool has_code(const ValidationReport& rep, const std::string& code) {
    return std::any_of(rep.issues.begin(), rep.issues.end(),
                       [&](const ValidationIssue& i) { return i.code == code; });
}

}  // namespace

TEST_CASE("solver output passes validation", "[validator]") {
    Fixture f;
    const ValidationReport rep = f.check();
    CHECK(rep.pass);
    CHECK(rep.issues.empty());
}

TEST_CASE("capacity and duplicate violations are flagged", "[validator]") {
    Fixture f;

    SECTION("over capacity") {
        AllocationEntry extra = f.entry_of("Y");
        extra.candidate_id = "Z";
        extra.score.candidate_id = "Z";
        f.artifact.allocation.entries.push_back(extra);
        f.artifact.allocation.unmatched.clear();

        const ValidationReport rep = f.check();
        CHECK_FALSE(rep.pass);
        CHECK(has_code(rep, "over_capacity"));
        CHECK_FALSE(has_code(rep, "duplicate_candidate"));
    }

    SECTION("same candidate twice") {
        f.artifact.allocation.entries.push_back(f.entry_of("Y"));
        const ValidationReport rep = f.check();
        CHECK(has_code(rep, "duplicate_candidate"));
    }
}

TEST_CASE("references and scores are cross-checked", "[validator]") {
    Fixture f;

    SECTION("unknown slot") {
        f.entry_of("Y").slot_id = "nowhere";
        const ValidationReport rep = f.check();
        CHECK(has_code(rep, "unknown_slot"));
        CHECK(has_code(rep, "score_mismatch"));
    }

    SECTION("breakdown does not add up") {
        f.entry_of("Y").score.composite += 0.1;
        const ValidationReport rep = f.check();
        CHECK(has_code(rep, "breakdown_sum_mismatch"));
        CHECK_FALSE(has_code(rep, "composite_out_of_range"));
    }

    SECTION("excluded entity assigned") {
        ExcludedEntity x;
        x.entity_id = "Y";
        x.entity_kind = "candidate";
        x.code = "non_finite";
        f.artifact.excluded.push_back(x);
        CHECK(has_code(f.check(), "excluded_entity_assigned"));
    }

    SECTION("ineligible pair") {
        f.cs[1].excluded_sectors = {"retail"};
        f.ss[0].sector = "Retail";
        CHECK(has_code(f.check(), "ineligible_assignment"));
    }
}

TEST_CASE("quota and accounting gaps are flagged", "[validator]") {
    Fixture f;

    SECTION("floor unmet without waiver") {
        auto& entries = f.artifact.allocation.entries;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const AllocationEntry& e) { return e.candidate_id == "X"; }),
                      entries.end());
        f.artifact.allocation.unmatched.push_back({"X", kReasonNoSeat});

        const ValidationReport rep = f.check();
        CHECK(has_code(rep, "floor_unmet"));
        CHECK_FALSE(has_code(rep, "unaccounted_candidate"));

        QuotaWaiver w;
        w.slot_id = "S";
        w.category = "rural";
        w.floor = 1;
        w.reason = kWaiverInsufficientCandidates;
        f.artifact.allocation.waivers.push_back(w);
        CHECK_FALSE(has_code(f.check(), "floor_unmet"));
    }

    SECTION("candidate missing from the outcome") {
        f.artifact.allocation.unmatched.clear();
        const ValidationReport rep = f.check();
        CHECK(has_code(rep, "unaccounted_candidate"));
    }

    SECTION("unmatched without reason") {
        f.artifact.allocation.unmatched[0].reason.clear();
        CHECK(has_code(f.check(), "missing_reason"));
    }
}

TEST_CASE("validation report is written as JSON", "[validator]") {
    Fixture f;
    f.artifact.allocation.unmatched.clear();
    const ValidationReport rep = f.check();

    testsupport::TempDir dir;
    const auto path = dir.path() / "reports" / "validation_report.json";
    write_validation_report(path, rep);

    std::ifstream in(path);
    REQUIRE(in);
    nlohmann::json j;
    in >> j;
    CHECK(j.at("pass") == false);
    REQUIRE(j.at("issues").size() == rep.issues.size());
    CHECK(j.at("issues")[0].at("code") == "unaccounted_candidate");
    CHECK(j.at("issues")[0].at("entity_id") == "Z");
}
