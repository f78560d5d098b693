#include <catch2/catch.hpp>

#include <string>

#include "TestSupport.hpp"
#include "placement/Errors.hpp"
#include "placement/Solver.hpp"

using namespace placement;
using testsupport::candidate;
using testsupport::matrix;
using testsupport::slot;

namespace {

Allocation solve(const std::vector<Candidate>& cs, const std::vector<Slot>& ss,
                 const std::vector<std::vector<double>>& values, QuotaPolicy policy = {},
                 SolverConfig cfg = {}) {
    const ScoreMatrix m = matrix(cs, ss, values);
    const QuotaSchedule schedule = testsupport::plan(cs, ss, m, std::move(policy));
    return solve_allocation("r1", cs, ss, m, schedule, cfg);
}

std::string reason_of(const Allocation& a, const std::string& id) {
    for (const auto& u : a.unmatched) {
        if (u.candidate_id == id) return u.reason;
    }
    return "";
}

}  // namespace

TEST_CASE("single seat goes to the best candidate", "[solver]") {
    const std::vector<Candidate> cs{candidate("A"), candidate("B"), candidate("C")};
    const std::vector<Slot> ss{slot("S1")};

    const Allocation a = solve(cs, ss, {{0.9}, {0.7}, {0.5}});

    CHECK(a.round_id == "r1");
    REQUIRE(a.entries.size() == 1);
    CHECK(a.entries[0].candidate_id == "A");
    CHECK(a.entries[0].slot_id == "S1");
    CHECK_FALSE(a.entries[0].via_quota);
    CHECK(a.entries[0].confidence == "high");

    REQUIRE(a.unmatched.size() == 2);
    CHECK(reason_of(a, "B") == kReasonNoSeat);
    CHECK(reason_of(a, "C") == kReasonNoSeat);
    CHECK(a.waivers.empty());
}

TEST_CASE("reserved seat is filled before open competition", "[solver]") {
    const std::vector<Candidate> cs{candidate("X", "rural"), candidate("Y"), candidate("Z")};
    const std::vector<Slot> ss{slot("S", 2, {{"rural", 1}})};

    const Allocation a = solve(cs, ss, {{0.4}, {0.9}, {0.8}});

    REQUIRE(a.entries.size() == 2);
    const AllocationEntry* x = a.find("X");
    const AllocationEntry* y = a.find("Y");
    REQUIRE(x != nullptr);
    REQUIRE(y != nullptr);
    CHECK(x->via_quota);
    CHECK(x->quota_category == "rural");
    CHECK_FALSE(y->via_quota);

    CHECK(a.find("Z") == nullptr);
    CHECK(reason_of(a, "Z") == kReasonNoSeat);
    CHECK(a.assigned_count("S") == 2);
}

TEST_CASE("equal scores favour the earlier submission", "[solver]") {
    const std::vector<Candidate> cs{candidate("late", "general", 50), candidate("early", "general", 10)};
    const std::vector<Slot> ss{slot("S")};

    const Allocation a = solve(cs, ss, {{0.8}, {0.8}});

    REQUIRE(a.entries.size() == 1);
    CHECK(a.entries[0].candidate_id == "early");
    CHECK(reason_of(a, "late") == kReasonNoSeat);
}

TEST_CASE("total compatibility beats greedy first-choice", "[solver]") {
    const std::vector<Candidate> cs{candidate("A"), candidate("B")};
    const std::vector<Slot> ss{slot("S1"), slot("S2")};

    const Allocation a = solve(cs, ss, {{0.9, 0.8}, {0.85, 0.1}});

    REQUIRE(a.entries.size() == 2);
    // entries follow slot order
    CHECK(a.entries[0].slot_id == "S1");
    CHECK(a.entries[0].candidate_id == "B");
    CHECK(a.entries[1].slot_id == "S2");
    CHECK(a.entries[1].candidate_id == "A");
    CHECK(a.unmatched.empty());
}

TEST_CASE("category ceiling leaves seats to other categories", "[solver]") {
    const std::vector<Candidate> cs{candidate("U1", "urban"), candidate("U2", "urban"), candidate("R1", "rural")};
    const std::vector<Slot> ss{slot("S", 4)};

    QuotaPolicy policy;
    policy.categories["urban"].max_fraction = 0.25;

    const Allocation a = solve(cs, ss, {{0.9}, {0.8}, {0.3}}, policy);

    REQUIRE(a.entries.size() == 2);
    CHECK(a.find("U1") != nullptr);
    CHECK(a.find("R1") != nullptr);
    CHECK(reason_of(a, "U2") == kReasonCeilingReached);
}

TEST_CASE("unmatched reasons distinguish ineligible and low scores", "[solver]") {
    const std::vector<Candidate> cs{candidate("good"), candidate("weak"), candidate("blocked")};
    const std::vector<Slot> ss{slot("S", 3)};

    SolverConfig cfg;
    cfg.min_score = 0.5;

    const Allocation a = solve(cs, ss, {{0.7}, {0.3}, {-1.0}}, {}, cfg);

    REQUIRE(a.entries.size() == 1);
    CHECK(a.entries[0].candidate_id == "good");
    CHECK(reason_of(a, "weak") == kReasonBelowMinScore);
    CHECK(reason_of(a, "blocked") == kReasonIneligible);
}

TEST_CASE("unfillable reserved seat", "[solver]") {
    const std::vector<Candidate> cs{candidate("G")};
    const std::vector<Slot> ss{slot("S", 1, {{"rural", 1}})};

    SECTION("is waived by default and the seat opens up") {
        const Allocation a = solve(cs, ss, {{0.9}});

        REQUIRE(a.waivers.size() == 1);
        CHECK(a.waivers[0].slot_id == "S");
        CHECK(a.waivers[0].category == "rural");
        CHECK(a.waivers[0].floor == 1);
        CHECK(a.waivers[0].filled == 0);
        CHECK(a.waivers[0].reason == kWaiverInsufficientCandidates);

        REQUIRE(a.entries.size() == 1);
        CHECK(a.entries[0].candidate_id == "G");
    }

    SECTION("fails the solve under strict floors") {
        SolverConfig cfg;
        cfg.waive_unfilled_floors = false;
        CHECK_THROWS_AS(solve(cs, ss, {{0.9}}, {}, cfg), SolverError);
    }
}

TEST_CASE("multi-seat slot fills to capacity in submission order", "[solver]") {
    std::vector<Candidate> cs;
    for (int i = 0; i < 5; ++i) cs.push_back(candidate("c" + std::to_string(i), "general", 100 - i));
    const std::vector<Slot> ss{slot("S", 3)};

    const Allocation a = solve(cs, ss, {{0.5}, {0.9}, {0.2}, {0.7}, {0.6}});

    REQUIRE(a.entries.size() == 3);
    CHECK(a.assigned_count("S") == 3);
    // c4 was submitted first, then c3, then c1
    CHECK(a.entries[0].candidate_id == "c4");
    CHECK(a.entries[1].candidate_id == "c3");
    CHECK(a.entries[2].candidate_id == "c1");

    REQUIRE(a.unmatched.size() == 2);
    CHECK(reason_of(a, "c0") == kReasonNoSeat);
    CHECK(reason_of(a, "c2") == kReasonNoSeat);
}

TEST_CASE("empty rounds produce empty allocations", "[solver]") {
    const std::vector<Candidate> none;
    const std::vector<Slot> ss{slot("S")};
    const Allocation a = solve(none, ss, {});
    CHECK(a.entries.empty());
    CHECK(a.unmatched.empty());

    const std::vector<Candidate> cs{candidate("A")};
    const std::vector<Slot> no_slots;
    const Allocation b = solve(cs, no_slots, {{}});
    CHECK(b.entries.empty());
    REQUIRE(b.unmatched.size() == 1);
    CHECK(b.unmatched[0].reason == kReasonIneligible);
}

TEST_CASE("mismatched inputs are rejected", "[solver]") {
    const std::vector<Candidate> cs{candidate("A")};
    const std::vector<Slot> ss{slot("S")};
    const ScoreMatrix m = matrix(cs, ss, {{0.5}});

    CHECK_THROWS_AS(solve_allocation("r", cs, ss, m, QuotaSchedule{}), SolverError);

    const std::vector<Candidate> two{candidate("A"), candidate("B")};
    CHECK_THROWS_AS(solve_allocation("r", two, ss, m, testsupport::plan(cs, ss, m)), SolverError);
}
