#include <catch2/catch.hpp>

#include <fstream>
#include <string>

#include "TestSupport.hpp"
#include "io/JsonIO.hpp"
#include "nlohmann/json.hpp"
#include "placement/AllocationArtifact.hpp"
#include "placement/Errors.hpp"
#include "placement/Orchestrator.hpp"

using json = nlohmann::json;
using namespace placement;

static json batch_json() {
    return json::parse(R"({
        "schema": {
            "version": 1,
            "skill_dim": 2,
            "tag_vocabulary": ["software", "finance"],
            "numeric_fields": [{"name": "experience", "min": 0, "max": 10}]
        },
        "candidates": [
            {
                "id": "A",
                "submitted_at": 17,
                "category": "  Rural ",
                "home": {"region": "north", "city": "pune"},
                "allowed_regions": ["north"],
                "features": {"schema_version": 1, "skills": [1, 0], "tags": ["software"], "numeric": {"experience": 3}}
            },
            {"id": "B"}
        ],
        "slots": [
            {
                "id": "S1",
                "organization": "Acme",
                "capacity": 3,
                "sector": "software",
                "location": {"region": "north", "city": "pune"},
                "reserved": {"RURAL": 1}
            }
        ],
        "policy": {
            "tolerance": 0.2,
            "scope": "per_slot",
            "categories": {"Urban ": {"max_fraction": 0.5}}
        }
    })");
}

TEST_CASE("batch parsing normalizes categories and keeps missing features empty", "[json_io]") {
    const Batch b = parseBatch(batch_json());

    CHECK(b.schema.skill_dim == 2);
    REQUIRE(b.schema.numeric_fields.size() == 1);
    CHECK(b.schema.numeric_fields[0].max == 10.0);

    REQUIRE(b.candidates.size() == 2);
    const Candidate& a = b.candidates[0];
    CHECK(a.category == "rural");
    CHECK(a.submitted_at == 17);
    CHECK(a.home.city == "pune");
    CHECK(a.features.schema_version == 1);
    CHECK(a.features.numeric.at("experience") == 3.0);

    const Candidate& bc = b.candidates[1];
    CHECK(bc.category == "unspecified");
    CHECK(bc.features.schema_version == 0);

    REQUIRE(b.slots.size() == 1);
    CHECK(b.slots[0].capacity == 3);
    CHECK(b.slots[0].reserved.at("rural") == 1);

    REQUIRE(b.policy.has_value());
    CHECK(b.policy->scope == DisparityScope::PerSlot);
    CHECK(b.policy->tolerance == Approx(0.2));
    CHECK(b.policy->categories.count("urban") == 1);
}

TEST_CASE("batch errors name the offending path", "[json_io]") {
    json j = batch_json();
    j["candidates"] = json::object();
    CHECK_THROWS_WITH(parseBatch(j), Catch::Matchers::Contains("root.candidates"));

    j = batch_json();
    j.erase("schema");
    CHECK_THROWS_AS(parseBatch(j), std::runtime_error);

    j = batch_json();
    j["policy"]["scope"] = "global";
    CHECK_THROWS_AS(parseBatch(j), ConfigError);
}

TEST_CASE("a malformed candidate is excluded and the rest of the batch loads", "[json_io]") {
    json j = batch_json();
    j["candidates"][0]["features"]["skills"] = json::array({"oops", 0});

    const Batch b = parseBatch(j);
    REQUIRE(b.candidates.size() == 1);
    CHECK(b.candidates[0].id == "B");
    REQUIRE(b.slots.size() == 1);

    REQUIRE(b.intake_failures.size() == 1);
    const ExcludedEntity& x = b.intake_failures[0];
    CHECK(x.entity_id == "A");
    CHECK(x.entity_kind == "candidate");
    CHECK(x.code == "malformed_features");
    CHECK_THAT(x.message, Catch::Matchers::Contains("root.candidates[0].features.skills[0]"));

    j = batch_json();
    j["candidates"][0]["features"]["schema_version"] = 0;
    const Batch v0 = parseBatch(j);
    REQUIRE(v0.intake_failures.size() == 1);
    CHECK(v0.intake_failures[0].code == "malformed_features");

    j = batch_json();
    j["candidates"][1].erase("id");
    const Batch no_id = parseBatch(j);
    CHECK(no_id.candidates.size() == 1);
    REQUIRE(no_id.intake_failures.size() == 1);
    CHECK(no_id.intake_failures[0].entity_id == "#1");
    CHECK(no_id.intake_failures[0].code == "missing_id");
}

TEST_CASE("a malformed slot is excluded with a path-carrying message", "[json_io]") {
    json j = batch_json();
    j["slots"][0]["capacity"] = "three";
    Batch b = parseBatch(j);
    CHECK(b.slots.empty());
    CHECK(b.candidates.size() == 2);
    REQUIRE(b.intake_failures.size() == 1);
    CHECK(b.intake_failures[0].entity_id == "S1");
    CHECK(b.intake_failures[0].entity_kind == "slot");
    CHECK(b.intake_failures[0].code == "malformed_entity");
    CHECK_THAT(b.intake_failures[0].message, Catch::Matchers::Contains("root.slots[0].capacity"));

    j = batch_json();
    j["slots"][0]["reserved"]["RURAL"] = 1.5;
    b = parseBatch(j);
    CHECK(b.slots.empty());
    REQUIRE(b.intake_failures.size() == 1);
    CHECK_THAT(b.intake_failures[0].message, Catch::Matchers::Contains("reserved.RURAL must be an integer"));
}

TEST_CASE("integers outside the int range are rejected, not wrapped", "[json_io]") {
    json j = batch_json();
    j["slots"][0]["capacity"] = 4294967297LL;
    Batch b = parseBatch(j);
    CHECK(b.slots.empty());
    REQUIRE(b.intake_failures.size() == 1);
    CHECK_THAT(b.intake_failures[0].message, Catch::Matchers::Contains("root.slots[0].capacity is out of range"));

    j = batch_json();
    j["slots"][0]["capacity"] = 18446744073709551615ULL;
    b = parseBatch(j);
    CHECK(b.slots.empty());
    REQUIRE(b.intake_failures.size() == 1);
    CHECK_THAT(b.intake_failures[0].message, Catch::Matchers::Contains("out of range"));

    j = batch_json();
    j["slots"][0]["reserved"]["RURAL"] = 4294967297LL;
    b = parseBatch(j);
    CHECK(b.slots.empty());
    REQUIRE(b.intake_failures.size() == 1);
    CHECK_THAT(b.intake_failures[0].message, Catch::Matchers::Contains("reserved.RURAL is out of range"));

    CHECK_THROWS_AS(parseEngineConfig(json::parse(R"({"threads": 4294967297})")), ConfigError);
}

TEST_CASE("entities excluded at parse time are audited by the round", "[json_io]") {
    json j = json::parse(R"({
        "schema": {"version": 1, "skill_dim": 2, "tag_vocabulary": ["software"],
                   "numeric_fields": [{"name": "experience", "min": 0, "max": 10}]},
        "candidates": [
            {"id": "A", "features": {"schema_version": 1, "skills": [1, 0], "tags": ["software"], "numeric": {"experience": 5}}},
            {"id": "B", "features": {"schema_version": 1, "skills": ["oops", 0]}}
        ],
        "slots": [
            {"id": "S1", "capacity": 1, "features": {"schema_version": 1, "skills": [1, 0], "tags": ["software"], "numeric": {"experience": 2}}}
        ]
    })");

    const Batch batch = parseBatch(j);
    AuditLedger ledger;
    BatchOrchestrator orch(ledger, RoundConfig{});
    const RoundResult res = orch.run_round("r1", batch);
    REQUIRE(res.ok);

    REQUIRE(res.allocation.entries.size() == 1);
    CHECK(res.allocation.entries[0].candidate_id == "A");
    REQUIRE(res.excluded.size() == 1);
    CHECK(res.excluded[0].entity_id == "B");
    CHECK(res.excluded[0].code == "malformed_features");

    const auto history = ledger.history("B");
    REQUIRE(history.size() == 1);
    CHECK(history[0].kind == AuditKind::Excluded);
}

TEST_CASE("engine config applies overrides over defaults", "[json_io]") {
    const EngineConfig defaults = parseEngineConfig(json::object());
    CHECK(defaults.round.weights.skill_similarity == Approx(0.40));
    CHECK(defaults.retry.max_attempts == 3);

    const EngineConfig cfg = parseEngineConfig(json::parse(R"({
        "weights": {"skill_similarity": 0.5, "preference_alignment": 0.2, "geography_fit": 0.1, "experience_fit": 0.2},
        "scoring": {"same_region_credit": 0.3},
        "solver": {"min_score": 0.25, "waive_unfilled_floors": false},
        "policy": {"tolerance": 0.05, "waive_infeasible": true},
        "threads": 2,
        "retry": {"max_attempts": 5, "initial_backoff_ms": 10, "backoff_multiplier": 3}
    })"));

    CHECK(cfg.round.weights.skill_similarity == Approx(0.5));
    CHECK(cfg.round.scoring.same_region_credit == Approx(0.3));
    CHECK(cfg.round.solver.min_score == Approx(0.25));
    CHECK_FALSE(cfg.round.solver.waive_unfilled_floors);
    CHECK(cfg.round.policy.waive_infeasible);
    CHECK(cfg.round.worker_threads == 2);
    CHECK(cfg.retry.max_attempts == 5);
    CHECK(cfg.retry.initial_backoff_ms == 10);
    CHECK(cfg.retry.backoff_multiplier == Approx(3.0));
}

TEST_CASE("engine config rejects bad values as ConfigError", "[json_io]") {
    CHECK_THROWS_AS(parseEngineConfig(json::parse(R"({"weights": {"skill_similarity": 0.9}})")), ConfigError);
    CHECK_THROWS_AS(parseEngineConfig(json::parse(R"({"solver": {"min_score": "high"}})")), ConfigError);
    CHECK_THROWS_AS(parseEngineConfig(json::parse(R"({"retry": {"max_attempts": 0}})")), ConfigError);
    CHECK_THROWS_AS(parseEngineConfig(json::parse(R"({"threads": -1})")), ConfigError);
    CHECK_THROWS_AS(loadEngineConfig("/nonexistent/round_config.json"), ConfigError);
}

TEST_CASE("loadBatch reads from disk", "[json_io]") {
    testsupport::TempDir dir;
    const auto path = dir.path() / "batch.json";
    {
        std::ofstream out(path);
        out << batch_json().dump(2);
    }
    CHECK(loadBatch(path.string()).candidates.size() == 2);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ broken";
    }
    CHECK_THROWS_AS(loadBatch(path.string()), std::runtime_error);
}

TEST_CASE("allocation artifact survives a write and reload", "[json_io]") {
    Batch batch;
    batch.schema = testsupport::schema();

    Candidate a = testsupport::candidate("A", "rural", 1);
    a.features = testsupport::features({1.0, 0.0}, {"software"}, 4.0);
    Candidate b = testsupport::candidate("B", "general", 2);
    b.features = testsupport::features({0.6, 0.8}, {}, 9.0);
    batch.candidates = {a, b};

    Slot s = testsupport::slot("S", 1, {{"rural", 1}});
    s.features = testsupport::features({1.0, 0.0}, {"software"}, 2.0);
    batch.slots = {s};

    AuditLedger ledger;
    BatchOrchestrator orch(ledger, RoundConfig{});
    const RoundResult res = orch.run_round("r7", batch);
    REQUIRE(res.ok);

    testsupport::TempDir dir;
    const auto path = dir.path() / "allocation.json";
    res.artifact().write_to(path);

    const AllocationArtifact back = AllocationArtifact::load(path);
    CHECK(back.allocation.round_id == "r7");
    REQUIRE(back.allocation.entries.size() == 1);

    const AllocationEntry& e = back.allocation.entries[0];
    const AllocationEntry& orig = res.allocation.entries[0];
    CHECK(e.candidate_id == "A");
    CHECK(e.via_quota);
    CHECK(e.quota_category == "rural");
    CHECK(e.score.composite == Approx(orig.score.composite));
    REQUIRE(e.score.breakdown.size() == orig.score.breakdown.size());
    CHECK(e.score.breakdown[0].factor == orig.score.breakdown[0].factor);

    REQUIRE(back.allocation.unmatched.size() == 1);
    CHECK(back.allocation.unmatched[0].candidate_id == "B");

    REQUIRE(back.schedule.slots.size() == 1);
    CHECK(back.schedule.slots[0].floor_for("rural") == 1);
    CHECK(back.ledger_head == ledger.head_hash());
}
