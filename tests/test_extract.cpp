#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "extract/FeatureSource.hpp"
#include "extract/ProcUtil.hpp"
#include "extract/Retry.hpp"

using namespace extract;
namespace fs = std::filesystem;

namespace {

// Fails `failures` times per id before answering; ids listed in `broken` fail permanently.
class FlakySource : public FeatureSource {
public:
    int failures = 0;
    std::vector<std::string> broken;
    std::map<std::string, int> calls;

    placement::RawFeatures fetch(EntityKind, const std::string& id) override {
        const int n = ++calls[id];
        for (const auto& b : broken) {
            if (b == id) throw ExtractionError(id, "malformed payload for " + id, false);
        }
        if (n <= failures) throw ExtractionError(id, "service unavailable");
        return testsupport::features({1.0, 0.0}, {"software"}, 1.0);
    }
};

struct SleepLog {
    std::vector<long long> waits;
    Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) { waits.push_back(d.count()); };
    }
};

size_t count_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

}  // namespace

TEST_CASE("transient extraction failures are retried with backoff", "[extract]") {
    FlakySource source;
    source.failures = 2;
    SleepLog log;

    const placement::RawFeatures f = fetch_with_retry(source, EntityKind::Candidate, "c1", RetryPolicy{}, log.sleeper());

    CHECK(f.schema_version == 1);
    CHECK(source.calls["c1"] == 3);
    CHECK(log.waits == std::vector<long long>({100, 200}));
}

TEST_CASE("retries stop at max_attempts", "[extract]") {
    FlakySource source;
    source.failures = 10;
    SleepLog log;

    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.initial_backoff_ms = 5;
    policy.backoff_multiplier = 3.0;

    CHECK_THROWS_AS(fetch_with_retry(source, EntityKind::Slot, "s1", policy, log.sleeper()), ExtractionError);
    CHECK(source.calls["s1"] == 4);
    CHECK(log.waits == std::vector<long long>({5, 15, 45}));
}

TEST_CASE("permanent extraction failures are not retried", "[extract]") {
    FlakySource source;
    source.broken = {"c1"};
    SleepLog log;

    try {
        fetch_with_retry(source, EntityKind::Candidate, "c1", RetryPolicy{}, log.sleeper());
        FAIL("expected ExtractionError");
    } catch (const ExtractionError& e) {
        CHECK(e.entity_id() == "c1");
        CHECK_FALSE(e.retryable());
    }
    CHECK(source.calls["c1"] == 1);
    CHECK(log.waits.empty());
}

TEST_CASE("hydrate_batch fills missing features and drops failures", "[extract]") {
    std::vector<placement::Candidate> cs{testsupport::candidate("ready"), testsupport::candidate("pending"),
                                         testsupport::candidate("bad")};
    cs[0].features = testsupport::features({0.0, 1.0}, {}, 2.0);
    std::vector<placement::Slot> ss{testsupport::slot("s1")};

    FlakySource source;
    source.broken = {"bad"};
    SleepLog log;

    const HydrateResult res = hydrate_batch(cs, ss, source, RetryPolicy{}, log.sleeper());

    CHECK(res.fetched == 2);
    REQUIRE(res.failures.size() == 1);
    CHECK(res.failures[0].entity_id == "bad");
    CHECK(res.failures[0].entity_kind == "candidate");
    CHECK(res.failures[0].code == "extraction_failed");

    REQUIRE(cs.size() == 2);
    CHECK(cs[0].id == "ready");
    CHECK(cs[0].features.skills == std::vector<double>({0.0, 1.0}));
    CHECK(cs[1].id == "pending");
    CHECK(cs[1].features.schema_version == 1);
    CHECK(ss[0].features.schema_version == 1);

    CHECK(source.calls.count("ready") == 0);
}

TEST_CASE("directory source reads per-entity files", "[extract]") {
    testsupport::TempDir dir;
    fs::create_directories(dir.path() / "slots");
    {
        std::ofstream out(dir.path() / "slots" / "s1.json");
        out << R"({"schema_version": 2, "skills": [0.5, 0.5], "tags": ["finance"], "numeric": {"experience": 4}})";
    }
    {
        std::ofstream out(dir.path() / "slots" / "s2.json");
        out << R"({"skills": [0.5, 0.5]})";
    }

    DirectoryFeatureSource source(dir.path().string());

    const placement::RawFeatures f = source.fetch(EntityKind::Slot, "s1");
    CHECK(f.schema_version == 2);
    CHECK(f.tags == std::vector<std::string>({"finance"}));
    CHECK(f.numeric.at("experience") == 4.0);

    try {
        source.fetch(EntityKind::Candidate, "s1");
        FAIL("expected ExtractionError");
    } catch (const ExtractionError& e) {
        CHECK_FALSE(e.retryable());
    }

    // no schema_version
    CHECK_THROWS_AS(source.fetch(EntityKind::Slot, "s2"), ExtractionError);
}

TEST_CASE("command source parses stdout and caches the payload", "[extract]") {
    testsupport::TempDir dir;
    const fs::path cache = dir.path() / "cache";

    CommandFeatureSource source(R"(echo '{"schema_version":1,"skills":[1,0]}')", cache.string());

    const placement::RawFeatures f = source.fetch(EntityKind::Candidate, "c1");
    CHECK(f.schema_version == 1);
    CHECK(f.skills == std::vector<double>({1.0, 0.0}));
    CHECK(count_files(cache) == 1);

    const placement::RawFeatures again = source.fetch(EntityKind::Candidate, "c1");
    CHECK(again.skills == f.skills);
    CHECK(count_files(cache) == 1);

    source.fetch(EntityKind::Slot, "c1");
    CHECK(count_files(cache) == 2);
}

TEST_CASE("command source failures", "[extract]") {
    testsupport::TempDir dir;

    SECTION("non-zero exit is retryable") {
        CommandFeatureSource source("false", (dir.path() / "cache").string());
        try {
            source.fetch(EntityKind::Candidate, "c1");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& e) {
            CHECK(e.retryable());
        }
    }

    SECTION("empty output is retryable") {
        CommandFeatureSource source("true", (dir.path() / "cache").string());
        try {
            source.fetch(EntityKind::Candidate, "c1");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& e) {
            CHECK(e.retryable());
        }
    }

    SECTION("garbage output is permanent") {
        CommandFeatureSource source("echo nope", (dir.path() / "cache").string());
        try {
            source.fetch(EntityKind::Candidate, "c1");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& e) {
            CHECK_FALSE(e.retryable());
        }
        CHECK(count_files(dir.path() / "cache") == 0);
    }
}

TEST_CASE("shell arguments are single-quoted", "[extract]") {
    CHECK(procutil::shell_quote("abc") == "'abc'");
    CHECK(procutil::shell_quote("it's") == "'it'\\''s'");
    CHECK(procutil::shell_quote("") == "''");

    const procutil::ProcResult r = procutil::run_capture_stdout("echo " + procutil::shell_quote("a b;c"));
    CHECK(r.exit_code == 0);
    CHECK(r.out == "a b;c\n");
}
