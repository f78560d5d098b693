#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

#include "TestSupport.hpp"
#include "placement/Errors.hpp"
#include "placement/FeatureNormalizer.hpp"

using namespace placement;
using Catch::Matchers::Contains;

static std::string code_of(const FeatureNormalizer& n, const RawFeatures& raw) {
    try {
        n.normalize("e1", raw);
    } catch (const ValidationError& e) {
        CHECK(e.entity_id() == "e1");
        return e.code();
    }
    return "";
}

TEST_CASE("normalizer scales skills to unit length", "[normalizer]") {
    const FeatureNormalizer n(testsupport::schema());
    const NormalizedVector v = n.normalize("c1", testsupport::features({3.0, 4.0}, {}, 5.0));

    REQUIRE(v.skills.size() == 2);
    CHECK(v.skills[0] == Approx(0.6));
    CHECK(v.skills[1] == Approx(0.8));
    CHECK(v.schema_version == 1);
}

TEST_CASE("normalizer keeps a zero skill vector at zero", "[normalizer]") {
    const FeatureNormalizer n(testsupport::schema());
    const NormalizedVector v = n.normalize("c1", testsupport::features({0.0, 0.0}, {}, 5.0));
    CHECK(v.skills[0] == 0.0);
    CHECK(v.skills[1] == 0.0);
}

TEST_CASE("numeric fields are rescaled, clamped and imputed", "[normalizer]") {
    FeatureSchema s = testsupport::schema();
    s.numeric_fields.push_back({"gpa", 0.0, 4.0});
    const FeatureNormalizer n(s);

    SECTION("in range") {
        RawFeatures raw = testsupport::features({1.0, 0.0}, {}, 2.5);
        raw.numeric["gpa"] = 3.0;
        const NormalizedVector v = n.normalize("c1", raw);
        REQUIRE(v.numeric_names == std::vector<std::string>{"experience", "gpa"});
        CHECK(v.numeric[0] == Approx(0.25));
        CHECK(v.numeric[1] == Approx(0.75));
        CHECK_FALSE(v.imputed[0]);
        CHECK_FALSE(v.imputed[1]);
    }

    SECTION("out of range values are clamped") {
        RawFeatures raw = testsupport::features({1.0, 0.0}, {}, 25.0);
        raw.numeric["gpa"] = -1.0;
        const NormalizedVector v = n.normalize("c1", raw);
        CHECK(v.numeric[0] == 1.0);
        CHECK(v.numeric[1] == 0.0);
    }

    SECTION("missing field is imputed to the midpoint and flagged") {
        RawFeatures raw = testsupport::features({1.0, 0.0}, {}, 5.0);
        const NormalizedVector v = n.normalize("c1", raw);
        CHECK(v.numeric[1] == Approx(kImputedNumeric));
        CHECK(v.imputed[1]);
        CHECK_FALSE(v.imputed[0]);
    }
}

TEST_CASE("tags map to vocabulary indices with an unknown bucket", "[normalizer]") {
    const FeatureNormalizer n(testsupport::schema());
    const NormalizedVector v = n.normalize("c1", testsupport::features({1.0, 0.0}, {"Finance", " robotics ", "finance", ""}, 1.0));

    CHECK(n.unknown_tag_index() == 2);
    CHECK(v.unknown_tag_index == 2);
    CHECK(v.tag_indices == std::vector<int>{1, 2});
}

TEST_CASE("malformed features raise ValidationError with a code", "[normalizer]") {
    const FeatureNormalizer n(testsupport::schema());

    SECTION("schema version mismatch") {
        RawFeatures raw = testsupport::features({1.0, 0.0}, {}, 1.0);
        raw.schema_version = 2;
        CHECK(code_of(n, raw) == "schema_mismatch");
    }

    SECTION("features never extracted") {
        RawFeatures raw;
        CHECK(code_of(n, raw) == "schema_mismatch");
    }

    SECTION("wrong skill dimension") {
        CHECK(code_of(n, testsupport::features({1.0, 0.0, 0.0}, {}, 1.0)) == "dimension_mismatch");
    }

    SECTION("non-finite skill") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK(code_of(n, testsupport::features({nan, 0.0}, {}, 1.0)) == "non_finite");
    }

    SECTION("non-finite numeric") {
        const double inf = std::numeric_limits<double>::infinity();
        CHECK(code_of(n, testsupport::features({1.0, 0.0}, {}, inf)) == "non_finite");
    }

    SECTION("unknown numeric field") {
        RawFeatures raw = testsupport::features({1.0, 0.0}, {}, 1.0);
        raw.numeric["salary"] = 10.0;
        CHECK(code_of(n, raw) == "unknown_field");
    }
}

TEST_CASE("unusable schema is a ConfigError", "[normalizer]") {
    FeatureSchema s = testsupport::schema();

    SECTION("zero skill dimension") {
        s.skill_dim = 0;
        CHECK_THROWS_AS(FeatureNormalizer(s), ConfigError);
    }
    SECTION("empty numeric range") {
        s.numeric_fields = {{"experience", 3.0, 3.0}};
        CHECK_THROWS_AS(FeatureNormalizer(s), ConfigError);
    }
    SECTION("duplicate numeric field") {
        s.numeric_fields.push_back({"experience", 0.0, 1.0});
        CHECK_THROWS_WITH(FeatureNormalizer(s), Contains("twice"));
    }
}
