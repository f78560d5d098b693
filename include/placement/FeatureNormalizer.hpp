#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "placement/Models.hpp"

namespace placement {

struct NumericFieldSpec {
    std::string name;
    double min = 0.0;
    double max = 1.0;
};

struct FeatureSchema {
    int version = 1;
    size_t skill_dim = 0;
    std::vector<std::string> tag_vocabulary;
    std::vector<NumericFieldSpec> numeric_fields;
};

// Value a missing numeric field is imputed to (midpoint of the scaled range).
constexpr double kImputedNumeric = 0.5;

class FeatureNormalizer {
public:
    // Throws ConfigError if the schema itself is unusable.
    explicit FeatureNormalizer(FeatureSchema schema);

    // Throws ValidationError (entity_id, code) when raw does not fit the schema.
    NormalizedVector normalize(const std::string& entity_id, const RawFeatures& raw) const;

    int unknown_tag_index() const { return static_cast<int>(m_schema.tag_vocabulary.size()); }
    const FeatureSchema& schema() const { return m_schema; }

private:
    FeatureSchema m_schema;
    std::unordered_map<std::string, int> m_tag_index;
};

}  // namespace placement
