#include "placement/FeatureNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "placement/Errors.hpp"
#include "placement/TextUtil.hpp"

namespace placement {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

FeatureNormalizer::FeatureNormalizer(FeatureSchema schema) : m_schema(std::move(schema)) {
    if (m_schema.version <= 0) {
        throw ConfigError("feature schema version must be positive");
    }
    if (m_schema.skill_dim == 0) {
        throw ConfigError("feature schema skill_dim must be positive");
    }

    std::unordered_set<std::string> seen_fields;
    for (const auto& f : m_schema.numeric_fields) {
        if (f.name.empty()) throw ConfigError("feature schema has a numeric field without a name");
        if (!seen_fields.insert(f.name).second) {
            throw ConfigError("feature schema declares numeric field twice: " + f.name);
        }
        if (!(f.max > f.min)) {
            throw ConfigError("feature schema field '" + f.name + "' needs max > min");
        }
    }

    for (size_t i = 0; i < m_schema.tag_vocabulary.size(); ++i) {
        const std::string key = textutil::normalize_tag(m_schema.tag_vocabulary[i]);
        // first declaration wins so indices stay stable
        m_tag_index.emplace(key, static_cast<int>(i));
    }
}

NormalizedVector FeatureNormalizer::normalize(const std::string& entity_id, const RawFeatures& raw) const {
    if (raw.schema_version != m_schema.version) {
        std::ostringstream oss;
        oss << entity_id << ": feature schema version " << raw.schema_version
            << " does not match expected " << m_schema.version;
        throw ValidationError(entity_id, "schema_mismatch", oss.str());
    }

    if (raw.skills.size() != m_schema.skill_dim) {
        std::ostringstream oss;
        oss << entity_id << ": skill vector has " << raw.skills.size()
            << " components, schema expects " << m_schema.skill_dim;
        throw ValidationError(entity_id, "dimension_mismatch", oss.str());
    }

    NormalizedVector out;
    out.schema_version = raw.schema_version;

    double norm2 = 0.0;
    out.skills.reserve(raw.skills.size());
    for (size_t i = 0; i < raw.skills.size(); ++i) {
        const double x = raw.skills[i];
        if (!std::isfinite(x)) {
            std::ostringstream oss;
            oss << entity_id << ": skills[" << i << "] is not finite";
            throw ValidationError(entity_id, "non_finite", oss.str());
        }
        norm2 += x * x;
        out.skills.push_back(x);
    }
    if (norm2 > 0.0) {
        const double n = std::sqrt(norm2);
        for (double& x : out.skills) x /= n;
    }

    for (const auto& kv : raw.numeric) {
        const bool known = std::any_of(m_schema.numeric_fields.begin(), m_schema.numeric_fields.end(),
                                       [&](const NumericFieldSpec& f) { return f.name == kv.first; });
        if (!known) {
            throw ValidationError(entity_id, "unknown_field", entity_id + ": unknown numeric field '" + kv.first + "'");
        }
    }

    out.numeric_names.reserve(m_schema.numeric_fields.size());
    out.numeric.reserve(m_schema.numeric_fields.size());
    out.imputed.reserve(m_schema.numeric_fields.size());

    for (const auto& f : m_schema.numeric_fields) {
        out.numeric_names.push_back(f.name);

        auto it = raw.numeric.find(f.name);
        if (it == raw.numeric.end()) {
            out.numeric.push_back(kImputedNumeric);
            out.imputed.push_back(true);
            continue;
        }

        if (!std::isfinite(it->second)) {
            throw ValidationError(entity_id, "non_finite", entity_id + ": numeric field '" + f.name + "' is not finite");
        }

        out.numeric.push_back(clamp01((it->second - f.min) / (f.max - f.min)));
        out.imputed.push_back(false);
    }

    const int unknown = unknown_tag_index();
    out.unknown_tag_index = unknown;
    for (const auto& t : raw.tags) {
        const std::string key = textutil::normalize_tag(t);
        if (key.empty()) continue;

        auto it = m_tag_index.find(key);
        out.tag_indices.push_back(it != m_tag_index.end() ? it->second : unknown);
    }
    std::sort(out.tag_indices.begin(), out.tag_indices.end());
    out.tag_indices.erase(std::unique(out.tag_indices.begin(), out.tag_indices.end()), out.tag_indices.end());

    return out;
}

}  // namespace placement
