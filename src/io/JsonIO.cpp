#include "io/JsonIO.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "placement/Errors.hpp"
#include "placement/TextUtil.hpp"

using json = nlohmann::json;
using namespace placement;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static long long integer_value(const json& v, const std::string& where) {
    if (!v.is_number_integer()) {
        throw std::runtime_error(where + " must be an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        throw std::runtime_error(where + " is out of range");
    }
    return v.get<long long>();
}

static int int_value(const json& v, const std::string& where) {
    const long long n = integer_value(v, where);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw std::runtime_error(where + " is out of range");
    }
    return static_cast<int>(n);
}

static long long optional_integer(const json& j, const char* key, long long def, const std::string& where) {
    if (!j.contains(key)) return def;
    return integer_value(j.at(key), where + "." + std::string(key));
}

static int optional_int(const json& j, const char* key, int def, const std::string& where) {
    if (!j.contains(key)) return def;
    return int_value(j.at(key), where + "." + std::string(key));
}

static double optional_number(const json& j, const char* key, double def, const std::string& where) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    }
    return j.at(key).get<double>();
}

static bool optional_bool(const json& j, const char* key, bool def, const std::string& where) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static std::vector<std::string> optional_string_array(const json& j, const char* key, const std::string& where) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static Location parseLocation(const json& j, const std::string& where) {
    Location loc;
    if (j.is_null()) return loc;
    require_object(j, where);
    loc.region = optional_string(j, "region", where);
    loc.city = optional_string(j, "city", where);
    return loc;
}

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

RawFeatures parseRawFeatures(const json& j, const std::string& where) {
    require_object(j, where);

    RawFeatures f;
    f.schema_version = optional_int(j, "schema_version", 0, where);
    if (f.schema_version <= 0) {
        throw std::runtime_error(where + ".schema_version must be a positive integer");
    }

    if (j.contains("skills")) {
        const json& skills = j.at("skills");
        require_array(skills, where + ".skills");
        f.skills.reserve(skills.size());
        for (size_t i = 0; i < skills.size(); ++i) {
            if (!skills.at(i).is_number()) {
                std::ostringstream oss;
                oss << where << ".skills[" << i << "] must be a number";
                throw std::runtime_error(oss.str());
            }
            f.skills.push_back(skills.at(i).get<double>());
        }
    }

    f.tags = optional_string_array(j, "tags", where);

    if (j.contains("numeric")) {
        const json& num = j.at("numeric");
        require_object(num, where + ".numeric");
        for (auto it = num.begin(); it != num.end(); ++it) {
            if (it.value().is_null()) continue;
            if (!it.value().is_number()) {
                throw std::runtime_error(where + ".numeric." + it.key() + " must be a number");
            }
            f.numeric[it.key()] = it.value().get<double>();
        }
    }

    return f;
}

FeatureSchema parseFeatureSchema(const json& j, const std::string& where) {
    require_object(j, where);

    FeatureSchema s;
    s.version = optional_int(j, "version", 1, where);

    const long long dim = optional_integer(j, "skill_dim", 0, where);
    if (dim < 0) throw std::runtime_error(where + ".skill_dim must be >= 0");
    s.skill_dim = static_cast<size_t>(dim);

    s.tag_vocabulary = optional_string_array(j, "tag_vocabulary", where);

    if (j.contains("numeric_fields")) {
        const json& fields = j.at("numeric_fields");
        require_array(fields, where + ".numeric_fields");
        for (size_t i = 0; i < fields.size(); ++i) {
            std::ostringstream oss;
            oss << where << ".numeric_fields[" << i << "]";
            const json& fj = fields.at(i);
            require_object(fj, oss.str());

            NumericFieldSpec spec;
            spec.name = require_string(fj, "name", oss.str());
            spec.min = optional_number(fj, "min", 0.0, oss.str());
            spec.max = optional_number(fj, "max", 1.0, oss.str());
            s.numeric_fields.push_back(std::move(spec));
        }
    }

    return s;
}

static DisparityScope parseScope(const std::string& s, const std::string& where) {
    if (s == "aggregate") return DisparityScope::Aggregate;
    if (s == "per_slot") return DisparityScope::PerSlot;
    throw ConfigError(where + ".scope must be \"aggregate\" or \"per_slot\"");
}

QuotaPolicy parseQuotaPolicy(const json& j, const std::string& where) {
    require_object(j, where);

    QuotaPolicy p;
    p.tolerance = optional_number(j, "tolerance", p.tolerance, where);
    p.waive_infeasible = optional_bool(j, "waive_infeasible", p.waive_infeasible, where);
    if (j.contains("scope")) p.scope = parseScope(require_string(j, "scope", where), where);

    if (j.contains("categories")) {
        const json& cats = j.at("categories");
        require_object(cats, where + ".categories");
        for (auto it = cats.begin(); it != cats.end(); ++it) {
            const std::string cw = where + ".categories." + it.key();
            require_object(it.value(), cw);

            CategoryPolicy cp;
            cp.min_fraction = optional_number(it.value(), "min_fraction", cp.min_fraction, cw);
            cp.max_fraction = optional_number(it.value(), "max_fraction", cp.max_fraction, cw);
            p.categories[textutil::normalize_key(it.key())] = cp;
        }
    }
    return p;
}

static std::string normalize_category(const std::string& raw) {
    std::string c = textutil::normalize_key(raw);
    return c.empty() ? "unspecified" : c;
}

// A features block that does not parse excludes its entity, not the batch.
static RawFeatures parseEntityFeatures(const json& j, const std::string& entity_id, const std::string& where) {
    try {
        return parseRawFeatures(j, where);
    } catch (const std::runtime_error& e) {
        throw ValidationError(entity_id, "malformed_features", e.what());
    }
}

static Candidate parseCandidate(const json& j, const std::string& where) {
    require_object(j, where);

    Candidate c;
    c.id = require_string(j, "id", where);
    c.submitted_at = optional_integer(j, "submitted_at", 0, where);
    c.category = normalize_category(optional_string(j, "category", where));
    c.home = parseLocation(j.value("home", json()), where + ".home");
    c.allowed_regions = optional_string_array(j, "allowed_regions", where);
    c.excluded_sectors = optional_string_array(j, "excluded_sectors", where);
    if (j.contains("features") && !j.at("features").is_null()) {
        c.features = parseEntityFeatures(j.at("features"), c.id, where + ".features");
    }
    return c;
}

static Slot parseSlot(const json& j, const std::string& where) {
    require_object(j, where);

    Slot s;
    s.id = require_string(j, "id", where);
    s.organization = optional_string(j, "organization", where);
    s.capacity = optional_int(j, "capacity", 1, where);
    s.sector = optional_string(j, "sector", where);
    s.location = parseLocation(j.value("location", json()), where + ".location");
    s.eligible_regions = optional_string_array(j, "eligible_regions", where);

    if (j.contains("reserved")) {
        const json& res = j.at("reserved");
        require_object(res, where + ".reserved");
        for (auto it = res.begin(); it != res.end(); ++it) {
            const std::string rw = where + ".reserved." + it.key();
            const long long total = static_cast<long long>(s.reserved[normalize_category(it.key())]) + int_value(it.value(), rw);
            if (total < std::numeric_limits<int>::min() || total > std::numeric_limits<int>::max()) {
                throw std::runtime_error(rw + " is out of range");
            }
            s.reserved[normalize_category(it.key())] = static_cast<int>(total);
        }
    }

    if (j.contains("features") && !j.at("features").is_null()) {
        s.features = parseEntityFeatures(j.at("features"), s.id, where + ".features");
    }
    return s;
}

static std::string entity_label(const json& j, size_t index) {
    if (j.is_object() && j.contains("id") && j.at("id").is_string() && !j.at("id").get<std::string>().empty()) {
        return j.at("id").get<std::string>();
    }
    return "#" + std::to_string(index);
}

template <typename Entity, typename Parse>
static void parseEntities(
    const json& arr,
    const std::string& where,
    const char* kind,
    Parse parse,
    std::vector<Entity>& out,
    std::vector<ExcludedEntity>& excluded
) {
    require_array(arr, where);
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";

        ExcludedEntity x;
        x.entity_id = entity_label(arr.at(i), i);
        x.entity_kind = kind;
        try {
            out.push_back(parse(arr.at(i), oss.str()));
            continue;
        } catch (const ValidationError& e) {
            x.code = e.code();
            x.message = e.what();
        } catch (const std::runtime_error& e) {
            x.code = x.entity_id[0] == '#' ? "missing_id" : "malformed_entity";
            x.message = e.what();
        }
        excluded.push_back(std::move(x));
    }
}

Batch parseBatch(const json& j) {
    require_object(j, "root");

    Batch b;
    if (!j.contains("schema")) {
        throw std::runtime_error("root missing required field: schema");
    }
    b.schema = parseFeatureSchema(j.at("schema"), "root.schema");

    if (j.contains("candidates")) {
        parseEntities(j.at("candidates"), "root.candidates", "candidate", parseCandidate, b.candidates, b.intake_failures);
    }
    if (j.contains("slots")) {
        parseEntities(j.at("slots"), "root.slots", "slot", parseSlot, b.slots, b.intake_failures);
    }

    if (j.contains("policy")) b.policy = parseQuotaPolicy(j.at("policy"), "root.policy");

    return b;
}

Batch loadBatch(const std::string& path) {
    return parseBatch(read_json_file(path, "batch"));
}

EngineConfig parseEngineConfig(const json& j) {
    require_object(j, "config");

    EngineConfig cfg;
    RoundConfig& rc = cfg.round;

    try {
        if (j.contains("weights")) {
            const json& w = j.at("weights");
            require_object(w, "config.weights");
            rc.weights.skill_similarity = optional_number(w, "skill_similarity", rc.weights.skill_similarity, "config.weights");
            rc.weights.preference_alignment = optional_number(w, "preference_alignment", rc.weights.preference_alignment, "config.weights");
            rc.weights.geography_fit = optional_number(w, "geography_fit", rc.weights.geography_fit, "config.weights");
            rc.weights.experience_fit = optional_number(w, "experience_fit", rc.weights.experience_fit, "config.weights");
        }

        if (j.contains("scoring")) {
            const json& s = j.at("scoring");
            require_object(s, "config.scoring");
            rc.scoring.same_region_credit = optional_number(s, "same_region_credit", rc.scoring.same_region_credit, "config.scoring");
            if (s.contains("experience_field")) rc.scoring.experience_field = require_string(s, "experience_field", "config.scoring");
        }

        if (j.contains("policy")) rc.policy = parseQuotaPolicy(j.at("policy"), "config.policy");

        if (j.contains("solver")) {
            const json& s = j.at("solver");
            require_object(s, "config.solver");
            rc.solver.min_score = optional_number(s, "min_score", rc.solver.min_score, "config.solver");
            rc.solver.waive_unfilled_floors = optional_bool(s, "waive_unfilled_floors", rc.solver.waive_unfilled_floors, "config.solver");
        }

        rc.worker_threads = optional_int(j, "threads", rc.worker_threads, "config");

        if (j.contains("retry")) {
            const json& r = j.at("retry");
            require_object(r, "config.retry");
            cfg.retry.max_attempts = optional_int(r, "max_attempts", cfg.retry.max_attempts, "config.retry");
            cfg.retry.initial_backoff_ms = optional_int(r, "initial_backoff_ms", cfg.retry.initial_backoff_ms, "config.retry");
            cfg.retry.backoff_multiplier = optional_number(r, "backoff_multiplier", cfg.retry.backoff_multiplier, "config.retry");
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }

    if (cfg.retry.max_attempts < 1) throw ConfigError("config.retry.max_attempts must be >= 1");
    if (cfg.retry.initial_backoff_ms < 0) throw ConfigError("config.retry.initial_backoff_ms must be >= 0");
    if (cfg.retry.backoff_multiplier < 1.0) throw ConfigError("config.retry.backoff_multiplier must be >= 1");

    rc.validate();
    return cfg;
}

EngineConfig loadEngineConfig(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "config");
    } catch (const std::runtime_error& e) {
        throw ConfigError(e.what());
    }
    return parseEngineConfig(j);
}
