#include "placement/ScoreJson.hpp"

#include <sstream>
#include <stdexcept>

namespace placement {

using json = nlohmann::json;

static const json& require(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static double require_number(const json& j, const char* key, const std::string& where) {
    const json& v = require(j, key, where);
    if (!v.is_number()) throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    return v.get<double>();
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require(j, key, where);
    if (!v.is_string()) throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    return v.get<std::string>();
}

json breakdown_to_json(const std::vector<FactorContribution>& breakdown) {
    json arr = json::array();
    for (const auto& f : breakdown) {
        json fj = {
            {"factor", f.factor},
            {"weight", f.weight},
            {"subscore", f.subscore},
            {"contribution", f.contribution}
        };
        if (f.degraded) {
            fj["degraded"] = true;
            fj["note"] = f.note;
        }
        arr.push_back(std::move(fj));
    }
    return arr;
}

std::vector<FactorContribution> breakdown_from_json(const json& j, const std::string& where) {
    if (!j.is_array()) throw std::runtime_error(where + " must be an array");

    std::vector<FactorContribution> out;
    out.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        const std::string w = oss.str();
        const json& fj = j.at(i);

        FactorContribution f;
        f.factor = require_string(fj, "factor", w);
        f.weight = require_number(fj, "weight", w);
        f.subscore = require_number(fj, "subscore", w);
        f.contribution = require_number(fj, "contribution", w);
        f.degraded = fj.value("degraded", false);
        f.note = fj.value("note", "");
        out.push_back(std::move(f));
    }
    return out;
}

json pair_score_to_json(const PairScore& ps) {
    return {
        {"candidate_id", ps.candidate_id},
        {"slot_id", ps.slot_id},
        {"composite", ps.composite},
        {"breakdown", breakdown_to_json(ps.breakdown)}
    };
}

PairScore pair_score_from_json(const json& j, const std::string& where) {
    PairScore ps;
    ps.candidate_id = require_string(j, "candidate_id", where);
    ps.slot_id = require_string(j, "slot_id", where);
    ps.composite = require_number(j, "composite", where);
    ps.breakdown = breakdown_from_json(require(j, "breakdown", where), where + ".breakdown");
    return ps;
}

}  // namespace placement
