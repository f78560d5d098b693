#include "placement/AllocationArtifact.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "placement/ScoreJson.hpp"

namespace placement {

using json = nlohmann::json;

static const json& require_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) throw std::runtime_error(where + " missing required field: " + std::string(key));
    const json& v = j.at(key);
    if (!v.is_array()) throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    return v;
}

static std::string at_index(const std::string& where, const char* key, size_t i) {
    std::ostringstream oss;
    oss << where << "." << key << "[" << i << "]";
    return oss.str();
}

json allocation_to_json(const Allocation& a) {
    json j;
    j["round_id"] = a.round_id;

    json entries = json::array();
    for (const auto& e : a.entries) {
        json ej = {
            {"candidate_id", e.candidate_id},
            {"slot_id", e.slot_id},
            {"via_quota", e.via_quota},
            {"confidence", e.confidence},
            {"score", pair_score_to_json(e.score)}
        };
        if (e.via_quota) ej["quota_category"] = e.quota_category;
        entries.push_back(std::move(ej));
    }
    j["assignments"] = entries;

    json unmatched = json::array();
    for (const auto& u : a.unmatched) {
        unmatched.push_back({{"candidate_id", u.candidate_id}, {"reason", u.reason}});
    }
    j["unmatched"] = unmatched;

    json waivers = json::array();
    for (const auto& w : a.waivers) {
        waivers.push_back({
            {"slot_id", w.slot_id},
            {"category", w.category},
            {"floor", w.floor},
            {"filled", w.filled},
            {"reason", w.reason}
        });
    }
    j["waivers"] = waivers;

    return j;
}

Allocation allocation_from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("allocation must be an object");

    Allocation a;
    a.round_id = j.value("round_id", "");

    const json& entries = require_array(j, "assignments", "allocation");
    for (size_t i = 0; i < entries.size(); ++i) {
        const std::string where = at_index("allocation", "assignments", i);
        const json& ej = entries.at(i);
        if (!ej.is_object()) throw std::runtime_error(where + " must be an object");

        AllocationEntry e;
        e.candidate_id = ej.value("candidate_id", "");
        e.slot_id = ej.value("slot_id", "");
        e.via_quota = ej.value("via_quota", false);
        e.quota_category = ej.value("quota_category", "");
        e.confidence = ej.value("confidence", "");
        if (!ej.contains("score")) throw std::runtime_error(where + " missing required field: score");
        e.score = pair_score_from_json(ej.at("score"), where + ".score");
        if (e.candidate_id.empty() || e.slot_id.empty()) {
            throw std::runtime_error(where + " needs candidate_id and slot_id");
        }
        a.entries.push_back(std::move(e));
    }

    if (j.contains("unmatched")) {
        const json& un = require_array(j, "unmatched", "allocation");
        for (const auto& uj : un) {
            UnmatchedCandidate u;
            u.candidate_id = uj.value("candidate_id", "");
            u.reason = uj.value("reason", "");
            a.unmatched.push_back(std::move(u));
        }
    }

    if (j.contains("waivers")) {
        const json& ws = require_array(j, "waivers", "allocation");
        for (const auto& wj : ws) {
            QuotaWaiver w;
            w.slot_id = wj.value("slot_id", "");
            w.category = wj.value("category", "");
            w.floor = wj.value("floor", 0);
            w.filled = wj.value("filled", 0);
            w.reason = wj.value("reason", "");
            a.waivers.push_back(std::move(w));
        }
    }

    return a;
}

json slot_quota_to_json(const SlotQuota& sq) {
    json j;
    j["slot_id"] = sq.slot_id;
    j["capacity"] = sq.capacity;

    json entries = json::array();
    for (const auto& e : sq.entries) {
        json ej = {
            {"category", e.category},
            {"floor", e.floor},
            {"ceiling", e.ceiling},
            {"binding", e.binding},
            {"short_supply", e.short_supply},
            {"waived", e.waived}
        };
        if (e.waived) ej["waiver_reason"] = e.waiver_reason;
        entries.push_back(std::move(ej));
    }
    j["quotas"] = entries;
    return j;
}

json schedule_to_json(const QuotaSchedule& s) {
    json arr = json::array();
    for (const auto& sq : s.slots) arr.push_back(slot_quota_to_json(sq));
    return arr;
}

QuotaSchedule schedule_from_json(const json& j) {
    if (!j.is_array()) throw std::runtime_error("quota_schedule must be an array");

    QuotaSchedule s;
    for (const auto& sj : j) {
        SlotQuota sq;
        sq.slot_id = sj.value("slot_id", "");
        sq.capacity = sj.value("capacity", 0);
        if (sj.contains("quotas") && sj.at("quotas").is_array()) {
            for (const auto& ej : sj.at("quotas")) {
                QuotaEntry e;
                e.category = ej.value("category", "");
                e.floor = ej.value("floor", 0);
                e.ceiling = ej.value("ceiling", sq.capacity);
                e.binding = ej.value("binding", false);
                e.short_supply = ej.value("short_supply", false);
                e.waived = ej.value("waived", false);
                e.waiver_reason = ej.value("waiver_reason", "");
                sq.entries.push_back(std::move(e));
            }
        }
        s.slots.push_back(std::move(sq));
    }
    return s;
}

json disparity_to_json(const DisparityReport& d) {
    json j;
    j["scope"] = disparity_scope_name(d.scope);
    j["tolerance"] = d.tolerance;
    j["passed"] = d.passed();

    json rates = json::array();
    for (const auto& r : d.rates) {
        json rj = {
            {"category", r.category},
            {"population", r.population},
            {"assigned", r.assigned},
            {"observed", r.observed},
            {"expected", r.expected},
            {"disparity", r.disparity}
        };
        if (!r.slot_id.empty()) rj["slot_id"] = r.slot_id;
        rates.push_back(std::move(rj));
    }
    j["rates"] = rates;

    json violations = json::array();
    for (const auto& v : d.violations) {
        json vj = {
            {"category", v.category},
            {"observed", v.observed},
            {"expected", v.expected},
            {"disparity", v.disparity},
            {"tolerance", v.tolerance}
        };
        if (!v.slot_id.empty()) vj["slot_id"] = v.slot_id;
        violations.push_back(std::move(vj));
    }
    j["violations"] = violations;
    return j;
}

json excluded_to_json(const std::vector<ExcludedEntity>& excluded) {
    json arr = json::array();
    for (const auto& x : excluded) {
        arr.push_back({
            {"entity_id", x.entity_id},
            {"entity_kind", x.entity_kind},
            {"code", x.code},
            {"message", x.message}
        });
    }
    return arr;
}

json AllocationArtifact::to_json() const {
    json j = allocation_to_json(allocation);
    j["quota_schedule"] = schedule_to_json(schedule);
    j["disparity"] = disparity_to_json(disparity);
    j["excluded"] = excluded_to_json(excluded);
    j["stats"] = stats.to_json();
    j["ledger_head"] = ledger_head;
    return j;
}

void AllocationArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

AllocationArtifact AllocationArtifact::from_json(const json& j) {
    AllocationArtifact a;
    a.allocation = allocation_from_json(j);
    if (j.contains("quota_schedule")) a.schedule = schedule_from_json(j.at("quota_schedule"));
    if (j.contains("excluded") && j.at("excluded").is_array()) {
        for (const auto& xj : j.at("excluded")) {
            ExcludedEntity x;
            x.entity_id = xj.value("entity_id", "");
            x.entity_kind = xj.value("entity_kind", "");
            x.code = xj.value("code", "");
            x.message = xj.value("message", "");
            a.excluded.push_back(std::move(x));
        }
    }
    a.ledger_head = j.value("ledger_head", "");
    return a;
}

AllocationArtifact AllocationArtifact::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open allocation file: " + path.string());

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return from_json(j);
}

}  // namespace placement
