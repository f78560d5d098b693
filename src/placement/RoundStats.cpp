#include "placement/RoundStats.hpp"

#include <unordered_map>

namespace placement {

nlohmann::json RoundStats::to_json() const {
    nlohmann::json j;
    j["candidates"] = candidates;
    j["slots"] = slots;
    j["total_capacity"] = total_capacity;
    j["assigned"] = assigned;
    j["unmatched"] = unmatched;
    j["excluded"] = excluded;
    j["waivers"] = waivers;
    j["fairness_violations"] = violations;
    j["fill_rate"] = fill_rate;
    j["mean_composite"] = mean_composite;
    j["by_confidence"] = by_confidence;
    j["unmatched_reasons"] = unmatched_reasons;

    nlohmann::json cats = nlohmann::json::object();
    for (const auto& kv : by_category) {
        cats[kv.first] = {
            {"population", kv.second.population},
            {"assigned", kv.second.assigned},
            {"via_quota", kv.second.via_quota}
        };
    }
    j["by_category"] = cats;
    return j;
}

RoundStats compute_round_stats(
    const Allocation& allocation,
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const std::vector<ExcludedEntity>& excluded,
    const DisparityReport& disparity
) {
    RoundStats s;
    s.candidates = static_cast<int>(candidates.size());
    s.slots = static_cast<int>(slots.size());
    for (const auto& sl : slots) s.total_capacity += sl.capacity;

    s.assigned = static_cast<int>(allocation.entries.size());
    s.unmatched = static_cast<int>(allocation.unmatched.size());
    s.excluded = static_cast<int>(excluded.size());
    s.waivers = static_cast<int>(allocation.waivers.size());
    s.violations = static_cast<int>(disparity.violations.size());

    if (s.total_capacity > 0) s.fill_rate = static_cast<double>(s.assigned) / s.total_capacity;

    std::unordered_map<std::string, std::string> category_of;
    for (const auto& c : candidates) {
        category_of[c.id] = c.category;
        s.by_category[c.category].population += 1;
    }

    double sum = 0.0;
    for (const auto& e : allocation.entries) {
        sum += e.score.composite;
        s.by_confidence[e.confidence] += 1;

        auto it = category_of.find(e.candidate_id);
        if (it == category_of.end()) continue;
        CategoryFill& f = s.by_category[it->second];
        f.assigned += 1;
        if (e.via_quota) f.via_quota += 1;
    }
    if (s.assigned > 0) s.mean_composite = sum / s.assigned;

    for (const auto& u : allocation.unmatched) s.unmatched_reasons[u.reason] += 1;

    return s;
}

}  // namespace placement
