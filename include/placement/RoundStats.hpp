#pragma once

#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "placement/FairnessMonitor.hpp"
#include "placement/Models.hpp"

namespace placement {

struct CategoryFill {
    int population = 0;
    int assigned = 0;
    int via_quota = 0;
};

// Summary figures of one round, written next to the allocation.
struct RoundStats {
    int candidates = 0;
    int slots = 0;
    int total_capacity = 0;
    int assigned = 0;
    int unmatched = 0;
    int excluded = 0;
    int waivers = 0;
    int violations = 0;

    double fill_rate = 0.0;        // assigned / total_capacity
    double mean_composite = 0.0;   // over assignments

    std::map<std::string, int> by_confidence;
    std::map<std::string, int> unmatched_reasons;
    std::map<std::string, CategoryFill> by_category;

    nlohmann::json to_json() const;
};

RoundStats compute_round_stats(const Allocation& allocation,
                               const std::vector<Candidate>& candidates,
                               const std::vector<Slot>& slots,
                               const std::vector<ExcludedEntity>& excluded,
                               const DisparityReport& disparity);

}  // namespace placement
