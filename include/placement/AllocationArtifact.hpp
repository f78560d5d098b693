#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "placement/FairnessMonitor.hpp"
#include "placement/Models.hpp"
#include "placement/RoundStats.hpp"

namespace placement {

nlohmann::json allocation_to_json(const Allocation& a);
Allocation allocation_from_json(const nlohmann::json& j);

nlohmann::json slot_quota_to_json(const SlotQuota& sq);
nlohmann::json schedule_to_json(const QuotaSchedule& s);
QuotaSchedule schedule_from_json(const nlohmann::json& j);

nlohmann::json disparity_to_json(const DisparityReport& d);

nlohmann::json excluded_to_json(const std::vector<ExcludedEntity>& excluded);

// Committed round as written to <outdir>/allocation.json.
struct AllocationArtifact {
    Allocation allocation;
    QuotaSchedule schedule;
    DisparityReport disparity;
    std::vector<ExcludedEntity> excluded;
    RoundStats stats;
    std::string ledger_head;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;

    // Restores allocation, schedule and exclusions; the disparity report and
    // stats are derived data and are not read back.
    static AllocationArtifact from_json(const nlohmann::json& j);
    static AllocationArtifact load(const std::filesystem::path& path);
};

}  // namespace placement
