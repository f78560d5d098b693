#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace placement {

struct Location {
    std::string region;
    std::string city;
};

// Feature payload as delivered by the extraction service.
// schema_version == 0 means "not extracted yet".
struct RawFeatures {
    int schema_version = 0;
    std::vector<double> skills;              // skill-embedding components
    std::vector<std::string> tags;           // preference / sector tags
    std::map<std::string, double> numeric;   // absent key = missing field
};

struct Candidate {
    std::string id;
    int64_t submitted_at = 0;                // tie-break key, earlier wins
    std::string category;                    // protected attribute, fairness accounting only
    Location home;

    std::vector<std::string> allowed_regions;   // empty = any region
    std::vector<std::string> excluded_sectors;

    RawFeatures features;
};

struct Slot {
    std::string id;
    std::string organization;
    int capacity = 1;
    std::string sector;
    Location location;

    std::vector<std::string> eligible_regions;  // empty = open to every home region
    std::map<std::string, int> reserved;        // category -> minimum reserved seats

    RawFeatures features;
};

struct NormalizedVector {
    int schema_version = 0;
    std::vector<double> skills;              // L2-normalized, fixed dimension
    std::vector<int> tag_indices;            // sorted, unique
    int unknown_tag_index = -1;              // bucket for tags outside the vocabulary
    std::vector<std::string> numeric_names;  // schema order
    std::vector<double> numeric;             // [0,1]
    std::vector<bool> imputed;               // parallel to numeric
};

struct FactorContribution {
    std::string factor;
    double weight = 0.0;
    double subscore = 0.0;
    double contribution = 0.0;

    bool degraded = false;                   // factor failed and was replaced by 0
    std::string note;
};

struct PairScore {
    std::string candidate_id;
    std::string slot_id;
    double composite = 0.0;

    // ordered by contribution desc, ties by factor declaration order
    std::vector<FactorContribution> breakdown;
};

struct AllocationEntry {
    std::string candidate_id;
    std::string slot_id;
    PairScore score;

    bool via_quota = false;                  // filled a reserved seat in phase 1
    std::string quota_category;
    std::string confidence;                  // "high" | "medium" | "low"
};

struct UnmatchedCandidate {
    std::string candidate_id;
    std::string reason;
};

struct QuotaWaiver {
    std::string slot_id;
    std::string category;
    int floor = 0;
    int filled = 0;
    std::string reason;
};

// Entity dropped from a round before scoring (bad features, failed extraction).
struct ExcludedEntity {
    std::string entity_id;
    std::string entity_kind;     // "candidate" | "slot"
    std::string code;
    std::string message;
};

struct Allocation {
    std::string round_id;
    std::vector<AllocationEntry> entries;
    std::vector<UnmatchedCandidate> unmatched;
    std::vector<QuotaWaiver> waivers;

    const AllocationEntry* find(const std::string& candidate_id) const;
    int assigned_count(const std::string& slot_id) const;
};

}  // namespace placement
