#pragma once

#include <map>
#include <string>
#include <vector>

#include "placement/Models.hpp"
#include "placement/Scorer.hpp"

namespace placement {

enum class DisparityScope {
    Aggregate,   // category allocation rate vs population rate across the batch
    PerSlot      // category share of each slot vs its eligible pool
};

const char* disparity_scope_name(DisparityScope s);

struct CategoryPolicy {
    double min_fraction = 0.0;   // of each slot's capacity, rounded up
    double max_fraction = 1.0;   // of each slot's capacity, rounded down
};

struct QuotaPolicy {
    std::map<std::string, CategoryPolicy> categories;

    double tolerance = 0.10;
    DisparityScope scope = DisparityScope::Aggregate;

    // proceed with the conflicting slot's floors waived instead of failing the round
    bool waive_infeasible = false;
};

struct QuotaEntry {
    std::string category;
    int floor = 0;
    int ceiling = 0;

    bool binding = false;        // quota-blind greedy would miss the floor or exceed the ceiling
    bool short_supply = false;   // fewer eligible candidates than the floor

    bool waived = false;
    std::string waiver_reason;
};

struct SlotQuota {
    std::string slot_id;
    int capacity = 0;
    std::vector<QuotaEntry> entries;   // sorted by category

    const QuotaEntry* find(const std::string& category) const;

    // floor of a category (0 when waived or absent)
    int floor_for(const std::string& category) const;

    // ceiling of a category; capacity when no quota names it
    int ceiling_for(const std::string& category) const;
};

// Parallel to the slot list the schedule was planned for.
struct QuotaSchedule {
    std::vector<SlotQuota> slots;

    const SlotQuota* find(const std::string& slot_id) const;
};

struct CategoryRate {
    std::string slot_id;        // empty for aggregate scope
    std::string category;
    int population = 0;
    int assigned = 0;
    double observed = 0.0;
    double expected = 0.0;
    double disparity = 0.0;     // observed - expected
};

// Non-fatal reporting signal.
struct FairnessViolation {
    std::string slot_id;
    std::string category;
    double observed = 0.0;
    double expected = 0.0;
    double disparity = 0.0;
    double tolerance = 0.0;
};

struct DisparityReport {
    DisparityScope scope = DisparityScope::Aggregate;
    double tolerance = 0.0;
    std::vector<CategoryRate> rates;
    std::vector<FairnessViolation> violations;

    bool passed() const { return violations.empty(); }
};

class FairnessMonitor {
public:
    explicit FairnessMonitor(QuotaPolicy policy);

    // Per-slot floor/ceiling schedule. Throws QuotaInfeasibleError naming the
    // first slot whose floors cannot coexist.
    QuotaSchedule plan(const std::vector<Candidate>& candidates,
                       const std::vector<Slot>& slots,
                       const ScoreMatrix& scores) const;

    // Same as plan(), but an infeasible slot gets all its floors waived with
    // the conflict recorded as the reason.
    QuotaSchedule plan_with_waivers(const std::vector<Candidate>& candidates,
                                    const std::vector<Slot>& slots,
                                    const ScoreMatrix& scores) const;

    DisparityReport disparity(const Allocation& allocation,
                              const std::vector<Candidate>& candidates,
                              const std::vector<Slot>& slots,
                              const ScoreMatrix& scores) const;

    const QuotaPolicy& policy() const { return m_policy; }

private:
    QuotaSchedule build(const std::vector<Candidate>& candidates,
                        const std::vector<Slot>& slots,
                        const ScoreMatrix& scores,
                        bool waive) const;

    QuotaPolicy m_policy;
};

}  // namespace placement
