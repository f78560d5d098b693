#include "placement/FairnessMonitor.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

#include "placement/Errors.hpp"

namespace placement {

const char* disparity_scope_name(DisparityScope s) {
    switch (s) {
        case DisparityScope::Aggregate: return "aggregate";
        case DisparityScope::PerSlot: return "per_slot";
        default: return "unknown";
    }
}

const QuotaEntry* SlotQuota::find(const std::string& category) const {
    for (const auto& e : entries) {
        if (e.category == category) return &e;
    }
    return nullptr;
}

int SlotQuota::floor_for(const std::string& category) const {
    const QuotaEntry* e = find(category);
    if (!e || e->waived) return 0;
    return e->floor;
}

int SlotQuota::ceiling_for(const std::string& category) const {
    const QuotaEntry* e = find(category);
    if (!e) return capacity;
    return e->ceiling;
}

const SlotQuota* QuotaSchedule::find(const std::string& slot_id) const {
    for (const auto& s : slots) {
        if (s.slot_id == slot_id) return &s;
    }
    return nullptr;
}

FairnessMonitor::FairnessMonitor(QuotaPolicy policy) : m_policy(std::move(policy)) {
    for (const auto& kv : m_policy.categories) {
        const CategoryPolicy& cp = kv.second;
        if (cp.min_fraction < 0.0 || cp.min_fraction > 1.0 || cp.max_fraction < 0.0 || cp.max_fraction > 1.0) {
            throw ConfigError("quota fractions for category '" + kv.first + "' must lie in [0,1]");
        }
        if (cp.min_fraction > cp.max_fraction) {
            throw ConfigError("quota for category '" + kv.first + "' has min_fraction > max_fraction");
        }
    }
    if (m_policy.tolerance < 0.0) {
        throw ConfigError("fairness tolerance must be non-negative");
    }
}

// Quota-blind greedy: best pairs first, earlier submission wins ties.
static std::vector<std::map<std::string, int>> simulate_greedy(
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores
) {
    struct Pair {
        size_t r;
        size_t c;
        double score;
    };

    std::vector<Pair> pairs;
    for (size_t r = 0; r < scores.rows; ++r) {
        for (size_t c = 0; c < scores.cols; ++c) {
            if (scores.has(r, c)) pairs.push_back({r, c, scores.composite(r, c)});
        }
    }

    std::sort(pairs.begin(), pairs.end(), [&](const Pair& a, const Pair& b) {
        if (a.score != b.score) return a.score > b.score;
        const Candidate& ca = candidates[a.r];
        const Candidate& cb = candidates[b.r];
        if (ca.submitted_at != cb.submitted_at) return ca.submitted_at < cb.submitted_at;
        if (ca.id != cb.id) return ca.id < cb.id;
        return a.c < b.c;
    });

    std::vector<char> taken(scores.rows, 0);
    std::vector<int> filled(scores.cols, 0);
    std::vector<std::map<std::string, int>> by_category(scores.cols);

    for (const auto& p : pairs) {
        if (taken[p.r]) continue;
        if (filled[p.c] >= slots[p.c].capacity) continue;
        taken[p.r] = 1;
        filled[p.c] += 1;
        by_category[p.c][candidates[p.r].category] += 1;
    }
    return by_category;
}

QuotaSchedule FairnessMonitor::build(
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores,
    bool waive
) const {
    const auto greedy = simulate_greedy(candidates, slots, scores);

    QuotaSchedule schedule;
    schedule.slots.reserve(slots.size());

    for (size_t j = 0; j < slots.size(); ++j) {
        const Slot& slot = slots[j];

        SlotQuota sq;
        sq.slot_id = slot.id;
        sq.capacity = slot.capacity;

        std::set<std::string> categories;
        for (const auto& kv : slot.reserved) categories.insert(kv.first);
        for (const auto& kv : m_policy.categories) categories.insert(kv.first);

        int floor_sum = 0;
        std::vector<std::string> conflicting;
        std::ostringstream why;

        for (const auto& cat : categories) {
            QuotaEntry e;
            e.category = cat;

            auto rit = slot.reserved.find(cat);
            const int reserved = rit != slot.reserved.end() ? rit->second : 0;

            auto pit = m_policy.categories.find(cat);
            int policy_floor = 0;
            e.ceiling = slot.capacity;
            if (pit != m_policy.categories.end()) {
                policy_floor = static_cast<int>(std::ceil(pit->second.min_fraction * slot.capacity - 1e-9));
                e.ceiling = static_cast<int>(std::floor(pit->second.max_fraction * slot.capacity + 1e-9));
            }
            e.floor = std::max(reserved, policy_floor);

            if (e.floor <= 0 && e.ceiling >= slot.capacity) continue;

            if (e.floor > e.ceiling) {
                conflicting.push_back(cat);
                why << "category '" << cat << "' floor " << e.floor << " exceeds ceiling " << e.ceiling << "; ";
            }
            floor_sum += e.floor;

            int supply = 0;
            for (size_t r = 0; r < scores.rows; ++r) {
                if (candidates[r].category == cat && scores.has(r, j)) ++supply;
            }
            e.short_supply = supply < e.floor;

            auto git = greedy[j].find(cat);
            const int greedy_count = git != greedy[j].end() ? git->second : 0;
            e.binding = greedy_count < e.floor || greedy_count > e.ceiling;

            sq.entries.push_back(std::move(e));
        }

        if (floor_sum > slot.capacity) {
            for (const auto& e : sq.entries) {
                if (e.floor > 0 && std::find(conflicting.begin(), conflicting.end(), e.category) == conflicting.end()) {
                    conflicting.push_back(e.category);
                }
            }
            why << "reserved floors sum to " << floor_sum << " but capacity is " << slot.capacity << "; ";
        }

        if (!conflicting.empty()) {
            std::sort(conflicting.begin(), conflicting.end());

            std::string reason = why.str();
            if (reason.size() >= 2) reason.erase(reason.size() - 2);

            if (!waive) {
                std::ostringstream msg;
                msg << "quota infeasible for slot " << slot.id << " (categories:";
                for (const auto& c : conflicting) msg << " " << c;
                msg << "): " << reason;
                throw QuotaInfeasibleError(slot.id, conflicting, msg.str());
            }

            for (auto& e : sq.entries) {
                if (e.floor > 0) {
                    e.waived = true;
                    e.waiver_reason = "quota_infeasible: " + reason;
                }
            }
        }

        schedule.slots.push_back(std::move(sq));
    }

    return schedule;
}

QuotaSchedule FairnessMonitor::plan(
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores
) const {
    return build(candidates, slots, scores, false);
}

QuotaSchedule FairnessMonitor::plan_with_waivers(
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores
) const {
    return build(candidates, slots, scores, true);
}

DisparityReport FairnessMonitor::disparity(
    const Allocation& allocation,
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores
) const {
    DisparityReport rep;
    rep.scope = m_policy.scope;
    rep.tolerance = m_policy.tolerance;

    std::unordered_map<std::string, std::string> category_of;
    for (const auto& c : candidates) category_of[c.id] = c.category;

    auto record = [&](CategoryRate rate) {
        if (std::fabs(rate.disparity) > m_policy.tolerance + 1e-12) {
            FairnessViolation v;
            v.slot_id = rate.slot_id;
            v.category = rate.category;
            v.observed = rate.observed;
            v.expected = rate.expected;
            v.disparity = rate.disparity;
            v.tolerance = m_policy.tolerance;
            rep.violations.push_back(std::move(v));
        }
        rep.rates.push_back(std::move(rate));
    };

    if (m_policy.scope == DisparityScope::Aggregate) {
        std::map<std::string, int> population;
        std::map<std::string, int> assigned;
        for (const auto& c : candidates) population[c.category] += 1;
        for (const auto& e : allocation.entries) {
            auto it = category_of.find(e.candidate_id);
            if (it != category_of.end()) assigned[it->second] += 1;
        }

        if (candidates.empty()) return rep;
        const double mean = static_cast<double>(allocation.entries.size()) / static_cast<double>(candidates.size());

        for (const auto& kv : population) {
            CategoryRate rate;
            rate.category = kv.first;
            rate.population = kv.second;
            rate.assigned = assigned[kv.first];
            rate.observed = static_cast<double>(rate.assigned) / static_cast<double>(rate.population);
            rate.expected = mean;
            rate.disparity = rate.observed - rate.expected;
            record(std::move(rate));
        }
        return rep;
    }

    for (size_t j = 0; j < slots.size(); ++j) {
        std::map<std::string, int> pool;
        int pool_total = 0;
        for (size_t r = 0; r < scores.rows && r < candidates.size(); ++r) {
            if (!scores.has(r, j)) continue;
            pool[candidates[r].category] += 1;
            ++pool_total;
        }

        std::map<std::string, int> assigned;
        int assigned_total = 0;
        for (const auto& e : allocation.entries) {
            if (e.slot_id != slots[j].id) continue;
            auto it = category_of.find(e.candidate_id);
            if (it == category_of.end()) continue;
            assigned[it->second] += 1;
            ++assigned_total;
        }

        if (pool_total == 0 || assigned_total == 0) continue;

        for (const auto& kv : pool) {
            CategoryRate rate;
            rate.slot_id = slots[j].id;
            rate.category = kv.first;
            rate.population = kv.second;
            rate.assigned = assigned[kv.first];
            rate.observed = static_cast<double>(rate.assigned) / static_cast<double>(assigned_total);
            rate.expected = static_cast<double>(kv.second) / static_cast<double>(pool_total);
            rate.disparity = rate.observed - rate.expected;
            record(std::move(rate));
        }
    }

    return rep;
}

}  // namespace placement
