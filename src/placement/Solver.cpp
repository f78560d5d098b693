#include "placement/Solver.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <sstream>
#include <unordered_set>

#include "placement/Assignment.hpp"
#include "placement/Errors.hpp"

namespace placement {

const char* const kReasonNoSeat = "no_seat_available";
const char* const kReasonIneligible = "ineligible_for_all_open_slots";
const char* const kReasonBelowMinScore = "below_min_score";
const char* const kReasonCeilingReached = "quota_ceiling_reached";

const char* const kWaiverInsufficientCandidates = "insufficient_eligible_candidates";

namespace {

constexpr long long kScoreScale = 1000000;  // scores compared at 1e-6 resolution

// Integer edge weights: score dominates, submission order breaks ties.
class WeightModel {
public:
    explicit WeightModel(const std::vector<Candidate>& candidates) {
        const size_t n = candidates.size();

        std::vector<size_t> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            if (candidates[a].submitted_at != candidates[b].submitted_at) {
                return candidates[a].submitted_at < candidates[b].submitted_at;
            }
            if (candidates[a].id != candidates[b].id) return candidates[a].id < candidates[b].id;
            return a < b;
        });

        m_priority.assign(n, 0);
        for (size_t rank = 0; rank < n; ++rank) {
            m_priority[order[rank]] = static_cast<long long>(n - rank);
        }

        // must exceed any achievable sum of priorities
        const long long nn = static_cast<long long>(n);
        if (nn > 3000000000LL) throw SolverError("round too large for exact tie-breaking");
        m_multiplier = nn * (nn + 1) / 2 + 1;

        const long long limit = std::numeric_limits<long long>::max() / 8;
        if (m_multiplier > limit / (kScoreScale + 1)) {
            throw SolverError("round too large for exact integer weights; split the batch");
        }
        m_max_weight = kScoreScale * m_multiplier + nn;
    }

    long long weight(size_t row, double score) const {
        const double clamped = std::min(1.0, std::max(0.0, score));
        return std::llround(clamped * static_cast<double>(kScoreScale)) * m_multiplier + m_priority[row];
    }

    long long priority(size_t row) const { return m_priority[row]; }
    long long max_weight() const { return m_max_weight; }

private:
    std::vector<long long> m_priority;
    long long m_multiplier = 1;
    long long m_max_weight = 0;
};

struct ReservedSeat {
    size_t slot = 0;
    std::string category;
};

enum class SeatKind {
    Any,          // slot has no binding ceiling
    Unlimited,    // any category without a binding ceiling in this slot
    Category      // only `category`
};

struct OpenSeat {
    size_t slot = 0;
    SeatKind kind = SeatKind::Any;
    std::string category;
};

struct Pick {
    size_t row = 0;
    size_t slot = 0;
    bool via_quota = false;
    std::string category;
};

void check_cost_range(long long max_abs, size_t rows) {
    if (max_abs > max_safe_cost(rows)) {
        throw SolverError("round too large for exact integer weights; split the batch");
    }
}

}  // namespace

Allocation solve_allocation(
    const std::string& round_id,
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores,
    const QuotaSchedule& schedule,
    const SolverConfig& cfg
) {
    if (scores.rows != candidates.size() || scores.cols != slots.size()) {
        throw SolverError("score matrix does not match the candidate/slot universe");
    }
    if (schedule.slots.size() != slots.size()) {
        throw SolverError("quota schedule does not match the slot list");
    }
    for (size_t j = 0; j < slots.size(); ++j) {
        if (schedule.slots[j].slot_id != slots[j].id) {
            throw SolverError("quota schedule out of order at slot " + slots[j].id);
        }
        if (slots[j].capacity < 1) {
            throw SolverError("slot " + slots[j].id + " has capacity < 1");
        }
    }

    const size_t R = candidates.size();
    const size_t S = slots.size();

    auto usable = [&](size_t r, size_t j) {
        return scores.has(r, j) && scores.composite(r, j) + 1e-12 >= cfg.min_score;
    };

    const WeightModel wm(candidates);

    std::vector<char> assigned(R, 0);
    std::vector<int> filled(S, 0);
    std::vector<std::map<std::string, int>> filled_by_cat(S);
    std::vector<Pick> picks;

    // ---------- phase 1: reserved floors ----------
    std::vector<ReservedSeat> reserved;
    for (size_t j = 0; j < S; ++j) {
        for (const auto& e : schedule.slots[j].entries) {
            if (e.waived) continue;
            for (int k = 0; k < e.floor; ++k) reserved.push_back({j, e.category});
        }
    }

    if (!reserved.empty()) {
        std::vector<size_t> rows;
        for (size_t r = 0; r < R; ++r) {
            for (const auto& seat : reserved) {
                if (candidates[r].category == seat.category && usable(r, seat.slot)) {
                    rows.push_back(r);
                    break;
                }
            }
        }

        if (!rows.empty()) {
            const size_t seat_cols = reserved.size();
            const size_t cols = seat_cols + rows.size();

            // filling one more reserved seat always beats any score gain
            const long long per_match = wm.max_weight();
            const long long most = static_cast<long long>(std::min(seat_cols, rows.size()));
            if (per_match > max_safe_cost(rows.size()) / (most + 2)) {
                throw SolverError("round too large for exact integer weights; split the batch");
            }
            const long long bonus = per_match * most + 1;

            CostMatrix cost(rows.size(), std::vector<long long>(cols, kForbidden));
            for (size_t i = 0; i < rows.size(); ++i) {
                const size_t r = rows[i];
                cost[i][seat_cols + i] = 0;  // stay out of phase 1
                for (size_t k = 0; k < seat_cols; ++k) {
                    const ReservedSeat& seat = reserved[k];
                    if (candidates[r].category != seat.category || !usable(r, seat.slot)) continue;
                    cost[i][k] = -(bonus + wm.weight(r, scores.composite(r, seat.slot)));
                }
            }

            const MatchVec match = solve_assignment(cost);
            for (size_t i = 0; i < rows.size(); ++i) {
                if (match[i] < 0 || static_cast<size_t>(match[i]) >= seat_cols) continue;
                const ReservedSeat& seat = reserved[static_cast<size_t>(match[i])];
                const size_t r = rows[i];
                assigned[r] = 1;
                filled[seat.slot] += 1;
                filled_by_cat[seat.slot][seat.category] += 1;
                picks.push_back({r, seat.slot, true, seat.category});
            }
        }
    }

    std::vector<QuotaWaiver> waivers;
    for (size_t j = 0; j < S; ++j) {
        for (const auto& e : schedule.slots[j].entries) {
            if (e.waived || e.floor <= 0) continue;
            const int got = filled_by_cat[j][e.category];
            if (got >= e.floor) continue;

            if (!cfg.waive_unfilled_floors) {
                std::ostringstream oss;
                oss << "slot " << slots[j].id << ": reserved floor " << e.floor << " for category '" << e.category
                    << "' cannot be met (only " << got << " eligible candidates could be placed)";
                throw SolverError(oss.str());
            }

            QuotaWaiver w;
            w.slot_id = slots[j].id;
            w.category = e.category;
            w.floor = e.floor;
            w.filled = got;
            w.reason = kWaiverInsufficientCandidates;
            waivers.push_back(std::move(w));
        }
    }

    // ---------- phase 2: remaining seats ----------
    std::vector<int> open(S, 0);
    for (size_t j = 0; j < S; ++j) open[j] = slots[j].capacity - filled[j];

    std::vector<size_t> rows;
    for (size_t r = 0; r < R; ++r) {
        if (assigned[r]) continue;
        for (size_t j = 0; j < S; ++j) {
            if (open[j] > 0 && usable(r, j)) {
                rows.push_back(r);
                break;
            }
        }
    }

    if (!rows.empty()) {
        std::vector<OpenSeat> seats;
        std::vector<std::set<std::string>> limited_cats(S);
        std::vector<size_t> blocker_slots;

        for (size_t j = 0; j < S; ++j) {
            if (open[j] <= 0) continue;

            std::set<std::string> present;
            for (size_t r : rows) {
                if (usable(r, j)) present.insert(candidates[r].category);
            }
            if (present.empty()) continue;

            std::map<std::string, int> limits;
            for (const auto& cat : present) {
                int lim = schedule.slots[j].ceiling_for(cat) - filled_by_cat[j][cat];
                lim = std::max(0, std::min(lim, open[j]));
                if (lim < open[j]) limits[cat] = lim;
            }

            if (limits.empty()) {
                for (int k = 0; k < open[j]; ++k) seats.push_back({j, SeatKind::Any, ""});
                continue;
            }

            for (const auto& kv : limits) limited_cats[j].insert(kv.first);
            for (int k = 0; k < open[j]; ++k) seats.push_back({j, SeatKind::Unlimited, ""});
            for (const auto& kv : limits) {
                for (int k = 0; k < kv.second; ++k) {
                    seats.push_back({j, SeatKind::Category, kv.first});
                    // one blocker per restricted seat caps the slot total at open[j]
                    blocker_slots.push_back(j);
                }
            }
        }

        const size_t seat_cols = seats.size();
        const size_t n_rows = rows.size() + blocker_slots.size();
        const size_t cols = seat_cols + rows.size();

        check_cost_range(wm.max_weight(), n_rows);

        auto seat_allows = [&](const OpenSeat& seat, const std::string& category) {
            switch (seat.kind) {
                case SeatKind::Any: return true;
                case SeatKind::Unlimited: return limited_cats[seat.slot].count(category) == 0;
                case SeatKind::Category: return seat.category == category;
                default: return false;
            }
        };

        CostMatrix cost(n_rows, std::vector<long long>(cols, kForbidden));
        for (size_t i = 0; i < rows.size(); ++i) {
            const size_t r = rows[i];
            cost[i][seat_cols + i] = 0;  // stay unmatched
            for (size_t k = 0; k < seat_cols; ++k) {
                const OpenSeat& seat = seats[k];
                if (!usable(r, seat.slot) || !seat_allows(seat, candidates[r].category)) continue;
                cost[i][k] = -wm.weight(r, scores.composite(r, seat.slot));
            }
        }
        for (size_t b = 0; b < blocker_slots.size(); ++b) {
            const size_t i = rows.size() + b;
            for (size_t k = 0; k < seat_cols; ++k) {
                if (seats[k].slot == blocker_slots[b]) cost[i][k] = 0;
            }
        }

        const MatchVec match = solve_assignment(cost);
        for (size_t i = 0; i < rows.size(); ++i) {
            if (match[i] < 0 || static_cast<size_t>(match[i]) >= seat_cols) continue;
            const OpenSeat& seat = seats[static_cast<size_t>(match[i])];
            const size_t r = rows[i];
            assigned[r] = 1;
            filled[seat.slot] += 1;
            filled_by_cat[seat.slot][candidates[r].category] += 1;
            picks.push_back({r, seat.slot, false, ""});
        }
    }

    // ---------- result ----------
    Allocation out;
    out.round_id = round_id;

    std::sort(picks.begin(), picks.end(), [&](const Pick& a, const Pick& b) {
        if (a.slot != b.slot) return a.slot < b.slot;
        return wm.priority(a.row) > wm.priority(b.row);
    });

    for (const auto& p : picks) {
        AllocationEntry e;
        e.candidate_id = candidates[p.row].id;
        e.slot_id = slots[p.slot].id;
        e.score = scores.at(p.row, p.slot);
        e.via_quota = p.via_quota;
        e.quota_category = p.category;
        e.confidence = confidence_level(e.score.composite);
        out.entries.push_back(std::move(e));
    }

    for (size_t r = 0; r < R; ++r) {
        if (assigned[r]) continue;

        bool eligible = false;
        bool above = false;
        bool ceiling_blocked = false;
        for (size_t j = 0; j < S; ++j) {
            if (!scores.has(r, j)) continue;
            eligible = true;
            if (!usable(r, j)) continue;
            above = true;

            const std::string& cat = candidates[r].category;
            if (filled[j] < slots[j].capacity && filled_by_cat[j][cat] >= schedule.slots[j].ceiling_for(cat)) {
                ceiling_blocked = true;
            }
        }

        UnmatchedCandidate u;
        u.candidate_id = candidates[r].id;
        if (!eligible) u.reason = kReasonIneligible;
        else if (!above) u.reason = kReasonBelowMinScore;
        else if (ceiling_blocked) u.reason = kReasonCeilingReached;
        else u.reason = kReasonNoSeat;
        out.unmatched.push_back(std::move(u));
    }

    // waivers decided while planning
    for (size_t j = 0; j < S; ++j) {
        for (const auto& e : schedule.slots[j].entries) {
            if (!e.waived) continue;
            QuotaWaiver w;
            w.slot_id = slots[j].id;
            w.category = e.category;
            w.floor = e.floor;
            w.filled = filled_by_cat[j][e.category];
            w.reason = e.waiver_reason;
            out.waivers.push_back(std::move(w));
        }
    }
    for (auto& w : waivers) out.waivers.push_back(std::move(w));

    // ---------- post-conditions ----------
    std::unordered_set<std::string> seen;
    for (const auto& e : out.entries) {
        if (!seen.insert(e.candidate_id).second) {
            throw SolverError("internal: candidate " + e.candidate_id + " assigned twice");
        }
    }
    for (size_t j = 0; j < S; ++j) {
        if (filled[j] > slots[j].capacity) {
            throw SolverError("internal: slot " + slots[j].id + " over capacity");
        }
        for (const auto& kv : filled_by_cat[j]) {
            if (kv.second > schedule.slots[j].ceiling_for(kv.first)) {
                throw SolverError("internal: slot " + slots[j].id + " exceeds ceiling for category " + kv.first);
            }
        }
        for (const auto& e : schedule.slots[j].entries) {
            if (e.floor <= 0 || filled_by_cat[j][e.category] >= e.floor) continue;
            const bool waived = std::any_of(out.waivers.begin(), out.waivers.end(), [&](const QuotaWaiver& w) {
                return w.slot_id == slots[j].id && w.category == e.category;
            });
            if (!waived) {
                throw SolverError("internal: floor for " + e.category + " in slot " + slots[j].id + " neither met nor waived");
            }
        }
    }

    return out;
}

}  // namespace placement
