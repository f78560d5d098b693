#pragma once

#include <string>
#include <vector>

#include "placement/FairnessMonitor.hpp"
#include "placement/Models.hpp"
#include "placement/Scorer.hpp"

namespace placement {

// Reason codes for candidates left without a seat.
extern const char* const kReasonNoSeat;
extern const char* const kReasonIneligible;
extern const char* const kReasonBelowMinScore;
extern const char* const kReasonCeilingReached;

// Waiver reason for a reserved seat no eligible candidate could take.
extern const char* const kWaiverInsufficientCandidates;

struct SolverConfig {
    // pairs scoring below this get no edge
    double min_score = 0.0;

    // record a waiver for an unfillable floor instead of failing the round
    bool waive_unfilled_floors = true;
};

// Capacity- and quota-respecting allocation maximizing total compatibility.
//
// Phase 1 fills reserved (slot, category) seats up to each active floor,
// phase 2 matches everyone left against the remaining seats under the
// category ceilings. Both phases run the Hungarian kernel over seat
// columns (one column per unit of capacity). Equal totals are broken in
// favour of earlier submissions.
//
// `scores` must be the matrix of exactly `candidates` x `slots` and
// `schedule` the plan for `slots`. Throws SolverError; never returns a
// partial allocation.
Allocation solve_allocation(
    const std::string& round_id,
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const ScoreMatrix& scores,
    const QuotaSchedule& schedule,
    const SolverConfig& cfg = {}
);

}  // namespace placement
