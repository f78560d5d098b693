#pragma once

#include <string>
#include <vector>

#include "placement/Models.hpp"

namespace placement {

// Ordered factor breakdown of an assignment. Pure: repeated calls on the
// same entry return identical results.
std::vector<FactorContribution> explain(const AllocationEntry& entry);

// Factors with subscore below `threshold`, weakest first.
std::vector<FactorContribution> improvement_areas(const AllocationEntry& entry, double threshold = 0.5);

// Human-readable rendering used by the CLI.
std::vector<std::string> explain_lines(const AllocationEntry& entry);

}  // namespace placement
