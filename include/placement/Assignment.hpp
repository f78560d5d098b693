#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace placement {

using CostMatrix = std::vector<std::vector<long long>>;
using MatchVec = std::vector<int>;

// Marks an edge that may not be used.
constexpr long long kForbidden = std::numeric_limits<long long>::max();

// Minimum-cost assignment of every row to a distinct column (Hungarian
// method with row/column potentials). Requires rows <= cols and a
// rectangular matrix. Returns row -> column.
// Throws SolverError when some row has no usable column left.
MatchVec solve_assignment(const CostMatrix& cost);

// Largest |cost| the kernel accepts for a matrix with `rows` rows.
long long max_safe_cost(std::size_t rows);

}  // namespace placement
