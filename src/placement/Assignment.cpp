#include "placement/Assignment.hpp"

#include <sstream>

#include "placement/Errors.hpp"

namespace placement {

long long max_safe_cost(std::size_t rows) {
    // potentials stay within (rows + 1) * max|cost|; keep headroom for u + v
    const long long limit = std::numeric_limits<long long>::max() / 4;
    return limit / static_cast<long long>(rows + 1);
}

MatchVec solve_assignment(const CostMatrix& cost) {
    const size_t n = cost.size();
    if (n == 0) return {};

    const size_t m = cost[0].size();
    if (n > m) {
        std::ostringstream oss;
        oss << "assignment needs rows <= cols (" << n << " > " << m << ")";
        throw SolverError(oss.str());
    }

    const long long safe = max_safe_cost(n);
    for (size_t i = 0; i < n; ++i) {
        if (cost[i].size() != m) throw SolverError("assignment cost matrix is not rectangular");
        for (long long c : cost[i]) {
            if (c != kForbidden && (c > safe || c < -safe)) {
                throw SolverError("assignment cost exceeds exact integer range; split the batch");
            }
        }
    }

    const long long INF = std::numeric_limits<long long>::max();

    // 1-indexed; column 0 is the virtual start column
    std::vector<long long> u(n + 1, 0), v(m + 1, 0);
    std::vector<size_t> p(m + 1, 0), way(m + 1, 0);

    for (size_t i = 1; i <= n; ++i) {
        p[0] = i;
        size_t j0 = 0;
        std::vector<long long> minv(m + 1, INF);
        std::vector<char> used(m + 1, 0);

        do {
            used[j0] = 1;
            const size_t i0 = p[j0];
            long long delta = INF;
            size_t j1 = 0;

            for (size_t j = 1; j <= m; ++j) {
                if (used[j]) continue;

                const long long c = cost[i0 - 1][j - 1];
                if (c != kForbidden) {
                    const long long cur = c - u[i0] - v[j];
                    if (cur < minv[j]) {
                        minv[j] = cur;
                        way[j] = j0;
                    }
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            if (j1 == 0) {
                std::ostringstream oss;
                oss << "assignment infeasible: row " << (i - 1) << " has no reachable free column";
                throw SolverError(oss.str());
            }

            for (size_t j = 0; j <= m; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else if (minv[j] != INF) {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        do {
            const size_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    MatchVec row_match(n, -1);
    for (size_t j = 1; j <= m; ++j) {
        if (p[j] != 0) row_match[p[j] - 1] = static_cast<int>(j - 1);
    }
    return row_match;
}

}  // namespace placement
