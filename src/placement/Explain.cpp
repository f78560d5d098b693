#include "placement/Explain.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace placement {

std::vector<FactorContribution> explain(const AllocationEntry& entry) {
    return entry.score.breakdown;
}

std::vector<FactorContribution> improvement_areas(const AllocationEntry& entry, double threshold) {
    std::vector<FactorContribution> weak;
    for (const auto& f : entry.score.breakdown) {
        if (f.subscore < threshold) weak.push_back(f);
    }
    std::stable_sort(weak.begin(), weak.end(), [](const FactorContribution& a, const FactorContribution& b) {
        return a.subscore < b.subscore;
    });
    return weak;
}

std::vector<std::string> explain_lines(const AllocationEntry& entry) {
    std::vector<std::string> lines;

    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4);
        oss << entry.candidate_id << " -> " << entry.slot_id
            << "  composite=" << entry.score.composite
            << "  confidence=" << entry.confidence;
        if (entry.via_quota) oss << "  reserved_seat=" << entry.quota_category;
        lines.push_back(oss.str());
    }

    for (const auto& f : explain(entry)) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4);
        oss << "  " << std::left << std::setw(22) << f.factor
            << " weight=" << f.weight
            << " subscore=" << f.subscore
            << " contribution=" << f.contribution;
        if (f.degraded) oss << "  [degraded: " << f.note << "]";
        lines.push_back(oss.str());
    }

    const auto weak = improvement_areas(entry);
    if (!weak.empty()) {
        std::ostringstream oss;
        oss << "  improve:";
        for (size_t i = 0; i < weak.size(); ++i) {
            oss << (i ? ", " : " ") << weak[i].factor;
        }
        lines.push_back(oss.str());
    }

    return lines;
}

}  // namespace placement
