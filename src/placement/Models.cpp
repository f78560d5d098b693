#include "placement/Models.hpp"

namespace placement {

const AllocationEntry* Allocation::find(const std::string& candidate_id) const {
    for (const auto& e : entries) {
        if (e.candidate_id == candidate_id) return &e;
    }
    return nullptr;
}

int Allocation::assigned_count(const std::string& slot_id) const {
    int n = 0;
    for (const auto& e : entries) {
        if (e.slot_id == slot_id) ++n;
    }
    return n;
}

}  // namespace placement
