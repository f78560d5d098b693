#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "placement/AllocationArtifact.hpp"
#include "placement/Models.hpp"

namespace placement {

struct ValidationIssue {
    std::string code;
    std::string message;
    std::string entity_id;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationIssue> issues;
};

// Independent check of a written allocation against the batch it came from:
// known ids, one seat per candidate, capacity, eligibility, floors met or
// waived, ceilings, and score breakdown consistency.
ValidationReport validate_allocation(const std::vector<Candidate>& candidates,
                                     const std::vector<Slot>& slots,
                                     const AllocationArtifact& artifact);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace placement
