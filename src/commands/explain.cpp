#include "commands/explain.hpp"

#include "commands/Args.hpp"
#include "placement/AllocationArtifact.hpp"
#include "placement/Explain.hpp"

#include <iostream>
#include <string>

static int explain_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine explain --allocation <path> --candidate <id>\n";
    return 1;
}

int cmd_explain(int argc, char** argv) {
    const std::string alloc_path = cli::get_arg(argc, argv, "--allocation", "out/allocation.json");
    const std::string candidate_id = cli::get_arg(argc, argv, "--candidate", "");

    if (candidate_id.empty()) {
        std::cerr << "error: missing --candidate\n";
        return explain_usage();
    }

    placement::AllocationArtifact artifact;
    try {
        artifact = placement::AllocationArtifact::load(alloc_path);
    } catch (const std::exception& e) {
        std::cerr << "explain failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "ROUND: " << artifact.allocation.round_id << "\n";

    if (const placement::AllocationEntry* e = artifact.allocation.find(candidate_id)) {
        for (const auto& line : placement::explain_lines(*e)) std::cout << line << "\n";
        return 0;
    }

    for (const auto& u : artifact.allocation.unmatched) {
        if (u.candidate_id == candidate_id) {
            std::cout << candidate_id << " UNMATCHED: " << u.reason << "\n";
            return 0;
        }
    }
    for (const auto& x : artifact.excluded) {
        if (x.entity_id == candidate_id) {
            std::cout << candidate_id << " EXCLUDED: " << x.code << ": " << x.message << "\n";
            return 0;
        }
    }

    std::cerr << "error: candidate " << candidate_id << " not found in " << alloc_path << "\n";
    return 1;
}
