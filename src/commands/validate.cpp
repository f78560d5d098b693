#include "commands/validate.hpp"

#include "commands/Args.hpp"
#include "io/JsonIO.hpp"
#include "placement/AllocationArtifact.hpp"
#include "placement/Validator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine validate --batch <path> [--allocation <path>] [--out <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string batch_path = cli::get_arg(argc, argv, "--batch", "");
    const std::string alloc_path = cli::get_arg(argc, argv, "--allocation", "out/allocation.json");

    if (batch_path.empty()) {
        std::cerr << "error: missing --batch\n";
        return validate_usage();
    }

    const fs::path alloc_p(alloc_path);
    const std::string out_path = cli::get_arg(argc, argv, "--out", (alloc_p.parent_path() / "validation_report.json").string());

    placement::ValidationReport rep;
    try {
        const placement::Batch batch = loadBatch(batch_path);
        const placement::AllocationArtifact artifact = placement::AllocationArtifact::load(alloc_p);
        rep = placement::validate_allocation(batch.candidates, batch.slots, artifact);
        placement::write_validation_report(fs::path(out_path), rep);
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }

    if (!rep.pass) {
        std::cerr << "validation failed: wrote " << out_path << "\n";
        for (const auto& e : rep.issues) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.entity_id.empty()) std::cerr << " (entity_id=" << e.entity_id << ")";
            std::cerr << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
