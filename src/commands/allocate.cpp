#include "commands/allocate.hpp"

#include "commands/Args.hpp"
#include "commands/Common.hpp"
#include "placement/AuditLedger.hpp"
#include "placement/Orchestrator.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

static int allocate_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine allocate --batch <path> --round <id> [options]\n";
    return 1;
}

int cmd_allocate(int argc, char** argv) {
    const std::string round_id = cli::get_arg(argc, argv, "--round", "");
    const std::string outdir = cli::get_arg(argc, argv, "--outdir", "out");
    const fs::path outdir_p(outdir);
    const std::string ledger_path = cli::get_arg(argc, argv, "--ledger", (outdir_p / "audit_ledger.jsonl").string());

    if (round_id.empty()) {
        std::cerr << "error: missing --round\n";
        return allocate_usage();
    }

    EngineConfig cfg;
    if (!load_cli_config(argc, argv, cfg)) return 2;

    placement::Batch batch;
    if (!load_cli_batch(argc, argv, cfg, batch)) return 2;

    try {
        fs::create_directories(outdir_p);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to create outdir '" << outdir << "': " << e.what() << "\n";
        return 2;
    }

    std::unique_ptr<placement::AuditLedger> ledger;
    try {
        ledger = std::make_unique<placement::AuditLedger>(fs::path(ledger_path));
    } catch (const std::exception& e) {
        std::cerr << "error: failed to open audit ledger: " << e.what() << "\n";
        return 2;
    }

    placement::JsonFilePublisher publisher(outdir);
    placement::BatchOrchestrator orchestrator(*ledger, cfg.round, &publisher);

    const placement::RoundResult res = orchestrator.run_round(round_id, batch);

    const fs::path events_path = outdir_p / "round_events.jsonl";
    append_jsonl(events_path, placement::round_event_json(res));

    std::cout << "ROUND: " << res.round_id << "\n";
    for (const auto& ev : res.events) {
        std::cout << "STAGE: " << ev.stage << " " << ev.millis << "ms";
        if (!ev.detail.empty()) std::cout << " (" << ev.detail << ")";
        std::cout << "\n";
    }

    if (!res.ok) {
        std::cerr << "allocate failed: " << placement::failure_kind_name(res.failure.kind) << ": " << res.failure.message << "\n";
        for (const auto& id : res.failure.offending) std::cerr << "- " << id << "\n";
        std::cout << "OUT_EVENTS: " << events_path.string() << "\n";
        return 1;
    }

    std::cout << "CANDIDATES: " << res.stats.candidates << "\n";
    std::cout << "ASSIGNED: " << res.stats.assigned << "\n";
    std::cout << "UNMATCHED: " << res.stats.unmatched << "\n";
    std::cout << "EXCLUDED: " << res.stats.excluded << "\n";
    std::cout << "WAIVERS: " << res.stats.waivers << "\n";
    std::cout << "FILL_RATE: " << res.stats.fill_rate << "\n";
    std::cout << "MEAN_COMPOSITE: " << res.stats.mean_composite << "\n";

    if (res.disparity.passed()) {
        std::cout << "FAIRNESS: pass\n";
    } else {
        std::cout << "FAIRNESS: " << res.disparity.violations.size() << " violation(s)\n";
        for (const auto& v : res.disparity.violations) {
            std::cout << "- " << v.category;
            if (!v.slot_id.empty()) std::cout << " @ " << v.slot_id;
            std::cout << ": observed=" << v.observed << " expected=" << v.expected << "\n";
        }
    }

    std::cout << "OUT_ALLOCATION: " << publisher.allocation_path().string() << "\n";
    std::cout << "OUT_LEDGER: " << ledger_path << "\n";
    std::cout << "OUT_EVENTS: " << events_path.string() << "\n";
    return 0;
}
