#include "commands/allocate.hpp"
#include "commands/audit.hpp"
#include "commands/explain.hpp"
#include "commands/recommend.hpp"
#include "commands/score.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine allocate [args]\n"
        << "  placement-engine score [args]\n"
        << "  placement-engine recommend [args]\n"
        << "  placement-engine explain [args]\n"
        << "  placement-engine audit [args]\n"
        << "  placement-engine validate [args]\n"
        << "  placement-engine help\n";
    return 1;
}

static int print_allocate_help() {
    std::cerr
        << "usage:\n"
        << "  placement-engine allocate --batch <path> --round <id> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --batch <path>               (required) candidates, slots, feature schema\n"
        << "  --round <id>                 (required) round identifier\n"
        << "  --config <path>              round config JSON (weights, scoring, policy, solver, threads, retry)\n"
        << "  --outdir <dir>               default: out\n"
        << "  --ledger <path>              default: <outdir>/audit_ledger.jsonl\n"
        << "\n"
        << "feature extraction (entities without features):\n"
        << "  --features_dir <dir>         read <dir>/candidates/<id>.json, <dir>/slots/<id>.json\n"
        << "  --extractor <cmd>            run '<cmd> <candidates|slots> <id>', JSON on stdout\n"
        << "  --extractor_cache <dir>      default: out/extract_cache\n"
        << "\n"
        << "overrides:\n"
        << "  --min_score <f>              default: 0.0\n"
        << "  --threads <n>                default: 0 (hardware concurrency)\n"
        << "  --tolerance <f>              default: 0.10\n"
        << "  --scope <aggregate|per_slot> default: aggregate\n"
        << "  --waive_infeasible           waive floors of slots whose quotas conflict\n"
        << "  --strict_floors              fail the round on an unfillable floor\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "allocate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_allocate_help();

    if (cmd == "allocate")  return cmd_allocate(argc - 1, argv + 1);
    if (cmd == "score")     return cmd_score(argc - 1, argv + 1);
    if (cmd == "recommend") return cmd_recommend(argc - 1, argv + 1);
    if (cmd == "explain")   return cmd_explain(argc - 1, argv + 1);
    if (cmd == "audit")     return cmd_audit(argc - 1, argv + 1);
    if (cmd == "validate")  return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
