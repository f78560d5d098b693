#include "commands/audit.hpp"

#include "commands/Args.hpp"
#include "placement/AuditLedger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int audit_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine audit --ledger <path> --verify\n"
        << "  placement-engine audit --ledger <path> --entity <id>\n"
        << "  placement-engine audit --ledger <path> --supersede <sequence> --round <id> --reason <text>\n";
    return 1;
}

static void print_record(const placement::AuditRecord& r) {
    std::cout << "#" << r.sequence << " [" << r.round_id << "] " << placement::audit_kind_name(r.kind);
    if (!r.candidate_id.empty()) std::cout << " candidate=" << r.candidate_id;
    if (!r.slot_id.empty()) std::cout << " slot=" << r.slot_id;
    if (r.kind == placement::AuditKind::Assignment) {
        std::cout << " composite=" << std::fixed << std::setprecision(4) << r.composite << std::defaultfloat;
    }
    if (r.supersedes >= 0) std::cout << " supersedes=#" << r.supersedes;
    if (!r.reason.empty()) std::cout << " reason=" << r.reason;
    std::cout << "\n";
}

int cmd_audit(int argc, char** argv) {
    const std::string ledger_path = cli::get_arg(argc, argv, "--ledger", "out/audit_ledger.jsonl");
    const std::string entity = cli::get_arg(argc, argv, "--entity", "");
    const std::string supersede_s = cli::get_arg(argc, argv, "--supersede", "");
    const bool verify = cli::has_flag(argc, argv, "--verify");

    if (!verify && entity.empty() && supersede_s.empty()) return audit_usage();

    if (!fs::exists(ledger_path)) {
        std::cerr << "error: ledger not found: " << ledger_path << "\n";
        return 1;
    }

    try {
        placement::AuditLedger ledger{fs::path(ledger_path)};

        if (verify) {
            const placement::ChainCheck check = ledger.verify();
            std::cout << "RECORDS: " << ledger.size() << "\n";
            if (!check.ok) {
                std::cout << "CHAIN: broken\n";
                std::cerr << "audit failed: " << check.message << "\n";
                return 1;
            }
            std::cout << "CHAIN: ok\n";
            std::cout << "HEAD: " << ledger.head_hash() << "\n";
        }

        if (!entity.empty()) {
            const auto hist = ledger.history(entity);
            std::cout << "ENTITY: " << entity << "\n";
            std::cout << "RECORDS: " << hist.size() << "\n";
            for (const auto& r : hist) print_record(r);
        }

        if (!supersede_s.empty()) {
            const std::string round_id = cli::get_arg(argc, argv, "--round", "");
            const std::string reason = cli::get_arg(argc, argv, "--reason", "");
            int seq = -1;
            if (!cli::parse_int(supersede_s, seq) || seq < 0) {
                std::cerr << "error: invalid --supersede\n";
                return 1;
            }
            if (round_id.empty() || reason.empty()) {
                std::cerr << "error: --supersede needs --round and --reason\n";
                return audit_usage();
            }

            const placement::ChainCheck check = ledger.verify();
            if (!check.ok) {
                std::cerr << "audit failed: refusing to append to a broken chain: " << check.message << "\n";
                return 1;
            }
            print_record(ledger.append_correction(static_cast<uint64_t>(seq), round_id, reason));
        }
    } catch (const std::exception& e) {
        std::cerr << "audit failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
