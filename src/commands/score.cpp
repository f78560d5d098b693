#include "commands/score.hpp"

#include "commands/Args.hpp"
#include "commands/Common.hpp"
#include "placement/Errors.hpp"
#include "placement/FeatureNormalizer.hpp"
#include "placement/ScoreJson.hpp"
#include "placement/Scorer.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

static int score_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine score --batch <path> --candidate <id> --slot <id> [--config <path>] [--out <path>]\n";
    return 1;
}

int cmd_score(int argc, char** argv) {
    const std::string candidate_id = cli::get_arg(argc, argv, "--candidate", "");
    const std::string slot_id = cli::get_arg(argc, argv, "--slot", "");
    const std::string out_path = cli::get_arg(argc, argv, "--out", "");

    if (candidate_id.empty() || slot_id.empty()) {
        std::cerr << "error: missing --candidate or --slot\n";
        return score_usage();
    }

    EngineConfig cfg;
    if (!load_cli_config(argc, argv, cfg)) return 2;

    placement::Batch batch;
    if (!load_cli_batch(argc, argv, cfg, batch)) return 2;

    const placement::Candidate* cand = nullptr;
    for (const auto& c : batch.candidates) if (c.id == candidate_id) cand = &c;
    const placement::Slot* slot = nullptr;
    for (const auto& s : batch.slots) if (s.id == slot_id) slot = &s;

    if (!cand) {
        std::cerr << "error: unknown candidate: " << candidate_id << "\n";
        return 1;
    }
    if (!slot) {
        std::cerr << "error: unknown slot: " << slot_id << "\n";
        return 1;
    }

    try {
        const placement::FeatureNormalizer normalizer(batch.schema);
        const placement::NormalizedVector cv = normalizer.normalize(cand->id, cand->features);
        const placement::NormalizedVector sv = normalizer.normalize(slot->id, slot->features);

        placement::ScoringSide cs{&cv, &cand->home, cand->id};
        placement::ScoringSide ss{&sv, &slot->location, slot->id};
        const placement::PairScore ps = placement::score_pair(cs, ss, cfg.round.weights, cfg.round.scoring);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "PAIR: " << ps.candidate_id << " -> " << ps.slot_id << "\n";
        std::cout << "ELIGIBLE: " << (placement::is_eligible(*cand, *slot) ? "yes" : "no") << "\n";
        std::cout << "COMPOSITE: " << ps.composite << "\n";
        std::cout << "CONFIDENCE: " << placement::confidence_level(ps.composite) << "\n";
        for (const auto& f : ps.breakdown) {
            std::cout << "- " << f.factor << ": " << f.contribution << " (weight " << f.weight
                      << " x subscore " << f.subscore << ")";
            if (f.degraded) std::cout << " [degraded: " << f.note << "]";
            std::cout << "\n";
        }

        if (!out_path.empty()) {
            std::ofstream out(out_path, std::ios::out | std::ios::trunc);
            if (!out) {
                std::cerr << "error: failed to open --out path: " << out_path << "\n";
                return 1;
            }
            out << placement::pair_score_to_json(ps).dump(2) << "\n";
            std::cout << "OUT: " << out_path << "\n";
        }
    } catch (const placement::ValidationError& e) {
        std::cerr << "score failed: " << e.entity_id() << " (" << e.code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "score failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
