#include "commands/recommend.hpp"

#include "commands/Args.hpp"
#include "commands/Common.hpp"
#include "placement/Errors.hpp"
#include "placement/FeatureNormalizer.hpp"
#include "placement/Scorer.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  placement-engine recommend --batch <path> --candidate <id> [--topk <n>] [--config <path>]\n";
    return 1;
}

int cmd_recommend(int argc, char** argv) {
    const std::string candidate_id = cli::get_arg(argc, argv, "--candidate", "");
    const std::string topk_s = cli::get_arg(argc, argv, "--topk", "5");

    if (candidate_id.empty()) {
        std::cerr << "error: missing --candidate\n";
        return recommend_usage();
    }

    int topk = 0;
    if (!cli::parse_int(topk_s, topk) || topk < 0) {
        std::cerr << "error: invalid --topk\n";
        return 1;
    }

    EngineConfig cfg;
    if (!load_cli_config(argc, argv, cfg)) return 2;

    placement::Batch batch;
    if (!load_cli_batch(argc, argv, cfg, batch)) return 2;

    const placement::Candidate* cand = nullptr;
    for (const auto& c : batch.candidates) if (c.id == candidate_id) cand = &c;
    if (!cand) {
        std::cerr << "error: unknown candidate: " << candidate_id << "\n";
        return 1;
    }

    try {
        const placement::FeatureNormalizer normalizer(batch.schema);
        const placement::NormalizedVector cv = normalizer.normalize(cand->id, cand->features);

        std::vector<placement::Slot> slots;
        std::vector<placement::NormalizedVector> slot_vecs;
        for (const auto& s : batch.slots) {
            try {
                slot_vecs.push_back(normalizer.normalize(s.id, s.features));
                slots.push_back(s);
            } catch (const placement::ValidationError& e) {
                std::cerr << "warning: skipping slot " << s.id << ": " << e.what() << "\n";
            }
        }

        const auto recs = placement::recommend_slots(*cand, cv, slots, slot_vecs, cfg.round.weights,
                                                     cfg.round.scoring, static_cast<size_t>(topk));

        std::cout << "CANDIDATE: " << cand->id << "\n";
        std::cout << "RECOMMENDATIONS: " << recs.size() << "\n";
        std::cout << std::fixed << std::setprecision(4);
        for (size_t i = 0; i < recs.size(); ++i) {
            const auto& r = recs[i];
            std::cout << (i + 1) << ". " << r.slot_id;
            if (!r.organization.empty()) std::cout << " (" << r.organization << ")";
            std::cout << " score=" << r.score.composite << " confidence=" << r.confidence;
            if (!r.score.breakdown.empty()) std::cout << " top=" << r.score.breakdown.front().factor;
            std::cout << "\n";
        }
    } catch (const placement::ValidationError& e) {
        std::cerr << "recommend failed: " << e.entity_id() << " (" << e.code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "recommend failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
