#pragma once

#include <string>
#include <vector>

#include "placement/Models.hpp"

namespace placement {

class CancelToken;

// Declaration order is the tie-break order of the breakdown.
enum class Factor {
    SkillSimilarity,
    PreferenceAlignment,
    GeographyFit,
    ExperienceFit
};

const char* factor_name(Factor f);

struct FactorWeights {
    double skill_similarity = 0.40;
    double preference_alignment = 0.25;
    double geography_fit = 0.15;
    double experience_fit = 0.20;

    double weight_of(Factor f) const;

    // Throws ConfigError unless every weight is >= 0 and they sum to 1.
    void validate() const;
};

struct ScoreConfig {
    // geography_fit credit when the city differs but the region matches
    double same_region_credit = 0.5;

    // numeric field compared by experience_fit (normalized on both sides)
    std::string experience_field = "experience";
};

// Inputs of one side of a pair, as seen by the scorer.
struct ScoringSide {
    const NormalizedVector* features = nullptr;
    const Location* location = nullptr;
    std::string id;
};

// Pure function of its arguments; identical inputs give identical output.
PairScore score_pair(
    const ScoringSide& candidate,
    const ScoringSide& slot,
    const FactorWeights& weights,
    const ScoreConfig& cfg = {}
);

// Hard eligibility constraints (geography / sector restrictions).
bool is_eligible(const Candidate& c, const Slot& s);

const char* confidence_level(double composite);

// Dense candidate x slot matrix. Ineligible pairs carry no score.
struct ScoreMatrix {
    size_t rows = 0;
    size_t cols = 0;

    std::vector<char> eligible;     // rows * cols
    std::vector<PairScore> scores;  // rows * cols, meaningful where eligible

    bool has(size_t r, size_t c) const { return eligible[r * cols + c] != 0; }
    const PairScore& at(size_t r, size_t c) const { return scores[r * cols + c]; }
    double composite(size_t r, size_t c) const { return scores[r * cols + c].composite; }
};

// Scores every eligible pair on `threads` workers (0 = hardware concurrency).
// candidate_vecs / slot_vecs are parallel to candidates / slots.
ScoreMatrix score_matrix(
    const std::vector<Candidate>& candidates,
    const std::vector<NormalizedVector>& candidate_vecs,
    const std::vector<Slot>& slots,
    const std::vector<NormalizedVector>& slot_vecs,
    const FactorWeights& weights,
    const ScoreConfig& cfg,
    int threads = 0,
    const CancelToken* cancel = nullptr
);

struct Recommendation {
    std::string slot_id;
    std::string organization;
    PairScore score;
    std::string confidence;
};

// Eligible slots for one candidate, best first (ties: slot order).
std::vector<Recommendation> recommend_slots(
    const Candidate& candidate,
    const NormalizedVector& candidate_vec,
    const std::vector<Slot>& slots,
    const std::vector<NormalizedVector>& slot_vecs,
    const FactorWeights& weights,
    const ScoreConfig& cfg,
    size_t topk
);

}  // namespace placement
