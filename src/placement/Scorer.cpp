#include "placement/Scorer.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "placement/CancelToken.hpp"
#include "placement/Errors.hpp"
#include "placement/TextUtil.hpp"

namespace placement {

static const Factor kFactorOrder[] = {
    Factor::SkillSimilarity,
    Factor::PreferenceAlignment,
    Factor::GeographyFit,
    Factor::ExperienceFit,
};

const char* factor_name(Factor f) {
    switch (f) {
        case Factor::SkillSimilarity: return "skill_similarity";
        case Factor::PreferenceAlignment: return "preference_alignment";
        case Factor::GeographyFit: return "geography_fit";
        case Factor::ExperienceFit: return "experience_fit";
        default: return "unknown";
    }
}

double FactorWeights::weight_of(Factor f) const {
    switch (f) {
        case Factor::SkillSimilarity: return skill_similarity;
        case Factor::PreferenceAlignment: return preference_alignment;
        case Factor::GeographyFit: return geography_fit;
        case Factor::ExperienceFit: return experience_fit;
        default: return 0.0;
    }
}

void FactorWeights::validate() const {
    double sum = 0.0;
    for (Factor f : kFactorOrder) {
        const double w = weight_of(f);
        if (!std::isfinite(w) || w < 0.0) {
            throw ConfigError(std::string("factor weight must be a non-negative number: ") + factor_name(f));
        }
        sum += w;
    }
    if (std::fabs(sum - 1.0) > 1e-9) {
        std::ostringstream oss;
        oss << "factor weights must sum to 1.0 (got " << sum << ")";
        throw ConfigError(oss.str());
    }
}

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

static const NormalizedVector& require_features(const ScoringSide& side, Factor f) {
    if (!side.features) {
        throw FactorError(factor_name(f), side.id + ": normalized features absent");
    }
    return *side.features;
}

static double numeric_field(const NormalizedVector& v, const std::string& name, const std::string& owner, Factor f) {
    for (size_t i = 0; i < v.numeric_names.size() && i < v.numeric.size(); ++i) {
        if (v.numeric_names[i] == name) return v.numeric[i];
    }
    throw FactorError(factor_name(f), owner + ": numeric field '" + name + "' absent after normalization");
}

// cosine rescaled from [-1,1] to [0,1]
static double skill_similarity(const ScoringSide& cand, const ScoringSide& slot) {
    const auto& a = require_features(cand, Factor::SkillSimilarity).skills;
    const auto& b = require_features(slot, Factor::SkillSimilarity).skills;

    if (a.empty() || b.empty()) {
        throw FactorError(factor_name(Factor::SkillSimilarity), "skill vector absent");
    }
    if (a.size() != b.size()) {
        std::ostringstream oss;
        oss << "skill dimension mismatch (" << a.size() << " vs " << b.size() << ")";
        throw FactorError(factor_name(Factor::SkillSimilarity), oss.str());
    }

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        na += a[i] * a[i];
        nb += b[i] * b[i];
    }
    if (na == 0.0 || nb == 0.0) {
        throw FactorError(factor_name(Factor::SkillSimilarity), "zero skill vector");
    }

    const double cosine = dot / (std::sqrt(na) * std::sqrt(nb));
    return clamp01((cosine + 1.0) / 2.0);
}

static std::vector<int> known_tags(const NormalizedVector& v) {
    std::vector<int> out;
    out.reserve(v.tag_indices.size());
    for (int t : v.tag_indices) {
        if (t != v.unknown_tag_index) out.push_back(t);
    }
    return out;
}

// Jaccard overlap of known tags; neutral when either side states nothing.
static double preference_alignment(const ScoringSide& cand, const ScoringSide& slot) {
    const auto a = known_tags(require_features(cand, Factor::PreferenceAlignment));
    const auto b = known_tags(require_features(slot, Factor::PreferenceAlignment));

    if (a.empty() || b.empty()) return 0.5;

    std::vector<int> inter;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(inter));

    const size_t uni = a.size() + b.size() - inter.size();
    return uni == 0 ? 0.0 : static_cast<double>(inter.size()) / static_cast<double>(uni);
}

static double geography_fit(const ScoringSide& cand, const ScoringSide& slot, const ScoreConfig& cfg) {
    if (!cand.location || !slot.location) {
        throw FactorError(factor_name(Factor::GeographyFit), "location absent");
    }

    const std::string ca = textutil::normalize_key(cand.location->city);
    const std::string cb = textutil::normalize_key(slot.location->city);
    const std::string ra = textutil::normalize_key(cand.location->region);
    const std::string rb = textutil::normalize_key(slot.location->region);

    const bool same_region = !ra.empty() && ra == rb;
    const bool region_compatible = ra.empty() || rb.empty() || same_region;

    if (!ca.empty() && ca == cb && region_compatible) return 1.0;
    if (same_region) return clamp01(cfg.same_region_credit);
    return 0.0;
}

static double experience_fit(const ScoringSide& cand, const ScoringSide& slot, const ScoreConfig& cfg) {
    const double have = numeric_field(require_features(cand, Factor::ExperienceFit), cfg.experience_field, cand.id,
                                      Factor::ExperienceFit);
    const double need = numeric_field(require_features(slot, Factor::ExperienceFit), cfg.experience_field, slot.id,
                                      Factor::ExperienceFit);

    if (have >= need) return 1.0;
    return clamp01(1.0 - (need - have));
}

static double compute_factor(Factor f, const ScoringSide& cand, const ScoringSide& slot, const ScoreConfig& cfg) {
    switch (f) {
        case Factor::SkillSimilarity: return skill_similarity(cand, slot);
        case Factor::PreferenceAlignment: return preference_alignment(cand, slot);
        case Factor::GeographyFit: return geography_fit(cand, slot, cfg);
        case Factor::ExperienceFit: return experience_fit(cand, slot, cfg);
        default: throw FactorError("unknown", "unknown factor");
    }
}

PairScore score_pair(
    const ScoringSide& candidate,
    const ScoringSide& slot,
    const FactorWeights& weights,
    const ScoreConfig& cfg
) {
    PairScore ps;
    ps.candidate_id = candidate.id;
    ps.slot_id = slot.id;

    for (Factor f : kFactorOrder) {
        const double w = weights.weight_of(f);
        if (w <= 0.0) continue;

        FactorContribution fc;
        fc.factor = factor_name(f);
        fc.weight = w;

        try {
            fc.subscore = compute_factor(f, candidate, slot, cfg);
        } catch (const FactorError& e) {
            fc.subscore = 0.0;
            fc.degraded = true;
            fc.note = e.what();
        }

        fc.contribution = fc.weight * fc.subscore;
        ps.composite += fc.contribution;
        ps.breakdown.push_back(std::move(fc));
    }

    // stable: equal contributions keep declaration order
    std::stable_sort(ps.breakdown.begin(), ps.breakdown.end(),
                     [](const FactorContribution& a, const FactorContribution& b) {
                         return a.contribution > b.contribution;
                     });

    return ps;
}

bool is_eligible(const Candidate& c, const Slot& s) {
    if (!c.allowed_regions.empty() && !textutil::contains_key(c.allowed_regions, s.location.region)) return false;
    if (!s.eligible_regions.empty() && !textutil::contains_key(s.eligible_regions, c.home.region)) return false;
    if (!s.sector.empty() && textutil::contains_key(c.excluded_sectors, s.sector)) return false;
    return true;
}

const char* confidence_level(double composite) {
    if (composite >= 0.80) return "high";
    if (composite >= 0.60) return "medium";
    return "low";
}

ScoreMatrix score_matrix(
    const std::vector<Candidate>& candidates,
    const std::vector<NormalizedVector>& candidate_vecs,
    const std::vector<Slot>& slots,
    const std::vector<NormalizedVector>& slot_vecs,
    const FactorWeights& weights,
    const ScoreConfig& cfg,
    int threads,
    const CancelToken* cancel
) {
    if (candidate_vecs.size() != candidates.size() || slot_vecs.size() != slots.size()) {
        throw std::invalid_argument("score_matrix: feature vectors not parallel to entities");
    }

    ScoreMatrix m;
    m.rows = candidates.size();
    m.cols = slots.size();
    m.eligible.assign(m.rows * m.cols, 0);
    m.scores.resize(m.rows * m.cols);

    if (m.rows == 0 || m.cols == 0) return m;

    size_t workers = threads > 0 ? static_cast<size_t>(threads) : std::thread::hardware_concurrency();
    if (workers == 0) workers = 1;
    workers = std::min(workers, m.rows);

    std::atomic<size_t> next_row{0};
    std::atomic<bool> stop{false};
    std::exception_ptr first_error;
    std::mutex error_mu;

    // each worker owns whole rows, so writes never overlap
    auto work = [&]() {
        while (!stop.load()) {
            if (cancel && cancel->cancelled()) {
                stop.store(true);
                return;
            }

            const size_t r = next_row.fetch_add(1);
            if (r >= m.rows) return;

            try {
                ScoringSide cs;
                cs.features = &candidate_vecs[r];
                cs.location = &candidates[r].home;
                cs.id = candidates[r].id;

                for (size_t c = 0; c < m.cols; ++c) {
                    if (!is_eligible(candidates[r], slots[c])) continue;

                    ScoringSide ss;
                    ss.features = &slot_vecs[c];
                    ss.location = &slots[c].location;
                    ss.id = slots[c].id;

                    m.scores[r * m.cols + c] = score_pair(cs, ss, weights, cfg);
                    m.eligible[r * m.cols + c] = 1;
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mu);
                if (!first_error) first_error = std::current_exception();
                stop.store(true);
                return;
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) pool.emplace_back(work);
    for (auto& t : pool) t.join();

    if (first_error) std::rethrow_exception(first_error);
    if (cancel) cancel->throw_if_cancelled();

    return m;
}

std::vector<Recommendation> recommend_slots(
    const Candidate& candidate,
    const NormalizedVector& candidate_vec,
    const std::vector<Slot>& slots,
    const std::vector<NormalizedVector>& slot_vecs,
    const FactorWeights& weights,
    const ScoreConfig& cfg,
    size_t topk
) {
    std::vector<Recommendation> out;

    ScoringSide cs;
    cs.features = &candidate_vec;
    cs.location = &candidate.home;
    cs.id = candidate.id;

    for (size_t i = 0; i < slots.size() && i < slot_vecs.size(); ++i) {
        if (!is_eligible(candidate, slots[i])) continue;

        ScoringSide ss;
        ss.features = &slot_vecs[i];
        ss.location = &slots[i].location;
        ss.id = slots[i].id;

        Recommendation rec;
        rec.slot_id = slots[i].id;
        rec.organization = slots[i].organization;
        rec.score = score_pair(cs, ss, weights, cfg);
        rec.confidence = confidence_level(rec.score.composite);
        out.push_back(std::move(rec));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         return a.score.composite > b.score.composite;
                     });

    if (topk > 0 && out.size() > topk) out.resize(topk);
    return out;
}

}  // namespace placement
