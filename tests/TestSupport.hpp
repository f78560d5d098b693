#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "placement/FairnessMonitor.hpp"
#include "placement/FeatureNormalizer.hpp"
#include "placement/Models.hpp"
#include "placement/Scorer.hpp"

namespace testsupport {

inline placement::Candidate candidate(const std::string& id, const std::string& category = "general",
                                      long long submitted_at = 0) {
    placement::Candidate c;
    c.id = id;
    c.category = category;
    c.submitted_at = submitted_at;
    return c;
}

inline placement::Slot slot(const std::string& id, int capacity = 1,
                            std::map<std::string, int> reserved = {}) {
    placement::Slot s;
    s.id = id;
    s.capacity = capacity;
    s.reserved = std::move(reserved);
    return s;
}

// values[r][c] < 0 marks an ineligible pair
inline placement::ScoreMatrix matrix(const std::vector<placement::Candidate>& cs,
                                     const std::vector<placement::Slot>& ss,
                                     const std::vector<std::vector<double>>& values) {
    placement::ScoreMatrix m;
    m.rows = cs.size();
    m.cols = ss.size();
    m.eligible.assign(m.rows * m.cols, 0);
    m.scores.resize(m.rows * m.cols);

    for (size_t r = 0; r < m.rows; ++r) {
        for (size_t c = 0; c < m.cols; ++c) {
            const double v = values[r][c];
            if (v < 0.0) continue;

            placement::PairScore ps;
            ps.candidate_id = cs[r].id;
            ps.slot_id = ss[c].id;
            ps.composite = v;

            placement::FactorContribution f;
            f.factor = "skill_similarity";
            f.weight = 1.0;
            f.subscore = v;
            f.contribution = v;
            ps.breakdown.push_back(f);

            m.scores[r * m.cols + c] = ps;
            m.eligible[r * m.cols + c] = 1;
        }
    }
    return m;
}

inline placement::QuotaSchedule plan(const std::vector<placement::Candidate>& cs,
                                     const std::vector<placement::Slot>& ss,
                                     const placement::ScoreMatrix& m,
                                     placement::QuotaPolicy policy = {}) {
    return placement::FairnessMonitor(std::move(policy)).plan(cs, ss, m);
}

inline placement::NormalizedVector vec(std::vector<double> skills, std::vector<int> tags, double experience,
                                       int unknown_tag = 10) {
    placement::NormalizedVector v;
    v.schema_version = 1;
    v.skills = std::move(skills);
    v.tag_indices = std::move(tags);
    v.unknown_tag_index = unknown_tag;
    v.numeric_names = {"experience"};
    v.numeric = {experience};
    v.imputed = {false};
    return v;
}

inline placement::FeatureSchema schema() {
    placement::FeatureSchema s;
    s.version = 1;
    s.skill_dim = 2;
    s.tag_vocabulary = {"software", "finance"};
    s.numeric_fields = {{"experience", 0.0, 10.0}};
    return s;
}

inline placement::RawFeatures features(std::vector<double> skills, std::vector<std::string> tags, double experience) {
    placement::RawFeatures f;
    f.schema_version = 1;
    f.skills = std::move(skills);
    f.tags = std::move(tags);
    f.numeric["experience"] = experience;
    return f;
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("placement_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

}  // namespace testsupport
