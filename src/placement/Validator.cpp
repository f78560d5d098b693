#include "placement/Validator.hpp"

#include <cmath>
#include <fstream>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "nlohmann/json.hpp"
#include "placement/Scorer.hpp"

namespace fs = std::filesystem;

namespace placement {

static void add_issue(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& entity_id = "") {
    rep.pass = false;
    ValidationIssue e;
    e.code = code;
    e.message = msg;
    e.entity_id = entity_id;
    rep.issues.push_back(std::move(e));
}

ValidationReport validate_allocation(
    const std::vector<Candidate>& candidates,
    const std::vector<Slot>& slots,
    const AllocationArtifact& artifact
) {
    ValidationReport rep;
    const Allocation& alloc = artifact.allocation;

    std::unordered_map<std::string, const Candidate*> cand_by_id;
    for (const auto& c : candidates) cand_by_id[c.id] = &c;
    std::unordered_map<std::string, const Slot*> slot_by_id;
    for (const auto& s : slots) slot_by_id[s.id] = &s;

    std::unordered_set<std::string> excluded;
    for (const auto& x : artifact.excluded) excluded.insert(x.entity_id);

    std::unordered_set<std::string> seen;
    std::map<std::string, int> per_slot;
    std::map<std::string, std::map<std::string, int>> per_slot_category;

    for (const auto& e : alloc.entries) {
        auto cit = cand_by_id.find(e.candidate_id);
        auto sit = slot_by_id.find(e.slot_id);

        if (cit == cand_by_id.end()) {
            add_issue(rep, "unknown_candidate", "assigned candidate not in batch", e.candidate_id);
        }
        if (sit == slot_by_id.end()) {
            add_issue(rep, "unknown_slot", "assignment targets a slot not in batch", e.slot_id);
        }
        if (excluded.count(e.candidate_id) || excluded.count(e.slot_id)) {
            add_issue(rep, "excluded_entity_assigned", "excluded entity appears in an assignment", e.candidate_id);
        }

        if (!seen.insert(e.candidate_id).second) {
            add_issue(rep, "duplicate_candidate", "candidate assigned more than once", e.candidate_id);
        }

        per_slot[e.slot_id] += 1;
        if (cit != cand_by_id.end()) {
            per_slot_category[e.slot_id][cit->second->category] += 1;
        }

        if (cit != cand_by_id.end() && sit != slot_by_id.end() && !is_eligible(*cit->second, *sit->second)) {
            add_issue(rep, "ineligible_assignment", "candidate is not eligible for slot " + e.slot_id, e.candidate_id);
        }

        if (e.score.candidate_id != e.candidate_id || e.score.slot_id != e.slot_id) {
            add_issue(rep, "score_mismatch", "score belongs to a different pair", e.candidate_id);
        }
        if (!(e.score.composite >= -1e-9 && e.score.composite <= 1.0 + 1e-9)) {
            add_issue(rep, "composite_out_of_range", "composite outside [0,1]", e.candidate_id);
        }
        double sum = 0.0;
        for (const auto& f : e.score.breakdown) sum += f.contribution;
        if (std::fabs(sum - e.score.composite) > 1e-6) {
            add_issue(rep, "breakdown_sum_mismatch", "factor contributions do not sum to composite", e.candidate_id);
        }
    }

    for (const auto& u : alloc.unmatched) {
        if (cand_by_id.find(u.candidate_id) == cand_by_id.end()) {
            add_issue(rep, "unknown_candidate", "unmatched candidate not in batch", u.candidate_id);
        }
        if (!seen.insert(u.candidate_id).second) {
            add_issue(rep, "duplicate_candidate", "candidate both assigned and unmatched, or listed twice", u.candidate_id);
        }
        if (u.reason.empty()) {
            add_issue(rep, "missing_reason", "unmatched candidate has no reason code", u.candidate_id);
        }
    }

    for (const auto& c : candidates) {
        if (excluded.count(c.id)) continue;
        if (!seen.count(c.id)) {
            add_issue(rep, "unaccounted_candidate", "candidate neither assigned nor unmatched", c.id);
        }
    }

    for (const auto& s : slots) {
        const int n = per_slot[s.id];
        if (n > s.capacity) {
            add_issue(rep, "over_capacity", "slot holds " + std::to_string(n) + " for capacity " + std::to_string(s.capacity), s.id);
        }
    }

    auto has_waiver = [&](const std::string& slot_id, const std::string& category) {
        for (const auto& w : alloc.waivers) {
            if (w.slot_id == slot_id && w.category == category) return true;
        }
        return false;
    };

    for (const auto& sq : artifact.schedule.slots) {
        if (excluded.count(sq.slot_id)) continue;
        for (const auto& q : sq.entries) {
            const int got = per_slot_category[sq.slot_id][q.category];
            if (got > q.ceiling) {
                add_issue(rep, "ceiling_exceeded", "category " + q.category + " exceeds its ceiling", sq.slot_id);
            }
            if (q.floor > 0 && got < q.floor && !has_waiver(sq.slot_id, q.category)) {
                add_issue(rep, "floor_unmet", "category " + q.category + " below floor without a waiver", sq.slot_id);
            }
        }
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["issues"] = nlohmann::json::array();

    for (const auto& e : rep.issues) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.entity_id.empty()) ej["entity_id"] = e.entity_id;
        j["issues"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace placement
