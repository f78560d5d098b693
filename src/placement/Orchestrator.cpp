#include "placement/Orchestrator.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "placement/Errors.hpp"
#include "placement/Explain.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace placement {

void RoundConfig::validate() const {
    weights.validate();
    FairnessMonitor check(policy);
    (void)check;

    if (!(solver.min_score >= 0.0 && solver.min_score <= 1.0)) {
        throw ConfigError("min_score must lie in [0,1]");
    }
    if (!(scoring.same_region_credit >= 0.0 && scoring.same_region_credit <= 1.0)) {
        throw ConfigError("same_region_credit must lie in [0,1]");
    }
    if (scoring.experience_field.empty()) {
        throw ConfigError("experience_field must not be empty");
    }
    if (worker_threads < 0) {
        throw ConfigError("threads must be >= 0");
    }
}

const char* failure_kind_name(FailureKind k) {
    switch (k) {
        case FailureKind::InvalidInput: return "invalid_input";
        case FailureKind::QuotaInfeasible: return "quota_infeasible";
        case FailureKind::SolverError: return "solver_error";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Internal: return "internal";
        default: return "unknown";
    }
}

AllocationArtifact RoundResult::artifact() const {
    AllocationArtifact a;
    a.allocation = allocation;
    a.schedule = schedule;
    a.disparity = disparity;
    a.excluded = excluded;
    a.stats = stats;
    if (!audit.empty()) a.ledger_head = audit.back().hash;
    return a;
}

json round_event_json(const RoundResult& r) {
    json j;
    j["round_id"] = r.round_id;
    j["ok"] = r.ok;

    json stages = json::array();
    for (const auto& e : r.events) {
        json ej = {{"stage", e.stage}, {"millis", e.millis}};
        if (!e.detail.empty()) ej["detail"] = e.detail;
        stages.push_back(std::move(ej));
    }
    j["stages"] = stages;

    if (r.ok) {
        j["assigned"] = r.stats.assigned;
        j["unmatched"] = r.stats.unmatched;
        j["excluded"] = r.stats.excluded;
        j["waivers"] = r.stats.waivers;
        j["fairness_violations"] = r.stats.violations;
        j["audit_records"] = r.audit.size();
    } else {
        j["failure"] = {
            {"kind", failure_kind_name(r.failure.kind)},
            {"message", r.failure.message},
            {"offending", r.failure.offending}
        };
    }
    return j;
}

JsonFilePublisher::JsonFilePublisher(const std::string& outdir) : outdir_(outdir) {}

void JsonFilePublisher::publish(const RoundResult& result) {
    fs::create_directories(outdir_);
    result.artifact().write_to(allocation_path());
}

BatchOrchestrator::BatchOrchestrator(AuditLedger& ledger, RoundConfig cfg, Publisher* publisher)
    : m_ledger(ledger), m_cfg(std::move(cfg)), m_publisher(publisher) {
    m_cfg.validate();
}

namespace {

class StageClock {
public:
    explicit StageClock(std::vector<StageEvent>& events)
        : m_events(events), m_last(std::chrono::steady_clock::now()) {}

    void mark(const std::string& stage, const std::string& detail = "") {
        const auto now = std::chrono::steady_clock::now();
        StageEvent e;
        e.stage = stage;
        e.millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_last).count();
        e.detail = detail;
        m_events.push_back(std::move(e));
        m_last = now;
    }

private:
    std::vector<StageEvent>& m_events;
    std::chrono::steady_clock::time_point m_last;
};

ExcludedEntity excluded_entity(const std::string& id, const char* kind, const std::string& code, const std::string& msg) {
    ExcludedEntity x;
    x.entity_id = id;
    x.entity_kind = kind;
    x.code = code;
    x.message = msg;
    return x;
}

// Per-entity structural checks. Offenders are excluded, the round goes on.
template <typename Entity, typename Check>
std::vector<Entity> screen(const std::vector<Entity>& in, const char* kind, Check check, std::vector<ExcludedEntity>& excluded) {
    std::unordered_map<std::string, int> seen;
    for (const auto& e : in) seen[e.id] += 1;

    std::vector<Entity> out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        const Entity& e = in[i];
        if (e.id.empty()) {
            excluded.push_back(excluded_entity("#" + std::to_string(i), kind, "missing_id", std::string(kind) + " without id"));
            continue;
        }
        if (seen[e.id] > 1) {
            excluded.push_back(excluded_entity(e.id, kind, "duplicate_id", "id appears more than once in the batch"));
            continue;
        }
        std::string code, msg;
        if (!check(e, code, msg)) {
            excluded.push_back(excluded_entity(e.id, kind, code, msg));
            continue;
        }
        out.push_back(e);
    }
    return out;
}

json slot_state(const SlotQuota* sq, int filled) {
    json j = sq ? slot_quota_to_json(*sq) : json::object();
    j["filled"] = filled;
    return j;
}

}  // namespace

RoundResult BatchOrchestrator::run_round(const std::string& round_id, const Batch& batch, const CancelToken* cancel) {
    // serializes rounds across every orchestrator sharing this ledger
    auto round_lock = m_ledger.lock_rounds();

    RoundResult res;
    res.round_id = round_id;
    StageClock clock(res.events);

    auto fail = [&](FailureKind kind, const std::string& msg, std::vector<std::string> offending = {}) {
        res.ok = false;
        res.failure.kind = kind;
        res.failure.message = msg;
        res.failure.offending = std::move(offending);
        clock.mark("failed", std::string(failure_kind_name(kind)) + ": " + msg);
        return res;
    };

    if (round_id.empty()) return fail(FailureKind::InvalidInput, "round id must not be empty");
    if (committed(round_id) || m_ledger.has_round(round_id)) {
        return fail(FailureKind::InvalidInput, "round already committed: " + round_id, {round_id});
    }

    try {
        const ChainCheck chain = m_ledger.verify();
        if (!chain.ok) {
            return fail(FailureKind::Internal, "audit ledger failed verification: " + chain.message);
        }
        clock.mark("ledger_check");

        // validation
        res.excluded = batch.intake_failures;

        std::vector<Candidate> candidates = screen(batch.candidates, "candidate",
            [](const Candidate&, std::string&, std::string&) { return true; }, res.excluded);

        std::vector<Slot> slots = screen(batch.slots, "slot",
            [](const Slot& s, std::string& code, std::string& msg) {
                if (s.capacity < 1) {
                    code = "invalid_capacity";
                    msg = "capacity must be >= 1 (got " + std::to_string(s.capacity) + ")";
                    return false;
                }
                for (const auto& kv : s.reserved) {
                    if (kv.second < 0) {
                        code = "invalid_reserved";
                        msg = "reserved count for '" + kv.first + "' is negative";
                        return false;
                    }
                }
                return true;
            }, res.excluded);
        clock.mark("validate", std::to_string(res.excluded.size()) + " excluded");

        if (cancel) cancel->throw_if_cancelled();

        // normalization
        std::unique_ptr<FeatureNormalizer> normalizer;
        try {
            normalizer = std::make_unique<FeatureNormalizer>(batch.schema);
        } catch (const ConfigError& e) {
            return fail(FailureKind::InvalidInput, std::string("feature schema: ") + e.what());
        }

        std::vector<Candidate> kept_candidates;
        std::vector<NormalizedVector> candidate_vecs;
        for (auto& c : candidates) {
            try {
                candidate_vecs.push_back(normalizer->normalize(c.id, c.features));
                kept_candidates.push_back(std::move(c));
            } catch (const ValidationError& e) {
                res.excluded.push_back(excluded_entity(c.id, "candidate", e.code(), e.what()));
            }
        }

        std::vector<Slot> kept_slots;
        std::vector<NormalizedVector> slot_vecs;
        for (auto& s : slots) {
            try {
                slot_vecs.push_back(normalizer->normalize(s.id, s.features));
                kept_slots.push_back(std::move(s));
            } catch (const ValidationError& e) {
                res.excluded.push_back(excluded_entity(s.id, "slot", e.code(), e.what()));
            }
        }
        candidates.swap(kept_candidates);
        slots.swap(kept_slots);
        clock.mark("normalize", std::to_string(candidates.size()) + " candidates, " + std::to_string(slots.size()) + " slots");

        // scoring
        const ScoreMatrix matrix = score_matrix(candidates, candidate_vecs, slots, slot_vecs,
                                                m_cfg.weights, m_cfg.scoring, m_cfg.worker_threads, cancel);
        clock.mark("score");

        // fairness plan
        std::unique_ptr<FairnessMonitor> monitor;
        try {
            monitor = std::make_unique<FairnessMonitor>(batch.policy ? *batch.policy : m_cfg.policy);
        } catch (const ConfigError& e) {
            return fail(FailureKind::InvalidInput, std::string("quota policy: ") + e.what());
        }

        try {
            res.schedule = monitor->policy().waive_infeasible
                ? monitor->plan_with_waivers(candidates, slots, matrix)
                : monitor->plan(candidates, slots, matrix);
        } catch (const QuotaInfeasibleError& e) {
            std::vector<std::string> offending{e.slot_id()};
            offending.insert(offending.end(), e.categories().begin(), e.categories().end());
            return fail(FailureKind::QuotaInfeasible, e.what(), offending);
        }
        clock.mark("plan");

        if (cancel) cancel->throw_if_cancelled();

        // solve
        try {
            res.allocation = solve_allocation(round_id, candidates, slots, matrix, res.schedule, m_cfg.solver);
        } catch (const SolverError& e) {
            return fail(FailureKind::SolverError, e.what());
        }
        clock.mark("solve", std::to_string(res.allocation.entries.size()) + " assigned");

        // last point a round can be abandoned
        if (cancel) cancel->throw_if_cancelled();

        res.disparity = monitor->disparity(res.allocation, candidates, slots, matrix);
        res.stats = compute_round_stats(res.allocation, candidates, slots, res.excluded, res.disparity);
        clock.mark("disparity", std::to_string(res.disparity.violations.size()) + " violations");

        // audit records, in commit order
        std::vector<AuditRecord> records;
        for (const auto& e : res.allocation.entries) {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::Assignment;
            r.candidate_id = e.candidate_id;
            r.slot_id = e.slot_id;
            r.reason = e.via_quota ? "reserved_seat:" + e.quota_category : "max_total_compatibility";
            r.composite = e.score.composite;
            r.breakdown = e.score.breakdown;
            r.quota_state = slot_state(res.schedule.find(e.slot_id), res.allocation.assigned_count(e.slot_id));
            records.push_back(std::move(r));
        }
        std::unordered_map<std::string, size_t> row_of;
        for (size_t i = 0; i < candidates.size(); ++i) row_of[candidates[i].id] = i;

        for (const auto& u : res.allocation.unmatched) {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::Unmatched;
            r.candidate_id = u.candidate_id;
            r.reason = u.reason;

            // quota rows of every slot the candidate could have taken
            json consulted = json::array();
            auto rit = row_of.find(u.candidate_id);
            if (rit != row_of.end()) {
                for (size_t j = 0; j < slots.size(); ++j) {
                    if (!matrix.has(rit->second, j)) continue;
                    json st = slot_state(res.schedule.find(slots[j].id), res.allocation.assigned_count(slots[j].id));
                    st["slot_id"] = slots[j].id;
                    consulted.push_back(std::move(st));
                }
            }
            r.quota_state = {{"slots", consulted}};
            records.push_back(std::move(r));
        }
        for (const auto& x : res.excluded) {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::Excluded;
            if (x.entity_kind == "slot") r.slot_id = x.entity_id;
            else r.candidate_id = x.entity_id;
            r.reason = x.code + ": " + x.message;
            records.push_back(std::move(r));
        }
        for (const auto& w : res.allocation.waivers) {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::QuotaWaiver;
            r.slot_id = w.slot_id;
            r.reason = w.reason;
            r.quota_state = {{"category", w.category}, {"floor", w.floor}, {"filled", w.filled}};
            records.push_back(std::move(r));
        }
        for (const auto& v : res.disparity.violations) {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::FairnessViolation;
            r.slot_id = v.slot_id;
            r.reason = std::string("disparity beyond tolerance (") + disparity_scope_name(res.disparity.scope) + ")";
            r.quota_state = {
                {"category", v.category},
                {"observed", v.observed},
                {"expected", v.expected},
                {"disparity", v.disparity},
                {"tolerance", v.tolerance}
            };
            records.push_back(std::move(r));
        }
        {
            AuditRecord r;
            r.round_id = round_id;
            r.kind = AuditKind::RoundCommit;
            std::ostringstream oss;
            oss << "assigned=" << res.stats.assigned << " unmatched=" << res.stats.unmatched
                << " excluded=" << res.stats.excluded << " waivers=" << res.stats.waivers;
            r.reason = oss.str();
            r.quota_state = res.stats.to_json();
            records.push_back(std::move(r));
        }

        // commit
        try {
            res.audit = m_ledger.append_round(std::move(records));
        } catch (const DuplicateRoundError& e) {
            return fail(FailureKind::InvalidInput, e.what(), {round_id});
        } catch (const std::exception& e) {
            return fail(FailureKind::Internal, std::string("audit append failed: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(m_state_mu);
            m_committed[round_id] = res.allocation;
        }
        res.ok = true;
        clock.mark("commit", std::to_string(res.audit.size()) + " audit records");
    } catch (const RoundCancelled&) {
        return fail(FailureKind::Cancelled, "round cancelled before commit");
    } catch (const std::exception& e) {
        return fail(FailureKind::Internal, e.what());
    }

    if (m_publisher) {
        try {
            m_publisher->publish(res);
            clock.mark("publish");
        } catch (const std::exception& e) {
            std::cerr << "warning: publish failed for round " << round_id << ": " << e.what() << "\n";
            clock.mark("publish_failed", e.what());
        }
    }

    return res;
}

std::vector<FactorContribution> BatchOrchestrator::explain(const std::string& round_id, const std::string& candidate_id) const {
    std::lock_guard<std::mutex> lock(m_state_mu);

    auto it = m_committed.find(round_id);
    if (it == m_committed.end()) throw std::out_of_range("no committed round " + round_id);

    const AllocationEntry* e = it->second.find(candidate_id);
    if (!e) throw std::out_of_range("candidate " + candidate_id + " has no assignment in round " + round_id);
    return placement::explain(*e);
}

std::vector<AuditRecord> BatchOrchestrator::audit_history(const std::string& entity_id) const {
    return m_ledger.history(entity_id);
}

bool BatchOrchestrator::committed(const std::string& round_id) const {
    std::lock_guard<std::mutex> lock(m_state_mu);
    return m_committed.count(round_id) != 0;
}

std::optional<Allocation> BatchOrchestrator::committed_allocation(const std::string& round_id) const {
    std::lock_guard<std::mutex> lock(m_state_mu);
    auto it = m_committed.find(round_id);
    if (it == m_committed.end()) return std::nullopt;
    return it->second;
}

}  // namespace placement
