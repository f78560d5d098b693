#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "placement/AllocationArtifact.hpp"
#include "placement/AuditLedger.hpp"
#include "placement/CancelToken.hpp"
#include "placement/FairnessMonitor.hpp"
#include "placement/FeatureNormalizer.hpp"
#include "placement/Models.hpp"
#include "placement/RoundStats.hpp"
#include "placement/Scorer.hpp"
#include "placement/Solver.hpp"

namespace placement {

// Everything one round consumes.
struct Batch {
    FeatureSchema schema;
    std::vector<Candidate> candidates;
    std::vector<Slot> slots;

    // entities dropped at intake (e.g. extraction failed); recorded as excluded
    std::vector<ExcludedEntity> intake_failures;

    // overrides RoundConfig::policy when present
    std::optional<QuotaPolicy> policy;
};

struct RoundConfig {
    FactorWeights weights;
    ScoreConfig scoring;
    QuotaPolicy policy;
    SolverConfig solver;
    int worker_threads = 0;   // 0 = hardware concurrency

    // Throws ConfigError.
    void validate() const;
};

enum class FailureKind {
    InvalidInput,
    QuotaInfeasible,
    SolverError,
    Cancelled,
    Internal
};

const char* failure_kind_name(FailureKind k);

struct RoundFailure {
    FailureKind kind = FailureKind::Internal;
    std::string message;
    std::vector<std::string> offending;
};

struct StageEvent {
    std::string stage;
    long long millis = 0;
    std::string detail;
};

struct RoundResult {
    bool ok = false;
    std::string round_id;

    Allocation allocation;
    QuotaSchedule schedule;
    DisparityReport disparity;
    std::vector<ExcludedEntity> excluded;
    RoundStats stats;
    std::vector<AuditRecord> audit;   // sealed records appended by this round

    RoundFailure failure;             // meaningful when !ok
    std::vector<StageEvent> events;

    AllocationArtifact artifact() const;
};

// One line of round_events.jsonl.
nlohmann::json round_event_json(const RoundResult& r);

// Receives committed rounds. A throwing publisher never rolls back a commit.
class Publisher {
public:
    virtual ~Publisher() = default;
    virtual void publish(const RoundResult& result) = 0;
};

// Writes <outdir>/allocation.json.
class JsonFilePublisher final : public Publisher {
    std::filesystem::path outdir_;

public:
    explicit JsonFilePublisher(const std::string& outdir);
    void publish(const RoundResult& result) override;

    std::filesystem::path allocation_path() const { return outdir_ / "allocation.json"; }
};

// Runs allocation rounds end to end and owns the committed allocations.
//
// Rounds are serialized per ledger, across orchestrators sharing it, and a
// round id commits at most once per ledger. Until the ledger append succeeds
// nothing of a round is visible; a failed or cancelled round leaves ledger
// and committed state unchanged.
class BatchOrchestrator {
public:
    // Throws ConfigError on an invalid configuration.
    BatchOrchestrator(AuditLedger& ledger, RoundConfig cfg, Publisher* publisher = nullptr);

    RoundResult run_round(const std::string& round_id, const Batch& batch, const CancelToken* cancel = nullptr);

    // Factor breakdown of a committed assignment. Throws std::out_of_range
    // when the round is unknown or the candidate was not assigned in it.
    std::vector<FactorContribution> explain(const std::string& round_id, const std::string& candidate_id) const;

    std::vector<AuditRecord> audit_history(const std::string& entity_id) const;

    bool committed(const std::string& round_id) const;
    std::optional<Allocation> committed_allocation(const std::string& round_id) const;

    const RoundConfig& config() const { return m_cfg; }

private:
    AuditLedger& m_ledger;
    RoundConfig m_cfg;
    Publisher* m_publisher;

    mutable std::mutex m_state_mu;
    std::map<std::string, Allocation> m_committed;
};

}  // namespace placement
