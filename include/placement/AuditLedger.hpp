#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "placement/Models.hpp"

namespace placement {

enum class AuditKind {
    Assignment,
    Unmatched,
    Excluded,
    QuotaWaiver,
    FairnessViolation,
    RoundCommit,
    Correction
};

const char* audit_kind_name(AuditKind k);

// Throws std::runtime_error on an unknown name.
AuditKind parse_audit_kind(const std::string& name);

struct AuditRecord {
    uint64_t sequence = 0;
    std::string round_id;
    AuditKind kind = AuditKind::Assignment;

    std::string candidate_id;
    std::string slot_id;
    std::string reason;

    double composite = 0.0;
    std::vector<FactorContribution> breakdown;

    nlohmann::json quota_state = nlohmann::json::object();  // floors/ceilings/fill at decision time

    int64_t supersedes = -1;    // corrections only

    std::string prev_hash;
    std::string hash;

    // every field except `hash`; the hash is computed over body().dump()
    nlohmann::json body() const;

    nlohmann::json to_json() const;
    static AuditRecord from_json(const nlohmann::json& j);

    bool mentions(const std::string& entity_id) const;
};

struct ChainCheck {
    bool ok = true;
    uint64_t first_bad_sequence = 0;
    std::string message;
};

// Append-only, hash-chained decision log.
//
// No update or delete operation exists; a correction is a new record
// pointing at the sequence it supersedes. When constructed with a
// journal path every appended record is also written as one JSON line.
class AuditLedger {
public:
    AuditLedger() = default;

    // Loads existing lines from `journal` (if the file exists) and appends
    // to it from then on. Throws std::runtime_error on an unreadable file or
    // malformed line. Does not verify; call verify().
    explicit AuditLedger(std::filesystem::path journal);

    AuditLedger(const AuditLedger&) = delete;
    AuditLedger& operator=(const AuditLedger&) = delete;

    // Seals and appends a whole round under one lock. Sequence, prev_hash and
    // hash of the inputs are overwritten. All or nothing: if the journal
    // write fails nothing is appended and the journal is cut back to its
    // previous length. Throws DuplicateRoundError when the ledger already
    // holds a round with the same id, and std::runtime_error when another
    // writer has appended to the journal since it was loaded.
    // Returns the sealed records.
    std::vector<AuditRecord> append_round(std::vector<AuditRecord> records);

    // Held for the whole of a round; rounds sharing this ledger never solve
    // concurrently.
    std::unique_lock<std::mutex> lock_rounds() { return std::unique_lock<std::mutex>(m_round_mu); }

    // True when a non-correction record of `round_id` exists.
    bool has_round(const std::string& round_id) const;

    // Throws std::out_of_range if `supersedes` does not exist.
    AuditRecord append_correction(uint64_t supersedes, const std::string& round_id, const std::string& reason);

    std::vector<AuditRecord> history(const std::string& entity_id) const;
    std::vector<AuditRecord> round_records(const std::string& round_id) const;
    std::vector<AuditRecord> records() const;

    size_t size() const;
    std::string head_hash() const;

    ChainCheck verify() const;

    const std::filesystem::path& journal() const { return m_journal; }

    static const std::string& genesis_hash();
    static std::string compute_hash(const AuditRecord& r);
    static ChainCheck verify_chain(const std::vector<AuditRecord>& records);

private:
    std::vector<AuditRecord> seal_locked(std::vector<AuditRecord> records) const;
    bool has_round_locked(const std::string& round_id) const;
    void persist_locked(const std::vector<AuditRecord>& sealed);

    std::mutex m_round_mu;
    mutable std::mutex m_mu;
    std::vector<AuditRecord> m_records;
    std::filesystem::path m_journal;
    std::uintmax_t m_journal_bytes = 0;   // journal length this ledger has seen
};

}  // namespace placement
