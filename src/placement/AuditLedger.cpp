#include "placement/AuditLedger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "hashutil/Sha256.hpp"
#include "placement/Errors.hpp"
#include "placement/ScoreJson.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace placement {

const char* audit_kind_name(AuditKind k) {
    switch (k) {
        case AuditKind::Assignment: return "assignment";
        case AuditKind::Unmatched: return "unmatched";
        case AuditKind::Excluded: return "excluded";
        case AuditKind::QuotaWaiver: return "quota_waiver";
        case AuditKind::FairnessViolation: return "fairness_violation";
        case AuditKind::RoundCommit: return "round_commit";
        case AuditKind::Correction: return "correction";
        default: return "unknown";
    }
}

AuditKind parse_audit_kind(const std::string& name) {
    static const AuditKind kAll[] = {
        AuditKind::Assignment, AuditKind::Unmatched, AuditKind::Excluded, AuditKind::QuotaWaiver,
        AuditKind::FairnessViolation, AuditKind::RoundCommit, AuditKind::Correction,
    };
    for (AuditKind k : kAll) {
        if (name == audit_kind_name(k)) return k;
    }
    throw std::runtime_error("unknown audit record kind: " + name);
}

json AuditRecord::body() const {
    json j;
    j["sequence"] = sequence;
    j["round_id"] = round_id;
    j["kind"] = audit_kind_name(kind);
    j["candidate_id"] = candidate_id;
    j["slot_id"] = slot_id;
    j["reason"] = reason;
    j["composite"] = composite;
    j["breakdown"] = breakdown_to_json(breakdown);
    j["quota_state"] = quota_state;
    j["supersedes"] = supersedes;
    j["prev_hash"] = prev_hash;
    return j;
}

json AuditRecord::to_json() const {
    json j = body();
    j["hash"] = hash;
    return j;
}

AuditRecord AuditRecord::from_json(const json& j) {
    if (!j.is_object()) throw std::runtime_error("audit record must be an object");

    auto req = [&](const char* key) -> const json& {
        if (!j.contains(key)) throw std::runtime_error(std::string("audit record missing required field: ") + key);
        return j.at(key);
    };

    AuditRecord r;
    r.sequence = req("sequence").get<uint64_t>();
    r.round_id = req("round_id").get<std::string>();
    r.kind = parse_audit_kind(req("kind").get<std::string>());
    r.candidate_id = j.value("candidate_id", "");
    r.slot_id = j.value("slot_id", "");
    r.reason = j.value("reason", "");
    r.composite = j.value("composite", 0.0);
    if (j.contains("breakdown")) r.breakdown = breakdown_from_json(j.at("breakdown"), "audit.breakdown");
    if (j.contains("quota_state")) r.quota_state = j.at("quota_state");
    r.supersedes = j.value("supersedes", static_cast<int64_t>(-1));
    r.prev_hash = req("prev_hash").get<std::string>();
    r.hash = req("hash").get<std::string>();
    return r;
}

bool AuditRecord::mentions(const std::string& entity_id) const {
    if (entity_id.empty()) return false;
    return candidate_id == entity_id || slot_id == entity_id;
}

const std::string& AuditLedger::genesis_hash() {
    static const std::string kGenesis(64, '0');
    return kGenesis;
}

std::string AuditLedger::compute_hash(const AuditRecord& r) {
    return hashutil::sha256_hex(r.body().dump());
}

ChainCheck AuditLedger::verify_chain(const std::vector<AuditRecord>& records) {
    ChainCheck check;
    std::string prev = genesis_hash();

    for (size_t i = 0; i < records.size(); ++i) {
        const AuditRecord& r = records[i];
        std::ostringstream why;

        if (r.sequence != i) {
            why << "sequence gap: expected " << i << ", found " << r.sequence;
        } else if (r.prev_hash != prev) {
            why << "prev_hash does not match the preceding record";
        } else if (compute_hash(r) != r.hash) {
            why << "record hash does not match its contents";
        }

        const std::string msg = why.str();
        if (!msg.empty()) {
            check.ok = false;
            check.first_bad_sequence = i;
            check.message = "record " + std::to_string(i) + ": " + msg;
            return check;
        }
        prev = r.hash;
    }
    return check;
}

AuditLedger::AuditLedger(fs::path journal) : m_journal(std::move(journal)) {
    if (m_journal.empty() || !fs::exists(m_journal)) return;

    std::ifstream in(m_journal);
    if (!in) throw std::runtime_error("failed to open ledger file: " + m_journal.string());

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        try {
            m_records.push_back(AuditRecord::from_json(json::parse(line)));
        } catch (const std::exception& e) {
            throw std::runtime_error("ledger " + m_journal.string() + " line " + std::to_string(lineno) + ": " + e.what());
        }
    }
    if (fs::is_regular_file(m_journal)) m_journal_bytes = fs::file_size(m_journal);
}

std::vector<AuditRecord> AuditLedger::seal_locked(std::vector<AuditRecord> records) const {
    std::string prev = m_records.empty() ? genesis_hash() : m_records.back().hash;
    uint64_t seq = m_records.size();

    for (auto& r : records) {
        r.sequence = seq++;
        r.prev_hash = prev;
        r.hash = compute_hash(r);
        prev = r.hash;
    }
    return records;
}

namespace {

class JournalFd {
public:
    explicit JournalFd(int fd) : m_fd(fd) {}
    ~JournalFd() {
        if (m_fd >= 0) ::close(m_fd);
    }
    JournalFd(const JournalFd&) = delete;
    JournalFd& operator=(const JournalFd&) = delete;

    int get() const { return m_fd; }

private:
    int m_fd;
};

std::string errno_text() {
    return std::strerror(errno);
}

}  // namespace

void AuditLedger::persist_locked(const std::vector<AuditRecord>& sealed) {
    if (m_journal.empty() || sealed.empty()) return;

    if (m_journal.has_parent_path()) fs::create_directories(m_journal.parent_path());

    // one write per round keeps a round's lines contiguous on disk
    std::string blob;
    for (const auto& r : sealed) {
        blob += r.to_json().dump();
        blob += "\n";
    }

    JournalFd fd(::open(m_journal.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644));
    if (fd.get() < 0) {
        throw std::runtime_error("failed to open ledger file for append: " + m_journal.string() + ": " + errno_text());
    }

    // advisory; released when fd closes
    if (::flock(fd.get(), LOCK_EX) != 0) {
        throw std::runtime_error("failed to lock ledger file " + m_journal.string() + ": " + errno_text());
    }

    struct stat st;
    if (::fstat(fd.get(), &st) != 0) {
        throw std::runtime_error("failed to stat ledger file " + m_journal.string() + ": " + errno_text());
    }
    const bool regular = S_ISREG(st.st_mode);

    // our head hash is only valid if nobody else has appended since we last wrote
    if (regular && static_cast<std::uintmax_t>(st.st_size) != m_journal_bytes) {
        throw std::runtime_error("ledger file " + m_journal.string() + " was appended to by another writer; reload it");
    }

    auto roll_back = [&](const std::string& why) {
        if (regular && ::ftruncate(fd.get(), static_cast<off_t>(m_journal_bytes)) != 0) {
            throw std::runtime_error("failed to write ledger file " + m_journal.string() + " (" + why +
                                     ") and to cut it back: " + errno_text());
        }
        throw std::runtime_error("failed to write ledger file " + m_journal.string() + ": " + why);
    };

    size_t written = 0;
    while (written < blob.size()) {
        const ssize_t n = ::write(fd.get(), blob.data() + written, blob.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) roll_back(n < 0 ? errno_text() : "short write");
        written += static_cast<size_t>(n);
    }
    if (regular && ::fsync(fd.get()) != 0) roll_back(errno_text());

    m_journal_bytes += blob.size();
}

bool AuditLedger::has_round_locked(const std::string& round_id) const {
    for (const auto& r : m_records) {
        if (r.kind != AuditKind::Correction && r.round_id == round_id) return true;
    }
    return false;
}

bool AuditLedger::has_round(const std::string& round_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    return has_round_locked(round_id);
}

std::vector<AuditRecord> AuditLedger::append_round(std::vector<AuditRecord> records) {
    std::lock_guard<std::mutex> lock(m_mu);

    for (const auto& r : records) {
        if (r.kind != AuditKind::Correction && has_round_locked(r.round_id)) throw DuplicateRoundError(r.round_id);
    }

    auto sealed = seal_locked(std::move(records));
    persist_locked(sealed);
    m_records.insert(m_records.end(), sealed.begin(), sealed.end());
    return sealed;
}

AuditRecord AuditLedger::append_correction(uint64_t supersedes, const std::string& round_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mu);

    if (supersedes >= m_records.size()) {
        throw std::out_of_range("correction targets unknown audit sequence " + std::to_string(supersedes));
    }
    const AuditRecord& target = m_records[supersedes];

    AuditRecord c;
    c.round_id = round_id;
    c.kind = AuditKind::Correction;
    c.candidate_id = target.candidate_id;
    c.slot_id = target.slot_id;
    c.reason = reason;
    c.supersedes = static_cast<int64_t>(supersedes);

    auto sealed = seal_locked({c});
    persist_locked(sealed);
    m_records.push_back(sealed.front());
    return sealed.front();
}

std::vector<AuditRecord> AuditLedger::history(const std::string& entity_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::vector<AuditRecord> out;
    for (const auto& r : m_records) {
        if (r.mentions(entity_id)) out.push_back(r);
    }
    return out;
}

std::vector<AuditRecord> AuditLedger::round_records(const std::string& round_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    std::vector<AuditRecord> out;
    for (const auto& r : m_records) {
        if (r.round_id == round_id) out.push_back(r);
    }
    return out;
}

std::vector<AuditRecord> AuditLedger::records() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_records;
}

size_t AuditLedger::size() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_records.size();
}

std::string AuditLedger::head_hash() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_records.empty() ? genesis_hash() : m_records.back().hash;
}

ChainCheck AuditLedger::verify() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return verify_chain(m_records);
}

}  // namespace placement
