#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "placement/Models.hpp"

namespace extract {

enum class EntityKind {
    Candidate,
    Slot
};

// "candidates" / "slots"; also the sub-directory name used by the sources.
const char* entity_kind_dir(EntityKind k);

class ExtractionError : public std::runtime_error {
public:
    ExtractionError(std::string entity_id, const std::string& message, bool retryable = true)
        : std::runtime_error(message), m_entity_id(std::move(entity_id)), m_retryable(retryable) {}

    const std::string& entity_id() const { return m_entity_id; }
    bool retryable() const { return m_retryable; }

private:
    std::string m_entity_id;
    bool m_retryable;
};

// Feature extraction service as seen by the intake boundary.
class FeatureSource {
public:
    virtual ~FeatureSource() = default;

    // Throws ExtractionError when features cannot be produced.
    virtual placement::RawFeatures fetch(EntityKind kind, const std::string& entity_id) = 0;
};

// Reads <root>/<kind dir>/<entity_id>.json.
class DirectoryFeatureSource final : public FeatureSource {
    std::filesystem::path root_;

public:
    explicit DirectoryFeatureSource(const std::string& root_dir);

    placement::RawFeatures fetch(EntityKind kind, const std::string& entity_id) override;
};

// Runs `<command> <kind dir> <entity_id>` and parses the JSON object printed
// on stdout. Successful responses are cached under cache_dir, keyed by a
// SHA-256 of command, kind and id.
class CommandFeatureSource final : public FeatureSource {
    std::string command_;
    std::filesystem::path cache_dir_;

public:
    CommandFeatureSource(const std::string& command, const std::string& cache_dir);

    placement::RawFeatures fetch(EntityKind kind, const std::string& entity_id) override;

private:
    std::string cache_key(EntityKind kind, const std::string& entity_id) const;
    bool load_cache(const std::string& key, std::string& out) const;
    void save_cache(const std::string& key, const std::string& content) const;
};

}  // namespace extract
