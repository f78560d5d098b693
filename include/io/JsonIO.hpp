#pragma once

#include <string>

#include "extract/Retry.hpp"
#include "nlohmann/json.hpp"
#include "placement/Orchestrator.hpp"

// Full configuration file: round settings plus intake retry policy.
struct EngineConfig {
    placement::RoundConfig round;
    extract::RetryPolicy retry;
};

placement::RawFeatures parseRawFeatures(const nlohmann::json& j, const std::string& where);
placement::FeatureSchema parseFeatureSchema(const nlohmann::json& j, const std::string& where);
placement::QuotaPolicy parseQuotaPolicy(const nlohmann::json& j, const std::string& where);

// Candidates and slots with features; an entity without "features" is left
// at schema_version 0 for the extraction service to fill in. A candidate or
// slot that does not parse lands in Batch::intake_failures; only a broken
// root, schema or policy throws.
placement::Batch loadBatch(const std::string& path);
placement::Batch parseBatch(const nlohmann::json& j);

// Missing sections keep their defaults. Throws ConfigError on bad values.
EngineConfig parseEngineConfig(const nlohmann::json& j);
EngineConfig loadEngineConfig(const std::string& path);
