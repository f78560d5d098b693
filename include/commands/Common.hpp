#pragma once

#include <filesystem>

#include "io/JsonIO.hpp"
#include "nlohmann/json.hpp"

// Loads --config (defaults when absent) and applies the command-line
// overrides. Prints the problem and returns false on bad input.
bool load_cli_config(int argc, char** argv, EngineConfig& out);

// Loads --batch and fills missing features through --features_dir or
// --extractor. Entities that cannot be hydrated land in intake_failures.
bool load_cli_batch(int argc, char** argv, const EngineConfig& cfg, placement::Batch& out);

void append_jsonl(const std::filesystem::path& path, const nlohmann::json& j);
