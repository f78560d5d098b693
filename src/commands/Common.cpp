#include "commands/Common.hpp"

#include "commands/Args.hpp"
#include "extract/FeatureSource.hpp"
#include "extract/Retry.hpp"
#include "placement/Errors.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

bool load_cli_config(int argc, char** argv, EngineConfig& out) {
    const std::string config_path = cli::get_arg(argc, argv, "--config", "");

    try {
        out = config_path.empty() ? parseEngineConfig(nlohmann::json::object()) : loadEngineConfig(config_path);
    } catch (const placement::ConfigError& e) {
        std::cerr << "error: invalid config: " << e.what() << "\n";
        return false;
    }

    placement::RoundConfig& rc = out.round;

    const std::string min_score_s = cli::get_arg(argc, argv, "--min_score", "");
    if (!min_score_s.empty() && !cli::parse_double(min_score_s, rc.solver.min_score)) {
        std::cerr << "error: invalid --min_score\n";
        return false;
    }

    const std::string threads_s = cli::get_arg(argc, argv, "--threads", "");
    if (!threads_s.empty() && !cli::parse_int(threads_s, rc.worker_threads)) {
        std::cerr << "error: invalid --threads\n";
        return false;
    }

    const std::string tolerance_s = cli::get_arg(argc, argv, "--tolerance", "");
    if (!tolerance_s.empty() && !cli::parse_double(tolerance_s, rc.policy.tolerance)) {
        std::cerr << "error: invalid --tolerance\n";
        return false;
    }

    const std::string scope_s = cli::get_arg(argc, argv, "--scope", "");
    if (scope_s == "aggregate") rc.policy.scope = placement::DisparityScope::Aggregate;
    else if (scope_s == "per_slot") rc.policy.scope = placement::DisparityScope::PerSlot;
    else if (!scope_s.empty()) {
        std::cerr << "error: invalid --scope (aggregate | per_slot)\n";
        return false;
    }

    if (cli::has_flag(argc, argv, "--waive_infeasible")) rc.policy.waive_infeasible = true;
    if (cli::has_flag(argc, argv, "--strict_floors")) rc.solver.waive_unfilled_floors = false;

    try {
        rc.validate();
    } catch (const placement::ConfigError& e) {
        std::cerr << "error: invalid config: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool load_cli_batch(int argc, char** argv, const EngineConfig& cfg, placement::Batch& out) {
    const std::string batch_path = cli::get_arg(argc, argv, "--batch", "");
    if (batch_path.empty()) {
        std::cerr << "error: missing --batch\n";
        return false;
    }

    try {
        out = loadBatch(batch_path);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to load batch: " << e.what() << "\n";
        return false;
    }
    for (const auto& x : out.intake_failures) {
        std::cerr << "warning: excluded " << x.entity_kind << " " << x.entity_id << ": " << x.message << "\n";
    }

    const std::string features_dir = cli::get_arg(argc, argv, "--features_dir", "");
    const std::string extractor = cli::get_arg(argc, argv, "--extractor", "");
    const std::string extractor_cache = cli::get_arg(argc, argv, "--extractor_cache", "out/extract_cache");

    std::unique_ptr<extract::FeatureSource> source;
    try {
        if (!extractor.empty()) source = std::make_unique<extract::CommandFeatureSource>(extractor, extractor_cache);
        else if (!features_dir.empty()) source = std::make_unique<extract::DirectoryFeatureSource>(features_dir);
    } catch (const std::exception& e) {
        std::cerr << "error: failed to set up feature source: " << e.what() << "\n";
        return false;
    }
    if (!source) return true;

    extract::HydrateResult hr;
    try {
        hr = extract::hydrate_batch(out.candidates, out.slots, *source, cfg.retry);
    } catch (const std::exception& e) {
        std::cerr << "error: feature extraction failed: " << e.what() << "\n";
        return false;
    }
    for (const auto& f : hr.failures) {
        std::cerr << "warning: excluded " << f.entity_kind << " " << f.entity_id << ": " << f.message << "\n";
    }
    out.intake_failures.insert(out.intake_failures.end(), hr.failures.begin(), hr.failures.end());
    std::cout << "FETCHED: " << hr.fetched << "\n";
    return true;
}

void append_jsonl(const fs::path& path, const nlohmann::json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out) {
        std::cerr << "warning: failed to append to " << path.string() << "\n";
        return;
    }
    out << j.dump() << "\n";
}
