#include "extract/FeatureSource.hpp"

#include "extract/ProcUtil.hpp"
#include "hashutil/Sha256.hpp"
#include "io/JsonIO.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace extract {

const char* entity_kind_dir(EntityKind k) {
    switch (k) {
        case EntityKind::Candidate: return "candidates";
        case EntityKind::Slot: return "slots";
        default: return "unknown";
    }
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// keeps the outermost {...} so stray log lines around the payload are ignored
static std::string strip_to_object(const std::string& s) {
    auto a = s.find('{');
    auto b = s.rfind('}');
    if (a != std::string::npos && b != std::string::npos && b > a) return s.substr(a, b - a + 1);
    return s;
}

static placement::RawFeatures parse_payload(const std::string& entity_id, const std::string& text) {
    json j;
    try {
        j = json::parse(strip_to_object(text));
    } catch (const std::exception& e) {
        throw ExtractionError(entity_id, "unparseable feature payload for " + entity_id + ": " + e.what(), false);
    }
    try {
        return parseRawFeatures(j, entity_id + ".features");
    } catch (const std::exception& e) {
        throw ExtractionError(entity_id, e.what(), false);
    }
}

DirectoryFeatureSource::DirectoryFeatureSource(const std::string& root_dir) : root_(root_dir) {}

placement::RawFeatures DirectoryFeatureSource::fetch(EntityKind kind, const std::string& entity_id) {
    const fs::path p = root_ / entity_kind_dir(kind) / (entity_id + ".json");
    std::ifstream f(p);
    if (!f) throw ExtractionError(entity_id, "no feature file for " + entity_id + ": " + p.string(), false);
    return parse_payload(entity_id, read_all(f));
}

CommandFeatureSource::CommandFeatureSource(const std::string& command, const std::string& cache_dir)
    : command_(command), cache_dir_(cache_dir) {
    if (!cache_dir_.empty()) fs::create_directories(cache_dir_);
}

std::string CommandFeatureSource::cache_key(EntityKind kind, const std::string& entity_id) const {
    const std::string s = command_ + "\n" + entity_kind_dir(kind) + "\n" + entity_id;
    return std::string(entity_kind_dir(kind)) + "_v1-" + hashutil::sha256_hex(s);
}

bool CommandFeatureSource::load_cache(const std::string& key, std::string& out) const {
    if (cache_dir_.empty()) return false;
    fs::path p = cache_dir_ / (key + ".json");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return true;
}

void CommandFeatureSource::save_cache(const std::string& key, const std::string& content) const {
    if (cache_dir_.empty()) return;
    fs::path p = cache_dir_ / (key + ".json");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) {
        std::cerr << "CommandFeatureSource: failed to write cache entry " << p.string() << "\n";
        return;
    }
    f << content;
}

placement::RawFeatures CommandFeatureSource::fetch(EntityKind kind, const std::string& entity_id) {
    const std::string key = cache_key(kind, entity_id);

    std::string cached;
    if (load_cache(key, cached)) return parse_payload(entity_id, cached);

    const std::string cmdline = command_ + " " + procutil::shell_quote(entity_kind_dir(kind)) + " " +
                                procutil::shell_quote(entity_id);
    procutil::ProcResult res = procutil::run_capture_stdout(cmdline);

    if (res.exit_code != 0) {
        throw ExtractionError(entity_id, "extractor exited with status " + std::to_string(res.exit_code) + " for " + entity_id);
    }
    if (res.out.empty()) {
        throw ExtractionError(entity_id, "extractor produced no output for " + entity_id);
    }

    const std::string payload = strip_to_object(res.out);
    placement::RawFeatures raw = parse_payload(entity_id, payload);
    save_cache(key, payload);
    return raw;
}

}  // namespace extract
