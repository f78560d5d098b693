#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "extract/FeatureSource.hpp"
#include "placement/Models.hpp"

namespace extract {

struct RetryPolicy {
    int max_attempts = 3;
    int initial_backoff_ms = 100;
    double backoff_multiplier = 2.0;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Retries retryable ExtractionErrors with exponential backoff. The last
// error is rethrown once attempts run out. An empty sleeper uses
// std::this_thread::sleep_for.
placement::RawFeatures fetch_with_retry(FeatureSource& source,
                                        EntityKind kind,
                                        const std::string& entity_id,
                                        const RetryPolicy& policy,
                                        const Sleeper& sleep = {});

struct HydrateResult {
    int fetched = 0;
    std::vector<placement::ExcludedEntity> failures;
};

// Fetches features for every entity still at schema_version 0. Entities
// whose extraction fails are removed from the vectors and reported.
HydrateResult hydrate_batch(std::vector<placement::Candidate>& candidates,
                            std::vector<placement::Slot>& slots,
                            FeatureSource& source,
                            const RetryPolicy& policy,
                            const Sleeper& sleep = {});

}  // namespace extract
