#include "extract/Retry.hpp"

#include <iostream>
#include <thread>

namespace extract {

placement::RawFeatures fetch_with_retry(
    FeatureSource& source,
    EntityKind kind,
    const std::string& entity_id,
    const RetryPolicy& policy,
    const Sleeper& sleep
) {
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;
    double backoff_ms = policy.initial_backoff_ms > 0 ? policy.initial_backoff_ms : 0;

    for (int attempt = 1;; ++attempt) {
        try {
            return source.fetch(kind, entity_id);
        } catch (const ExtractionError& e) {
            if (!e.retryable() || attempt >= attempts) throw;

            std::cerr << "warning: extraction attempt " << attempt << "/" << attempts << " failed for "
                      << entity_id << ": " << e.what() << "\n";

            const auto delay = std::chrono::milliseconds(static_cast<long long>(backoff_ms));
            if (sleep) sleep(delay);
            else std::this_thread::sleep_for(delay);

            backoff_ms *= policy.backoff_multiplier;
        }
    }
}

template <typename Entity>
static void hydrate(std::vector<Entity>& entities, EntityKind kind, FeatureSource& source,
                    const RetryPolicy& policy, const Sleeper& sleep, HydrateResult& out) {
    std::vector<Entity> kept;
    kept.reserve(entities.size());

    for (auto& e : entities) {
        if (e.features.schema_version != 0) {
            kept.push_back(std::move(e));
            continue;
        }
        try {
            e.features = fetch_with_retry(source, kind, e.id, policy, sleep);
            out.fetched += 1;
            kept.push_back(std::move(e));
        } catch (const ExtractionError& err) {
            placement::ExcludedEntity x;
            x.entity_id = e.id;
            x.entity_kind = kind == EntityKind::Candidate ? "candidate" : "slot";
            x.code = "extraction_failed";
            x.message = err.what();
            out.failures.push_back(std::move(x));
        }
    }
    entities.swap(kept);
}

HydrateResult hydrate_batch(
    std::vector<placement::Candidate>& candidates,
    std::vector<placement::Slot>& slots,
    FeatureSource& source,
    const RetryPolicy& policy,
    const Sleeper& sleep
) {
    HydrateResult out;
    hydrate(candidates, EntityKind::Candidate, source, policy, sleep, out);
    hydrate(slots, EntityKind::Slot, source, policy, sleep, out);
    return out;
}

}  // namespace extract
