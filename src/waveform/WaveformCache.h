#pragma once

#include "WaveformExtractor.h"
#include "WaveformStores.h"
#include "core/VisualizerErrors.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * WaveformCache - two-tier store for peak envelopes
 *
 * Tier 1 lives for the process, tier 2 is an optional DurableWaveformStore.
 *
 * get() checks memory, then the durable store, promoting durable hits into
 * memory. Durable failures or corrupt entries are logged and count as a miss.
 *
 * put() always succeeds once the memory tier holds the envelope; a durable
 * write failure is logged and counted, the envelope stays session-only.
 *
 * Usage:
 * ```cpp
 * WaveformCache cache(std::make_shared<LocalWaveformStore>(kvStore));
 * std::string key = WaveformCache::makeCacheKey(audioUrl);
 * if (auto envelope = cache.get(key)) { ... }
 * ```
 */
class WaveformCache {
public:
    static constexpr const char* KEY_PREFIX = "waveform:";

    explicit WaveformCache(std::shared_ptr<DurableWaveformStore> durableStore = nullptr);

    // "waveform:" + last path segment (query/fragment stripped), or + id
    static std::string makeCacheKey(const std::string& urlOrId);

    std::optional<PeakEnvelope> get(const std::string& key);
    bool put(const std::string& key, const PeakEnvelope& envelope);

    bool containsInMemory(const std::string& key) const;
    void remove(const std::string& key);
    void clearMemory();
    std::vector<std::string> getCachedKeys() const;

    void setDurableStore(std::shared_ptr<DurableWaveformStore> durableStore);

    size_t getDurableWriteFailureCount() const;
    size_t getDurableReadFailureCount() const;

private:
    void reportFailure(VisualizerError error, const std::string& key, const std::string& detail);

    std::shared_ptr<DurableWaveformStore> durableStore_;
    std::map<std::string, PeakEnvelope> memory_;
    size_t durableWriteFailures_ = 0;
    size_t durableReadFailures_ = 0;
    mutable std::mutex mutex_;
};
