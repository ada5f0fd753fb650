#pragma once

#include "AudioDecoder.h"
#include "WaveformCache.h"
#include "WaveformExtractor.h"
#include "core/Notices.h"
#include "core/RetryCooldown.h"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct WaveformRequest {
    std::string trackId;      // preferred key source when set
    std::string audioUrl;     // http(s) URL or file path
};

struct WaveformResult {
    std::string cacheKey;
    PeakEnvelope envelope;
    bool synthetic = false;   // fallback shown while real analysis is unavailable
    std::string errorMessage;
};

/**
 * WaveformAnalysisService - background peak-envelope extraction per track
 *
 * Fetch, decode and extraction run on a worker future; update() (main
 * thread) collects finished jobs, stores envelopes in the cache and calls
 * back subscribers whose owner token is still alive. A subscriber whose
 * owner has been destroyed is skipped, so views can go away mid-analysis.
 *
 * At most one extraction runs per cache key: requests for a key that is
 * cached are answered immediately, requests for a key in flight join the
 * running job. A job that timed out keeps its key busy until its worker
 * returns; a success arriving late is still cached and handed to the
 * requests made after the timeout.
 *
 * Failures (fetch, decode, empty audio, timeout) post a recoverable notice,
 * start a retry cooldown for that key and deliver a SyntheticWaveform
 * instead. A request that cannot start (no audio url, fetcher or decoder)
 * gets the SyntheticWaveform too. Synthetic envelopes are never cached.
 *
 * Not thread-safe: call request(), cancel() and update() from the main thread.
 *
 * Usage:
 * ```cpp
 * auto alive = std::make_shared<bool>(true);
 * service.request({trackId, url}, alive, [this](const WaveformResult& r) { envelope_ = r.envelope; });
 * // every frame
 * service.update();
 * ```
 */
class WaveformAnalysisService {
public:
    enum class RequestOutcome {
        STARTED,
        CACHED,
        ALREADY_PENDING,
        IN_COOLDOWN,
        INVALID
    };

    using ResultCallback = std::function<void(const WaveformResult&)>;
    using TimeSource = std::function<uint64_t()>;

    static constexpr uint64_t DEFAULT_TIMEOUT_MS = 30000;

    WaveformAnalysisService(WaveformCache& cache,
                            std::shared_ptr<AudioFetcher> fetcher,
                            std::shared_ptr<AudioDecoder> decoder);
    ~WaveformAnalysisService();

    RequestOutcome request(const WaveformRequest& request, std::weak_ptr<void> owner, ResultCallback callback);

    // Drops every callback registered with this owner
    void cancel(const std::shared_ptr<void>& owner);

    void update();

    // Blocks until every worker has finished (shutdown and tests)
    void waitForWorkers();

    bool isPending(const std::string& cacheKey) const;
    size_t getNumPending() const { return jobs_.size(); }
    // Timed-out jobs whose worker is still running
    bool isAbandoned(const std::string& cacheKey) const;
    size_t getNumAbandoned() const { return abandoned_.size(); }
    bool wasAttempted(const std::string& cacheKey) const;
    size_t getNumStarted() const { return numStarted_; }

    static std::string keyFor(const WaveformRequest& request);

    void setTargetPointCount(int targetPointCount);
    // Also bounds the fetcher's network timeout
    void setTimeoutMs(uint64_t timeoutMs);
    uint64_t getTimeoutMs() const { return timeoutMs_; }
    void setRetryCooldownMs(uint64_t cooldownMs) { cooldownMs_ = cooldownMs; }
    void setTimeSource(TimeSource timeSource);
    void setNoticeSink(NoticeSink* sink) { noticeSink_ = sink; }

private:
    struct Subscriber {
        std::weak_ptr<void> owner;
        ResultCallback callback;
    };

    struct Job {
        std::string cacheKey;
        std::string audioUrl;
        uint64_t startMs = 0;
        std::future<PeakEnvelope> future;
        std::vector<Subscriber> subscribers;
    };

    using Delivery = std::pair<std::vector<Subscriber>, WaveformResult>;

    void deliver(const std::vector<Subscriber>& subscribers, const WaveformResult& result);
    void deliverAll(const std::vector<Delivery>& deliveries);
    WaveformResult makeFallback(const std::string& cacheKey, const std::string& errorMessage) const;
    void handleFailure(Job& job, const std::string& errorMessage, std::vector<Delivery>& deliveries);
    void reapAbandoned(std::vector<Delivery>& deliveries);

    WaveformCache& cache_;
    std::shared_ptr<AudioFetcher> fetcher_;
    std::shared_ptr<AudioDecoder> decoder_;
    NoticeSink* noticeSink_ = nullptr;
    TimeSource timeSource_;

    int targetPointCount_ = WaveformExtractor::DEFAULT_POINT_COUNT;
    uint64_t timeoutMs_ = DEFAULT_TIMEOUT_MS;
    uint64_t cooldownMs_ = RetryCooldown::DEFAULT_COOLDOWN_MS;
    size_t numStarted_ = 0;

    std::map<std::string, Job> jobs_;
    // Timed-out jobs; subscribers here joined after the timeout
    std::map<std::string, Job> abandoned_;
    std::map<std::string, RetryCooldown> cooldowns_;
    std::set<std::string> attempted_;
};
