#include "WaveformAnalysisService.h"
#include "SyntheticWaveform.h"
#include "ofLog.h"
#include "ofUtils.h"
#include <algorithm>
#include <chrono>

WaveformAnalysisService::WaveformAnalysisService(WaveformCache& cache,
                                                 std::shared_ptr<AudioFetcher> fetcher,
                                                 std::shared_ptr<AudioDecoder> decoder)
    : cache_(cache)
    , fetcher_(std::move(fetcher))
    , decoder_(std::move(decoder))
    , timeSource_([]() { return ofGetElapsedTimeMillis(); }) {
    if (fetcher_) {
        fetcher_->setTimeoutMs(timeoutMs_);
    }
}

WaveformAnalysisService::~WaveformAnalysisService() {
    waitForWorkers();
}

void WaveformAnalysisService::setTargetPointCount(int targetPointCount) {
    targetPointCount_ = targetPointCount > 0 ? targetPointCount : WaveformExtractor::DEFAULT_POINT_COUNT;
}

void WaveformAnalysisService::setTimeoutMs(uint64_t timeoutMs) {
    timeoutMs_ = timeoutMs;
    if (fetcher_) {
        fetcher_->setTimeoutMs(timeoutMs);
    }
}

void WaveformAnalysisService::setTimeSource(TimeSource timeSource) {
    if (timeSource) {
        timeSource_ = std::move(timeSource);
    }
}

std::string WaveformAnalysisService::keyFor(const WaveformRequest& request) {
    if (!request.trackId.empty()) {
        return WaveformCache::makeCacheKey(request.trackId);
    }
    if (!request.audioUrl.empty()) {
        return WaveformCache::makeCacheKey(request.audioUrl);
    }
    return "";
}

//--------------------------------------------------------------
WaveformAnalysisService::RequestOutcome WaveformAnalysisService::request(const WaveformRequest& request,
                                                                         std::weak_ptr<void> owner,
                                                                         ResultCallback callback) {
    std::string key = keyFor(request);
    if (key.empty()) {
        ofLogWarning("WaveformAnalysisService") << "Request without track id or audio url";
        return RequestOutcome::INVALID;
    }

    std::vector<Delivery> reaped;
    reapAbandoned(reaped);

    std::vector<Subscriber> subscriber{{owner, callback}};

    if (auto cached = cache_.get(key)) {
        WaveformResult result;
        result.cacheKey = key;
        result.envelope = *cached;
        deliver(subscriber, result);
        deliverAll(reaped);
        return RequestOutcome::CACHED;
    }

    auto pending = jobs_.find(key);
    if (pending != jobs_.end()) {
        pending->second.subscribers.push_back(subscriber.front());
        ofLogVerbose("WaveformAnalysisService") << "Joined running analysis for " << key;
        deliverAll(reaped);
        return RequestOutcome::ALREADY_PENDING;
    }

    auto abandoned = abandoned_.find(key);
    if (abandoned != abandoned_.end()) {
        // The fallback now, the real envelope if the late worker succeeds
        abandoned->second.subscribers.push_back(subscriber.front());
        ofLogVerbose("WaveformAnalysisService") << "Timed-out analysis for " << key << " still running";
        deliver(subscriber, makeFallback(key, "analysis still running after timeout"));
        deliverAll(reaped);
        return RequestOutcome::ALREADY_PENDING;
    }

    uint64_t now = timeSource_();
    auto cooldown = cooldowns_.find(key);
    if (cooldown != cooldowns_.end() && cooldown->second.isInCooldown(now)) {
        ofLogVerbose("WaveformAnalysisService") << "Skipping " << key << ", retry in "
                                                << cooldown->second.getRemainingMs(now) << "ms";
        deliver(subscriber, makeFallback(key, "analysis cooling down after failure"));
        deliverAll(reaped);
        return RequestOutcome::IN_COOLDOWN;
    }

    if (request.audioUrl.empty() || !fetcher_ || !decoder_) {
        ofLogWarning("WaveformAnalysisService") << "Cannot analyse " << key << ": no audio source";
        deliver(subscriber, makeFallback(key, "no audio source to analyse"));
        deliverAll(reaped);
        return RequestOutcome::INVALID;
    }

    // The worker only touches what it captures, never the service itself
    auto fetcher = fetcher_;
    auto decoder = decoder_;
    std::string audioUrl = request.audioUrl;
    int targetPoints = targetPointCount_;

    Job job;
    job.cacheKey = key;
    job.audioUrl = audioUrl;
    job.startMs = now;
    job.subscribers = subscriber;
    job.future = std::async(std::launch::async, [fetcher, decoder, audioUrl, targetPoints]() {
        ofBuffer encoded = fetcher->fetch(audioUrl);
        DecodedAudio decoded = decoder->decode(encoded, audioUrl);
        if (decoded.empty()) {
            throw DecodeError("decoded audio has no samples");
        }
        return WaveformExtractor::extractPeaks(decoded.channels[0], targetPoints);
    });

    jobs_.emplace(key, std::move(job));
    attempted_.insert(key);
    numStarted_++;
    ofLogNotice("WaveformAnalysisService") << "Analysing " << key << " from " << audioUrl;
    deliverAll(reaped);
    return RequestOutcome::STARTED;
}

void WaveformAnalysisService::cancel(const std::shared_ptr<void>& owner) {
    if (!owner) {
        return;
    }
    auto sameOwner = [&owner](const Subscriber& s) {
        return !s.owner.owner_before(owner) && !owner.owner_before(s.owner);
    };
    for (auto* table : {&jobs_, &abandoned_}) {
        for (auto& pair : *table) {
            auto& subscribers = pair.second.subscribers;
            subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(), sameOwner), subscribers.end());
        }
    }
}

//--------------------------------------------------------------
void WaveformAnalysisService::update() {
    std::vector<Delivery> deliveries;
    reapAbandoned(deliveries);

    uint64_t now = timeSource_();

    for (auto it = jobs_.begin(); it != jobs_.end();) {
        Job& job = it->second;
        bool ready = job.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;

        if (ready) {
            try {
                PeakEnvelope envelope = job.future.get();
                cache_.put(job.cacheKey, envelope);
                cooldowns_.erase(job.cacheKey);

                WaveformResult result;
                result.cacheKey = job.cacheKey;
                result.envelope = std::move(envelope);
                deliveries.emplace_back(job.subscribers, result);
                ofLogNotice("WaveformAnalysisService") << "Analysis complete for " << job.cacheKey;
            } catch (const std::exception& e) {
                handleFailure(job, e.what(), deliveries);
            }
            it = jobs_.erase(it);
        } else if (timeoutMs_ > 0 && now >= job.startMs && now - job.startMs > timeoutMs_) {
            handleFailure(job, "analysis timed out after " + ofToString(timeoutMs_) + "ms", deliveries);
            // Its subscribers have their fallback; the worker keeps the key busy until it returns
            Job late;
            late.cacheKey = job.cacheKey;
            late.audioUrl = job.audioUrl;
            late.startMs = job.startMs;
            late.future = std::move(job.future);
            abandoned_.emplace(job.cacheKey, std::move(late));
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }

    // Callbacks run after the job table is consistent; they may issue new requests
    deliverAll(deliveries);
}

void WaveformAnalysisService::handleFailure(Job& job, const std::string& errorMessage,
                                            std::vector<Delivery>& deliveries) {
    ofLogError("WaveformAnalysisService") << "Analysis failed for " << job.cacheKey << ": " << errorMessage;

    auto cooldown = cooldowns_.find(job.cacheKey);
    if (cooldown == cooldowns_.end()) {
        cooldown = cooldowns_.emplace(job.cacheKey, RetryCooldown(cooldownMs_, 1)).first;
    }
    cooldown->second.recordFailure(timeSource_());

    if (noticeSink_) {
        Notice notice;
        notice.error = VisualizerError::DECODE_FAILURE;
        notice.title = "Waveform unavailable";
        notice.message = "Showing an approximate waveform. Playback is not affected.";
        notice.recoverable = true;
        notice.timestampMs = timeSource_();
        noticeSink_->post(notice);
    }

    deliveries.emplace_back(job.subscribers, makeFallback(job.cacheKey, errorMessage));
}

void WaveformAnalysisService::deliverAll(const std::vector<Delivery>& deliveries) {
    for (const auto& delivery : deliveries) {
        deliver(delivery.first, delivery.second);
    }
}

void WaveformAnalysisService::deliver(const std::vector<Subscriber>& subscribers, const WaveformResult& result) {
    for (const auto& subscriber : subscribers) {
        // Owner token gone means the view was torn down
        auto alive = subscriber.owner.lock();
        if (!alive || !subscriber.callback) {
            continue;
        }
        subscriber.callback(result);
    }
}

WaveformResult WaveformAnalysisService::makeFallback(const std::string& cacheKey, const std::string& errorMessage) const {
    WaveformResult result;
    result.cacheKey = cacheKey;
    result.synthetic = true;
    result.errorMessage = errorMessage;
    result.envelope = SyntheticWaveform::generate(targetPointCount_, SyntheticWaveform::seedFromKey(cacheKey));
    return result;
}

//--------------------------------------------------------------
void WaveformAnalysisService::reapAbandoned(std::vector<Delivery>& deliveries) {
    for (auto it = abandoned_.begin(); it != abandoned_.end();) {
        Job& job = it->second;
        if (job.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            PeakEnvelope envelope = job.future.get();
            cache_.put(job.cacheKey, envelope);
            cooldowns_.erase(job.cacheKey);
            ofLogNotice("WaveformAnalysisService") << "Late analysis result cached for " << job.cacheKey;

            if (!job.subscribers.empty()) {
                WaveformResult result;
                result.cacheKey = job.cacheKey;
                result.envelope = std::move(envelope);
                deliveries.emplace_back(job.subscribers, result);
            }
        } catch (const std::exception& e) {
            ofLogVerbose("WaveformAnalysisService") << "Timed-out analysis finished with error: " << e.what();
        }
        it = abandoned_.erase(it);
    }
}

void WaveformAnalysisService::waitForWorkers() {
    for (auto* table : {&jobs_, &abandoned_}) {
        for (auto& pair : *table) {
            if (pair.second.future.valid()) {
                pair.second.future.wait();
            }
        }
    }
}

bool WaveformAnalysisService::isPending(const std::string& cacheKey) const {
    return jobs_.find(cacheKey) != jobs_.end();
}

bool WaveformAnalysisService::isAbandoned(const std::string& cacheKey) const {
    return abandoned_.find(cacheKey) != abandoned_.end();
}

bool WaveformAnalysisService::wasAttempted(const std::string& cacheKey) const {
    return attempted_.find(cacheKey) != attempted_.end();
}
