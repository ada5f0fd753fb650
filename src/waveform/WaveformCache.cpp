#include "WaveformCache.h"
#include "ofLog.h"
#include "ofUtils.h"

WaveformCache::WaveformCache(std::shared_ptr<DurableWaveformStore> durableStore)
    : durableStore_(std::move(durableStore)) {
}

void WaveformCache::setDurableStore(std::shared_ptr<DurableWaveformStore> durableStore) {
    std::lock_guard<std::mutex> lock(mutex_);
    durableStore_ = std::move(durableStore);
}

//--------------------------------------------------------------
std::string WaveformCache::makeCacheKey(const std::string& urlOrId) {
    std::string source = ofTrim(urlOrId);

    size_t cut = source.find_first_of("?#");
    if (cut != std::string::npos) {
        source = source.substr(0, cut);
    }

    bool isPath = source.find('/') != std::string::npos || source.find('\\') != std::string::npos;
    if (isPath) {
        while (!source.empty() && (source.back() == '/' || source.back() == '\\')) {
            source.pop_back();
        }
        size_t slash = source.find_last_of("/\\");
        if (slash != std::string::npos) {
            source = source.substr(slash + 1);
        }
    }
    return std::string(KEY_PREFIX) + source;
}

//--------------------------------------------------------------
std::optional<PeakEnvelope> WaveformCache::get(const std::string& key) {
    std::shared_ptr<DurableWaveformStore> durable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memory_.find(key);
        if (it != memory_.end()) {
            return it->second;
        }
        durable = durableStore_;
    }

    if (!durable) {
        return std::nullopt;
    }

    std::optional<PeakEnvelope> loaded;
    try {
        loaded = durable->load(key);
    } catch (const std::exception& e) {
        reportFailure(VisualizerError::CACHE_READ_FAILURE, key, e.what());
        return std::nullopt;
    }
    if (!loaded) {
        return std::nullopt;
    }
    if (!WaveformExtractor::isValidEnvelope(*loaded)) {
        reportFailure(VisualizerError::CACHE_READ_FAILURE, key, "stored envelope is empty or out of range");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    memory_[key] = *loaded;
    ofLogVerbose("WaveformCache") << "Promoted " << key << " from durable store";
    return loaded;
}

bool WaveformCache::put(const std::string& key, const PeakEnvelope& envelope) {
    if (key.empty() || envelope.empty()) {
        ofLogWarning("WaveformCache") << "Refusing to cache empty envelope for '" << key << "'";
        return false;
    }

    std::shared_ptr<DurableWaveformStore> durable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[key] = envelope;
        durable = durableStore_;
    }

    if (durable) {
        try {
            if (!durable->save(key, envelope)) {
                reportFailure(VisualizerError::CACHE_WRITE_FAILURE, key, "durable store rejected the envelope");
            }
        } catch (const std::exception& e) {
            reportFailure(VisualizerError::CACHE_WRITE_FAILURE, key, e.what());
        }
    }
    return true;
}

//--------------------------------------------------------------
bool WaveformCache::containsInMemory(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memory_.find(key) != memory_.end();
}

void WaveformCache::remove(const std::string& key) {
    std::shared_ptr<DurableWaveformStore> durable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_.erase(key);
        durable = durableStore_;
    }
    if (durable) {
        try {
            durable->remove(key);
        } catch (const std::exception& e) {
            ofLogWarning("WaveformCache") << "Failed to remove " << key << " from durable store: " << e.what();
        }
    }
}

void WaveformCache::clearMemory() {
    std::lock_guard<std::mutex> lock(mutex_);
    memory_.clear();
}

std::vector<std::string> WaveformCache::getCachedKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(memory_.size());
    for (const auto& pair : memory_) {
        keys.push_back(pair.first);
    }
    return keys;
}

size_t WaveformCache::getDurableWriteFailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durableWriteFailures_;
}

size_t WaveformCache::getDurableReadFailureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durableReadFailures_;
}

//--------------------------------------------------------------
void WaveformCache::reportFailure(VisualizerError error, const std::string& key, const std::string& detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error == VisualizerError::CACHE_WRITE_FAILURE) {
            durableWriteFailures_++;
        } else {
            durableReadFailures_++;
        }
    }

    if (error == VisualizerError::CACHE_WRITE_FAILURE) {
        ofLogWarning("WaveformCache") << "Durable write failed for " << key << " (kept in memory): " << detail;
    } else {
        ofLogWarning("WaveformCache") << "Durable read failed for " << key << " (treated as miss): " << detail;
    }
}
