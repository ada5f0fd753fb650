#pragma once

#include "WaveformExtractor.h"
#include "ofJson.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Durable storage for peak envelopes
 *
 * DurableWaveformStore is the save/load contract of the second cache tier.
 * LocalWaveformStore keeps envelopes as JSON array text in a KeyValueStore;
 * CompositeWaveformStore fans out to several stores (e.g. local + a remote
 * backend supplied by the host).
 *
 * Implementations may be called from worker threads for different keys.
 */

// Raised by KeyValueStore writes (quota exceeded, disk full, ...)
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> getItem(const std::string& key) const = 0;
    // Throws StorageError when the value cannot be stored
    virtual void setItem(const std::string& key, const std::string& value) = 0;
    virtual void removeItem(const std::string& key) = 0;
    virtual std::vector<std::string> getKeys() const = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
    // quotaBytes == 0 means unlimited
    explicit MemoryKeyValueStore(size_t quotaBytes = 0);

    std::optional<std::string> getItem(const std::string& key) const override;
    void setItem(const std::string& key, const std::string& value) override;
    void removeItem(const std::string& key) override;
    std::vector<std::string> getKeys() const override;

    size_t getUsedBytes() const;

private:
    size_t quotaBytes_;
    size_t usedBytes_ = 0;
    std::map<std::string, std::string> items_;
    mutable std::mutex mutex_;
};

/**
 * JsonFileKeyValueStore - key/value pairs in one JSON document on disk
 *
 * The whole document is read once on construction and rewritten on every
 * change, like the asset index. Paths are resolved with ofToDataPath.
 */
class JsonFileKeyValueStore : public KeyValueStore {
public:
    explicit JsonFileKeyValueStore(const std::string& path);

    std::optional<std::string> getItem(const std::string& key) const override;
    void setItem(const std::string& key, const std::string& value) override;
    void removeItem(const std::string& key) override;
    std::vector<std::string> getKeys() const override;

    const std::string& getPath() const { return path_; }
    bool reload();

private:
    bool writeDocument(const std::map<std::string, std::string>& items) const;

    std::string path_;
    std::map<std::string, std::string> items_;
    mutable std::mutex mutex_;
};

//--------------------------------------------------------------
class DurableWaveformStore {
public:
    virtual ~DurableWaveformStore() = default;

    virtual bool save(const std::string& trackKey, const PeakEnvelope& envelope) = 0;
    // Absent when nothing is stored; may throw on backend or parse errors
    virtual std::optional<PeakEnvelope> load(const std::string& trackKey) = 0;
    virtual bool remove(const std::string& trackKey) { return false; }
};

class LocalWaveformStore : public DurableWaveformStore {
public:
    explicit LocalWaveformStore(std::shared_ptr<KeyValueStore> store);

    bool save(const std::string& trackKey, const PeakEnvelope& envelope) override;
    std::optional<PeakEnvelope> load(const std::string& trackKey) override;
    bool remove(const std::string& trackKey) override;

    static std::string serialize(const PeakEnvelope& envelope);
    // Throws std::invalid_argument unless the text is a JSON array of numbers
    static PeakEnvelope parse(const std::string& text);

private:
    std::shared_ptr<KeyValueStore> store_;
    std::mutex mutex_;
};

class CompositeWaveformStore : public DurableWaveformStore {
public:
    void addStore(std::shared_ptr<DurableWaveformStore> store);
    size_t getNumStores() const { return stores_.size(); }

    // Succeeds if any store accepted the envelope
    bool save(const std::string& trackKey, const PeakEnvelope& envelope) override;
    // First store with a hit wins; a throwing store is skipped
    std::optional<PeakEnvelope> load(const std::string& trackKey) override;
    bool remove(const std::string& trackKey) override;

private:
    std::vector<std::shared_ptr<DurableWaveformStore>> stores_;
};
