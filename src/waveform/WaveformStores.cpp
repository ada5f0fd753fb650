#include "WaveformStores.h"
#include "ofFileUtils.h"
#include "ofLog.h"
#include "ofUtils.h"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

//--------------------------------------------------------------
// MemoryKeyValueStore
//--------------------------------------------------------------
MemoryKeyValueStore::MemoryKeyValueStore(size_t quotaBytes)
    : quotaBytes_(quotaBytes) {
}

std::optional<std::string> MemoryKeyValueStore::getItem(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::setItem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t previous = 0;
    auto it = items_.find(key);
    if (it != items_.end()) {
        previous = key.size() + it->second.size();
    }
    size_t required = usedBytes_ - previous + key.size() + value.size();
    if (quotaBytes_ > 0 && required > quotaBytes_) {
        throw StorageError("quota exceeded storing '" + key + "' (" + ofToString(required)
                           + " of " + ofToString(quotaBytes_) + " bytes)");
    }
    items_[key] = value;
    usedBytes_ = required;
}

void MemoryKeyValueStore::removeItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it != items_.end()) {
        usedBytes_ -= key.size() + it->second.size();
        items_.erase(it);
    }
}

std::vector<std::string> MemoryKeyValueStore::getKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& pair : items_) {
        keys.push_back(pair.first);
    }
    return keys;
}

size_t MemoryKeyValueStore::getUsedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usedBytes_;
}

//--------------------------------------------------------------
// JsonFileKeyValueStore
//--------------------------------------------------------------
JsonFileKeyValueStore::JsonFileKeyValueStore(const std::string& path)
    : path_(ofToDataPath(path, true)) {
    reload();
}

bool JsonFileKeyValueStore::reload() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();

    if (!ofFile::doesFileExist(path_, false)) {
        return true;
    }

    ofFile file(path_, ofFile::ReadOnly);
    if (!file.is_open()) {
        ofLogError("JsonFileKeyValueStore") << "Failed to open: " << path_;
        return false;
    }
    std::string jsonString = file.readToBuffer().getText();
    file.close();

    try {
        ofJson json = ofJson::parse(jsonString);
        if (json.contains("entries") && json["entries"].is_object()) {
            for (auto it = json["entries"].begin(); it != json["entries"].end(); ++it) {
                if (it.value().is_string()) {
                    items_[it.key()] = it.value().get<std::string>();
                }
            }
        }
        ofLogNotice("JsonFileKeyValueStore") << "Loaded " << items_.size() << " entries from " << path_;
    } catch (const std::exception& e) {
        ofLogError("JsonFileKeyValueStore") << "Failed to parse " << path_ << ": " << e.what();
        return false;
    }
    return true;
}

bool JsonFileKeyValueStore::writeDocument(const std::map<std::string, std::string>& items) const {
    ofJson json = ofJson::object();
    json["version"] = "1.0";

    auto now = std::time(nullptr);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
    json["modified"] = ss.str();

    json["entries"] = ofJson::object();
    for (const auto& pair : items) {
        json["entries"][pair.first] = pair.second;
    }

    std::string directory = ofFilePath::getEnclosingDirectory(path_, false);
    if (!directory.empty() && !ofDirectory::doesDirectoryExist(directory, false)) {
        ofDirectory::createDirectory(directory, false, true);
    }

    ofFile file(path_, ofFile::WriteOnly);
    if (!file.is_open()) {
        return false;
    }
    file << json.dump(4);
    file.close();
    return true;
}

std::optional<std::string> JsonFileKeyValueStore::getItem(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonFileKeyValueStore::setItem(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto updated = items_;
    updated[key] = value;
    if (!writeDocument(updated)) {
        throw StorageError("failed to write " + path_);
    }
    items_.swap(updated);
}

void JsonFileKeyValueStore::removeItem(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.erase(key) > 0 && !writeDocument(items_)) {
        ofLogError("JsonFileKeyValueStore") << "Failed to write " << path_ << " after removing " << key;
    }
}

std::vector<std::string> JsonFileKeyValueStore::getKeys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& pair : items_) {
        keys.push_back(pair.first);
    }
    return keys;
}

//--------------------------------------------------------------
// LocalWaveformStore
//--------------------------------------------------------------
LocalWaveformStore::LocalWaveformStore(std::shared_ptr<KeyValueStore> store)
    : store_(std::move(store)) {
}

std::string LocalWaveformStore::serialize(const PeakEnvelope& envelope) {
    ofJson json = ofJson::array();
    for (float value : envelope) {
        json.push_back(value);
    }
    return json.dump();
}

PeakEnvelope LocalWaveformStore::parse(const std::string& text) {
    ofJson json = ofJson::parse(text);
    if (!json.is_array()) {
        throw std::invalid_argument("envelope is not an array");
    }
    PeakEnvelope envelope;
    envelope.reserve(json.size());
    for (const auto& value : json) {
        if (!value.is_number()) {
            throw std::invalid_argument("envelope contains a non-numeric value");
        }
        envelope.push_back(value.get<float>());
    }
    return envelope;
}

bool LocalWaveformStore::save(const std::string& trackKey, const PeakEnvelope& envelope) {
    if (!store_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    store_->setItem(trackKey, serialize(envelope));
    return true;
}

std::optional<PeakEnvelope> LocalWaveformStore::load(const std::string& trackKey) {
    if (!store_) {
        return std::nullopt;
    }
    std::optional<std::string> text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        text = store_->getItem(trackKey);
    }
    if (!text) {
        return std::nullopt;
    }
    return parse(*text);
}

bool LocalWaveformStore::remove(const std::string& trackKey) {
    if (!store_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    store_->removeItem(trackKey);
    return true;
}

//--------------------------------------------------------------
// CompositeWaveformStore
//--------------------------------------------------------------
void CompositeWaveformStore::addStore(std::shared_ptr<DurableWaveformStore> store) {
    if (store) {
        stores_.push_back(std::move(store));
    }
}

bool CompositeWaveformStore::save(const std::string& trackKey, const PeakEnvelope& envelope) {
    bool saved = false;
    std::string lastError;
    for (auto& store : stores_) {
        try {
            saved = store->save(trackKey, envelope) || saved;
        } catch (const std::exception& e) {
            lastError = e.what();
            ofLogWarning("CompositeWaveformStore") << "Store rejected " << trackKey << ": " << e.what();
        }
    }
    if (!saved && !lastError.empty()) {
        throw StorageError(lastError);
    }
    return saved;
}

std::optional<PeakEnvelope> CompositeWaveformStore::load(const std::string& trackKey) {
    for (auto& store : stores_) {
        try {
            auto envelope = store->load(trackKey);
            if (envelope) {
                return envelope;
            }
        } catch (const std::exception& e) {
            ofLogWarning("CompositeWaveformStore") << "Store failed loading " << trackKey << ": " << e.what();
        }
    }
    return std::nullopt;
}

bool CompositeWaveformStore::remove(const std::string& trackKey) {
    bool removed = false;
    for (auto& store : stores_) {
        try {
            removed = store->remove(trackKey) || removed;
        } catch (const std::exception& e) {
            ofLogWarning("CompositeWaveformStore") << "Store failed removing " << trackKey << ": " << e.what();
        }
    }
    return removed;
}
