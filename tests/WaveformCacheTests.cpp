#include "waveform/WaveformCache.h"
#include "ofFileUtils.h"
#include <gtest/gtest.h>
#include <filesystem>

namespace {

class WaveformCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryKeyValueStore> kv = std::make_shared<MemoryKeyValueStore>();
    std::shared_ptr<LocalWaveformStore> local = std::make_shared<LocalWaveformStore>(kv);
    PeakEnvelope envelope = {0.0f, 0.25f, 1.0f, 0.5f};
};

TEST(WaveformCacheKeyTest, UsesLastPathSegment) {
    EXPECT_EQ(WaveformCache::makeCacheKey("https://cdn.example.com/audio/song.mp3?token=1"), "waveform:song.mp3");
    EXPECT_EQ(WaveformCache::makeCacheKey("https://other.example.org/mirror/song.mp3#t=3"), "waveform:song.mp3");
    EXPECT_EQ(WaveformCache::makeCacheKey("/home/user/Music/take 2.wav"), "waveform:take 2.wav");
    EXPECT_EQ(WaveformCache::makeCacheKey("C:\\audio\\loop.ogg"), "waveform:loop.ogg");
    EXPECT_EQ(WaveformCache::makeCacheKey("track-42"), "waveform:track-42");
}

TEST_F(WaveformCacheTest, PutThenGetFromBothTiers) {
    WaveformCache cache(local);
    EXPECT_TRUE(cache.put("waveform:a.mp3", envelope));
    EXPECT_TRUE(cache.containsInMemory("waveform:a.mp3"));
    EXPECT_TRUE(kv->getItem("waveform:a.mp3").has_value());

    auto cached = cache.get("waveform:a.mp3");
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(*cached, envelope);
}

TEST_F(WaveformCacheTest, MissReturnsNothing) {
    WaveformCache cache(local);
    EXPECT_FALSE(cache.get("waveform:missing.mp3").has_value());
    EXPECT_EQ(cache.getDurableReadFailureCount(), 0u);

    WaveformCache memoryOnly;
    EXPECT_FALSE(memoryOnly.get("waveform:missing.mp3").has_value());
}

TEST_F(WaveformCacheTest, DurableHitIsPromotedToMemory) {
    WaveformCache writer(local);
    writer.put("waveform:a.mp3", envelope);

    WaveformCache reader(local);
    EXPECT_FALSE(reader.containsInMemory("waveform:a.mp3"));
    auto loaded = reader.get("waveform:a.mp3");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, envelope);
    EXPECT_TRUE(reader.containsInMemory("waveform:a.mp3"));

    kv->removeItem("waveform:a.mp3");
    EXPECT_TRUE(reader.get("waveform:a.mp3").has_value());
}

TEST_F(WaveformCacheTest, QuotaFailureKeepsEnvelopeInMemory) {
    auto tiny = std::make_shared<MemoryKeyValueStore>(16);
    WaveformCache cache(std::make_shared<LocalWaveformStore>(tiny));

    EXPECT_TRUE(cache.put("waveform:long-track.mp3", envelope));
    EXPECT_EQ(cache.getDurableWriteFailureCount(), 1u);
    EXPECT_TRUE(tiny->getKeys().empty());
    ASSERT_TRUE(cache.get("waveform:long-track.mp3").has_value());
}

TEST_F(WaveformCacheTest, CorruptEntriesAreMisses) {
    kv->setItem("waveform:broken.mp3", "not json");
    kv->setItem("waveform:range.mp3", "[1.5]");
    kv->setItem("waveform:empty.mp3", "[]");
    WaveformCache cache(local);

    EXPECT_FALSE(cache.get("waveform:broken.mp3").has_value());
    EXPECT_FALSE(cache.get("waveform:range.mp3").has_value());
    EXPECT_FALSE(cache.get("waveform:empty.mp3").has_value());
    EXPECT_EQ(cache.getDurableReadFailureCount(), 3u);
    EXPECT_FALSE(cache.containsInMemory("waveform:range.mp3"));
}

TEST_F(WaveformCacheTest, RejectsEmptyEnvelopeOrKey) {
    WaveformCache cache(local);
    EXPECT_FALSE(cache.put("waveform:a.mp3", PeakEnvelope()));
    EXPECT_FALSE(cache.put("", envelope));
    EXPECT_TRUE(cache.getCachedKeys().empty());
    EXPECT_TRUE(kv->getKeys().empty());
}

TEST_F(WaveformCacheTest, RemoveDropsBothTiers) {
    WaveformCache cache(local);
    cache.put("waveform:a.mp3", envelope);
    cache.remove("waveform:a.mp3");
    EXPECT_FALSE(cache.containsInMemory("waveform:a.mp3"));
    EXPECT_FALSE(kv->getItem("waveform:a.mp3").has_value());
}

TEST_F(WaveformCacheTest, CompositeStoreFansOut) {
    auto otherKv = std::make_shared<MemoryKeyValueStore>();
    auto composite = std::make_shared<CompositeWaveformStore>();
    composite->addStore(std::make_shared<LocalWaveformStore>(std::make_shared<MemoryKeyValueStore>(8)));
    composite->addStore(local);
    composite->addStore(std::make_shared<LocalWaveformStore>(otherKv));
    EXPECT_EQ(composite->getNumStores(), 3u);

    WaveformCache cache(composite);
    cache.put("waveform:a.mp3", envelope);
    EXPECT_EQ(cache.getDurableWriteFailureCount(), 0u);
    EXPECT_TRUE(kv->getItem("waveform:a.mp3").has_value());
    EXPECT_TRUE(otherKv->getItem("waveform:a.mp3").has_value());

    kv->setItem("waveform:a.mp3", "not json");
    WaveformCache reader(composite);
    auto loaded = reader.get("waveform:a.mp3");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, envelope);
}

TEST(JsonFileKeyValueStoreTest, SurvivesReload) {
    std::string path = (std::filesystem::temp_directory_path() / "trackscope_cache_test.json").string();
    ofFile::removeFile(path, false);
    {
        JsonFileKeyValueStore store(path);
        EXPECT_TRUE(store.getKeys().empty());
        store.setItem("waveform:a.mp3", LocalWaveformStore::serialize({0.5f, 1.0f}));
    }

    JsonFileKeyValueStore reopened(path);
    auto text = reopened.getItem("waveform:a.mp3");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(LocalWaveformStore::parse(*text), PeakEnvelope({0.5f, 1.0f}));

    reopened.removeItem("waveform:a.mp3");
    EXPECT_TRUE(reopened.reload());
    EXPECT_TRUE(reopened.getKeys().empty());
    ofFile::removeFile(path, false);
}

TEST(LocalWaveformStoreTest, ParseRejectsNonNumericArrays) {
    EXPECT_THROW(LocalWaveformStore::parse("{\"a\":1}"), std::invalid_argument);
    EXPECT_THROW(LocalWaveformStore::parse("[0.5,\"x\"]"), std::invalid_argument);
    EXPECT_ANY_THROW(LocalWaveformStore::parse("[0.5,"));
}

} // namespace
