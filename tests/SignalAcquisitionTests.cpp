#include "audio/SignalAcquisition.h"
#include "TestDoubles.h"
#include <gtest/gtest.h>

namespace {

TEST(SignalAcquisitionTest, NoNodeMeansNothingToDraw) {
    SignalAcquisition acquisition;
    EXPECT_FALSE(acquisition.isAvailable());
    EXPECT_EQ(acquisition.pullTimeDomain(), nullptr);
    EXPECT_EQ(acquisition.pullFrequency(), nullptr);
    EXPECT_FLOAT_EQ(acquisition.getSampleRate(), 0.0f);
    EXPECT_EQ(acquisition.getFrequencyBinCount(), 0);
}

TEST(SignalAcquisitionTest, PullsCopyCurrentNodeData) {
    FakeAnalysisNode node(8);
    node.timeDomain = {0.0f, 0.5f, -0.5f, 1.0f, 0.0f, 0.0f, 0.0f, -1.0f};
    node.frequency = {255.0f, 128.0f, 0.0f, 12.0f};
    SignalAcquisition acquisition(&node);

    const std::vector<float>* time = acquisition.pullTimeDomain();
    ASSERT_NE(time, nullptr);
    EXPECT_EQ(*time, node.timeDomain);

    const std::vector<float>* freq = acquisition.pullFrequency();
    ASSERT_NE(freq, nullptr);
    EXPECT_EQ(*freq, node.frequency);
    EXPECT_EQ(acquisition.getFrequencyBinCount(), 4);
}

TEST(SignalAcquisitionTest, BuffersAreReusedAcrossFrames) {
    FakeAnalysisNode node(2048);
    SignalAcquisition acquisition(&node);

    const std::vector<float>* first = acquisition.pullTimeDomain();
    acquisition.pullFrequency();
    EXPECT_EQ(acquisition.getReallocationCount(), 2u);

    for (int frame = 0; frame < 10; frame++) {
        node.timeDomain[0] = static_cast<float>(frame) / 10.0f;
        const std::vector<float>* current = acquisition.pullTimeDomain();
        acquisition.pullFrequency();
        EXPECT_EQ(current, first);
        EXPECT_FLOAT_EQ((*current)[0], static_cast<float>(frame) / 10.0f);
    }
    EXPECT_EQ(acquisition.getReallocationCount(), 2u);
    EXPECT_EQ(node.numTimeDomainPulls, 11u);
}

TEST(SignalAcquisitionTest, ResolutionChangeReallocatesOnce) {
    FakeAnalysisNode node(2048);
    SignalAcquisition acquisition(&node);
    acquisition.pullFrequency();
    EXPECT_EQ(acquisition.pullFrequency()->size(), 1024u);

    node.setFftSize(4096);
    EXPECT_EQ(acquisition.pullFrequency()->size(), 2048u);
    acquisition.pullFrequency();
    EXPECT_EQ(acquisition.getReallocationCount(), 2u);
}

TEST(SignalAcquisitionTest, DetachingNodeStopsPulls) {
    FakeAnalysisNode node(64);
    SignalAcquisition acquisition(&node);
    ASSERT_NE(acquisition.pullTimeDomain(), nullptr);

    acquisition.setAnalysisNode(nullptr);
    EXPECT_EQ(acquisition.pullTimeDomain(), nullptr);
    EXPECT_EQ(node.numTimeDomainPulls, 1u);
}

} // namespace
