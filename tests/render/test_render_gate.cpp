/*
CandleSync — RenderGate Tests
Role: Verify change notifications coalesce into draws of an immutable window copy, only while Active
Testing Strategy: WindowSynchronizer with fake sources → burst of merges → count draw callbacks
Coverage: Coalescing, interval scheduling, inactive suppression, copy semantics
*/
#include <gtest/gtest.h>
#include "RenderGate.hpp"
#include "marketdata/WindowSynchronizer.hpp"
#include "../marketdata/fixtures/fake_live_feed.hpp"
#include "../marketdata/fixtures/fake_snapshot_source.hpp"
#include "../marketdata/fixtures/kline_messages.hpp"
#include "../marketdata/fixtures/wait_for.hpp"

using fixtures::candle;
using fixtures::kBase;
using fixtures::kMinute;

namespace {

struct GateHarness {
    std::shared_ptr<FakeSnapshotSource::Log> snaps = std::make_shared<FakeSnapshotSource::Log>();
    std::shared_ptr<FakeLiveFeed::Registry>  feeds = std::make_shared<FakeLiveFeed::Registry>();
    WindowSynchronizer sync{SyncConfig{}, std::make_unique<FakeSnapshotSource>(snaps), FakeLiveFeed::factory(feeds)};
    std::vector<std::vector<Candle>> frames;

    void seed(std::size_t n) {
        sync.start();
        snaps->complete(snaps->count() - 1, okSnapshot(fixtures::minuteSeries(n)));
    }
};

} // namespace

TEST(RenderGate, RequiresDrawCallback) {
    GateHarness h;
    EXPECT_THROW(RenderGate(h.sync, RenderGate::DrawFn{}), std::invalid_argument);
}

TEST(RenderGate, DrawsSeededWindowOnceActive) {
    GateHarness h;
    RenderGate gate(h.sync, [&](const std::vector<Candle>& w){ h.frames.push_back(w); });

    h.seed(60);
    ASSERT_TRUE(fixtures::waitFor([&]{ return gate.framesDrawn() == 1; }));
    ASSERT_EQ(h.frames.size(), 1u);
    EXPECT_EQ(h.frames[0].size(), 60u);
}

TEST(RenderGate, BurstOfMergesCoalescesIntoOneDraw) {
    GateHarness h;
    RenderGate gate(h.sync, [&](const std::vector<Candle>& w){ h.frames.push_back(w); },
                    std::chrono::milliseconds(20));
    h.seed(10);
    ASSERT_TRUE(fixtures::waitFor([&]{ return gate.framesDrawn() == 1; }));

    // All submitted inline on the owner thread before the gate's timer can fire
    for (int i = 0; i < 25; ++i) {
        h.sync.submitObservation(h.sync.generation(), candle(kBase + 9 * kMinute, 200.0 + i));
    }
    ASSERT_TRUE(fixtures::waitFor([&]{ return gate.framesDrawn() == 2; }));
    fixtures::waitFor([]{ return false; }, std::chrono::milliseconds(60));

    EXPECT_EQ(gate.framesDrawn(), 2u);
    EXPECT_EQ(gate.coalesced(), 24u);
    EXPECT_DOUBLE_EQ(h.frames.back().back().close, 224.0);
}

TEST(RenderGate, NoDrawAfterStop) {
    GateHarness h;
    RenderGate gate(h.sync, [&](const std::vector<Candle>& w){ h.frames.push_back(w); },
                    std::chrono::milliseconds(20));
    h.seed(10);

    // Stop before the pending draw fires
    ASSERT_TRUE(fixtures::waitFor([&]{ return h.sync.state() == SynchronizerState::Active; }));
    h.sync.stop();
    fixtures::waitFor([]{ return false; }, std::chrono::milliseconds(80));

    EXPECT_EQ(gate.framesDrawn(), 0u);
    EXPECT_TRUE(h.frames.empty());
}

TEST(RenderGate, DrawReceivesIndependentCopy) {
    GateHarness h;
    RenderGate gate(h.sync, [&](const std::vector<Candle>& w){ h.frames.push_back(w); });
    h.seed(3);
    ASSERT_TRUE(fixtures::waitFor([&]{ return gate.framesDrawn() == 1; }));

    h.sync.submitObservation(h.sync.generation(), candle(kBase + 3 * kMinute, 500));
    ASSERT_TRUE(fixtures::waitFor([&]{ return gate.framesDrawn() == 2; }));

    EXPECT_EQ(h.frames[0].size(), 3u);
    EXPECT_EQ(h.frames[1].size(), 3u);
    EXPECT_EQ(h.frames[0].back().openTime, kBase + 2 * kMinute);
    EXPECT_EQ(h.frames[1].back().openTime, kBase + 3 * kMinute);
}
