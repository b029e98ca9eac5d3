#pragma once
/*
CandleSync — WindowSynchronizer
Role: Reconciles one historical snapshot with an unbounded live kline stream into a bounded RollingWindow.
Inputs/Outputs: Consumes ISnapshotSource results and ILiveFeed observations; emits windowChanged and lifecycle signals.
Threading: The window, state and stats live on this object's thread. Producers post onto it with queued invocations.
Performance: Each merge is O(1) and never performs I/O; the owning thread never waits on a worker.
Integration: Built by makeBinanceSynchronizer() or with test doubles; RenderGate listens to windowChanged.
Observability: Lifecycle transitions at app level; merge/stale/rejection paths throttled at data level; SyncStats.
Related: WindowSynchronizer.cpp, RollingWindow.hpp, ISnapshotSource.hpp, ILiveFeed.hpp, SyncConfig.hpp.
Assumptions: One instrument per synchronizer; reconnection policy belongs to the application.
*/
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include <QObject>
#include <QString>
#include "SyncConfig.hpp"
#include "model/CandleData.h"
#include "sources/ILiveFeed.hpp"
#include "sources/ISnapshotSource.hpp"
#include "window/RollingWindow.hpp"

struct SyncStats {
    std::uint64_t appended = 0;
    std::uint64_t replaced = 0;
    std::uint64_t evicted = 0;
    std::uint64_t stale = 0;
    std::uint64_t rejectedGeneration = 0;
    std::uint64_t rejectedInactive = 0;
    std::uint64_t seeded = 0;
    std::uint64_t seedDropped = 0;
    std::uint64_t snapshotFailures = 0;
    std::uint64_t connectionLosses = 0;
};

class WindowSynchronizer : public QObject {
    Q_OBJECT

public:
    using LiveFeedFactory = std::function<std::unique_ptr<ILiveFeed>()>;

    WindowSynchronizer(SyncConfig config,
                       std::unique_ptr<ISnapshotSource> snapshots,
                       LiveFeedFactory feeds,
                       QObject* parent = nullptr);
    ~WindowSynchronizer() override;

    // Idempotent; callable from any thread, executed on this object's thread.
    void start();
    void stop();

    // Merge entry point; callable from any thread.
    void submitObservation(Generation generation, const Candle& candle);

    // Owning-thread accessors. snapshot() returns a copy, never the live window.
    SynchronizerState   state() const { return m_state; }
    Generation          generation() const { return m_generation; }
    std::vector<Candle> snapshot() const { return m_window->snapshot(); }
    std::optional<Candle> lastCandle() const { return m_window->last(); }
    std::size_t         windowLength() const { return m_window->size(); }
    const SyncStats&    stats() const { return m_stats; }

    WindowSynchronizer(const WindowSynchronizer&) = delete;
    WindowSynchronizer& operator=(const WindowSynchronizer&) = delete;

signals:
    void windowChanged();
    void stateChanged(SynchronizerState state);
    void snapshotFailed(const QString& reason);
    void connectionLost(const QString& reason);

private:
    template <typename F> void runOnOwner(F&& fn);

    void doStart();
    void doStop();
    void applySnapshot(Generation generation, const SnapshotResult& result);
    void applyObservation(Generation generation, const Candle& candle);
    void handleConnectionLost(Generation generation, const QString& reason);
    void handleFeedClosed(Generation generation);
    void finishStop();
    void setState(SynchronizerState next);
    std::unique_ptr<ILiveFeed> makeFeed();

    SyncConfig                       m_config;
    std::unique_ptr<ISnapshotSource> m_snapshots;
    LiveFeedFactory                  m_feedFactory;

    std::unique_ptr<RollingWindow>   m_window;
    std::unique_ptr<ILiveFeed>       m_feed;       // current generation
    std::unique_ptr<ILiveFeed>       m_retiring;   // closing, previous generation

    SynchronizerState                m_state = SynchronizerState::Idle;
    Generation                       m_generation = 0;
    std::atomic<bool>                m_accepting{false};
    SyncStats                        m_stats;
};
