/*
CandleSync — WindowSynchronizer
Role: State machine (Idle/Loading/Active/Stopping/Stopped) and the merge protocol gate.
Threading: Every mutation of m_window/m_state happens on thread(); worker callbacks arrive via Qt::QueuedConnection.
Observability: Transitions logged unthrottled; per-observation paths throttled.
*/
#include "WindowSynchronizer.hpp"
#include "CandleSyncLogging.hpp"
#include "Cpp20Utils.hpp"
#include <QMetaObject>
#include <QPointer>
#include <QThread>
#include <QTimer>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

WindowSynchronizer::WindowSynchronizer(SyncConfig config,
                                       std::unique_ptr<ISnapshotSource> snapshots,
                                       LiveFeedFactory feeds,
                                       QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_snapshots(std::move(snapshots))
    , m_feedFactory(std::move(feeds))
{
    qRegisterMetaType<Candle>("Candle");
    qRegisterMetaType<SynchronizerState>("SynchronizerState");

    m_config.validate();
    if (!m_snapshots || !m_feedFactory) {
        throw std::invalid_argument("WindowSynchronizer requires a snapshot source and a live feed factory");
    }
    m_window = std::make_unique<RollingWindow>(m_config.windowSize);

    cLog_App("WindowSynchronizer created for" << QString::fromStdString(m_config.instrument)
             << QString::fromStdString(m_config.interval) << "capacity" << m_config.windowSize);
}

WindowSynchronizer::~WindowSynchronizer() {
    m_accepting.store(false);
    // Join every worker before QObject teardown so no callback can post to a dead object
    if (m_feed) m_feed->close();
    m_feed.reset();
    m_retiring.reset();
    m_snapshots.reset();
    cLog_App("WindowSynchronizer destroyed");
}

template <typename F>
void WindowSynchronizer::runOnOwner(F&& fn) {
    if (QThread::currentThread() == thread()) {
        fn();
        return;
    }
    QPointer<WindowSynchronizer> self(this);
    QMetaObject::invokeMethod(this, [self, fn = std::forward<F>(fn)]() {
        if (!self) return;
        fn();
    }, Qt::QueuedConnection);
}

void WindowSynchronizer::start() {
    runOnOwner([this]{ doStart(); });
}

void WindowSynchronizer::stop() {
    // Effective for acceptance immediately, whichever thread calls
    m_accepting.store(false);
    runOnOwner([this]{ doStop(); });
}

void WindowSynchronizer::submitObservation(Generation generation, const Candle& candle) {
    runOnOwner([this, generation, candle]{ applyObservation(generation, candle); });
}

void WindowSynchronizer::setState(SynchronizerState next) {
    if (next == m_state) return;
    cLog_App("State" << toString(m_state) << "->" << toString(next) << "generation" << m_generation);
    m_state = next;
    emit stateChanged(next);
}

std::unique_ptr<ILiveFeed> WindowSynchronizer::makeFeed() {
    auto feed = m_feedFactory();
    if (!feed) {
        throw std::runtime_error("live feed factory returned null");
    }

    QPointer<WindowSynchronizer> self(this);
    feed->onObservation([this, self](Generation g, Candle c) {
        QMetaObject::invokeMethod(this, [self, g, c]{
            if (self) self->applyObservation(g, c);
        }, Qt::QueuedConnection);
    });
    feed->onConnectionLost([this, self](Generation g, std::string reason) {
        QMetaObject::invokeMethod(this, [self, g, r = QString::fromStdString(reason)]{
            if (self) self->handleConnectionLost(g, r);
        }, Qt::QueuedConnection);
    });
    feed->onClosed([this, self](Generation g) {
        QMetaObject::invokeMethod(this, [self, g]{
            if (self) self->handleFeedClosed(g);
        }, Qt::QueuedConnection);
    });
    return feed;
}

void WindowSynchronizer::doStart() {
    if (m_state == SynchronizerState::Loading || m_state == SynchronizerState::Active) {
        cLog_App("start() ignored: already" << toString(m_state));
        return;
    }
    if (m_state == SynchronizerState::Stopping) {
        finishStop();
    }
    m_retiring.reset();
    if (m_state == SynchronizerState::Stopped) {
        setState(SynchronizerState::Idle);
    }

    ++m_generation;
    const Generation gen = m_generation;
    // Replace rather than clear: nothing from the previous run can touch the new window
    m_window = std::make_unique<RollingWindow>(m_config.windowSize);

    QPointer<WindowSynchronizer> self(this);
    m_snapshots->fetch(m_config.request(), gen, [this, self](Generation g, SnapshotResult r) {
        QMetaObject::invokeMethod(this, [self, g, r]{
            if (self) self->applySnapshot(g, r);
        }, Qt::QueuedConnection);
    });

    setState(SynchronizerState::Loading);
}

void WindowSynchronizer::applySnapshot(Generation generation, const SnapshotResult& result) {
    if (generation != m_generation || m_state != SynchronizerState::Loading) {
        cLog_App("Dropping snapshot for generation" << generation << "(current" << m_generation
                 << toString(m_state) << ")");
        return;
    }

    if (!result.ok() || result.candles.empty()) {
        ++m_stats.snapshotFailures;
        const QString reason = result.ok()
            ? QStringLiteral("snapshot returned no candles")
            : QString::fromStdString(fmt::format("{} error: {}", toString(result.error), result.message));
        cLog_Warning("Snapshot for generation" << generation << "unusable:" << reason);
        setState(SynchronizerState::Idle);
        emit snapshotFailed(reason);
        return;
    }

    const SeedResult seeded = m_window->seed(result.candles);
    m_stats.seeded += seeded.kept;
    m_stats.seedDropped += seeded.dropped;
    if (seeded.dropped > 0) {
        cLog_Warning("Snapshot contained" << seeded.dropped << "out-of-order or duplicate candles");
    }
    cLog_App("Seeded window with" << seeded.kept << "candles, last"
             << QString::fromStdString(Cpp20Utils::formatCandleLog(*m_window->last())));

    m_feed = makeFeed();
    m_feed->open(m_config.stream(), generation);
    m_accepting.store(true);
    setState(SynchronizerState::Active);
    emit windowChanged();
}

void WindowSynchronizer::applyObservation(Generation generation, const Candle& candle) {
    if (generation != m_generation) {
        ++m_stats.rejectedGeneration;
        cLog_Data("Rejected observation from generation" << generation << "(current" << m_generation << ")");
        return;
    }
    if (m_state != SynchronizerState::Active || !m_accepting.load()) {
        ++m_stats.rejectedInactive;
        cLog_Data("Rejected observation while" << toString(m_state));
        return;
    }

    const MergeOutcome outcome = m_window->merge(candle);
    if (!changesWindow(outcome)) {
        ++m_stats.stale;
        cLog_DataN(5, "Stale observation t=" << candle.openTime << "behind last"
                   << m_window->last()->openTime << "[" << m_stats.stale << "stale total]");
        return;
    }
    switch (outcome) {
        case MergeOutcome::Replaced:
            ++m_stats.replaced;
            break;
        case MergeOutcome::AppendedWithEviction:
            ++m_stats.evicted;
            ++m_stats.appended;
            break;
        case MergeOutcome::Appended:
            ++m_stats.appended;
            break;
        case MergeOutcome::Stale:
            break;
    }

    cLog_Data("Merge" << toString(outcome) << QString::fromStdString(Cpp20Utils::formatCandleLog(candle))
              << "len" << m_window->size());
    emit windowChanged();
}

void WindowSynchronizer::doStop() {
    switch (m_state) {
        case SynchronizerState::Idle:
        case SynchronizerState::Stopping:
        case SynchronizerState::Stopped:
            cLog_App("stop() ignored in state" << toString(m_state));
            return;

        case SynchronizerState::Loading:
            // No connection yet; the pending snapshot is dropped by the state gate
            setState(SynchronizerState::Stopped);
            return;

        case SynchronizerState::Active: {
            m_retiring = std::move(m_feed);
            if (m_retiring) m_retiring->close();

            const Generation gen = m_generation;
            QTimer::singleShot(m_config.closeGrace, this, [this, gen]{
                if (m_state == SynchronizerState::Stopping && m_generation == gen) {
                    cLog_Warning("Live feed close not acknowledged within"
                                 << static_cast<qint64>(m_config.closeGrace.count()) << "ms; forcing stop");
                    finishStop();
                }
            });
            setState(SynchronizerState::Stopping);
            return;
        }
    }
}

void WindowSynchronizer::handleFeedClosed(Generation generation) {
    if (generation == m_generation && m_state == SynchronizerState::Stopping) {
        finishStop();
        return;
    }
    cLog_App("Close acknowledged for generation" << generation << "while" << toString(m_state));
}

void WindowSynchronizer::finishStop() {
    m_retiring.reset();
    setState(SynchronizerState::Stopped);
}

void WindowSynchronizer::handleConnectionLost(Generation generation, const QString& reason) {
    if (generation != m_generation || m_state != SynchronizerState::Active) {
        cLog_App("Ignoring connection loss from generation" << generation << "while" << toString(m_state));
        return;
    }

    ++m_stats.connectionLosses;
    m_accepting.store(false);
    m_retiring = std::move(m_feed);
    if (m_retiring) m_retiring->close();

    setState(SynchronizerState::Stopped);
    emit connectionLost(reason);
}
