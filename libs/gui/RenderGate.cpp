#include "RenderGate.hpp"
#include "CandleSyncLogging.hpp"
#include "marketdata/WindowSynchronizer.hpp"
#include <QTimer>
#include <stdexcept>
#include <utility>

RenderGate::RenderGate(WindowSynchronizer& sync, DrawFn draw,
                       std::chrono::milliseconds interval, QObject* parent)
    : QObject(parent)
    , m_sync(&sync)
    , m_draw(std::move(draw))
    , m_interval(interval)
{
    if (!m_draw) {
        throw std::invalid_argument("RenderGate requires a draw callback");
    }
    connect(&sync, &WindowSynchronizer::windowChanged, this, &RenderGate::requestRedraw);
}

void RenderGate::requestRedraw() {
    if (m_pending) {
        ++m_coalesced;
        return;
    }
    m_pending = true;
    QTimer::singleShot(m_interval, this, &RenderGate::flush);
}

void RenderGate::flush() {
    m_pending = false;
    if (!m_sync) return;

    if (m_sync->state() != SynchronizerState::Active) {
        cLog_Render("Skipping draw while" << toString(m_sync->state()));
        return;
    }
    const std::vector<Candle> frame = m_sync->snapshot();
    if (frame.empty()) return;

    QElapsedTimer timer;
    timer.start();
    m_draw(frame);
    m_lastDrawMicros = timer.nsecsElapsed() / 1000;

    ++m_framesDrawn;
    cLog_Render("Frame" << m_framesDrawn << "len" << frame.size() << "draw" << m_lastDrawMicros << "us"
                << "coalesced" << m_coalesced);
}
