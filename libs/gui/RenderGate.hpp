/*
CandleSync — RenderGate
Role: Turns bursts of windowChanged notifications into at most one draw per render interval.
Inputs/Outputs: Listens to WindowSynchronizer::windowChanged; hands a window copy to the draw callback.
Threading: Lives on the synchronizer's thread; the draw callback runs there too.
Performance: A burst of N merges costs one snapshot copy and one draw.
Integration: Constructed by the application next to the synchronizer; the draw callback is the surface.
Observability: Counts frames drawn and notifications coalesced; throttled render logs.
Related: RenderGate.cpp, WindowSynchronizer.hpp.
Assumptions: The synchronizer outlives the gate or is its parent.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>
#include <QElapsedTimer>
#include <QObject>
#include <QPointer>
#include "marketdata/model/CandleData.h"

class WindowSynchronizer;

class RenderGate : public QObject {
    Q_OBJECT

public:
    using DrawFn = std::function<void(const std::vector<Candle>&)>;

    RenderGate(WindowSynchronizer& sync, DrawFn draw,
               std::chrono::milliseconds interval = std::chrono::milliseconds{0},
               QObject* parent = nullptr);

    std::uint64_t framesDrawn() const { return m_framesDrawn; }
    std::uint64_t coalesced() const { return m_coalesced; }
    qint64        lastDrawMicros() const { return m_lastDrawMicros; }

public slots:
    void requestRedraw();

private:
    void flush();

    QPointer<WindowSynchronizer> m_sync;
    DrawFn                       m_draw;
    std::chrono::milliseconds    m_interval;
    bool                         m_pending = false;

    std::uint64_t                m_framesDrawn = 0;
    std::uint64_t                m_coalesced = 0;
    qint64                       m_lastDrawMicros = 0;
};
