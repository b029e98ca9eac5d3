/*
CandleSync — RollingWindow
Role: Bounded, strictly time-ordered, de-duplicated sequence of the most recent candles.
Inputs/Outputs: Accepts one candle per merge() or a whole ordered batch per seed(); yields copies.
Threading: Not thread-safe. Owned by exactly one context (WindowSynchronizer's thread).
Performance: merge() is O(1), including FIFO eviction; snapshot() is O(N).
Integration: Created and replaced by WindowSynchronizer; never handed out by reference.
Observability: Returns a MergeOutcome for every merge; the caller counts and logs.
Related: RollingWindow.cpp, WindowSynchronizer.hpp, CandleData.h.
Assumptions: Capacity is fixed at construction and is at least 1.
*/
#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include "../model/CandleData.h"

enum class MergeOutcome {
    Appended,              // empty window, or a newer bucket opened
    AppendedWithEviction,  // newer bucket opened on a full window; oldest dropped
    Replaced,              // same bucket, still forming: last element overwritten
    Stale                  // older than the last element: discarded
};

inline bool changesWindow(MergeOutcome o) noexcept { return o != MergeOutcome::Stale; }

inline const char* toString(MergeOutcome o) {
    switch (o) {
        case MergeOutcome::Appended:             return "appended";
        case MergeOutcome::AppendedWithEviction: return "appended+evicted";
        case MergeOutcome::Replaced:             return "replaced";
        case MergeOutcome::Stale:                return "stale";
    }
    return "unknown";
}

struct SeedResult {
    std::size_t kept = 0;       // candles now in the window
    std::size_t dropped = 0;    // non-increasing entries skipped
    std::size_t truncated = 0;  // oldest entries beyond capacity
};

class RollingWindow {
public:
    explicit RollingWindow(std::size_t capacity);

    // Invariants: size() <= capacity(); openTime strictly increasing front to back.
    MergeOutcome merge(const Candle& c);

    // Bulk replacement from an ordered snapshot, bypassing the per-candle policy.
    SeedResult seed(const std::vector<Candle>& ordered);

    [[nodiscard]] std::vector<Candle> snapshot() const { return {m_candles.begin(), m_candles.end()}; }
    [[nodiscard]] std::optional<Candle> last() const;
    [[nodiscard]] std::optional<Candle> first() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_candles.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool empty() const noexcept { return m_candles.empty(); }
    [[nodiscard]] bool full() const noexcept { return m_candles.size() == m_capacity; }

    RollingWindow(const RollingWindow&) = delete;
    RollingWindow& operator=(const RollingWindow&) = delete;

private:
    std::size_t        m_capacity;
    std::deque<Candle> m_candles;
};
