/*
CandleSync — RollingWindow
Role: Implements the merge policy (append / replace-forming / evict / discard-stale) and bulk seed.
Threading: Caller guarantees single-context access.
Observability: No internal logging.
*/
#include "RollingWindow.hpp"
#include <stdexcept>

RollingWindow::RollingWindow(std::size_t capacity)
    : m_capacity(capacity)
{
    if (m_capacity == 0) {
        throw std::invalid_argument("RollingWindow capacity must be at least 1");
    }
}

MergeOutcome RollingWindow::merge(const Candle& c) {
    if (m_candles.empty()) {
        m_candles.push_back(c);
        return MergeOutcome::Appended;
    }

    Candle& last = m_candles.back();
    if (c.openTime == last.openTime) {
        // Forming candle: last write wins
        last = c;
        return MergeOutcome::Replaced;
    }

    if (c.openTime < last.openTime) {
        return MergeOutcome::Stale;
    }

    m_candles.push_back(c);
    if (m_candles.size() > m_capacity) {
        m_candles.pop_front();
        return MergeOutcome::AppendedWithEviction;
    }
    return MergeOutcome::Appended;
}

SeedResult RollingWindow::seed(const std::vector<Candle>& ordered) {
    SeedResult result;
    std::deque<Candle> fresh;

    for (const auto& c : ordered) {
        if (!fresh.empty() && c.openTime <= fresh.back().openTime) {
            ++result.dropped;
            continue;
        }
        fresh.push_back(c);
        if (fresh.size() > m_capacity) {
            fresh.pop_front();
            ++result.truncated;
        }
    }

    m_candles.swap(fresh);
    result.kept = m_candles.size();
    return result;
}

std::optional<Candle> RollingWindow::last() const {
    if (m_candles.empty()) return std::nullopt;
    return m_candles.back();
}

std::optional<Candle> RollingWindow::first() const {
    if (m_candles.empty()) return std::nullopt;
    return m_candles.front();
}
