#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

// Exponential reconnect delay with jitter: 1s, 2s, 4s ... capped at 60s, plus 0-250ms.
// reset() after a generation reaches Active.
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(std::chrono::seconds initial = std::chrono::seconds(1),
                              std::chrono::seconds max = std::chrono::seconds(60),
                              std::uint32_t seed = std::random_device{}())
        : m_initial(initial), m_max(max), m_current(initial), m_gen(seed) {}

    std::chrono::milliseconds next() {
        std::uniform_int_distribution<int> jitter(0, kMaxJitterMs);
        const auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(m_current)
                         + std::chrono::milliseconds(jitter(m_gen));
        m_current = std::min(m_current * 2, m_max);
        ++m_attempts;
        return delay;
    }

    void reset() {
        m_current = m_initial;
        m_attempts = 0;
    }

    std::chrono::seconds current() const { return m_current; }
    int attempts() const { return m_attempts; }

    static constexpr int kMaxJitterMs = 250;

private:
    std::chrono::seconds m_initial;
    std::chrono::seconds m_max;
    std::chrono::seconds m_current;
    int                  m_attempts = 0;
    std::mt19937         m_gen;
};
