/*
CandleSync — LiveFeedConsumer
Role: Owns one persistent kline websocket subscription and its I/O thread.
Inputs/Outputs: Takes a KlineStream + generation; emits one Candle observation per decodable frame.
Threading: Runs a Boost.Asio io_context on a dedicated worker thread; callbacks fire on that thread.
Performance: One JSON decode per frame; no allocation beyond the frame copy.
Integration: Created per generation by WindowSynchronizer through ILiveFeed; never reopened.
Observability: Logs connect/close/loss, throttled decode failures; counts frames and failures.
Related: LiveFeedConsumer.cpp, BeastWsTransport.hpp, KlineDecoder.hpp, ILiveFeed.hpp.
Assumptions: Callbacks are set before open() and outlive the I/O thread.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ssl/context.hpp>
#include "../sources/ILiveFeed.hpp"
#include "../ws/WsTransport.hpp"

namespace net = boost::asio;
namespace ssl = net::ssl;

class LiveFeedConsumer : public ILiveFeed {
public:
    // Upper bound the destructor waits for a posted close to reach the peer
    static constexpr std::chrono::milliseconds kCloseDrain{500};

    using TransportFactory = std::function<std::unique_ptr<WsTransport>(net::io_context&, ssl::context&)>;

    struct Endpoint {
        std::string host = "stream.binance.com";
        std::string port = "9443";
    };

    // An empty factory selects BeastWsTransport.
    explicit LiveFeedConsumer(Endpoint endpoint, TransportFactory factory = {});
    ~LiveFeedConsumer() override;

    void open(const KlineStream& stream, Generation generation) override;
    void close() override;

    void onObservation(ObservationCb cb) override { m_onObservation = std::move(cb); }
    void onConnectionLost(ConnectionLostCb cb) override { m_onConnectionLost = std::move(cb); }
    void onClosed(ClosedCb cb) override { m_onClosed = std::move(cb); }

    Generation    generation() const { return m_generation; }
    std::uint64_t framesReceived() const { return m_frames.load(std::memory_order_relaxed); }
    std::uint64_t decodeFailures() const { return m_decodeFailures.load(std::memory_order_relaxed); }

    // Non-copyable, non-movable (manages thread)
    LiveFeedConsumer(const LiveFeedConsumer&) = delete;
    LiveFeedConsumer& operator=(const LiveFeedConsumer&) = delete;
    LiveFeedConsumer(LiveFeedConsumer&&) = delete;
    LiveFeedConsumer& operator=(LiveFeedConsumer&&) = delete;

private:
    void run();
    void handleFrame(std::string payload);
    void handleStatus(bool up);
    void markIdle();

    Endpoint                        m_endpoint;
    TransportFactory                m_factory;
    std::string                     m_streamKey;
    Generation                      m_generation = 0;

    ObservationCb                   m_onObservation;
    ConnectionLostCb                m_onConnectionLost;
    ClosedCb                        m_onClosed;

    net::io_context                 m_ioc;
    ssl::context                    m_sslCtx{ssl::context::tlsv12_client};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::unique_ptr<WsTransport>    m_transport;
    std::thread                     m_ioThread;
    std::string                     m_lastError;   // I/O thread only

    std::atomic<bool>               m_opened{false};
    std::atomic<bool>               m_closing{false};
    std::atomic<bool>               m_finished{false};
    std::atomic<bool>               m_ioExited{false};
    std::mutex                      m_drainMutex;
    std::condition_variable         m_drainCv;
    std::atomic<std::uint64_t>      m_frames{0};
    std::atomic<std::uint64_t>      m_decodeFailures{0};
};
