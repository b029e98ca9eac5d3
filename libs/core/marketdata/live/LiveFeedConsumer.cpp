/*
CandleSync — LiveFeedConsumer
Role: Decodes inbound kline frames and reports connection-level events for one generation.
Threading: open()/close() may be called from any thread; all transport work is posted to the I/O thread.
Observability: Connection lifecycle at app level; per-frame faults throttled at data level.
*/
#include "LiveFeedConsumer.hpp"
#include "CandleSyncLogging.hpp"
#include "../dispatch/Channels.hpp"
#include "../dispatch/KlineDecoder.hpp"
#include "../ws/BeastWsTransport.hpp"
#include <boost/asio/post.hpp>
#include <QString>
#include <stdexcept>
#include <utility>

LiveFeedConsumer::LiveFeedConsumer(Endpoint endpoint, TransportFactory factory)
    : m_endpoint(std::move(endpoint))
    , m_factory(std::move(factory))
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);

    if (!m_factory) {
        m_factory = [](net::io_context& ioc, ssl::context& ctx) -> std::unique_ptr<WsTransport> {
            return std::make_unique<BeastWsTransport>(ioc, ctx);
        };
    }
}

LiveFeedConsumer::~LiveFeedConsumer() {
    close();
    if (m_ioThread.joinable()) {
        // Give the posted close a chance to run before the loop is torn down
        std::unique_lock<std::mutex> lock(m_drainMutex);
        if (!m_drainCv.wait_for(lock, kCloseDrain, [this]{ return m_finished.load() || m_ioExited.load(); })) {
            cLog_Warning("Live feed close did not drain within" << kCloseDrain.count() << "ms:"
                         << QString::fromStdString(m_streamKey));
        }
    }
    m_ioc.stop();
    if (m_ioThread.joinable()) {
        m_ioThread.join();
    }
}

void LiveFeedConsumer::open(const KlineStream& stream, Generation generation) {
    if (m_opened.exchange(true)) {
        throw std::logic_error("LiveFeedConsumer::open called twice; create a new consumer per generation");
    }

    m_generation = generation;
    m_streamKey = ch::streamKey(stream);
    const std::string target = ch::streamTarget(stream);

    m_transport = m_factory(m_ioc, m_sslCtx);
    m_transport->onMessage([this](std::string payload){ handleFrame(std::move(payload)); });
    m_transport->onStatus([this](bool up){ handleStatus(up); });
    m_transport->onError([this](std::string err){
        m_lastError = std::move(err);
        cLog_Warning("Live feed error" << QString::fromStdString(m_streamKey) << ":"
                     << QString::fromStdString(m_lastError));
    });

    cLog_App("Opening live feed" << QString::fromStdString(m_endpoint.host + ":" + m_endpoint.port + target)
             << "generation" << generation);

    m_workGuard.emplace(m_ioc.get_executor());
    m_ioThread = std::thread(&LiveFeedConsumer::run, this);

    net::post(m_ioc, [this, target]{
        if (m_closing.load()) {
            handleStatus(false);
            return;
        }
        m_transport->connect(m_endpoint.host, m_endpoint.port, target);
    });
}

void LiveFeedConsumer::close() {
    if (m_closing.exchange(true)) return;
    if (!m_opened.load()) return;

    cLog_App("Closing live feed" << QString::fromStdString(m_streamKey) << "generation" << m_generation);
    net::post(m_ioc, [this]{
        m_transport->close();
        m_workGuard.reset();
    });
}

void LiveFeedConsumer::run() {
    try {
        m_ioc.run();
    } catch (const std::exception& e) {
        m_lastError = e.what();
        cLog_Error("Live feed I/O loop aborted:" << e.what());
        handleStatus(false);
    }
    cLog_Data("Live feed I/O loop exited for generation" << m_generation);
    m_ioExited.store(true);
    markIdle();
}

void LiveFeedConsumer::markIdle() {
    std::lock_guard<std::mutex> lock(m_drainMutex);
    m_drainCv.notify_all();
}

void LiveFeedConsumer::handleFrame(std::string payload) {
    m_frames.fetch_add(1, std::memory_order_relaxed);
    if (m_closing.load(std::memory_order_acquire)) return;

    Candle candle;
    try {
        candle = KlineDecoder::decodeLiveFrame(payload);
    } catch (const DecodeError& e) {
        const auto failures = m_decodeFailures.fetch_add(1, std::memory_order_relaxed) + 1;
        cLog_DataN(10, "Dropped undecodable frame (" << failures << "total):" << e.what());
        return;
    }

    cLog_Data("Kline" << QString::fromStdString(m_streamKey) << "t=" << candle.openTime
              << "c=" << candle.close);
    if (m_onObservation) m_onObservation(m_generation, candle);
}

void LiveFeedConsumer::handleStatus(bool up) {
    if (up) {
        cLog_App("Live feed connected:" << QString::fromStdString(m_streamKey));
        return;
    }

    if (m_finished.exchange(true)) return;
    m_workGuard.reset();

    if (m_closing.load()) {
        cLog_App("Live feed closed:" << QString::fromStdString(m_streamKey));
        if (m_onClosed) m_onClosed(m_generation);
    } else {
        std::string reason = m_lastError.empty() ? std::string{"connection closed by peer"} : m_lastError;
        cLog_Warning("Live feed lost:" << QString::fromStdString(m_streamKey) << "-"
                     << QString::fromStdString(reason));
        if (m_onConnectionLost) m_onConnectionLost(m_generation, std::move(reason));
    }
    markIdle();
}
