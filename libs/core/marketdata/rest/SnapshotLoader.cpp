#include "SnapshotLoader.hpp"
#include "CandleSyncLogging.hpp"
#include "../dispatch/Channels.hpp"
#include "../dispatch/KlineDecoder.hpp"
#include <QString>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

SnapshotLoader::SnapshotLoader(std::shared_ptr<HttpTransport> http, Endpoint endpoint)
    : m_http(std::move(http))
    , m_endpoint(std::move(endpoint))
{
    if (!m_http) {
        throw std::invalid_argument("SnapshotLoader requires an HttpTransport");
    }
}

SnapshotLoader::~SnapshotLoader() {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (auto& w : m_workers) {
        if (w.thread.joinable()) w.thread.join();
    }
    m_workers.clear();
}

void SnapshotLoader::reapFinished() {
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (it->done.load(std::memory_order_acquire)) {
            if (it->thread.joinable()) it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

void SnapshotLoader::fetch(const KlineRequest& request, Generation generation, ResultCb cb) {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    reapFinished();

    // std::list keeps the element address stable for the worker's done flag
    Worker& worker = m_workers.emplace_back();
    worker.thread = std::thread([this, request, generation, cb = std::move(cb), &worker]() {
        SnapshotResult result = load(request);
        if (cb) cb(generation, std::move(result));
        worker.done.store(true, std::memory_order_release);
    });
}

SnapshotResult SnapshotLoader::load(const KlineRequest& request) {
    SnapshotResult result;
    const std::string target = ch::klinesTarget(request, m_endpoint.path);
    cLog_App("Fetching snapshot" << QString::fromStdString(m_endpoint.host + target));

    try {
        HttpResponse response = m_http->get(m_endpoint.host, m_endpoint.port, target, m_endpoint.timeout);
        if (response.status < 200 || response.status >= 300) {
            throw TransportError(fmt::format("GET https://{}{} returned HTTP {}",
                                             m_endpoint.host, target, response.status));
        }
        result.candles = KlineDecoder::decodeSnapshot(response.body);
        cLog_App("Snapshot received:" << result.candles.size() << "candles");
    } catch (const TransportError& e) {
        result.candles.clear();
        result.error = SnapshotError::Transport;
        result.message = e.what();
    } catch (const DecodeError& e) {
        result.candles.clear();
        result.error = SnapshotError::Decode;
        result.message = e.what();
    } catch (const std::exception& e) {
        // Beast/asio may still surface system_error outside the transport's own checks
        result.candles.clear();
        result.error = SnapshotError::Transport;
        result.message = e.what();
    }

    if (!result.ok()) {
        cLog_Warning("Snapshot fetch failed (" << toString(result.error) << "):"
                     << QString::fromStdString(result.message));
    }
    return result;
}
