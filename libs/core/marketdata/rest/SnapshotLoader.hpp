/*
CandleSync — SnapshotLoader
Role: One-shot historical kline fetch that seeds a RollingWindow.
Inputs/Outputs: Takes a KlineRequest + generation; reports a SnapshotResult through the callback.
Threading: Every fetch() runs on its own worker thread; the callback fires on that worker.
Performance: Blocking I/O confined to the worker; the caller's thread never waits.
Integration: Owned by WindowSynchronizer through ISnapshotSource, which marshals the result.
Observability: Logs request targets, result sizes and failures via CandleSyncLogging.
Related: SnapshotLoader.cpp, HttpTransport.hpp, KlineDecoder.hpp, ISnapshotSource.hpp.
Assumptions: The HttpTransport outlives this object and is safe to call from several workers.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "../sources/ISnapshotSource.hpp"
#include "HttpTransport.hpp"

class SnapshotLoader : public ISnapshotSource {
public:
    struct Endpoint {
        std::string host = "api.binance.com";
        std::string port = "443";
        std::string path = "/api/v3/klines";
        std::chrono::seconds timeout{5};
    };

    SnapshotLoader(std::shared_ptr<HttpTransport> http, Endpoint endpoint);
    ~SnapshotLoader() override;

    void fetch(const KlineRequest& request, Generation generation, ResultCb cb) override;

    // Synchronous body of a fetch; exposed for tests. Never throws.
    SnapshotResult load(const KlineRequest& request);

    SnapshotLoader(const SnapshotLoader&) = delete;
    SnapshotLoader& operator=(const SnapshotLoader&) = delete;

private:
    struct Worker {
        std::thread       thread;
        std::atomic<bool> done{false};
    };

    void reapFinished();

    std::shared_ptr<HttpTransport> m_http;
    Endpoint                       m_endpoint;

    std::mutex                     m_workersMutex;
    std::list<Worker>              m_workers;
};
