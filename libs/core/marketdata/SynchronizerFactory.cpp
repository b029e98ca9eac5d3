#include "SynchronizerFactory.hpp"
#include "WindowSynchronizer.hpp"
#include "live/LiveFeedConsumer.hpp"
#include "rest/BeastHttpTransport.hpp"
#include "rest/SnapshotLoader.hpp"

std::unique_ptr<WindowSynchronizer> makeBinanceSynchronizer(const SyncConfig& config, QObject* parent) {
    config.validate();

    SnapshotLoader::Endpoint rest;
    rest.host    = config.restHost;
    rest.port    = config.restPort;
    rest.path    = config.restPath;
    rest.timeout = config.fetchTimeout;

    auto snapshots = std::make_unique<SnapshotLoader>(std::make_shared<BeastHttpTransport>(), rest);

    LiveFeedConsumer::Endpoint stream{config.streamHost, config.streamPort};
    auto feeds = [stream]() -> std::unique_ptr<ILiveFeed> {
        return std::make_unique<LiveFeedConsumer>(stream);
    };

    return std::make_unique<WindowSynchronizer>(config, std::move(snapshots), std::move(feeds), parent);
}
