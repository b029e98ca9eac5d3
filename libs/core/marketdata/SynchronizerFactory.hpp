#pragma once
#include <memory>
#include <QObject>
#include "SyncConfig.hpp"

class WindowSynchronizer;

// Production wiring: SnapshotLoader over BeastHttpTransport for the seed,
// a fresh LiveFeedConsumer per generation for the stream.
std::unique_ptr<WindowSynchronizer> makeBinanceSynchronizer(const SyncConfig& config,
                                                            QObject* parent = nullptr);
