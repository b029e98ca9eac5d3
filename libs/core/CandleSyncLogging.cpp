#include "CandleSyncLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "candlesync.app")
Q_LOGGING_CATEGORY(logData, "candlesync.data")
Q_LOGGING_CATEGORY(logRender, "candlesync.render")
