#include "RelayLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "relay.app")       // Application: session lifecycle, config, pause/resume
Q_LOGGING_CATEGORY(logData, "relay.data")     // Data: sockets, frames, queue flush, subscription replay
Q_LOGGING_CATEGORY(logDebug, "relay.debug", QtWarningMsg)  // Debug: disabled unless enabled via QT_LOGGING_RULES
