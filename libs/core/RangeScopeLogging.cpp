#include "RangeScopeLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "rangescope.app")         // Application: init, lifecycle, config
Q_LOGGING_CATEGORY(logData, "rangescope.data")       // Data: HTTP calls, stage transitions, parsing
Q_LOGGING_CATEGORY(logRender, "rangescope.render")   // Render: chart painting, viewport changes
Q_LOGGING_CATEGORY(logDebug, "rangescope.debug", QtWarningMsg)
