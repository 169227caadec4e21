#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTiming)
Q_DECLARE_LOGGING_CATEGORY(lcRender)
Q_DECLARE_LOGGING_CATEGORY(lcCapture)
Q_DECLARE_LOGGING_CATEGORY(lcEncoder)
Q_DECLARE_LOGGING_CATEGORY(lcPipeline)

namespace Logging {
    // Enables debug output for every karaokeforge.* category.
    void setVerbose(bool verbose);
}
