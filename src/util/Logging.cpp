#include "Logging.h"

Q_LOGGING_CATEGORY(lcTiming, "karaokeforge.timing", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "karaokeforge.render", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCapture, "karaokeforge.capture", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEncoder, "karaokeforge.encoder", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPipeline, "karaokeforge.pipeline", QtInfoMsg)

namespace Logging {

void setVerbose(bool verbose) {
    if (verbose)
        QLoggingCategory::setFilterRules(QStringLiteral("karaokeforge.*.debug=true"));
    else
        QLoggingCategory::setFilterRules(QStringLiteral("karaokeforge.*.debug=false"));
}

} // namespace Logging
