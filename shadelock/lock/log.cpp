#include "log.h"

Q_LOGGING_CATEGORY(lcSession,  "shadelock.session",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcEffects,  "shadelock.effects",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcOutputs,  "shadelock.outputs",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender,   "shadelock.render",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcAuth,     "shadelock.auth",     QtInfoMsg)
Q_LOGGING_CATEGORY(lcWatchdog, "shadelock.watchdog", QtInfoMsg)
Q_LOGGING_CATEGORY(lcConfig,   "shadelock.config",   QtInfoMsg)

namespace shadelock {

void installLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} "
        "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
        "%{if-critical}C%{endif}%{if-fatal}F%{endif} "
        "[%{category}] %{message}"));

    if (verbose)
        QLoggingCategory::setFilterRules(QStringLiteral("shadelock.*.debug=true"));
}

} // namespace shadelock
