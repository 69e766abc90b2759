#ifndef SHADELOCK_LOG_H
#define SHADELOCK_LOG_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcEffects)
Q_DECLARE_LOGGING_CATEGORY(lcOutputs)
Q_DECLARE_LOGGING_CATEGORY(lcRender)
Q_DECLARE_LOGGING_CATEGORY(lcAuth)
Q_DECLARE_LOGGING_CATEGORY(lcWatchdog)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

namespace shadelock {

// Installs the message pattern and, when verbose, enables debug output for
// every shadelock.* category.
void installLogging(bool verbose);

} // namespace shadelock

#endif // SHADELOCK_LOG_H
