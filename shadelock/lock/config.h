#ifndef SHADELOCK_CONFIG_H
#define SHADELOCK_CONFIG_H

#include <QColor>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace shadelock {

// Delay applied before forwarding a credential, keyed on how many checks in a
// row have come back negative.
struct BackoffPolicy {
    int threshold = 1;
    int baseMsec = 500;
    double factor = 2.0;
    int maxMsec = 30000;

    int delayFor(int consecutiveFailures) const;
};

struct FadeDefaults {
    double ceilingSeconds = 10.0;
    double maxCeilingSeconds = 30.0;
    double exponent = 1.0;
};

struct LockConfig {
    QString effectsDirectory;
    QString effectName;        // empty selects at random
    bool hasSeed = false;
    quint32 seed = 0;

    FadeDefaults fade;
    QColor fallbackColor = QColor(0, 0, 0);
    QString iconPath;          // empty draws no icon

    QString authService = QStringLiteral("system-auth");
    QString authBackend = QStringLiteral("pam");
    BackoffPolicy backoff;

    qint64 watchdogTimeoutMsec = 0;   // 0 disables the heartbeat

    bool verbose = false;
};

QString realHomePath();
QString defaultConfigPath();
QString defaultEffectsDirectory();
QString defaultIconPath();

// Defaults <- INI file <- environment. Bad values are logged and ignored.
LockConfig loadConfig(const QString &path, const QProcessEnvironment &env);

// Command-line flags override everything else. Returns false on a malformed
// flag; args excludes the program name.
bool applyArguments(LockConfig *config, const QStringList &args, QString *errorString);

} // namespace shadelock

#endif // SHADELOCK_CONFIG_H
