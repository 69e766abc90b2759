#include "config.h"
#include "log.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include <pwd.h>
#include <unistd.h>

#include <cmath>

#ifndef SHADELOCK_DATADIR
#define SHADELOCK_DATADIR "/usr/local/share/shadelock"
#endif

namespace shadelock {

int BackoffPolicy::delayFor(int consecutiveFailures) const
{
    if (consecutiveFailures < threshold || baseMsec <= 0)
        return 0;

    double delay = baseMsec * std::pow(factor, consecutiveFailures - threshold);
    if (delay > maxMsec)
        return maxMsec;
    return int(delay);
}

QString realHomePath()
{
    QByteArray homeEnv = qgetenv("HOME");
    if (!homeEnv.isEmpty()) {
        QString h = QString::fromUtf8(homeEnv).trimmed();
        if (!h.isEmpty() && QFileInfo(h).isDir())
            return h;
    }

    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        QString h = QString::fromUtf8(pw->pw_dir).trimmed();
        if (!h.isEmpty() && QFileInfo(h).isDir())
            return h;
    }

    return QDir::homePath();
}

QString defaultConfigPath()
{
    return realHomePath() + "/.config/shadelock/shadelock.conf";
}

QString defaultEffectsDirectory()
{
    return QStringLiteral(SHADELOCK_DATADIR "/effects");
}

QString defaultIconPath()
{
    return QStringLiteral(SHADELOCK_DATADIR "/lock.png");
}

namespace {

double readPositive(QSettings &s, const char *key, double fallback)
{
    if (!s.contains(key))
        return fallback;
    bool ok = false;
    double v = s.value(key).toDouble(&ok);
    if (!ok || v <= 0.0 || !std::isfinite(v)) {
        qCWarning(lcConfig) << "ignoring invalid value for" << key << ":" << s.value(key).toString();
        return fallback;
    }
    return v;
}

int readInt(QSettings &s, const char *key, int fallback, int minimum)
{
    if (!s.contains(key))
        return fallback;
    bool ok = false;
    int v = s.value(key).toInt(&ok);
    if (!ok || v < minimum) {
        qCWarning(lcConfig) << "ignoring invalid value for" << key << ":" << s.value(key).toString();
        return fallback;
    }
    return v;
}

} // namespace

LockConfig loadConfig(const QString &path, const QProcessEnvironment &env)
{
    LockConfig c;
    c.effectsDirectory = defaultEffectsDirectory();
    c.iconPath = defaultIconPath();

    if (!path.isEmpty() && QFile::exists(path)) {
        QSettings s(path, QSettings::IniFormat);
        if (s.status() != QSettings::NoError) {
            qCWarning(lcConfig) << "could not parse" << path << ", using defaults";
        } else {
            qCDebug(lcConfig) << "reading" << path;

            s.beginGroup("Effects");
            if (s.contains("Directory"))
                c.effectsDirectory = s.value("Directory").toString().trimmed();
            c.effectName = s.value("Name").toString().trimmed();
            if (s.contains("Seed")) {
                bool ok = false;
                quint32 seed = s.value("Seed").toUInt(&ok);
                if (ok) {
                    c.hasSeed = true;
                    c.seed = seed;
                } else {
                    qCWarning(lcConfig) << "ignoring invalid Effects/Seed";
                }
            }
            c.fade.ceilingSeconds = readPositive(s, "FadeCeiling", c.fade.ceilingSeconds);
            c.fade.maxCeilingSeconds = readPositive(s, "MaxFadeCeiling", c.fade.maxCeilingSeconds);
            c.fade.exponent = readPositive(s, "FadeExponent", c.fade.exponent);
            s.endGroup();

            s.beginGroup("Display");
            if (s.contains("FallbackColor")) {
                QColor color(s.value("FallbackColor").toString());
                if (color.isValid())
                    c.fallbackColor = color;
                else
                    qCWarning(lcConfig) << "ignoring invalid Display/FallbackColor";
            }
            if (s.contains("Icon"))
                c.iconPath = s.value("Icon").toString().trimmed();
            s.endGroup();

            s.beginGroup("Auth");
            if (s.contains("Service"))
                c.authService = s.value("Service").toString().trimmed();
            if (s.contains("Backend")) {
                QString backend = s.value("Backend").toString().trimmed().toLower();
                if (backend == "pam" || backend == "null")
                    c.authBackend = backend;
                else
                    qCWarning(lcConfig) << "unknown Auth/Backend" << backend << ", keeping pam";
            }
            c.backoff.threshold = readInt(s, "BackoffThreshold", c.backoff.threshold, 0);
            c.backoff.baseMsec = readInt(s, "BackoffBaseMsec", c.backoff.baseMsec, 1);
            c.backoff.factor = readPositive(s, "BackoffFactor", c.backoff.factor);
            c.backoff.maxMsec = readInt(s, "BackoffMaxMsec", c.backoff.maxMsec, 1);
            s.endGroup();

            // Every further failure must wait strictly longer until the cap.
            const BackoffPolicy defaults;
            if (c.backoff.factor <= 1.0) {
                qCWarning(lcConfig) << "Auth/BackoffFactor must be greater than 1, using"
                                    << defaults.factor;
                c.backoff.factor = defaults.factor;
            }
            if (c.backoff.maxMsec < c.backoff.baseMsec) {
                qCWarning(lcConfig) << "Auth/BackoffMaxMsec is below Auth/BackoffBaseMsec, using"
                                    << defaults.baseMsec << "/" << defaults.maxMsec;
                c.backoff.baseMsec = defaults.baseMsec;
                c.backoff.maxMsec = defaults.maxMsec;
            }

            s.beginGroup("Watchdog");
            c.watchdogTimeoutMsec = readInt(s, "TimeoutMsec", 0, 0);
            s.endGroup();
        }
    }

    if (c.fade.ceilingSeconds > c.fade.maxCeilingSeconds) {
        qCWarning(lcConfig) << "FadeCeiling exceeds MaxFadeCeiling, clamping";
        c.fade.ceilingSeconds = c.fade.maxCeilingSeconds;
    }

    QString effectsEnv = env.value("SHADELOCK_EFFECTS_DIR");
    if (!effectsEnv.isEmpty())
        c.effectsDirectory = effectsEnv;

    if (env.contains("SHADELOCK_ICON"))
        c.iconPath = env.value("SHADELOCK_ICON").trimmed();

    QString serviceEnv = env.value("SHADELOCK_PAM_SERVICE");
    if (!serviceEnv.isEmpty())
        c.authService = serviceEnv;

    if (env.contains("WATCHDOG_USEC")) {
        bool pidOk = true;
        if (env.contains("WATCHDOG_PID"))
            pidOk = env.value("WATCHDOG_PID").toLongLong() == qint64(getpid());

        bool ok = false;
        qint64 usec = env.value("WATCHDOG_USEC").toLongLong(&ok);
        if (!pidOk)
            qCDebug(lcConfig) << "WATCHDOG_PID names another process, ignoring WATCHDOG_USEC";
        else if (!ok || usec <= 0)
            qCWarning(lcConfig) << "ignoring invalid WATCHDOG_USEC";
        else
            c.watchdogTimeoutMsec = qMax<qint64>(1, usec / 1000);
    }

    return c;
}

bool applyArguments(LockConfig *config, const QStringList &args, QString *errorString)
{
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);

        if (arg == "--verbose" || arg == "-v") {
            config->verbose = true;
            continue;
        }

        if (arg != "--effects" && arg != "--effect" && arg != "--seed" && arg != "--icon") {
            if (errorString)
                *errorString = QString("unknown argument %1").arg(arg);
            return false;
        }

        if (i + 1 >= args.size()) {
            if (errorString)
                *errorString = QString("%1 needs a value").arg(arg);
            return false;
        }
        QString value = args.at(++i);

        if (arg == "--effects") {
            config->effectsDirectory = value;
        } else if (arg == "--effect") {
            config->effectName = value;
        } else if (arg == "--icon") {
            config->iconPath = value;
        } else {
            bool ok = false;
            quint32 seed = value.toUInt(&ok);
            if (!ok) {
                if (errorString)
                    *errorString = QString("invalid seed %1").arg(value);
                return false;
            }
            config->hasSeed = true;
            config->seed = seed;
        }
    }
    return true;
}

} // namespace shadelock
