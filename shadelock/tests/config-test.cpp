#include "test-support.h"
#include "../lock/config.h"

#include <QTemporaryDir>

#include <unistd.h>

#include <gtest/gtest.h>

using namespace shadelock;
using namespace shadelock::test;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    QString write(const QByteArray &content, const QString &name = QStringLiteral("shadelock.conf"))
    {
        const QString path = dir.filePath(name);
        EXPECT_TRUE(writeFile(path, content));
        return path;
    }

    QTemporaryDir dir;
    QProcessEnvironment env;
};

TEST_F(ConfigTest, DefaultsWithoutAFile)
{
    LockConfig c = loadConfig(dir.filePath("absent.conf"), env);
    EXPECT_EQ(c.effectsDirectory, defaultEffectsDirectory());
    EXPECT_TRUE(c.effectName.isEmpty());
    EXPECT_FALSE(c.hasSeed);
    EXPECT_DOUBLE_EQ(c.fade.ceilingSeconds, 10.0);
    EXPECT_DOUBLE_EQ(c.fade.maxCeilingSeconds, 30.0);
    EXPECT_EQ(c.fallbackColor, QColor(0, 0, 0));
    EXPECT_EQ(c.iconPath, defaultIconPath());
    EXPECT_EQ(c.authService, QString("system-auth"));
    EXPECT_EQ(c.authBackend, QString("pam"));
    EXPECT_EQ(c.backoff.baseMsec, 500);
    EXPECT_EQ(c.watchdogTimeoutMsec, 0);
    EXPECT_FALSE(c.verbose);
}

TEST_F(ConfigTest, ReadsEveryGroup)
{
    const QString path = write("[Effects]\n"
                               "Directory=/opt/effects\n"
                               "Name=ripple\n"
                               "Seed=1234\n"
                               "FadeCeiling=6\n"
                               "MaxFadeCeiling=20\n"
                               "FadeExponent=1.5\n"
                               "[Display]\n"
                               "FallbackColor=#102030\n"
                               "[Auth]\n"
                               "Service=login\n"
                               "Backend=null\n"
                               "BackoffThreshold=3\n"
                               "BackoffBaseMsec=250\n"
                               "BackoffFactor=3\n"
                               "BackoffMaxMsec=9000\n"
                               "[Watchdog]\n"
                               "TimeoutMsec=15000\n");

    LockConfig c = loadConfig(path, env);
    EXPECT_EQ(c.effectsDirectory, QString("/opt/effects"));
    EXPECT_EQ(c.effectName, QString("ripple"));
    EXPECT_TRUE(c.hasSeed);
    EXPECT_EQ(c.seed, 1234u);
    EXPECT_DOUBLE_EQ(c.fade.ceilingSeconds, 6.0);
    EXPECT_DOUBLE_EQ(c.fade.maxCeilingSeconds, 20.0);
    EXPECT_DOUBLE_EQ(c.fade.exponent, 1.5);
    EXPECT_EQ(c.fallbackColor, QColor(0x10, 0x20, 0x30));
    EXPECT_EQ(c.authService, QString("login"));
    EXPECT_EQ(c.authBackend, QString("null"));
    EXPECT_EQ(c.backoff.threshold, 3);
    EXPECT_EQ(c.backoff.baseMsec, 250);
    EXPECT_DOUBLE_EQ(c.backoff.factor, 3.0);
    EXPECT_EQ(c.backoff.maxMsec, 9000);
    EXPECT_EQ(c.watchdogTimeoutMsec, 15000);
}

TEST_F(ConfigTest, BadValuesFallBackToDefaults)
{
    const QString path = write("[Effects]\n"
                               "Seed=banana\n"
                               "FadeCeiling=-1\n"
                               "FadeExponent=0\n"
                               "[Display]\n"
                               "FallbackColor=notacolour\n"
                               "[Auth]\n"
                               "Backend=kerberos\n"
                               "BackoffBaseMsec=-10\n"
                               "BackoffFactor=zero\n");

    LockConfig c = loadConfig(path, env);
    EXPECT_FALSE(c.hasSeed);
    EXPECT_DOUBLE_EQ(c.fade.ceilingSeconds, 10.0);
    EXPECT_DOUBLE_EQ(c.fade.exponent, 1.0);
    EXPECT_EQ(c.fallbackColor, QColor(0, 0, 0));
    EXPECT_EQ(c.authBackend, QString("pam"));
    EXPECT_EQ(c.backoff.baseMsec, 500);
    EXPECT_DOUBLE_EQ(c.backoff.factor, 2.0);
}

TEST_F(ConfigTest, BackoffFactorMustGrowTheDelay)
{
    for (const char *factor : {"0.5", "1.0", "1"}) {
        LockConfig c = loadConfig(write(QByteArray("[Auth]\nBackoffFactor=") + factor + "\n",
                                        QString("factor-%1.conf").arg(factor)), env);
        EXPECT_DOUBLE_EQ(c.backoff.factor, 2.0) << factor;
        EXPECT_LT(c.backoff.delayFor(1), c.backoff.delayFor(2)) << factor;
    }

    LockConfig c = loadConfig(write("[Auth]\nBackoffFactor=1.5\n", "growing.conf"), env);
    EXPECT_DOUBLE_EQ(c.backoff.factor, 1.5);
}

TEST_F(ConfigTest, BackoffCapCannotUndercutTheBase)
{
    LockConfig zero = loadConfig(write("[Auth]\nBackoffMaxMsec=0\n", "zero.conf"), env);
    EXPECT_EQ(zero.backoff.maxMsec, 30000);
    EXPECT_EQ(zero.backoff.delayFor(1), 500);

    LockConfig below = loadConfig(write("[Auth]\nBackoffBaseMsec=4000\nBackoffMaxMsec=1000\n", "below.conf"),
                                  env);
    EXPECT_EQ(below.backoff.baseMsec, 500);
    EXPECT_EQ(below.backoff.maxMsec, 30000);

    LockConfig equal = loadConfig(write("[Auth]\nBackoffBaseMsec=1000\nBackoffMaxMsec=1000\n", "equal.conf"),
                                  env);
    EXPECT_EQ(equal.backoff.baseMsec, 1000);
    EXPECT_EQ(equal.backoff.maxMsec, 1000);

    LockConfig off = loadConfig(write("[Auth]\nBackoffBaseMsec=0\n", "off.conf"), env);
    EXPECT_EQ(off.backoff.baseMsec, 500);
}

TEST_F(ConfigTest, FadeCeilingIsClampedToTheMaximum)
{
    LockConfig c = loadConfig(write("[Effects]\nFadeCeiling=90\nMaxFadeCeiling=25\n"), env);
    EXPECT_DOUBLE_EQ(c.fade.ceilingSeconds, 25.0);
}

TEST_F(ConfigTest, EnvironmentOverridesTheFile)
{
    const QString path = write("[Effects]\nDirectory=/from/file\n[Auth]\nService=login\n");
    env.insert("SHADELOCK_EFFECTS_DIR", "/from/env");
    env.insert("SHADELOCK_PAM_SERVICE", "screensaver");

    LockConfig c = loadConfig(path, env);
    EXPECT_EQ(c.effectsDirectory, QString("/from/env"));
    EXPECT_EQ(c.authService, QString("screensaver"));
}

TEST_F(ConfigTest, IconCanBeReplacedOrDisabled)
{
    LockConfig custom = loadConfig(write("[Display]\nIcon=/opt/padlock.png\n", "icon.conf"), env);
    EXPECT_EQ(custom.iconPath, QString("/opt/padlock.png"));

    LockConfig none = loadConfig(write("[Display]\nIcon=\n", "no-icon.conf"), env);
    EXPECT_TRUE(none.iconPath.isEmpty());

    env.insert("SHADELOCK_ICON", "/from/env.png");
    EXPECT_EQ(loadConfig(dir.filePath("absent.conf"), env).iconPath, QString("/from/env.png"));
}

TEST_F(ConfigTest, WatchdogEnvironmentHonoursThePid)
{
    env.insert("WATCHDOG_USEC", "6000000");
    EXPECT_EQ(loadConfig(QString(), env).watchdogTimeoutMsec, 6000);

    env.insert("WATCHDOG_PID", QString::number(getpid()));
    EXPECT_EQ(loadConfig(QString(), env).watchdogTimeoutMsec, 6000);

    env.insert("WATCHDOG_PID", QString::number(getpid() + 1));
    EXPECT_EQ(loadConfig(QString(), env).watchdogTimeoutMsec, 0);

    env.remove("WATCHDOG_PID");
    env.insert("WATCHDOG_USEC", "soon");
    EXPECT_EQ(loadConfig(QString(), env).watchdogTimeoutMsec, 0);
}

TEST(ArgumentsTest, FlagsOverrideConfiguration)
{
    LockConfig c;
    QString error;
    ASSERT_TRUE(applyArguments(&c, QStringList() << "--effects" << "/tmp/fx" << "--effect" << "blur"
                                                 << "--seed" << "77" << "--icon" << "/tmp/lock.png"
                                                 << "-v", &error))
        << error.toStdString();
    EXPECT_EQ(c.effectsDirectory, QString("/tmp/fx"));
    EXPECT_EQ(c.effectName, QString("blur"));
    EXPECT_TRUE(c.hasSeed);
    EXPECT_EQ(c.seed, 77u);
    EXPECT_EQ(c.iconPath, QString("/tmp/lock.png"));
    EXPECT_TRUE(c.verbose);
}

TEST(ArgumentsTest, MalformedFlagsAreRejected)
{
    LockConfig c;
    QString error;

    EXPECT_FALSE(applyArguments(&c, QStringList() << "--unlock-now", &error));
    EXPECT_TRUE(error.contains("--unlock-now"));

    EXPECT_FALSE(applyArguments(&c, QStringList() << "--effect", &error));
    EXPECT_TRUE(error.contains("needs a value"));

    EXPECT_FALSE(applyArguments(&c, QStringList() << "--seed" << "-3", &error));
    EXPECT_TRUE(error.contains("seed"));
    EXPECT_FALSE(c.hasSeed);

    EXPECT_TRUE(applyArguments(&c, QStringList(), &error));
}

} // namespace
