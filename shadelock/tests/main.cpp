#include <QCoreApplication>

#include <gtest/gtest.h>

// Queued signals, timers and QFutureWatcher need a live application object.
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
