#include "../lock/screenshot.h"

#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace shadelock;

namespace {

TEST(ScreenshotTest, MatchingSizeKeepsPixels)
{
    QImage captured(8, 4, QImage::Format_ARGB32);
    captured.fill(QColor(10, 20, 30));
    captured.setPixelColor(7, 3, QColor(250, 0, 0));

    QImage out = normalizeScreenshot(captured, QSize(8, 4));
    EXPECT_EQ(out.format(), QImage::Format_RGBX8888);
    EXPECT_EQ(out.size(), QSize(8, 4));
    EXPECT_EQ(out.pixelColor(0, 0), QColor(10, 20, 30));
    EXPECT_EQ(out.pixelColor(7, 3), QColor(250, 0, 0));
}

TEST(ScreenshotTest, LargerCaptureIsClippedToTheTopLeft)
{
    QImage captured(6, 6, QImage::Format_RGB32);
    captured.fill(QColor(0, 0, 255));
    captured.setPixelColor(0, 0, QColor(255, 0, 0));
    captured.setPixelColor(2, 2, QColor(0, 255, 0));

    QImage out = normalizeScreenshot(captured, QSize(3, 3));
    ASSERT_EQ(out.size(), QSize(3, 3));
    EXPECT_EQ(out.pixelColor(0, 0), QColor(255, 0, 0));
    EXPECT_EQ(out.pixelColor(2, 2), QColor(0, 255, 0));
    EXPECT_EQ(out.pixelColor(1, 2), QColor(0, 0, 255));
}

TEST(ScreenshotTest, SmallerCaptureIsPaddedWithOpaqueBlack)
{
    QImage captured(2, 2, QImage::Format_RGB32);
    captured.fill(QColor(255, 255, 255));

    QImage out = normalizeScreenshot(captured, QSize(4, 3));
    ASSERT_EQ(out.size(), QSize(4, 3));
    EXPECT_EQ(out.pixelColor(1, 1), QColor(255, 255, 255));
    EXPECT_EQ(out.pixelColor(3, 2), QColor(0, 0, 0));
    EXPECT_EQ(out.pixelColor(2, 0).alpha(), 255);
}

TEST(ScreenshotTest, TranslucentCaptureBecomesOpaque)
{
    QImage captured(4, 4, QImage::Format_ARGB32);
    captured.fill(QColor(120, 60, 30, 0));

    QImage out = normalizeScreenshot(captured, QSize(4, 4));
    for (int y = 0; y < out.height(); ++y) {
        for (int x = 0; x < out.width(); ++x)
            ASSERT_EQ(out.pixelColor(x, y).alpha(), 255);
    }
}

TEST(ScreenshotTest, FallbackIsOpaqueSolidColor)
{
    QImage out = fallbackScreenshot(QSize(5, 2), QColor(40, 50, 60, 10));
    EXPECT_EQ(out.format(), QImage::Format_RGBX8888);
    EXPECT_EQ(out.size(), QSize(5, 2));
    EXPECT_EQ(out.pixelColor(4, 1), QColor(40, 50, 60));

    EXPECT_FALSE(fallbackScreenshot(QSize(), Qt::black).isNull());
}

TEST(IconTest, LoadsWithStraightAlpha)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QImage source(6, 4, QImage::Format_ARGB32);
    source.fill(Qt::transparent);
    source.setPixelColor(2, 1, QColor(255, 255, 255, 128));
    const QString path = dir.filePath("icon.png");
    ASSERT_TRUE(source.save(path, "PNG"));

    QImage icon;
    QString error;
    ASSERT_TRUE(loadIcon(path, &icon, &error)) << error.toStdString();
    EXPECT_EQ(icon.format(), QImage::Format_RGBA8888);
    EXPECT_EQ(icon.size(), QSize(6, 4));
    EXPECT_EQ(icon.pixelColor(0, 0).alpha(), 0);
    EXPECT_EQ(icon.pixelColor(2, 1), QColor(255, 255, 255, 128));
}

TEST(IconTest, UnreadableFileIsReported)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QImage icon(1, 1, QImage::Format_RGBA8888);
    QString error;
    EXPECT_FALSE(loadIcon(dir.filePath("missing.png"), &icon, &error));
    EXPECT_TRUE(error.contains("missing.png"));
    EXPECT_EQ(icon.size(), QSize(1, 1));
}

TEST(IconTest, ShippedIconLoads)
{
    QImage icon;
    QString error;
    ASSERT_TRUE(loadIcon(QStringLiteral(SHADELOCK_SOURCE_DATA_DIR "/lock.png"), &icon, &error))
        << error.toStdString();
    EXPECT_EQ(icon.size(), QSize(64, 64));
    EXPECT_EQ(icon.pixelColor(0, 0).alpha(), 0);
    EXPECT_GT(icon.pixelColor(20, 50).alpha(), 0);
}

} // namespace
