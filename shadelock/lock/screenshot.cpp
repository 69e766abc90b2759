#include "screenshot.h"
#include "log.h"

#include <QImageReader>
#include <QPainter>

namespace shadelock {

QImage normalizeScreenshot(const QImage &captured, const QSize &outputSize)
{
    QSize size = outputSize.isValid() && !outputSize.isEmpty() ? outputSize : captured.size();
    if (size.isEmpty())
        size = QSize(1, 1);

    QImage source = captured.convertToFormat(QImage::Format_RGBX8888);
    if (source.size() == size)
        return source;

    qCDebug(lcOutputs) << "screenshot" << captured.size() << "does not match output" << size
                       << ", clipping/padding";

    QImage out(size, QImage::Format_RGBX8888);
    out.fill(QColor(0, 0, 0, 255));

    QPainter p(&out);
    p.setCompositionMode(QPainter::CompositionMode_Source);
    p.drawImage(QPoint(0, 0), source, QRect(QPoint(0, 0), size.boundedTo(source.size())));
    p.end();
    return out;
}

QImage fallbackScreenshot(const QSize &size, const QColor &color)
{
    QImage out(size.isEmpty() ? QSize(1, 1) : size, QImage::Format_RGBX8888);
    QColor opaque = color;
    opaque.setAlpha(255);
    out.fill(opaque);
    return out;
}

bool loadIcon(const QString &path, QImage *icon, QString *errorString)
{
    QImageReader reader(path);
    QImage image = reader.read();
    if (image.isNull()) {
        if (errorString)
            *errorString = QString("cannot read icon %1: %2").arg(path, reader.errorString());
        return false;
    }
    *icon = image.convertToFormat(QImage::Format_RGBA8888);
    return true;
}

} // namespace shadelock
