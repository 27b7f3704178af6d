#include "preview/previewrenderer.h"

#include <QFileInfo>
#include <QImageReader>
#include <QPainter>
#include <QtMath>
#include <QDebug>

PreviewRenderer::PreviewRenderer(const QString& root, CropAnchor anchor)
    : m_root(root), m_anchor(anchor)
{
}

PreviewRenderer::CropAnchor PreviewRenderer::anchorFromString(const QString& name)
{
    if (name.trimmed().compare("center", Qt::CaseInsensitive) == 0) return CropAnchor::Center;
    return CropAnchor::Top;
}

QString PreviewRenderer::anchorToString(CropAnchor anchor)
{
    return anchor == CropAnchor::Center ? QStringLiteral("center") : QStringLiteral("top");
}

QString PreviewRenderer::resolve(const QString& imageRef) const
{
    if (imageRef.isEmpty()) return QString();
    if (imageRef.startsWith(":/") || QFileInfo(imageRef).isAbsolute()) return imageRef;
    if (m_root.isEmpty()) return imageRef;
    if (m_root.endsWith('/')) return m_root + imageRef;
    return m_root + '/' + imageRef;
}

QImage PreviewRenderer::coverCrop(const QImage& source, int width, int height, CropAnchor anchor)
{
    const int tw = qMax(1, width);
    const int th = qMax(1, height);
    if (source.isNull()) return placeholder(tw, th);

    // KeepAspectRatioByExpanding: scale = max(tw/iw, th/ih)
    const QImage scaled = source.scaled(tw, th, Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation);

    const int x = scaled.width() > tw ? (scaled.width() - tw) / 2 : 0;
    int y = 0;
    if (anchor == CropAnchor::Center && scaled.height() > th) {
        y = (scaled.height() - th) / 2;
    }
    return scaled.copy(x, y, tw, th);
}

QImage PreviewRenderer::placeholder(int width, int height)
{
    QImage img(qMax(1, width), qMax(1, height), QImage::Format_ARGB32_Premultiplied);
    img.fill(QColor(90, 90, 90));

    QPainter p(&img);
    p.setRenderHint(QPainter::Antialiasing);
    p.setPen(QPen(QColor(130, 130, 130), 1));
    p.drawRect(img.rect().adjusted(0, 0, -1, -1));
    p.drawLine(0, 0, img.width() - 1, img.height() - 1);
    p.drawLine(0, img.height() - 1, img.width() - 1, 0);
    p.end();
    return img;
}

QImage PreviewRenderer::renderImage(const QString& imageRef, int targetWidth, int targetHeight,
                                    qreal devicePixelRatio) const
{
    const qreal dpr = devicePixelRatio > 0.0 ? devicePixelRatio : 1.0;
    // Round up so a fractional dpr never leaves the label short of a device pixel
    const int tw = qMax(1, qCeil(targetWidth * dpr));
    const int th = qMax(1, qCeil(targetHeight * dpr));

    const QString path = resolve(imageRef);
    QImage source;
    if (!path.isEmpty()) {
        QImageReader reader(path);
        source = reader.read();
        if (source.isNull()) {
            qDebug() << "[Preview] Cannot read" << path << ":" << reader.errorString();
        }
    }

    QImage out = source.isNull() ? placeholder(tw, th) : coverCrop(source, tw, th, m_anchor);
    out.setDevicePixelRatio(dpr);
    return out;
}

QPixmap PreviewRenderer::render(const QString& imageRef, int targetWidth, int targetHeight,
                                qreal devicePixelRatio) const
{
    QPixmap pm = QPixmap::fromImage(renderImage(imageRef, targetWidth, targetHeight, devicePixelRatio));
    pm.setDevicePixelRatio(devicePixelRatio > 0.0 ? devicePixelRatio : 1.0);
    return pm;
}

QPixmap PreviewRenderer::thumbnail(const QString& imageRef, int size, qreal devicePixelRatio) const
{
    return render(imageRef, size, size, devicePixelRatio);
}
