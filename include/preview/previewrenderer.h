#ifndef PREVIEWRENDERER_H
#define PREVIEWRENDERER_H

#include <QImage>
#include <QPixmap>
#include <QString>

/**
 * @brief PreviewRenderer - Banner and thumbnail images for the service list
 *
 * Images are scaled to "cover" the target (the shorter side fills it) and
 * cropped to exactly the target size: horizontally centered, vertically at
 * the configured anchor. Rendering happens in device pixels so previews stay
 * sharp on HiDPI screens; the returned pixmap carries the device pixel ratio
 * and its logical size is the requested one.
 *
 * A missing or unreadable image yields a placeholder of the same size.
 */
class PreviewRenderer {
public:
    enum class CropAnchor {
        Top,
        Center
    };

    static constexpr CropAnchor DefaultAnchor = CropAnchor::Top;

    explicit PreviewRenderer(const QString& root = QStringLiteral(":/"),
                             CropAnchor anchor = DefaultAnchor);

    void setRoot(const QString& root) { m_root = root; }
    QString root() const { return m_root; }
    void setAnchor(CropAnchor anchor) { m_anchor = anchor; }
    CropAnchor anchor() const { return m_anchor; }

    // Resolve an image reference from the catalog against the root
    QString resolve(const QString& imageRef) const;

    QPixmap render(const QString& imageRef, int targetWidth, int targetHeight,
                   qreal devicePixelRatio = 1.0) const;
    QImage renderImage(const QString& imageRef, int targetWidth, int targetHeight,
                       qreal devicePixelRatio = 1.0) const;
    QPixmap thumbnail(const QString& imageRef, int size, qreal devicePixelRatio = 1.0) const;

    static QImage coverCrop(const QImage& source, int width, int height, CropAnchor anchor);
    static QImage placeholder(int width, int height);

    static CropAnchor anchorFromString(const QString& name);
    static QString anchorToString(CropAnchor anchor);

private:
    QString m_root;
    CropAnchor m_anchor;
};

#endif // PREVIEWRENDERER_H
