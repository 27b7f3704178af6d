#ifndef SERVICEENTRY_H
#define SERVICEENTRY_H

#include <QString>
#include <QVector>

// Kind of layer a tileset variant describes. Xyz is presented together with
// WMTS but builds a different provider URI.
enum class LayerKind {
    Unknown = 0,
    Wmts,
    Wms,
    Xyz,
    VectorTile
};

LayerKind layerKindFromString(const QString& type);

/**
 * @brief TilesetVariant - One tileset / projection choice of a service
 *
 * Carries every connection parameter the host needs to construct the layer.
 * Unused fields stay empty; zoom levels of -1 mean "use the kind default".
 */
struct TilesetVariant {
    QString label;
    LayerKind kind{LayerKind::Unknown};
    QString url;                // WMS endpoint, XYZ template or vector tile service
    QString capabilitiesUrl;    // WMTS GetCapabilities
    QString layers;
    QString styles;
    QString format;
    QString tileMatrixSet;
    QString crs;                // e.g. "EPSG:25833"
    int zmin{-1};
    int zmax{-1};
    QString styleUrl;           // vector tiles
    QString uri;                // explicit provider URI, bypasses the builder
    QString provider;           // QGIS provider key override, empty for the kind's default

    bool isValid() const { return !label.isEmpty(); }
};

/**
 * @brief ServiceOffering - One service type (WMTS/XYZ, WMS, vector tiles)
 */
struct ServiceOffering {
    QString key;                // "wmts", "wms", "vectortile", ...
    QString label;
    bool disabled{false};
    QString disabledReason;
    QVector<TilesetVariant> variants;

    const TilesetVariant* variant(const QString& label) const;
    bool isSelectable() const { return !disabled && !variants.isEmpty(); }
};

struct ServiceEntry {
    QString id;
    QString name;
    QString description;        // rich text
    QString preview;
    QString thumbnail;
    QVector<ServiceOffering> offerings;

    const ServiceOffering* offering(const QString& key) const;
    const ServiceOffering* firstSelectableOffering() const;

    // All variants of all offerings, in presentation order
    QVector<TilesetVariant> variants() const;

    QString thumbnailRef() const { return thumbnail.isEmpty() ? preview : thumbnail; }
};

#endif // SERVICEENTRY_H
