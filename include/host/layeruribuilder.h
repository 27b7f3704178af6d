#ifndef LAYERURIBUILDER_H
#define LAYERURIBUILDER_H

#include "catalog/serviceentry.h"
#include "host/layerdefinition.h"

#include <QCoreApplication>
#include <QString>

/**
 * @brief LayerUriBuilder - Tileset variant -> QGIS data source
 *
 * Produces the provider key and data-source URI QGIS stores in the project
 * for WMTS, WMS, XYZ and ArcGIS vector tile layers. Nested URLs are encoded
 * so the URI's own key=value&... syntax survives.
 */
class LayerUriBuilder {
    Q_DECLARE_TR_FUNCTIONS(LayerUriBuilder)
public:
    static constexpr int DefaultXyzZmin = 0;
    static constexpr int DefaultXyzZmax = 21;
    static constexpr int DefaultVectorTileZmin = 0;
    static constexpr int DefaultVectorTileZmax = 14;

    // '%' -> %25, '=' -> %3D, '&' -> %26
    static QString encodeUrl(const QString& url);
    // '%' -> %25, '&' -> %26, '{' -> %7B, '}' -> %7D
    static QString encodeTemplate(const QString& urlTemplate);

    // "<service> [<OFFERING>] (<variant>)"
    static QString layerTitle(const ServiceEntry& service, const QString& offeringKey,
                              const TilesetVariant& variant);

    bool build(const TilesetVariant& variant, const QString& title, LayerDefinition& out);
    QString lastError() const { return m_lastError; }

private:
    bool buildWmts(const TilesetVariant& variant, LayerDefinition& out);
    bool buildWms(const TilesetVariant& variant, LayerDefinition& out);
    bool buildXyz(const TilesetVariant& variant, LayerDefinition& out);
    bool buildVectorTile(const TilesetVariant& variant, LayerDefinition& out);

    QString m_lastError;
};

#endif // LAYERURIBUILDER_H
