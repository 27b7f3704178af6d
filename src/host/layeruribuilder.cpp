#include "host/layeruribuilder.h"

namespace {

QString orDefault(const QString& value, const QString& fallback)
{
    return value.isEmpty() ? fallback : value;
}

} // namespace

QString LayerUriBuilder::encodeUrl(const QString& url)
{
    QString out = url;
    out.replace('%', "%25");
    out.replace('=', "%3D");
    out.replace('&', "%26");
    return out;
}

QString LayerUriBuilder::encodeTemplate(const QString& urlTemplate)
{
    QString out = urlTemplate;
    out.replace('%', "%25");
    out.replace('&', "%26");
    out.replace('{', "%7B");
    out.replace('}', "%7D");
    return out;
}

QString LayerUriBuilder::layerTitle(const ServiceEntry& service, const QString& offeringKey,
                                    const TilesetVariant& variant)
{
    return QString("%1 [%2] (%3)")
        .arg(orDefault(service.name, QStringLiteral("Bakgrunnskart")),
             offeringKey.toUpper(),
             orDefault(variant.label, QStringLiteral("variant")));
}

bool LayerUriBuilder::build(const TilesetVariant& variant, const QString& title, LayerDefinition& out)
{
    m_lastError.clear();
    out = LayerDefinition();
    out.title = title.isEmpty() ? variant.label : title;

    switch (variant.kind) {
        case LayerKind::Wmts:
            return buildWmts(variant, out);
        case LayerKind::Wms:
            return buildWms(variant, out);
        case LayerKind::Xyz:
            return buildXyz(variant, out);
        case LayerKind::VectorTile:
            return buildVectorTile(variant, out);
        case LayerKind::Unknown:
            break;
    }
    m_lastError = tr("Ukjent variant-type.\n\n"
                     "Bruk 'wmts', 'wms', 'xyz' eller 'vectortile'.");
    return false;
}

bool LayerUriBuilder::buildWmts(const TilesetVariant& variant, LayerDefinition& out)
{
    if (variant.capabilitiesUrl.isEmpty() || variant.layers.isEmpty() || variant.tileMatrixSet.isEmpty()) {
        m_lastError = tr("WMTS-varianten mangler 'capabilities', 'layer' eller 'tileMatrixSet'.");
        return false;
    }

    out.type = LayerDefinition::Type::Raster;
    out.provider = QStringLiteral("wms");
    out.uri = QString("crs=%1&format=%2&layers=%3&styles=%4&tileMatrixSet=%5&url=%6")
                  .arg(orDefault(variant.crs, QStringLiteral("EPSG:25833")),
                       orDefault(variant.format, QStringLiteral("image/png")),
                       variant.layers,
                       orDefault(variant.styles, QStringLiteral("default")),
                       variant.tileMatrixSet,
                       encodeUrl(variant.capabilitiesUrl));
    return true;
}

bool LayerUriBuilder::buildWms(const TilesetVariant& variant, LayerDefinition& out)
{
    if (variant.url.isEmpty()) {
        m_lastError = tr("WMS-varianten mangler 'url'.");
        return false;
    }
    if (variant.layers.isEmpty()) {
        m_lastError = tr("WMS-varianten mangler 'layers' (eller 'layer').");
        return false;
    }

    out.type = LayerDefinition::Type::Raster;
    out.provider = QStringLiteral("wms");
    out.uri = QString("crs=%1&format=%2&layers=%3&styles=%4&url=%5")
                  .arg(orDefault(variant.crs, QStringLiteral("EPSG:25833")),
                       orDefault(variant.format, QStringLiteral("image/png")),
                       variant.layers,
                       variant.styles,
                       encodeUrl(variant.url));
    return true;
}

bool LayerUriBuilder::buildXyz(const TilesetVariant& variant, LayerDefinition& out)
{
    if (variant.url.isEmpty()) {
        m_lastError = tr("XYZ-varianten mangler 'xyz_url'.");
        return false;
    }

    const int zmin = variant.zmin >= 0 ? variant.zmin : DefaultXyzZmin;
    const int zmax = variant.zmax >= 0 ? variant.zmax : DefaultXyzZmax;

    out.type = LayerDefinition::Type::Raster;
    out.provider = QStringLiteral("wms");
    out.uri = QString("type=xyz&url=%1&zmin=%2&zmax=%3&crs=EPSG3857")
                  .arg(encodeTemplate(variant.url), QString::number(zmin), QString::number(zmax));
    return true;
}

bool LayerUriBuilder::buildVectorTile(const TilesetVariant& variant, LayerDefinition& out)
{
    out.type = LayerDefinition::Type::VectorTile;
    out.provider = orDefault(variant.provider, QStringLiteral("arcgisvectortileservice"));

    if (!variant.uri.isEmpty()) {
        out.uri = variant.uri;
        return true;
    }

    const int zmin = variant.zmin >= 0 ? variant.zmin : DefaultVectorTileZmin;
    const int zmax = variant.zmax >= 0 ? variant.zmax : DefaultVectorTileZmax;

    // Plain XYZ vector tiles need only the tile template; the style is optional
    if (out.provider == QLatin1String("xyzvectortiles")) {
        if (variant.url.isEmpty()) {
            m_lastError = tr("Vector tile-varianten mangler 'uri' eller 'url'.");
            return false;
        }
        out.uri = QString("type=xyz&url=%1&zmin=%2&zmax=%3")
                      .arg(encodeTemplate(variant.url), QString::number(zmin), QString::number(zmax));
        if (!variant.styleUrl.isEmpty()) out.uri += QStringLiteral("&styleUrl=") + variant.styleUrl;
        return true;
    }

    if (variant.url.isEmpty() || variant.styleUrl.isEmpty()) {
        m_lastError = tr("Vector tile-varianten mangler 'uri' eller (service_url/url + style_url/styleUrl).");
        return false;
    }

    out.uri = QString("serviceType=arcgis&styleUrl=%1&type=xyz&url=%2&zmin=%3&zmax=%4")
                  .arg(variant.styleUrl, variant.url, QString::number(zmin), QString::number(zmax));
    return true;
}
