#include "catalog/catalogstore.h"

#include <QFile>
#include <QSet>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QDebug>

#include <algorithm>

namespace {

const QStringList kTypeOrder = {
    QStringLiteral("wmts"),
    QStringLiteral("wms"),
    QStringLiteral("vectortile")
};

QString firstString(const QJsonObject& obj, const QStringList& keys)
{
    for (const QString& k : keys) {
        const QJsonValue v = obj.value(k);
        if (v.isString()) return v.toString();
    }
    return QString();
}

// Tileset labels select a variant, so the first one with a given label wins
void appendVariant(ServiceOffering& offering, const TilesetVariant& variant)
{
    if (offering.variant(variant.label)) {
        qWarning() << "[Catalog] Skipping duplicate tileset" << variant.label << "in" << offering.key;
        return;
    }
    offering.variants.append(variant);
}

LayerKind kindForOfferingKey(const QString& key)
{
    // XYZ variants always say so explicitly; an untyped WMTS offering is WMTS
    return layerKindFromString(key);
}

} // namespace

QString CatalogStore::defaultPath()
{
    return QStringLiteral(":/catalog/services.json");
}

QStringList CatalogStore::orderedKeys(const QStringList& keys)
{
    QStringList out;
    for (const QString& k : kTypeOrder) {
        if (keys.contains(k)) out << k;
    }
    QStringList rest;
    for (const QString& k : keys) {
        if (!kTypeOrder.contains(k)) rest << k;
    }
    std::sort(rest.begin(), rest.end());
    out += rest;
    return out;
}

TilesetVariant CatalogStore::parseVariant(const QJsonObject& obj, int index)
{
    TilesetVariant v;
    v.label = obj.value("label").toString();
    if (v.label.isEmpty()) v.label = QString("Variant %1").arg(index + 1);

    v.kind = layerKindFromString(obj.value("type").toString());
    v.capabilitiesUrl = obj.value("capabilities").toString();
    if (v.kind == LayerKind::Xyz) {
        v.url = firstString(obj, {"xyz_url", "url"});
    } else {
        v.url = firstString(obj, {"url", "service_url"});
    }
    v.layers = firstString(obj, {"layers", "layer"});
    v.styles = firstString(obj, {"styles", "style"});
    v.format = obj.value("format").toString();
    v.tileMatrixSet = obj.value("tileMatrixSet").toString();
    v.crs = obj.value("crs").toString();
    v.zmin = obj.value("zmin").toInt(-1);
    v.zmax = obj.value("zmax").toInt(-1);
    v.styleUrl = firstString(obj, {"style_url", "styleUrl"});
    v.uri = obj.value("uri").toString();
    v.provider = obj.value("provider").toString().trimmed();
    return v;
}

ServiceOffering CatalogStore::parseOffering(const QString& key, const QJsonObject& obj)
{
    ServiceOffering off;
    off.key = key;
    off.label = obj.value("label").toString();
    if (off.label.isEmpty()) off.label = key.toUpper();
    off.disabled = obj.value("disabled").toBool(false);
    off.disabledReason = obj.value("disabled_reason").toString();

    const QJsonArray variants = obj.value("variants").toArray();
    for (int i = 0; i < variants.size(); ++i) {
        if (!variants.at(i).isObject()) continue;
        TilesetVariant v = parseVariant(variants.at(i).toObject(), i);
        if (v.kind == LayerKind::Unknown) v.kind = kindForOfferingKey(key);
        appendVariant(off, v);
    }
    return off;
}

QVector<ServiceOffering> CatalogStore::normalizeOfferings(const QJsonObject& service)
{
    QVector<ServiceOffering> out;

    const QJsonObject offerings = service.value("offerings").toObject();
    if (!offerings.isEmpty()) {
        for (const QString& key : orderedKeys(offerings.keys())) {
            const QJsonValue val = offerings.value(key);
            if (!val.isObject()) continue;
            out.append(parseOffering(key, val.toObject()));
        }
        return out;
    }

    // Flat variant list: group by type, XYZ rides along with WMTS
    ServiceOffering wmtsLike{QStringLiteral("wmts"), QStringLiteral("WMTS / XYZ")};
    ServiceOffering wmsLike{QStringLiteral("wms"), QStringLiteral("WMS")};
    ServiceOffering vtLike{QStringLiteral("vectortile"), QStringLiteral("Vector tiles")};

    const QJsonArray variants = service.value("variants").toArray();
    for (int i = 0; i < variants.size(); ++i) {
        if (!variants.at(i).isObject()) continue;
        const TilesetVariant v = parseVariant(variants.at(i).toObject(), i);
        switch (v.kind) {
            case LayerKind::Wms:
                appendVariant(wmsLike, v);
                break;
            case LayerKind::VectorTile:
                appendVariant(vtLike, v);
                break;
            default:
                appendVariant(wmtsLike, v);
                break;
        }
    }

    if (!wmtsLike.variants.isEmpty()) out.append(wmtsLike);
    if (!wmsLike.variants.isEmpty()) out.append(wmsLike);
    if (!vtLike.variants.isEmpty()) out.append(vtLike);

    if (out.isEmpty()) {
        TilesetVariant standard;
        standard.label = QStringLiteral("Standard");
        wmtsLike.variants.append(standard);
        out.append(wmtsLike);
    }
    return out;
}

bool CatalogStore::load(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_catalog = Catalog();
        m_lastError = QString("Cannot open catalog %1: %2").arg(path, file.errorString());
        qWarning() << "[Catalog]" << m_lastError;
        return false;
    }
    return loadFromJson(file.readAll());
}

bool CatalogStore::loadFromJson(const QByteArray& json)
{
    m_catalog = Catalog();
    m_lastError.clear();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_lastError = QString("Catalog is not valid JSON: %1 (offset %2)")
                          .arg(parseError.errorString())
                          .arg(parseError.offset);
        qWarning() << "[Catalog]" << m_lastError;
        return false;
    }
    if (!doc.isObject()) {
        m_lastError = "Catalog root must be an object";
        qWarning() << "[Catalog]" << m_lastError;
        return false;
    }

    const QJsonObject root = doc.object();
    const int version = root.value("version").toInt(0);
    if (version < 1 || version > SupportedVersion) {
        m_lastError = QString("Unsupported catalog version %1").arg(version);
        qWarning() << "[Catalog]" << m_lastError;
        return false;
    }

    QVector<ServiceEntry> entries;
    QSet<QString> seen;
    const QJsonArray services = root.value("services").toArray();
    for (int i = 0; i < services.size(); ++i) {
        const QJsonObject obj = services.at(i).toObject();
        ServiceEntry entry;
        entry.id = obj.value("id").toString().trimmed();
        entry.name = obj.value("name").toString();
        if (entry.id.isEmpty() || entry.name.isEmpty()) {
            qWarning() << "[Catalog] Skipping service" << i << "without id or name";
            continue;
        }
        if (seen.contains(entry.id)) {
            qWarning() << "[Catalog] Skipping duplicate service id" << entry.id;
            continue;
        }
        seen.insert(entry.id);

        entry.description = obj.value("description").toString();
        entry.preview = obj.value("preview").toString();
        entry.thumbnail = obj.value("thumb").toString();
        entry.offerings = normalizeOfferings(obj);
        entries.append(entry);
    }

    m_catalog = Catalog(version, entries);
    qDebug() << "[Catalog] Loaded" << entries.size() << "services (version" << version << ")";
    return true;
}
