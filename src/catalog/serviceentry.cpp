#include "catalog/serviceentry.h"

LayerKind layerKindFromString(const QString& type)
{
    const QString t = type.trimmed().toLower();
    if (t == "wmts") return LayerKind::Wmts;
    if (t == "wms") return LayerKind::Wms;
    if (t == "xyz") return LayerKind::Xyz;
    if (t == "vectortile" || t == "vt" || t == "mvt" ||
        t == "arcgis_vt" || t == "arcgisvectortile") {
        return LayerKind::VectorTile;
    }
    return LayerKind::Unknown;
}

const TilesetVariant* ServiceOffering::variant(const QString& label) const
{
    for (const TilesetVariant& v : variants) {
        if (v.label == label) return &v;
    }
    return nullptr;
}

const ServiceOffering* ServiceEntry::offering(const QString& key) const
{
    for (const ServiceOffering& o : offerings) {
        if (o.key == key) return &o;
    }
    return nullptr;
}

const ServiceOffering* ServiceEntry::firstSelectableOffering() const
{
    for (const ServiceOffering& o : offerings) {
        if (o.isSelectable()) return &o;
    }
    return nullptr;
}

QVector<TilesetVariant> ServiceEntry::variants() const
{
    QVector<TilesetVariant> out;
    for (const ServiceOffering& o : offerings) {
        out += o.variants;
    }
    return out;
}
