#ifndef CATALOGSTORE_H
#define CATALOGSTORE_H

#include "catalog/catalog.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QJsonObject>

/**
 * @brief CatalogStore - Reads the bundled basemap service definition
 *
 * The definition is a versioned JSON document compiled into the plugin as a
 * Qt resource. Entries that cannot be used (no id, no name, duplicate id) are
 * skipped with a warning; a broken document leaves an empty catalog and sets
 * lastError().
 */
class CatalogStore {
public:
    static constexpr int SupportedVersion = 1;

    static QString defaultPath();

    // Read and parse a catalog file (defaults to the bundled resource)
    bool load(const QString& path = defaultPath());
    bool loadFromJson(const QByteArray& json);

    const Catalog& catalog() const { return m_catalog; }
    QString lastError() const { return m_lastError; }

    // Offerings of one service record, in presentation order. Records with a
    // flat "variants" list are grouped by variant type.
    static QVector<ServiceOffering> normalizeOfferings(const QJsonObject& service);

    // wmts, wms, vectortile first; unknown keys follow alphabetically
    static QStringList orderedKeys(const QStringList& keys);

private:
    static TilesetVariant parseVariant(const QJsonObject& obj, int index);
    static ServiceOffering parseOffering(const QString& key, const QJsonObject& obj);

    Catalog m_catalog;
    QString m_lastError;
};

#endif // CATALOGSTORE_H
