#ifndef CATALOG_H
#define CATALOG_H

#include "catalog/serviceentry.h"

#include <QVector>
#include <QString>

// Immutable set of basemap services. Loaded once when the plugin starts and
// handed to the dialog by value (the entry vector is implicitly shared).
class Catalog {
public:
    Catalog() = default;
    Catalog(int version, const QVector<ServiceEntry>& entries);

    int version() const { return m_version; }
    const QVector<ServiceEntry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    const ServiceEntry* find(const QString& id) const;
    int indexOf(const QString& id) const;

private:
    int m_version{0};
    QVector<ServiceEntry> m_entries;
};

#endif // CATALOG_H
