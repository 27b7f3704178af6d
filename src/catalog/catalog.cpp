#include "catalog/catalog.h"

Catalog::Catalog(int version, const QVector<ServiceEntry>& entries)
    : m_version(version), m_entries(entries)
{
}

int Catalog::indexOf(const QString& id) const
{
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].id == id) return i;
    }
    return -1;
}

const ServiceEntry* Catalog::find(const QString& id) const
{
    const int idx = indexOf(id);
    if (idx < 0) return nullptr;
    return &m_entries.at(idx);
}
