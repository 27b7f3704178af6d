#include "selection/selectionstate.h"

SelectionState::SelectionState(const Catalog& catalog, QObject* parent)
    : QObject(parent), m_catalog(catalog)
{
}

const ServiceEntry* SelectionState::currentService() const
{
    if (m_serviceId.isEmpty()) return nullptr;
    return m_catalog.find(m_serviceId);
}

const ServiceOffering* SelectionState::currentOffering() const
{
    const ServiceEntry* svc = currentService();
    if (!svc || m_offeringKey.isEmpty()) return nullptr;
    return svc->offering(m_offeringKey);
}

const TilesetVariant* SelectionState::currentTileset() const
{
    const ServiceOffering* off = currentOffering();
    if (!off || m_tilesetLabel.isEmpty()) return nullptr;
    return off->variant(m_tilesetLabel);
}

Selection SelectionState::current() const
{
    Selection sel;
    const TilesetVariant* v = currentTileset();
    if (!v) return sel;
    sel.service = *currentService();
    sel.offeringKey = m_offeringKey;
    sel.variant = *v;
    return sel;
}

bool SelectionState::selectService(const QString& id)
{
    const ServiceEntry* svc = m_catalog.find(id);
    if (!svc) {
        clear();
        return false;
    }

    QString offeringKey;
    QString label;
    if (const ServiceOffering* off = svc->firstSelectableOffering()) {
        offeringKey = off->key;
        label = off->variants.first().label;
    }
    apply(svc->id, offeringKey, label);
    return true;
}

bool SelectionState::selectOffering(const QString& key)
{
    const ServiceEntry* svc = currentService();
    if (!svc) return false;
    const ServiceOffering* off = svc->offering(key);
    if (!off || !off->isSelectable()) return false;

    apply(m_serviceId, off->key, off->variants.first().label);
    return true;
}

bool SelectionState::selectTileset(const QString& label)
{
    const ServiceOffering* off = currentOffering();
    if (!off || !off->variant(label)) return false;

    apply(m_serviceId, m_offeringKey, label);
    return true;
}

void SelectionState::clear()
{
    apply(QString(), QString(), QString());
}

void SelectionState::apply(const QString& serviceId, const QString& offeringKey, const QString& tilesetLabel)
{
    const bool serviceDiff = serviceId != m_serviceId;
    const bool offeringDiff = serviceDiff || offeringKey != m_offeringKey;
    const bool tilesetDiff = offeringDiff || tilesetLabel != m_tilesetLabel;

    m_serviceId = serviceId;
    m_offeringKey = offeringKey;
    m_tilesetLabel = tilesetLabel;

    if (serviceDiff) emit serviceChanged(m_serviceId);
    if (offeringDiff) emit offeringChanged(m_offeringKey);
    if (tilesetDiff) emit tilesetChanged(m_tilesetLabel);
    if (tilesetDiff) emit selectionChanged();
}
