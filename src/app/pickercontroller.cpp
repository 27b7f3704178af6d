#include "app/pickercontroller.h"
#include "catalog/searchfilter.h"
#include "selection/selectionstate.h"

PickerController::PickerController(const Catalog& catalog, HostIntegrationAdapter* adapter, QObject* parent)
    : QObject(parent), m_catalog(catalog), m_adapter(adapter)
{
    m_selection = new SelectionState(m_catalog, this);
    m_visible = m_catalog.entries();
}

bool PickerController::isVisible(const QString& serviceId) const
{
    for (const ServiceEntry& e : m_visible) {
        if (e.id == serviceId) return true;
    }
    return false;
}

bool PickerController::canConfirm() const
{
    return m_state == State::Browsing && m_adapter && m_selection->hasSelection();
}

void PickerController::restoreSelection(const QString& serviceId, const QString& offeringKey,
                                        const QString& tilesetLabel)
{
    if (!isVisible(serviceId) || !m_selection->selectService(serviceId)) {
        if (m_visible.isEmpty()) {
            m_selection->clear();
            return;
        }
        m_selection->selectService(m_visible.first().id);
        return;
    }
    if (!offeringKey.isEmpty()) m_selection->selectOffering(offeringKey);
    if (!tilesetLabel.isEmpty()) m_selection->selectTileset(tilesetLabel);
}

void PickerController::setQuery(const QString& query)
{
    if (m_state != State::Browsing) return;
    m_query = query;
    m_visible = SearchFilter::filter(m_catalog.entries(), m_query);

    // Keep the current service while it is still listed
    if (!isVisible(m_selection->serviceId())) {
        if (m_visible.isEmpty()) {
            m_selection->clear();
        } else {
            m_selection->selectService(m_visible.first().id);
        }
    }
    emit filterChanged();
}

void PickerController::selectService(const QString& id)
{
    if (m_state != State::Browsing) return;
    if (!isVisible(id)) return;
    m_selection->selectService(id);
}

void PickerController::selectOffering(const QString& key)
{
    if (m_state != State::Browsing) return;
    m_selection->selectOffering(key);
}

void PickerController::selectTileset(const QString& label)
{
    if (m_state != State::Browsing) return;
    m_selection->selectTileset(label);
}

bool PickerController::confirm()
{
    if (!canConfirm()) return false;

    const Selection sel = m_selection->current();
    AddLayerRequest request;
    request.service = sel.service;
    request.offeringKey = sel.offeringKey;
    request.variant = sel.variant;

    m_lastResult = m_adapter->addLayer(request);
    if (!m_lastResult.ok) {
        emit addLayerFailed(m_lastResult.message);
        return false;
    }

    m_state = State::Confirmed;
    emit confirmed(m_lastResult);
    return true;
}
