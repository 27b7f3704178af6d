#ifndef SELECTIONSTATE_H
#define SELECTIONSTATE_H

#include "catalog/catalog.h"

#include <QObject>
#include <QString>

// Snapshot of what the user has picked. Invalid when no service, or no
// selectable tileset, is chosen.
struct Selection {
    ServiceEntry service;
    QString offeringKey;
    TilesetVariant variant;

    bool isValid() const { return !service.id.isEmpty() && variant.isValid(); }
};

/**
 * @brief SelectionState - Highlighted service and chosen tileset
 *
 * Invariant: the tileset label, when set, always names a variant of the
 * current offering of the current service. Changing service resets the
 * offering to the first selectable one and the tileset to its first variant.
 */
class SelectionState : public QObject {
    Q_OBJECT
public:
    explicit SelectionState(const Catalog& catalog, QObject* parent = nullptr);

    // Unknown id clears the selection and returns false
    bool selectService(const QString& id);
    // No-op (false) for unknown or disabled offerings
    bool selectOffering(const QString& key);
    // No-op (false) when the label is not in the current offering
    bool selectTileset(const QString& label);
    void clear();

    QString serviceId() const { return m_serviceId; }
    QString offeringKey() const { return m_offeringKey; }
    QString tilesetLabel() const { return m_tilesetLabel; }

    const ServiceEntry* currentService() const;
    const ServiceOffering* currentOffering() const;
    const TilesetVariant* currentTileset() const;

    bool hasSelection() const { return currentTileset() != nullptr; }
    Selection current() const;

signals:
    void serviceChanged(const QString& id);
    void offeringChanged(const QString& key);
    void tilesetChanged(const QString& label);
    void selectionChanged();

private:
    void apply(const QString& serviceId, const QString& offeringKey, const QString& tilesetLabel);

    Catalog m_catalog;
    QString m_serviceId;
    QString m_offeringKey;
    QString m_tilesetLabel;
};

#endif // SELECTIONSTATE_H
