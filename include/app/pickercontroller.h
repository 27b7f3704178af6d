#ifndef PICKERCONTROLLER_H
#define PICKERCONTROLLER_H

#include "catalog/catalog.h"
#include "host/hostintegration.h"

#include <QObject>
#include <QString>
#include <QVector>

class SelectionState;

/**
 * @brief PickerController - State of the basemap picker dialog
 *
 * Starts in Browsing. Query changes re-run the search filter, list and radio
 * clicks update the selection. confirm() with a complete selection asks the
 * host adapter to add the layer exactly once: success moves to the terminal
 * Confirmed state, failure reports a message and stays in Browsing so the
 * user can retry or pick another tileset.
 */
class PickerController : public QObject {
    Q_OBJECT
public:
    enum class State {
        Browsing,
        Confirmed
    };

    PickerController(const Catalog& catalog, HostIntegrationAdapter* adapter, QObject* parent = nullptr);

    const Catalog& catalog() const { return m_catalog; }
    SelectionState* selection() const { return m_selection; }

    QString query() const { return m_query; }
    const QVector<ServiceEntry>& visibleEntries() const { return m_visible; }
    bool isVisible(const QString& serviceId) const;

    State state() const { return m_state; }
    bool canConfirm() const;
    AddLayerResult lastResult() const { return m_lastResult; }

    // Select the remembered service/offering/tileset, falling back to the
    // first visible service for anything that no longer exists
    void restoreSelection(const QString& serviceId, const QString& offeringKey,
                          const QString& tilesetLabel);

public slots:
    void setQuery(const QString& query);
    void selectService(const QString& id);
    void selectOffering(const QString& key);
    void selectTileset(const QString& label);
    bool confirm();

signals:
    void filterChanged();
    void confirmed(const AddLayerResult& result);
    void addLayerFailed(const QString& message);

private:
    Catalog m_catalog;
    HostIntegrationAdapter* m_adapter{nullptr};
    SelectionState* m_selection{nullptr};
    QString m_query;
    QVector<ServiceEntry> m_visible;
    State m_state{State::Browsing};
    AddLayerResult m_lastResult;
};

#endif // PICKERCONTROLLER_H
