#ifndef HOSTINTEGRATION_H
#define HOSTINTEGRATION_H

#include "catalog/serviceentry.h"

#include <QCoreApplication>
#include <QMetaType>
#include <QString>

class LayerHost;

struct AddLayerRequest {
    ServiceEntry service;
    QString offeringKey;
    TilesetVariant variant;
};

struct AddLayerResult {
    bool ok{false};
    QString layerTitle;
    QString message;        // user-facing reason when !ok
    bool groupCreated{false};
};

Q_DECLARE_METATYPE(AddLayerResult)

/**
 * @brief HostIntegrationAdapter - Inserts the chosen basemap into the project
 *
 * All layers land in the root group "Bakgrunnskart", which is created on
 * first use and reused afterwards. Nothing thrown below this boundary
 * reaches the caller: every failure becomes an AddLayerResult with a message.
 */
class HostIntegrationAdapter {
    Q_DECLARE_TR_FUNCTIONS(HostIntegrationAdapter)
public:
    static QString groupName();

    explicit HostIntegrationAdapter(LayerHost* host);

    AddLayerResult addLayer(const AddLayerRequest& request);
    AddLayerResult addLayer(const ServiceEntry& service, const QString& offeringKey,
                            const TilesetVariant& variant);

    int requestCount() const { return m_requestCount; }

private:
    AddLayerResult insert(const AddLayerRequest& request);

    LayerHost* m_host{nullptr};
    int m_requestCount{0};
};

#endif // HOSTINTEGRATION_H
