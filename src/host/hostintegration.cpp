#include "host/hostintegration.h"
#include "host/layerhost.h"
#include "host/layeruribuilder.h"

#include <QDebug>

#include <exception>

QString HostIntegrationAdapter::groupName()
{
    return QStringLiteral("Bakgrunnskart");
}

HostIntegrationAdapter::HostIntegrationAdapter(LayerHost* host)
    : m_host(host)
{
}

AddLayerResult HostIntegrationAdapter::addLayer(const ServiceEntry& service, const QString& offeringKey,
                                                const TilesetVariant& variant)
{
    AddLayerRequest request;
    request.service = service;
    request.offeringKey = offeringKey;
    request.variant = variant;
    return addLayer(request);
}

AddLayerResult HostIntegrationAdapter::addLayer(const AddLayerRequest& request)
{
    ++m_requestCount;
    try {
        return insert(request);
    } catch (const std::exception& e) {
        qWarning() << "[Host] Layer insertion threw:" << e.what();
        AddLayerResult result;
        result.message = tr("Klarte ikke å legge til laget.\n\n%1").arg(QString::fromUtf8(e.what()));
        return result;
    } catch (...) {
        // Host plugins may throw types of their own; report them like any other failure
        qWarning() << "[Host] Layer insertion threw a non-standard exception";
        AddLayerResult result;
        result.message = tr("Klarte ikke å legge til laget på grunn av en ukjent feil.");
        return result;
    }
}

AddLayerResult HostIntegrationAdapter::insert(const AddLayerRequest& request)
{
    AddLayerResult result;
    if (!m_host) {
        result.message = tr("Ingen kartprosjekt er tilgjengelig.");
        return result;
    }

    const QString title = LayerUriBuilder::layerTitle(request.service, request.offeringKey, request.variant);
    result.layerTitle = title;

    LayerUriBuilder builder;
    LayerDefinition definition;
    if (!builder.build(request.variant, title, definition)) {
        result.message = builder.lastError();
        qWarning() << "[Host] Cannot build layer" << title << ":" << result.message;
        return result;
    }

    if (!m_host->createOrGetGroup(groupName(), &result.groupCreated)) {
        result.message = tr("Klarte ikke å opprette gruppen «%1».\n\n%2")
                             .arg(groupName(), m_host->lastError());
        qWarning() << "[Host]" << result.message;
        return result;
    }
    if (result.groupCreated) {
        qDebug() << "[Host] Created layer group" << groupName();
    }

    if (!m_host->addLayerToGroup(groupName(), definition)) {
        result.message = m_host->lastError();
        qWarning() << "[Host] Host rejected layer" << title << ":" << result.message;
        return result;
    }

    qDebug() << "[Host] Added" << title << "to" << groupName();
    result.ok = true;
    return result;
}
