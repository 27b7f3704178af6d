#include "host/qgislayerhost.h"

#include <qgsexception.h>
#include <qgslayertree.h>
#include <qgslayertreegroup.h>
#include <qgsmaplayer.h>
#include <qgsproject.h>
#include <qgsrasterlayer.h>
#include <qgsvectortilelayer.h>

#include <QDebug>

#include <memory>

QgisLayerHost::QgisLayerHost(QgsProject* project)
    : m_project(project)
{
}

bool QgisLayerHost::createOrGetGroup(const QString& name, bool* created)
{
    m_lastError.clear();
    if (created) *created = false;
    if (!m_project) {
        m_lastError = tr("Ingen QGIS-prosjekt er åpent.");
        return false;
    }

    QgsLayerTree* root = m_project->layerTreeRoot();
    if (root->findGroup(name)) return true;

    if (!root->addGroup(name)) {
        m_lastError = tr("QGIS avviste gruppen «%1».").arg(name);
        return false;
    }
    if (created) *created = true;
    return true;
}

bool QgisLayerHost::addLayerToGroup(const QString& group, const LayerDefinition& definition)
{
    m_lastError.clear();
    if (!m_project) {
        m_lastError = tr("Ingen QGIS-prosjekt er åpent.");
        return false;
    }

    QgsLayerTreeGroup* target = m_project->layerTreeRoot()->findGroup(group);
    if (!target) {
        m_lastError = tr("Fant ikke gruppen «%1».").arg(group);
        return false;
    }

    std::unique_ptr<QgsMapLayer> layer;
    try {
        if (definition.type == LayerDefinition::Type::VectorTile) {
            // QgsVectorTileLayer picks its provider from the URI, so the key is only checked below
            layer = std::make_unique<QgsVectorTileLayer>(definition.uri, definition.title);
        } else {
            layer = std::make_unique<QgsRasterLayer>(definition.uri, definition.title, definition.provider);
        }
    } catch (const QgsException& e) {
        m_lastError = tr("QGIS kunne ikke opprette laget.\n\n%1").arg(e.what());
        return false;
    }

    if (!definition.provider.isEmpty() && layer->providerType() != definition.provider) {
        qWarning() << "[QGIS] Expected provider" << definition.provider << "but QGIS chose" << layer->providerType();
    }

    if (!layer->isValid()) {
        m_lastError = tr("Klarte ikke å opprette laget «%1».\n\nURI:\n%2")
                          .arg(definition.title, definition.uri);
        return false;
    }

    // Not added to the root: the layer tree node goes into our group instead
    QgsMapLayer* added = m_project->addMapLayer(layer.release(), false);
    if (!added) {
        m_lastError = tr("QGIS avviste laget «%1».").arg(definition.title);
        return false;
    }

    target->insertLayer(0, added);
    qDebug() << "[QGIS] Inserted" << definition.title << "at top of" << group;
    return true;
}
