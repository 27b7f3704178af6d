#ifndef QGISLAYERHOST_H
#define QGISLAYERHOST_H

#include "host/layerhost.h"

#include <QCoreApplication>

class QgsProject;

// LayerHost backed by a QGIS project's layer tree
class QgisLayerHost : public LayerHost {
    Q_DECLARE_TR_FUNCTIONS(QgisLayerHost)
public:
    explicit QgisLayerHost(QgsProject* project);

    bool createOrGetGroup(const QString& name, bool* created = nullptr) override;
    bool addLayerToGroup(const QString& group, const LayerDefinition& definition) override;
    QString lastError() const override { return m_lastError; }

private:
    QgsProject* m_project{nullptr};
    QString m_lastError;
};

#endif // QGISLAYERHOST_H
