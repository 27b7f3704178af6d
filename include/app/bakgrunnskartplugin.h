#ifndef BAKGRUNNSKARTPLUGIN_H
#define BAKGRUNNSKARTPLUGIN_H

#include "catalog/catalog.h"

#include <QObject>
#include <qgisplugin.h>

class QAction;
class QToolBar;
class QgisInterface;

/**
 * @brief BakgrunnskartPlugin - QGIS entry point
 *
 * Adds a "Bakgrunnskart" action to the &Kartverket plugin menu and the
 * Kartverket toolbar. The action opens the service picker over the project
 * of the running QGIS instance.
 */
class BakgrunnskartPlugin : public QObject, public QgisPlugin
{
    Q_OBJECT
public:
    static const QString s_name;
    static const QString s_description;
    static const QString s_category;
    static const QString s_version;
    static const QString s_icon;
    static const QgisPlugin::PluginType s_type;

    explicit BakgrunnskartPlugin(QgisInterface* iface);

    void initGui() override;
    void unload() override;

public slots:
    void run();

private:
    static QString menuName();

    QgisInterface* m_iface{nullptr};
    QAction* m_action{nullptr};
    QToolBar* m_toolbar{nullptr};
    Catalog m_catalog;
};

#endif // BAKGRUNNSKARTPLUGIN_H
