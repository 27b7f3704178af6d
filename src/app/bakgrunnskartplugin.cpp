#include "app/bakgrunnskartplugin.h"
#include "app/dialogcompat.h"
#include "app/servicepickerdialog.h"
#include "catalog/catalogstore.h"
#include "host/hostintegration.h"
#include "host/qgislayerhost.h"
#include "iconmanager.h"

#include <QAction>
#include <QDebug>
#include <QMainWindow>
#include <QToolBar>

#include <qgis.h>
#include <qgisinterface.h>
#include <qgsproject.h>

const QString BakgrunnskartPlugin::s_name = QStringLiteral("Bakgrunnskart");
const QString BakgrunnskartPlugin::s_description =
    QStringLiteral("Legg til bakgrunnskart fra Kartverket (WMTS, WMS og vektorfliser)");
const QString BakgrunnskartPlugin::s_category = QStringLiteral("Plugins");
const QString BakgrunnskartPlugin::s_version = QStringLiteral("1.0.0");
const QString BakgrunnskartPlugin::s_icon = QStringLiteral(":/icons/bakgrunnskart.svg");
const QgisPlugin::PluginType BakgrunnskartPlugin::s_type = QgisPlugin::UI;

BakgrunnskartPlugin::BakgrunnskartPlugin(QgisInterface* iface)
    : QgisPlugin(s_name, s_description, s_category, s_version, s_type)
    , m_iface(iface)
{
}

QString BakgrunnskartPlugin::menuName()
{
    return tr("&Kartverket");
}

void BakgrunnskartPlugin::initGui()
{
    CatalogStore store;
    if (!store.load()) {
        qWarning() << "[Plugin] Catalog unavailable:" << store.lastError();
    }
    m_catalog = store.catalog();

    QWidget* mainWindow = m_iface->mainWindow();
    m_action = new QAction(IconManager::icon("bakgrunnskart"), tr("Bakgrunnskart"), mainWindow);
    m_action->setObjectName("mActionBakgrunnskart");
    connect(m_action, &QAction::triggered, this, &BakgrunnskartPlugin::run);

    m_iface->addPluginToMenu(menuName(), m_action);
    m_toolbar = m_iface->addToolBar(QStringLiteral("Kartverket"));
    if (m_toolbar) {
        m_toolbar->setObjectName("KartverketToolbar");
        m_toolbar->addAction(m_action);
    }
    qDebug() << "[Plugin] Initialized with" << m_catalog.size() << "services";
}

void BakgrunnskartPlugin::unload()
{
    if (!m_action) return;

    m_iface->removePluginMenu(menuName(), m_action);
    if (m_toolbar) {
        m_toolbar->removeAction(m_action);
        delete m_toolbar;
        m_toolbar = nullptr;
    }
    delete m_action;
    m_action = nullptr;
    qDebug() << "[Plugin] Unloaded";
}

void BakgrunnskartPlugin::run()
{
    QgisLayerHost host(QgsProject::instance());
    HostIntegrationAdapter adapter(&host);

    ServicePickerDialog dlg(m_catalog, &adapter, m_iface->mainWindow());
    if (DialogCompat::fromNative(dlg.exec()) != DialogResult::Accepted) return;

    qDebug() << "[Plugin] Added" << adapter.requestCount() << "layer request(s)";
}

// Native plugin entry points

QGISEXTERN QgisPlugin* classFactory(QgisInterface* qgisInterfacePointer)
{
    return new BakgrunnskartPlugin(qgisInterfacePointer);
}

QGISEXTERN const QString* name()
{
    return &BakgrunnskartPlugin::s_name;
}

QGISEXTERN const QString* description()
{
    return &BakgrunnskartPlugin::s_description;
}

QGISEXTERN const QString* category()
{
    return &BakgrunnskartPlugin::s_category;
}

QGISEXTERN int type()
{
    return BakgrunnskartPlugin::s_type;
}

QGISEXTERN const QString* version()
{
    return &BakgrunnskartPlugin::s_version;
}

QGISEXTERN const QString* icon()
{
    return &BakgrunnskartPlugin::s_icon;
}

QGISEXTERN void unload(QgisPlugin* pluginPointer)
{
    delete pluginPointer;
}
