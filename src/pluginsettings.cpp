#include "pluginsettings.h"
#include <QSettings>

static QString key(const char* name)
{
    return QStringLiteral("Bakgrunnskart/") + QLatin1String(name);
}

QString PluginSettings::lastServiceId()
{
    QSettings s;
    return s.value(key("selection/service")).toString();
}

void PluginSettings::setLastServiceId(const QString& id)
{
    QSettings s;
    s.setValue(key("selection/service"), id);
}

QString PluginSettings::lastOfferingKey()
{
    QSettings s;
    return s.value(key("selection/offering")).toString();
}

void PluginSettings::setLastOfferingKey(const QString& offeringKey)
{
    QSettings s;
    s.setValue(key("selection/offering"), offeringKey);
}

QString PluginSettings::lastTilesetLabel()
{
    QSettings s;
    return s.value(key("selection/tileset")).toString();
}

void PluginSettings::setLastTilesetLabel(const QString& label)
{
    QSettings s;
    s.setValue(key("selection/tileset"), label);
}

void PluginSettings::rememberSelection(const QString& serviceId, const QString& offeringKey,
                                       const QString& tilesetLabel)
{
    setLastServiceId(serviceId);
    setLastOfferingKey(offeringKey);
    setLastTilesetLabel(tilesetLabel);
}

QString PluginSettings::previewCropAnchor()
{
    QSettings s;
    const QString v = s.value(key("preview/anchor"), "top").toString().toLower();
    return v == "center" ? v : QStringLiteral("top");
}

void PluginSettings::setPreviewCropAnchor(const QString& anchor)
{
    QSettings s;
    s.setValue(key("preview/anchor"), anchor.toLower());
}

QSize PluginSettings::previewSize()
{
    QSettings s;
    const QSize sz = s.value(key("preview/size"), QSize(550, 220)).toSize();
    if (sz.width() < 50 || sz.height() < 20) return QSize(550, 220);
    return sz;
}

void PluginSettings::setPreviewSize(const QSize& size)
{
    QSettings s;
    s.setValue(key("preview/size"), size);
}

int PluginSettings::listIconSize()
{
    QSettings s;
    const int px = s.value(key("list/iconSize"), 50).toInt();
    return qBound(16, px, 128);
}

void PluginSettings::setListIconSize(int px)
{
    QSettings s;
    s.setValue(key("list/iconSize"), px);
}
