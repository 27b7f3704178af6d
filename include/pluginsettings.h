#ifndef PLUGINSETTINGS_H
#define PLUGINSETTINGS_H

#include <QString>
#include <QSize>

// Persistent plugin preferences, stored in the host's QSettings under
// "Bakgrunnskart/".
class PluginSettings {
public:
    // Last confirmed choice, restored when the dialog opens
    static QString lastServiceId();
    static void setLastServiceId(const QString& id);
    static QString lastOfferingKey();
    static void setLastOfferingKey(const QString& key);
    static QString lastTilesetLabel();
    static void setLastTilesetLabel(const QString& label);
    static void rememberSelection(const QString& serviceId, const QString& offeringKey,
                                  const QString& tilesetLabel);

    // Preview
    static QString previewCropAnchor();     // "top" or "center"
    static void setPreviewCropAnchor(const QString& anchor);
    static QSize previewSize();
    static void setPreviewSize(const QSize& size);
    static int listIconSize();
    static void setListIconSize(int px);
};

#endif // PLUGINSETTINGS_H
