#include "iconmanager.h"
#include <QFile>
#include <QDebug>

QIcon IconManager::icon(const QString& name)
{
    const QString path = QString(":/icons/%1.svg").arg(name);
    if (!QFile::exists(path)) {
        qWarning() << "[Icon] Missing icon resource" << path;
        return QIcon();
    }
    return QIcon(path);
}
