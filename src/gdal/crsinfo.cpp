#include "gdal/crsinfo.h"

#include <ogr_spatialref.h>
#include <cpl_error.h>

#include <QHash>
#include <QDebug>

namespace {

// Code -> name; empty name marks a code OGR could not resolve
QHash<QString, QString>& nameCache()
{
    static QHash<QString, QString> cache;
    return cache;
}

QString lookup(const QString& code)
{
    QHash<QString, QString>& cache = nameCache();
    auto it = cache.constFind(code);
    if (it != cache.constEnd()) return it.value();

    QString name;
    OGRSpatialReference srs;
    CPLPushErrorHandler(CPLQuietErrorHandler);
    const OGRErr err = srs.SetFromUserInput(code.toUtf8().constData());
    CPLPopErrorHandler();
    if (err == OGRERR_NONE) {
        const char* n = srs.GetName();
        if (n) name = QString::fromUtf8(n);
    } else {
        qDebug() << "[CRS] Unknown CRS" << code << ":" << CPLGetLastErrorMsg();
    }

    cache.insert(code, name);
    return name;
}

} // namespace

QString CrsInfo::displayName(const QString& code)
{
    const QString c = code.trimmed();
    if (c.isEmpty()) return QString();
    const QString name = lookup(c);
    return name.isEmpty() ? c : name;
}

bool CrsInfo::isKnown(const QString& code)
{
    const QString c = code.trimmed();
    if (c.isEmpty()) return false;
    return !lookup(c).isEmpty();
}

QString CrsInfo::tooltip(const QString& code)
{
    const QString c = code.trimmed();
    if (c.isEmpty()) return QString();
    const QString name = lookup(c);
    if (name.isEmpty()) return c;
    return QString("%1 (%2)").arg(name, c);
}
