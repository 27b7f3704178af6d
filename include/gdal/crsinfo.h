#ifndef CRSINFO_H
#define CRSINFO_H

#include <QString>

// CRS lookups through GDAL/OGR (PROJ database)
class CrsInfo {
public:
    // "EPSG:25832" -> "ETRS89 / UTM zone 32N". Unknown codes come back as-is.
    static QString displayName(const QString& code);

    static bool isKnown(const QString& code);

    // Tooltip text for a tileset radio button
    static QString tooltip(const QString& code);
};

#endif // CRSINFO_H
