#ifndef LAYERDEFINITION_H
#define LAYERDEFINITION_H

#include <QString>

// What the host needs to construct a map layer
struct LayerDefinition {
    enum class Type {
        Raster,         // QGIS "wms" provider: WMS, WMTS and XYZ
        VectorTile
    };

    Type type{Type::Raster};
    QString uri;
    QString title;
    QString provider;
};

#endif // LAYERDEFINITION_H
