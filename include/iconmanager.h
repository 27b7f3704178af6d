#ifndef ICONMANAGER_H
#define ICONMANAGER_H

#include <QIcon>
#include <QString>

class IconManager {
public:
    // Icon ":/icons/<name>.svg", or a null icon when the resource is missing
    static QIcon icon(const QString& name);
};

#endif // ICONMANAGER_H
