#ifndef SEARCHFILTER_H
#define SEARCHFILTER_H

#include "catalog/serviceentry.h"

#include <QString>
#include <QVector>

/**
 * @brief SearchFilter - Free-text filtering of the service list
 *
 * An entry matches when the trimmed query occurs, ignoring case, in its name,
 * in the plain text of its description or in one of its tileset labels.
 * Results keep catalog order; an empty query returns the input unchanged.
 */
class SearchFilter {
public:
    static QVector<ServiceEntry> filter(const QVector<ServiceEntry>& entries, const QString& query);
    static bool matches(const ServiceEntry& entry, const QString& query);

    // Rich text -> visible text (tags dropped, entities decoded)
    static QString plainText(const QString& richText);
};

#endif // SEARCHFILTER_H
