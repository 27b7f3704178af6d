#include "catalog/searchfilter.h"

#include <QTextDocumentFragment>

QString SearchFilter::plainText(const QString& richText)
{
    if (richText.isEmpty()) return QString();
    return QTextDocumentFragment::fromHtml(richText).toPlainText();
}

bool SearchFilter::matches(const ServiceEntry& entry, const QString& query)
{
    const QString q = query.trimmed();
    if (q.isEmpty()) return true;

    if (entry.name.contains(q, Qt::CaseInsensitive)) return true;
    if (plainText(entry.description).contains(q, Qt::CaseInsensitive)) return true;
    for (const TilesetVariant& v : entry.variants()) {
        if (v.label.contains(q, Qt::CaseInsensitive)) return true;
    }
    return false;
}

QVector<ServiceEntry> SearchFilter::filter(const QVector<ServiceEntry>& entries, const QString& query)
{
    if (query.trimmed().isEmpty()) return entries;

    QVector<ServiceEntry> out;
    for (const ServiceEntry& e : entries) {
        if (matches(e, query)) out.append(e);
    }
    return out;
}
