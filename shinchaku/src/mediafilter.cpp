#include "mediafilter.h"
#include <QStringList>

// ============================================================================
// SearchFilter Implementation
// ============================================================================

SearchFilter::SearchFilter(const QString& searchText)
    : m_searchText(searchText.trimmed())
{
}

bool SearchFilter::matches(const MediaItem& item) const
{
    if (m_searchText.isEmpty()) {
        return true;
    }
    
    if (item.title().contains(m_searchText, Qt::CaseInsensitive)) {
        return true;
    }
    
    return !item.titleNative().isEmpty()
        && item.titleNative().contains(m_searchText, Qt::CaseInsensitive);
}

QString SearchFilter::description() const
{
    return m_searchText.isEmpty()
        ? QString("No search filter")
        : QString("Search: \"%1\"").arg(m_searchText);
}

// ============================================================================
// TypeFilter Implementation
// ============================================================================

const QString TypeFilter::ALL = QStringLiteral("ALL");
const QString TypeFilter::ANIME = QStringLiteral("ANIME");
const QString TypeFilter::MANGA = QStringLiteral("MANGA");

TypeFilter::TypeFilter(const QString& mode)
    : m_mode(mode.isEmpty() ? ALL : mode)
{
}

bool TypeFilter::matches(const MediaItem& item) const
{
    if (m_mode == ALL) {
        return true;
    }
    
    return item.mediaType() == m_mode;
}

QString TypeFilter::description() const
{
    return m_mode == ALL
        ? QString("All types")
        : QString("Type: %1").arg(m_mode);
}

// ============================================================================
// CompositeFilter Implementation
// ============================================================================

CompositeFilter::~CompositeFilter()
{
    clear();
}

void CompositeFilter::addFilter(MediaFilter* filter)
{
    if (filter) {
        m_filters.append(filter);
    }
}

void CompositeFilter::clear()
{
    qDeleteAll(m_filters);
    m_filters.clear();
}

bool CompositeFilter::matches(const MediaItem& item) const
{
    // All filters must pass (AND logic)
    for (const MediaFilter* filter : m_filters) {
        if (filter && !filter->matches(item)) {
            return false;
        }
    }
    return true;
}

QString CompositeFilter::description() const
{
    if (m_filters.isEmpty()) {
        return QString("No filters active");
    }
    
    QStringList descriptions;
    for (const MediaFilter* filter : m_filters) {
        if (filter) {
            descriptions.append(filter->description());
        }
    }
    
    return descriptions.join(" AND ");
}

MediaItemList CompositeFilter::apply(const MediaItemList& items) const
{
    MediaItemList result;
    for (const MediaItem& item : items) {
        if (matches(item)) {
            result.append(item);
        }
    }
    return result;
}
