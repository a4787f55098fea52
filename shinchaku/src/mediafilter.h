#ifndef MEDIAFILTER_H
#define MEDIAFILTER_H

#include <QString>
#include <QList>
#include "mediaitem.h"

/**
 * Abstract base class for media list filters
 * 
 * Each filter decides on a single MediaItem, so filters can be tested in
 * isolation and combined with CompositeFilter.
 */
class MediaFilter
{
public:
    virtual ~MediaFilter() = default;
    
    /**
     * Check if an item passes this filter
     * @param item Media item to check
     * @return true if the item should be listed
     */
    virtual bool matches(const MediaItem& item) const = 0;
    
    /**
     * Get human-readable description of this filter
     * Used for logging
     */
    virtual QString description() const = 0;
};

/**
 * Filter by search text in the title or the native title
 * 
 * The text is trimmed and matched case-insensitively as a substring.
 */
class SearchFilter : public MediaFilter
{
public:
    explicit SearchFilter(const QString& searchText);
    
    bool matches(const MediaItem& item) const override;
    QString description() const override;
    
private:
    QString m_searchText;
};

/**
 * Filter by media type
 * Modes: "ALL", "ANIME", "MANGA"
 */
class TypeFilter : public MediaFilter
{
public:
    static const QString ALL;
    static const QString ANIME;
    static const QString MANGA;
    
    explicit TypeFilter(const QString& mode);
    
    bool matches(const MediaItem& item) const override;
    QString description() const override;
    
    QString mode() const { return m_mode; }
    
private:
    QString m_mode;
};

/**
 * Composite filter - combines multiple filters with AND logic
 * 
 * All filters must pass for the composite to pass.
 */
class CompositeFilter : public MediaFilter
{
public:
    CompositeFilter() = default;
    ~CompositeFilter() override;
    
    CompositeFilter(const CompositeFilter&) = delete;
    CompositeFilter& operator=(const CompositeFilter&) = delete;
    
    // Add a filter to the composite (takes ownership)
    void addFilter(MediaFilter* filter);
    
    // Remove all filters
    void clear();
    
    bool matches(const MediaItem& item) const override;
    QString description() const override;
    
    /**
     * Items that pass every filter, in their original order
     */
    MediaItemList apply(const MediaItemList& items) const;
    
    // Get count of active filters
    int count() const { return m_filters.size(); }
    
private:
    QList<MediaFilter*> m_filters;
};

#endif // MEDIAFILTER_H
