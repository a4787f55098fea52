#ifndef MEDIASORT_H
#define MEDIASORT_H

#include "mediaitem.h"

/**
 * @brief Merge, deduplication and ordering of fetched media lists
 * 
 * The list shown to the user is the concatenation of the ANIME and MANGA
 * pages, with each (media type, id) pair kept once and ordered by the
 * descending tuple (release date, media type, lowercase title).
 */
class MediaSort
{
public:
    /**
     * @brief Keep each (media type, id) pair exactly once
     * 
     * The first occurrence keeps its position, the data of the last
     * occurrence wins.
     */
    static MediaItemList deduplicate(const MediaItemList& items);
    
    /**
     * @brief Sort newest first
     * 
     * Items without a start date sort as 1900-01-01. Ties on the date are
     * broken by media type and then by case-insensitive title, also
     * descending. Equal items keep their relative order.
     */
    static void sortByReleaseDesc(MediaItemList& items);
    
    /**
     * @brief Ordering predicate used by sortByReleaseDesc
     * @return true if a should be listed before b
     */
    static bool comesBefore(const MediaItem& a, const MediaItem& b);
    
    /**
     * @brief Concatenate, deduplicate and sort the per-type pages
     */
    static MediaItemList mergeAndSort(const MediaItemList& anime, const MediaItemList& manga);
};

#endif // MEDIASORT_H
