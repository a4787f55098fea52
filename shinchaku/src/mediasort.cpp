#include "mediasort.h"
#include <QHash>
#include <algorithm>

MediaItemList MediaSort::deduplicate(const MediaItemList& items)
{
    MediaItemList result;
    result.reserve(items.size());
    QHash<MediaItem::DedupKey, int> positions;
    
    for (const MediaItem& item : items) {
        MediaItem::DedupKey key = item.dedupKey();
        auto it = positions.constFind(key);
        if (it != positions.constEnd()) {
            result[it.value()] = item;
        } else {
            positions.insert(key, static_cast<int>(result.size()));
            result.append(item);
        }
    }
    
    return result;
}

bool MediaSort::comesBefore(const MediaItem& a, const MediaItem& b)
{
    QDate dateA = a.keyDate();
    QDate dateB = b.keyDate();
    if (dateA != dateB) {
        return dateA > dateB;
    }
    
    if (a.mediaType() != b.mediaType()) {
        return a.mediaType() > b.mediaType();
    }
    
    return a.title().toLower() > b.title().toLower();
}

void MediaSort::sortByReleaseDesc(MediaItemList& items)
{
    std::stable_sort(items.begin(), items.end(), &MediaSort::comesBefore);
}

MediaItemList MediaSort::mergeAndSort(const MediaItemList& anime, const MediaItemList& manga)
{
    MediaItemList merged = deduplicate(anime + manga);
    sortByReleaseDesc(merged);
    return merged;
}
