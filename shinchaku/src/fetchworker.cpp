#include "fetchworker.h"
#include "anilistapi.h"
#include "mediasort.h"
#include "logger.h"

FetchWorker::FetchWorker(const ApplicationSettings::ApiSettings& settings,
                         const QDate& dateFrom, const QDate& dateTo,
                         QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_dateFrom(dateFrom)
    , m_dateTo(dateTo)
    , m_abort(0)
{
    qRegisterMetaType<MediaItem>("MediaItem");
    qRegisterMetaType<MediaItemList>("MediaItemList");
}

void FetchWorker::run()
{
    LOG(QString("[FetchWorker] Started for %1 .. %2")
        .arg(m_dateFrom.toString(Qt::ISODate), m_dateTo.toString(Qt::ISODate)));
    
    AniListApi api(m_settings);
    api.setAbortFlag(&m_abort);
    
    if (isAborted()) {
        LOG("[FetchWorker] Aborted before first request");
        return;
    }
    
    AniListApi::Response anime = api.fetchNew("ANIME", m_dateFrom, m_dateTo, m_settings.perPage);
    if (isAborted()) {
        LOG("[FetchWorker] Aborted after ANIME request");
        return;
    }
    if (!anime.ok) {
        emit error(anime.error);
        return;
    }
    
    AniListApi::Response manga = api.fetchNew("MANGA", m_dateFrom, m_dateTo, m_settings.perPage);
    if (isAborted()) {
        LOG("[FetchWorker] Aborted after MANGA request");
        return;
    }
    if (!manga.ok) {
        emit error(manga.error);
        return;
    }
    
    MediaItemList items = MediaSort::mergeAndSort(anime.items, manga.items);
    
    LOG(QString("[FetchWorker] %1 anime + %2 manga -> %3 unique items")
        .arg(anime.items.size()).arg(manga.items.size()).arg(items.size()));
    
    emit finished(items);
}

void FetchWorker::abort()
{
    m_abort.storeRelease(1);
}
