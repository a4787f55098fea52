#ifndef ANILISTAPI_H
#define ANILISTAPI_H

#include <QString>
#include <QByteArray>
#include <QDate>
#include <QJsonObject>
#include <QAtomicInt>
#include "mediaitem.h"
#include "applicationsettings.h"

/**
 * @class AniListApi
 * @brief Blocking client for the AniList GraphQL endpoint
 * 
 * Fetches one page of media of a single type whose start date lies strictly
 * between two dates. Each call creates its own QNetworkAccessManager and
 * spins a local event loop, so it can run on any thread (the FetchWorker
 * thread in the application, the test thread in unit tests).
 * 
 * No exceptions are thrown: every outcome is returned as a Response, and
 * failures carry a single message meant to be shown to the user as is.
 * 
 * Usage:
 *   AniListApi api(settings.api());
 *   AniListApi::Response r = api.fetchNew("ANIME", from, to, 40);
 *   if (!r.ok) {
 *       LOG(r.error);
 *   }
 */
class AniListApi
{
public:
    /**
     * @brief Outcome of a single fetch
     */
    struct Response {
        bool ok;
        QString error;          ///< User-facing message, empty when ok
        MediaItemList items;    ///< Empty when !ok
        
        Response() : ok(false) {}
        
        static Response success(const MediaItemList& items);
        static Response failure(const QString& error);
    };
    
    // Error bodies and GraphQL error dumps are cut to this many characters
    static constexpr int MAX_ERROR_TEXT = 2000;
    
    // Interval at which a running request checks the abort flag
    static constexpr int ABORT_POLL_INTERVAL_MS = 100;
    
    explicit AniListApi(const ApplicationSettings::ApiSettings& settings);
    
    /**
     * @brief Watch a flag that cancels the request in flight when set
     * 
     * The flag is polled while waiting for the reply. A cancelled request
     * returns a failure; the caller is expected to check its own flag and
     * drop the result.
     */
    void setAbortFlag(const QAtomicInt *abortFlag) { m_abortFlag = abortFlag; }
    
    /**
     * @brief Fetch new releases of one media type
     * @param mediaType "ANIME" or "MANGA"
     * @param dateFrom Lower bound (exclusive, startDate_greater)
     * @param dateTo Upper bound (exclusive, startDate_lesser)
     * @param perPage Page size, a single page is requested
     * @return Mapped items or an error message
     */
    Response fetchNew(const QString& mediaType, const QDate& dateFrom,
                      const QDate& dateTo, int perPage) const;
    
    /**
     * @brief The fixed GraphQL query sent with every request
     */
    static QString query();
    
    /**
     * @brief Build the JSON POST body (query + variables)
     */
    static QByteArray buildRequestBody(const QString& mediaType, const QDate& dateFrom,
                                       const QDate& dateTo, int perPage);
    
    /**
     * @brief Turn an HTTP reply into a Response
     * 
     * Handles non-200 statuses, invalid JSON and GraphQL error arrays, then
     * maps data.Page.media[] into items.
     * 
     * @param httpStatus HTTP status code of the reply
     * @param body Raw reply body
     * @param requestedType Media type used when an entry carries none
     */
    static Response parseResponse(int httpStatus, const QByteArray& body,
                                  const QString& requestedType);
    
    /**
     * @brief Map one element of data.Page.media[] to a MediaItem
     * 
     * Missing fields fall back to defaults ("Untitled", "Unknown", empty),
     * they never make the whole fetch fail.
     */
    static MediaItem mapMedia(const QJsonObject& media, const QString& requestedType);
    
private:
    bool abortRequested() const { return m_abortFlag && m_abortFlag->loadAcquire() != 0; }
    
    ApplicationSettings::ApiSettings m_settings;
    const QAtomicInt *m_abortFlag;
};

#endif // ANILISTAPI_H
