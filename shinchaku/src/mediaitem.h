#ifndef MEDIAITEM_H
#define MEDIAITEM_H

#include <QString>
#include <QDate>
#include <QPair>
#include <QList>
#include <QMetaType>

/**
 * @class MediaItem
 * @brief One anime or manga release record returned by AniList
 * 
 * Items are built once per fetch by the AniList response mapper and are not
 * modified afterwards. All fallbacks ("Unknown", "Untitled") are applied by
 * the mapper, so getters never need to guess.
 * 
 * The start date may be null when AniList only knows part of it (fuzzy date).
 * Such items display "Unknown" and sort as if released on 1900-01-01.
 */
class MediaItem
{
public:
    /// (media type, AniList id) - identifies an entry across both fetches
    typedef QPair<QString, int> DedupKey;
    
    MediaItem();
    MediaItem(int id, const QString& mediaType, const QString& title,
              const QString& titleNative, const QString& imageUrl,
              const QString& countryCode, const QString& country,
              const QString& language, const QDate& startDate,
              const QString& format, const QString& status,
              const QString& description, const QString& siteUrl);
    
    // Getters
    int id() const { return m_id; }
    QString mediaType() const { return m_mediaType; }
    QString title() const { return m_title; }
    QString titleNative() const { return m_titleNative; }
    QString imageUrl() const { return m_imageUrl; }
    QString countryCode() const { return m_countryCode; }
    QString country() const { return m_country; }
    QString language() const { return m_language; }
    QDate startDate() const { return m_startDate; }
    QString format() const { return m_format; }
    QString status() const { return m_status; }
    QString description() const { return m_description; }
    QString siteUrl() const { return m_siteUrl; }
    
    bool hasStartDate() const { return m_startDate.isValid(); }
    bool isAnime() const { return m_mediaType == QLatin1String("ANIME"); }
    
    /**
     * @brief Start date formatted for display
     * @return ISO date (yyyy-MM-dd) or "Unknown" when the date is null
     */
    QString publicationDay() const;
    
    /**
     * @brief Sortable date key
     * @return Start date, or 1900-01-01 when the date is null
     */
    QDate keyDate() const;
    
    DedupKey dedupKey() const { return DedupKey(m_mediaType, m_id); }
    
    /**
     * @brief Build a start date from AniList fuzzy date parts
     * 
     * All three parts must be non-zero and form a real calendar date,
     * otherwise a null QDate is returned.
     */
    static QDate fromFuzzyDate(int year, int month, int day);
    
    bool operator==(const MediaItem& other) const;
    bool operator!=(const MediaItem& other) const { return !(*this == other); }
    
private:
    int m_id;
    QString m_mediaType;      ///< "ANIME" or "MANGA"
    QString m_title;          ///< English title, romaji fallback
    QString m_titleNative;
    QString m_imageUrl;       ///< Cover image URL (large, medium fallback)
    QString m_countryCode;    ///< Raw countryOfOrigin code
    QString m_country;
    QString m_language;
    QDate m_startDate;        ///< Null when the fuzzy date is incomplete
    QString m_format;
    QString m_status;
    QString m_description;    ///< Plain text, HTML already stripped
    QString m_siteUrl;
};

Q_DECLARE_METATYPE(MediaItem)

typedef QList<MediaItem> MediaItemList;

#endif // MEDIAITEM_H
