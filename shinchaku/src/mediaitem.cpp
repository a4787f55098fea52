#include "mediaitem.h"

MediaItem::MediaItem()
    : m_id(0)
{
}

MediaItem::MediaItem(int id, const QString& mediaType, const QString& title,
                     const QString& titleNative, const QString& imageUrl,
                     const QString& countryCode, const QString& country,
                     const QString& language, const QDate& startDate,
                     const QString& format, const QString& status,
                     const QString& description, const QString& siteUrl)
    : m_id(id)
    , m_mediaType(mediaType)
    , m_title(title)
    , m_titleNative(titleNative)
    , m_imageUrl(imageUrl)
    , m_countryCode(countryCode)
    , m_country(country)
    , m_language(language)
    , m_startDate(startDate)
    , m_format(format)
    , m_status(status)
    , m_description(description)
    , m_siteUrl(siteUrl)
{
}

QString MediaItem::publicationDay() const
{
    if (!m_startDate.isValid()) {
        return "Unknown";
    }
    return m_startDate.toString(Qt::ISODate);
}

QDate MediaItem::keyDate() const
{
    return m_startDate.isValid() ? m_startDate : QDate(1900, 1, 1);
}

QDate MediaItem::fromFuzzyDate(int year, int month, int day)
{
    if (year == 0 || month == 0 || day == 0) {
        return QDate();
    }
    
    // QDate rejects out-of-range parts (e.g. 2023-02-30) by staying invalid
    QDate date(year, month, day);
    return date.isValid() ? date : QDate();
}

bool MediaItem::operator==(const MediaItem& other) const
{
    return m_id == other.m_id
        && m_mediaType == other.m_mediaType
        && m_title == other.m_title
        && m_titleNative == other.m_titleNative
        && m_imageUrl == other.m_imageUrl
        && m_countryCode == other.m_countryCode
        && m_country == other.m_country
        && m_language == other.m_language
        && m_startDate == other.m_startDate
        && m_format == other.m_format
        && m_status == other.m_status
        && m_description == other.m_description
        && m_siteUrl == other.m_siteUrl;
}
