#ifndef MEDIAUTILS_H
#define MEDIAUTILS_H

#include <QString>
#include <QDate>

/**
 * Utility functions for AniList media data processing
 */
namespace MediaUtils {

/**
 * Country and main language for an AniList countryOfOrigin code
 */
struct CountryInfo {
    QString country;
    QString language;
    
    CountryInfo() = default;
    CountryInfo(const QString& c, const QString& l) : country(c), language(l) {}
    
    bool operator==(const CountryInfo& other) const {
        return country == other.country && language == other.language;
    }
};

/**
 * Look up country name and main language for an ISO alpha-3 code
 * 
 * Unknown codes map to (code, "Unknown"), an empty code maps to
 * ("Unknown", "Unknown"). Never fails.
 * 
 * @param code countryOfOrigin value from AniList (e.g. "JPN")
 * @return Country and language names
 */
CountryInfo lookupCountry(const QString& code);

/**
 * Encode a date as the YYYYMMDD integer AniList uses for FuzzyDateInt
 * 
 * @param date Calendar date (must be valid)
 * @return year*10000 + month*100 + day
 */
inline int fuzzyDateInt(const QDate& date)
{
    return date.year() * 10000 + date.month() * 100 + date.day();
}

/**
 * Convert an AniList description to plain text
 * 
 * Line breaks (<br>) and paragraph ends (</p>) become newlines, all other
 * tags are stripped, the common HTML entities are decoded and runs of blank
 * lines collapse to a single empty line.
 * 
 * @param html Raw description, may be empty
 * @return Trimmed plain text
 */
QString cleanDescription(const QString& html);

} // namespace MediaUtils

#endif // MEDIAUTILS_H
