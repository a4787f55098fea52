#include "mediautils.h"
#include <QHash>
#include <QRegularExpression>

namespace MediaUtils {

namespace {

const QHash<QString, CountryInfo>& countryTable()
{
    static const QHash<QString, CountryInfo> table = {
        {"JPN", CountryInfo("Japan", "Japanese")},
        {"KOR", CountryInfo("South Korea", "Korean")},
        {"CHN", CountryInfo("China", "Chinese")},
        {"TWN", CountryInfo("Taiwan", "Chinese")},
        {"USA", CountryInfo("United States", "English")},
        {"CAN", CountryInfo("Canada", "English")},
        {"GBR", CountryInfo("United Kingdom", "English")},
        {"AUS", CountryInfo("Australia", "English")},
        {"FRA", CountryInfo("France", "French")},
        {"DEU", CountryInfo("Germany", "German")},
        {"ESP", CountryInfo("Spain", "Spanish")},
        {"ITA", CountryInfo("Italy", "Italian")},
        {"BRA", CountryInfo("Brazil", "Portuguese")},
        {"MEX", CountryInfo("Mexico", "Spanish")},
        {"RUS", CountryInfo("Russia", "Russian")},
        {"IND", CountryInfo("India", "Hindi")},
        {"PHL", CountryInfo("Philippines", "Filipino")},
        {"THA", CountryInfo("Thailand", "Thai")},
        {"VNM", CountryInfo("Vietnam", "Vietnamese")},
    };
    return table;
}

} // namespace

CountryInfo lookupCountry(const QString& code)
{
    const QHash<QString, CountryInfo>& table = countryTable();
    auto it = table.constFind(code);
    if (it != table.constEnd()) {
        return it.value();
    }
    
    return CountryInfo(code.isEmpty() ? QString("Unknown") : code, "Unknown");
}

QString cleanDescription(const QString& html)
{
    if (html.isEmpty()) {
        return QString();
    }
    
    static const QRegularExpression lineBreak("<br\\s*/?>", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression paragraphEnd("</p\\s*>", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression anyTag("<[^>]+>");
    static const QRegularExpression blankRun("\\n{3,}");
    
    QString text = html;
    text.remove('\r');
    text.replace(lineBreak, "\n");
    text.replace(paragraphEnd, "\n\n");
    text.remove(anyTag);
    
    text.replace("&amp;", "&");
    text.replace("&lt;", "<");
    text.replace("&gt;", ">");
    text.replace("&quot;", "\"");
    text.replace("&#039;", "'");
    
    text.replace(blankRun, "\n\n");
    return text.trimmed();
}

} // namespace MediaUtils
