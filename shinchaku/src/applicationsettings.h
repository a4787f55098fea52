#ifndef APPLICATIONSETTINGS_H
#define APPLICATIONSETTINGS_H

#include <QString>
#include <QUrl>
#include <QSize>
#include <QList>

/**
 * @brief Holds all application settings in typed groups
 * 
 * Settings are built with their defaults and handed to the components that
 * need them (AniList client, fetch worker, window). Nothing is read from or
 * written to disk. Setters validate their input and keep the previous value
 * when it is rejected.
 */
class ApplicationSettings
{
public:
    /**
     * @brief AniList GraphQL endpoint and request parameters
     */
    struct ApiSettings {
        QUrl endpoint;
        int perPage;            // Items requested per media type (one page only)
        int timeoutMs;          // Transfer timeout for a single request
        QString userAgent;
        
        ApiSettings()
            : endpoint(QStringLiteral("https://graphql.anilist.co"))
            , perPage(40)
            , timeoutMs(25000)
            , userAgent(QStringLiteral("Shinchaku/1.0 (Qt; personal use)")) {}
    };
    
    /**
     * @brief Date range preselected in the header
     */
    struct RangeSettings {
        int defaultRangeDays;   // "From" defaults to today minus this many days
        
        RangeSettings() : defaultRangeDays(7) {}
    };
    
    /**
     * @brief Window geometry preferences
     */
    struct UISettings {
        QSize minimumWindowSize;
        QList<int> splitterSizes;   // List pane, detail pane
        
        UISettings() : minimumWindowSize(980, 600), splitterSizes({520, 440}) {}
    };
    
    // AniList caps perPage at 50
    static constexpr int MAX_PER_PAGE = 50;
    
    ApplicationSettings() = default;
    
    // === API ===
    
    const ApiSettings& api() const { return m_api; }
    
    QUrl getEndpoint() const { return m_api.endpoint; }
    void setEndpoint(const QUrl& endpoint);
    
    int getPerPage() const { return m_api.perPage; }
    void setPerPage(int perPage);
    
    int getTimeoutMs() const { return m_api.timeoutMs; }
    void setTimeoutMs(int timeoutMs);
    
    QString getUserAgent() const { return m_api.userAgent; }
    void setUserAgent(const QString& userAgent);
    
    // === Range ===
    
    const RangeSettings& range() const { return m_range; }
    
    int getDefaultRangeDays() const { return m_range.defaultRangeDays; }
    void setDefaultRangeDays(int days);
    
    // === UI ===
    
    const UISettings& ui() const { return m_ui; }
    
    QSize getMinimumWindowSize() const { return m_ui.minimumWindowSize; }
    QList<int> getSplitterSizes() const { return m_ui.splitterSizes; }
    
private:
    ApiSettings m_api;
    RangeSettings m_range;
    UISettings m_ui;
};

#endif // APPLICATIONSETTINGS_H
