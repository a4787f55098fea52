#ifndef IMAGECACHE_H
#define IMAGECACHE_H

#include <QObject>
#include <QString>
#include <QHash>
#include <QMap>
#include <QSet>
#include <QPixmap>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>

/**
 * @brief ImageCache - In-memory cover image cache keyed by URL
 * 
 * Cover images are downloaded at most once per URL while a request is in
 * flight, decoded into QPixmaps and kept for the lifetime of the cache.
 * Widgets ask for an image with request(), then poll get() when
 * imageReady() fires for their URL.
 * 
 * Lives on the UI thread (QPixmap is not usable elsewhere). There is no
 * eviction and nothing is written to disk.
 */
class ImageCache : public QObject
{
    Q_OBJECT
    
public:
    explicit ImageCache(const QString& userAgent = QString(), QObject *parent = nullptr);
    ~ImageCache() override;
    
    /**
     * @brief Get a cached image
     * @param url Image URL
     * @return Decoded image, or a null pixmap if not (yet) cached
     */
    QPixmap get(const QString& url) const;
    
    /**
     * @brief Start downloading an image unless it is cached or pending
     * 
     * Empty URLs are ignored.
     */
    void request(const QString& url);
    
    bool contains(const QString& url) const { return m_cache.contains(url); }
    bool isPending(const QString& url) const { return m_pendingUrls.contains(url); }
    int size() const { return m_cache.size(); }
    int pendingCount() const { return m_pendingUrls.size(); }
    
signals:
    /**
     * Emitted once an image has been downloaded and decoded
     */
    void imageReady(const QString &url);
    
private slots:
    void onDownloadFinished(QNetworkReply *reply);
    
private:
    QNetworkAccessManager *m_networkManager;
    QString m_userAgent;
    QHash<QString, QPixmap> m_cache;
    QMap<QNetworkReply*, QString> m_pendingRequests;
    QSet<QString> m_pendingUrls;
};

#endif // IMAGECACHE_H
