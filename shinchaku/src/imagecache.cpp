#include "imagecache.h"
#include "logger.h"
#include <QNetworkRequest>
#include <QUrl>

ImageCache::ImageCache(const QString& userAgent, QObject *parent)
    : QObject(parent)
    , m_networkManager(nullptr)
    , m_userAgent(userAgent)
{
    m_networkManager = new QNetworkAccessManager(this);
    connect(m_networkManager, &QNetworkAccessManager::finished,
            this, &ImageCache::onDownloadFinished);
}

ImageCache::~ImageCache()
{
    // Replies still in flight are children of the manager, drop them quietly
    disconnect(m_networkManager, nullptr, this, nullptr);
    for (QNetworkReply *reply : m_pendingRequests.keys()) {
        reply->abort();
    }
}

QPixmap ImageCache::get(const QString& url) const
{
    if (url.isEmpty()) {
        return QPixmap();
    }
    return m_cache.value(url);
}

void ImageCache::request(const QString& url)
{
    if (url.isEmpty() || m_cache.contains(url) || m_pendingUrls.contains(url)) {
        return;
    }
    
    QNetworkRequest request((QUrl(url)));
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    if (!m_userAgent.isEmpty()) {
        request.setHeader(QNetworkRequest::UserAgentHeader, m_userAgent);
    }
    
    QNetworkReply *reply = m_networkManager->get(request);
    m_pendingRequests.insert(reply, url);
    m_pendingUrls.insert(url);
}

void ImageCache::onDownloadFinished(QNetworkReply *reply)
{
    if (!m_pendingRequests.contains(reply)) {
        reply->deleteLater();
        return;
    }
    
    QString url = m_pendingRequests.take(reply);
    m_pendingUrls.remove(url);
    
    if (reply->error() != QNetworkReply::NoError) {
        LOG(QString("[ImageCache] Download error for %1: %2").arg(url, reply->errorString()));
        reply->deleteLater();
        return;
    }
    
    QByteArray imageData = reply->readAll();
    reply->deleteLater();
    
    if (imageData.isEmpty()) {
        LOG(QString("[ImageCache] Empty image data for %1").arg(url));
        return;
    }
    
    QPixmap pixmap;
    if (!pixmap.loadFromData(imageData)) {
        LOG(QString("[ImageCache] Could not decode image from %1 (%2 bytes)")
            .arg(url).arg(imageData.size()));
        return;
    }
    
    m_cache.insert(url, pixmap);
    emit imageReady(url);
}
