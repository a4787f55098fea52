#ifndef MEDIACARD_H
#define MEDIACARD_H

#include <QFrame>
#include <QLabel>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QPixmap>
#include "mediaitem.h"

class ImageCache;
class PillLabel;

/**
 * MediaCard - One row of the release list
 * 
 * Layout:
 * +-----+------------------------------+
 * |     |Title                   [TYPE]|
 * |thumb|Native title                  |
 * |     |day • country • lang • fmt • st|
 * +-----+------------------------------+
 * 
 * Creating a card asks the image cache for its cover. The window calls
 * updateImageIfReady() when the cache reports the cover URL.
 */
class MediaCard : public QFrame
{
    Q_OBJECT
    
public:
    MediaCard(const MediaItem& item, ImageCache *imageCache, QWidget *parent = nullptr);
    
    const MediaItem& item() const { return m_item; }
    
    // Whether the thumbnail shows the downloaded cover instead of the placeholder
    bool hasCover() const { return m_hasCover; }
    
    QString titleText() const { return m_titleLabel->text(); }
    QString metaText() const { return m_metaLabel->text(); }
    
    static QSize thumbnailSize() { return QSize(60, 84); }
    static int rowHeight() { return 106; }
    
    /**
     * Build the one-line summary shown under the title
     */
    static QString formatMeta(const MediaItem& item);
    
public slots:
    void updateImageIfReady();
    
private:
    void setupUI();
    
    MediaItem m_item;
    ImageCache *m_imageCache;
    bool m_hasCover;
    
    QLabel *m_thumbLabel;
    QLabel *m_titleLabel;
    QLabel *m_nativeLabel;
    QLabel *m_metaLabel;
    PillLabel *m_typeBadge;
};

#endif // MEDIACARD_H
