#include "mediacard.h"
#include "imagecache.h"
#include "pilllabel.h"
#include "uistyle.h"
#include "uicolors.h"
#include <QSizePolicy>
#include <QStringList>

MediaCard::MediaCard(const MediaItem& item, ImageCache *imageCache, QWidget *parent)
    : QFrame(parent)
    , m_item(item)
    , m_imageCache(imageCache)
    , m_hasCover(false)
    , m_thumbLabel(nullptr)
    , m_titleLabel(nullptr)
    , m_nativeLabel(nullptr)
    , m_metaLabel(nullptr)
    , m_typeBadge(nullptr)
{
    setObjectName("MediaCard");
    setFrameShape(QFrame::NoFrame);
    
    setupUI();
    
    if (m_imageCache && !m_item.imageUrl().isEmpty()) {
        m_imageCache->request(m_item.imageUrl());
        // Already cached covers show up immediately
        updateImageIfReady();
    }
}

void MediaCard::setupUI()
{
    QHBoxLayout *root = new QHBoxLayout(this);
    root->setContentsMargins(10, 10, 10, 10);
    root->setSpacing(10);
    
    m_thumbLabel = new QLabel(this);
    m_thumbLabel->setObjectName("Thumb");
    m_thumbLabel->setFixedSize(thumbnailSize());
    m_thumbLabel->setAlignment(Qt::AlignCenter);
    m_thumbLabel->setScaledContents(true);
    m_thumbLabel->setPixmap(UIStyle::thumbnailPlaceholder(thumbnailSize()));
    
    QVBoxLayout *middle = new QVBoxLayout();
    middle->setContentsMargins(0, 0, 0, 0);
    middle->setSpacing(4);
    
    QHBoxLayout *titleRow = new QHBoxLayout();
    titleRow->setContentsMargins(0, 0, 0, 0);
    titleRow->setSpacing(8);
    
    m_titleLabel = new QLabel(m_item.title(), this);
    m_titleLabel->setObjectName("CardTitle");
    m_titleLabel->setWordWrap(false);
    m_titleLabel->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
    
    m_typeBadge = new PillLabel(m_item.mediaType(), PillLabel::kindForMediaType(m_item.mediaType()), this);
    
    titleRow->addWidget(m_titleLabel, 1);
    titleRow->addWidget(m_typeBadge, 0);
    middle->addLayout(titleRow);
    
    m_nativeLabel = new QLabel(m_item.titleNative(), this);
    m_nativeLabel->setObjectName("CardSub");
    m_nativeLabel->setWordWrap(false);
    if (m_item.titleNative().isEmpty()) {
        m_nativeLabel->hide();
    } else {
        middle->addWidget(m_nativeLabel);
    }
    
    m_metaLabel = new QLabel(formatMeta(m_item), this);
    m_metaLabel->setObjectName("CardMeta");
    m_metaLabel->setWordWrap(false);
    m_metaLabel->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
    middle->addWidget(m_metaLabel);
    
    root->addWidget(m_thumbLabel, 0);
    root->addLayout(middle, 1);
}

QString MediaCard::formatMeta(const MediaItem& item)
{
    QStringList parts;
    parts << item.publicationDay()
          << item.country()
          << item.language()
          << item.format()
          << item.status();
    return parts.join(UIIcons::META_SEPARATOR);
}

void MediaCard::updateImageIfReady()
{
    if (!m_imageCache || m_item.imageUrl().isEmpty()) {
        return;
    }
    
    QPixmap cover = m_imageCache->get(m_item.imageUrl());
    if (cover.isNull()) {
        return;
    }
    
    m_thumbLabel->setPixmap(cover.scaled(m_thumbLabel->size(),
                                         Qt::KeepAspectRatioByExpanding,
                                         Qt::SmoothTransformation));
    m_hasCover = true;
}
