#include "mediadetailview.h"
#include "imagecache.h"
#include "pilllabel.h"
#include "uistyle.h"
#include "uicolors.h"
#include "logger.h"
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QApplication>
#include <QClipboard>
#include <QDesktopServices>
#include <QUrl>

MediaDetailView::MediaDetailView(ImageCache *imageCache, QWidget *parent)
    : QFrame(parent)
    , m_imageCache(imageCache)
    , m_hasItem(false)
    , m_hasCover(false)
{
    setObjectName("Pane");
    setupUI();
    clear();
}

void MediaDetailView::setupUI()
{
    QVBoxLayout *root = new QVBoxLayout(this);
    root->setContentsMargins(14, 14, 14, 14);
    root->setSpacing(10);
    
    QFrame *hero = new QFrame(this);
    hero->setObjectName("DetailHero");
    QHBoxLayout *heroLayout = new QHBoxLayout(hero);
    heroLayout->setContentsMargins(12, 12, 12, 12);
    heroLayout->setSpacing(12);
    
    m_coverLabel = new QLabel(hero);
    m_coverLabel->setObjectName("DetailImg");
    m_coverLabel->setFixedSize(coverSize());
    m_coverLabel->setAlignment(Qt::AlignCenter);
    m_coverLabel->setScaledContents(true);
    
    QVBoxLayout *infoLayout = new QVBoxLayout();
    infoLayout->setSpacing(6);
    
    m_titleLabel = new QLabel(hero);
    m_titleLabel->setObjectName("DetailTitle");
    m_titleLabel->setWordWrap(true);
    
    m_nativeLabel = new QLabel(hero);
    m_nativeLabel->setObjectName("DetailNative");
    m_nativeLabel->setWordWrap(true);
    
    m_metaLabel = new QLabel(hero);
    m_metaLabel->setObjectName("DetailMeta");
    m_metaLabel->setWordWrap(true);
    
    QHBoxLayout *pillRow = new QHBoxLayout();
    pillRow->setContentsMargins(0, 0, 0, 0);
    pillRow->setSpacing(6);
    m_typePill = new PillLabel(UIIcons::EMPTY_PILL, "neutral", hero);
    m_countryPill = new PillLabel(UIIcons::EMPTY_PILL, "neutral", hero);
    m_languagePill = new PillLabel(UIIcons::EMPTY_PILL, "neutral", hero);
    pillRow->addWidget(m_typePill);
    pillRow->addWidget(m_countryPill);
    pillRow->addWidget(m_languagePill);
    pillRow->addStretch(1);
    
    QHBoxLayout *buttonRow = new QHBoxLayout();
    buttonRow->setContentsMargins(0, 0, 0, 0);
    buttonRow->setSpacing(8);
    
    m_openButton = new QPushButton("Open page", hero);
    m_openButton->setObjectName("GhostButton");
    m_openButton->setCursor(Qt::PointingHandCursor);
    connect(m_openButton, &QPushButton::clicked, this, &MediaDetailView::openCurrentPage);
    
    m_copyButton = new QPushButton("Copy link", hero);
    m_copyButton->setObjectName("GhostButton");
    m_copyButton->setCursor(Qt::PointingHandCursor);
    connect(m_copyButton, &QPushButton::clicked, this, &MediaDetailView::copyCurrentLink);
    
    buttonRow->addWidget(m_openButton);
    buttonRow->addWidget(m_copyButton);
    buttonRow->addStretch(1);
    
    infoLayout->addWidget(m_titleLabel);
    infoLayout->addWidget(m_nativeLabel);
    infoLayout->addLayout(pillRow);
    infoLayout->addWidget(m_metaLabel);
    infoLayout->addLayout(buttonRow);
    infoLayout->addStretch(1);
    
    heroLayout->addWidget(m_coverLabel, 0);
    heroLayout->addLayout(infoLayout, 1);
    root->addWidget(hero, 0);
    
    m_descriptionView = new QTextBrowser(this);
    m_descriptionView->setObjectName("DetailDesc");
    m_descriptionView->setOpenExternalLinks(false);
    m_descriptionView->setReadOnly(true);
    root->addWidget(m_descriptionView, 1);
}

QString MediaDetailView::helpText()
{
    return QString("Click Download to fetch the last 7 days of new anime/manga start dates.\n\n"
                   "Note: This is based on AniList startDate; it is not a store/volume release tracker.");
}

QString MediaDetailView::formatMeta(const MediaItem& item)
{
    QString code = item.countryCode().isEmpty() ? QString("Unknown") : item.countryCode();
    return QString("Publication day: %1\n"
                   "Country of release: %2 (%3)\n"
                   "Main language: %4\n"
                   "Format: %5\n"
                   "Status: %6")
        .arg(item.publicationDay(), item.country(), code,
             item.language(), item.format(), item.status());
}

void MediaDetailView::clear()
{
    m_item = MediaItem();
    m_hasItem = false;
    
    m_titleLabel->setText("Select an item");
    m_nativeLabel->clear();
    m_nativeLabel->setVisible(false);
    m_metaLabel->clear();
    m_descriptionView->setPlainText(helpText());
    
    m_typePill->setText(UIIcons::EMPTY_PILL);
    m_typePill->setKind("neutral");
    m_countryPill->setText(UIIcons::EMPTY_PILL);
    m_languagePill->setText(UIIcons::EMPTY_PILL);
    
    m_openButton->setEnabled(false);
    m_copyButton->setEnabled(false);
    
    showCoverPlaceholder();
}

void MediaDetailView::showItem(const MediaItem& item)
{
    m_item = item;
    m_hasItem = true;
    
    m_titleLabel->setText(item.title());
    m_nativeLabel->setText(item.titleNative());
    m_nativeLabel->setVisible(!item.titleNative().isEmpty());
    
    m_typePill->setText(item.mediaType());
    m_typePill->setKind(PillLabel::kindForMediaType(item.mediaType()));
    m_countryPill->setText(item.country());
    m_languagePill->setText(item.language());
    
    m_metaLabel->setText(formatMeta(item));
    m_descriptionView->setPlainText(item.description().isEmpty()
                                    ? QString("No description provided.")
                                    : item.description());
    
    bool hasLink = !item.siteUrl().isEmpty();
    m_openButton->setEnabled(hasLink);
    m_copyButton->setEnabled(hasLink);
    
    showCoverPlaceholder();
    if (m_imageCache && !item.imageUrl().isEmpty()) {
        m_imageCache->request(item.imageUrl());
        updateImageIfReady(item.imageUrl());
    }
}

void MediaDetailView::showCoverPlaceholder()
{
    m_coverLabel->setPixmap(UIStyle::coverPlaceholder(coverSize()));
    m_hasCover = false;
}

void MediaDetailView::updateImageIfReady(const QString& url)
{
    if (!m_hasItem || !m_imageCache || url.isEmpty() || url != m_item.imageUrl()) {
        return;
    }
    
    QPixmap cover = m_imageCache->get(url);
    if (cover.isNull()) {
        return;
    }
    
    m_coverLabel->setPixmap(cover.scaled(m_coverLabel->size(),
                                         Qt::KeepAspectRatioByExpanding,
                                         Qt::SmoothTransformation));
    m_hasCover = true;
}

void MediaDetailView::openCurrentPage()
{
    if (!m_hasItem || m_item.siteUrl().isEmpty()) {
        return;
    }
    
    if (!QDesktopServices::openUrl(QUrl(m_item.siteUrl()))) {
        LOG(QString("[MediaDetailView] Could not open %1").arg(m_item.siteUrl()));
        emit statusMessage("Could not open the page.");
    }
}

void MediaDetailView::copyCurrentLink()
{
    if (!m_hasItem || m_item.siteUrl().isEmpty()) {
        return;
    }
    
    QApplication::clipboard()->setText(m_item.siteUrl());
    emit statusMessage("Link copied to clipboard.");
}
