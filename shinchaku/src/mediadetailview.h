#ifndef MEDIADETAILVIEW_H
#define MEDIADETAILVIEW_H

#include <QFrame>
#include <QLabel>
#include <QPushButton>
#include <QTextBrowser>
#include "mediaitem.h"

class ImageCache;
class PillLabel;

/**
 * MediaDetailView - Right-hand pane showing the selected release
 * 
 * Shows the cover, titles, type/country/language pills, a metadata block,
 * the plain-text description and buttons to open or copy the AniList page.
 * With no item it falls back to a short help text.
 */
class MediaDetailView : public QFrame
{
    Q_OBJECT
    
public:
    explicit MediaDetailView(ImageCache *imageCache, QWidget *parent = nullptr);
    
    bool hasItem() const { return m_hasItem; }
    const MediaItem& currentItem() const { return m_item; }
    bool hasCover() const { return m_hasCover; }
    
    QString titleText() const { return m_titleLabel->text(); }
    QString metaText() const { return m_metaLabel->text(); }
    QString descriptionText() const { return m_descriptionView->toPlainText(); }
    bool canOpenPage() const { return m_openButton->isEnabled(); }
    
    static QSize coverSize() { return QSize(140, 196); }
    
    /**
     * Multi-line metadata block (publication day, country, language, ...)
     */
    static QString formatMeta(const MediaItem& item);
    
    static QString helpText();
    
public slots:
    void showItem(const MediaItem& item);
    void clear();
    
    // Refresh the cover if url belongs to the item on display
    void updateImageIfReady(const QString& url);
    
    void openCurrentPage();
    void copyCurrentLink();
    
signals:
    void statusMessage(const QString &message);
    
private:
    void setupUI();
    void showCoverPlaceholder();
    
    ImageCache *m_imageCache;
    MediaItem m_item;
    bool m_hasItem;
    bool m_hasCover;
    
    QLabel *m_coverLabel;
    QLabel *m_titleLabel;
    QLabel *m_nativeLabel;
    QLabel *m_metaLabel;
    PillLabel *m_typePill;
    PillLabel *m_countryPill;
    PillLabel *m_languagePill;
    QPushButton *m_openButton;
    QPushButton *m_copyButton;
    QTextBrowser *m_descriptionView;
};

#endif // MEDIADETAILVIEW_H
