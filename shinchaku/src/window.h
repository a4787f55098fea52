#ifndef WINDOW_H
#define WINDOW_H

#include <QtWidgets/QWidget>
#include <QtWidgets/QBoxLayout>
#include <QtWidgets/QTabWidget>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QDateEdit>
#include <QtWidgets/QListWidget>
#include <QtWidgets/QProgressBar>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QTextEdit>
#include <QtGui/QCloseEvent>
#include <QPointer>
#include <QThread>
#include <QDate>
#include <QList>
#include "mediaitem.h"
#include "applicationsettings.h"

class ImageCache;
class FetchWorker;
class MediaCard;
class MediaDetailView;

/**
 * Window - Main application window
 * 
 * Tabs:
 * - Releases: header (date range, type filter, Download), the release list
 *   with search box on the left and the detail pane on the right
 * - Log: the Logger message stream
 * 
 * Downloads run on a FetchWorker thread. Starting a new download aborts the
 * previous worker; results from a superseded worker are dropped.
 */
class Window : public QWidget
{
    Q_OBJECT
    friend class TestWindow;
    
public:
    explicit Window(const ApplicationSettings& settings = ApplicationSettings(), QWidget *parent = nullptr);
    ~Window() override;
    
    const MediaItemList& items() const { return m_items; }
    QString filterMode() const { return m_filterMode; }
    bool isFetching() const { return m_worker != nullptr; }
    
    /**
     * Selected date range, From <= To
     */
    QDate dateFrom() const;
    QDate dateTo() const;
    void setDateRange(const QDate& from, const QDate& to);
    
public slots:
    void startDownload();
    void applyFilter(const QString& mode);
    void rebuildList();
    
signals:
    // Emitted after a fetch has finished, successfully or not
    void fetchCompleted(bool success);
    
protected:
    void closeEvent(QCloseEvent *event) override;
    
private slots:
    void onFetched(const MediaItemList& items);
    void onFetchError(const QString& message);
    void onSelectedRowChanged(int row);
    void onImageReady(const QString& url);
    void onDateRangeEdited();
    void getNotifyLogAppend(QString message);
    
private:
    void setupUI();
    QWidget* createHeader();
    QWidget* createListPane();
    QWidget* createLogPage();
    
    void stopWorkerIfAny(int waitMs);
    void finishFetchUi();
    void setStatus(const QString& text);
    
    static constexpr int STOP_WAIT_MS = 500;
    
    ApplicationSettings m_settings;
    ImageCache *m_imageCache;
    
    MediaItemList m_items;
    QString m_filterMode;
    
    // Current fetch, null when idle
    QThread *m_workerThread;
    FetchWorker *m_worker;
    // Superseded fetch threads that may still be running
    QList<QPointer<QThread>> m_retiredThreads;
    
    // main layout
    QBoxLayout *layout;
    QTabWidget *tabwidget;
    
    // header
    QLabel *m_headerSubtitle;
    QDateEdit *m_fromDate;
    QDateEdit *m_toDate;
    QPushButton *m_filterAll;
    QPushButton *m_filterAnime;
    QPushButton *m_filterManga;
    QPushButton *m_downloadButton;
    
    // list pane
    QLineEdit *m_searchEdit;
    QLabel *m_countLabel;
    QListWidget *m_listWidget;
    QProgressBar *m_progressBar;
    
    // detail pane
    MediaDetailView *m_detailView;
    QSplitter *m_splitter;
    
    QLabel *m_statusLabel;
    
    // page log
    QTextEdit *logOutput;
};

#endif // WINDOW_H
