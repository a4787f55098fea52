#include "window.h"
#include "fetchworker.h"
#include "imagecache.h"
#include "mediacard.h"
#include "mediadetailview.h"
#include "mediafilter.h"
#include "uistyle.h"
#include "uicolors.h"
#include "logger.h"
#include <QtWidgets/QFrame>
#include <QtWidgets/QMessageBox>
#include <QtWidgets/QAbstractItemView>
#include <QSignalBlocker>
#include <QVariant>

Window::Window(const ApplicationSettings& settings, QWidget *parent)
    : QWidget(parent)
    , m_settings(settings)
    , m_imageCache(nullptr)
    , m_filterMode(TypeFilter::ALL)
    , m_workerThread(nullptr)
    , m_worker(nullptr)
{
    setWindowTitle("Anime & Manga");
    setMinimumSize(m_settings.getMinimumWindowSize());
    setAttribute(Qt::WA_StyledBackground, true);
    
    m_imageCache = new ImageCache(m_settings.getUserAgent(), this);
    connect(m_imageCache, &ImageCache::imageReady, this, &Window::onImageReady);
    
    setupUI();
    setStyleSheet(UIStyle::applicationStyleSheet());
    
    // Log messages may come from the fetch thread, AutoConnection queues them
    connect(Logger::instance(), &Logger::logMessage, this, &Window::getNotifyLogAppend);
    
    onDateRangeEdited();
    setStatus("Ready.");
    LOG("[Window] Main window ready");
}

Window::~Window()
{
    stopWorkerIfAny(STOP_WAIT_MS);
    
    // A superseded fetch must not outlive its QThread object
    for (const QPointer<QThread>& thread : m_retiredThreads) {
        if (thread && thread->isRunning()) {
            thread->quit();
            thread->wait();
        }
    }
}

void Window::setupUI()
{
    layout = new QBoxLayout(QBoxLayout::TopToBottom, this);
    layout->setContentsMargins(0, 0, 0, 0);
    tabwidget = new QTabWidget(this);
    layout->addWidget(tabwidget);
    
    // Releases page
    QWidget *releasesPage = new QWidget(tabwidget);
    QVBoxLayout *root = new QVBoxLayout(releasesPage);
    root->setContentsMargins(18, 18, 18, 18);
    root->setSpacing(12);
    
    root->addWidget(createHeader());
    
    m_splitter = new QSplitter(Qt::Horizontal, releasesPage);
    m_splitter->setChildrenCollapsible(false);
    m_splitter->setHandleWidth(10);
    m_splitter->setObjectName("MainSplit");
    m_splitter->addWidget(createListPane());
    
    m_detailView = new MediaDetailView(m_imageCache, m_splitter);
    connect(m_detailView, &MediaDetailView::statusMessage, this, &Window::setStatus);
    m_splitter->addWidget(m_detailView);
    m_splitter->setSizes(m_settings.getSplitterSizes());
    root->addWidget(m_splitter, 1);
    
    m_statusLabel = new QLabel(releasesPage);
    m_statusLabel->setObjectName("StatusLabel");
    root->addWidget(m_statusLabel);
    
    tabwidget->addTab(releasesPage, "Releases");
    tabwidget->addTab(createLogPage(), "Log");
}

QWidget* Window::createHeader()
{
    QFrame *header = new QFrame(this);
    header->setObjectName("Header");
    QHBoxLayout *headerLayout = new QHBoxLayout(header);
    headerLayout->setContentsMargins(14, 14, 14, 14);
    headerLayout->setSpacing(12);
    
    // Title and range subtitle
    QVBoxLayout *titleColumn = new QVBoxLayout();
    titleColumn->setSpacing(2);
    QLabel *title = new QLabel("New releases", header);
    title->setObjectName("HeaderTitle");
    m_headerSubtitle = new QLabel(header);
    m_headerSubtitle->setObjectName("HeaderSub");
    titleColumn->addWidget(title);
    titleColumn->addWidget(m_headerSubtitle);
    headerLayout->addLayout(titleColumn, 1);
    
    // Date range
    QFrame *dateBar = new QFrame(header);
    dateBar->setObjectName("DateBar");
    QHBoxLayout *dateLayout = new QHBoxLayout(dateBar);
    dateLayout->setContentsMargins(8, 6, 8, 6);
    dateLayout->setSpacing(8);
    
    m_fromDate = new QDateEdit(dateBar);
    m_toDate = new QDateEdit(dateBar);
    for (QDateEdit *edit : {m_fromDate, m_toDate}) {
        edit->setCalendarPopup(true);
        edit->setDisplayFormat("yyyy-MM-dd");
        edit->setObjectName("DateEdit");
        edit->setCursor(Qt::PointingHandCursor);
    }
    QDate today = QDate::currentDate();
    m_toDate->setDate(today);
    m_fromDate->setDate(today.addDays(-m_settings.getDefaultRangeDays()));
    connect(m_fromDate, &QDateEdit::dateChanged, this, &Window::onDateRangeEdited);
    connect(m_toDate, &QDateEdit::dateChanged, this, &Window::onDateRangeEdited);
    
    dateLayout->addWidget(new QLabel("From:", dateBar));
    dateLayout->addWidget(m_fromDate);
    dateLayout->addSpacing(6);
    dateLayout->addWidget(new QLabel("To:", dateBar));
    dateLayout->addWidget(m_toDate);
    headerLayout->addWidget(dateBar, 0);
    
    // Type filter segment
    QFrame *segment = new QFrame(header);
    segment->setObjectName("SegWrap");
    QHBoxLayout *segmentLayout = new QHBoxLayout(segment);
    segmentLayout->setContentsMargins(4, 4, 4, 4);
    segmentLayout->setSpacing(6);
    
    m_filterAll = new QPushButton("All", segment);
    m_filterAnime = new QPushButton("Anime", segment);
    m_filterManga = new QPushButton("Manga", segment);
    for (QPushButton *button : {m_filterAll, m_filterAnime, m_filterManga}) {
        button->setCheckable(true);
        button->setCursor(Qt::PointingHandCursor);
        button->setObjectName("SegButton");
        segmentLayout->addWidget(button);
    }
    m_filterAll->setChecked(true);
    connect(m_filterAll, &QPushButton::clicked, this, [this]() { applyFilter(TypeFilter::ALL); });
    connect(m_filterAnime, &QPushButton::clicked, this, [this]() { applyFilter(TypeFilter::ANIME); });
    connect(m_filterManga, &QPushButton::clicked, this, [this]() { applyFilter(TypeFilter::MANGA); });
    headerLayout->addWidget(segment, 0);
    
    m_downloadButton = new QPushButton("Download", header);
    m_downloadButton->setObjectName("PrimaryButton");
    m_downloadButton->setCursor(Qt::PointingHandCursor);
    connect(m_downloadButton, &QPushButton::clicked, this, &Window::startDownload);
    headerLayout->addWidget(m_downloadButton, 0);
    
    UIStyle::addDropShadow(header, 26, 10, UIColors::HEADER_SHADOW);
    return header;
}

QWidget* Window::createListPane()
{
    QFrame *pane = new QFrame(this);
    pane->setObjectName("Pane");
    QVBoxLayout *paneLayout = new QVBoxLayout(pane);
    paneLayout->setContentsMargins(12, 12, 12, 12);
    paneLayout->setSpacing(10);
    
    QHBoxLayout *topRow = new QHBoxLayout();
    topRow->setContentsMargins(0, 0, 0, 0);
    topRow->setSpacing(10);
    
    m_searchEdit = new QLineEdit(pane);
    m_searchEdit->setPlaceholderText("Search title" + UIIcons::ELLIPSIS);
    m_searchEdit->setObjectName("SearchBox");
    connect(m_searchEdit, &QLineEdit::textChanged, this, &Window::rebuildList);
    
    m_countLabel = new QLabel("0 items", pane);
    m_countLabel->setObjectName("CountLabel");
    m_countLabel->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    
    topRow->addWidget(m_searchEdit, 1);
    topRow->addWidget(m_countLabel, 0);
    paneLayout->addLayout(topRow);
    
    m_listWidget = new QListWidget(pane);
    m_listWidget->setObjectName("MediaList");
    m_listWidget->setSpacing(10);
    m_listWidget->setUniformItemSizes(false);
    m_listWidget->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listWidget->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    connect(m_listWidget, &QListWidget::currentRowChanged, this, &Window::onSelectedRowChanged);
    paneLayout->addWidget(m_listWidget, 1);
    
    m_progressBar = new QProgressBar(pane);
    m_progressBar->setObjectName("Progress");
    m_progressBar->setTextVisible(false);
    m_progressBar->setVisible(false);
    paneLayout->addWidget(m_progressBar, 0);
    
    return pane;
}

QWidget* Window::createLogPage()
{
    QWidget *page = new QWidget(tabwidget);
    QVBoxLayout *pageLayout = new QVBoxLayout(page);
    pageLayout->setContentsMargins(18, 18, 18, 18);
    
    logOutput = new QTextEdit(page);
    logOutput->setObjectName("LogOutput");
    logOutput->setReadOnly(true);
    pageLayout->addWidget(logOutput);
    
    return page;
}

QDate Window::dateFrom() const
{
    return qMin(m_fromDate->date(), m_toDate->date());
}

QDate Window::dateTo() const
{
    return qMax(m_fromDate->date(), m_toDate->date());
}

void Window::setDateRange(const QDate& from, const QDate& to)
{
    {
        QSignalBlocker blockFrom(m_fromDate);
        QSignalBlocker blockTo(m_toDate);
        m_fromDate->setDate(from);
        m_toDate->setDate(to);
    }
    onDateRangeEdited();
}

void Window::onDateRangeEdited()
{
    QDate from = m_fromDate->date();
    QDate to = m_toDate->date();
    if (from > to) {
        QSignalBlocker blockFrom(m_fromDate);
        QSignalBlocker blockTo(m_toDate);
        m_fromDate->setDate(to);
        m_toDate->setDate(from);
    }
    
    m_headerSubtitle->setText(QString("%1%2%3 (based on AniList startDate)")
        .arg(dateFrom().toString(Qt::ISODate), UIIcons::RANGE_ARROW, dateTo().toString(Qt::ISODate)));
}

void Window::startDownload()
{
    stopWorkerIfAny(STOP_WAIT_MS);
    
    QDate from = dateFrom();
    QDate to = dateTo();
    
    setStatus("Fetching from AniList" + UIIcons::ELLIPSIS);
    m_downloadButton->setEnabled(false);
    m_progressBar->setVisible(true);
    m_progressBar->setRange(0, 0);
    
    QThread *thread = new QThread(this);
    FetchWorker *worker = new FetchWorker(m_settings.api(), from, to);
    worker->moveToThread(thread);
    
    connect(thread, &QThread::started, worker, &FetchWorker::run);
    
    // Results of a superseded worker are dropped
    connect(worker, &FetchWorker::finished, this, [this, worker](const MediaItemList& items) {
        if (worker == m_worker) {
            onFetched(items);
        }
    });
    connect(worker, &FetchWorker::error, this, [this, worker](const QString& message) {
        if (worker == m_worker) {
            onFetchError(message);
        }
    });
    
    connect(worker, &FetchWorker::finished, thread, &QThread::quit);
    connect(worker, &FetchWorker::error, thread, &QThread::quit);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    
    m_workerThread = thread;
    m_worker = worker;
    
    LOG(QString("[Window] Download started for %1 .. %2")
        .arg(from.toString(Qt::ISODate), to.toString(Qt::ISODate)));
    thread->start();
}

void Window::stopWorkerIfAny(int waitMs)
{
    if (!m_worker) {
        return;
    }
    
    FetchWorker *worker = m_worker;
    QThread *thread = m_workerThread;
    m_worker = nullptr;
    m_workerThread = nullptr;
    
    worker->abort();
    thread->quit();
    if (!thread->wait(waitMs)) {
        LOG(QString("[Window] Previous fetch still running after %1 ms, detaching it").arg(waitMs));
        m_retiredThreads.append(QPointer<QThread>(thread));
    }
    
    // Forget threads that have been deleted meanwhile
    m_retiredThreads.removeAll(QPointer<QThread>());
}

void Window::finishFetchUi()
{
    m_worker = nullptr;
    m_workerThread = nullptr;
    m_downloadButton->setEnabled(true);
    m_progressBar->setVisible(false);
    m_progressBar->setRange(0, 1);
}

void Window::onFetched(const MediaItemList& items)
{
    m_items = items;
    finishFetchUi();
    rebuildList();
    setStatus(QString("Loaded %1 items.").arg(m_items.size()));
    emit fetchCompleted(true);
}

void Window::onFetchError(const QString& message)
{
    finishFetchUi();
    setStatus("Fetch failed.");
    LOG(QString("[Window] Fetch failed: %1").arg(message.section('\n', 0, 0)));
    
    QMessageBox *box = new QMessageBox(QMessageBox::Critical, "Fetch failed", message,
                                       QMessageBox::Ok, this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
    
    emit fetchCompleted(false);
}

void Window::applyFilter(const QString& mode)
{
    m_filterMode = mode;
    m_filterAll->setChecked(mode == TypeFilter::ALL);
    m_filterAnime->setChecked(mode == TypeFilter::ANIME);
    m_filterManga->setChecked(mode == TypeFilter::MANGA);
    rebuildList();
}

void Window::rebuildList()
{
    CompositeFilter filter;
    filter.addFilter(new TypeFilter(m_filterMode));
    filter.addFilter(new SearchFilter(m_searchEdit->text()));
    MediaItemList visible = filter.apply(m_items);
    
    {
        QSignalBlocker blocker(m_listWidget);
        m_listWidget->clear();
        
        for (const MediaItem& item : visible) {
            QListWidgetItem *listItem = new QListWidgetItem(m_listWidget);
            listItem->setData(Qt::UserRole, QVariant::fromValue(item));
            listItem->setSizeHint(QSize(10, MediaCard::rowHeight()));
            
            MediaCard *card = new MediaCard(item, m_imageCache);
            UIStyle::addDropShadow(card, 18, 8, UIColors::CARD_SHADOW);
            m_listWidget->setItemWidget(listItem, card);
        }
    }
    
    m_countLabel->setText(QString("%1 items").arg(visible.size()));
    
    if (m_listWidget->count() == 0) {
        m_detailView->clear();
    } else {
        m_listWidget->setCurrentRow(0);
    }
}

void Window::onSelectedRowChanged(int row)
{
    QListWidgetItem *listItem = row >= 0 ? m_listWidget->item(row) : nullptr;
    if (!listItem) {
        m_detailView->clear();
        return;
    }
    
    QVariant data = listItem->data(Qt::UserRole);
    if (!data.canConvert<MediaItem>()) {
        m_detailView->clear();
        return;
    }
    m_detailView->showItem(data.value<MediaItem>());
}

void Window::onImageReady(const QString& url)
{
    for (int i = 0; i < m_listWidget->count(); ++i) {
        MediaCard *card = qobject_cast<MediaCard*>(m_listWidget->itemWidget(m_listWidget->item(i)));
        if (card && card->item().imageUrl() == url) {
            card->updateImageIfReady();
        }
    }
    
    m_detailView->updateImageIfReady(url);
}

void Window::setStatus(const QString& text)
{
    m_statusLabel->setText(text);
}

void Window::getNotifyLogAppend(QString message)
{
    logOutput->append(message);
}

void Window::closeEvent(QCloseEvent *event)
{
    stopWorkerIfAny(STOP_WAIT_MS);
    QWidget::closeEvent(event);
}
