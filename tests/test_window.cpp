#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QImage>
#include <QJsonArray>
#include <QMessageBox>
#include "../shinchaku/src/window.h"
#include "../shinchaku/src/mediacard.h"
#include "../shinchaku/src/mediadetailview.h"
#include "../shinchaku/src/imagecache.h"
#include "../shinchaku/src/mediafilter.h"
#include "fakegraphqlserver.h"
#include "mediatestutils.h"

using MediaTestUtils::makeItem;
using MediaTestUtils::mediaJson;
using MediaTestUtils::pageBody;

/**
 * Test suite for the main window
 * 
 * Downloads go to a FakeGraphQLServer on the test thread while the fetch
 * itself runs on the window's worker thread.
 */
class TestWindow : public QObject
{
    Q_OBJECT

private slots:
    void testInitialState();
    void testDateRangeIsSwapped();
    void testDownloadPopulatesList();
    void testSelectionShowsDetail();
    void testTypeFilterAndSearch();
    void testEmptyListClearsDetail();
    void testFetchErrorKeepsPreviousList();
    void testSupersededFetchIsDropped();
    void testCloseAbortsFetch();
    void testCoverRefreshesCard();
    void testCopyLinkUpdatesStatus();

private:
    ApplicationSettings settingsFor(const FakeGraphQLServer& server)
    {
        ApplicationSettings settings;
        settings.setEndpoint(server.url());
        settings.setTimeoutMs(5000);
        return settings;
    }
    
    MediaItemList sampleItems()
    {
        MediaItemList items;
        items << makeItem(1, "ANIME", "Frieren", QDate(2024, 3, 3), "Native One", QString(), "https://anilist.co/anime/1")
              << makeItem(2, "MANGA", "Dandadan", QDate(2024, 3, 2))
              << makeItem(3, "ANIME", "Dungeon Meshi", QDate(2024, 3, 1));
        return items;
    }
};

void TestWindow::testInitialState()
{
    ApplicationSettings settings;
    Window window(settings);
    
    QDate today = QDate::currentDate();
    QCOMPARE(window.dateTo(), today);
    QCOMPARE(window.dateFrom(), today.addDays(-7));
    QVERIFY(window.m_headerSubtitle->text().endsWith("(based on AniList startDate)"));
    QVERIFY(window.m_headerSubtitle->text().startsWith(today.addDays(-7).toString(Qt::ISODate)));
    
    QCOMPARE(window.m_statusLabel->text(), QString("Ready."));
    QCOMPARE(window.m_countLabel->text(), QString("0 items"));
    QCOMPARE(window.filterMode(), TypeFilter::ALL);
    QVERIFY(window.m_filterAll->isChecked());
    QVERIFY(!window.isFetching());
    QVERIFY(!window.m_detailView->hasItem());
    QCOMPARE(window.tabwidget->count(), 2);
}

void TestWindow::testDateRangeIsSwapped()
{
    Window window;
    window.setDateRange(QDate(2024, 5, 10), QDate(2024, 5, 1));
    
    QCOMPARE(window.m_fromDate->date(), QDate(2024, 5, 1));
    QCOMPARE(window.m_toDate->date(), QDate(2024, 5, 10));
    
    // Editing From past To swaps them too
    window.m_fromDate->setDate(QDate(2024, 6, 1));
    QCOMPARE(window.dateFrom(), QDate(2024, 5, 10));
    QCOMPARE(window.dateTo(), QDate(2024, 6, 1));
    QVERIFY(window.m_headerSubtitle->text().startsWith("2024-05-10"));
}

void TestWindow::testDownloadPopulatesList()
{
    FakeGraphQLServer server;
    QJsonArray anime;
    anime.append(mediaJson(100, "ANIME", "Shared", 2024, 5, 1));
    anime.append(mediaJson(101, "ANIME", "Newest", 2024, 5, 6));
    QJsonArray manga;
    manga.append(mediaJson(100, "MANGA", "Shared", 2024, 5, 1));
    server.enqueue(200, pageBody(anime));
    server.enqueue(200, pageBody(manga));
    
    Window window(settingsFor(server));
    window.setDateRange(QDate(2024, 4, 30), QDate(2024, 5, 7));
    QSignalSpy spy(&window, &Window::fetchCompleted);
    
    window.startDownload();
    QVERIFY(window.isFetching());
    QVERIFY(!window.m_downloadButton->isEnabled());
    QCOMPARE(window.m_statusLabel->text(), QString::fromUtf8("Fetching from AniList…"));
    
    QVERIFY(spy.wait(10000));
    QCOMPARE(spy.at(0).at(0).toBool(), true);
    
    QVERIFY(!window.isFetching());
    QVERIFY(window.m_downloadButton->isEnabled());
    QCOMPARE(window.items().size(), 3);
    QCOMPARE(window.m_listWidget->count(), 3);
    QCOMPARE(window.m_countLabel->text(), QString("3 items"));
    QCOMPARE(window.m_statusLabel->text(), QString("Loaded 3 items."));
    
    // First row selected and shown
    QCOMPARE(window.m_listWidget->currentRow(), 0);
    QCOMPARE(window.m_detailView->titleText(), QString("Newest"));
    
    QCOMPARE(server.requestVariables(0).value("startGreater").toInt(), 20240430);
    QCOMPARE(server.requestVariables(0).value("startLesser").toInt(), 20240507);
    
    // Worker log lines reach the Log tab
    QTRY_VERIFY_WITH_TIMEOUT(window.logOutput->toPlainText().contains("[FetchWorker]"), 5000);
}

void TestWindow::testSelectionShowsDetail()
{
    Window window;
    window.m_items = sampleItems();
    window.rebuildList();
    
    window.m_listWidget->setCurrentRow(2);
    QCOMPARE(window.m_detailView->currentItem().id(), 3);
    QCOMPARE(window.m_detailView->titleText(), QString("Dungeon Meshi"));
    
    MediaCard *card = qobject_cast<MediaCard*>(
        window.m_listWidget->itemWidget(window.m_listWidget->item(1)));
    QVERIFY(card != nullptr);
    QCOMPARE(card->titleText(), QString("Dandadan"));
    
    QVariant stored = window.m_listWidget->item(0)->data(Qt::UserRole);
    QCOMPARE(stored.value<MediaItem>().id(), 1);
}

void TestWindow::testTypeFilterAndSearch()
{
    Window window;
    window.m_items = sampleItems();
    window.rebuildList();
    QCOMPARE(window.m_listWidget->count(), 3);
    
    window.applyFilter(TypeFilter::ANIME);
    QCOMPARE(window.m_listWidget->count(), 2);
    QCOMPARE(window.m_countLabel->text(), QString("2 items"));
    QVERIFY(window.m_filterAnime->isChecked());
    QVERIFY(!window.m_filterAll->isChecked());
    
    window.m_searchEdit->setText("meshi");
    QCOMPARE(window.m_listWidget->count(), 1);
    QCOMPARE(window.m_detailView->titleText(), QString("Dungeon Meshi"));
    
    // Search on native title
    window.applyFilter(TypeFilter::ALL);
    window.m_searchEdit->setText("native one");
    QCOMPARE(window.m_listWidget->count(), 1);
    
    // Clicking the segment button goes through applyFilter
    window.m_searchEdit->clear();
    window.m_filterManga->click();
    QCOMPARE(window.filterMode(), TypeFilter::MANGA);
    QCOMPARE(window.m_listWidget->count(), 1);
    
    // The underlying list is never changed by filtering
    QCOMPARE(window.items().size(), 3);
}

void TestWindow::testEmptyListClearsDetail()
{
    Window window;
    window.m_items = sampleItems();
    window.rebuildList();
    QVERIFY(window.m_detailView->hasItem());
    
    window.m_searchEdit->setText("no such title");
    QCOMPARE(window.m_listWidget->count(), 0);
    QCOMPARE(window.m_countLabel->text(), QString("0 items"));
    QVERIFY(!window.m_detailView->hasItem());
    QCOMPARE(window.m_detailView->titleText(), QString("Select an item"));
}

void TestWindow::testFetchErrorKeepsPreviousList()
{
    FakeGraphQLServer server;
    server.enqueue(500, "server exploded");
    
    Window window(settingsFor(server));
    window.m_items = sampleItems();
    window.rebuildList();
    QSignalSpy spy(&window, &Window::fetchCompleted);
    
    window.startDownload();
    QVERIFY(spy.wait(10000));
    QCOMPARE(spy.at(0).at(0).toBool(), false);
    
    QCOMPARE(window.m_statusLabel->text(), QString("Fetch failed."));
    QCOMPARE(window.items().size(), 3);
    QCOMPARE(window.m_listWidget->count(), 3);
    QVERIFY(window.m_downloadButton->isEnabled());
    
    QMessageBox *box = window.findChild<QMessageBox*>();
    QVERIFY(box != nullptr);
    QCOMPARE(box->windowTitle(), QString("Fetch failed"));
    QVERIFY(box->text().startsWith("HTTP 500"));
    box->close();
}

void TestWindow::testSupersededFetchIsDropped()
{
    FakeGraphQLServer server;
    QJsonArray stale;
    stale.append(mediaJson(7, "ANIME", "Stale", 2024, 5, 1));
    QJsonArray fresh;
    fresh.append(mediaJson(8, "ANIME", "Fresh", 2024, 5, 2));
    server.enqueue(200, pageBody(stale), 3000);
    server.enqueue(200, pageBody(fresh));
    server.enqueue(200, pageBody(QJsonArray()));
    
    Window window(settingsFor(server));
    QSignalSpy spy(&window, &Window::fetchCompleted);
    
    window.startDownload();
    QTRY_COMPARE_WITH_TIMEOUT(server.requestCount(), 1, 5000);
    
    window.startDownload();
    QVERIFY(spy.wait(10000));
    QTest::qWait(300);
    
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toBool(), true);
    QCOMPARE(window.items().size(), 1);
    QCOMPARE(window.items().at(0).title(), QString("Fresh"));
}

void TestWindow::testCloseAbortsFetch()
{
    FakeGraphQLServer server;
    server.setDefaultReply(200, pageBody(QJsonArray()), 3000);
    
    Window window(settingsFor(server));
    window.show();
    QSignalSpy spy(&window, &Window::fetchCompleted);
    
    window.startDownload();
    QTRY_COMPARE_WITH_TIMEOUT(server.requestCount(), 1, 5000);
    
    window.close();
    QVERIFY(!window.isFetching());
    
    QTest::qWait(300);
    QCOMPARE(spy.count(), 0);
}

void TestWindow::testCoverRefreshesCard()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QImage image(30, 42, QImage::Format_ARGB32);
    image.fill(Qt::darkYellow);
    QString path = dir.filePath("window.png");
    QVERIFY(image.save(path, "PNG"));
    QString url = QUrl::fromLocalFile(path).toString();
    
    Window window;
    QSignalSpy spy(window.m_imageCache, &ImageCache::imageReady);
    
    window.m_items << makeItem(1, "ANIME", "Covered", QDate(2024, 3, 3), QString(), url);
    window.rebuildList();
    
    MediaCard *card = qobject_cast<MediaCard*>(
        window.m_listWidget->itemWidget(window.m_listWidget->item(0)));
    QVERIFY(card != nullptr);
    QVERIFY(!card->hasCover());
    
    QVERIFY(spy.wait(5000));
    QVERIFY(card->hasCover());
    QVERIFY(window.m_detailView->hasCover());
}

void TestWindow::testCopyLinkUpdatesStatus()
{
    Window window;
    window.m_items = sampleItems();
    window.rebuildList();
    
    window.m_detailView->copyCurrentLink();
    QCOMPARE(window.m_statusLabel->text(), QString("Link copied to clipboard."));
}

QTEST_MAIN(TestWindow)
#include "test_window.moc"
