#include <QtTest/QtTest>
#include <QTcpServer>
#include <QElapsedTimer>
#include <QJsonArray>
#include "../shinchaku/src/anilistapi.h"
#include "../shinchaku/src/applicationsettings.h"
#include "fakegraphqlserver.h"
#include "mediatestutils.h"

using MediaTestUtils::mediaJson;
using MediaTestUtils::pageBody;

/**
 * Test suite for AniListApi::fetchNew against a local HTTP server
 */
class TestAniListApiHttp : public QObject
{
    Q_OBJECT

private:
    ApplicationSettings::ApiSettings settingsFor(const FakeGraphQLServer& server)
    {
        ApplicationSettings settings;
        settings.setEndpoint(server.url());
        settings.setTimeoutMs(5000);
        return settings.api();
    }

private slots:
    void testFetchSuccess()
    {
        FakeGraphQLServer server;
        QVERIFY(server.isListening());
        
        QJsonArray media;
        media.append(mediaJson(11, "ANIME", "Eleven", 2024, 3, 2));
        media.append(mediaJson(12, "ANIME", "Twelve", 2024, 3, 1));
        server.enqueue(200, pageBody(media));
        
        AniListApi api(settingsFor(server));
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 2, 25), QDate(2024, 3, 3), 40);
        
        QVERIFY2(response.ok, qPrintable(response.error));
        QCOMPARE(response.items.size(), 2);
        QCOMPARE(response.items.at(0).title(), QString("Eleven"));
        
        QCOMPARE(server.requestCount(), 1);
        QJsonObject variables = server.requestVariables(0);
        QCOMPARE(variables.value("type").toString(), QString("ANIME"));
        QCOMPARE(variables.value("startGreater").toInt(), 20240225);
        QCOMPARE(variables.value("startLesser").toInt(), 20240303);
        QCOMPARE(variables.value("perPage").toInt(), 40);
    }

    void testRequestHeaders()
    {
        FakeGraphQLServer server;
        ApplicationSettings settings;
        settings.setEndpoint(server.url());
        settings.setUserAgent("ShinchakuTest/0.1");
        
        AniListApi api(settings.api());
        AniListApi::Response response = api.fetchNew("MANGA", QDate(2024, 1, 1), QDate(2024, 1, 8), 5);
        QVERIFY2(response.ok, qPrintable(response.error));
        
        QCOMPARE(server.requestCount(), 1);
        QByteArray headers = server.requestHeaders(0).toLower();
        QVERIFY(headers.startsWith("post "));
        QVERIFY(headers.contains("content-type: application/json"));
        QVERIFY(headers.contains("accept: application/json"));
        QVERIFY(headers.contains("user-agent: shinchakutest/0.1"));
    }

    void testHttpErrorStatus()
    {
        FakeGraphQLServer server;
        server.enqueue(500, "{\"message\":\"boom\"}");
        
        AniListApi api(settingsFor(server));
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QVERIFY(response.items.isEmpty());
        QCOMPARE(response.error, QString("HTTP 500\n\n{\"message\":\"boom\"}"));
    }

    void testGraphQLErrorWithOkStatus()
    {
        FakeGraphQLServer server;
        server.enqueue(200, "{\"errors\":[{\"message\":\"Invalid token\"}],\"data\":null}");
        
        AniListApi api(settingsFor(server));
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QVERIFY(response.error.startsWith("AniList GraphQL error:\n"));
        QVERIFY(response.error.contains("Invalid token"));
    }

    void testInvalidJson()
    {
        FakeGraphQLServer server;
        server.enqueue(200, "not json at all");
        
        AniListApi api(settingsFor(server));
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QVERIFY(response.error.startsWith("Invalid JSON response: "));
    }

    void testConnectionRefused()
    {
        // Grab a free port, then release it so nothing listens there
        QTcpServer probe;
        QVERIFY(probe.listen(QHostAddress::LocalHost, 0));
        quint16 port = probe.serverPort();
        probe.close();
        
        ApplicationSettings settings;
        settings.setEndpoint(QUrl(QString("http://127.0.0.1:%1/").arg(port)));
        
        AniListApi api(settings.api());
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QVERIFY(response.items.isEmpty());
        QVERIFY(response.error.startsWith("Network error: "));
    }

    void testTransferTimeout()
    {
        FakeGraphQLServer server;
        server.setDefaultReply(200, "{}", 3000);
        
        ApplicationSettings settings;
        settings.setEndpoint(server.url());
        settings.setTimeoutMs(200);
        
        AniListApi api(settings.api());
        QElapsedTimer timer;
        timer.start();
        AniListApi::Response response = api.fetchNew("ANIME", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QVERIFY(response.error.startsWith("Network error: "));
        QVERIFY(timer.elapsed() < 2500);
    }

    void testAbortFlagCancelsRequest()
    {
        FakeGraphQLServer server;
        server.setDefaultReply(200, "{}", 5000);
        
        QAtomicInt abortFlag(0);
        AniListApi api(settingsFor(server));
        api.setAbortFlag(&abortFlag);
        
        QTimer::singleShot(150, [&abortFlag]() { abortFlag.storeRelease(1); });
        
        QElapsedTimer timer;
        timer.start();
        AniListApi::Response response = api.fetchNew("MANGA", QDate(2024, 1, 1), QDate(2024, 1, 8), 40);
        
        QVERIFY(!response.ok);
        QCOMPARE(response.error, QString("Network error: request aborted"));
        QVERIFY(timer.elapsed() < 3000);
    }
};

QTEST_MAIN(TestAniListApiHttp)
#include "test_anilistapi_http.moc"
