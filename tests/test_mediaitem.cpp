#include <QtTest/QtTest>
#include <QVariant>
#include "../shinchaku/src/mediaitem.h"
#include "mediatestutils.h"

using MediaTestUtils::makeItem;

class TestMediaItem : public QObject
{
    Q_OBJECT

private slots:
    void testDefaultConstructed()
    {
        MediaItem item;
        QCOMPARE(item.id(), 0);
        QVERIFY(item.title().isEmpty());
        QVERIFY(!item.hasStartDate());
        QCOMPARE(item.publicationDay(), QString("Unknown"));
    }

    void testPublicationDay()
    {
        MediaItem item = makeItem(1, "ANIME", "Frieren", QDate(2023, 9, 29));
        QVERIFY(item.hasStartDate());
        QCOMPARE(item.publicationDay(), QString("2023-09-29"));
    }

    void testKeyDateFallback()
    {
        MediaItem dated = makeItem(1, "ANIME", "Dated", QDate(2024, 1, 5));
        MediaItem undated = makeItem(2, "ANIME", "Undated");
        
        QCOMPARE(dated.keyDate(), QDate(2024, 1, 5));
        QCOMPARE(undated.keyDate(), QDate(1900, 1, 1));
    }

    void testFromFuzzyDate_complete()
    {
        QCOMPARE(MediaItem::fromFuzzyDate(2024, 2, 29), QDate(2024, 2, 29));
    }

    void testFromFuzzyDate_missingParts()
    {
        QVERIFY(MediaItem::fromFuzzyDate(0, 0, 0).isNull());
        QVERIFY(MediaItem::fromFuzzyDate(2024, 0, 0).isNull());
        QVERIFY(MediaItem::fromFuzzyDate(2024, 5, 0).isNull());
        QVERIFY(MediaItem::fromFuzzyDate(0, 5, 12).isNull());
    }

    void testFromFuzzyDate_invalidCalendarDate()
    {
        QVERIFY(MediaItem::fromFuzzyDate(2023, 2, 30).isNull());
        QVERIFY(MediaItem::fromFuzzyDate(2023, 13, 1).isNull());
    }

    void testDedupKey()
    {
        MediaItem anime = makeItem(100, "ANIME", "Same id");
        MediaItem manga = makeItem(100, "MANGA", "Same id");
        
        QCOMPARE(anime.dedupKey(), MediaItem::DedupKey("ANIME", 100));
        QVERIFY(anime.dedupKey() != manga.dedupKey());
    }

    void testIsAnime()
    {
        QVERIFY(makeItem(1, "ANIME", "A").isAnime());
        QVERIFY(!makeItem(1, "MANGA", "M").isAnime());
    }

    void testEquality()
    {
        MediaItem a = makeItem(5, "MANGA", "Title", QDate(2024, 3, 3));
        MediaItem b = makeItem(5, "MANGA", "Title", QDate(2024, 3, 3));
        MediaItem c = makeItem(5, "MANGA", "Other title", QDate(2024, 3, 3));
        
        QVERIFY(a == b);
        QVERIFY(a != c);
    }

    void testVariantRoundTrip()
    {
        // The list widget stores items in Qt::UserRole
        MediaItem item = makeItem(7, "ANIME", "Stored", QDate(2024, 7, 7));
        QVariant v = QVariant::fromValue(item);
        QVERIFY(v.canConvert<MediaItem>());
        QCOMPARE(v.value<MediaItem>(), item);
    }
};

QTEST_MAIN(TestMediaItem)
#include "test_mediaitem.moc"
