#ifndef FETCHWORKER_H
#define FETCHWORKER_H

#include <QObject>
#include <QAtomicInt>
#include <QDate>
#include <QString>
#include "mediaitem.h"
#include "applicationsettings.h"

/**
 * FetchWorker - Downloads one date range of new releases off the UI thread
 * 
 * Meant to be moved to a QThread and started through run(). Fetches the
 * ANIME page, then the MANGA page, merges them with MediaSort and emits
 * finished() once. Any failure emits error() with the message from
 * AniListApi and nothing else.
 * 
 * abort() is cooperative: the flag is checked before each request and
 * before emitting, so an aborted worker may still finish the request in
 * flight but never reports its result.
 */
class FetchWorker : public QObject
{
    Q_OBJECT
    
public:
    FetchWorker(const ApplicationSettings::ApiSettings& settings,
                const QDate& dateFrom, const QDate& dateTo,
                QObject *parent = nullptr);
    
    QDate dateFrom() const { return m_dateFrom; }
    QDate dateTo() const { return m_dateTo; }
    bool isAborted() const { return m_abort.loadAcquire() != 0; }
    
public slots:
    void run();
    
    // Safe to call from any thread
    void abort();
    
signals:
    void finished(const MediaItemList &items);
    void error(const QString &message);
    
private:
    ApplicationSettings::ApiSettings m_settings;
    QDate m_dateFrom;
    QDate m_dateTo;
    QAtomicInt m_abort;
};

#endif // FETCHWORKER_H
