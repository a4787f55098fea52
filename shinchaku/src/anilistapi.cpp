#include "anilistapi.h"
#include "mediautils.h"
#include "logger.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QScopedPointer>
#include <QEventLoop>
#include <QTimer>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonValue>
#include <QElapsedTimer>

AniListApi::Response AniListApi::Response::success(const MediaItemList& items)
{
    Response r;
    r.ok = true;
    r.items = items;
    return r;
}

AniListApi::Response AniListApi::Response::failure(const QString& error)
{
    Response r;
    r.ok = false;
    r.error = error;
    return r;
}

AniListApi::AniListApi(const ApplicationSettings::ApiSettings& settings)
    : m_settings(settings)
    , m_abortFlag(nullptr)
{
}

QString AniListApi::query()
{
    return QStringLiteral(
        "query ($type: MediaType, $startGreater: FuzzyDateInt, $startLesser: FuzzyDateInt, $perPage: Int) {\n"
        "  Page(page: 1, perPage: $perPage) {\n"
        "    media(type: $type, startDate_greater: $startGreater, startDate_lesser: $startLesser, sort: START_DATE_DESC) {\n"
        "      id\n"
        "      type\n"
        "      format\n"
        "      status\n"
        "      title { romaji english native }\n"
        "      startDate { year month day }\n"
        "      countryOfOrigin\n"
        "      description(asHtml: false)\n"
        "      siteUrl\n"
        "      coverImage { large medium color }\n"
        "    }\n"
        "  }\n"
        "}\n");
}

QByteArray AniListApi::buildRequestBody(const QString& mediaType, const QDate& dateFrom,
                                        const QDate& dateTo, int perPage)
{
    QJsonObject variables;
    variables["type"] = mediaType;
    variables["startGreater"] = MediaUtils::fuzzyDateInt(dateFrom);
    variables["startLesser"] = MediaUtils::fuzzyDateInt(dateTo);
    variables["perPage"] = perPage;
    
    QJsonObject payload;
    payload["query"] = query();
    payload["variables"] = variables;
    
    return QJsonDocument(payload).toJson(QJsonDocument::Compact);
}

AniListApi::Response AniListApi::fetchNew(const QString& mediaType, const QDate& dateFrom,
                                          const QDate& dateTo, int perPage) const
{
    LOG(QString("[AniListApi] Fetching %1 from %2 to %3 (perPage=%4)")
        .arg(mediaType, dateFrom.toString(Qt::ISODate), dateTo.toString(Qt::ISODate))
        .arg(perPage));
    
    QNetworkAccessManager manager;
    
    QNetworkRequest request(m_settings.endpoint);
    request.setRawHeader("Accept", "application/json");
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setHeader(QNetworkRequest::UserAgentHeader, m_settings.userAgent);
    request.setTransferTimeout(m_settings.timeoutMs);
    
    QElapsedTimer timer;
    timer.start();
    
    QScopedPointer<QNetworkReply> reply(
        manager.post(request, buildRequestBody(mediaType, dateFrom, dateTo, perPage)));
    
    QEventLoop loop;
    QObject::connect(reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    
    QTimer abortPoll;
    if (m_abortFlag) {
        abortPoll.setInterval(ABORT_POLL_INTERVAL_MS);
        QNetworkReply *pending = reply.data();
        QObject::connect(&abortPoll, &QTimer::timeout, &loop, [this, pending]() {
            if (abortRequested() && pending->isRunning()) {
                pending->abort();
            }
        });
        abortPoll.start();
    }
    
    if (!reply->isFinished()) {
        loop.exec();
    }
    abortPoll.stop();
    
    QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    
    // No HTTP status means the request never got an answer
    if (!statusAttr.isValid()) {
        QString reason = reply->errorString();
        if (reply->error() == QNetworkReply::OperationCanceledError
            || reply->error() == QNetworkReply::TimeoutError) {
            reason = abortRequested()
                ? QString("request aborted")
                : QString("request timed out after %1 ms").arg(m_settings.timeoutMs);
        }
        LOG(QString("[AniListApi] %1 request failed: %2").arg(mediaType, reason));
        return Response::failure(QString("Network error: %1").arg(reason));
    }
    
    int httpStatus = statusAttr.toInt();
    Response response = parseResponse(httpStatus, reply->readAll(), mediaType);
    
    if (response.ok) {
        LOG(QString("[AniListApi] %1: %2 items in %3 ms")
            .arg(mediaType).arg(response.items.size()).arg(timer.elapsed()));
    } else {
        LOG(QString("[AniListApi] %1 request failed (HTTP %2)").arg(mediaType).arg(httpStatus));
    }
    
    return response;
}

AniListApi::Response AniListApi::parseResponse(int httpStatus, const QByteArray& body,
                                               const QString& requestedType)
{
    if (httpStatus != 200) {
        return Response::failure(QString("HTTP %1\n\n%2")
            .arg(httpStatus)
            .arg(QString::fromUtf8(body).left(MAX_ERROR_TEXT)));
    }
    
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        QString reason = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QString("top-level value is not an object");
        return Response::failure(QString("Invalid JSON response: %1").arg(reason));
    }
    
    QJsonObject root = doc.object();
    
    QJsonValue errors = root.value("errors");
    bool hasErrors = (errors.isArray() && !errors.toArray().isEmpty())
        || (errors.isObject() && !errors.toObject().isEmpty())
        || (errors.isString() && !errors.toString().isEmpty());
    if (hasErrors) {
        QByteArray dump;
        if (errors.isArray()) {
            dump = QJsonDocument(errors.toArray()).toJson(QJsonDocument::Indented);
        } else if (errors.isObject()) {
            dump = QJsonDocument(errors.toObject()).toJson(QJsonDocument::Indented);
        } else {
            dump = errors.toString().toUtf8();
        }
        return Response::failure("AniList GraphQL error:\n"
            + QString::fromUtf8(dump).left(MAX_ERROR_TEXT));
    }
    
    // data, Page and media may each be missing or null
    QJsonArray mediaList = root.value("data").toObject()
                               .value("Page").toObject()
                               .value("media").toArray();
    
    MediaItemList items;
    items.reserve(mediaList.size());
    for (const QJsonValue& value : mediaList) {
        items.append(mapMedia(value.toObject(), requestedType));
    }
    
    return Response::success(items);
}

MediaItem AniListApi::mapMedia(const QJsonObject& media, const QString& requestedType)
{
    QJsonObject titleBlock = media.value("title").toObject();
    QString title = titleBlock.value("english").toString();
    if (title.isEmpty()) {
        title = titleBlock.value("romaji").toString();
    }
    if (title.isEmpty()) {
        title = "Untitled";
    }
    QString titleNative = titleBlock.value("native").toString();
    
    QJsonObject cover = media.value("coverImage").toObject();
    QString imageUrl = cover.value("large").toString();
    if (imageUrl.isEmpty()) {
        imageUrl = cover.value("medium").toString();
    }
    
    QString countryCode = media.value("countryOfOrigin").toString();
    MediaUtils::CountryInfo countryInfo = MediaUtils::lookupCountry(countryCode);
    
    QJsonObject startDate = media.value("startDate").toObject();
    QDate date = MediaItem::fromFuzzyDate(startDate.value("year").toInt(),
                                          startDate.value("month").toInt(),
                                          startDate.value("day").toInt());
    
    QString mediaType = media.value("type").toString();
    if (mediaType.isEmpty()) {
        mediaType = requestedType;
    }
    
    QString format = media.value("format").toString();
    QString status = media.value("status").toString();
    
    return MediaItem(
        media.value("id").toInt(),
        mediaType,
        title,
        titleNative,
        imageUrl,
        countryCode,
        countryInfo.country,
        countryInfo.language,
        date,
        format.isEmpty() ? QString("Unknown") : format,
        status.isEmpty() ? QString("Unknown") : status,
        MediaUtils::cleanDescription(media.value("description").toString()),
        media.value("siteUrl").toString());
}
