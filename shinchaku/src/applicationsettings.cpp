#include "applicationsettings.h"
#include "logger.h"

void ApplicationSettings::setEndpoint(const QUrl& endpoint)
{
    if (!endpoint.isValid() || endpoint.scheme().isEmpty()) {
        LOG(QString("[Settings] Rejected invalid endpoint '%1'").arg(endpoint.toString()));
        return;
    }
    m_api.endpoint = endpoint;
}

void ApplicationSettings::setPerPage(int perPage)
{
    if (perPage < 1 || perPage > MAX_PER_PAGE) {
        LOG(QString("[Settings] Rejected page size %1 (allowed 1-%2)").arg(perPage).arg(MAX_PER_PAGE));
        return;
    }
    m_api.perPage = perPage;
}

void ApplicationSettings::setTimeoutMs(int timeoutMs)
{
    if (timeoutMs <= 0) {
        LOG(QString("[Settings] Rejected timeout %1 ms").arg(timeoutMs));
        return;
    }
    m_api.timeoutMs = timeoutMs;
}

void ApplicationSettings::setUserAgent(const QString& userAgent)
{
    if (userAgent.trimmed().isEmpty()) {
        LOG("[Settings] Rejected empty User-Agent");
        return;
    }
    m_api.userAgent = userAgent;
}

void ApplicationSettings::setDefaultRangeDays(int days)
{
    if (days < 0) {
        LOG(QString("[Settings] Rejected negative range length %1").arg(days));
        return;
    }
    m_range.defaultRangeDays = days;
}
