#include "logger.h"
#include <QDebug>
#include <QDateTime>
#include <QMutex>

// The instance lives for the application's lifetime and is never deleted.
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;

Logger::Logger() : QObject(nullptr)
{
}

Logger* Logger::instance()
{
    // Double-checked locking, QMutex provides the memory barriers
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

void Logger::log(const QString &msg, const QString &file, int line)
{
    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    
    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        // Extract just the filename from the full path
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }
        
        fullMessage = QString("[%1] [%2:%3] %4").arg(timestamp, filename).arg(line).arg(msg);
    }
    else
    {
        fullMessage = QString("[%1] %2").arg(timestamp, msg);
    }
    
    // 1. Output to console
    qDebug().noquote() << fullMessage;
    
    // 2. Emit signal for UI log tab
    emit instance()->logMessage(fullMessage);
}
