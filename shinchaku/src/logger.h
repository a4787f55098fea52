#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>

/**
 * Unified logging system for Shinchaku
 * 
 * This class provides a centralized logging mechanism that:
 * - Outputs to console (qDebug) for development
 * - Emits signal to update the Log tab in the UI
 * 
 * Usage:
 *   LOG("Your message here");
 *   LOG(QString("Formatted %1 message %2").arg(var1).arg(var2));
 */
class Logger : public QObject
{
    Q_OBJECT
    
public:
    /**
     * Main unified logging function
     * Logs a message to console and UI log tab
     * 
     * @param msg The message to log
     * @param file Source file name, prefer the LOG macro over passing __FILE__
     * @param line Source line number, prefer the LOG macro over passing __LINE__
     * 
     * An empty file or a non-positive line drops the [file:line] part of the
     * message but the message itself is still logged.
     */
    static void log(const QString &msg, const QString &file, int line);
    
    /**
     * Get the singleton instance of the Logger
     */
    static Logger* instance();
    
signals:
    /**
     * Signal emitted when a message is logged
     * The Window class connects to this to update the Log tab
     */
    void logMessage(QString message);
    
private:
    Logger();
};

/**
 * Convenience macro for logging with file and line info
 * Usage: LOG("Your message")
 */
#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)

#endif // LOGGER_H
