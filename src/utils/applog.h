#ifndef DOCSHIFT_APPLOG_H
#define DOCSHIFT_APPLOG_H

#include <QString>
#include <QtGlobal>

namespace AppLog
{
// Route qDebug/qInfo/qWarning/qCritical into logFilePath (appended) and stderr.
// Safe to call multiple times; the latest path wins. Returns false if the file cannot be opened,
// in which case messages still reach stderr.
bool install(const QString &logFilePath);

// Restore the default Qt handler and close the log file.
void uninstall();

// Path currently written to; empty when not installed.
QString currentLogFile();

// One formatted log line, without trailing newline. Exposed for tests.
QString formatLine(QtMsgType type, const QString &message);

// Start global startup timer. Safe to call multiple times (later calls restart).
void startTimer();

// Log a startup step with the elapsed milliseconds since startTimer().
void startupStep(const QString &step);

// Elapsed milliseconds since startTimer(); -1 if not started.
qint64 elapsedMs();
} // namespace AppLog

#endif // DOCSHIFT_APPLOG_H
