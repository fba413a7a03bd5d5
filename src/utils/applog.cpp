#include "applog.h"

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QRecursiveMutex>
#include <QDebug>
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace
{
QRecursiveMutex g_mutex; // QFile may warn from inside the handler
std::unique_ptr<QFile> g_file;
QString g_path;
QtMessageHandler g_previous = nullptr;
bool g_installed = false;

QElapsedTimer g_timer;
bool g_started = false;

const char *levelName(QtMsgType type)
{
    switch (type)
    {
    case QtDebugMsg: return "debug";
    case QtInfoMsg: return "info";
    case QtWarningMsg: return "warning";
    case QtCriticalMsg: return "critical";
    case QtFatalMsg: return "fatal";
    }
    return "debug";
}

void messageHandler(QtMsgType type, const QMessageLogContext &, const QString &msg)
{
    const QString line = AppLog::formatLine(type, msg);
    const QByteArray utf8 = line.toUtf8();
    {
        QMutexLocker locker(&g_mutex);
        if (g_file && g_file->isOpen())
        {
            g_file->write(utf8);
            g_file->write("\n");
            g_file->flush();
        }
    }
    fprintf(stderr, "%s\n", utf8.constData());
    fflush(stderr);
    if (type == QtFatalMsg) abort();
}
} // namespace

bool AppLog::install(const QString &logFilePath)
{
    bool opened = false;
    {
        QMutexLocker locker(&g_mutex);
        g_file.reset();
        g_path.clear();
        QDir().mkpath(QFileInfo(logFilePath).absolutePath());
        auto file = std::make_unique<QFile>(logFilePath);
        if (file->open(QIODevice::Append | QIODevice::Text))
        {
            g_file = std::move(file);
            g_path = logFilePath;
            opened = true;
        }
        if (!g_installed)
        {
            g_previous = qInstallMessageHandler(messageHandler);
            g_installed = true;
        }
    }
    if (!opened) qWarning().noquote() << "[log] cannot open log file:" << logFilePath;
    return opened;
}

void AppLog::uninstall()
{
    QMutexLocker locker(&g_mutex);
    if (g_installed)
    {
        qInstallMessageHandler(g_previous);
        g_previous = nullptr;
        g_installed = false;
    }
    g_file.reset();
    g_path.clear();
}

QString AppLog::currentLogFile()
{
    QMutexLocker locker(&g_mutex);
    return g_path;
}

QString AppLog::formatLine(QtMsgType type, const QString &message)
{
    return QStringLiteral("%1 [%2] %3")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
             QString::fromLatin1(levelName(type)), message);
}

void AppLog::startTimer()
{
    {
        QMutexLocker locker(&g_mutex);
        g_timer.start();
        g_started = true;
    }
    qInfo().noquote() << QStringLiteral("[startup] timer started");
}

void AppLog::startupStep(const QString &step)
{
    qint64 ms = -1;
    {
        QMutexLocker locker(&g_mutex);
        if (!g_started) return;
        ms = g_timer.elapsed();
    }
    qInfo().noquote() << QStringLiteral("[startup] %1 @ %2 ms").arg(step, QString::number(ms));
}

qint64 AppLog::elapsedMs()
{
    QMutexLocker locker(&g_mutex);
    return g_started ? g_timer.elapsed() : -1;
}
