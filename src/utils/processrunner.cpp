#include "processrunner.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <QStandardPaths>

namespace
{
QString decodeOutput(const QByteArray &bytes)
{
#ifdef Q_OS_WIN
    return QString::fromLocal8Bit(bytes); // console code page
#else
    return QString::fromUtf8(bytes);
#endif
}
} // namespace

namespace ProcessRunner
{
ProcessResult run(const QString &program, const QStringList &args, const QString &workingDir,
                  const QProcessEnvironment &env, int timeoutMs)
{
    ProcessResult result;
    QProcess process;
    process.setProgram(program);
    process.setArguments(args);
    process.setProcessEnvironment(env);
    if (!workingDir.isEmpty()) process.setWorkingDirectory(workingDir);

    QElapsedTimer timer;
    timer.start();
    process.start();
    if (!process.waitForStarted())
    {
        result.stdErr = process.errorString();
        qWarning().noquote() << "[process] cannot start" << program << ":" << result.stdErr;
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs > 0 ? timeoutMs : -1))
    {
        result.timedOut = true;
        process.kill();
        process.waitForFinished(1000);
        qWarning().noquote() << "[process] killed" << program << "after" << timer.elapsed() << "ms";
    }

    result.stdOut = decodeOutput(process.readAllStandardOutput());
    result.stdErr = decodeOutput(process.readAllStandardError());
    if (!result.timedOut && process.exitStatus() == QProcess::NormalExit) result.exitCode = process.exitCode();
    qDebug().noquote() << "[process]" << QFileInfo(program).fileName() << "exit" << result.exitCode << "in"
                       << timer.elapsed() << "ms";
    return result;
}

QString findFirstExecutable(const QStringList &names, const QStringList &absoluteCandidates)
{
    for (const QString &name : names)
    {
        const QString onPath = QStandardPaths::findExecutable(name);
        if (!onPath.isEmpty()) return onPath;
    }
    for (const QString &candidate : absoluteCandidates)
    {
        const QFileInfo info(candidate);
        if (info.isFile() && info.isExecutable()) return info.absoluteFilePath();
    }
    return QString();
}

QString tail(const QString &text, int maxLines)
{
    QStringList lines;
    const QStringList all = text.split(QRegularExpression(QStringLiteral("[\r\n]")), Qt::SkipEmptyParts);
    for (int i = all.size() - 1; i >= 0 && lines.size() < maxLines; --i)
    {
        const QString trimmed = all.at(i).trimmed();
        if (!trimmed.isEmpty()) lines.prepend(trimmed);
    }
    return lines.join(QLatin1Char('\n'));
}
} // namespace ProcessRunner
