#include "office_engine.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QProcessEnvironment>
#include <QTemporaryDir>
#include <QUrl>

#include "utils/pathutil.h"
#include "utils/processrunner.h"
#include "xconfig.h"

OfficeEngine::OfficeEngine(const QString &configuredPath, int timeoutMs)
    : m_executable(locate(configuredPath)), m_timeoutMs(timeoutMs > 0 ? timeoutMs : DEFAULT_OFFICE_TIMEOUT_MS)
{
}

QStringList OfficeEngine::installCandidates()
{
    QStringList candidates;
#ifdef Q_OS_WIN
    candidates << QStringLiteral("C:/Program Files/LibreOffice/program/soffice.exe")
               << QStringLiteral("C:/Program Files (x86)/LibreOffice/program/soffice.exe");
#elif defined(Q_OS_MACOS)
    candidates << QStringLiteral("/Applications/LibreOffice.app/Contents/MacOS/soffice");
#else
    candidates << QStringLiteral("/usr/bin/soffice") << QStringLiteral("/usr/lib/libreoffice/program/soffice")
               << QStringLiteral("/opt/libreoffice/program/soffice") << QStringLiteral("/snap/bin/libreoffice");
#endif
    return candidates;
}

QString OfficeEngine::locate(const QString &configuredPath)
{
    const QString configured = configuredPath.trimmed();
    if (!configured.isEmpty())
    {
        const QFileInfo info(configured);
        if (info.exists() && info.isFile() && info.isExecutable()) return info.absoluteFilePath();
        qWarning().noquote() << "[office] configured office_path is not executable:" << configured;
    }
    return ProcessRunner::findFirstExecutable({QStringLiteral("soffice"), QStringLiteral("libreoffice")},
                                              installCandidates());
}

ConversionResult OfficeEngine::convert(const QString &input, const QString &outDir, const QString &format) const
{
    if (m_executable.isEmpty())
    {
        return ConversionResult::failure(DocShiftErrorCode::EngineUnavailable,
                                         QObject::tr("LibreOffice (soffice) was not found; install it or set office_path"));
    }

    QTemporaryDir profile;
    if (!profile.isValid())
    {
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed,
                                         QObject::tr("Cannot create temporary office profile"));
    }

    const QString expected = outputFilePath(outDir, input, QString(), format);
    QFile::remove(expected); // a stale file would hide a failed run

    QStringList args;
    args << QStringLiteral("--headless") << QStringLiteral("--norestore") << QStringLiteral("--nologo")
         << QStringLiteral("-env:UserInstallation=%1").arg(QUrl::fromLocalFile(profile.path()).toString())
         << QStringLiteral("--convert-to") << format << QStringLiteral("--outdir") << toToolFriendlyPath(outDir)
         << toToolFriendlyPath(input);

    qInfo().noquote() << "[office]" << m_executable << args.join(QLatin1Char(' '));
    const ProcessResult run =
        ProcessRunner::run(m_executable, args, outDir, QProcessEnvironment::systemEnvironment(), m_timeoutMs);

    if (!run.started)
    {
        return ConversionResult::failure(DocShiftErrorCode::EngineFailed,
                                         QObject::tr("Cannot start office: %1").arg(m_executable));
    }
    if (run.timedOut)
    {
        return ConversionResult::failure(DocShiftErrorCode::EngineTimeout,
                                         QObject::tr("Office conversion timed out after %1 s").arg(m_timeoutMs / 1000));
    }
    if (run.exitCode != 0)
    {
        qWarning().noquote() << "[office] exit" << run.exitCode << "stderr:" << run.stdErr;
        const QString detail = ProcessRunner::tail(run.stdErr.isEmpty() ? run.stdOut : run.stdErr);
        return ConversionResult::failure(DocShiftErrorCode::EngineFailed,
                                         QObject::tr("Office conversion failed (exit %1): %2").arg(run.exitCode).arg(detail));
    }
    if (!QFileInfo::exists(expected))
    {
        // soffice reports some load errors on stdout with exit code 0
        qWarning().noquote() << "[office] no output, stdout:" << run.stdOut << "stderr:" << run.stdErr;
        const QString detail = ProcessRunner::tail(run.stdErr.isEmpty() ? run.stdOut : run.stdErr);
        return ConversionResult::failure(DocShiftErrorCode::OutputMissing,
                                         detail.isEmpty() ? QObject::tr("conversion produced no output file")
                                                          : QObject::tr("conversion produced no output file: %1").arg(detail));
    }
    return ConversionResult::success({expected});
}
