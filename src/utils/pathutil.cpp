// pathutil.cpp - see header
#include "pathutil.h"

#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QSaveFile>

#ifdef Q_OS_WIN
#  include <windows.h>
#endif

static inline QString toNativeAbs(const QString &p)
{
    if (p.isEmpty()) return p;
    const QFileInfo fi(p);
    const QString abs = fi.isAbsolute() ? p : fi.absoluteFilePath();
    return QDir::toNativeSeparators(abs);
}

QString toToolFriendlyPath(const QString &path)
{
    if (path.isEmpty()) return path;

    const QString native = toNativeAbs(path);
#ifdef Q_OS_WIN
    // soffice still opens some inputs through "char*" APIs on Windows,
    // which break on non-ASCII paths. Convert to 8.3 short path if available.
    const wchar_t *longPath = reinterpret_cast<const wchar_t *>(native.utf16());
    // GetShortPathNameW requires the path to exist.
    DWORD required = GetShortPathNameW(longPath, nullptr, 0);
    if (required == 0) {
        // Fallback: return native path; QProcess will pass Unicode.
        return native;
    }

    QString out;
    out.resize(int(required)); // includes room for terminator
    wchar_t *buf = reinterpret_cast<wchar_t *>(out.data());
    DWORD written = GetShortPathNameW(longPath, buf, required);
    if (written == 0) {
        return native; // fallback
    }
    // QString length handling: written excludes terminator
    out.resize(int(written));
    return out;
#else
    return native;
#endif
}

bool isAsciiOnly(const QString &s)
{
    for (QChar c : s)
    {
        if (c.unicode() > 0x7F) return false;
    }
    return true;
}

QString dottedSuffix(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix.isEmpty()) return QString();
    return QLatin1Char('.') + suffix;
}

bool hasSupportedSuffix(const QString &path, const QStringList &dottedExtensions)
{
    const QString suffix = dottedSuffix(path);
    return !suffix.isEmpty() && dottedExtensions.contains(suffix);
}

QString resolveOutputDir(const QString &inputFile, const QString &outputDir, QString *error)
{
    const QString target = outputDir.trimmed().isEmpty()
                               ? QFileInfo(inputFile).absolutePath()
                               : QDir::cleanPath(QFileInfo(outputDir).absoluteFilePath());
    QDir dir(target);
    if (!dir.exists() && !QDir().mkpath(target))
    {
        if (error) *error = QObject::tr("Failed to create output directory: %1").arg(target);
        qWarning().noquote() << "[path] mkpath failed:" << target;
        return QString();
    }
    return dir.absolutePath();
}

QString outputFilePath(const QString &dir, const QString &inputFile, const QString &suffix, const QString &extension)
{
    const QString stem = QFileInfo(inputFile).completeBaseName();
    QString ext = extension;
    if (ext.startsWith(QLatin1Char('.'))) ext.remove(0, 1);
    return QDir(dir).filePath(stem + suffix + QLatin1Char('.') + ext);
}

bool readFileBytes(const QString &path, QByteArray *data, QString *error)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
    {
        if (error) *error = QObject::tr("Failed to read file: %1").arg(path);
        return false;
    }
    *data = f.readAll();
    return true;
}

bool writeFileBytes(const QString &path, const QByteArray &data, QString *error)
{
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly) || f.write(data) != data.size() || !f.commit())
    {
        if (error) *error = QObject::tr("Failed to write file: %1").arg(path);
        qWarning().noquote() << "[path] write failed:" << path << f.errorString();
        return false;
    }
    return true;
}
