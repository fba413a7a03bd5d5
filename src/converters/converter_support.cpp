#include "converter_support.h"

#include <QDebug>
#include <QFileInfo>
#include <QObject>

#include "utils/pathutil.h"

namespace ConverterSupport
{
bool checkInput(const QString &input, const QStringList &dottedExtensions, ConversionResult *failure)
{
    const QFileInfo info(input);
    if (input.trimmed().isEmpty() || !info.exists() || !info.isFile())
    {
        if (failure)
            *failure = ConversionResult::failure(DocShiftErrorCode::IoInputMissing,
                                                 QObject::tr("Input file not found: %1").arg(input));
        return false;
    }
    if (!hasSupportedSuffix(input, dottedExtensions))
    {
        if (failure)
            *failure = ConversionResult::failure(
                DocShiftErrorCode::InputUnsupported,
                QObject::tr("Unsupported file type %1, expected one of: %2")
                    .arg(dottedSuffix(input).isEmpty() ? QStringLiteral("(none)") : dottedSuffix(input),
                         dottedExtensions.join(QLatin1Char(' '))));
        return false;
    }
    return true;
}

bool prepareOutputDir(const QString &input, const QString &outDir, QString *dir, ConversionResult *failure)
{
    QString error;
    const QString resolved = resolveOutputDir(input, outDir, &error);
    if (resolved.isEmpty())
    {
        if (failure) *failure = ConversionResult::failure(DocShiftErrorCode::IoOutputDirFailed, error);
        return false;
    }
    if (dir) *dir = resolved;
    return true;
}

ConversionResult verifyOutputs(const QStringList &files, const QStringList &warnings)
{
    if (files.isEmpty())
        return ConversionResult::failure(DocShiftErrorCode::OutputMissing,
                                         QObject::tr("conversion produced no output file"));
    for (const QString &file : files)
    {
        const QFileInfo info(file);
        if (!info.exists() || info.size() == 0)
        {
            qWarning().noquote() << "[convert] expected output missing:" << file;
            return ConversionResult::failure(DocShiftErrorCode::OutputMissing,
                                             QObject::tr("conversion produced no output file: %1").arg(file));
        }
    }
    return ConversionResult::success(files, warnings);
}

QString dialogPatterns(const QStringList &dottedExtensions)
{
    QStringList patterns;
    for (const QString &ext : dottedExtensions) patterns << QLatin1Char('*') + ext;
    return patterns.join(QLatin1Char(' '));
}
} // namespace ConverterSupport
