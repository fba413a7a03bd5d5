#include "word_md_converter.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QObject>
#include <QTemporaryDir>

#include "converter_support.h"
#include "docx_markdown.h"
#include "office_engine.h"
#include "utils/compound_file.h"
#include "utils/pathutil.h"

WordMdConverter::WordMdConverter(const ConversionOptions &options) : m_options(options) {}

QStringList WordMdConverter::inputExtensions() { return {QStringLiteral(".docx"), QStringLiteral(".doc")}; }

QJsonObject WordMdConverter::supportedFormats()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("input"), QJsonArray::fromStringList(inputExtensions()));
    obj.insert(QStringLiteral("output"), QJsonArray{QStringLiteral(".md")});
    obj.insert(QStringLiteral("engine"), QStringLiteral("miniz+qtxml"));
    return obj;
}

ConversionResult WordMdConverter::wordToMd(const QString &input, const QString &outDir) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;

    if (dottedSuffix(input) == QLatin1String(".docx")) return docxToMd(input, input, dir);

    // .doc: let the office engine upgrade it to .docx, else recover the plain text
    const OfficeEngine engine(m_options.officePath, m_options.officeTimeoutMs);
    if (engine.isAvailable())
    {
        QTemporaryDir scratch;
        if (scratch.isValid())
        {
            const ConversionResult upgraded = engine.convert(input, scratch.path(), QStringLiteral("docx"));
            if (upgraded.ok) return docxToMd(upgraded.primaryOutput(), input, dir);
            qWarning().noquote() << "[word2md] office upgrade failed, falling back to text recovery:" << upgraded.errorText();
        }
    }
    return legacyDocToMd(input, dir);
}

ConversionResult WordMdConverter::docxToMd(const QString &docx, const QString &input, const QString &dir) const
{
    const QString stem = QFileInfo(input).completeBaseName();
    const QString mediaName = stem + QStringLiteral("_media");
    const DocxMarkdown::Result converted = DocxMarkdown::convertFile(docx, mediaName);
    if (!converted.ok)
    {
        qWarning().noquote() << "[word2md]" << converted.error;
        return ConversionResult::failure(DocShiftErrorCode::InputCorrupt, converted.error);
    }

    // pictures first: a failed export must not leave a .md behind
    QString error;
    QStringList mediaFiles;
    auto discardMedia = [&mediaFiles]() {
        for (const QString &path : mediaFiles) QFile::remove(path);
    };
    if (!converted.media.isEmpty())
    {
        const QString mediaDir = QDir(dir).filePath(mediaName);
        if (!QDir().mkpath(mediaDir))
        {
            return ConversionResult::failure(DocShiftErrorCode::IoOutputDirFailed,
                                             QObject::tr("Failed to create output directory: %1").arg(mediaDir));
        }
        for (const DocxMarkdown::MediaFile &file : converted.media)
        {
            const QString path = QDir(mediaDir).filePath(file.name);
            if (!writeFileBytes(path, file.data, &error))
            {
                discardMedia();
                return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
            }
            mediaFiles << path;
        }
    }

    const QString mdPath = outputFilePath(dir, input, QString(), QStringLiteral("md"));
    if (!writeFileBytes(mdPath, converted.markdown.toUtf8(), &error))
    {
        discardMedia();
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
    }
    const QStringList outputs = QStringList{mdPath} + mediaFiles;

    qInfo().noquote() << "[word2md] wrote" << mdPath << "images" << converted.media.size() << "warnings"
                      << converted.warnings.size();
    return ConverterSupport::verifyOutputs(outputs, converted.warnings);
}

ConversionResult WordMdConverter::legacyDocToMd(const QString &input, const QString &dir) const
{
    QStringList paragraphs;
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;
    if (!LegacyWord::readParagraphs(input, &paragraphs, &code, &error))
    {
        qWarning().noquote() << "[word2md]" << formatDocShiftError(code, error);
        return ConversionResult::failure(code, error);
    }

    const QString mdPath = outputFilePath(dir, input, QString(), QStringLiteral("md"));
    if (!writeFileBytes(mdPath, DocxMarkdown::paragraphsToMarkdown(paragraphs).toUtf8(), &error))
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);

    const QString warning =
        QObject::tr("LibreOffice not available: only plain text was recovered from the .doc file (no formatting or images)");
    qWarning().noquote() << "[word2md]" << warning;
    return ConverterSupport::verifyOutputs({mdPath}, {warning});
}
