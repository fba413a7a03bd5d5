#include "image_pdf_converter.h"

#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <QJsonArray>
#include <QObject>
#include <QPainter>

#include "converter_support.h"
#include "mupdf_support.h"
#include "utils/pathutil.h"

namespace
{
// Decoded picture with EXIF orientation applied and alpha flattened on white.
QImage loadRgbImage(const QString &path, QString *error)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull())
    {
        if (error) *error = QObject::tr("Cannot decode image %1: %2").arg(path, reader.errorString());
        return QImage();
    }
    if (!image.hasAlphaChannel()) return image.convertToFormat(QImage::Format_RGB888);

    QImage flat(image.size(), QImage::Format_RGB888);
    flat.fill(Qt::white);
    QPainter painter(&flat);
    painter.drawImage(0, 0, image);
    painter.end();
    return flat;
}

// JPEG sources stay JPEG, everything else is stored losslessly.
QByteArray encodeForPdf(const QImage &image, const QString &sourcePath)
{
    const QString suffix = dottedSuffix(sourcePath);
    const bool jpeg = suffix == QLatin1String(".jpg") || suffix == QLatin1String(".jpeg");
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (jpeg)
        image.save(&buffer, "JPEG", DEFAULT_JPEG_QUALITY);
    else
        image.save(&buffer, "PNG");
    return bytes;
}

bool appendImagePage(mupdf::PdfWriter &writer, const QString &input, const QString &layout, ConversionResult *failure)
{
    QString error;
    const QImage image = loadRgbImage(input, &error);
    if (image.isNull())
    {
        qWarning().noquote() << "[img2pdf]" << error;
        *failure = ConversionResult::failure(DocShiftErrorCode::InputCorrupt, error);
        return false;
    }

    PagePlacement place;
    if (!ImagePdfConverter::computePlacement(layout, image.width(), image.height(), &place))
    {
        *failure = ConversionResult::failure(DocShiftErrorCode::InputUnsupported,
                                             QObject::tr("Unknown page layout %1").arg(layout));
        return false;
    }

    const QByteArray encoded = encodeForPdf(image, input);
    if (encoded.isEmpty())
    {
        *failure = ConversionResult::failure(DocShiftErrorCode::EngineFailed,
                                             QObject::tr("Cannot re-encode image %1").arg(input));
        return false;
    }
    if (!writer.addImagePage(encoded, static_cast<float>(place.pageWidth), static_cast<float>(place.pageHeight),
                             static_cast<float>(place.x), static_cast<float>(place.y), static_cast<float>(place.width),
                             static_cast<float>(place.height), &error))
    {
        *failure = ConversionResult::failure(DocShiftErrorCode::EngineFailed, error);
        return false;
    }
    qDebug().noquote() << "[img2pdf]" << input << image.width() << "x" << image.height() << "->" << place.pageWidth
                       << "x" << place.pageHeight << "pt";
    return true;
}
} // namespace

QStringList ImagePdfConverter::inputExtensions()
{
    return {QStringLiteral(".jpg"), QStringLiteral(".jpeg"), QStringLiteral(".png"), QStringLiteral(".bmp"),
            QStringLiteral(".tiff"), QStringLiteral(".tif"), QStringLiteral(".gif")};
}

QStringList ImagePdfConverter::layouts()
{
    return {QStringLiteral("image"), QStringLiteral("a4"), QStringLiteral("letter")};
}

QJsonObject ImagePdfConverter::supportedFormats()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("input"), QJsonArray::fromStringList(inputExtensions()));
    obj.insert(QStringLiteral("output"), QJsonArray{QStringLiteral(".pdf")});
    obj.insert(QStringLiteral("layouts"), QJsonArray::fromStringList(layouts()));
    obj.insert(QStringLiteral("engine"), QStringLiteral("qt+mupdf"));
    return obj;
}

bool ImagePdfConverter::computePlacement(const QString &layout, int imageWidth, int imageHeight, PagePlacement *placement)
{
    if (imageWidth <= 0 || imageHeight <= 0 || !placement) return false;
    const QString mode = layout.trimmed().toLower();
    PagePlacement p;
    if (mode.isEmpty() || mode == QLatin1String("image"))
    {
        p.pageWidth = imageWidth * 72.0 / DEFAULT_IMAGE_PDF_DPI;
        p.pageHeight = imageHeight * 72.0 / DEFAULT_IMAGE_PDF_DPI;
        p.width = p.pageWidth;
        p.height = p.pageHeight;
        *placement = p;
        return true;
    }
    if (mode == QLatin1String("a4"))
    {
        p.pageWidth = PAGE_A4_WIDTH;
        p.pageHeight = PAGE_A4_HEIGHT;
    }
    else if (mode == QLatin1String("letter"))
    {
        p.pageWidth = PAGE_LETTER_WIDTH;
        p.pageHeight = PAGE_LETTER_HEIGHT;
    }
    else
    {
        return false;
    }
    const double scale = qMin(p.pageWidth / imageWidth, p.pageHeight / imageHeight) * DEFAULT_PAGE_MARGIN_RATIO;
    p.width = imageWidth * scale;
    p.height = imageHeight * scale;
    p.x = (p.pageWidth - p.width) / 2.0;
    p.y = (p.pageHeight - p.height) / 2.0;
    *placement = p;
    return true;
}

ConversionResult ImagePdfConverter::imageToPdf(const QString &input, const QString &outDir, const QString &layout) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;
    return imagesToPdf({input}, outputFilePath(dir, input, QString(), QStringLiteral("pdf")), layout);
}

ConversionResult ImagePdfConverter::imagesToPdf(const QStringList &inputs, const QString &outputFile,
                                                const QString &layout) const
{
    if (inputs.isEmpty())
        return ConversionResult::failure(DocShiftErrorCode::InputUnsupported, QObject::tr("no input images"));
    // no layout means the picture's own size
    const QString mode = layout.trimmed().isEmpty() ? QStringLiteral("image") : layout.trimmed().toLower();
    if (!layouts().contains(mode))
        return ConversionResult::failure(DocShiftErrorCode::InputUnsupported,
                                         QObject::tr("Unknown page layout %1").arg(layout));

    ConversionResult failure;
    for (const QString &input : inputs)
    {
        if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    }

    const QString target = QFileInfo(outputFile).absoluteFilePath();
    if (!QDir().mkpath(QFileInfo(target).absolutePath()))
    {
        return ConversionResult::failure(DocShiftErrorCode::IoOutputDirFailed,
                                         QObject::tr("Failed to create output directory: %1").arg(QFileInfo(target).absolutePath()));
    }

    mupdf::Context ctx;
    if (!ctx.isValid()) return ConversionResult::failure(DocShiftErrorCode::EngineUnavailable, ctx.error());
    mupdf::PdfWriter writer(ctx);
    if (!writer.isValid())
        return ConversionResult::failure(DocShiftErrorCode::EngineFailed, QObject::tr("Cannot create PDF document"));

    for (const QString &input : inputs)
    {
        if (!appendImagePage(writer, input, mode, &failure)) return failure;
    }

    QString error;
    if (!writer.save(target, &error))
    {
        qWarning().noquote() << "[img2pdf]" << error;
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
    }
    qInfo().noquote() << "[img2pdf] wrote" << target << "pages" << inputs.size();
    return ConverterSupport::verifyOutputs({target});
}
