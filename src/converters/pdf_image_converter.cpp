#include "pdf_image_converter.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImage>
#include <QImageWriter>
#include <QJsonArray>
#include <QObject>
#include <QPainter>
#include <QVector>
#include <cstring>

#include "converter_support.h"
#include "mupdf_support.h"
#include "utils/pathutil.h"

namespace
{
// Qt writer name for a user facing format id
QByteArray writerFormat(const QString &format)
{
    const QString f = format.toLower();
    if (f == QLatin1String("jpg") || f == QLatin1String("jpeg")) return QByteArrayLiteral("jpeg");
    return f.toLatin1();
}

bool checkRenderOptions(const QString &format, int dpi, ConversionResult *failure)
{
    if (!PdfImageConverter::outputFormats().contains(format.toLower()))
    {
        *failure = ConversionResult::failure(
            DocShiftErrorCode::InputUnsupported,
            QObject::tr("Unsupported image format %1, expected one of: %2")
                .arg(format, PdfImageConverter::outputFormats().join(QLatin1Char(' '))));
        return false;
    }
    if (dpi < MIN_IMAGE_DPI || dpi > MAX_IMAGE_DPI)
    {
        *failure = ConversionResult::failure(
            DocShiftErrorCode::InputUnsupported,
            QObject::tr("dpi %1 out of range %2..%3").arg(dpi).arg(MIN_IMAGE_DPI).arg(MAX_IMAGE_DPI));
        return false;
    }
    return true;
}

// RGB rendering of one page, alpha dropped. Null image on failure.
QImage renderPage(fz_context *ctx, fz_document *doc, int index, float zoom, QString *error)
{
    fz_pixmap *pix = nullptr;
    bool failed = false;
    fz_var(pix);
    fz_var(failed);
    fz_try(ctx)
    {
        pix = fz_new_pixmap_from_page_number(ctx, doc, index, fz_scale(zoom, zoom), fz_device_rgb(ctx), 0);
    }
    fz_catch(ctx)
    {
        failed = true;
    }
    if (failed)
    {
        if (error) *error = QObject::tr("page %1: %2").arg(index + 1).arg(mupdf::caughtMessage(ctx));
        return QImage();
    }

    const int w = fz_pixmap_width(ctx, pix);
    const int h = fz_pixmap_height(ctx, pix);
    const int stride = static_cast<int>(fz_pixmap_stride(ctx, pix));
    const unsigned char *samples = fz_pixmap_samples(ctx, pix);
    QImage image(w, h, QImage::Format_RGB888);
    if (image.isNull())
    {
        fz_drop_pixmap(ctx, pix);
        if (error) *error = QObject::tr("page %1: out of memory for %2x%3 image").arg(index + 1).arg(w).arg(h);
        return QImage();
    }
    for (int y = 0; y < h; ++y) memcpy(image.scanLine(y), samples + static_cast<size_t>(y) * stride, static_cast<size_t>(w) * 3);
    fz_drop_pixmap(ctx, pix);
    return image;
}

bool saveImage(const QImage &image, const QString &path, const QString &format, QString *error)
{
    QImageWriter writer(path, writerFormat(format));
    if (writerFormat(format) == "jpeg") writer.setQuality(DEFAULT_JPEG_QUALITY);
    if (!writer.write(image))
    {
        if (error) *error = QObject::tr("Failed to write %1: %2").arg(path, writer.errorString());
        return false;
    }
    return true;
}
} // namespace

QStringList PdfImageConverter::inputExtensions() { return {QStringLiteral(".pdf")}; }

QStringList PdfImageConverter::outputFormats()
{
    return {QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("bmp"),
            QStringLiteral("tiff")};
}

QJsonObject PdfImageConverter::supportedFormats()
{
    QJsonArray outputs;
    for (const QString &f : outputFormats()) outputs.append(QLatin1Char('.') + f);
    QJsonObject obj;
    obj.insert(QStringLiteral("input"), QJsonArray::fromStringList(inputExtensions()));
    obj.insert(QStringLiteral("output"), outputs);
    obj.insert(QStringLiteral("engine"), QStringLiteral("mupdf"));
    return obj;
}

bool PdfImageConverter::resolvePageRange(int pageCount, int requestedFirst, int requestedLast, int *first, int *last)
{
    const int f = qMax(1, requestedFirst);
    const int l = requestedLast <= 0 ? pageCount : qMin(requestedLast, pageCount);
    if (first) *first = f;
    if (last) *last = l;
    return pageCount > 0 && f <= l;
}

ConversionResult PdfImageConverter::pdfToImage(const QString &input, const QString &outDir, const QString &format,
                                               int dpi, int pageFirst, int pageLast) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    if (!checkRenderOptions(format, dpi, &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;

    mupdf::Context ctx;
    if (!ctx.isValid()) return ConversionResult::failure(DocShiftErrorCode::EngineUnavailable, ctx.error());
    mupdf::Document doc(ctx);
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;
    if (!doc.open(input, &code, &error)) return ConversionResult::failure(code, error);

    int first = 0;
    int last = 0;
    if (!resolvePageRange(doc.pageCount(), pageFirst, pageLast, &first, &last))
    {
        return ConversionResult::failure(DocShiftErrorCode::InputUnsupported,
                                         QObject::tr("page range selects no pages (document has %1)").arg(doc.pageCount()));
    }

    const float zoom = static_cast<float>(dpi) / 72.0f;
    const QString ext = format.toLower();
    QStringList files;
    for (int page = first; page <= last; ++page)
    {
        const QImage image = renderPage(ctx.get(), doc.get(), page - 1, zoom, &error);
        if (image.isNull())
        {
            qWarning().noquote() << "[pdf2img]" << error;
            return ConversionResult::failure(DocShiftErrorCode::EngineFailed, error);
        }
        const QString suffix = QStringLiteral("_page_%1").arg(page, 3, 10, QLatin1Char('0'));
        const QString path = outputFilePath(dir, input, suffix, ext);
        if (!saveImage(image, path, ext, &error))
        {
            qWarning().noquote() << "[pdf2img]" << error;
            return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
        }
        qInfo().noquote() << "[pdf2img] page" << page << "->" << path << image.width() << "x" << image.height();
        files << path;
    }
    return ConverterSupport::verifyOutputs(files);
}

ConversionResult PdfImageConverter::pdfToSingleImage(const QString &input, const QString &outputFile,
                                                     const QString &format, int dpi, const QString &layout) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    if (!checkRenderOptions(format, dpi, &failure)) return failure;
    const bool horizontal = layout.compare(QLatin1String("horizontal"), Qt::CaseInsensitive) == 0;
    if (!horizontal && layout.compare(QLatin1String("vertical"), Qt::CaseInsensitive) != 0)
    {
        return ConversionResult::failure(DocShiftErrorCode::InputUnsupported,
                                         QObject::tr("Unknown layout %1, expected vertical or horizontal").arg(layout));
    }
    const QString target = QFileInfo(outputFile).absoluteFilePath();
    if (!QDir().mkpath(QFileInfo(target).absolutePath()))
    {
        return ConversionResult::failure(DocShiftErrorCode::IoOutputDirFailed,
                                         QObject::tr("Failed to create output directory: %1").arg(QFileInfo(target).absolutePath()));
    }

    mupdf::Context ctx;
    if (!ctx.isValid()) return ConversionResult::failure(DocShiftErrorCode::EngineUnavailable, ctx.error());
    mupdf::Document doc(ctx);
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString error;
    if (!doc.open(input, &code, &error)) return ConversionResult::failure(code, error);
    if (doc.pageCount() <= 0)
        return ConversionResult::failure(DocShiftErrorCode::InputCorrupt, QObject::tr("PDF has no pages: %1").arg(input));

    const float zoom = static_cast<float>(dpi) / 72.0f;
    QVector<QImage> pages;
    int totalW = 0;
    int totalH = 0;
    for (int i = 0; i < doc.pageCount(); ++i)
    {
        QImage image = renderPage(ctx.get(), doc.get(), i, zoom, &error);
        if (image.isNull())
        {
            qWarning().noquote() << "[pdf2img]" << error;
            return ConversionResult::failure(DocShiftErrorCode::EngineFailed, error);
        }
        if (horizontal)
        {
            totalW += image.width();
            totalH = qMax(totalH, image.height());
        }
        else
        {
            totalW = qMax(totalW, image.width());
            totalH += image.height();
        }
        pages.append(image);
    }

    QImage canvas(totalW, totalH, QImage::Format_RGB888);
    if (canvas.isNull())
    {
        return ConversionResult::failure(DocShiftErrorCode::EngineFailed,
                                         QObject::tr("Combined image %1x%2 is too large").arg(totalW).arg(totalH));
    }
    canvas.fill(Qt::white);
    {
        QPainter painter(&canvas);
        int offset = 0;
        for (const QImage &page : pages)
        {
            if (horizontal)
            {
                painter.drawImage(offset, 0, page);
                offset += page.width();
            }
            else
            {
                painter.drawImage(0, offset, page);
                offset += page.height();
            }
        }
    }

    if (!saveImage(canvas, target, format, &error))
    {
        qWarning().noquote() << "[pdf2img]" << error;
        return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);
    }
    qInfo().noquote() << "[pdf2img] combined" << pages.size() << "pages ->" << target;
    return ConverterSupport::verifyOutputs({target});
}
