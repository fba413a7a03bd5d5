#include "converter_registry.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QObject>

#include "converter_support.h"
#include "image_pdf_converter.h"
#include "pdf_image_converter.h"
#include "scan_converter.h"
#include "word_md_converter.h"
#include "word_pdf_converter.h"

namespace
{
QString filterWithFallback(const QString &name, const QStringList &patterns)
{
    return QStringLiteral("%1 (%2);;所有文件 (*)").arg(name, ConverterSupport::dialogPatterns(patterns));
}

// Dialog patterns stay narrower than what the converters accept (no .tif/.gif)
QStringList dialogImagePatterns()
{
    return {QStringLiteral(".jpg"), QStringLiteral(".jpeg"), QStringLiteral(".png"), QStringLiteral(".bmp"),
            QStringLiteral(".tiff")};
}
} // namespace

namespace ConverterRegistry
{
QList<ConversionKind> allKinds()
{
    return {ConversionKind::WordToPdf,  ConversionKind::PdfToWord,   ConversionKind::ImageToPdf,
            ConversionKind::PdfToImage, ConversionKind::ImageToScan, ConversionKind::WordToMd};
}

QString kindId(ConversionKind kind)
{
    switch (kind)
    {
    case ConversionKind::WordToPdf: return QStringLiteral("word_to_pdf");
    case ConversionKind::PdfToWord: return QStringLiteral("pdf_to_word");
    case ConversionKind::ImageToPdf: return QStringLiteral("image_to_pdf");
    case ConversionKind::PdfToImage: return QStringLiteral("pdf_to_image");
    case ConversionKind::ImageToScan: return QStringLiteral("image_to_scan");
    case ConversionKind::WordToMd: return QStringLiteral("word_to_md");
    }
    return QStringLiteral("word_to_pdf");
}

QString kindLabel(ConversionKind kind)
{
    switch (kind)
    {
    case ConversionKind::WordToPdf: return QStringLiteral("Word转PDF");
    case ConversionKind::PdfToWord: return QStringLiteral("PDF转Word");
    case ConversionKind::ImageToPdf: return QStringLiteral("图片转PDF");
    case ConversionKind::PdfToImage: return QStringLiteral("PDF转图片");
    case ConversionKind::ImageToScan: return QStringLiteral("图片转扫描件");
    case ConversionKind::WordToMd: return QStringLiteral("Word转Markdown");
    }
    return QString();
}

ConversionKind kindFromId(const QString &id, bool *ok)
{
    const QString key = id.trimmed().toLower();
    for (ConversionKind kind : allKinds())
    {
        if (kindId(kind) == key)
        {
            if (ok) *ok = true;
            return kind;
        }
    }
    if (ok) *ok = false;
    return ConversionKind::WordToPdf;
}

QString fileFilter(ConversionKind kind)
{
    switch (kind)
    {
    case ConversionKind::WordToPdf:
    case ConversionKind::WordToMd: return filterWithFallback(QStringLiteral("Word文档"), WordPdfConverter::wordExtensions());
    case ConversionKind::PdfToWord:
    case ConversionKind::PdfToImage: return filterWithFallback(QStringLiteral("PDF文件"), WordPdfConverter::pdfExtensions());
    case ConversionKind::ImageToPdf:
    case ConversionKind::ImageToScan: return filterWithFallback(QStringLiteral("图片文件"), dialogImagePatterns());
    }
    return QStringLiteral("所有文件 (*)");
}

ConversionResult run(ConversionKind kind, const QString &input, const QString &outDir, const ConversionOptions &options)
{
    QElapsedTimer timer;
    timer.start();
    qInfo().noquote() << "[convert] start" << kindId(kind) << input << "->" << (outDir.isEmpty() ? QStringLiteral("(input dir)") : outDir);

    ConversionResult result;
    switch (kind)
    {
    case ConversionKind::WordToPdf: result = WordPdfConverter(options).wordToPdf(input, outDir); break;
    case ConversionKind::PdfToWord: result = WordPdfConverter(options).pdfToWord(input, outDir); break;
    case ConversionKind::ImageToPdf: result = ImagePdfConverter().imageToPdf(input, outDir, options.pageLayout); break;
    case ConversionKind::PdfToImage:
        result = PdfImageConverter().pdfToImage(input, outDir, options.imageFormat, options.dpi, options.pageFirst,
                                                options.pageLast);
        break;
    case ConversionKind::ImageToScan: result = ScanConverter().convertToScan(input, outDir); break;
    case ConversionKind::WordToMd: result = WordMdConverter(options).wordToMd(input, outDir); break;
    }

    if (result.ok)
        qInfo().noquote() << "[convert] done" << kindId(kind) << result.outputs.size() << "file(s) in" << timer.elapsed() << "ms";
    else
        qWarning().noquote() << "[convert] failed" << kindId(kind) << result.errorText();
    return result;
}

QJsonObject capabilities(const ConversionOptions &options)
{
    const WordPdfConverter wordPdf(options);
    const QString office = wordPdf.officeExecutable();

    QJsonObject wordToPdf;
    wordToPdf.insert(QStringLiteral("available"), !office.isEmpty());
    wordToPdf.insert(QStringLiteral("input"), QJsonArray::fromStringList(WordPdfConverter::wordExtensions()));
    wordToPdf.insert(QStringLiteral("output"), QJsonArray{QStringLiteral(".pdf")});
    wordToPdf.insert(QStringLiteral("engine"), QStringLiteral("libreoffice"));
    wordToPdf.insert(QStringLiteral("executable"), office);

    QJsonObject pdfToWord;
    pdfToWord.insert(QStringLiteral("available"), wordPdf.isPdfToWordAvailable());
    pdfToWord.insert(QStringLiteral("input"), QJsonArray::fromStringList(WordPdfConverter::pdfExtensions()));
    pdfToWord.insert(QStringLiteral("output"), QJsonArray{QStringLiteral(".docx")});
    pdfToWord.insert(QStringLiteral("engine"), QStringLiteral("mupdf"));

    QJsonObject pdfToImage = PdfImageConverter::supportedFormats();
    pdfToImage.insert(QStringLiteral("available"), true);
    QJsonObject imageToPdf = ImagePdfConverter::supportedFormats();
    imageToPdf.insert(QStringLiteral("available"), true);
    QJsonObject imageToScan = ScanConverter::supportedFormats();
    imageToScan.insert(QStringLiteral("available"), true);
    QJsonObject wordToMd = WordMdConverter::supportedFormats();
    wordToMd.insert(QStringLiteral("available"), true);
    // .doc keeps formatting only through the office engine
    wordToMd.insert(QStringLiteral("doc_via_office"), !office.isEmpty());

    QJsonObject all;
    all.insert(kindId(ConversionKind::WordToPdf), wordToPdf);
    all.insert(kindId(ConversionKind::PdfToWord), pdfToWord);
    all.insert(kindId(ConversionKind::ImageToPdf), imageToPdf);
    all.insert(kindId(ConversionKind::PdfToImage), pdfToImage);
    all.insert(kindId(ConversionKind::ImageToScan), imageToScan);
    all.insert(kindId(ConversionKind::WordToMd), wordToMd);
    return all;
}
} // namespace ConverterRegistry
