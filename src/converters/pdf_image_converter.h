#ifndef DOCSHIFT_PDF_IMAGE_CONVERTER_H
#define DOCSHIFT_PDF_IMAGE_CONVERTER_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "conversion_result.h"
#include "xconfig.h"

// PDF pages rendered to raster files with MuPDF.
class PdfImageConverter
{
public:
    // One file per page, "<stem>_page_NNN.<format>". pageFirst/pageLast are
    // 1-based and inclusive; 0 leaves that end open.
    ConversionResult pdfToImage(const QString &input, const QString &outDir,
                                const QString &format = QStringLiteral(DEFAULT_IMAGE_FORMAT),
                                int dpi = DEFAULT_IMAGE_DPI, int pageFirst = 0, int pageLast = 0) const;

    // Every page stitched into one picture; layout is "vertical" or "horizontal".
    ConversionResult pdfToSingleImage(const QString &input, const QString &outputFile,
                                      const QString &format = QStringLiteral(DEFAULT_IMAGE_FORMAT),
                                      int dpi = DEFAULT_IMAGE_DPI,
                                      const QString &layout = QStringLiteral("vertical")) const;

    static QStringList inputExtensions();
    static QStringList outputFormats();
    static QJsonObject supportedFormats();

    // Clamp a requested range against pageCount. Returns false when nothing is selected.
    static bool resolvePageRange(int pageCount, int requestedFirst, int requestedLast, int *first, int *last);
};

#endif // DOCSHIFT_PDF_IMAGE_CONVERTER_H
