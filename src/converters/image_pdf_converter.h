#ifndef DOCSHIFT_IMAGE_PDF_CONVERTER_H
#define DOCSHIFT_IMAGE_PDF_CONVERTER_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "conversion_result.h"
#include "xconfig.h"

// Where a picture lands on its PDF page, in points from the top-left corner.
struct PagePlacement
{
    double pageWidth = 0;
    double pageHeight = 0;
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

// Pictures to PDF pages, decoded by Qt and written with MuPDF.
class ImagePdfConverter
{
public:
    // Layout "image": page sized to the picture at 100 dpi.
    // Layout "a4"/"letter": picture scaled to 90 % of the fitting size and centred.
    ConversionResult imageToPdf(const QString &input, const QString &outDir,
                                const QString &layout = QStringLiteral(DEFAULT_PAGE_LAYOUT)) const;

    // One page per picture, in list order, into outputFile.
    ConversionResult imagesToPdf(const QStringList &inputs, const QString &outputFile,
                                 const QString &layout = QStringLiteral(DEFAULT_PAGE_LAYOUT)) const;

    static QStringList inputExtensions();
    static QStringList layouts();
    static QJsonObject supportedFormats();

    // False for an unknown layout or an empty picture.
    static bool computePlacement(const QString &layout, int imageWidth, int imageHeight, PagePlacement *placement);
};

#endif // DOCSHIFT_IMAGE_PDF_CONVERTER_H
