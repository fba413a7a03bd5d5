#ifndef DOCSHIFT_WORD_PDF_CONVERTER_H
#define DOCSHIFT_WORD_PDF_CONVERTER_H

#include <QString>
#include <QStringList>

#include "conversion_result.h"
#include "xconfig.h"

// Word <-> PDF. Word layout goes through the office engine, PDF to Word is a
// text and picture flow rebuilt from MuPDF structured text.
class WordPdfConverter
{
public:
    explicit WordPdfConverter(const ConversionOptions &options = ConversionOptions());

    ConversionResult wordToPdf(const QString &input, const QString &outDir) const;
    ConversionResult pdfToWord(const QString &input, const QString &outDir) const;

    bool isWordToPdfAvailable() const;
    bool isPdfToWordAvailable() const { return true; }
    QString officeExecutable() const;

    static QStringList wordExtensions();
    static QStringList pdfExtensions();

private:
    ConversionOptions m_options;
};

#endif // DOCSHIFT_WORD_PDF_CONVERTER_H
