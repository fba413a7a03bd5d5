#ifndef DOCSHIFT_WORD_MD_CONVERTER_H
#define DOCSHIFT_WORD_MD_CONVERTER_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "conversion_result.h"
#include "xconfig.h"

// Word documents to Markdown. Pictures are exported next to the .md file in "<stem>_media/".
class WordMdConverter
{
public:
    explicit WordMdConverter(const ConversionOptions &options = ConversionOptions());

    ConversionResult wordToMd(const QString &input, const QString &outDir) const;

    static QStringList inputExtensions();
    static QJsonObject supportedFormats();

private:
    ConversionResult docxToMd(const QString &docx, const QString &input, const QString &dir) const;
    ConversionResult legacyDocToMd(const QString &input, const QString &dir) const;

    ConversionOptions m_options;
};

#endif // DOCSHIFT_WORD_MD_CONVERTER_H
