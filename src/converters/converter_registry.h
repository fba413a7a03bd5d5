#ifndef DOCSHIFT_CONVERTER_REGISTRY_H
#define DOCSHIFT_CONVERTER_REGISTRY_H

#include <QJsonObject>
#include <QList>
#include <QString>

#include "conversion_result.h"
#include "xconfig.h"

enum class ConversionKind
{
    WordToPdf,
    PdfToWord,
    ImageToPdf,
    PdfToImage,
    ImageToScan,
    WordToMd,
};

// Maps conversion kinds to their ids, UI labels, dialog filters and converters.
namespace ConverterRegistry
{
// UI order: two columns, three rows
QList<ConversionKind> allKinds();

QString kindId(ConversionKind kind);
QString kindLabel(ConversionKind kind);
// Unknown ids fall back to WordToPdf and set *ok to false.
ConversionKind kindFromId(const QString &id, bool *ok = nullptr);

// QFileDialog filter string for the kind's input files.
QString fileFilter(ConversionKind kind);

// Runs one conversion synchronously; safe to call from a worker thread.
ConversionResult run(ConversionKind kind, const QString &input, const QString &outDir,
                     const ConversionOptions &options = ConversionOptions());

// Per kind: availability, accepted inputs, outputs and engine.
QJsonObject capabilities(const ConversionOptions &options = ConversionOptions());
} // namespace ConverterRegistry

#endif // DOCSHIFT_CONVERTER_REGISTRY_H
