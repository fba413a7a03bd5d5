#ifndef DOCSHIFT_CONVERTER_SUPPORT_H
#define DOCSHIFT_CONVERTER_SUPPORT_H

#include <QString>
#include <QStringList>

#include "conversion_result.h"

// Steps shared by every converter: validate the input, resolve the output
// directory, and check that the produced files exist.
namespace ConverterSupport
{
// Input must exist, be a regular file and carry one of dottedExtensions.
// On failure *failure is filled and false returned.
bool checkInput(const QString &input, const QStringList &dottedExtensions, ConversionResult *failure);

// Absolute, existing output directory (input's directory when outDir is empty).
bool prepareOutputDir(const QString &input, const QString &outDir, QString *dir, ConversionResult *failure);

// Success when every file exists and is non-empty, OutputMissing otherwise.
ConversionResult verifyOutputs(const QStringList &files, const QStringList &warnings = QStringList());

// "*.docx *.doc" style pattern list for file dialogs.
QString dialogPatterns(const QStringList &dottedExtensions);
} // namespace ConverterSupport

#endif // DOCSHIFT_CONVERTER_SUPPORT_H
