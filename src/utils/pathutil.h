// pathutil.h - input validation and output location helpers shared by the converters
#ifndef DOCSHIFT_PATHUTIL_H
#define DOCSHIFT_PATHUTIL_H

#include <QString>
#include <QStringList>

// Return a path representation that external third-party command-line tools can handle.
// - On Windows, office tools may not support Unicode paths when built with narrow char APIs.
//   We attempt to convert to an ASCII-only 8.3 short path (GetShortPathNameW).
// - On other platforms, the absolute native path is returned.
// The function is a no-op for empty paths.
QString toToolFriendlyPath(const QString &path);

// Quick predicate; useful for tests and conditional handling
bool isAsciiOnly(const QString &s);

// Lower-case suffix with a leading dot ("report.DOCX" -> ".docx"); empty when there is none.
QString dottedSuffix(const QString &path);

// True if the path's suffix is one of the dotted, lower-case extensions.
bool hasSupportedSuffix(const QString &path, const QStringList &dottedExtensions);

// Resolve the directory a converter writes into. Empty outputDir means "next to the input".
// The directory is created recursively. Returns the absolute directory or empty on failure.
QString resolveOutputDir(const QString &inputFile, const QString &outputDir, QString *error = nullptr);

// "<dir>/<stem><suffix>.<extension>" where stem is the input name without its last extension.
QString outputFilePath(const QString &dir, const QString &inputFile, const QString &suffix, const QString &extension);

// Read a whole file / write a whole file; both report the failing path in *error.
bool readFileBytes(const QString &path, QByteArray *data, QString *error = nullptr);
bool writeFileBytes(const QString &path, const QByteArray &data, QString *error = nullptr);

#endif // DOCSHIFT_PATHUTIL_H
