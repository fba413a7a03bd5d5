#ifndef DOCSHIFT_OFFICE_ENGINE_H
#define DOCSHIFT_OFFICE_ENGINE_H

#include <QString>
#include <QStringList>

#include "conversion_result.h"

// LibreOffice running headless. Every call uses a throw-away user profile so a
// desktop office instance that is already open does not swallow the request.
class OfficeEngine
{
public:
    explicit OfficeEngine(const QString &configuredPath = QString(), int timeoutMs = 0);

    // Absolute soffice path or empty when no office install was found.
    const QString &executable() const { return m_executable; }
    bool isAvailable() const { return !m_executable.isEmpty(); }

    // soffice --convert-to <format> into outDir. The produced file is
    // "<outDir>/<input stem>.<format>" and is returned as the single output.
    ConversionResult convert(const QString &input, const QString &outDir, const QString &format) const;

    // Lookup order: configured path, soffice/libreoffice on PATH, platform install dirs.
    static QString locate(const QString &configuredPath);
    static QStringList installCandidates();

private:
    QString m_executable;
    int m_timeoutMs = 0;
};

#endif // DOCSHIFT_OFFICE_ENGINE_H
