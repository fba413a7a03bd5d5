#ifndef DOCSHIFT_CONVERSION_RESULT_H
#define DOCSHIFT_CONVERSION_RESULT_H

#include <QString>
#include <QStringList>

#include "utils/docshift_error.h"

// 一次转换的结果：成功时 outputs 至少包含一个文件，第一个为主输出。
struct ConversionResult
{
    bool ok = false;
    DocShiftErrorCode code = DocShiftErrorCode::None;
    QString message;
    QStringList outputs;
    QStringList warnings;

    QString primaryOutput() const { return outputs.isEmpty() ? QString() : outputs.first(); }
    QString errorText() const { return formatDocShiftError(code, message); }

    static ConversionResult success(const QStringList &files, const QStringList &warnings = QStringList())
    {
        ConversionResult r;
        r.ok = true;
        r.outputs = files;
        r.warnings = warnings;
        return r;
    }

    static ConversionResult failure(DocShiftErrorCode code, const QString &message)
    {
        ConversionResult r;
        r.code = code;
        r.message = message;
        return r;
    }
};

#endif // DOCSHIFT_CONVERSION_RESULT_H
