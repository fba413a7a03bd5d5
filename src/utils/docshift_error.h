#ifndef DOCSHIFT_ERROR_H
#define DOCSHIFT_ERROR_H

#include <QString>

// DocShift 统一错误码：
// - 目标：让弹窗文案可读，同时让日志/自动化能稳定匹配错误类别。
// - 约定：
//   - IO  = 输入文件/输出目录读写
//   - IN  = 输入内容或参数不被支持
//   - ENG = 外部转换引擎（office 进程等）
//   - OUT = 转换结束后的产物校验
enum class DocShiftErrorCode
{
    None = 0,
    IoInputMissing,
    IoOutputDirFailed,
    IoWriteFailed,
    InputUnsupported,
    InputCorrupt,
    InputEncrypted,
    EngineUnavailable,
    EngineFailed,
    EngineTimeout,
    OutputMissing,
};

inline QString docShiftErrorCodeTag(DocShiftErrorCode code)
{
    switch (code)
    {
    case DocShiftErrorCode::IoInputMissing: return QStringLiteral("DS-IO-001");
    case DocShiftErrorCode::IoOutputDirFailed: return QStringLiteral("DS-IO-002");
    case DocShiftErrorCode::IoWriteFailed: return QStringLiteral("DS-IO-003");
    case DocShiftErrorCode::InputUnsupported: return QStringLiteral("DS-IN-001");
    case DocShiftErrorCode::InputCorrupt: return QStringLiteral("DS-IN-002");
    case DocShiftErrorCode::InputEncrypted: return QStringLiteral("DS-IN-003");
    case DocShiftErrorCode::EngineUnavailable: return QStringLiteral("DS-ENG-001");
    case DocShiftErrorCode::EngineFailed: return QStringLiteral("DS-ENG-002");
    case DocShiftErrorCode::EngineTimeout: return QStringLiteral("DS-ENG-003");
    case DocShiftErrorCode::OutputMissing: return QStringLiteral("DS-OUT-001");
    case DocShiftErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("DS-UNKNOWN");
}

inline QString formatDocShiftError(DocShiftErrorCode code, const QString &message)
{
    if (code == DocShiftErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(docShiftErrorCodeTag(code), message);
}

#endif // DOCSHIFT_ERROR_H
