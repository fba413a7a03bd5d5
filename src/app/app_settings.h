#ifndef DOCSHIFT_APP_SETTINGS_H
#define DOCSHIFT_APP_SETTINGS_H

#include <QString>

#include "xconfig.h"

class QSettings;

// 持久化的用户选择（docshift_config.ini）。
// 非法值在 load 时回落到默认值，保证界面拿到的总是可用配置。
struct AppSettings
{
    QString conversionType = QStringLiteral(DEFAULT_CONVERSION_TYPE);
    QString lastInputDir;
    QString outputDir;
    QString imageFormat = QStringLiteral(DEFAULT_IMAGE_FORMAT);
    int imageDpi = DEFAULT_IMAGE_DPI;
    QString pageLayout = QStringLiteral(DEFAULT_PAGE_LAYOUT);
    QString officePath;
    int officeTimeoutMs = DEFAULT_OFFICE_TIMEOUT_MS;

    static AppSettings defaults() { return AppSettings(); }

    static AppSettings load(const QSettings &settings);
    static AppSettings loadFile(const QString &iniPath);

    void save(QSettings &settings) const;
    bool saveFile(const QString &iniPath) const;

    // 本次转换的参数快照
    ConversionOptions toOptions() const;
};

#endif // DOCSHIFT_APP_SETTINGS_H
