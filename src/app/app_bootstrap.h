#ifndef DOCSHIFT_APP_BOOTSTRAP_H
#define DOCSHIFT_APP_BOOTSTRAP_H

#include <QString>

#include "app_context.h"

// 应用启动装配器：集中处理环境变量、目录准备、日志与默认配置。
class AppBootstrap
{
public:
    // 早期环境变量设置（必须在 QApplication 创建前执行）。
    static void applyEarlyEnv();

    // 构建 AppContext。appDir 为空时取可执行程序所在目录。
    static AppContext buildContext(const QString &appDir = QString());

    // 确保 DOCSHIFT_TEMP 目录存在。
    static bool ensureTempDir(const AppContext &ctx);

    // 安装文件日志（DOCSHIFT_TEMP/docshift.log）。
    static bool installLog(const AppContext &ctx);

    // 若无配置文件，则写入默认值。返回 true 表示本次新建了配置。
    static bool ensureDefaultConfig(const AppContext &ctx);
};

#endif // DOCSHIFT_APP_BOOTSTRAP_H
