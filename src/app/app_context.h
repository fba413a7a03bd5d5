#ifndef DOCSHIFT_APP_CONTEXT_H
#define DOCSHIFT_APP_CONTEXT_H

#include <QString>

// 应用启动阶段需要的上下文信息（只读快照）。
// 约定：AppContext 在应用启动后构建完成，后续仅作为只读配置传递。
struct AppContext
{
    QString appDir;     // 可执行程序所在目录
    QString appPath;    // 可执行程序完整路径
    QString tempDir;    // DOCSHIFT_TEMP 绝对路径
    QString configPath; // docshift_config.ini
    QString logPath;    // docshift.log
};

#endif // DOCSHIFT_APP_CONTEXT_H
