#include "app_bootstrap.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QtGlobal>

#include "app_settings.h"
#include "utils/applog.h"
#include "xconfig.h"

void AppBootstrap::applyEarlyEnv()
{
    // 兼容老旧 CPU：禁用 Qt PCRE2 JIT，避免 SIGILL。
    qputenv("QT_DISABLE_REGEXP_JIT", QByteArray("1"));
}

AppContext AppBootstrap::buildContext(const QString &appDir)
{
    AppContext ctx;
    if (appDir.isEmpty())
    {
        ctx.appDir = QCoreApplication::applicationDirPath(); // 就在当前目录创建DOCSHIFT_TEMP文件夹
        ctx.appPath = QCoreApplication::applicationFilePath();
    }
    else
    {
        ctx.appDir = QFileInfo(appDir).absoluteFilePath();
    }

    ctx.tempDir = QDir(ctx.appDir).filePath(QStringLiteral(DOCSHIFT_TEMP_DIR_RELATIVE));
    ctx.configPath = QDir(ctx.tempDir).filePath(QStringLiteral(DOCSHIFT_CONFIG_FILE));
    ctx.logPath = QDir(ctx.tempDir).filePath(QStringLiteral(DOCSHIFT_LOG_FILE));
    return ctx;
}

bool AppBootstrap::ensureTempDir(const AppContext &ctx)
{
    if (QDir().mkpath(ctx.tempDir)) return true;
    qWarning().noquote() << "[startup] cannot create" << ctx.tempDir;
    return false;
}

bool AppBootstrap::installLog(const AppContext &ctx)
{
    if (!ensureTempDir(ctx)) return false;
    return AppLog::install(ctx.logPath);
}

bool AppBootstrap::ensureDefaultConfig(const AppContext &ctx)
{
    if (!ensureTempDir(ctx)) return false;
    if (QFile::exists(ctx.configPath)) return false;

    QSettings s(ctx.configPath, QSettings::IniFormat);
    s.setIniCodec("utf-8");
    AppSettings::defaults().save(s);
    s.sync();
    if (s.status() != QSettings::NoError)
    {
        qWarning().noquote() << "[startup] failed to write default config" << ctx.configPath;
        return false;
    }
    qInfo().noquote() << "[startup] default config written" << ctx.configPath;
    return true;
}
