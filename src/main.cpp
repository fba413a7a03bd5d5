#include <QApplication>
#include <QDebug>
#include <QGuiApplication>

#include "app/app_bootstrap.h"
#include "utils/applog.h"
#include "widget/converter_window.h"
#include "xconfig.h"

int main(int argc, char *argv[])
{
    AppLog::startTimer();
    AppBootstrap::applyEarlyEnv();

    QCoreApplication::setAttribute(Qt::AA_EnableHighDpiScaling, true);                                       // 自适应缩放
    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(Qt::HighDpiScaleFactorRoundingPolicy::PassThrough); // 适配非整数倍缩放
    QApplication a(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral(DOCSHIFT_APP_NAME));
    QCoreApplication::setApplicationVersion(QStringLiteral(DOCSHIFT_VERSION));

    const AppContext ctx = AppBootstrap::buildContext();
    AppBootstrap::installLog(ctx); // 目录无法创建时日志仍输出到stderr
    AppLog::startupStep(QStringLiteral("QApplication 初始化完成"));
    qInfo().noquote() << "[startup]" << DOCSHIFT_APP_NAME << DOCSHIFT_VERSION << "at" << ctx.appPath;

    AppBootstrap::ensureDefaultConfig(ctx);
    AppLog::startupStep(QStringLiteral("配置加载完成"));

    ConverterWindow w(ctx);
    w.show();
    AppLog::startupStep(QStringLiteral("主窗口显示"));

    const int code = a.exec();
    qInfo().noquote() << "[startup] exit code" << code;
    AppLog::uninstall();
    return code;
}
