#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QTemporaryDir>

#include "app/app_bootstrap.h"
#include "app/app_settings.h"

TEST_CASE("AppSettings defaults come from xconfig")
{
    const AppSettings s = AppSettings::defaults();
    CHECK(s.conversionType == QStringLiteral("word_to_pdf"));
    CHECK(s.imageFormat == QStringLiteral("png"));
    CHECK(s.imageDpi == 150);
    CHECK(s.pageLayout == QStringLiteral("image"));
    CHECK(s.officePath.isEmpty());
    CHECK(s.officeTimeoutMs == DEFAULT_OFFICE_TIMEOUT_MS);
}

TEST_CASE("AppSettings round-trips through an ini file")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString ini = dir.filePath(QStringLiteral("docshift_config.ini"));

    AppSettings s;
    s.conversionType = QStringLiteral("pdf_to_image");
    s.lastInputDir = QStringLiteral("/home/用户/文档");
    s.outputDir = QStringLiteral("/home/用户/输出");
    s.imageFormat = QStringLiteral("jpg");
    s.imageDpi = 300;
    s.pageLayout = QStringLiteral("a4");
    s.officePath = QStringLiteral("/opt/libreoffice/program/soffice");
    s.officeTimeoutMs = 60000;
    REQUIRE(s.saveFile(ini));

    const AppSettings loaded = AppSettings::loadFile(ini);
    CHECK(loaded.conversionType == s.conversionType);
    CHECK(loaded.lastInputDir == s.lastInputDir);
    CHECK(loaded.outputDir == s.outputDir);
    CHECK(loaded.imageFormat == s.imageFormat);
    CHECK(loaded.imageDpi == s.imageDpi);
    CHECK(loaded.pageLayout == s.pageLayout);
    CHECK(loaded.officePath == s.officePath);
    CHECK(loaded.officeTimeoutMs == s.officeTimeoutMs);

    const ConversionOptions options = loaded.toOptions();
    CHECK(options.imageFormat == QStringLiteral("jpg"));
    CHECK(options.dpi == 300);
    CHECK(options.pageLayout == QStringLiteral("a4"));
    CHECK(options.officePath == s.officePath);
    CHECK(options.officeTimeoutMs == 60000);
    CHECK(options.pageFirst == 0);
    CHECK(options.pageLast == 0);
}

TEST_CASE("AppSettings falls back to defaults for invalid values")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString ini = dir.filePath(QStringLiteral("broken.ini"));
    {
        QSettings raw(ini, QSettings::IniFormat);
        raw.setValue("conversion_type", QStringLiteral("   "));
        raw.setValue("image_format", QStringLiteral("gif"));
        raw.setValue("image_dpi", QStringLiteral("lots"));
        raw.setValue("page_layout", QStringLiteral("tabloid"));
        raw.setValue("office_timeout_ms", -5);
        raw.sync();
    }

    const AppSettings loaded = AppSettings::loadFile(ini);
    CHECK(loaded.conversionType == QStringLiteral("word_to_pdf"));
    CHECK(loaded.imageFormat == QStringLiteral("png"));
    CHECK(loaded.imageDpi == 150);
    CHECK(loaded.pageLayout == QStringLiteral("image"));
    CHECK(loaded.officeTimeoutMs == DEFAULT_OFFICE_TIMEOUT_MS);

    {
        QSettings raw(ini, QSettings::IniFormat);
        raw.setValue("image_dpi", 5000);
        raw.setValue("image_format", QStringLiteral("TIFF"));
        raw.sync();
    }
    const AppSettings again = AppSettings::loadFile(ini);
    CHECK(again.imageDpi == 150);
    CHECK(again.imageFormat == QStringLiteral("tiff"));
}

TEST_CASE("AppBootstrap lays out the temp directory next to the application")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const AppContext ctx = AppBootstrap::buildContext(dir.path());
    CHECK(ctx.tempDir == QDir(dir.path()).filePath(QStringLiteral("DOCSHIFT_TEMP")));
    CHECK(QFileInfo(ctx.configPath).fileName() == QStringLiteral("docshift_config.ini"));
    CHECK(QFileInfo(ctx.logPath).fileName() == QStringLiteral("docshift.log"));
    CHECK(QFileInfo(ctx.configPath).absolutePath() == QFileInfo(ctx.tempDir).absoluteFilePath());
}

TEST_CASE("AppBootstrap writes the default config only once")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const AppContext ctx = AppBootstrap::buildContext(dir.path());

    CHECK(AppBootstrap::ensureDefaultConfig(ctx));
    REQUIRE(QFile::exists(ctx.configPath));
    QSettings written(ctx.configPath, QSettings::IniFormat);
    CHECK(written.value("conversion_type").toString() == QStringLiteral("word_to_pdf"));
    CHECK(written.value("image_dpi").toInt() == 150);

    AppSettings changed = AppSettings::loadFile(ctx.configPath);
    changed.conversionType = QStringLiteral("word_to_md");
    REQUIRE(changed.saveFile(ctx.configPath));

    CHECK_FALSE(AppBootstrap::ensureDefaultConfig(ctx));
    CHECK(AppSettings::loadFile(ctx.configPath).conversionType == QStringLiteral("word_to_md"));
}
