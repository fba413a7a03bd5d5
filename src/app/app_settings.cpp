#include "app_settings.h"

#include <QSettings>
#include <QStringList>
#include <QtGlobal>

namespace
{
const QStringList &knownImageFormats()
{
    static const QStringList formats = {QStringLiteral("png"), QStringLiteral("jpg"), QStringLiteral("jpeg"),
                                        QStringLiteral("bmp"), QStringLiteral("tiff")};
    return formats;
}

const QStringList &knownLayouts()
{
    static const QStringList layouts = {QStringLiteral("image"), QStringLiteral("a4"), QStringLiteral("letter")};
    return layouts;
}
} // namespace

AppSettings AppSettings::load(const QSettings &settings)
{
    AppSettings s;
    s.conversionType = settings.value("conversion_type", s.conversionType).toString().trimmed();
    s.lastInputDir = settings.value("last_input_dir", s.lastInputDir).toString();
    s.outputDir = settings.value("output_dir", s.outputDir).toString();
    s.officePath = settings.value("office_path", s.officePath).toString().trimmed();

    const QString format = settings.value("image_format", s.imageFormat).toString().trimmed().toLower();
    if (knownImageFormats().contains(format)) s.imageFormat = format;

    bool ok = false;
    const int dpi = settings.value("image_dpi", s.imageDpi).toInt(&ok);
    if (ok && dpi >= MIN_IMAGE_DPI && dpi <= MAX_IMAGE_DPI) s.imageDpi = dpi;

    const QString layout = settings.value("page_layout", s.pageLayout).toString().trimmed().toLower();
    if (knownLayouts().contains(layout)) s.pageLayout = layout;

    const int timeout = settings.value("office_timeout_ms", s.officeTimeoutMs).toInt(&ok);
    if (ok && timeout > 0) s.officeTimeoutMs = timeout;

    if (s.conversionType.isEmpty()) s.conversionType = QStringLiteral(DEFAULT_CONVERSION_TYPE);
    return s;
}

AppSettings AppSettings::loadFile(const QString &iniPath)
{
    QSettings settings(iniPath, QSettings::IniFormat);
    settings.setIniCodec("utf-8");
    return load(settings);
}

void AppSettings::save(QSettings &settings) const
{
    settings.setValue("conversion_type", conversionType);
    settings.setValue("last_input_dir", lastInputDir);
    settings.setValue("output_dir", outputDir);
    settings.setValue("image_format", imageFormat);
    settings.setValue("image_dpi", imageDpi);
    settings.setValue("page_layout", pageLayout);
    settings.setValue("office_path", officePath);
    settings.setValue("office_timeout_ms", officeTimeoutMs);
}

bool AppSettings::saveFile(const QString &iniPath) const
{
    QSettings settings(iniPath, QSettings::IniFormat);
    settings.setIniCodec("utf-8");
    save(settings);
    settings.sync();
    return settings.status() == QSettings::NoError;
}

ConversionOptions AppSettings::toOptions() const
{
    ConversionOptions options;
    options.imageFormat = imageFormat;
    options.dpi = imageDpi;
    options.pageLayout = pageLayout;
    options.officePath = officePath;
    options.officeTimeoutMs = officeTimeoutMs;
    return options;
}
