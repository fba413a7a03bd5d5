#ifndef DOCSHIFT_XCONFIG_H
#define DOCSHIFT_XCONFIG_H

#include <QString>
#include <QStringList>

// 版本
#define DOCSHIFT_APP_NAME "docshift"
#define DOCSHIFT_VERSION "1.2.0"

// 运行目录约定（相对可执行程序所在目录）
#define DOCSHIFT_TEMP_DIR_RELATIVE "DOCSHIFT_TEMP"
#define DOCSHIFT_CONFIG_FILE "docshift_config.ini"
#define DOCSHIFT_LOG_FILE "docshift.log"

// 转换默认值
#define DEFAULT_CONVERSION_TYPE "word_to_pdf"
#define DEFAULT_IMAGE_FORMAT "png"
#define DEFAULT_IMAGE_DPI 150
#define MIN_IMAGE_DPI 10
#define MAX_IMAGE_DPI 1200
#define DEFAULT_JPEG_QUALITY 95
#define DEFAULT_PAGE_LAYOUT "image"
#define DEFAULT_IMAGE_PDF_DPI 100.0 // 图片转PDF时按100dpi计算页面尺寸
#define DEFAULT_PAGE_MARGIN_RATIO 0.9
#define DEFAULT_OFFICE_TIMEOUT_MS 180000

// 纸张尺寸（单位pt）
#define PAGE_A4_WIDTH 595.28
#define PAGE_A4_HEIGHT 841.89
#define PAGE_LETTER_WIDTH 612.0
#define PAGE_LETTER_HEIGHT 792.0

// 扫描件参数
#define SCAN_DETECT_HEIGHT 500.0
#define SCAN_MIN_AREA_RATIO 0.2
#define SCAN_GAMMA 1.5
#define SCAN_TRUNC_THRESHOLD 230

// 转换参数（每次转换的快照，默认值来自配置文件）
struct ConversionOptions
{
    QString imageFormat = QStringLiteral(DEFAULT_IMAGE_FORMAT); // pdf转图片输出格式
    int dpi = DEFAULT_IMAGE_DPI;                                // pdf转图片分辨率
    int pageFirst = 0;                                          // 起始页(1基)，0表示从头
    int pageLast = 0;                                           // 结束页(含)，0表示到尾
    QString pageLayout = QStringLiteral(DEFAULT_PAGE_LAYOUT);   // 图片转PDF页面: image/a4/letter
    QString officePath;                                         // 指定的soffice路径，空则自动查找
    int officeTimeoutMs = DEFAULT_OFFICE_TIMEOUT_MS;
};

#endif // DOCSHIFT_XCONFIG_H
