#ifndef DOCSHIFT_SCAN_CONVERTER_H
#define DOCSHIFT_SCAN_CONVERTER_H

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <array>
#include <vector>

#include <opencv2/core.hpp>

#include "conversion_result.h"

// Photo of a document -> flat, high-contrast "scanned" page. Red seals keep their colour.
class ScanConverter
{
public:
    ConversionResult convertToScan(const QString &input, const QString &outDir) const;

    static QStringList inputExtensions();
    static QJsonObject supportedFormats();

    // Perspective-corrected page when a large enough quadrilateral is found,
    // otherwise a copy of image. *found reports which case applied.
    static cv::Mat detectDocument(const cv::Mat &image, bool *found = nullptr);

    // Contour simplifies to four corners and encloses at least minArea.
    static bool isPageOutline(const std::vector<cv::Point> &contour, double minArea,
                              std::vector<cv::Point> *corners = nullptr);

    // top-left, top-right, bottom-right, bottom-left
    static std::array<cv::Point2f, 4> orderPoints(const std::vector<cv::Point2f> &points);

    static cv::Mat fourPointTransform(const cv::Mat &image, const std::vector<cv::Point2f> &points);

    // 256-entry darkening curve, pow(i / 255, SCAN_GAMMA) * 255 truncated.
    static cv::Mat gammaTable();

    // BGR in, BGR out.
    static cv::Mat applyScanEffect(const cv::Mat &image);

    // Pixels that read as red stamp ink (two HSV hue bands), dilated once.
    static cv::Mat redSealMask(const cv::Mat &bgr);
};

#endif // DOCSHIFT_SCAN_CONVERTER_H
