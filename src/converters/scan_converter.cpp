#include "scan_converter.h"

#include <QDebug>
#include <QJsonArray>
#include <QObject>
#include <algorithm>
#include <cmath>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "converter_support.h"
#include "utils/pathutil.h"
#include "xconfig.h"

namespace
{
double distance(const cv::Point2f &a, const cv::Point2f &b)
{
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

cv::Mat toBgr(const cv::Mat &image)
{
    cv::Mat bgr;
    if (image.channels() == 1)
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    else if (image.channels() == 4)
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    else
        bgr = image;
    return bgr;
}
} // namespace

QStringList ScanConverter::inputExtensions()
{
    return {QStringLiteral(".jpg"), QStringLiteral(".jpeg"), QStringLiteral(".png"), QStringLiteral(".bmp"),
            QStringLiteral(".tiff"), QStringLiteral(".tif")};
}

QJsonObject ScanConverter::supportedFormats()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("input"), QJsonArray::fromStringList(inputExtensions()));
    obj.insert(QStringLiteral("output"), QJsonArray{QStringLiteral(".jpg")});
    obj.insert(QStringLiteral("engine"), QStringLiteral("opencv"));
    return obj;
}

std::array<cv::Point2f, 4> ScanConverter::orderPoints(const std::vector<cv::Point2f> &points)
{
    std::array<cv::Point2f, 4> rect{};
    if (points.size() < 4) return rect;
    auto sum = [](const cv::Point2f &p) { return p.x + p.y; };
    auto diff = [](const cv::Point2f &p) { return p.y - p.x; };
    rect[0] = *std::min_element(points.begin(), points.end(), [&](const cv::Point2f &a, const cv::Point2f &b) { return sum(a) < sum(b); });
    rect[2] = *std::max_element(points.begin(), points.end(), [&](const cv::Point2f &a, const cv::Point2f &b) { return sum(a) < sum(b); });
    rect[1] = *std::min_element(points.begin(), points.end(), [&](const cv::Point2f &a, const cv::Point2f &b) { return diff(a) < diff(b); });
    rect[3] = *std::max_element(points.begin(), points.end(), [&](const cv::Point2f &a, const cv::Point2f &b) { return diff(a) < diff(b); });
    return rect;
}

cv::Mat ScanConverter::fourPointTransform(const cv::Mat &image, const std::vector<cv::Point2f> &points)
{
    const std::array<cv::Point2f, 4> rect = orderPoints(points);
    const cv::Point2f &tl = rect[0];
    const cv::Point2f &tr = rect[1];
    const cv::Point2f &br = rect[2];
    const cv::Point2f &bl = rect[3];

    const int maxWidth = std::max(static_cast<int>(distance(br, bl)), static_cast<int>(distance(tr, tl)));
    const int maxHeight = std::max(static_cast<int>(distance(tr, br)), static_cast<int>(distance(tl, bl)));
    if (maxWidth < 1 || maxHeight < 1) return image.clone();

    const cv::Point2f src[4] = {tl, tr, br, bl};
    const cv::Point2f dst[4] = {cv::Point2f(0, 0), cv::Point2f(static_cast<float>(maxWidth - 1), 0),
                                cv::Point2f(static_cast<float>(maxWidth - 1), static_cast<float>(maxHeight - 1)),
                                cv::Point2f(0, static_cast<float>(maxHeight - 1))};
    const cv::Mat m = cv::getPerspectiveTransform(src, dst);
    cv::Mat warped;
    cv::warpPerspective(image, warped, m, cv::Size(maxWidth, maxHeight));
    return warped;
}

cv::Mat ScanConverter::detectDocument(const cv::Mat &image, bool *found)
{
    if (found) *found = false;
    if (image.empty()) return cv::Mat();

    // detection runs on a copy scaled to a fixed height
    const double ratio = image.rows / SCAN_DETECT_HEIGHT;
    const int detectWidth = std::max(1, static_cast<int>(image.cols / ratio));
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(detectWidth, static_cast<int>(SCAN_DETECT_HEIGHT)));

    cv::Mat gray;
    cv::cvtColor(toBgr(resized), gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(5, 5), 0);
    cv::Mat edged;
    cv::Canny(gray, edged, 75, 200);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edged, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);
    std::sort(contours.begin(), contours.end(), [](const std::vector<cv::Point> &a, const std::vector<cv::Point> &b) {
        return cv::contourArea(a) > cv::contourArea(b);
    });
    if (contours.size() > 5) contours.resize(5);

    const double minArea = static_cast<double>(resized.rows) * resized.cols * SCAN_MIN_AREA_RATIO;
    for (const auto &contour : contours)
    {
        std::vector<cv::Point> approx;
        if (!isPageOutline(contour, minArea, &approx)) continue;

        std::vector<cv::Point2f> corners;
        corners.reserve(4);
        for (const cv::Point &p : approx)
            corners.emplace_back(static_cast<float>(p.x * ratio), static_cast<float>(p.y * ratio));
        if (found) *found = true;
        return fourPointTransform(image, corners);
    }

    qWarning().noquote() << "[scan] no document outline found, using the whole image";
    return image.clone();
}

bool ScanConverter::isPageOutline(const std::vector<cv::Point> &contour, double minArea,
                                  std::vector<cv::Point> *corners)
{
    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true), true);
    // area of what was traced, not of the smoothed polygon
    if (approx.size() != 4 || cv::contourArea(contour) < minArea) return false;
    if (corners) *corners = approx;
    return true;
}

cv::Mat ScanConverter::redSealMask(const cv::Mat &bgr)
{
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
    cv::Mat lower;
    cv::Mat upper;
    cv::inRange(hsv, cv::Scalar(0, 43, 46), cv::Scalar(10, 255, 255), lower);
    cv::inRange(hsv, cv::Scalar(156, 43, 46), cv::Scalar(180, 255, 255), upper);
    cv::Mat mask = lower + upper;
    cv::dilate(mask, mask, cv::Mat::ones(3, 3, CV_8U), cv::Point(-1, -1), 1);
    return mask;
}

cv::Mat ScanConverter::gammaTable()
{
    cv::Mat table(1, 256, CV_8U);
    for (int i = 0; i < 256; ++i)
        table.at<uchar>(i) = static_cast<uchar>(std::pow(i / 255.0, SCAN_GAMMA) * 255.0);
    return table;
}

cv::Mat ScanConverter::applyScanEffect(const cv::Mat &image)
{
    if (image.empty()) return cv::Mat();
    const cv::Mat bgr = toBgr(image);
    const cv::Mat mask = redSealMask(bgr);

    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    // flatten uneven lighting: divide by a closed (text-free) background estimate
    int kernel = static_cast<int>(std::min(gray.rows, gray.cols) * 0.02) | 1;
    kernel = std::max(kernel, 3);
    cv::Mat background;
    cv::morphologyEx(gray, background, cv::MORPH_CLOSE,
                     cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernel, kernel)));
    cv::Mat flat;
    cv::divide(gray, background, flat, 255);

    cv::Mat gamma;
    cv::LUT(flat, gammaTable(), gamma);

    cv::Mat truncated;
    cv::threshold(gamma, truncated, SCAN_TRUNC_THRESHOLD, 255, cv::THRESH_TRUNC);
    cv::normalize(truncated, truncated, 0, 255, cv::NORM_MINMAX);

    cv::Mat blurred;
    cv::GaussianBlur(truncated, blurred, cv::Size(0, 0), 2);
    cv::Mat sharp;
    cv::addWeighted(truncated, 1.5, blurred, -0.5, 0, sharp);

    cv::Mat result;
    cv::cvtColor(sharp, result, cv::COLOR_GRAY2BGR);
    bgr.copyTo(result, mask);
    return result;
}

ConversionResult ScanConverter::convertToScan(const QString &input, const QString &outDir) const
{
    ConversionResult failure;
    if (!ConverterSupport::checkInput(input, inputExtensions(), &failure)) return failure;
    QString dir;
    if (!ConverterSupport::prepareOutputDir(input, outDir, &dir, &failure)) return failure;

    QByteArray bytes;
    QString error;
    if (!readFileBytes(input, &bytes, &error)) return ConversionResult::failure(DocShiftErrorCode::IoInputMissing, error);
    if (bytes.isEmpty())
    {
        return ConversionResult::failure(DocShiftErrorCode::InputCorrupt, QObject::tr("Image file is empty: %1").arg(input));
    }

    const QString output = outputFilePath(dir, input, QStringLiteral("_scan"), QStringLiteral("jpg"));
    std::vector<uchar> encoded;
    bool documentFound = false;
    try
    {
        const cv::Mat raw(1, bytes.size(), CV_8UC1, bytes.data());
        const cv::Mat image = cv::imdecode(raw, cv::IMREAD_COLOR);
        if (image.empty())
        {
            return ConversionResult::failure(DocShiftErrorCode::InputCorrupt,
                                             QObject::tr("Cannot decode image: %1").arg(input));
        }
        const cv::Mat page = detectDocument(image, &documentFound);
        const cv::Mat scanned = applyScanEffect(page);
        if (!cv::imencode(".jpg", scanned, encoded, {cv::IMWRITE_JPEG_QUALITY, DEFAULT_JPEG_QUALITY}))
        {
            return ConversionResult::failure(DocShiftErrorCode::EngineFailed, QObject::tr("JPEG encoding failed"));
        }
    }
    catch (const cv::Exception &e)
    {
        qWarning().noquote() << "[scan] OpenCV error:" << e.what();
        return ConversionResult::failure(DocShiftErrorCode::EngineFailed,
                                         QObject::tr("Image processing failed: %1").arg(QString::fromUtf8(e.what())));
    }

    const QByteArray out(reinterpret_cast<const char *>(encoded.data()), static_cast<int>(encoded.size()));
    if (!writeFileBytes(output, out, &error)) return ConversionResult::failure(DocShiftErrorCode::IoWriteFailed, error);

    QStringList warnings;
    if (!documentFound) warnings << QObject::tr("No document outline detected; the whole image was processed");
    qInfo().noquote() << "[scan] wrote" << output << (documentFound ? "(perspective corrected)" : "(full image)");
    return ConverterSupport::verifyOutputs({output}, warnings);
}
