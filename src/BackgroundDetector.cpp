#include "BackgroundDetector.h"
#include "Raster.h"

#include <cmath>

namespace PureVision {

std::vector<cv::Point> BackgroundDetector::samplePoints(int width, int height) {
    return {
        {0, 0},
        {width - 1, 0},
        {0, height - 1},
        {width - 1, height - 1},
        {width / 2, 0},
    };
}

std::optional<RGBColor> BackgroundDetector::detect(const cv::Mat& raster) {
    requireRaster(raster, "BackgroundDetector::detect");
    if (raster.empty() || raster.cols <= 0 || raster.rows <= 0) return std::nullopt;

    const std::vector<cv::Point> samples = samplePoints(raster.cols, raster.rows);
    int sumR = 0, sumG = 0, sumB = 0;
    for (const auto& p : samples) {
        const RGBColor c = pixelColor(raster.at<cv::Vec4b>(p.y, p.x));
        sumR += c.r;
        sumG += c.g;
        sumB += c.b;
    }

    const double n = static_cast<double>(samples.size());
    return RGBColor{
        static_cast<uint8_t>(std::lround(sumR / n)),
        static_cast<uint8_t>(std::lround(sumG / n)),
        static_cast<uint8_t>(std::lround(sumB / n)),
    };
}

} // namespace PureVision
