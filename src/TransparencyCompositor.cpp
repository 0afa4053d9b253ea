#include "TransparencyCompositor.h"
#include "Raster.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace PureVision {

uint8_t keyAlpha(double distance, int tolerance, int smoothness) {
    const int smoothRange = std::max(smoothness, 1);
    if (distance <= tolerance) return 0;
    if (distance <= static_cast<double>(tolerance) + smoothRange) {
        const double alpha = ((distance - tolerance) / smoothRange) * 255.0;
        return static_cast<uint8_t>(std::clamp(std::lround(alpha), 0L, 255L));
    }
    return 255;
}

namespace {

static void validate(const cv::Mat& raster, const KeyParameters& params) {
    requireRaster(raster, "TransparencyCompositor");
    if (params.tolerance < 0) throw std::invalid_argument("TransparencyCompositor: tolerance must be >= 0");
    if (params.smoothness < 0) throw std::invalid_argument("TransparencyCompositor: smoothness must be >= 0");
}

} // namespace

void TransparencyCompositor::applyInPlace(cv::Mat& raster, const KeyParameters& params) {
    validate(raster, params);
    if (raster.empty()) return;

    // Copied so every row worker sees the same snapshot.
    const KeyParameters p = params;
    cv::parallel_for_(cv::Range(0, raster.rows), [&raster, p](const cv::Range& range) {
        for (int y = range.start; y < range.end; ++y) {
            cv::Vec4b* row = raster.ptr<cv::Vec4b>(y);
            for (int x = 0; x < raster.cols; ++x) {
                const double d = colorDistance(pixelColor(row[x]), p.targetColor);
                row[x][3] = keyAlpha(d, p.tolerance, p.smoothness);
            }
        }
    });
}

cv::Mat TransparencyCompositor::apply(const cv::Mat& source, const KeyParameters& params) {
    validate(source, params);
    cv::Mat out = source.clone();
    applyInPlace(out, params);
    return out;
}

} // namespace PureVision
