#include "Raster.h"

#include <stdexcept>
#include <string>

namespace PureVision {

cv::Mat toRaster(const cv::Mat& image) {
    if (image.empty()) return cv::Mat(0, 0, CV_8UC4);
    if (image.depth() != CV_8U) {
        throw std::invalid_argument("toRaster: only 8-bit images are supported");
    }

    cv::Mat raster;
    switch (image.channels()) {
        case 1: cv::cvtColor(image, raster, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(image, raster, cv::COLOR_BGR2BGRA); break;
        case 4: raster = image.clone(); break;
        default:
            throw std::invalid_argument("toRaster: unsupported channel count " + std::to_string(image.channels()));
    }
    return raster;
}

void requireRaster(const cv::Mat& raster, const char* who) {
    if (raster.empty()) return;
    if (raster.type() != CV_8UC4) {
        throw std::invalid_argument(std::string(who) + ": raster must be CV_8UC4");
    }
}

} // namespace PureVision
