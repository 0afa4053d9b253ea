#include "ImageIO.h"
#include "Raster.h"

#include <opencv2/core/utils/logger.hpp>
#include <fstream>

namespace PureVision {

namespace {

static std::optional<cv::Mat> normalizeDecoded(const cv::Mat& image, const std::string& what) {
    if (image.empty()) {
        CV_LOG_WARNING(NULL, "PureVision: failed to decode " << what << ", no image available");
        return std::nullopt;
    }
    // 16-bit PNGs are scaled down to 8-bit first.
    cv::Mat eightBit = image;
    if (image.depth() == CV_16U) {
        image.convertTo(eightBit, CV_8U, 1.0 / 257.0);
    } else if (image.depth() != CV_8U) {
        CV_LOG_WARNING(NULL, "PureVision: unsupported pixel depth in " << what);
        return std::nullopt;
    }
    return toRaster(eightBit);
}

} // namespace

std::optional<cv::Mat> decodeRaster(const std::vector<uchar>& encoded) {
    if (encoded.empty()) {
        CV_LOG_WARNING(NULL, "PureVision: empty image buffer, no image available");
        return std::nullopt;
    }
    const cv::Mat image = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
    return normalizeDecoded(image, "in-memory image");
}

std::optional<cv::Mat> loadRaster(const std::string& path) {
    const cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
    return normalizeDecoded(image, path);
}

std::vector<uchar> encodePng(const cv::Mat& raster) {
    std::vector<uchar> out;
    if (raster.empty()) return out;
    // Level 3 matches OpenCV's default; PNG is lossless at every level.
    const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 3};
    if (!cv::imencode(".png", raster, out, params)) out.clear();
    return out;
}

bool writePng(const std::string& path, const cv::Mat& raster) {
    const std::vector<uchar> bytes = encodePng(raster);
    if (bytes.empty()) {
        CV_LOG_WARNING(NULL, "PureVision: nothing to write for " << path);
        return false;
    }
    std::ofstream o(path, std::ios::binary);
    o.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!o) {
        CV_LOG_WARNING(NULL, "PureVision: failed to write " << path);
        return false;
    }
    return true;
}

} // namespace PureVision
