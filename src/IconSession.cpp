#include "IconSession.h"
#include "BackgroundDetector.h"
#include "ImageIO.h"
#include "Raster.h"
#include "TransparencyCompositor.h"

#include <opencv2/core/utils/logger.hpp>
#include <exception>

namespace PureVision {

IconSession::IconSession(const ProcessingOptions& options) {
    setOptions(options);
}

bool IconSession::loadSource(const cv::Mat& image, const ProcessRequest& request) {
    if (image.empty() || image.cols <= 0 || image.rows <= 0) return false;
    cv::Mat raster = toRaster(image);

    source_ = raster;
    processed_.release();
    overlay_.reset(source_.size());
    editor_.pointerUp();
    return process(request);
}

bool IconSession::loadSourceFile(const std::string& path, const ProcessRequest& request) {
    const auto raster = loadRaster(path);
    if (!raster) return false;
    return loadSource(*raster, request);
}

bool IconSession::process(const ProcessRequest& request) {
    if (source_.empty()) return false;

    if (request.useDetector) {
        if (const auto detected = BackgroundDetector::detect(source_)) {
            options_.targetColor = *detected;
        }
    }
    recomposite();
    return true;
}

void IconSession::recomposite() {
    const KeyParameters params = options_.keyParameters();
    cv::Mat composite = overlay_.compositeOnto(source_);
    TransparencyCompositor::applyInPlace(composite, params);
    processed_ = composite;
}

void IconSession::setOptions(const ProcessingOptions& options) {
    options.validate();
    options_ = options;
}

void IconSession::setTargetColor(const RGBColor& color) {
    options_.targetColor = color;
    options_.autoDetect = false;
}

void IconSession::beginEdit() {
    editing_ = true;
}

void IconSession::endEdit() {
    editing_ = false;
    editor_.pointerUp();
}

bool IconSession::pointerDown(const DisplayRect& display, const cv::Point2d& pointer) {
    if (!editing_ || source_.empty()) return false;
    if (!editor_.pointerDown(display, pointer, options_.brushSize, options_.targetColor)) return false;
    recomposite();
    return true;
}

bool IconSession::pointerMove(const DisplayRect& display, const cv::Point2d& pointer) {
    if (!editing_ || source_.empty()) return false;
    if (!editor_.pointerMove(display, pointer, options_.brushSize, options_.targetColor)) return false;
    recomposite();
    return true;
}

void IconSession::resetStrokes() {
    overlay_.clear();
    if (!source_.empty()) recomposite();
}

bool IconSession::enhance(ImageEnhancer& enhancer) {
    if (source_.empty()) return false;

    std::optional<std::vector<uchar>> result;
    try {
        result = enhancer.enhance(encodePng(source_));
    } catch (const std::exception& e) {
        CV_LOG_WARNING(NULL, "PureVision: enhancement failed: " << e.what());
        return false;
    }
    if (!result) {
        CV_LOG_WARNING(NULL, "PureVision: enhancement returned no image");
        return false;
    }

    const auto raster = decodeRaster(*result);
    if (!raster || raster->empty()) {
        CV_LOG_WARNING(NULL, "PureVision: enhancement returned an undecodable image");
        return false;
    }
    CV_LOG_INFO(NULL, "PureVision: source replaced by enhanced image " << raster->cols << "x" << raster->rows);
    return loadSource(*raster);
}

void IconSession::clear() {
    source_.release();
    processed_.release();
    overlay_.reset(cv::Size());
    editor_.pointerUp();
    editing_ = false;
}

ImageState IconSession::state() const {
    ImageState s;
    s.hasSource = !source_.empty();
    s.hasProcessed = !processed_.empty();
    s.width = source_.cols;
    s.height = source_.rows;
    return s;
}

std::vector<uchar> IconSession::processedPng() const {
    return encodePng(processed_);
}

bool IconSession::exportPng(const std::string& path) const {
    if (processed_.empty()) return false;
    return writePng(path, processed_);
}

} // namespace PureVision
