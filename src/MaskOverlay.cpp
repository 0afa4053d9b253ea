#include "MaskOverlay.h"
#include "Raster.h"

#include <algorithm>
#include <stdexcept>

namespace PureVision {

std::optional<BrushDab> mapPointerToRaster(const DisplayRect& display, const cv::Size& rasterSize,
                                           const cv::Point2d& pointer, int brushSize) {
    if (display.width <= 0.0 || display.height <= 0.0) return std::nullopt;
    if (rasterSize.width <= 0 || rasterSize.height <= 0) return std::nullopt;

    const double relX = pointer.x - display.left;
    const double relY = pointer.y - display.top;
    if (relX < 0.0 || relY < 0.0 || relX > display.width || relY > display.height) return std::nullopt;

    const double scaleX = rasterSize.width / display.width;
    const double scaleY = rasterSize.height / display.height;

    BrushDab dab;
    dab.center = cv::Point2d(relX * scaleX, relY * scaleY);
    dab.radius = (brushSize * scaleX) / 2.0;
    return dab;
}

void MaskOverlay::reset(const cv::Size& size) {
    buffer_ = cv::Mat::zeros(size, CV_8UC4);
    dabCount_ = 0;
}

void MaskOverlay::ensureSize(const cv::Size& size) {
    if (buffer_.empty() || buffer_.size() != size) reset(size);
}

void MaskOverlay::paint(const BrushDab& dab, const RGBColor& color) {
    if (buffer_.empty()) return;

    // Sub-pixel center/radius through cv::circle's fixed-point shift.
    constexpr int kShift = 4;
    constexpr double kScale = 1 << kShift;
    const cv::Point center(cvRound(dab.center.x * kScale), cvRound(dab.center.y * kScale));
    const int radius = std::max(0, cvRound(dab.radius * kScale));
    cv::circle(buffer_, center, radius, toScalar(color, 255), cv::FILLED, cv::LINE_8, kShift);
    dabCount_++;
}

cv::Mat MaskOverlay::compositeOnto(const cv::Mat& source) const {
    requireRaster(source, "MaskOverlay::compositeOnto");
    if (source.size() != buffer_.size()) {
        throw std::invalid_argument("MaskOverlay::compositeOnto: overlay and source sizes differ");
    }

    cv::Mat out = source.clone();
    if (dabCount_ == 0) return out;

    // Strokes are always fully opaque, so source-over reduces to a masked copy.
    cv::Mat coverage;
    cv::extractChannel(buffer_, coverage, 3);
    buffer_.copyTo(out, coverage);
    return out;
}

bool MaskEditor::pointerDown(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color) {
    if (!paintAt(display, pointer, brushSize, color)) return false;
    state_ = State::Painting;
    return true;
}

bool MaskEditor::pointerMove(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color) {
    if (state_ != State::Painting) return false;
    return paintAt(display, pointer, brushSize, color);
}

bool MaskEditor::paintAt(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color) {
    const auto dab = mapPointerToRaster(display, overlay_.size(), pointer, brushSize);
    if (!dab) return false;
    overlay_.paint(*dab, color);
    return true;
}

} // namespace PureVision
