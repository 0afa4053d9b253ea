#pragma once

#include <opencv2/opencv.hpp>
#include <optional>

#include "Color.h"

namespace PureVision {

// On-screen rectangle the raster is rendered into (display coordinates).
struct DisplayRect {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// One filled disc in raster coordinates.
struct BrushDab {
    cv::Point2d center;
    double radius = 0.0;
};

/// 把显示坐标下的指针位置映射到栅格坐标。
///
/// - scaleX = rasterW / displayW，scaleY = rasterH / displayH
/// - relX = pointer.x - left，relY = pointer.y - top；
///   落在 [0, displayW] x [0, displayH]（含边界）之外时返回 nullopt（忽略，不钳制）。
/// - 圆心 = (relX * scaleX, relY * scaleY)
/// - 半径 = brushSize * scaleX / 2：只按水平缩放修正。scaleX != scaleY 时笔刷在栅格上仍是圆，
///   但在屏幕上会显示成椭圆，这是保留下来的行为。
///
/// 显示区域或栅格为零面积时同样返回 nullopt。
std::optional<BrushDab> mapPointerToRaster(const DisplayRect& display, const cv::Size& rasterSize,
                                           const cv::Point2d& pointer, int brushSize);

/// 手动擦除遮罩：与源图同尺寸的 CV_8UC4 缓冲区，空遮罩每个像素都是 0（alpha 0 = 不参与合成）。
/// 每次涂抹写入一个以目标色、完全不透明填充的圆；笔画只累加，直到显式 reset 或源图尺寸变化。
class MaskOverlay {
public:
    MaskOverlay() = default;
    explicit MaskOverlay(const cv::Size& size) { reset(size); }

    void reset(const cv::Size& size);
    void clear() { reset(size()); }
    // Reinitializes only when the dimensions differ from the current ones.
    void ensureSize(const cv::Size& size);

    void paint(const BrushDab& dab, const RGBColor& color);

    /// 把遮罩按 source-over 叠加到 source 上，返回新栅格（source 不变）。
    /// 尺寸不一致时抛出 std::invalid_argument。
    cv::Mat compositeOnto(const cv::Mat& source) const;

    cv::Size size() const { return buffer_.size(); }
    bool empty() const { return dabCount_ == 0; }
    int dabCount() const { return dabCount_; }
    const cv::Mat& buffer() const { return buffer_; }

private:
    cv::Mat buffer_;
    int dabCount_ = 0;
};

/// 擦除模式的状态机：Idle --(按下且在图像内)--> Painting --(抬起/离开)--> Idle。
///
/// 拖动只是一串离散的采样点，每个采样点画一个圆；快速拖动时采样点之间的空隙不会被插值补齐。
/// 进入编辑模式既不清空也不初始化遮罩。每个方法返回遮罩是否被修改（调用方据此重新合成）。
class MaskEditor {
public:
    enum class State { Idle, Painting };

    explicit MaskEditor(MaskOverlay& overlay) : overlay_(overlay) {}

    bool pointerDown(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color);
    bool pointerMove(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color);
    void pointerUp() { state_ = State::Idle; }
    void pointerLeave() { state_ = State::Idle; }

    State state() const { return state_; }

private:
    bool paintAt(const DisplayRect& display, const cv::Point2d& pointer, int brushSize, const RGBColor& color);

    MaskOverlay& overlay_;
    State state_ = State::Idle;
};

} // namespace PureVision
