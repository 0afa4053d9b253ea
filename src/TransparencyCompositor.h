#pragma once

#include <opencv2/opencv.hpp>
#include <cstdint>

#include "Color.h"

namespace PureVision {

/// 一次合成所用的参数快照（不可变）。每次调用都按值传入，合成过程中不会读取任何共享的可变设置。
struct KeyParameters {
    RGBColor targetColor;
    int tolerance = 0;   // >= 0
    int smoothness = 0;  // >= 0; 0 is treated as 1
};

/// 单像素分类：给定与目标色的距离 d，返回新的 alpha。
/// - d <= tolerance：0（完全透明，边界归透明一侧）
/// - d <= tolerance + s（s = max(smoothness, 1)）：线性过渡 ((d - tolerance) / s) * 255，四舍五入后钳制到 [0,255]
/// - 其它：255（强制不透明，丢弃原有 alpha）
uint8_t keyAlpha(double distance, int tolerance, int smoothness);

class TransparencyCompositor {
public:
    /// 就地改写每个像素的 alpha 通道；RGB 保持不变（透明像素不会被涂黑）。
    ///
    /// 像素之间相互独立，按行用 cv::parallel_for_ 并行处理，结果与顺序无关。
    /// 注意：不幂等。不透明分支总是写 255，所以不要把输出再当作输入反复处理，
    /// 应始终从未处理的源图（+ 遮罩）重新合成。
    ///
    /// 参数非法（tolerance/smoothness 为负，或栅格不是 CV_8UC4）时抛出 std::invalid_argument，
    /// 在进入像素循环之前失败；零面积栅格是 no-op。
    static void applyInPlace(cv::Mat& raster, const KeyParameters& params);

    // Same classification on an independent copy; `source` is left untouched.
    static cv::Mat apply(const cv::Mat& source, const KeyParameters& params);
};

} // namespace PureVision
