#pragma once

#include <opencv2/opencv.hpp>

#include "Color.h"

namespace PureVision {

/// 栅格缓冲区约定：CV_8UC4，行优先，原点在左上角。
///
/// 通道顺序沿用 OpenCV 的 B,G,R,A（imread/imencode 的原生顺序），
/// 因此所有模块都从通道 2 读红色、通道 0 读蓝色；alpha 为 0 表示完全透明，255 表示完全不透明。

/// 把任意 8 位 1/3/4 通道图像规范化为 CV_8UC4 栅格（没有 alpha 时补 255）。
/// 其它深度视为调用方错误，抛出 std::invalid_argument。
cv::Mat toRaster(const cv::Mat& image);

// Throws std::invalid_argument unless `raster` is CV_8UC4 (empty is allowed).
void requireRaster(const cv::Mat& raster, const char* who);

inline RGBColor pixelColor(const cv::Vec4b& px) {
    return RGBColor{px[2], px[1], px[0]};
}

inline cv::Scalar toScalar(const RGBColor& c, int alpha = 255) {
    return cv::Scalar(c.b, c.g, c.r, alpha);
}

} // namespace PureVision
