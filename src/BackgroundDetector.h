#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <vector>

#include "Color.h"

namespace PureVision {

class BackgroundDetector {
public:
    /// 估计图标的背景色。
    ///
    /// 规则：
    /// - 固定采样 5 个点：四个角 (0,0) (W-1,0) (0,H-1) (W-1,H-1) 以及顶边中点 (floor(W/2),0)。
    /// - 对 5 个样本的 R/G/B 分别求平均并四舍五入（不是截断）；忽略 alpha。
    /// - 不做多数投票、也不剔除离群点：假设图标画在与四角相连的均匀背景上。
    ///
    /// 退化情况：
    /// - 1xN / Nx1 / 1x1 图像仍然取 5 个样本，重合的点只是在平均值里权重更大。
    /// - 零面积图像返回 nullopt（几何退化是 no-op，不是错误）。
    ///
    /// 只读，不修改输入；是否采用返回的颜色由调用方决定。
    ///
    /// @param raster CV_8UC4 栅格（其它类型抛出 std::invalid_argument）。
    static std::optional<RGBColor> detect(const cv::Mat& raster);

    // The five sample coordinates, in sampling order.
    static std::vector<cv::Point> samplePoints(int width, int height);
};

} // namespace PureVision
