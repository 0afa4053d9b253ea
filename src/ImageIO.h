#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

namespace PureVision {

// Decoded rasters are always normalized to CV_8UC4 (see Raster.h).
// Decode failure => nullopt plus one warning line ("no image available").
std::optional<cv::Mat> decodeRaster(const std::vector<uchar>& encoded);
std::optional<cv::Mat> loadRaster(const std::string& path);

/// 无损 PNG 编码，alpha 原样保留（不会被重新压缩改变）。编码失败返回空 vector。
std::vector<uchar> encodePng(const cv::Mat& raster);

// Returns false (and logs) when the file could not be written.
bool writePng(const std::string& path, const cv::Mat& raster);

} // namespace PureVision
