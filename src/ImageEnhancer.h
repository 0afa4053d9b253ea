#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PureVision {

/// 外部“AI 高清增强”服务的抽象。
///
/// 约定：输入一张编码后的 PNG，返回编码后的图像（尺寸可以不同），或者 nullopt 表示没有结果。
/// 每次用户请求只调用一次，核心不会自动重试；实现可以抛异常，调用方会把异常当作失败处理。
class ImageEnhancer {
public:
    virtual ~ImageEnhancer() = default;
    virtual std::optional<std::vector<uchar>> enhance(const std::vector<uchar>& png) = 0;
};

// Hands back an already-enhanced image stored on disk; nullopt if it cannot be read.
class FileEnhancer : public ImageEnhancer {
public:
    explicit FileEnhancer(std::string path) : path_(std::move(path)) {}
    std::optional<std::vector<uchar>> enhance(const std::vector<uchar>& png) override;

private:
    std::string path_;
};

} // namespace PureVision
