#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "Color.h"
#include "TransparencyCompositor.h"

namespace PureVision {

// JSON form of a color is the "#rrggbb" string.
void to_json(nlohmann::json& j, const RGBColor& c);
void from_json(const nlohmann::json& j, RGBColor& c);

struct ProcessingOptions {
    // 容差：与目标色距离 <= tolerance 的像素完全透明。
    int tolerance = 20;
    // 平滑度：透明度从 0 线性过渡到 255 的距离带宽（0 按 1 处理）。
    int smoothness = 30;
    // 背景色。autoDetect 打开时每次处理前会被检测结果覆盖。
    RGBColor targetColor{255, 255, 255};
    // 手动擦除的笔刷直径（显示像素）。
    int brushSize = 20;
    bool autoDetect = true;

    // Throws std::invalid_argument for tolerance < 0, smoothness < 0 or brushSize <= 0.
    void validate() const;

    KeyParameters keyParameters() const { return {targetColor, tolerance, smoothness}; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ProcessingOptions, tolerance, smoothness, targetColor, brushSize, autoDetect)
};

/// 读取 JSON 配置文件：文件中出现的键覆盖默认值，缺省的键保持默认值，最后做 validate()。
/// 文件无法打开、JSON 语法错误或字段类型不对时抛出 std::invalid_argument。
ProcessingOptions loadOptionsFile(const std::string& path);

} // namespace PureVision
