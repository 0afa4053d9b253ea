#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace PureVision {

/// 8 位 RGB 颜色（值类型）。颜色之间只按欧氏距离比较，不做身份比较。
struct RGBColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/// RGB 空间的欧氏距离：sqrt(dr^2 + dg^2 + db^2)。
/// 对所有输入都有定义，范围 [0, sqrt(3*255^2) ≈ 441.67]。
double colorDistance(const RGBColor& a, const RGBColor& b);

// "#rrggbb" / "rrggbb" (case-insensitive). Returns nullopt on malformed text.
std::optional<RGBColor> parseHexColor(const std::string& text);

// Always lowercase with a leading '#'.
std::string toHexString(const RGBColor& c);

} // namespace PureVision
