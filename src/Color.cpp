#include "Color.h"

#include <cctype>
#include <cmath>

namespace PureVision {

double colorDistance(const RGBColor& a, const RGBColor& b) {
    const double dr = static_cast<double>(a.r) - static_cast<double>(b.r);
    const double dg = static_cast<double>(a.g) - static_cast<double>(b.g);
    const double db = static_cast<double>(a.b) - static_cast<double>(b.b);
    return std::sqrt(dr * dr + dg * dg + db * db);
}

namespace {

static int hexDigit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

} // namespace

std::optional<RGBColor> parseHexColor(const std::string& text) {
    size_t pos = (!text.empty() && text[0] == '#') ? 1 : 0;
    if (text.size() - pos != 6) return std::nullopt;

    uint8_t channels[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i, pos += 2) {
        const int hi = hexDigit(text[pos]);
        const int lo = hexDigit(text[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return RGBColor{channels[0], channels[1], channels[2]};
}

std::string toHexString(const RGBColor& c) {
    static const char* kDigits = "0123456789abcdef";
    std::string out = "#";
    for (const uint8_t v : {c.r, c.g, c.b}) {
        out.push_back(kDigits[v >> 4]);
        out.push_back(kDigits[v & 0x0F]);
    }
    return out;
}

} // namespace PureVision
