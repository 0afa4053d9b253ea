#include "ImageEnhancer.h"

#include <fstream>
#include <iterator>

namespace PureVision {

std::optional<std::vector<uchar>> FileEnhancer::enhance(const std::vector<uchar>&) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) return std::nullopt;
    std::vector<uchar> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.empty()) return std::nullopt;
    return bytes;
}

} // namespace PureVision
