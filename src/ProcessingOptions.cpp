#include "ProcessingOptions.h"

#include <opencv2/core/utils/logger.hpp>
#include <fstream>
#include <stdexcept>

namespace PureVision {

void to_json(nlohmann::json& j, const RGBColor& c) {
    j = toHexString(c);
}

void from_json(const nlohmann::json& j, RGBColor& c) {
    const auto parsed = parseHexColor(j.get<std::string>());
    if (!parsed) throw std::invalid_argument("invalid color '" + j.get<std::string>() + "', expected #rrggbb");
    c = *parsed;
}

void ProcessingOptions::validate() const {
    if (tolerance < 0) throw std::invalid_argument("tolerance must be >= 0");
    if (smoothness < 0) throw std::invalid_argument("smoothness must be >= 0");
    if (brushSize <= 0) throw std::invalid_argument("brushSize must be > 0");
}

ProcessingOptions loadOptionsFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::invalid_argument("cannot open options file: " + path);

    ProcessingOptions options;
    try {
        const nlohmann::json j = nlohmann::json::parse(in);
        options = j.get<ProcessingOptions>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument("malformed options file " + path + ": " + e.what());
    }
    options.validate();
    CV_LOG_INFO(NULL, "PureVision: loaded options from " << path << " (tolerance=" << options.tolerance
                << ", smoothness=" << options.smoothness << ", target=" << toHexString(options.targetColor) << ")");
    return options;
}

} // namespace PureVision
