#include <iostream>
#include <opencv2/opencv.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include "IconSession.h"
#include "ImageEnhancer.h"
#include "ProcessingOptions.h"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace PureVision;

namespace {

struct CommandLine {
    std::string inputPath;
    std::string configPath;
    std::string strokesPath;
    std::string enhancedPath;
    std::optional<RGBColor> color;
    std::optional<int> tolerance;
    std::optional<int> smoothness;
    bool verbose = false;
};

// 手动擦除笔画回放文件：
// { "display": {"left":0,"top":0,"width":100,"height":100}, "brushSize": 20, "drags": [[[x,y],[x,y]], ...] }
// 每个 drag 依次对应 pointerDown、若干 pointerMove、pointerUp。
struct StrokeScript {
    DisplayRect display;
    std::optional<int> brushSize;
    std::vector<std::vector<cv::Point2d>> drags;
};

static void printUsage() {
    std::cout << "Usage: PureVision <file_or_directory_path> [tolerance smoothness]\n"
              << "                  [--config options.json] [--color #rrggbb]\n"
              << "                  [--strokes strokes.json] [--enhanced enhanced.png] [--verbose]" << std::endl;
}

static std::optional<CommandLine> parseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = (i + 1 < argc);
        if (arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "--config" && hasValue) {
            cmd.configPath = argv[++i];
        } else if (arg == "--strokes" && hasValue) {
            cmd.strokesPath = argv[++i];
        } else if (arg == "--enhanced" && hasValue) {
            cmd.enhancedPath = argv[++i];
        } else if (arg == "--color" && hasValue) {
            cmd.color = parseHexColor(argv[++i]);
            if (!cmd.color) {
                std::cerr << "[ERROR] Invalid color '" << argv[i] << "', expected #rrggbb" << std::endl;
                return std::nullopt;
            }
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "[ERROR] Unknown or incomplete option " << arg << std::endl;
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) return std::nullopt;
    cmd.inputPath = positional[0];

    // Optional: tolerance and smoothness as positional integers.
    if (positional.size() >= 3) {
        try {
            cmd.tolerance = std::stoi(positional[1]);
            cmd.smoothness = std::stoi(positional[2]);
        } catch (const std::exception&) {
            std::cerr << "[ERROR] tolerance/smoothness must be integers" << std::endl;
            return std::nullopt;
        }
    }
    return cmd;
}

static StrokeScript loadStrokeScript(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::invalid_argument("cannot open strokes file: " + path);

    StrokeScript script;
    try {
        const json j = json::parse(in);
        const json& d = j.at("display");
        script.display.left = d.value("left", 0.0);
        script.display.top = d.value("top", 0.0);
        script.display.width = d.at("width").get<double>();
        script.display.height = d.at("height").get<double>();
        if (j.contains("brushSize")) script.brushSize = j.at("brushSize").get<int>();
        for (const auto& drag : j.at("drags")) {
            std::vector<cv::Point2d> points;
            for (const auto& p : drag) points.emplace_back(p.at(0).get<double>(), p.at(1).get<double>());
            if (!points.empty()) script.drags.push_back(std::move(points));
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument("malformed strokes file " + path + ": " + e.what());
    }
    return script;
}

static int replayStrokes(IconSession& session, const StrokeScript& script) {
    int painted = 0;
    session.beginEdit();
    for (const auto& drag : script.drags) {
        if (session.pointerDown(script.display, drag.front())) painted++;
        for (size_t i = 1; i < drag.size(); ++i) {
            if (session.pointerMove(script.display, drag[i])) painted++;
        }
        session.pointerUp();
    }
    session.endEdit();
    return painted;
}

static bool isImageFile(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".webp";
}

static std::string outputPathFor(const std::string& inputPath) {
    fs::path p(inputPath);
    return (p.parent_path() / (p.stem().string() + ".transparent.png")).string();
}

} // namespace

int main(int argc, char** argv) {
    const auto cmd = parseCommandLine(argc, argv);
    if (!cmd) {
        printUsage();
        return 1;
    }

    // Keep console output focused on results (suppress OpenCV INFO logs).
    cv::utils::logging::setLogLevel(cmd->verbose ? cv::utils::logging::LOG_LEVEL_INFO
                                                 : cv::utils::logging::LOG_LEVEL_ERROR);

    ProcessingOptions options;
    std::optional<StrokeScript> strokes;
    try {
        if (!cmd->configPath.empty()) options = loadOptionsFile(cmd->configPath);
        if (cmd->tolerance) options.tolerance = *cmd->tolerance;
        if (cmd->smoothness) options.smoothness = *cmd->smoothness;
        if (cmd->color) {
            options.targetColor = *cmd->color;
            options.autoDetect = false;
        }
        if (!cmd->strokesPath.empty()) {
            strokes = loadStrokeScript(cmd->strokesPath);
            if (strokes->brushSize) options.brushSize = *strokes->brushSize;
        }
        options.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    const std::string& inputPath = cmd->inputPath;
    const bool isDirectory = fs::is_directory(inputPath);
    if (isDirectory && !cmd->enhancedPath.empty()) {
        std::cerr << "[ERROR] --enhanced only applies to a single file" << std::endl;
        return 1;
    }

    std::vector<std::string> filesToProcess;
    if (isDirectory) {
        std::cout << "Processing directory: " << inputPath << std::endl;
        for (const auto& entry : fs::directory_iterator(inputPath)) {
            if (!entry.is_regular_file() || !isImageFile(entry.path())) continue;
            // Skip our own outputs from a previous run.
            if (entry.path().stem().string().find(".transparent") != std::string::npos) continue;
            filesToProcess.push_back(entry.path().string());
        }
    } else {
        filesToProcess.push_back(inputPath);
    }
    std::sort(filesToProcess.begin(), filesToProcess.end());

    int successCount = 0;
    long long totalMs = 0;
    json out;
    out["input"] = inputPath;
    out["options"] = options;
    out["results"] = json::array();

    for (const auto& filePath : filesToProcess) {
        const std::string fileName = fs::path(filePath).filename().string();
        std::cout << "  Processing: " << fileName << "... ";

        const auto t0 = std::chrono::steady_clock::now();
        IconSession session(options);
        if (!session.loadSourceFile(filePath, ProcessRequest{options.autoDetect})) {
            std::cout << "[ERROR] Failed to load image." << std::endl;
            out["results"].push_back({
                {"file", fileName},
                {"path", filePath},
                {"imageWidth", 0},
                {"imageHeight", 0},
                {"ok", false},
                {"error", "Failed to load image"}
            });
            continue;
        }

        bool enhanced = false;
        if (!cmd->enhancedPath.empty()) {
            FileEnhancer enhancer(cmd->enhancedPath);
            enhanced = session.enhance(enhancer);
            if (!enhanced) std::cout << "[WARN] Enhancement failed, keeping original. ";
        }

        int dabs = 0;
        if (strokes) dabs = replayStrokes(session, *strokes);

        const std::string outPath = outputPathFor(filePath);
        const bool written = session.exportPng(outPath);
        const auto t1 = std::chrono::steady_clock::now();
        const long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        totalMs += ms;

        const ImageState state = session.state();
        const std::string target = toHexString(session.options().targetColor);
        if (written) successCount++;

        std::cout << (written ? "[OK]" : "[ERROR] Failed to write output.")
                  << " " << state.width << "x" << state.height
                  << " target=" << target
                  << " (" << ms << " ms)" << std::endl;

        json result = {
            {"file", fileName},
            {"path", filePath},
            {"imageWidth", state.width},
            {"imageHeight", state.height},
            {"ok", written},
            {"targetColor", target},
            {"autoDetected", options.autoDetect || enhanced},
            {"enhanced", enhanced},
            {"maskDabs", dabs},
            {"timeMs", ms}
        };
        if (written) {
            result["output"] = outPath;
        } else {
            result["error"] = "Failed to write output";
        }
        out["results"].push_back(result);
    }

    out["totalTimeMs"] = totalMs;
    out["processedCount"] = successCount;
    out["fileCount"] = static_cast<int>(filesToProcess.size());

    std::string reportPath;
    if (isDirectory) {
        reportPath = (fs::path(inputPath) / "PureVision_results.json").string();
    } else {
        reportPath = (fs::path(inputPath).string() + ".results.json");
    }

    std::ofstream o(reportPath);
    o << out.dump(2) << std::endl;
    std::cout << "\nBatch processing complete. Processed " << successCount << "/" << filesToProcess.size()
              << " files. Total " << totalMs << " ms. -> " << fs::path(reportPath).filename().string() << std::endl;
    return (successCount == static_cast<int>(filesToProcess.size())) ? 0 : 2;
}
