#pragma once

#include <opencv2/opencv.hpp>
#include <optional>
#include <string>

#include "Color.h"
#include "ImageEnhancer.h"
#include "MaskOverlay.h"
#include "ProcessingOptions.h"

namespace PureVision {

struct ImageState {
    bool hasSource = false;
    bool hasProcessed = false; // false until the compositor has run at least once
    int width = 0;
    int height = 0;
};

// Per-call choice of where the target color comes from.
struct ProcessRequest {
    bool useDetector = false;
};

/// 一张图标的完整处理会话：源图 -> (可选) 背景检测 -> 叠加手动遮罩 -> 透明合成 -> 预览/导出。
///
/// 约定：
/// - 合成总是从“未处理的源图 + 遮罩”重新开始，从不把上一次的输出再喂给合成器。
/// - 每次合成前把 options 拍成 KeyParameters 快照。
/// - 失败只发生在边界（解码、外部增强、配置）；失败时已有状态保持不变。
class IconSession {
public:
    IconSession() = default;
    explicit IconSession(const ProcessingOptions& options);
    IconSession(const IconSession&) = delete;
    IconSession& operator=(const IconSession&) = delete;

    /// 载入新的源图：遮罩按新尺寸清空，旧输出作废，然后按 request 处理一次
    /// （默认先做背景检测，与上传新图时的行为一致）。
    /// 零面积图像返回 false，状态不变；非 8 位图像抛出 std::invalid_argument。
    bool loadSource(const cv::Mat& image, const ProcessRequest& request = ProcessRequest{true});
    // Decode failure => false, state untouched.
    bool loadSourceFile(const std::string& path, const ProcessRequest& request = ProcessRequest{true});

    /// 运行一次合成。useDetector 为 true 时先检测背景色并写回 options().targetColor。
    /// 没有源图时返回 false。
    bool process(const ProcessRequest& request);
    // Re-process with the stored target color.
    bool applySettings() { return process(ProcessRequest{false}); }
    // Re-process, letting the stored autoDetect flag pick the color source.
    bool refresh() { return process(ProcessRequest{options_.autoDetect}); }

    // Validates first; throws std::invalid_argument and keeps the old options on failure.
    void setOptions(const ProcessingOptions& options);
    // Picking a color by hand turns auto-detection off.
    void setTargetColor(const RGBColor& color);
    const ProcessingOptions& options() const { return options_; }

    // --- manual erase mode ---
    void beginEdit();
    void endEdit();
    bool editing() const { return editing_; }
    MaskEditor::State editState() const { return editor_.state(); }
    bool pointerDown(const DisplayRect& display, const cv::Point2d& pointer);
    bool pointerMove(const DisplayRect& display, const cv::Point2d& pointer);
    void pointerUp() { editor_.pointerUp(); }
    void pointerLeave() { editor_.pointerLeave(); }
    void resetStrokes();

    /// 调用外部增强服务替换源图。
    /// 成功：源图被替换（遮罩按新尺寸清空）并用背景检测重新处理，返回 true。
    /// 失败（无结果、无法解码、抛异常）：记录一次警告，状态完全回到调用前，返回 false。
    bool enhance(ImageEnhancer& enhancer);

    void clear();

    ImageState state() const;
    const cv::Mat& source() const { return source_; }
    const cv::Mat& processed() const { return processed_; }
    const MaskOverlay& overlay() const { return overlay_; }

    // Encoded preview of the current output (empty when nothing has been processed).
    std::vector<uchar> processedPng() const;
    bool exportPng(const std::string& path) const;

private:
    void recomposite();

    ProcessingOptions options_;
    cv::Mat source_;
    cv::Mat processed_;
    MaskOverlay overlay_;
    MaskEditor editor_{overlay_};
    bool editing_ = false;
};

} // namespace PureVision
