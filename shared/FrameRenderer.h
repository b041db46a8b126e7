// FrameRenderer.h - Renders a range of animation frames to normalized RGB frames and masks
//
// State machine per render call:
//   Parsing -> DecodingLayers -> (per frame: Compositing -> PostProcessing -> Emitting) -> Done
// or Failed when the description cannot be parsed or the frame loop aborts (allocation
// failure, a throwing state callback). Nothing throws out of the renderer:
// every fallback is recorded in RenderResult::diagnostics and the result always holds at
// least one frame/mask pair (a 64x64 all-zero placeholder when nothing was rendered).
//
// Frames are independent of each other and may be rendered on several worker threads.
// Each worker owns its canvas and mask; decoded layer rasters are shared read-only.

#ifndef AE_FRAME_RENDERER_H
#define AE_FRAME_RENDERER_H

#include "AnimationTypes.h"
#include "LayerCompositor.h"
#include "render_diagnostics.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace aerender {

enum class RenderState {
    Idle,           // No render has run yet
    Parsing,        // Reading the animation description
    DecodingLayers, // Converting layer rasters and applying custom masks
    Compositing,    // Blending layers for one frame
    PostProcessing, // Mask expansion and feathering for one frame
    Emitting,       // Normalizing and storing one frame
    Done,           // All requested frames emitted
    Failed          // Description unusable or frame loop aborted, placeholder emitted
};

const char* renderStateName(RenderState state);

struct RenderRequest {
    int startFrame = 0;         // First frame index, negative values clamp to 0
    int endFrame = -1;          // Exclusive; -1 or > totalFrames means totalFrames
    int workerThreads = 1;      // <= 0 uses the hardware concurrency
};

struct RenderResult {
    std::vector<FloatImage> frames;     // height x width x 3, ascending frame order
    std::vector<FloatImage> masks;      // height x width x 1, parallel to frames
    std::vector<int> frameIndices;      // Frame index of each entry, empty for a placeholder
    RenderDiagnostics diagnostics;
    bool placeholder = false;
    RenderState finalState = RenderState::Idle;

    size_t frameCount() const { return frames.size(); }
};

// Invoked on state transitions. frameIndex is -1 outside the per-frame states.
// Per-frame states may be reported from worker threads; calls are serialized.
// An exception thrown by the callback aborts the render with a RenderFailure diagnostic.
using RenderStateCallback = std::function<void(RenderState state, int frameIndex)>;

class FrameRenderer {
public:
    static constexpr int kPlaceholderSize = 64;
    static constexpr int kUnboundedEnd = -1;

    FrameRenderer();
    ~FrameRenderer() = default;

    FrameRenderer(const FrameRenderer&) = delete;
    FrameRenderer& operator=(const FrameRenderer&) = delete;

    // === Rendering ===

    // Render an already loaded animation
    RenderResult render(const Animation& animation, const RenderRequest& request = RenderRequest());

    // Parse a JSON description, then render it
    RenderResult renderDescription(const std::string& description,
                                   const RenderRequest& request = RenderRequest());

    // Placeholder result for a description that could not be loaded. Ends in Failed.
    RenderResult renderLoadFailure(const RenderDiagnostics& loadDiagnostics);

    // === Options ===

    void setStateCallback(RenderStateCallback callback);
    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool isVerbose() const { return verbose_; }

    // State of the most recent (or running) render
    RenderState state() const { return state_.load(); }

    // === Stages (public for tests and hosts driving frames themselves) ===

    // Clamped [start, end) frame range for a project
    static std::pair<int, int> clampFrameRange(const ProjectConfig& project, const RenderRequest& request);

    // Convert every layer raster once and apply custom masks. Layers that fail are dropped
    // and reported; the returned list keeps the order of the survivors.
    static std::vector<PreparedLayer> prepareLayers(const Animation& animation, RenderDiagnostics& diagnostics);

    // Composite all layers at one frame index into a fresh canvas
    static bool compositeFrame(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                               int frameIndex, FrameCanvas& canvas);

    // Apply mask expansion then feathering. Returns the input mask when nothing applies.
    static SkBitmap postProcessMask(const SkBitmap& mask, const ProjectConfig& project);

    // Append one 64x64 all-zero frame and mask
    static void emitPlaceholder(RenderResult& result);

private:
    void setState(RenderState state, int frameIndex = -1);
    RenderResult renderLoaded(const Animation& animation, const RenderRequest& request);
    void renderSlot(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                    RenderResult& result, size_t slot);
    void recordFailure(int frameIndex, const std::string& message);
    void resetFailure();
    void finishWithFailure(RenderResult& result);
    bool renderOneFrame(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                        int frameIndex, FloatImage& frame, FloatImage& mask);
    void finishWithPlaceholder(RenderResult& result, RenderState state, DiagnosticKind reason);

    RenderStateCallback stateCallback_;
    std::mutex callbackMutex_;
    std::atomic<RenderState> state_{RenderState::Idle};
    bool verbose_ = true;

    // First failure of the running render; workers stop claiming frames once set
    std::atomic<bool> failed_{false};
    std::mutex failureMutex_;
    int failureFrame_ = -1;
    std::string failureMessage_;
};

} // namespace aerender

#endif // AE_FRAME_RENDERER_H
