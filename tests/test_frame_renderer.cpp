// test_frame_renderer.cpp - Integration tests for the frame loop and its fallback paths
//
// Covers frame timing, range clamping, mask post-processing, placeholder output,
// worker threads, state transitions and instrumentation hooks.

#include "test_framework.h"

#include "../shared/FrameRenderer.h"
#include "../shared/render_instrumentation.h"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace aerender;

// =============================================================================
// Helpers
// =============================================================================

static Layer solidLayer(const char* id, LayerKind kind, int width, int height, uint8_t r, uint8_t g, uint8_t b) {
    Layer layer;
    layer.id = id;
    layer.kind = kind;
    layer.image = RasterBuffer::make(width, height, 3);
    for (size_t i = 0; i < layer.image.pixels.size(); i += 3) {
        layer.image.pixels[i + 0] = r;
        layer.image.pixels[i + 1] = g;
        layer.image.pixels[i + 2] = b;
    }
    return layer;
}

static Animation makeAnimation(int width, int height, int fps, int totalFrames) {
    Animation animation;
    animation.project.width = width;
    animation.project.height = height;
    animation.project.fps = fps;
    animation.project.totalFrames = totalFrames;
    return animation;
}

// Red 50x50 block sliding from the center to +50 px over one second
static Animation slidingBlock() {
    Animation animation = makeAnimation(100, 100, 10, 10);
    Layer block = solidLayer("block", LayerKind::Foreground, 50, 50, 255, 0, 0);
    block.keyframes["x"] = KeyframeTrack({{0.0, 0.0}, {1.0, 50.0}});
    animation.layers.push_back(std::move(block));
    return animation;
}

static FrameRenderer& quiet(FrameRenderer& renderer) {
    renderer.setVerbose(false);
    return renderer;
}

static int nonZeroCount(const FloatImage& image) {
    int count = 0;
    for (float v : image.data) {
        if (v != 0.0f) count++;
    }
    return count;
}

static bool isAllZero(const FloatImage& image) {
    return nonZeroCount(image) == 0;
}

// =============================================================================
// End-to-end
// =============================================================================

TEST(sliding_block_renders_every_frame) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(slidingBlock());

    ASSERT_TRUE(result.finalState == RenderState::Done);
    ASSERT_FALSE(result.placeholder);
    ASSERT_EQ(result.frameCount(), 10u);
    ASSERT_EQ(result.masks.size(), 10u);
    ASSERT_EQ(result.frameIndices.front(), 0);
    ASSERT_EQ(result.frameIndices.back(), 9);
    ASSERT_FALSE(result.diagnostics.isDegraded());

    const FloatImage& frame = result.frames[0];
    ASSERT_EQ(frame.width, 100);
    ASSERT_EQ(frame.height, 100);
    ASSERT_EQ(frame.channels, 3);
    ASSERT_EQ(result.masks[0].channels, 1);
}

TEST(sliding_block_frame_zero_is_centered) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(slidingBlock());
    const FloatImage& frame = result.frames[0];
    const FloatImage& mask = result.masks[0];

    // Block occupies [25, 75) in both axes
    ASSERT_EQ(frame.at(50, 50, 0), 1.0f);
    ASSERT_EQ(frame.at(50, 50, 1), 0.0f);
    ASSERT_EQ(frame.at(25, 25, 0), 1.0f);
    ASSERT_EQ(frame.at(74, 74, 0), 1.0f);
    ASSERT_EQ(frame.at(24, 50, 0), 0.0f);
    ASSERT_EQ(frame.at(75, 50, 0), 0.0f);

    ASSERT_EQ(mask.at(50, 50), 1.0f);
    ASSERT_EQ(mask.at(10, 10), 0.0f);
    ASSERT_EQ(nonZeroCount(mask), 2500);
}

TEST(sliding_block_frame_five_is_shifted) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(slidingBlock());
    const FloatImage& frame = result.frames[5];

    // time 0.5 -> x = 25, block occupies [50, 100)
    ASSERT_EQ(frame.at(49, 50, 0), 0.0f);
    ASSERT_EQ(frame.at(50, 50, 0), 1.0f);
    ASSERT_EQ(frame.at(99, 50, 0), 1.0f);
    ASSERT_EQ(nonZeroCount(result.masks[5]), 2500);
}

TEST(empty_animation_renders_blank_frames) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(makeAnimation(32, 16, 4, 3));
    ASSERT_TRUE(result.finalState == RenderState::Done);
    ASSERT_EQ(result.frameCount(), 3u);
    ASSERT_EQ(result.frames[2].width, 32);
    ASSERT_EQ(result.frames[2].height, 16);
    ASSERT_TRUE(isAllZero(result.frames[2]));
    ASSERT_TRUE(isAllZero(result.masks[2]));
}

// =============================================================================
// Placeholder paths
// =============================================================================

TEST(malformed_description_emits_placeholder) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).renderDescription("{ this is not json");

    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_TRUE(renderer.state() == RenderState::Failed);
    ASSERT_TRUE(result.placeholder);
    ASSERT_EQ(result.frameCount(), 1u);
    ASSERT_EQ(result.masks.size(), 1u);
    ASSERT_TRUE(result.frameIndices.empty());

    const FloatImage& frame = result.frames[0];
    ASSERT_EQ(frame.width, FrameRenderer::kPlaceholderSize);
    ASSERT_EQ(frame.height, FrameRenderer::kPlaceholderSize);
    ASSERT_TRUE(isAllZero(frame));
    ASSERT_TRUE(isAllZero(result.masks[0]));
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::MalformedDescription), 1u);
}

TEST(invalid_project_emits_placeholder) {
    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(makeAnimation(0, 100, 10, 10));
    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_TRUE(result.placeholder);
    ASSERT_TRUE(result.diagnostics.has(DiagnosticKind::MalformedDescription));
}

TEST(empty_range_emits_placeholder) {
    FrameRenderer renderer;
    RenderRequest request;
    request.startFrame = 5;
    request.endFrame = 5;
    RenderResult result = quiet(renderer).render(slidingBlock(), request);

    ASSERT_TRUE(result.finalState == RenderState::Done);
    ASSERT_TRUE(result.placeholder);
    ASSERT_EQ(result.frameCount(), 1u);
    ASSERT_EQ(result.frames[0].width, FrameRenderer::kPlaceholderSize);
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::EmptyFrameRange), 1u);
}

TEST(load_failure_keeps_loader_diagnostics) {
    RenderDiagnostics loadDiagnostics;
    loadDiagnostics.setVerbose(false);
    loadDiagnostics.reportMalformedDescription("cannot open file");

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).renderLoadFailure(loadDiagnostics);
    ASSERT_TRUE(result.placeholder);
    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_EQ(result.diagnostics.records().size(), 1u);
    ASSERT_EQ(result.diagnostics.records()[0].message, std::string("cannot open file"));
}

// =============================================================================
// Frame range
// =============================================================================

TEST(frame_range_clamping) {
    ProjectConfig project;
    project.totalFrames = 24;
    RenderRequest request;

    auto range = FrameRenderer::clampFrameRange(project, request);
    ASSERT_EQ(range.first, 0);
    ASSERT_EQ(range.second, 24);

    request.startFrame = -3;
    request.endFrame = 100;
    range = FrameRenderer::clampFrameRange(project, request);
    ASSERT_EQ(range.first, 0);
    ASSERT_EQ(range.second, 24);

    request.startFrame = 4;
    request.endFrame = 8;
    range = FrameRenderer::clampFrameRange(project, request);
    ASSERT_EQ(range.first, 4);
    ASSERT_EQ(range.second, 8);
}

TEST(sub_range_reports_absolute_frame_indices) {
    FrameRenderer renderer;
    RenderRequest request;
    request.startFrame = 3;
    request.endFrame = 6;
    RenderResult result = quiet(renderer).render(slidingBlock(), request);

    ASSERT_EQ(result.frameCount(), 3u);
    ASSERT_EQ(result.frameIndices[0], 3);
    ASSERT_EQ(result.frameIndices[2], 5);
    // Frame 5 is at x = 25 regardless of where the range starts
    ASSERT_EQ(result.frames[2].at(50, 50, 0), 1.0f);
    ASSERT_EQ(result.frames[2].at(49, 50, 0), 0.0f);
}

// =============================================================================
// Mask post-processing
// =============================================================================

TEST(mask_expansion_grows_single_dot) {
    Animation animation = makeAnimation(11, 11, 1, 1);
    animation.project.maskExpansion = 2;
    animation.layers.push_back(solidLayer("dot", LayerKind::Foreground, 1, 1, 255, 255, 255));

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(animation);
    const FloatImage& mask = result.masks[0];
    ASSERT_TRUE(nonZeroCount(mask) >= 25);
    for (int y = 3; y <= 7; y++) {
        for (int x = 3; x <= 7; x++) {
            ASSERT_EQ(mask.at(x, y), 1.0f);
        }
    }
    // The color frame is not expanded
    ASSERT_EQ(nonZeroCount(result.frames[0]), 3);
}

TEST(mask_erosion_shrinks_block) {
    Animation animation = makeAnimation(20, 20, 1, 1);
    animation.project.maskExpansion = -1;
    animation.layers.push_back(solidLayer("block", LayerKind::Foreground, 10, 10, 255, 255, 255));

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(animation);
    const FloatImage& mask = result.masks[0];
    // Block [5, 15) shrinks to [6, 14)
    ASSERT_EQ(nonZeroCount(mask), 64);
    ASSERT_EQ(mask.at(5, 5), 0.0f);
    ASSERT_EQ(mask.at(6, 6), 1.0f);
    ASSERT_EQ(mask.at(13, 13), 1.0f);
    ASSERT_EQ(mask.at(14, 13), 0.0f);
}

TEST(mask_feather_softens_without_touching_color) {
    Animation animation = makeAnimation(40, 40, 1, 1);
    animation.project.maskFeather = 3;
    animation.layers.push_back(solidLayer("block", LayerKind::Foreground, 10, 10, 255, 255, 255));

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(animation);
    const FloatImage& mask = result.masks[0];
    ASSERT_TRUE(mask.at(14, 20) > 0.0f);     // Outside the block [15, 25)
    ASSERT_TRUE(mask.at(15, 15) < 1.0f);
    ASSERT_EQ(mask.at(0, 0), 0.0f);
    ASSERT_EQ(result.frames[0].at(14, 20, 0), 0.0f);
}

TEST(post_process_without_settings_returns_input) {
    ProjectConfig project;
    FrameCanvas canvas = FrameCanvas::make(8, 8);
    SkBitmap processed = FrameRenderer::postProcessMask(canvas.mask, project);
    ASSERT_TRUE(processed.getPixels() == canvas.mask.getPixels());
}

// =============================================================================
// Layer preparation
// =============================================================================

TEST(invalid_layer_is_dropped_and_render_continues) {
    Animation animation = slidingBlock();
    Layer broken = solidLayer("broken", LayerKind::Foreground, 10, 10, 0, 255, 0);
    broken.image.pixels.resize(7);
    animation.layers.insert(animation.layers.begin(), std::move(broken));

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(animation);
    ASSERT_TRUE(result.finalState == RenderState::Done);
    ASSERT_EQ(result.frameCount(), 10u);
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::LayerDecodeFailure), 1u);
    ASSERT_EQ(result.diagnostics.records()[0].layerId, std::string("broken"));
    ASSERT_EQ(result.frames[0].at(50, 50, 0), 1.0f);
}

TEST(prepare_layers_keeps_order_of_survivors) {
    Animation animation = makeAnimation(10, 10, 1, 1);
    animation.layers.push_back(solidLayer("a", LayerKind::Background, 2, 2, 1, 1, 1));
    Layer bad = solidLayer("b", LayerKind::Foreground, 2, 2, 1, 1, 1);
    bad.image.channels = 2;
    animation.layers.push_back(bad);
    animation.layers.push_back(solidLayer("c", LayerKind::Foreground, 2, 2, 1, 1, 1));

    RenderDiagnostics diagnostics;
    diagnostics.setVerbose(false);
    std::vector<PreparedLayer> prepared = FrameRenderer::prepareLayers(animation, diagnostics);
    ASSERT_EQ(prepared.size(), 2u);
    ASSERT_EQ(prepared[0].layer->id, std::string("a"));
    ASSERT_EQ(prepared[1].layer->id, std::string("c"));
    ASSERT_EQ(diagnostics.count(DiagnosticKind::LayerDecodeFailure), 1u);
}

TEST(custom_mask_is_applied_to_foreground_only) {
    Animation animation = makeAnimation(10, 10, 1, 1);
    RasterBuffer clear = RasterBuffer::make(4, 4, 1);  // All zero

    Layer bg = solidLayer("bg", LayerKind::Background, 10, 10, 0, 0, 255);
    bg.bgMode = BackgroundMode::Stretch;
    bg.customMask = clear;
    Layer fg = solidLayer("fg", LayerKind::Foreground, 10, 10, 255, 0, 0);
    fg.customMask = clear;
    animation.layers.push_back(bg);
    animation.layers.push_back(fg);

    FrameRenderer renderer;
    RenderResult result = quiet(renderer).render(animation);
    // Background stays visible, masked foreground contributes nothing
    ASSERT_EQ(result.frames[0].at(5, 5, 2), 1.0f);
    ASSERT_EQ(result.frames[0].at(5, 5, 0), 0.0f);
    ASSERT_TRUE(isAllZero(result.masks[0]));
}

// =============================================================================
// Worker threads
// =============================================================================

TEST(multithreaded_render_matches_single_thread) {
    Animation animation = slidingBlock();
    animation.layers[0].keyframes["rotation"] = KeyframeTrack({{0.0, 0.0}, {1.0, 90.0}});
    animation.project.maskFeather = 2;

    FrameRenderer single;
    RenderResult expected = quiet(single).render(animation);

    FrameRenderer pooled;
    RenderRequest request;
    request.workerThreads = 4;
    RenderResult actual = quiet(pooled).render(animation, request);

    ASSERT_EQ(actual.frameCount(), expected.frameCount());
    for (size_t i = 0; i < expected.frameCount(); i++) {
        ASSERT_EQ(actual.frameIndices[i], expected.frameIndices[i]);
        ASSERT_TRUE(actual.frames[i].data == expected.frames[i].data);
        ASSERT_TRUE(actual.masks[i].data == expected.masks[i].data);
    }
}

TEST(hardware_concurrency_request) {
    FrameRenderer renderer;
    RenderRequest request;
    request.workerThreads = 0;
    RenderResult result = quiet(renderer).render(slidingBlock(), request);
    ASSERT_EQ(result.frameCount(), 10u);
    ASSERT_EQ(result.frameIndices[9], 9);
}

// =============================================================================
// State transitions
// =============================================================================

TEST(state_callback_reports_transitions_in_order) {
    std::vector<RenderState> states;
    std::vector<int> frames;
    FrameRenderer renderer;
    renderer.setStateCallback([&](RenderState state, int frameIndex) {
        states.push_back(state);
        frames.push_back(frameIndex);
    });

    RenderRequest request;
    request.endFrame = 2;
    quiet(renderer).render(slidingBlock(), request);

    const std::vector<RenderState> expected = {
        RenderState::DecodingLayers,
        RenderState::Compositing, RenderState::PostProcessing, RenderState::Emitting,
        RenderState::Compositing, RenderState::PostProcessing, RenderState::Emitting,
        RenderState::Done,
    };
    ASSERT_TRUE(states == expected);
    ASSERT_EQ(frames[0], -1);
    ASSERT_EQ(frames[1], 0);
    ASSERT_EQ(frames[4], 1);
    ASSERT_EQ(frames.back(), -1);
    ASSERT_TRUE(renderer.state() == RenderState::Done);
}

TEST(description_render_starts_with_parsing) {
    std::vector<RenderState> states;
    FrameRenderer renderer;
    renderer.setStateCallback([&](RenderState state, int) { states.push_back(state); });

    quiet(renderer).renderDescription(
        R"({"project": {"width": 8, "height": 8, "fps": 2, "total_frames": 1}, "layers": []})");
    ASSERT_FALSE(states.empty());
    ASSERT_TRUE(states.front() == RenderState::Parsing);
    ASSERT_TRUE(states[1] == RenderState::DecodingLayers);
    ASSERT_TRUE(states.back() == RenderState::Done);
}

TEST(state_callback_from_workers_is_serialized) {
    std::mutex seenMutex;
    std::set<int> emitted;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};

    FrameRenderer renderer;
    renderer.setStateCallback([&](RenderState state, int frameIndex) {
        if (inside.fetch_add(1) != 0) overlapped = true;
        if (state == RenderState::Emitting) {
            std::lock_guard<std::mutex> lock(seenMutex);
            emitted.insert(frameIndex);
        }
        inside.fetch_sub(1);
    });

    RenderRequest request;
    request.workerThreads = 3;
    quiet(renderer).render(slidingBlock(), request);
    ASSERT_FALSE(overlapped.load());
    ASSERT_EQ(emitted.size(), 10u);
}

TEST(throwing_callback_on_workers_fails_with_placeholder) {
    std::atomic<int> calls{0};
    RenderState lastState = RenderState::Idle;

    FrameRenderer renderer;
    renderer.setStateCallback([&](RenderState state, int frameIndex) {
        lastState = state;
        if (state == RenderState::Compositing && frameIndex == 3) {
            throw std::runtime_error("host rejected frame");
        }
        calls.fetch_add(1);
    });

    RenderRequest request;
    request.workerThreads = 4;
    RenderResult result = quiet(renderer).render(slidingBlock(), request);

    ASSERT_TRUE(result.placeholder);
    ASSERT_EQ(result.frameCount(), 1u);
    ASSERT_EQ(result.masks.size(), 1u);
    ASSERT_TRUE(result.frameIndices.empty());
    ASSERT_EQ(result.frames[0].width, FrameRenderer::kPlaceholderSize);
    ASSERT_TRUE(isAllZero(result.frames[0]));
    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_TRUE(renderer.state() == RenderState::Failed);
    ASSERT_TRUE(lastState == RenderState::Failed);
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::RenderFailure), 1u);
    const DiagnosticRecord& record = result.diagnostics.records().back();
    ASSERT_TRUE(record.message.find("frame 3") != std::string::npos);
    ASSERT_TRUE(record.message.find("host rejected frame") != std::string::npos);
}

TEST(throwing_callback_single_thread_stops_frame_loop) {
    std::vector<int> composited;

    FrameRenderer renderer;
    renderer.setStateCallback([&](RenderState state, int frameIndex) {
        if (state != RenderState::Compositing) return;
        composited.push_back(frameIndex);
        if (frameIndex == 1) throw std::runtime_error("stop");
    });

    RenderResult result = quiet(renderer).render(slidingBlock());
    ASSERT_TRUE(result.placeholder);
    ASSERT_EQ(result.frameCount(), 1u);
    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::RenderFailure), 1u);
    ASSERT_EQ(composited.size(), 2u);

    // The next render starts clean
    renderer.setStateCallback(nullptr);
    RenderResult next = renderer.render(slidingBlock());
    ASSERT_FALSE(next.placeholder);
    ASSERT_EQ(next.frameCount(), 10u);
    ASSERT_TRUE(next.finalState == RenderState::Done);
    ASSERT_FALSE(next.diagnostics.has(DiagnosticKind::RenderFailure));
}

TEST(throwing_callback_while_decoding_fails_before_frames) {
    FrameRenderer renderer;
    renderer.setStateCallback([](RenderState state, int) {
        if (state == RenderState::DecodingLayers) throw std::logic_error("decode hook");
    });

    RenderResult result = quiet(renderer).render(slidingBlock());
    ASSERT_TRUE(result.placeholder);
    ASSERT_TRUE(result.finalState == RenderState::Failed);
    ASSERT_EQ(result.diagnostics.count(DiagnosticKind::RenderFailure), 1u);
    ASSERT_TRUE(result.diagnostics.records().back().message.find("decode hook") != std::string::npos);
}

TEST(render_state_names) {
    ASSERT_EQ(std::string(renderStateName(RenderState::Idle)), std::string("Idle"));
    ASSERT_EQ(std::string(renderStateName(RenderState::PostProcessing)), std::string("PostProcessing"));
    ASSERT_EQ(std::string(renderStateName(RenderState::Failed)), std::string("Failed"));
    FrameRenderer renderer;
    ASSERT_TRUE(renderer.state() == RenderState::Idle);
}

// =============================================================================
// Instrumentation hooks
// =============================================================================

#if AE_RENDER_INSTRUMENTATION_ENABLED

TEST(hooks_report_frames_drops_and_placeholders) {
    std::atomic<int> framesRendered{0};
    std::vector<std::string> dropped;
    std::vector<DiagnosticKind> placeholders;

    {
        instrumentation::HookInstaller hooks;
        hooks.onFrameRendered([&](int, double renderTimeMs) {
                 if (renderTimeMs >= 0.0) framesRendered++;
             })
            .onLayerDropped([&](const std::string& layerId) { dropped.push_back(layerId); })
            .onPlaceholderEmitted([&](DiagnosticKind reason) { placeholders.push_back(reason); });

        Animation animation = slidingBlock();
        Layer broken = solidLayer("broken", LayerKind::Foreground, 4, 4, 0, 0, 0);
        broken.image.width = 0;
        animation.layers.push_back(broken);

        FrameRenderer renderer;
        quiet(renderer).render(animation);
        quiet(renderer).renderDescription("[1, 2");
    }

    ASSERT_EQ(framesRendered.load(), 10);
    ASSERT_EQ(dropped.size(), 1u);
    ASSERT_EQ(dropped[0], std::string("broken"));
    ASSERT_EQ(placeholders.size(), 1u);
    ASSERT_TRUE(placeholders[0] == DiagnosticKind::MalformedDescription);

    // Hooks are removed when the installer goes out of scope
    FrameRenderer renderer;
    quiet(renderer).render(slidingBlock());
    ASSERT_EQ(framesRendered.load(), 10);
}

#endif // AE_RENDER_INSTRUMENTATION_ENABLED

int main() {
    return runAllTests("AE Render FrameRenderer - Integration Tests");
}
