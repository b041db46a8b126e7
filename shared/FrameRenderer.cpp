// FrameRenderer.cpp - Frame loop, mask post-processing and placeholder output

#include "FrameRenderer.h"
#include "AnimationLoader.h"
#include "RasterOps.h"
#include "render_instrumentation.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <new>
#include <system_error>
#include <thread>

namespace aerender {

const char* renderStateName(RenderState state) {
    switch (state) {
        case RenderState::Idle: return "Idle";
        case RenderState::Parsing: return "Parsing";
        case RenderState::DecodingLayers: return "DecodingLayers";
        case RenderState::Compositing: return "Compositing";
        case RenderState::PostProcessing: return "PostProcessing";
        case RenderState::Emitting: return "Emitting";
        case RenderState::Done: return "Done";
        case RenderState::Failed: return "Failed";
    }
    return "Unknown";
}

FrameRenderer::FrameRenderer() = default;

void FrameRenderer::setStateCallback(RenderStateCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    stateCallback_ = std::move(callback);
}

// Callbacks run under the lock so worker threads never report concurrently.
// A callback must not call setStateCallback().
void FrameRenderer::setState(RenderState state, int frameIndex) {
    state_.store(state);
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (!stateCallback_) return;
    try {
        stateCallback_(state, frameIndex);
    } catch (const std::exception& e) {
        recordFailure(frameIndex, std::string("state callback threw: ") + e.what());
    } catch (...) {
        recordFailure(frameIndex, "state callback threw a non-standard exception");
    }
}

void FrameRenderer::recordFailure(int frameIndex, const std::string& message) {
    std::lock_guard<std::mutex> lock(failureMutex_);
    if (failed_.load()) return;
    failureFrame_ = frameIndex;
    failureMessage_ = message;
    failed_.store(true);
}

void FrameRenderer::resetFailure() {
    std::lock_guard<std::mutex> lock(failureMutex_);
    failed_.store(false);
    failureFrame_ = -1;
    failureMessage_.clear();
}

// =============================================================================
// Stages
// =============================================================================

std::pair<int, int> FrameRenderer::clampFrameRange(const ProjectConfig& project, const RenderRequest& request) {
    int start = std::max(0, request.startFrame);
    int end = request.endFrame;
    if (end == kUnboundedEnd || end > project.totalFrames) {
        end = project.totalFrames;
    }
    return {start, end};
}

std::vector<PreparedLayer> FrameRenderer::prepareLayers(const Animation& animation, RenderDiagnostics& diagnostics) {
    std::vector<PreparedLayer> prepared;
    prepared.reserve(animation.layers.size());

    for (const Layer& layer : animation.layers) {
        PreparedLayer entry;
        entry.layer = &layer;
        entry.raster = RasterOps::makeLayerBitmap(layer.image);
        if (entry.raster.drawsNothing()) {
            diagnostics.reportLayerDecodeFailure(
                layer.id, "invalid raster " + std::to_string(layer.image.width) + "x" +
                              std::to_string(layer.image.height) + "x" + std::to_string(layer.image.channels));
            AE_INSTRUMENT_LAYER_DROPPED(layer.id);
            continue;
        }

        // Background layers never carry a custom mask
        if (layer.isForeground() && layer.customMask) {
            SkBitmap mask = RasterOps::makeMaskBitmap(*layer.customMask);
            SkBitmap masked = mask.drawsNothing() ? SkBitmap() : RasterOps::applyCustomMask(entry.raster, mask);
            if (masked.drawsNothing()) {
                diagnostics.reportLayerDecodeFailure(layer.id, "custom mask could not be applied");
                AE_INSTRUMENT_LAYER_DROPPED(layer.id);
                continue;
            }
            entry.raster = masked;
        }

        prepared.push_back(std::move(entry));
    }
    return prepared;
}

bool FrameRenderer::compositeFrame(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                                   int frameIndex, FrameCanvas& canvas) {
    if (!canvas.isValid()) return false;
    double time = static_cast<double>(frameIndex) / static_cast<double>(std::max(project.fps, 1));

    // List order is z-order
    for (const PreparedLayer& layer : layers) {
        LayerCompositor::composite(layer, time, canvas);
    }
    return true;
}

SkBitmap FrameRenderer::postProcessMask(const SkBitmap& mask, const ProjectConfig& project) {
    SkBitmap result = mask;
    if (project.maskExpansion != 0) {
        result = RasterOps::expandMask(result, project.maskExpansion);
        if (result.drawsNothing()) return result;
    }
    if (project.maskFeather > 0) {
        result = RasterOps::featherMask(result, project.maskFeather);
    }
    return result;
}

void FrameRenderer::emitPlaceholder(RenderResult& result) {
    result.frames.push_back(FloatImage::zeros(kPlaceholderSize, kPlaceholderSize, 3));
    result.masks.push_back(FloatImage::zeros(kPlaceholderSize, kPlaceholderSize, 1));
    result.placeholder = true;
}

// =============================================================================
// Render loop
// =============================================================================

bool FrameRenderer::renderOneFrame(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                                   int frameIndex, FloatImage& frame, FloatImage& mask) {
    auto frameStart = std::chrono::steady_clock::now();

    setState(RenderState::Compositing, frameIndex);
    FrameCanvas canvas = FrameCanvas::make(project.width, project.height);
    if (!compositeFrame(layers, project, frameIndex, canvas)) {
        return false;
    }

    setState(RenderState::PostProcessing, frameIndex);
    SkBitmap processed = postProcessMask(canvas.mask, project);
    if (processed.drawsNothing()) {
        std::cerr << "[AERender] Frame " << frameIndex << ": mask post-processing failed, using raw mask"
                  << std::endl;
        processed = canvas.mask;
    }

    setState(RenderState::Emitting, frameIndex);
    frame = RasterOps::toNormalizedRGB(canvas.color);
    mask = RasterOps::toNormalizedMask(processed);

    auto frameEnd = std::chrono::steady_clock::now();
    double frameMs = std::chrono::duration<double, std::milli>(frameEnd - frameStart).count();
    AE_INSTRUMENT_FRAME_RENDERED(frameIndex, frameMs);
    (void)frameMs;
    return true;
}

// Frame failures are recorded, never rethrown; the first one aborts the render
void FrameRenderer::renderSlot(const std::vector<PreparedLayer>& layers, const ProjectConfig& project,
                               RenderResult& result, size_t slot) {
    int frameIndex = result.frameIndices[slot];
    try {
        if (!renderOneFrame(layers, project, frameIndex, result.frames[slot], result.masks[slot])) {
            recordFailure(frameIndex, "canvas allocation failed");
        }
    } catch (const std::bad_alloc&) {
        recordFailure(frameIndex, "out of memory");
    } catch (const std::exception& e) {
        recordFailure(frameIndex, e.what());
    }
}

void FrameRenderer::finishWithPlaceholder(RenderResult& result, RenderState state, DiagnosticKind reason) {
    emitPlaceholder(result);
    AE_INSTRUMENT_PLACEHOLDER_EMITTED(reason);
    result.finalState = state;
    setState(state);
}

// Partial frames are discarded
void FrameRenderer::finishWithFailure(RenderResult& result) {
    result.frames.clear();
    result.masks.clear();
    result.frameIndices.clear();
    {
        std::lock_guard<std::mutex> lock(failureMutex_);
        result.diagnostics.reportRenderFailure(failureFrame_, failureMessage_);
    }
    finishWithPlaceholder(result, RenderState::Failed, DiagnosticKind::RenderFailure);
}

RenderResult FrameRenderer::render(const Animation& animation, const RenderRequest& request) {
    resetFailure();
    return renderLoaded(animation, request);
}

RenderResult FrameRenderer::renderLoaded(const Animation& animation, const RenderRequest& request) {
    RenderResult result;
    result.diagnostics.setVerbose(verbose_);

    const ProjectConfig& project = animation.project;
    if (!project.isValid() || project.width > AnimationLoader::kMaxCanvasDimension ||
        project.height > AnimationLoader::kMaxCanvasDimension) {
        result.diagnostics.reportMalformedDescription(
            "invalid project settings " + std::to_string(project.width) + "x" + std::to_string(project.height) +
            " @" + std::to_string(project.fps) + "fps, " + std::to_string(project.totalFrames) + " frames");
        finishWithPlaceholder(result, RenderState::Failed, DiagnosticKind::MalformedDescription);
        return result;
    }

    auto [startFrame, endFrame] = clampFrameRange(project, request);
    if (verbose_) {
        std::cout << "[AERender] Render: " << project.width << "x" << project.height << ", " << startFrame
                  << "-" << endFrame << "/" << project.totalFrames << ", " << animation.layers.size()
                  << " layers" << std::endl;
    }

    setState(RenderState::DecodingLayers);
    std::vector<PreparedLayer> layers = prepareLayers(animation, result.diagnostics);
    if (failed_.load()) {
        finishWithFailure(result);
        return result;
    }

    if (startFrame >= endFrame) {
        result.diagnostics.reportEmptyFrameRange(startFrame, endFrame);
        finishWithPlaceholder(result, RenderState::Done, DiagnosticKind::EmptyFrameRange);
        return result;
    }

    const size_t frameCount = static_cast<size_t>(endFrame - startFrame);
    result.frames.resize(frameCount);
    result.masks.resize(frameCount);
    result.frameIndices.resize(frameCount);
    for (size_t i = 0; i < frameCount; i++) {
        result.frameIndices[i] = startFrame + static_cast<int>(i);
    }

    size_t workers = request.workerThreads > 0 ? static_cast<size_t>(request.workerThreads)
                                               : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, frameCount);

    auto renderStart = std::chrono::steady_clock::now();

    if (workers <= 1) {
        for (size_t i = 0; i < frameCount && !failed_.load(); i++) {
            renderSlot(layers, project, result, i);
        }
    } else {
        // Workers claim frame slots in order; each slot is written by exactly one worker
        std::atomic<size_t> nextSlot{0};
        auto workerLoop = [&]() {
            for (size_t i = nextSlot.fetch_add(1); i < frameCount && !failed_.load(); i = nextSlot.fetch_add(1)) {
                renderSlot(layers, project, result, i);
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; w++) {
            try {
                threads.emplace_back(workerLoop);
            } catch (const std::system_error& e) {
                // Threads already started finish the remaining slots
                if (threads.empty()) {
                    recordFailure(-1, std::string("could not start worker thread: ") + e.what());
                }
                break;
            }
        }
        for (std::thread& thread : threads) {
            thread.join();
        }
    }

    if (failed_.load()) {
        finishWithFailure(result);
        return result;
    }

    if (verbose_) {
        auto renderEnd = std::chrono::steady_clock::now();
        double totalMs = std::chrono::duration<double, std::milli>(renderEnd - renderStart).count();
        std::cout << "[AERender] Rendered " << frameCount << " frames (" << layers.size() << "/"
                  << animation.layers.size() << " layers, " << workers << " threads) in " << totalMs << " ms"
                  << std::endl;
    }

    result.finalState = RenderState::Done;
    setState(RenderState::Done);
    return result;
}

RenderResult FrameRenderer::renderLoadFailure(const RenderDiagnostics& loadDiagnostics) {
    RenderResult result;
    result.diagnostics.setVerbose(verbose_);
    result.diagnostics.merge(loadDiagnostics);
    finishWithPlaceholder(result, RenderState::Failed, DiagnosticKind::MalformedDescription);
    return result;
}

RenderResult FrameRenderer::renderDescription(const std::string& description, const RenderRequest& request) {
    resetFailure();
    setState(RenderState::Parsing);

    AnimationLoader loader;
    loader.setVerbose(verbose_);
    std::optional<Animation> animation = loader.loadFromString(description);

    if (!animation) {
        return renderLoadFailure(loader.diagnostics());
    }

    RenderResult result = renderLoaded(*animation, request);

    // Loader records precede render records
    RenderDiagnostics combined;
    combined.setVerbose(verbose_);
    combined.merge(loader.diagnostics());
    combined.merge(result.diagnostics);
    result.diagnostics = std::move(combined);
    return result;
}

} // namespace aerender
