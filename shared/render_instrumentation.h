#pragma once

// Compile-time control: enabled in debug builds by default
#ifndef AE_RENDER_INSTRUMENTATION_ENABLED
    #if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
        #define AE_RENDER_INSTRUMENTATION_ENABLED 1
    #else
        #define AE_RENDER_INSTRUMENTATION_ENABLED 0
    #endif
#endif

#if AE_RENDER_INSTRUMENTATION_ENABLED

#include <cstdint>
#include <functional>
#include <string>

#include "render_diagnostics.h"

namespace aerender {
namespace instrumentation {

// ============================================================================
// Hook Function Types
// ============================================================================

// Called once per emitted frame; may run on a worker thread
using FrameRenderedHook = std::function<void(int frameIndex, double renderTimeMs)>;
// Called when a layer is removed from the render during decoding
using LayerDroppedHook = std::function<void(const std::string& layerId)>;
// Called when the renderer falls back to the placeholder frame/mask pair
using PlaceholderEmittedHook = std::function<void(DiagnosticKind reason)>;

// ============================================================================
// Thread-Safe Hook Setters
// ============================================================================

void setFrameRenderedHook(FrameRenderedHook hook);
void setLayerDroppedHook(LayerDroppedHook hook);
void setPlaceholderEmittedHook(PlaceholderEmittedHook hook);

// ============================================================================
// Thread-Safe Hook Invocations (internal use by instrumented code)
// ============================================================================

void invokeFrameRendered(int frameIndex, double renderTimeMs);
void invokeLayerDropped(const std::string& layerId);
void invokePlaceholderEmitted(DiagnosticKind reason);

// ============================================================================
// RAII Hook Installer (for tests - automatically restores on scope exit)
// ============================================================================

class HookInstaller {
public:
    HookInstaller();
    ~HookInstaller();

    HookInstaller& onFrameRendered(FrameRenderedHook hook);
    HookInstaller& onLayerDropped(LayerDroppedHook hook);
    HookInstaller& onPlaceholderEmitted(PlaceholderEmittedHook hook);

    // Non-copyable, non-movable (RAII resource)
    HookInstaller(const HookInstaller&) = delete;
    HookInstaller& operator=(const HookInstaller&) = delete;
    HookInstaller(HookInstaller&&) = delete;
    HookInstaller& operator=(HookInstaller&&) = delete;

private:
    // Bitfield to track which hooks were set (to restore only those)
    uint32_t installedMask{0};

    FrameRenderedHook prevFrameRendered;
    LayerDroppedHook prevLayerDropped;
    PlaceholderEmittedHook prevPlaceholderEmitted;
};

} // namespace instrumentation
} // namespace aerender

// ============================================================================
// Convenience Macros (zero-overhead when AE_RENDER_INSTRUMENTATION_ENABLED=0)
// ============================================================================

#define AE_INSTRUMENT_FRAME_RENDERED(frameIndex, renderTimeMs) \
    aerender::instrumentation::invokeFrameRendered(frameIndex, renderTimeMs)
#define AE_INSTRUMENT_LAYER_DROPPED(layerId) \
    aerender::instrumentation::invokeLayerDropped(layerId)
#define AE_INSTRUMENT_PLACEHOLDER_EMITTED(reason) \
    aerender::instrumentation::invokePlaceholderEmitted(reason)

#else // AE_RENDER_INSTRUMENTATION_ENABLED == 0

#define AE_INSTRUMENT_FRAME_RENDERED(frameIndex, renderTimeMs) ((void)0)
#define AE_INSTRUMENT_LAYER_DROPPED(layerId) ((void)0)
#define AE_INSTRUMENT_PLACEHOLDER_EMITTED(reason) ((void)0)

#endif // AE_RENDER_INSTRUMENTATION_ENABLED
