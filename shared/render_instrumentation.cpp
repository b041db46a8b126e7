// render_instrumentation.cpp - Implementation of instrumentation hooks

#include "render_instrumentation.h"

#if AE_RENDER_INSTRUMENTATION_ENABLED

#include <mutex>
#include <utility>

namespace aerender {
namespace instrumentation {

// ============================================================================
// Thread-Safe Hook Storage
// ============================================================================

namespace {

std::mutex g_hookMutex;

FrameRenderedHook g_frameRenderedHook;
LayerDroppedHook g_layerDroppedHook;
PlaceholderEmittedHook g_placeholderEmittedHook;

// Copy under lock, invoke outside it so hooks may call back into setters
template<typename HookType, typename... Args>
void safeInvoke(const HookType& hook, Args&&... args) {
    HookType localCopy;
    {
        std::lock_guard<std::mutex> lock(g_hookMutex);
        localCopy = hook;
    }
    if (localCopy) {
        localCopy(std::forward<Args>(args)...);
    }
}

template<typename HookType>
HookType getHookCopy(const HookType& hook) {
    std::lock_guard<std::mutex> lock(g_hookMutex);
    return hook;
}

enum HookBit : uint32_t {
    HOOK_FRAME_RENDERED = 1u << 0,
    HOOK_LAYER_DROPPED = 1u << 1,
    HOOK_PLACEHOLDER_EMITTED = 1u << 2,
};

} // anonymous namespace

// ============================================================================
// Setters
// ============================================================================

void setFrameRenderedHook(FrameRenderedHook hook) {
    std::lock_guard<std::mutex> lock(g_hookMutex);
    g_frameRenderedHook = std::move(hook);
}

void setLayerDroppedHook(LayerDroppedHook hook) {
    std::lock_guard<std::mutex> lock(g_hookMutex);
    g_layerDroppedHook = std::move(hook);
}

void setPlaceholderEmittedHook(PlaceholderEmittedHook hook) {
    std::lock_guard<std::mutex> lock(g_hookMutex);
    g_placeholderEmittedHook = std::move(hook);
}

// ============================================================================
// Invocations
// ============================================================================

void invokeFrameRendered(int frameIndex, double renderTimeMs) {
    safeInvoke(g_frameRenderedHook, frameIndex, renderTimeMs);
}

void invokeLayerDropped(const std::string& layerId) {
    safeInvoke(g_layerDroppedHook, layerId);
}

void invokePlaceholderEmitted(DiagnosticKind reason) {
    safeInvoke(g_placeholderEmittedHook, reason);
}

// ============================================================================
// HookInstaller
// ============================================================================

HookInstaller::HookInstaller() = default;

HookInstaller::~HookInstaller() {
    if (installedMask & HOOK_FRAME_RENDERED) {
        setFrameRenderedHook(std::move(prevFrameRendered));
    }
    if (installedMask & HOOK_LAYER_DROPPED) {
        setLayerDroppedHook(std::move(prevLayerDropped));
    }
    if (installedMask & HOOK_PLACEHOLDER_EMITTED) {
        setPlaceholderEmittedHook(std::move(prevPlaceholderEmitted));
    }
}

HookInstaller& HookInstaller::onFrameRendered(FrameRenderedHook hook) {
    prevFrameRendered = getHookCopy(g_frameRenderedHook);
    setFrameRenderedHook(std::move(hook));
    installedMask |= HOOK_FRAME_RENDERED;
    return *this;
}

HookInstaller& HookInstaller::onLayerDropped(LayerDroppedHook hook) {
    prevLayerDropped = getHookCopy(g_layerDroppedHook);
    setLayerDroppedHook(std::move(hook));
    installedMask |= HOOK_LAYER_DROPPED;
    return *this;
}

HookInstaller& HookInstaller::onPlaceholderEmitted(PlaceholderEmittedHook hook) {
    prevPlaceholderEmitted = getHookCopy(g_placeholderEmittedHook);
    setPlaceholderEmittedHook(std::move(hook));
    installedMask |= HOOK_PLACEHOLDER_EMITTED;
    return *this;
}

} // namespace instrumentation
} // namespace aerender

#endif // AE_RENDER_INSTRUMENTATION_ENABLED
