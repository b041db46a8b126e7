// ae_render_api.cpp - C API implementation wrapping AnimationLoader and FrameRenderer

#include "ae_render_api.h"

#include "AnimationLoader.h"
#include "FrameRenderer.h"

#include <fstream>
#include <mutex>
#include <new>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

// =============================================================================
// Internal Types
// =============================================================================

/// Internal renderer structure (opaque to C API)
struct AERenderer {
    aerender::FrameRenderer renderer;
    aerender::AnimationLoader loader;

    // Loaded description (empty until a successful load)
    std::optional<aerender::Animation> animation;
    aerender::RenderDiagnostics loadDiagnostics;

    // Output of the last render
    aerender::RenderResult result;

    bool verbose = true;

    // Error handling
    std::string lastError;

    AERenderErrorCallback errorCallback = nullptr;
    void* errorUserData = nullptr;

    // Thread safety mutex
    std::mutex mutex;
};

// =============================================================================
// Internal Helper Functions
// =============================================================================

namespace {

// C enums mirror the C++ enums value for value
AERenderState toCState(aerender::RenderState state) {
    return static_cast<AERenderState>(static_cast<int>(state));
}

AEDiagnosticKind toCKind(aerender::DiagnosticKind kind) {
    return static_cast<AEDiagnosticKind>(static_cast<int>(kind));
}

/// Set error message and optionally invoke callback.
/// Must be called without holding renderer->mutex.
void setError(AERenderer* renderer, int code, const std::string& message) {
    if (!renderer) return;

    AERenderErrorCallback callback = nullptr;
    void* userData = nullptr;
    {
        std::lock_guard<std::mutex> lock(renderer->mutex);
        renderer->lastError = message;
        callback = renderer->errorCallback;
        userData = renderer->errorUserData;
    }

    if (callback) {
        callback(userData, code, message.c_str());
    }
}

/// Message of the most recent MalformedDescription record
std::string malformedMessage(const aerender::RenderDiagnostics& diagnostics) {
    const auto& records = diagnostics.records();
    for (auto it = records.rbegin(); it != records.rend(); ++it) {
        if (it->kind == aerender::DiagnosticKind::MalformedDescription) {
            return it->message;
        }
    }
    return "Malformed animation description";
}

/// Parse a description into the renderer. Returns an empty string on success.
/// Caller holds renderer->mutex.
std::string loadLocked(AERenderer* renderer, const std::string& description) {
    renderer->loader.clearDiagnostics();
    renderer->loader.setVerbose(renderer->verbose);
    renderer->animation = renderer->loader.loadFromString(description);
    renderer->loadDiagnostics = renderer->loader.diagnostics();
    renderer->result = aerender::RenderResult();

    if (!renderer->animation) {
        return malformedMessage(renderer->loadDiagnostics);
    }
    return std::string();
}

/// True for an output index of the last render. Caller holds renderer->mutex.
bool validIndex(const AERenderer* renderer, int index) {
    return index >= 0 && static_cast<size_t>(index) < renderer->result.frames.size();
}

} // anonymous namespace

// =============================================================================
// Section 1: Lifecycle Functions
// =============================================================================

AERendererRef AERender_Create(void) {
    try {
        return new AERenderer();
    } catch (const std::bad_alloc&) {
        return nullptr;
    }
}

void AERender_Destroy(AERendererRef renderer) {
    if (renderer) {
        delete renderer;
    }
}

const char* AERender_GetVersion(void) {
    return AE_RENDER_VERSION_STRING;
}

void AERender_GetVersionNumbers(int* major, int* minor, int* patch) {
    if (major) *major = AE_RENDER_API_VERSION_MAJOR;
    if (minor) *minor = AE_RENDER_API_VERSION_MINOR;
    if (patch) *patch = AE_RENDER_API_VERSION_PATCH;
}

// =============================================================================
// Section 2: Loading Functions
// =============================================================================

bool AERender_LoadDescription(AERendererRef renderer, const char* data, size_t length) {
    if (!renderer) return false;
    if (!data) {
        setError(renderer, AERenderError_InvalidArgument, "Description data is NULL");
        return false;
    }

    std::string error;
    try {
        std::lock_guard<std::mutex> lock(renderer->mutex);
        error = loadLocked(renderer, std::string(data, length));
    } catch (const std::bad_alloc&) {
        setError(renderer, AERenderError_OutOfMemory, "Out of memory while loading description");
        return false;
    }

    if (!error.empty()) {
        setError(renderer, AERenderError_ParseFailed, error);
        return false;
    }
    return true;
}

bool AERender_LoadDescriptionFile(AERendererRef renderer, const char* filepath) {
    if (!renderer) return false;
    if (!filepath) {
        setError(renderer, AERenderError_InvalidArgument, "File path is NULL");
        return false;
    }

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        setError(renderer, AERenderError_FileRead, std::string("Failed to open file: ") + filepath);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        setError(renderer, AERenderError_FileRead, std::string("Failed to read file: ") + filepath);
        return false;
    }

    const std::string content = buffer.str();
    return AERender_LoadDescription(renderer, content.data(), content.size());
}

bool AERender_IsLoaded(AERendererRef renderer) {
    if (!renderer) return false;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return renderer->animation.has_value();
}

int AERender_GetLayerCount(AERendererRef renderer) {
    if (!renderer) return 0;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return renderer->animation ? static_cast<int>(renderer->animation->layers.size()) : 0;
}

bool AERender_GetProjectInfo(AERendererRef renderer, int* width, int* height, int* fps, int* totalFrames) {
    if (!renderer) return false;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!renderer->animation) return false;

    const aerender::ProjectConfig& project = renderer->animation->project;
    if (width) *width = project.width;
    if (height) *height = project.height;
    if (fps) *fps = project.fps;
    if (totalFrames) *totalFrames = project.totalFrames;
    return true;
}

// =============================================================================
// Section 3: Rendering Functions
// =============================================================================

bool AERender_RenderRange(AERendererRef renderer, int startFrame, int endFrame, int workerThreads) {
    if (!renderer) return false;

    aerender::RenderRequest request;
    request.startFrame = startFrame;
    request.endFrame = endFrame;
    request.workerThreads = workerThreads;

    int errorCode = AERenderError_None;
    std::string error;
    try {
        std::lock_guard<std::mutex> lock(renderer->mutex);
        if (!renderer->animation) {
            errorCode = AERenderError_NotLoaded;
            error = "No description loaded for rendering";
        } else {
            renderer->renderer.setVerbose(renderer->verbose);
            aerender::RenderResult result = renderer->renderer.render(*renderer->animation, request);

            aerender::RenderDiagnostics combined;
            combined.setVerbose(renderer->verbose);
            combined.merge(renderer->loadDiagnostics);
            combined.merge(result.diagnostics);
            result.diagnostics = std::move(combined);
            renderer->result = std::move(result);
        }
    } catch (const std::bad_alloc&) {
        errorCode = AERenderError_OutOfMemory;
        error = "Out of memory while rendering";
    } catch (const std::system_error& e) {
        errorCode = AERenderError_RenderFailed;
        error = std::string("Failed to start worker threads: ") + e.what();
    }

    if (errorCode != AERenderError_None) {
        setError(renderer, errorCode, error);
        return false;
    }
    return true;
}

bool AERender_RenderDescription(AERendererRef renderer, const char* data, size_t length, int startFrame,
                                int endFrame, int workerThreads) {
    if (!renderer) return false;
    if (!data) {
        setError(renderer, AERenderError_InvalidArgument, "Description data is NULL");
        return false;
    }

    aerender::RenderRequest request;
    request.startFrame = startFrame;
    request.endFrame = endFrame;
    request.workerThreads = workerThreads;

    int errorCode = AERenderError_None;
    std::string error;
    try {
        std::lock_guard<std::mutex> lock(renderer->mutex);
        const std::string description(data, length);

        // Keep the parsed animation for later RenderRange calls
        loadLocked(renderer, description);
        renderer->renderer.setVerbose(renderer->verbose);
        if (renderer->animation) {
            aerender::RenderResult result = renderer->renderer.render(*renderer->animation, request);
            aerender::RenderDiagnostics combined;
            combined.setVerbose(renderer->verbose);
            combined.merge(renderer->loadDiagnostics);
            combined.merge(result.diagnostics);
            result.diagnostics = std::move(combined);
            renderer->result = std::move(result);
        } else {
            // Parse failure: placeholder output, recorded as a diagnostic rather than an error
            renderer->result = renderer->renderer.renderLoadFailure(renderer->loadDiagnostics);
        }
    } catch (const std::bad_alloc&) {
        errorCode = AERenderError_OutOfMemory;
        error = "Out of memory while rendering";
    } catch (const std::system_error& e) {
        errorCode = AERenderError_RenderFailed;
        error = std::string("Failed to start worker threads: ") + e.what();
    }

    if (errorCode != AERenderError_None) {
        setError(renderer, errorCode, error);
        return false;
    }
    return true;
}

AERenderState AERender_GetState(AERendererRef renderer) {
    if (!renderer) return AERenderState_Idle;
    // Lock-free so state callbacks may query it during a render
    return toCState(renderer->renderer.state());
}

int AERender_GetFrameCount(AERendererRef renderer) {
    if (!renderer) return 0;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return static_cast<int>(renderer->result.frames.size());
}

bool AERender_IsPlaceholder(AERendererRef renderer) {
    if (!renderer) return false;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return renderer->result.placeholder;
}

int AERender_GetFrameIndex(AERendererRef renderer, int index) {
    if (!renderer) return -1;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!validIndex(renderer, index) || static_cast<size_t>(index) >= renderer->result.frameIndices.size()) {
        return -1;
    }
    return renderer->result.frameIndices[static_cast<size_t>(index)];
}

bool AERender_GetFrameSize(AERendererRef renderer, int index, int* width, int* height) {
    if (!renderer) return false;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!validIndex(renderer, index)) return false;

    const aerender::FloatImage& frame = renderer->result.frames[static_cast<size_t>(index)];
    if (width) *width = frame.width;
    if (height) *height = frame.height;
    return true;
}

const float* AERender_GetFrameData(AERendererRef renderer, int index) {
    if (!renderer) return nullptr;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!validIndex(renderer, index)) return nullptr;
    return renderer->result.frames[static_cast<size_t>(index)].data.data();
}

const float* AERender_GetMaskData(AERendererRef renderer, int index) {
    if (!renderer) return nullptr;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!validIndex(renderer, index)) return nullptr;
    return renderer->result.masks[static_cast<size_t>(index)].data.data();
}

// =============================================================================
// Section 4: Diagnostics and Error Handling
// =============================================================================

// Diagnostics of the last render, or of the last load when nothing has rendered since
static const aerender::RenderDiagnostics& currentDiagnostics(const AERenderer* renderer) {
    if (renderer->result.finalState != aerender::RenderState::Idle) {
        return renderer->result.diagnostics;
    }
    return renderer->loadDiagnostics;
}

int AERender_GetDiagnosticCount(AERendererRef renderer) {
    if (!renderer) return 0;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return static_cast<int>(currentDiagnostics(renderer).records().size());
}

int AERender_GetDiagnosticCountByKind(AERendererRef renderer, AEDiagnosticKind kind) {
    if (!renderer) return 0;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return static_cast<int>(
        currentDiagnostics(renderer).count(static_cast<aerender::DiagnosticKind>(static_cast<int>(kind))));
}

bool AERender_GetDiagnostic(AERendererRef renderer, int index, AEDiagnosticKind* kind, const char** layerId,
                            const char** message) {
    if (!renderer) return false;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    const auto& records = currentDiagnostics(renderer).records();
    if (index < 0 || static_cast<size_t>(index) >= records.size()) return false;

    const aerender::DiagnosticRecord& record = records[static_cast<size_t>(index)];
    if (kind) *kind = toCKind(record.kind);
    if (layerId) *layerId = record.layerId.c_str();
    if (message) *message = record.message.c_str();
    return true;
}

void AERender_SetVerbose(AERendererRef renderer, bool verbose) {
    if (!renderer) return;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    renderer->verbose = verbose;
}

void AERender_SetErrorCallback(AERendererRef renderer, AERenderErrorCallback callback, void* userData) {
    if (!renderer) return;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    renderer->errorCallback = callback;
    renderer->errorUserData = userData;
}

void AERender_SetStateCallback(AERendererRef renderer, AERenderStateCallback callback, void* userData) {
    if (!renderer) return;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    if (!callback) {
        renderer->renderer.setStateCallback(nullptr);
        return;
    }
    renderer->renderer.setStateCallback([callback, userData](aerender::RenderState state, int frameIndex) {
        callback(userData, toCState(state), frameIndex);
    });
}

const char* AERender_GetLastError(AERendererRef renderer) {
    if (!renderer) return "";

    std::lock_guard<std::mutex> lock(renderer->mutex);
    return renderer->lastError.c_str();
}

void AERender_ClearError(AERendererRef renderer) {
    if (!renderer) return;

    std::lock_guard<std::mutex> lock(renderer->mutex);
    renderer->lastError.clear();
}
