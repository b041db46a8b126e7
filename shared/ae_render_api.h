// ae_render_api.h - C API for the AE Render keyframed layer compositor
//
// Design principles:
// - Pure C API for maximum ABI compatibility
// - Opaque handle pattern (AERendererRef) for type safety
// - No exceptions - use return codes and error strings
// - Thread-safe for single-writer access (caller manages synchronization)
//
// Usage:
//   1. Create renderer: AERender_Create()
//   2. Load a description: AERender_LoadDescription() or AERender_LoadDescriptionFile()
//   3. Render: AERender_RenderRange(), then read AERender_GetFrameData() / AERender_GetMaskData()
//   4. Cleanup: AERender_Destroy()
//
// AERender_RenderDescription() combines steps 2 and 3 and always produces output: a
// description that cannot be parsed yields a single 64x64 all-zero placeholder pair.

#ifndef AE_RENDER_API_H
#define AE_RENDER_API_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "version.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// API Version and Export Macros
// =============================================================================

#define AE_RENDER_API_VERSION_MAJOR AE_RENDER_VERSION_MAJOR
#define AE_RENDER_API_VERSION_MINOR AE_RENDER_VERSION_MINOR
#define AE_RENDER_API_VERSION_PATCH AE_RENDER_VERSION_PATCH

#ifdef _WIN32
#ifdef AE_RENDER_BUILDING_DLL
#define AE_RENDER_API __declspec(dllexport)
#else
#define AE_RENDER_API __declspec(dllimport)
#endif
#else
#ifdef AE_RENDER_BUILDING_DLL
#define AE_RENDER_API __attribute__((visibility("default")))
#else
#define AE_RENDER_API
#endif
#endif

// =============================================================================
// Opaque Handle Type
// =============================================================================

/// Opaque handle to a renderer instance
typedef struct AERenderer* AERendererRef;

// =============================================================================
// Enumerations
// =============================================================================

/// Error codes passed to the error callback
typedef enum {
    AERenderError_None = 0,
    AERenderError_InvalidArgument = 1,
    AERenderError_NotLoaded = 2,
    AERenderError_ParseFailed = 3,
    AERenderError_FileRead = 4,
    AERenderError_OutOfMemory = 5,
    AERenderError_IndexOutOfRange = 6,
    AERenderError_RenderFailed = 7
} AERenderErrorCode;

/// Renderer state machine
typedef enum {
    AERenderState_Idle = 0,
    AERenderState_Parsing = 1,
    AERenderState_DecodingLayers = 2,
    AERenderState_Compositing = 3,
    AERenderState_PostProcessing = 4,
    AERenderState_Emitting = 5,
    AERenderState_Done = 6,
    AERenderState_Failed = 7
} AERenderState;

/// Kinds of degraded-but-non-fatal outcomes
typedef enum {
    AEDiagnostic_MalformedDescription = 0,
    AEDiagnostic_LayerDecodeFailure = 1,
    AEDiagnostic_InvalidKeyframeTrack = 2,
    AEDiagnostic_EmptyFrameRange = 3,
    AEDiagnostic_RenderFailure = 4
} AEDiagnosticKind;

// =============================================================================
// Callback Type Definitions
// =============================================================================

/// Callback when an error occurs
/// @param userData User-provided context pointer
/// @param errorCode Error code (AERenderErrorCode)
/// @param errorMessage Error description (valid only during callback)
typedef void (*AERenderErrorCallback)(void* userData, int errorCode, const char* errorMessage);

/// Callback on render state transitions. May be called from worker threads (serialized).
/// Must not call back into the API except AERender_GetState.
/// @param frameIndex Frame being processed, or -1 outside the per-frame states
typedef void (*AERenderStateCallback)(void* userData, AERenderState state, int frameIndex);

// =============================================================================
// Section 1: Lifecycle Functions
// =============================================================================

/// Create a new renderer instance
/// @return Handle to the renderer, or NULL on failure
AE_RENDER_API AERendererRef AERender_Create(void);

/// Destroy a renderer and free all frames it holds
/// @param renderer Handle to destroy (safe to pass NULL)
AE_RENDER_API void AERender_Destroy(AERendererRef renderer);

/// Get the library version as a string - static, do not free
AE_RENDER_API const char* AERender_GetVersion(void);

/// Get detailed version numbers (any output can be NULL)
AE_RENDER_API void AERender_GetVersionNumbers(int* major, int* minor, int* patch);

// =============================================================================
// Section 2: Loading Functions
// =============================================================================

/// Load a JSON animation description from memory
/// @param data UTF-8 JSON text
/// @param length Length of data in bytes
/// @return true on success, false if the description is malformed (check AERender_GetLastError)
AE_RENDER_API bool AERender_LoadDescription(AERendererRef renderer, const char* data, size_t length);

/// Load a JSON animation description from disk
AE_RENDER_API bool AERender_LoadDescriptionFile(AERendererRef renderer, const char* filepath);

/// Check if a description is loaded
AE_RENDER_API bool AERender_IsLoaded(AERendererRef renderer);

/// Number of layers that survived loading
AE_RENDER_API int AERender_GetLayerCount(AERendererRef renderer);

/// Project settings of the loaded description (any output can be NULL)
/// @return false if nothing is loaded
AE_RENDER_API bool AERender_GetProjectInfo(AERendererRef renderer, int* width, int* height, int* fps,
                                           int* totalFrames);

// =============================================================================
// Section 3: Rendering Functions
// =============================================================================

/// Render frames [startFrame, endFrame) of the loaded description
/// @param endFrame Exclusive end, -1 renders through the last frame
/// @param workerThreads Number of worker threads, <= 0 uses all cores
/// @return false if nothing is loaded or the render could not run
AE_RENDER_API bool AERender_RenderRange(AERendererRef renderer, int startFrame, int endFrame, int workerThreads);

/// Parse and render in one call. Always produces at least one frame/mask pair.
/// @return false only for invalid arguments or allocation failure
AE_RENDER_API bool AERender_RenderDescription(AERendererRef renderer, const char* data, size_t length,
                                              int startFrame, int endFrame, int workerThreads);

/// State of the most recent (or running) render
AE_RENDER_API AERenderState AERender_GetState(AERendererRef renderer);

/// Number of frames produced by the last render
AE_RENDER_API int AERender_GetFrameCount(AERendererRef renderer);

/// True when the last render produced only the placeholder pair
AE_RENDER_API bool AERender_IsPlaceholder(AERendererRef renderer);

/// Frame index of an output entry, or -1 for a placeholder or invalid index
AE_RENDER_API int AERender_GetFrameIndex(AERendererRef renderer, int index);

/// Dimensions of an output entry
/// @return false for an invalid index
AE_RENDER_API bool AERender_GetFrameSize(AERendererRef renderer, int index, int* width, int* height);

/// Normalized RGB floats (height x width x 3), owned by the renderer until the next render
AE_RENDER_API const float* AERender_GetFrameData(AERendererRef renderer, int index);

/// Normalized mask floats (height x width), owned by the renderer until the next render
AE_RENDER_API const float* AERender_GetMaskData(AERendererRef renderer, int index);

// =============================================================================
// Section 4: Diagnostics and Error Handling
// =============================================================================

/// Number of diagnostics recorded by the last load and render
AE_RENDER_API int AERender_GetDiagnosticCount(AERendererRef renderer);

/// Number of diagnostics of one kind
AE_RENDER_API int AERender_GetDiagnosticCountByKind(AERendererRef renderer, AEDiagnosticKind kind);

/// Read one diagnostic. Strings stay valid until the next load or render (outputs can be NULL).
/// @return false for an invalid index
AE_RENDER_API bool AERender_GetDiagnostic(AERendererRef renderer, int index, AEDiagnosticKind* kind,
                                          const char** layerId, const char** message);

/// Enable or disable console logging (default: enabled)
AE_RENDER_API void AERender_SetVerbose(AERendererRef renderer, bool verbose);

/// Set error callback
AE_RENDER_API void AERender_SetErrorCallback(AERendererRef renderer, AERenderErrorCallback callback,
                                             void* userData);

/// Set state transition callback
AE_RENDER_API void AERender_SetStateCallback(AERendererRef renderer, AERenderStateCallback callback,
                                             void* userData);

/// Last error message (empty if none)
AE_RENDER_API const char* AERender_GetLastError(AERendererRef renderer);

/// Clear the last error
AE_RENDER_API void AERender_ClearError(AERendererRef renderer);

#ifdef __cplusplus
}
#endif

#endif // AE_RENDER_API_H
