// render_diagnostics.h - Structured record of degraded-but-non-fatal render outcomes
//
// The renderer never fails hard: malformed descriptions, undecodable layers, bad keyframe
// data, empty frame ranges and aborted frame loops are all handled locally. Every such fallback is logged and
// appended here so callers can tell a degraded render from a fully successful one.

#ifndef AE_RENDER_DIAGNOSTICS_H
#define AE_RENDER_DIAGNOSTICS_H

#include <cstddef>
#include <string>
#include <vector>

namespace aerender {

enum class DiagnosticKind {
    MalformedDescription,   // Description could not be parsed, placeholder output
    LayerDecodeFailure,     // Layer raster or custom mask unusable, layer dropped
    InvalidKeyframeTrack,   // Track entries discarded, property may use its default
    EmptyFrameRange,        // Range produced no frames, placeholder output
    RenderFailure           // Frame loop aborted (allocation or state callback), placeholder output
};

const char* diagnosticKindName(DiagnosticKind kind);

struct DiagnosticRecord {
    DiagnosticKind kind;
    std::string layerId;    // Empty when not layer-specific
    std::string property;   // Keyframe property name (InvalidKeyframeTrack only)
    size_t count = 0;       // Discarded entries (InvalidKeyframeTrack only)
    std::string message;
};

class RenderDiagnostics {
public:
    RenderDiagnostics() = default;

    // Log and record. Warnings go to std::cerr when verbose.
    void report(DiagnosticRecord record);

    void reportMalformedDescription(const std::string& message);
    void reportLayerDecodeFailure(const std::string& layerId, const std::string& message);
    void reportInvalidKeyframeTrack(const std::string& layerId, const std::string& property,
                                    size_t discarded, const std::string& message);
    void reportEmptyFrameRange(int startFrame, int endFrame);
    void reportRenderFailure(int frameIndex, const std::string& message);

    // Append another collector's records (no logging)
    void merge(const RenderDiagnostics& other);

    const std::vector<DiagnosticRecord>& records() const { return records_; }
    size_t count(DiagnosticKind kind) const;
    bool has(DiagnosticKind kind) const { return count(kind) > 0; }

    // True when any fallback path was taken
    bool isDegraded() const { return !records_.empty(); }

    void clear() { records_.clear(); }

    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool isVerbose() const { return verbose_; }

    // Log tag, e.g. "[AERender]"
    void setTag(const std::string& tag) { tag_ = tag; }

private:
    std::vector<DiagnosticRecord> records_;
    std::string tag_ = "[AERender]";
    bool verbose_ = true;
};

} // namespace aerender

#endif // AE_RENDER_DIAGNOSTICS_H
