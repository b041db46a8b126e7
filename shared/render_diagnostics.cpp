// render_diagnostics.cpp - Diagnostic collection and logging

#include "render_diagnostics.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace aerender {

const char* diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::MalformedDescription: return "MalformedDescription";
        case DiagnosticKind::LayerDecodeFailure: return "LayerDecodeFailure";
        case DiagnosticKind::InvalidKeyframeTrack: return "InvalidKeyframeTrack";
        case DiagnosticKind::EmptyFrameRange: return "EmptyFrameRange";
        case DiagnosticKind::RenderFailure: return "RenderFailure";
    }
    return "Unknown";
}

void RenderDiagnostics::report(DiagnosticRecord record) {
    if (verbose_) {
        std::cerr << tag_ << " " << diagnosticKindName(record.kind);
        if (!record.layerId.empty()) {
            std::cerr << " (layer '" << record.layerId << "')";
        }
        std::cerr << ": " << record.message << std::endl;
    }
    records_.push_back(std::move(record));
}

void RenderDiagnostics::reportMalformedDescription(const std::string& message) {
    report({DiagnosticKind::MalformedDescription, "", "", 0, message});
}

void RenderDiagnostics::reportLayerDecodeFailure(const std::string& layerId, const std::string& message) {
    report({DiagnosticKind::LayerDecodeFailure, layerId, "", 0, message});
}

void RenderDiagnostics::reportInvalidKeyframeTrack(const std::string& layerId, const std::string& property,
                                                   size_t discarded, const std::string& message) {
    report({DiagnosticKind::InvalidKeyframeTrack, layerId, property, discarded, message});
}

void RenderDiagnostics::reportEmptyFrameRange(int startFrame, int endFrame) {
    report({DiagnosticKind::EmptyFrameRange, "", "", 0,
            "frame range [" + std::to_string(startFrame) + ", " + std::to_string(endFrame) +
                ") is empty, emitting placeholder"});
}

void RenderDiagnostics::reportRenderFailure(int frameIndex, const std::string& message) {
    std::string where = frameIndex >= 0 ? "frame " + std::to_string(frameIndex) + ": " : std::string();
    report({DiagnosticKind::RenderFailure, "", "", 0, where + message + ", emitting placeholder"});
}

void RenderDiagnostics::merge(const RenderDiagnostics& other) {
    records_.insert(records_.end(), other.records_.begin(), other.records_.end());
}

size_t RenderDiagnostics::count(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                             [kind](const DiagnosticRecord& r) { return r.kind == kind; }));
}

} // namespace aerender
