// AnimationLoader.h - Parses JSON animation descriptions into the Animation data model
//
// Description layout:
//   {
//     "project": { "width", "height", "fps", "total_frames", "duration",
//                  "mask_expansion", "mask_feather" },
//     "layers": [ { "id", "name", "type": "background"|"foreground", "image_data",
//                   "bg_mode", "customMask", "x", "y", "scale", ...,
//                   "keyframes": { "<property>": [ { "time", "value" }, ... ] } } ]
//   }
//
// Images and custom masks are data URLs decoded with ImageDecoder. Problems that affect
// a single layer or track are recorded as diagnostics and skipped; only a description
// that cannot be parsed at all (or has an unusable project block) fails the load.

#ifndef AE_ANIMATION_LOADER_H
#define AE_ANIMATION_LOADER_H

#include "AnimationTypes.h"
#include "render_diagnostics.h"

#include <optional>
#include <string>

namespace aerender {

class AnimationLoader {
public:
    // Largest accepted canvas dimension
    static constexpr int kMaxCanvasDimension = 32767;

    AnimationLoader();

    // Parse a description. Returns nullopt after recording MalformedDescription.
    std::optional<Animation> loadFromString(const std::string& description);

    // Read a file and parse it. An unreadable file is a MalformedDescription.
    std::optional<Animation> loadFromFile(const std::string& filepath);

    // Diagnostics recorded by all loads since the last clear
    const RenderDiagnostics& diagnostics() const { return diagnostics_; }
    void clearDiagnostics() { diagnostics_.clear(); }

    void setVerbose(bool verbose) { diagnostics_.setVerbose(verbose); }
    bool isVerbose() const { return diagnostics_.isVerbose(); }

private:
    RenderDiagnostics diagnostics_;
};

} // namespace aerender

#endif // AE_ANIMATION_LOADER_H
