// AnimationTypes.h - Data model for keyframed raster layer animations
// Platform-independent C++17 definitions shared by the loader, renderer and C API.
//
// An Animation is a ProjectConfig plus an ordered list of layers. List order is the
// compositing (z) order: earlier layers are drawn first and overdrawn by later ones.
// The renderer never reorders layers, including the background.

#ifndef AE_ANIMATION_TYPES_H
#define AE_ANIMATION_TYPES_H

#include "KeyframeTrack.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aerender {

// Project-wide settings, immutable for the duration of a render call
struct ProjectConfig {
    int width = 512;            // Canvas width in pixels
    int height = 512;           // Canvas height in pixels
    int fps = 30;               // Frames per second
    int totalFrames = 1;        // Number of frames in the animation
    double duration = 0.0;      // Seconds; <= 0 means derive from totalFrames / fps
    int maskExpansion = 0;      // >0 dilates, <0 erodes the coverage mask (pixels)
    int maskFeather = 0;        // Blur radius applied to the coverage mask

    // Explicit duration, or totalFrames / fps
    double effectiveDuration() const;

    // True when every dimension and rate is at least 1
    bool isValid() const;
};

// Raw raster as handed over by the host: width x height x channels bytes, row-major,
// channels interleaved. 1 = gray, 3 = RGB, 4 = RGBA (straight alpha).
struct RasterBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<uint8_t> pixels;

    // Dimensions positive, channel count supported and pixel count consistent
    bool isValid() const;

    static RasterBuffer make(int width, int height, int channels);
};

enum class LayerKind {
    Background,
    Foreground
};

// Background sizing relative to the canvas
enum class BackgroundMode {
    Fit,        // Preserve aspect ratio, whole image visible
    Fill,       // Preserve aspect ratio, canvas fully covered
    Stretch     // Ignore aspect ratio, exactly canvas size
};

// Closed set of animatable properties
enum class LayerProperty {
    X,
    Y,
    Scale,
    ScaleX,
    ScaleY,
    Rotation,
    Opacity,
    FlipH,
    FlipV
};

// Description key for a property ("x", "scale_x", "flip_h", ...)
const char* propertyName(LayerProperty property);

// Inverse of propertyName()
std::optional<LayerProperty> parseLayerProperty(const std::string& name);

// All properties in declaration order
const std::vector<LayerProperty>& allLayerProperties();

const char* layerKindName(LayerKind kind);
const char* backgroundModeName(BackgroundMode mode);

// "fit" / "fill"; anything else is Stretch
BackgroundMode parseBackgroundMode(const std::string& name);

// Static values used when a property has no keyframe track
struct LayerProperties {
    double x = 0.0;         // Offset from canvas center, pixels
    double y = 0.0;
    double scale = 1.0;     // Uniform multiplier
    double scaleX = 1.0;    // Per-axis multipliers, compose with scale
    double scaleY = 1.0;
    double rotation = 0.0;  // Degrees
    double opacity = 1.0;   // 0..1
    double flipH = 0.0;     // Flip when > 0.5
    double flipV = 0.0;

    double get(LayerProperty property) const;
    void set(LayerProperty property, double value);
};

struct Layer {
    std::string id;                             // Unique within an animation
    std::string name;                           // Display name, informational
    LayerKind kind = LayerKind::Foreground;
    RasterBuffer image;                         // Owned exclusively by the layer
    BackgroundMode bgMode = BackgroundMode::Fit;    // Background layers only
    std::optional<RasterBuffer> customMask;     // Foreground layers only, any size
    LayerProperties defaults;
    std::map<std::string, KeyframeTrack> keyframes; // Property name -> track

    bool isForeground() const { return kind == LayerKind::Foreground; }

    // Track for a property, or nullptr
    const KeyframeTrack* track(LayerProperty property) const;
};

struct Animation {
    ProjectConfig project;
    std::vector<Layer> layers;
};

// Normalized float image produced by the renderer, row-major, channels interleaved
struct FloatImage {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<float> data;

    static FloatImage zeros(int width, int height, int channels);

    float at(int x, int y, int channel = 0) const {
        return data[(static_cast<size_t>(y) * width + x) * channels + channel];
    }
};

} // namespace aerender

#endif // AE_ANIMATION_TYPES_H
