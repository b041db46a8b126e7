// AnimationTypes.cpp - Data model helpers

#include "AnimationTypes.h"

#include <algorithm>

namespace aerender {

// === ProjectConfig ===

double ProjectConfig::effectiveDuration() const {
    if (duration > 0.0) return duration;
    return static_cast<double>(totalFrames) / static_cast<double>(std::max(fps, 1));
}

bool ProjectConfig::isValid() const {
    return width >= 1 && height >= 1 && fps >= 1 && totalFrames >= 1;
}

// === RasterBuffer ===

bool RasterBuffer::isValid() const {
    if (width <= 0 || height <= 0) return false;
    if (channels != 1 && channels != 3 && channels != 4) return false;
    return pixels.size() == static_cast<size_t>(width) * height * channels;
}

RasterBuffer RasterBuffer::make(int width, int height, int channels) {
    RasterBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.channels = channels;
    if (width > 0 && height > 0 && channels > 0) {
        buffer.pixels.assign(static_cast<size_t>(width) * height * channels, 0);
    }
    return buffer;
}

// === Property names ===

const char* propertyName(LayerProperty property) {
    switch (property) {
        case LayerProperty::X: return "x";
        case LayerProperty::Y: return "y";
        case LayerProperty::Scale: return "scale";
        case LayerProperty::ScaleX: return "scale_x";
        case LayerProperty::ScaleY: return "scale_y";
        case LayerProperty::Rotation: return "rotation";
        case LayerProperty::Opacity: return "opacity";
        case LayerProperty::FlipH: return "flip_h";
        case LayerProperty::FlipV: return "flip_v";
    }
    return "";
}

const std::vector<LayerProperty>& allLayerProperties() {
    static const std::vector<LayerProperty> properties = {
        LayerProperty::X,       LayerProperty::Y,        LayerProperty::Scale,
        LayerProperty::ScaleX,  LayerProperty::ScaleY,   LayerProperty::Rotation,
        LayerProperty::Opacity, LayerProperty::FlipH,    LayerProperty::FlipV,
    };
    return properties;
}

std::optional<LayerProperty> parseLayerProperty(const std::string& name) {
    for (LayerProperty property : allLayerProperties()) {
        if (name == propertyName(property)) return property;
    }
    return std::nullopt;
}

const char* layerKindName(LayerKind kind) {
    return kind == LayerKind::Background ? "background" : "foreground";
}

const char* backgroundModeName(BackgroundMode mode) {
    switch (mode) {
        case BackgroundMode::Fit: return "fit";
        case BackgroundMode::Fill: return "fill";
        case BackgroundMode::Stretch: return "stretch";
    }
    return "fit";
}

BackgroundMode parseBackgroundMode(const std::string& name) {
    if (name == "fit") return BackgroundMode::Fit;
    if (name == "fill") return BackgroundMode::Fill;
    return BackgroundMode::Stretch;
}

// === LayerProperties ===

double LayerProperties::get(LayerProperty property) const {
    switch (property) {
        case LayerProperty::X: return x;
        case LayerProperty::Y: return y;
        case LayerProperty::Scale: return scale;
        case LayerProperty::ScaleX: return scaleX;
        case LayerProperty::ScaleY: return scaleY;
        case LayerProperty::Rotation: return rotation;
        case LayerProperty::Opacity: return opacity;
        case LayerProperty::FlipH: return flipH;
        case LayerProperty::FlipV: return flipV;
    }
    return 0.0;
}

void LayerProperties::set(LayerProperty property, double value) {
    switch (property) {
        case LayerProperty::X: x = value; break;
        case LayerProperty::Y: y = value; break;
        case LayerProperty::Scale: scale = value; break;
        case LayerProperty::ScaleX: scaleX = value; break;
        case LayerProperty::ScaleY: scaleY = value; break;
        case LayerProperty::Rotation: rotation = value; break;
        case LayerProperty::Opacity: opacity = value; break;
        case LayerProperty::FlipH: flipH = value; break;
        case LayerProperty::FlipV: flipV = value; break;
    }
}

// === Layer ===

const KeyframeTrack* Layer::track(LayerProperty property) const {
    auto it = keyframes.find(propertyName(property));
    if (it == keyframes.end()) return nullptr;
    return &it->second;
}

// === FloatImage ===

FloatImage FloatImage::zeros(int width, int height, int channels) {
    FloatImage image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.data.assign(static_cast<size_t>(width) * height * channels, 0.0f);
    return image;
}

} // namespace aerender
