// LayerTransformResolver.cpp - Per-layer property resolution

#include "LayerTransformResolver.h"

#include <algorithm>

namespace aerender {

namespace {

constexpr double kFlipThreshold = 0.5;

} // namespace

double LayerTransformResolver::resolveProperty(const Layer& layer, LayerProperty property, double time) {
    double fallback = layer.defaults.get(property);
    const KeyframeTrack* track = layer.track(property);
    if (!track) return fallback;
    return track->valueAt(time, fallback);
}

ResolvedTransform LayerTransformResolver::resolve(const Layer& layer, double time) {
    ResolvedTransform result;
    result.x = resolveProperty(layer, LayerProperty::X, time);
    result.y = resolveProperty(layer, LayerProperty::Y, time);
    result.scale = resolveProperty(layer, LayerProperty::Scale, time);
    result.scaleX = resolveProperty(layer, LayerProperty::ScaleX, time);
    result.scaleY = resolveProperty(layer, LayerProperty::ScaleY, time);
    result.rotation = resolveProperty(layer, LayerProperty::Rotation, time);
    result.opacity = std::clamp(resolveProperty(layer, LayerProperty::Opacity, time), 0.0, 1.0);
    result.flipH = resolveProperty(layer, LayerProperty::FlipH, time) > kFlipThreshold;
    result.flipV = resolveProperty(layer, LayerProperty::FlipV, time) > kFlipThreshold;
    return result;
}

} // namespace aerender
