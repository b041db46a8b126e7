// LayerTransformResolver.h - Resolves a layer's transform at one time instant
// Each property comes from the layer's keyframe track when present, otherwise from
// the layer's static value.

#ifndef AE_LAYER_TRANSFORM_RESOLVER_H
#define AE_LAYER_TRANSFORM_RESOLVER_H

#include "AnimationTypes.h"

namespace aerender {

struct ResolvedTransform {
    double x = 0.0;
    double y = 0.0;
    double scale = 1.0;
    double scaleX = 1.0;
    double scaleY = 1.0;
    double rotation = 0.0;  // Degrees
    double opacity = 1.0;   // Clamped to [0, 1]
    bool flipH = false;
    bool flipV = false;

    // Uniform and per-axis scales compose multiplicatively
    double effectiveScaleX() const { return scale * scaleX; }
    double effectiveScaleY() const { return scale * scaleY; }
};

class LayerTransformResolver {
public:
    // Resolve every property of layer at time (seconds)
    static ResolvedTransform resolve(const Layer& layer, double time);

    // Resolve a single property: track value if a non-empty track exists, else static value
    static double resolveProperty(const Layer& layer, LayerProperty property, double time);
};

} // namespace aerender

#endif // AE_LAYER_TRANSFORM_RESOLVER_H
