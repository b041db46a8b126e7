// LayerCompositor.h - Transforms one layer at one time instant and blends it onto a frame
//
// Per layer per frame:
//   1. Resize (background fit/fill/stretch, or foreground scale), flip, rotate
//   2. Position: centered on the canvas center plus the (x, y) offset
//   3. Foreground layers add their coverage to the mask canvas (union by max)
//   4. Every layer is blended onto the color canvas with the over-operator
//
// Blending reads and writes the canvas left by all previously composited layers, so
// layers must be composited strictly in list order on a single thread per frame.

#ifndef AE_LAYER_COMPOSITOR_H
#define AE_LAYER_COMPOSITOR_H

#include "AnimationTypes.h"
#include "LayerTransformResolver.h"

#include "include/core/SkBitmap.h"
#include "include/core/SkPoint.h"
#include "include/core/SkRect.h"
#include "include/core/SkSize.h"

namespace aerender {

// Color canvas and coverage mask owned by one frame
struct FrameCanvas {
    SkBitmap color;     // RGBA8888 straight alpha, starts fully transparent black
    SkBitmap mask;      // kAlpha_8, starts at zero

    static FrameCanvas make(int width, int height);

    bool isValid() const { return !color.drawsNothing() && !mask.drawsNothing(); }
    int width() const { return color.width(); }
    int height() const { return color.height(); }
};

// A layer after decoding: the immutable premultiplied raster shared by all frames.
// The custom mask, when present, is already applied.
struct PreparedLayer {
    const Layer* layer = nullptr;
    SkBitmap raster;
};

class LayerCompositor {
public:
    // Composite layer at time onto canvas. Returns true if the layer touched the canvas.
    static bool composite(const PreparedLayer& prepared, double time, FrameCanvas& canvas);

    // Composite with an already resolved transform
    static bool composite(const PreparedLayer& prepared, const ResolvedTransform& transform,
                          FrameCanvas& canvas);

    // Resize, flip and rotate a private copy of the layer raster.
    // Returns an empty bitmap if an allocation fails.
    static SkBitmap transformRaster(const PreparedLayer& prepared, const ResolvedTransform& transform,
                                    SkISize canvasSize);

    // Top-left canvas position of a raster of layerSize centered at center + (x, y)
    static SkIPoint pasteOrigin(SkISize canvasSize, SkISize layerSize, double x, double y);

    // Canvas-space rectangle covered by a raster at origin, clipped to the canvas
    static SkIRect overlap(SkISize canvasSize, SkISize layerSize, SkIPoint origin);

    // Blend a premultiplied raster at origin. Mask coverage is written when writeMask.
    static void blend(const SkBitmap& raster, SkIPoint origin, double opacity, bool writeMask,
                      FrameCanvas& canvas);
};

} // namespace aerender

#endif // AE_LAYER_COMPOSITOR_H
