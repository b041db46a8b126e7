// RasterOps.h - Skia-backed raster primitives for the layer compositor
//
// Layer rasters are RGBA8888 premultiplied SkBitmaps; masks are kAlpha_8 SkBitmaps.
// Every operation returns a new bitmap and leaves its source untouched, so decoded
// layer rasters can be shared read-only between frames rendered concurrently.
// Failed operations return an empty bitmap (drawsNothing() == true) or false.

#ifndef AE_RASTER_OPS_H
#define AE_RASTER_OPS_H

#include "AnimationTypes.h"

#include "include/core/SkBitmap.h"
#include "include/core/SkPixmap.h"
#include "include/core/SkSize.h"

namespace aerender {

class RasterOps {
public:
    // Rotations at or below this magnitude (degrees) are skipped
    static constexpr double kMinRotationDegrees = 0.1;

    // === Conversion ===

    // RGBA8888 premultiplied bitmap from a 1, 3 or 4 channel buffer.
    // Gray and RGB inputs become fully opaque.
    static SkBitmap makeLayerBitmap(const RasterBuffer& buffer);

    // kAlpha_8 bitmap from a mask buffer. 3/4 channel buffers are reduced to BT.601 luma.
    static SkBitmap makeMaskBitmap(const RasterBuffer& buffer);

    // Zero-filled mask of the given size
    static SkBitmap makeEmptyMask(int width, int height);

    // === Layer operations ===

    // Multiply the layer's alpha by mask/255. The mask is bilinearly resized to the
    // layer's size first when dimensions differ.
    static SkBitmap applyCustomMask(const SkBitmap& layer, const SkBitmap& mask);

    // Target size of a transformed layer. Backgrounds use fit/fill/stretch against the
    // canvas; foregrounds scale their own size and keep it when the effective scale is 1.
    // Each dimension is truncated and floored to at least 1 pixel.
    static SkISize computeTargetSize(LayerKind kind, BackgroundMode mode, SkISize canvas,
                                     SkISize original, double scaleX, double scaleY);

    // Bilinear resize (works for RGBA and kAlpha_8)
    static SkBitmap resizeBilinear(const SkBitmap& src, SkISize size);

    // Mirror horizontally and/or vertically
    static SkBitmap flip(const SkBitmap& src, bool horizontal, bool vertical);

    // Rotate around the center of pixel (w/2, h/2) by degrees, positive is counter-clockwise on screen.
    // Canvas size is unchanged and uncovered pixels are fully transparent.
    static SkBitmap rotate(const SkBitmap& src, double degrees);

    // === Mask post-processing ===

    // Grow (dilate) coverage by iterations applications of a 3x3 square element
    static SkBitmap dilateMask(const SkBitmap& mask, int iterations);

    // Shrink (erode) coverage by iterations applications of a 3x3 square element
    static SkBitmap erodeMask(const SkBitmap& mask, int iterations);

    // Signed expansion: >0 dilates, <0 erodes, 0 copies
    static SkBitmap expandMask(const SkBitmap& mask, int expansion);

    // Gaussian feather with kernel size max(3, 2*feather+1)
    static SkBitmap featherMask(const SkBitmap& mask, int feather);

    // Gaussian sigma matching a kernel size (OpenCV convention for sigma = 0)
    static double sigmaForKernelSize(int kernelSize);

    // === Output ===

    // RGB channels of an RGBA8888 canvas as floats in [0, 1]
    static FloatImage toNormalizedRGB(const SkBitmap& canvas);

    // kAlpha_8 mask as floats in [0, 1]
    static FloatImage toNormalizedMask(const SkBitmap& mask);
};

} // namespace aerender

#endif // AE_RASTER_OPS_H
