// LayerCompositor.cpp - Per-layer transform and painter's-algorithm blending

#include "LayerCompositor.h"
#include "RasterOps.h"

#include "include/core/SkColor.h"
#include "include/core/SkImageInfo.h"

#include <algorithm>
#include <cmath>

namespace aerender {

namespace {

inline uint8_t toByte(float value) {
    if (value <= 0.0f) return 0;
    if (value >= 255.0f) return 255;
    return static_cast<uint8_t>(value);
}

} // namespace

FrameCanvas FrameCanvas::make(int width, int height) {
    FrameCanvas canvas;
    SkImageInfo colorInfo =
        SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    if (width <= 0 || height <= 0 || !canvas.color.tryAllocPixels(colorInfo)) {
        return FrameCanvas();
    }
    canvas.color.eraseColor(SK_ColorTRANSPARENT);
    canvas.mask = RasterOps::makeEmptyMask(width, height);
    return canvas;
}

SkIPoint LayerCompositor::pasteOrigin(SkISize canvasSize, SkISize layerSize, double x, double y) {
    double px = std::floor(canvasSize.width() / 2.0 + x - layerSize.width() / 2.0);
    double py = std::floor(canvasSize.height() / 2.0 + y - layerSize.height() / 2.0);
    // Keep far off-canvas offsets representable
    constexpr double kLimit = 1 << 24;
    px = std::clamp(px, -kLimit, kLimit);
    py = std::clamp(py, -kLimit, kLimit);
    return SkIPoint::Make(static_cast<int32_t>(px), static_cast<int32_t>(py));
}

SkIRect LayerCompositor::overlap(SkISize canvasSize, SkISize layerSize, SkIPoint origin) {
    SkIRect placed = SkIRect::MakeXYWH(origin.x(), origin.y(), layerSize.width(), layerSize.height());
    SkIRect bounds = SkIRect::MakeSize(canvasSize);
    if (!placed.intersect(bounds)) return SkIRect::MakeEmpty();
    return placed;
}

SkBitmap LayerCompositor::transformRaster(const PreparedLayer& prepared, const ResolvedTransform& transform,
                                          SkISize canvasSize) {
    const Layer& layer = *prepared.layer;
    SkBitmap current = prepared.raster;  // shared, read-only until replaced

    SkISize original = current.dimensions();
    SkISize target = RasterOps::computeTargetSize(layer.kind, layer.bgMode, canvasSize, original,
                                                  transform.effectiveScaleX(),
                                                  transform.effectiveScaleY());
    if (target != original) {
        current = RasterOps::resizeBilinear(current, target);
        if (current.drawsNothing()) return current;
    }

    if (transform.flipH || transform.flipV) {
        current = RasterOps::flip(current, transform.flipH, transform.flipV);
        if (current.drawsNothing()) return current;
    }

    if (std::fabs(transform.rotation) > RasterOps::kMinRotationDegrees) {
        current = RasterOps::rotate(current, transform.rotation);
    }
    return current;
}

void LayerCompositor::blend(const SkBitmap& raster, SkIPoint origin, double opacity, bool writeMask,
                            FrameCanvas& canvas) {
    SkIRect area = overlap(canvas.color.dimensions(), raster.dimensions(), origin);
    if (area.isEmpty()) return;

    const auto op = static_cast<float>(opacity);
    for (int y = area.top(); y < area.bottom(); y++) {
        const auto* src = static_cast<const uint8_t*>(raster.getAddr(area.left() - origin.x(), y - origin.y()));
        auto* dst = static_cast<uint8_t*>(canvas.color.getAddr(area.left(), y));
        uint8_t* mask = writeMask ? canvas.mask.getAddr8(area.left(), y) : nullptr;

        for (int x = 0; x < area.width(); x++, src += 4, dst += 4) {
            const float srcAlpha = static_cast<float>(src[3]);
            const float alpha = srcAlpha / 255.0f * op;

            if (mask) {
                mask[x] = std::max(mask[x], toByte(srcAlpha * op));
            }

            // Source is premultiplied: straight color * alpha == premul color * opacity
            const float keep = 1.0f - alpha;
            for (int c = 0; c < 3; c++) {
                dst[c] = toByte(static_cast<float>(dst[c]) * keep + static_cast<float>(src[c]) * op);
            }
            dst[3] = std::max(dst[3], toByte(alpha * 255.0f));
        }
    }
}

bool LayerCompositor::composite(const PreparedLayer& prepared, const ResolvedTransform& transform,
                                FrameCanvas& canvas) {
    if (!prepared.layer || prepared.raster.drawsNothing() || !canvas.isValid()) return false;

    SkISize canvasSize = canvas.color.dimensions();
    SkBitmap raster = transformRaster(prepared, transform, canvasSize);
    if (raster.drawsNothing()) return false;

    SkIPoint origin = pasteOrigin(canvasSize, raster.dimensions(), transform.x, transform.y);
    if (overlap(canvasSize, raster.dimensions(), origin).isEmpty()) return false;

    blend(raster, origin, transform.opacity, prepared.layer->isForeground(), canvas);
    return true;
}

bool LayerCompositor::composite(const PreparedLayer& prepared, double time, FrameCanvas& canvas) {
    if (!prepared.layer) return false;
    return composite(prepared, LayerTransformResolver::resolve(*prepared.layer, time), canvas);
}

} // namespace aerender
