// RasterOps.cpp - Skia-backed raster primitives
// See RasterOps.h for documentation

#include "RasterOps.h"

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkImage.h"
#include "include/core/SkImageFilter.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkTileMode.h"
#include "include/effects/SkImageFilters.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <utility>

namespace aerender {

namespace {

// Upper bound for any computed layer dimension
constexpr double kMaxDimension = 32767.0;

SkImageInfo layerInfo(int width, int height) {
    return SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kPremul_SkAlphaType);
}

SkImageInfo maskInfo(int width, int height) {
    return SkImageInfo::MakeA8(width, height);
}

uint8_t lumaBT601(uint8_t r, uint8_t g, uint8_t b) {
    // Fixed point 0.299 / 0.587 / 0.114, rounded
    return static_cast<uint8_t>((r * 19595 + g * 38470 + b * 7471 + 0x8000) >> 16);
}

int truncatedDimension(double value) {
    if (!std::isfinite(value)) return 1;
    value = std::min(value, kMaxDimension);
    int truncated = static_cast<int>(value);
    return std::max(1, truncated);
}

// Run a mask through an image filter. The mask is lifted into an RGBA working bitmap
// (black with the mask as alpha) so the filter sees a regular color source, and the
// alpha channel of the result is read back into a kAlpha_8 bitmap.
SkBitmap filterMask(const SkBitmap& mask, sk_sp<SkImageFilter> filter) {
    if (mask.drawsNothing() || !filter) return SkBitmap();

    SkImageInfo workInfo = layerInfo(mask.width(), mask.height());

    SkBitmap source;
    if (!source.tryAllocPixels(workInfo)) return SkBitmap();
    if (!mask.readPixels(source.pixmap(), 0, 0)) return SkBitmap();
    source.setImmutable();

    SkBitmap work;
    if (!work.tryAllocPixels(workInfo)) return SkBitmap();
    work.eraseColor(SK_ColorTRANSPARENT);

    {
        SkCanvas canvas(work);
        SkPaint paint;
        paint.setImageFilter(std::move(filter));
        canvas.drawImage(source.asImage(), 0, 0, SkSamplingOptions(), &paint);
    }

    SkBitmap result;
    if (!result.tryAllocPixels(mask.info())) return SkBitmap();
    if (!work.readPixels(result.pixmap(), 0, 0)) return SkBitmap();
    return result;
}

} // namespace

// =============================================================================
// Conversion
// =============================================================================

SkBitmap RasterOps::makeLayerBitmap(const RasterBuffer& buffer) {
    if (!buffer.isValid()) return SkBitmap();

    // Expand to straight RGBA first, then let Skia premultiply
    SkBitmap straight;
    SkImageInfo straightInfo =
        SkImageInfo::Make(buffer.width, buffer.height, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    if (!straight.tryAllocPixels(straightInfo)) return SkBitmap();

    const uint8_t* src = buffer.pixels.data();
    for (int y = 0; y < buffer.height; y++) {
        auto* row = static_cast<uint8_t*>(straight.getAddr(0, y));
        for (int x = 0; x < buffer.width; x++) {
            uint8_t* px = row + x * 4;
            switch (buffer.channels) {
                case 1:
                    px[0] = px[1] = px[2] = src[0];
                    px[3] = 255;
                    break;
                case 3:
                    px[0] = src[0];
                    px[1] = src[1];
                    px[2] = src[2];
                    px[3] = 255;
                    break;
                default:
                    std::memcpy(px, src, 4);
                    break;
            }
            src += buffer.channels;
        }
    }

    SkBitmap premul;
    if (!premul.tryAllocPixels(layerInfo(buffer.width, buffer.height))) return SkBitmap();
    if (!straight.readPixels(premul.pixmap(), 0, 0)) return SkBitmap();
    premul.setImmutable();
    return premul;
}

SkBitmap RasterOps::makeMaskBitmap(const RasterBuffer& buffer) {
    if (!buffer.isValid()) return SkBitmap();

    SkBitmap mask;
    if (!mask.tryAllocPixels(maskInfo(buffer.width, buffer.height))) return SkBitmap();

    const uint8_t* src = buffer.pixels.data();
    for (int y = 0; y < buffer.height; y++) {
        uint8_t* row = mask.getAddr8(0, y);
        for (int x = 0; x < buffer.width; x++) {
            row[x] = buffer.channels == 1 ? src[0] : lumaBT601(src[0], src[1], src[2]);
            src += buffer.channels;
        }
    }
    mask.setImmutable();
    return mask;
}

SkBitmap RasterOps::makeEmptyMask(int width, int height) {
    SkBitmap mask;
    if (width <= 0 || height <= 0) return mask;
    if (!mask.tryAllocPixels(maskInfo(width, height))) return SkBitmap();
    mask.eraseColor(SK_ColorTRANSPARENT);
    return mask;
}

// =============================================================================
// Layer operations
// =============================================================================

SkBitmap RasterOps::applyCustomMask(const SkBitmap& layer, const SkBitmap& mask) {
    if (layer.drawsNothing() || mask.drawsNothing()) return SkBitmap();
    if (mask.colorType() != kAlpha_8_SkColorType) return SkBitmap();

    SkBitmap sized = mask;
    if (mask.width() != layer.width() || mask.height() != layer.height()) {
        sized = resizeBilinear(mask, SkISize::Make(layer.width(), layer.height()));
        if (sized.drawsNothing()) return SkBitmap();
    }

    SkBitmap result;
    if (!result.tryAllocPixels(layer.info())) return SkBitmap();

    // Premultiplied: scaling every channel equals scaling the straight alpha
    for (int y = 0; y < layer.height(); y++) {
        const auto* src = static_cast<const uint8_t*>(layer.getAddr(0, y));
        const uint8_t* m = sized.getAddr8(0, y);
        auto* dst = static_cast<uint8_t*>(result.getAddr(0, y));
        for (int x = 0; x < layer.width(); x++) {
            float factor = static_cast<float>(m[x]) / 255.0f;
            for (int c = 0; c < 4; c++) {
                dst[x * 4 + c] = static_cast<uint8_t>(static_cast<float>(src[x * 4 + c]) * factor);
            }
        }
    }
    result.setImmutable();
    return result;
}

SkISize RasterOps::computeTargetSize(LayerKind kind, BackgroundMode mode, SkISize canvas,
                                     SkISize original, double scaleX, double scaleY) {
    const double ow = original.width();
    const double oh = original.height();

    if (kind == LayerKind::Foreground) {
        if (scaleX == 1.0 && scaleY == 1.0) return original;
        return SkISize::Make(truncatedDimension(ow * scaleX), truncatedDimension(oh * scaleY));
    }

    const double cw = canvas.width();
    const double ch = canvas.height();
    switch (mode) {
        case BackgroundMode::Fit: {
            double s = std::min(cw / ow, ch / oh);
            return SkISize::Make(truncatedDimension(ow * s * scaleX), truncatedDimension(oh * s * scaleY));
        }
        case BackgroundMode::Fill: {
            double s = std::max(cw / ow, ch / oh);
            return SkISize::Make(truncatedDimension(ow * s * scaleX), truncatedDimension(oh * s * scaleY));
        }
        case BackgroundMode::Stretch:
            return SkISize::Make(truncatedDimension(cw * scaleX), truncatedDimension(ch * scaleY));
    }
    return original;
}

SkBitmap RasterOps::resizeBilinear(const SkBitmap& src, SkISize size) {
    if (src.drawsNothing() || size.isEmpty()) return SkBitmap();

    SkBitmap dst;
    if (!dst.tryAllocPixels(src.info().makeDimensions(size))) return SkBitmap();
    if (!src.pixmap().scalePixels(dst.pixmap(), SkSamplingOptions(SkFilterMode::kLinear))) {
        return SkBitmap();
    }
    return dst;
}

SkBitmap RasterOps::flip(const SkBitmap& src, bool horizontal, bool vertical) {
    if (src.drawsNothing()) return SkBitmap();

    SkBitmap dst;
    if (!dst.tryAllocPixels(src.info())) return SkBitmap();
    dst.eraseColor(SK_ColorTRANSPARENT);

    SkCanvas canvas(dst);
    canvas.translate(horizontal ? static_cast<SkScalar>(src.width()) : 0.0f,
                     vertical ? static_cast<SkScalar>(src.height()) : 0.0f);
    canvas.scale(horizontal ? -1.0f : 1.0f, vertical ? -1.0f : 1.0f);

    SkPaint paint;
    paint.setBlendMode(SkBlendMode::kSrc);
    canvas.drawImage(src.asImage(), 0, 0, SkSamplingOptions(SkFilterMode::kNearest), &paint);
    return dst;
}

SkBitmap RasterOps::rotate(const SkBitmap& src, double degrees) {
    if (src.drawsNothing()) return SkBitmap();

    SkBitmap dst;
    if (!dst.tryAllocPixels(src.info())) return SkBitmap();
    dst.eraseColor(SK_ColorTRANSPARENT);

    SkCanvas canvas(dst);
    // Pivot is the center of pixel (w/2, h/2). Skia rotates clockwise for positive
    // degrees in y-down space, so the angle is negated.
    const SkScalar cx = static_cast<SkScalar>(src.width() / 2) + 0.5f;
    const SkScalar cy = static_cast<SkScalar>(src.height() / 2) + 0.5f;
    canvas.rotate(static_cast<SkScalar>(-degrees), cx, cy);

    SkPaint paint;
    paint.setAntiAlias(false);
    canvas.drawImage(src.asImage(), 0, 0, SkSamplingOptions(SkFilterMode::kLinear), &paint);
    return dst;
}

// =============================================================================
// Mask post-processing
// =============================================================================

SkBitmap RasterOps::dilateMask(const SkBitmap& mask, int iterations) {
    if (iterations <= 0) return mask;
    // n passes of a 3x3 element equal one pass of a (2n+1) square element
    auto radius = static_cast<SkScalar>(iterations);
    return filterMask(mask, SkImageFilters::Dilate(radius, radius, nullptr));
}

SkBitmap RasterOps::erodeMask(const SkBitmap& mask, int iterations) {
    if (iterations <= 0) return mask;
    auto radius = static_cast<SkScalar>(iterations);
    return filterMask(mask, SkImageFilters::Erode(radius, radius, nullptr));
}

SkBitmap RasterOps::expandMask(const SkBitmap& mask, int expansion) {
    if (expansion > 0) return dilateMask(mask, expansion);
    if (expansion < 0) return erodeMask(mask, -expansion);
    return mask;
}

double RasterOps::sigmaForKernelSize(int kernelSize) {
    return 0.3 * ((kernelSize - 1) * 0.5 - 1.0) + 0.8;
}

SkBitmap RasterOps::featherMask(const SkBitmap& mask, int feather) {
    if (feather <= 0) return mask;
    int kernelSize = std::max(3, feather * 2 + 1);
    auto sigma = static_cast<SkScalar>(sigmaForKernelSize(kernelSize));
    return filterMask(mask, SkImageFilters::Blur(sigma, sigma, SkTileMode::kClamp, nullptr));
}

// =============================================================================
// Output
// =============================================================================

FloatImage RasterOps::toNormalizedRGB(const SkBitmap& canvas) {
    FloatImage image = FloatImage::zeros(canvas.width(), canvas.height(), 3);
    if (canvas.drawsNothing()) return image;

    float* out = image.data.data();
    for (int y = 0; y < canvas.height(); y++) {
        const auto* row = static_cast<const uint8_t*>(canvas.getAddr(0, y));
        for (int x = 0; x < canvas.width(); x++) {
            *out++ = row[x * 4 + 0] / 255.0f;
            *out++ = row[x * 4 + 1] / 255.0f;
            *out++ = row[x * 4 + 2] / 255.0f;
        }
    }
    return image;
}

FloatImage RasterOps::toNormalizedMask(const SkBitmap& mask) {
    FloatImage image = FloatImage::zeros(mask.width(), mask.height(), 1);
    if (mask.drawsNothing()) return image;

    float* out = image.data.data();
    for (int y = 0; y < mask.height(); y++) {
        const uint8_t* row = mask.getAddr8(0, y);
        for (int x = 0; x < mask.width(); x++) {
            *out++ = row[x] / 255.0f;
        }
    }
    return image;
}

} // namespace aerender
