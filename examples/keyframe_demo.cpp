// keyframe_demo.cpp - Builds a two-layer animation in code and renders it to PNG files
//
// Background: sky gradient stretched to the canvas.
// Foreground: an orange disc sliding left to right while spinning and fading in.

#include "../shared/AnimationTypes.h"
#include "../shared/FrameRenderer.h"
#include "../shared/frame_export.h"

#include "include/core/SkBitmap.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPixmap.h"
#include "include/core/SkPoint.h"
#include "include/core/SkRect.h"
#include "include/core/SkShader.h"
#include "include/core/SkTileMode.h"
#include "include/effects/SkGradientShader.h"

#include <functional>
#include <iostream>

using namespace aerender;

// Draw with Skia into a premultiplied bitmap, then read back as straight RGBA
static RasterBuffer drawRaster(int width, int height, const std::function<void(SkCanvas&)>& draw) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kPremul_SkAlphaType));
    bitmap.eraseColor(SK_ColorTRANSPARENT);
    {
        SkCanvas canvas(bitmap);
        draw(canvas);
    }

    RasterBuffer buffer = RasterBuffer::make(width, height, 4);
    SkImageInfo straight = SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kUnpremul_SkAlphaType);
    if (!bitmap.readPixels(SkPixmap(straight, buffer.pixels.data(), straight.minRowBytes()), 0, 0)) {
        return RasterBuffer();
    }
    return buffer;
}

int main() {
    Animation animation;
    animation.project.width = 320;
    animation.project.height = 180;
    animation.project.fps = 12;
    animation.project.totalFrames = 24;
    animation.project.maskFeather = 2;

    // Background layer
    Layer background;
    background.id = "background";
    background.name = "Sky";
    background.kind = LayerKind::Background;
    background.bgMode = BackgroundMode::Stretch;
    background.image = drawRaster(64, 64, [](SkCanvas& canvas) {
        const SkPoint points[2] = {SkPoint::Make(0, 0), SkPoint::Make(0, 64)};
        const SkColor colors[2] = {SkColorSetRGB(70, 130, 180), SkColorSetRGB(176, 224, 230)};
        SkPaint paint;
        paint.setShader(SkGradientShader::MakeLinear(points, colors, nullptr, 2, SkTileMode::kClamp));
        canvas.drawRect(SkRect::MakeWH(64, 64), paint);
    });

    // Foreground layer
    Layer disc;
    disc.id = "disc";
    disc.name = "Disc";
    disc.kind = LayerKind::Foreground;
    disc.image = drawRaster(60, 60, [](SkCanvas& canvas) {
        SkPaint paint;
        paint.setAntiAlias(true);
        paint.setColor(SkColorSetRGB(255, 140, 0));  // Dark orange
        canvas.drawCircle(30, 30, 28, paint);
        paint.setColor(SkColorSetRGB(25, 25, 112));  // Midnight blue notch shows the rotation
        canvas.drawRect(SkRect::MakeXYWH(26, 4, 8, 20), paint);
    });
    disc.keyframes[propertyName(LayerProperty::X)] = KeyframeTrack({{0.0, -110.0}, {2.0, 110.0}});
    disc.keyframes[propertyName(LayerProperty::Rotation)] = KeyframeTrack({{0.0, 0.0}, {2.0, 360.0}});
    disc.keyframes[propertyName(LayerProperty::Opacity)] = KeyframeTrack({{0.0, 0.2}, {0.5, 1.0}});
    disc.keyframes[propertyName(LayerProperty::Scale)] = KeyframeTrack({{0.0, 0.8}, {1.0, 1.3}, {2.0, 0.8}});

    if (background.image.pixels.empty() || disc.image.pixels.empty()) {
        std::cerr << "Failed to draw layer rasters" << std::endl;
        return 1;
    }

    // List order is z-order: background first
    animation.layers.push_back(std::move(background));
    animation.layers.push_back(std::move(disc));

    FrameRenderer renderer;
    renderer.setStateCallback([](RenderState state, int frameIndex) {
        if (state == RenderState::Emitting) {
            std::cout << "  frame " << frameIndex << " done" << std::endl;
        }
    });

    RenderRequest request;
    request.workerThreads = 4;
    RenderResult result = renderer.render(animation, request);

    for (size_t i = 0; i < result.frameCount(); ++i) {
        int frameIndex = result.frameIndices[i];
        if (!saveImagePNG(result.frames[i], exportFilename("demo_frame", frameIndex)) ||
            !saveImagePNG(result.masks[i], exportFilename("demo_mask", frameIndex))) {
            return 1;
        }
    }

    std::cout << "Wrote " << result.frameCount() << " frames (" << renderStateName(result.finalState) << ")"
              << std::endl;
    return 0;
}
