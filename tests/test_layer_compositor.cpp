// test_layer_compositor.cpp - Unit tests for layer placement and over-operator blending

#include "test_framework.h"

#include "../shared/LayerCompositor.h"
#include "../shared/RasterOps.h"

#include <cstdint>

using namespace aerender;

// =============================================================================
// Helpers
// =============================================================================

static Layer solidLayer(const char* id, LayerKind kind, int width, int height, uint8_t r, uint8_t g, uint8_t b,
                        uint8_t a = 255) {
    Layer layer;
    layer.id = id;
    layer.kind = kind;
    layer.image = RasterBuffer::make(width, height, 4);
    for (size_t i = 0; i < layer.image.pixels.size(); i += 4) {
        layer.image.pixels[i + 0] = r;
        layer.image.pixels[i + 1] = g;
        layer.image.pixels[i + 2] = b;
        layer.image.pixels[i + 3] = a;
    }
    return layer;
}

static PreparedLayer prepare(const Layer& layer) {
    PreparedLayer prepared;
    prepared.layer = &layer;
    prepared.raster = RasterOps::makeLayerBitmap(layer.image);
    return prepared;
}

static const uint8_t* colorAt(const FrameCanvas& canvas, int x, int y) {
    return static_cast<const uint8_t*>(canvas.color.getAddr(x, y));
}

static uint8_t maskAt(const FrameCanvas& canvas, int x, int y) {
    return *canvas.mask.getAddr8(x, y);
}

static int maskCoverage(const FrameCanvas& canvas) {
    int count = 0;
    for (int y = 0; y < canvas.height(); y++) {
        for (int x = 0; x < canvas.width(); x++) {
            if (maskAt(canvas, x, y) != 0) count++;
        }
    }
    return count;
}

// =============================================================================
// Canvas
// =============================================================================

TEST(fresh_canvas_is_transparent_black) {
    FrameCanvas canvas = FrameCanvas::make(16, 9);
    ASSERT_TRUE(canvas.isValid());
    ASSERT_EQ(canvas.width(), 16);
    ASSERT_EQ(canvas.height(), 9);
    const uint8_t* px = colorAt(canvas, 15, 8);
    ASSERT_EQ(px[0], 0);
    ASSERT_EQ(px[3], 0);
    ASSERT_EQ(maskCoverage(canvas), 0);
}

TEST(invalid_canvas_size) {
    ASSERT_FALSE(FrameCanvas::make(0, 10).isValid());
    ASSERT_FALSE(FrameCanvas::make(10, -1).isValid());
}

// =============================================================================
// Placement
// =============================================================================

TEST(paste_origin_centers_layer) {
    SkIPoint origin = LayerCompositor::pasteOrigin({100, 100}, {20, 10}, 0.0, 0.0);
    ASSERT_EQ(origin.x(), 40);
    ASSERT_EQ(origin.y(), 45);

    origin = LayerCompositor::pasteOrigin({100, 100}, {20, 10}, 10.0, -5.0);
    ASSERT_EQ(origin.x(), 50);
    ASSERT_EQ(origin.y(), 40);
}

TEST(paste_origin_floors_fractions) {
    SkIPoint origin = LayerCompositor::pasteOrigin({101, 100}, {20, 21}, 0.0, 0.0);
    ASSERT_EQ(origin.x(), 40);   // floor(50.5 - 10)
    ASSERT_EQ(origin.y(), 39);   // floor(50 - 10.5)

    origin = LayerCompositor::pasteOrigin({100, 100}, {20, 20}, -0.25, 0.75);
    ASSERT_EQ(origin.x(), 39);
    ASSERT_EQ(origin.y(), 40);
}

TEST(paste_origin_far_offsets_stay_representable) {
    SkIPoint origin = LayerCompositor::pasteOrigin({100, 100}, {20, 20}, 1e300, -1e300);
    ASSERT_EQ(origin.x(), 1 << 24);
    ASSERT_EQ(origin.y(), -(1 << 24));
}

TEST(overlap_clips_to_canvas) {
    SkIRect inside = LayerCompositor::overlap({100, 50}, {10, 10}, {5, 5});
    ASSERT_TRUE(inside == SkIRect::MakeXYWH(5, 5, 10, 10));

    SkIRect partial = LayerCompositor::overlap({100, 50}, {10, 10}, {-4, 45});
    ASSERT_TRUE(partial == SkIRect::MakeLTRB(0, 45, 6, 50));

    ASSERT_TRUE(LayerCompositor::overlap({100, 50}, {10, 10}, {100, 0}).isEmpty());
    ASSERT_TRUE(LayerCompositor::overlap({100, 50}, {10, 10}, {-10, 0}).isEmpty());
}

// =============================================================================
// Blending
// =============================================================================

TEST(opaque_foreground_covers_its_area) {
    Layer layer = solidLayer("red", LayerKind::Foreground, 20, 20, 255, 0, 0);
    PreparedLayer prepared = prepare(layer);
    FrameCanvas canvas = FrameCanvas::make(100, 100);

    ASSERT_TRUE(LayerCompositor::composite(prepared, 0.0, canvas));
    const uint8_t* center = colorAt(canvas, 50, 50);
    ASSERT_EQ(center[0], 255);
    ASSERT_EQ(center[1], 0);
    ASSERT_EQ(center[3], 255);
    ASSERT_EQ(maskAt(canvas, 50, 50), 255);
    ASSERT_EQ(maskAt(canvas, 10, 10), 0);
    ASSERT_EQ(maskCoverage(canvas), 400);
}

TEST(later_layer_overdraws_earlier_layer) {
    Layer red = solidLayer("red", LayerKind::Foreground, 20, 20, 255, 0, 0);
    Layer blue = solidLayer("blue", LayerKind::Foreground, 20, 20, 0, 0, 255);
    FrameCanvas canvas = FrameCanvas::make(60, 60);

    LayerCompositor::composite(prepare(red), 0.0, canvas);
    LayerCompositor::composite(prepare(blue), 0.0, canvas);

    const uint8_t* px = colorAt(canvas, 30, 30);
    ASSERT_EQ(px[0], 0);
    ASSERT_EQ(px[2], 255);
    ASSERT_EQ(px[3], 255);
}

TEST(half_opacity_mixes_with_canvas) {
    Layer white = solidLayer("white", LayerKind::Background, 10, 10, 255, 255, 255);
    white.bgMode = BackgroundMode::Stretch;
    Layer black = solidLayer("black", LayerKind::Foreground, 10, 10, 0, 0, 0);
    black.defaults.opacity = 0.5;
    FrameCanvas canvas = FrameCanvas::make(10, 10);

    LayerCompositor::composite(prepare(white), 0.0, canvas);
    LayerCompositor::composite(prepare(black), 0.0, canvas);

    const uint8_t* px = colorAt(canvas, 5, 5);
    ASSERT_EQ(px[0], 127);      // 255 * 0.5, truncated
    ASSERT_EQ(px[3], 255);
    ASSERT_EQ(maskAt(canvas, 5, 5), 127);
}

TEST(zero_opacity_leaves_canvas_unchanged) {
    Layer base = solidLayer("base", LayerKind::Foreground, 8, 8, 10, 20, 30);
    Layer ghost = solidLayer("ghost", LayerKind::Foreground, 8, 8, 200, 200, 200);
    ghost.defaults.opacity = 0.0;
    FrameCanvas canvas = FrameCanvas::make(8, 8);

    LayerCompositor::composite(prepare(base), 0.0, canvas);
    std::vector<uint8_t> before(colorAt(canvas, 0, 0), colorAt(canvas, 0, 0) + 8 * 8 * 4);
    LayerCompositor::composite(prepare(ghost), 0.0, canvas);

    const uint8_t* after = colorAt(canvas, 0, 0);
    for (size_t i = 0; i < before.size(); i++) {
        ASSERT_EQ(after[i], before[i]);
    }
    ASSERT_EQ(maskAt(canvas, 4, 4), 255);
}

TEST(background_does_not_write_mask) {
    Layer bg = solidLayer("bg", LayerKind::Background, 4, 4, 0, 128, 0);
    bg.bgMode = BackgroundMode::Stretch;
    FrameCanvas canvas = FrameCanvas::make(32, 16);

    ASSERT_TRUE(LayerCompositor::composite(prepare(bg), 0.0, canvas));
    ASSERT_EQ(colorAt(canvas, 0, 0)[1], 128);
    ASSERT_EQ(colorAt(canvas, 31, 15)[1], 128);
    ASSERT_EQ(maskCoverage(canvas), 0);
}

TEST(background_fit_leaves_letterbox) {
    Layer bg = solidLayer("bg", LayerKind::Background, 200, 100, 255, 255, 255);
    bg.bgMode = BackgroundMode::Fit;
    FrameCanvas canvas = FrameCanvas::make(100, 100);
    LayerCompositor::composite(prepare(bg), 0.0, canvas);

    // 100x50 band centered vertically
    ASSERT_EQ(colorAt(canvas, 50, 10)[3], 0);
    ASSERT_EQ(colorAt(canvas, 50, 50)[3], 255);
    ASSERT_EQ(colorAt(canvas, 50, 90)[3], 0);
}

TEST(background_fill_covers_canvas) {
    Layer bg = solidLayer("bg", LayerKind::Background, 200, 100, 255, 255, 255);
    bg.bgMode = BackgroundMode::Fill;
    FrameCanvas canvas = FrameCanvas::make(100, 100);
    LayerCompositor::composite(prepare(bg), 0.0, canvas);

    ASSERT_EQ(colorAt(canvas, 0, 0)[3], 255);
    ASSERT_EQ(colorAt(canvas, 99, 99)[3], 255);
}

TEST(mask_is_union_of_foreground_coverage) {
    Layer left = solidLayer("left", LayerKind::Foreground, 10, 10, 255, 0, 0);
    left.defaults.x = -20.0;
    Layer right = solidLayer("right", LayerKind::Foreground, 10, 10, 0, 255, 0);
    right.defaults.x = 20.0;
    FrameCanvas canvas = FrameCanvas::make(80, 40);

    LayerCompositor::composite(prepare(left), 0.0, canvas);
    int leftOnly = maskCoverage(canvas);
    LayerCompositor::composite(prepare(right), 0.0, canvas);

    ASSERT_EQ(leftOnly, 100);
    ASSERT_EQ(maskCoverage(canvas), 200);
}

TEST(mask_takes_maximum_coverage) {
    Layer solid = solidLayer("solid", LayerKind::Foreground, 10, 10, 255, 255, 255);
    Layer faint = solidLayer("faint", LayerKind::Foreground, 10, 10, 255, 255, 255, 64);
    FrameCanvas canvas = FrameCanvas::make(10, 10);

    LayerCompositor::composite(prepare(solid), 0.0, canvas);
    LayerCompositor::composite(prepare(faint), 0.0, canvas);
    ASSERT_EQ(maskAt(canvas, 5, 5), 255);
}

TEST(off_canvas_layer_is_skipped) {
    Layer layer = solidLayer("far", LayerKind::Foreground, 10, 10, 255, 0, 0);
    layer.defaults.x = 500.0;
    FrameCanvas canvas = FrameCanvas::make(50, 50);

    ASSERT_FALSE(LayerCompositor::composite(prepare(layer), 0.0, canvas));
    ASSERT_EQ(maskCoverage(canvas), 0);
}

TEST(partially_visible_layer_is_clipped) {
    Layer layer = solidLayer("edge", LayerKind::Foreground, 10, 10, 255, 0, 0);
    layer.defaults.x = 25.0;   // Origin x = 25 + 25 - 5 = 45
    FrameCanvas canvas = FrameCanvas::make(50, 50);

    ASSERT_TRUE(LayerCompositor::composite(prepare(layer), 0.0, canvas));
    ASSERT_EQ(maskCoverage(canvas), 50);
    ASSERT_EQ(maskAt(canvas, 49, 25), 255);
}

TEST(keyframed_position_follows_time) {
    Layer layer = solidLayer("mover", LayerKind::Foreground, 4, 4, 255, 255, 255);
    layer.keyframes["x"] = KeyframeTrack({{0.0, -20.0}, {1.0, 20.0}});
    PreparedLayer prepared = prepare(layer);

    FrameCanvas start = FrameCanvas::make(60, 20);
    LayerCompositor::composite(prepared, 0.0, start);
    ASSERT_EQ(maskAt(start, 9, 10), 255);    // Origin 30 - 20 - 2 = 8
    ASSERT_EQ(maskAt(start, 50, 10), 0);

    FrameCanvas end = FrameCanvas::make(60, 20);
    LayerCompositor::composite(prepared, 1.0, end);
    ASSERT_EQ(maskAt(end, 9, 10), 0);
    ASSERT_EQ(maskAt(end, 49, 10), 255);     // Origin 30 + 20 - 2 = 48
}

TEST(scale_resizes_foreground) {
    Layer layer = solidLayer("grow", LayerKind::Foreground, 10, 10, 255, 255, 255);
    layer.defaults.scale = 2.0;
    layer.defaults.scaleX = 1.5;
    PreparedLayer prepared = prepare(layer);

    SkBitmap transformed =
        LayerCompositor::transformRaster(prepared, LayerTransformResolver::resolve(layer, 0.0), {100, 100});
    ASSERT_EQ(transformed.width(), 30);
    ASSERT_EQ(transformed.height(), 20);
    // Shared raster untouched
    ASSERT_EQ(prepared.raster.width(), 10);
}

int main() {
    return runAllTests("AE Render LayerCompositor - Unit Tests");
}
