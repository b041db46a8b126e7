// frame_export.cpp - PNG encoding with SkPngEncoder

#include "frame_export.h"

#include "include/core/SkImageInfo.h"
#include "include/core/SkPixmap.h"
#include "include/core/SkStream.h"
#include "include/encode/SkPngEncoder.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace aerender {

std::vector<uint8_t> quantizeImage(const FloatImage& image) {
    std::vector<uint8_t> bytes(image.data.size());
    for (size_t i = 0; i < image.data.size(); ++i) {
        float v = std::clamp(image.data[i], 0.0f, 1.0f);
        bytes[i] = static_cast<uint8_t>(std::lround(v * 255.0f));
    }
    return bytes;
}

bool saveImagePNG(const FloatImage& image, const std::string& path) {
    // Integer overflow protection: validate dimensions before calculating buffer size
    if (image.width <= 0 || image.height <= 0 || image.width > MAX_EXPORT_DIM || image.height > MAX_EXPORT_DIM) {
        std::cerr << "Invalid export dimensions: " << image.width << "x" << image.height << std::endl;
        return false;
    }
    if (image.channels != 1 && image.channels != 3) {
        std::cerr << "Unsupported channel count for export: " << image.channels << std::endl;
        return false;
    }

    size_t pixelCount = static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
    if (image.data.size() < pixelCount * static_cast<size_t>(image.channels)) {
        std::cerr << "Image buffer too small: " << image.data.size() << std::endl;
        return false;
    }

    std::vector<uint8_t> quantized = quantizeImage(image);
    std::vector<uint8_t> pixels;
    SkImageInfo info;

    if (image.channels == 1) {
        info = SkImageInfo::Make(image.width, image.height, kGray_8_SkColorType, kOpaque_SkAlphaType);
        pixels = std::move(quantized);
    } else {
        // Expand RGB to opaque RGBA for the encoder
        info = SkImageInfo::Make(image.width, image.height, kRGBA_8888_SkColorType, kOpaque_SkAlphaType);
        pixels.resize(pixelCount * 4);
        for (size_t i = 0; i < pixelCount; ++i) {
            pixels[i * 4 + 0] = quantized[i * 3 + 0];
            pixels[i * 4 + 1] = quantized[i * 3 + 1];
            pixels[i * 4 + 2] = quantized[i * 3 + 2];
            pixels[i * 4 + 3] = 255;
        }
    }

    SkPixmap pixmap(info, pixels.data(), info.minRowBytes());

    SkFILEWStream fileStream(path.c_str());
    if (!fileStream.isValid()) {
        std::cerr << "Failed to open output file: " << path << std::endl;
        return false;
    }

    if (!SkPngEncoder::Encode(&fileStream, pixmap, {})) {
        std::cerr << "Failed to encode PNG: " << path << std::endl;
        return false;
    }
    fileStream.flush();
    return true;
}

std::string exportFilename(const std::string& prefix, int frameIndex) {
    std::ostringstream ss;
    ss << prefix << "_" << std::setfill('0') << std::setw(4) << frameIndex << ".png";
    return ss.str();
}

}  // namespace aerender
