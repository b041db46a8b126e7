// frame_export.h - PNG export of rendered frames and masks
// Frames (3 channels) are written as opaque RGBA PNGs, masks (1 channel) as grayscale PNGs.

#ifndef AE_FRAME_EXPORT_H
#define AE_FRAME_EXPORT_H

#include "AnimationTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace aerender {

// Maximum exported image size per dimension
static constexpr int MAX_EXPORT_DIM = 32768;

// Quantize normalized floats back to 8-bit (round to nearest, clamped to [0, 255])
std::vector<uint8_t> quantizeImage(const FloatImage& image);

// Encode a 1 or 3 channel image as PNG and write it to path
bool saveImagePNG(const FloatImage& image, const std::string& path);

// "<prefix>_NNNN.png" with the frame index zero-padded to four digits
std::string exportFilename(const std::string& prefix, int frameIndex);

}  // namespace aerender

#endif  // AE_FRAME_EXPORT_H
