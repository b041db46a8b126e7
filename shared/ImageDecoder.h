// ImageDecoder.h - Decodes layer images and custom masks carried in animation descriptions
//
// Descriptions embed rasters as data URLs ("data:image/png;base64,...."). The payload is
// base64 decoded and handed to Skia's PNG or JPEG codec. Decoded images are always
// returned as 4-channel straight-alpha RGBA buffers; callers reduce masks to one channel.

#ifndef AE_IMAGE_DECODER_H
#define AE_IMAGE_DECODER_H

#include "AnimationTypes.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aerender {

class ImageDecoder {
public:
    // Largest accepted decoded image, per dimension
    static constexpr int kMaxImageDimension = 16384;

    // Base64 payload of a data URL (the text after the first comma). A string without a
    // comma is treated as a bare base64 payload. Whitespace in the payload is ignored.
    // Returns nullopt and sets error on malformed base64.
    static std::optional<std::vector<uint8_t>> decodeDataUrl(const std::string& url, std::string& error);

    // Decode PNG or JPEG bytes to RGBA. Returns nullopt and sets error on failure.
    static std::optional<RasterBuffer> decodeImage(const void* data, size_t size, std::string& error);

    // decodeDataUrl() followed by decodeImage()
    static std::optional<RasterBuffer> decodeDataUrlImage(const std::string& url, std::string& error);
};

} // namespace aerender

#endif // AE_IMAGE_DECODER_H
