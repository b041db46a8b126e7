// ImageDecoder.cpp - Data URL and PNG/JPEG decoding via Skia codecs

#include "ImageDecoder.h"

#include "include/codec/SkCodec.h"
#include "include/codec/SkJpegDecoder.h"
#include "include/codec/SkPngDecoder.h"
#include "include/core/SkData.h"
#include "include/core/SkImageInfo.h"
#include "include/utils/SkBase64.h"

#include <cctype>
#include <memory>

namespace aerender {

std::optional<std::vector<uint8_t>> ImageDecoder::decodeDataUrl(const std::string& url, std::string& error) {
    size_t comma = url.find(',');
    size_t begin = comma == std::string::npos ? 0 : comma + 1;

    std::string payload;
    payload.reserve(url.size() - begin);
    for (size_t i = begin; i < url.size(); i++) {
        if (!std::isspace(static_cast<unsigned char>(url[i]))) payload.push_back(url[i]);
    }
    if (payload.empty()) {
        error = "empty image data";
        return std::nullopt;
    }

    size_t decodedLength = 0;
    SkBase64::Error result = SkBase64::Decode(payload.data(), payload.size(), nullptr, &decodedLength);
    if (result != SkBase64::kNoError) {
        error = result == SkBase64::kPadError ? "invalid base64 padding" : "invalid base64 character";
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(decodedLength);
    result = SkBase64::Decode(payload.data(), payload.size(), bytes.data(), &decodedLength);
    if (result != SkBase64::kNoError) {
        error = "base64 decode failed";
        return std::nullopt;
    }
    bytes.resize(decodedLength);
    return bytes;
}

std::optional<RasterBuffer> ImageDecoder::decodeImage(const void* data, size_t size, std::string& error) {
    if (!data || size == 0) {
        error = "no image bytes";
        return std::nullopt;
    }

    const SkCodecs::Decoder decoders[] = {SkPngDecoder::Decoder(), SkJpegDecoder::Decoder()};
    std::unique_ptr<SkCodec> codec = SkCodec::MakeFromData(SkData::MakeWithCopy(data, size), decoders);
    if (!codec) {
        error = "unrecognized image format";
        return std::nullopt;
    }

    SkImageInfo info = codec->getInfo()
                           .makeColorType(kRGBA_8888_SkColorType)
                           .makeAlphaType(kUnpremul_SkAlphaType)
                           .makeColorSpace(nullptr);
    if (info.isEmpty() || info.width() > kMaxImageDimension || info.height() > kMaxImageDimension) {
        error = "image dimensions " + std::to_string(info.width()) + "x" + std::to_string(info.height()) +
                " out of range";
        return std::nullopt;
    }

    RasterBuffer buffer = RasterBuffer::make(info.width(), info.height(), 4);
    SkCodec::Result result = codec->getPixels(info, buffer.pixels.data(), info.minRowBytes());
    if (result != SkCodec::kSuccess) {
        error = std::string("image decode failed: ") + SkCodec::ResultToString(result);
        return std::nullopt;
    }
    return buffer;
}

std::optional<RasterBuffer> ImageDecoder::decodeDataUrlImage(const std::string& url, std::string& error) {
    std::optional<std::vector<uint8_t>> bytes = decodeDataUrl(url, error);
    if (!bytes) return std::nullopt;
    return decodeImage(bytes->data(), bytes->size(), error);
}

} // namespace aerender
