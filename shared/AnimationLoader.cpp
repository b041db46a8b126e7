// AnimationLoader.cpp - JSON description parsing (nlohmann/json)

#include "AnimationLoader.h"
#include "ImageDecoder.h"
#include "render_instrumentation.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace aerender {

namespace {

using json = nlohmann::json;

constexpr int kDefaultWidth = 512;
constexpr int kDefaultHeight = 512;
constexpr int kDefaultFps = 30;
constexpr double kDefaultDurationSeconds = 1.0;

// Finite number (booleans count as 0/1), or nullopt
std::optional<double> jsonNumber(const json& node) {
    if (node.is_boolean()) return node.get<bool>() ? 1.0 : 0.0;
    if (!node.is_number()) return std::nullopt;
    double value = node.get<double>();
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

double numberOr(const json& object, const char* key, double fallback) {
    auto it = object.find(key);
    if (it == object.end()) return fallback;
    return jsonNumber(*it).value_or(fallback);
}

int toInt(double value) {
    constexpr double lo = std::numeric_limits<int>::min();
    constexpr double hi = std::numeric_limits<int>::max();
    return static_cast<int>(std::clamp(value, lo, hi));
}

int intOr(const json& object, const char* key, int fallback) {
    return toInt(numberOr(object, key, fallback));
}

// Strings as-is, numbers as their JSON text, anything else is fallback
std::string stringOr(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return fallback;
}

std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

bool parseProject(const json& node, ProjectConfig& project, std::string& error) {
    if (!node.is_object()) {
        error = "\"project\" is not an object";
        return false;
    }

    project.width = intOr(node, "width", kDefaultWidth);
    project.height = intOr(node, "height", kDefaultHeight);
    project.fps = intOr(node, "fps", kDefaultFps);

    double durationSeconds = numberOr(node, "duration", kDefaultDurationSeconds);
    if (node.contains("total_frames")) {
        project.totalFrames = intOr(node, "total_frames", 1);
    } else {
        project.totalFrames = std::max(1, toInt(durationSeconds * project.fps));
    }
    project.duration = node.contains("duration") ? durationSeconds : 0.0;

    project.maskExpansion = intOr(node, "mask_expansion", 0);
    project.maskFeather = intOr(node, "mask_feather", 0);

    if (!project.isValid()) {
        error = "invalid project settings " + std::to_string(project.width) + "x" +
                std::to_string(project.height) + " @" + std::to_string(project.fps) + "fps, " +
                std::to_string(project.totalFrames) + " frames";
        return false;
    }
    if (project.width > AnimationLoader::kMaxCanvasDimension ||
        project.height > AnimationLoader::kMaxCanvasDimension) {
        error = "canvas " + std::to_string(project.width) + "x" + std::to_string(project.height) +
                " exceeds " + std::to_string(AnimationLoader::kMaxCanvasDimension) + " pixels";
        return false;
    }
    return true;
}

void parseKeyframes(const json& node, Layer& layer, RenderDiagnostics& diagnostics) {
    if (!node.is_object()) {
        diagnostics.reportInvalidKeyframeTrack(layer.id, "", 0,
                                               "Invalid keyframes block: expected object, got " +
                                                   std::string(node.type_name()));
        return;
    }

    for (const auto& item : node.items()) {
        const std::string& property = item.key();
        const json& samples = item.value();

        if (!samples.is_array()) {
            diagnostics.reportInvalidKeyframeTrack(
                layer.id, property, 0,
                "Invalid keyframe data type for property '" + property + "': expected list, got " +
                    samples.type_name());
            continue;
        }

        std::vector<RawKeyframe> raw;
        raw.reserve(samples.size());
        for (const json& sample : samples) {
            RawKeyframe entry;
            if (sample.is_object()) {
                auto time = sample.find("time");
                auto value = sample.find("value");
                if (time != sample.end()) entry.time = jsonNumber(*time);
                if (value != sample.end()) entry.value = jsonNumber(*value);
            }
            raw.push_back(entry);
        }

        KeyframeTrack track = KeyframeTrack::fromRaw(raw);
        if (track.discardedCount() > 0 || track.empty()) {
            std::string message;
            if (track.discardedCount() > 0) {
                message = "Skipped " + std::to_string(track.discardedCount()) +
                          " invalid frame(s) in property '" + property + "' (missing 'time' or 'value')";
            }
            if (track.empty()) {
                std::optional<LayerProperty> known = parseLayerProperty(property);
                double fallback = known ? layer.defaults.get(*known) : 0.0;
                if (!message.empty()) message += "; ";
                message += "No valid frames found for property '" + property + "', using default value " +
                           formatNumber(fallback);
            }
            diagnostics.reportInvalidKeyframeTrack(layer.id, property, track.discardedCount(), message);
        }
        layer.keyframes[property] = std::move(track);
    }
}

// Returns false when the layer must be dropped
bool parseLayer(const json& node, size_t index, Layer& layer, RenderDiagnostics& diagnostics) {
    const std::string fallbackId = "layer_" + std::to_string(index);
    if (!node.is_object()) {
        diagnostics.reportLayerDecodeFailure(fallbackId, "layer entry is not an object");
        AE_INSTRUMENT_LAYER_DROPPED(fallbackId);
        return false;
    }

    layer.id = stringOr(node, "id", fallbackId);
    layer.name = stringOr(node, "name", layer.id);
    layer.kind = stringOr(node, "type", "") == "background" ? LayerKind::Background : LayerKind::Foreground;
    // Only a missing bg_mode means fit; null or any other value stretches
    auto bgMode = node.find("bg_mode");
    if (bgMode == node.end()) {
        layer.bgMode = BackgroundMode::Fit;
    } else {
        layer.bgMode = parseBackgroundMode(bgMode->is_string() ? bgMode->get<std::string>() : std::string());
    }

    auto imageData = node.find("image_data");
    if (imageData == node.end() || !imageData->is_string()) {
        diagnostics.reportLayerDecodeFailure(layer.id, "missing image_data");
        AE_INSTRUMENT_LAYER_DROPPED(layer.id);
        return false;
    }

    std::string error;
    std::optional<RasterBuffer> image = ImageDecoder::decodeDataUrlImage(imageData->get<std::string>(), error);
    if (!image) {
        diagnostics.reportLayerDecodeFailure(layer.id, "image: " + error);
        AE_INSTRUMENT_LAYER_DROPPED(layer.id);
        return false;
    }
    layer.image = std::move(*image);

    // Custom masks only exist on foreground layers; a background's mask is ignored
    auto customMask = node.find("customMask");
    if (layer.isForeground() && customMask != node.end() && customMask->is_string() &&
        !customMask->get<std::string>().empty()) {
        std::optional<RasterBuffer> mask = ImageDecoder::decodeDataUrlImage(customMask->get<std::string>(), error);
        if (!mask) {
            diagnostics.reportLayerDecodeFailure(layer.id, "custom mask: " + error);
            AE_INSTRUMENT_LAYER_DROPPED(layer.id);
            return false;
        }
        layer.customMask = std::move(*mask);
    }

    for (LayerProperty property : allLayerProperties()) {
        layer.defaults.set(property, numberOr(node, propertyName(property), layer.defaults.get(property)));
    }

    auto keyframes = node.find("keyframes");
    if (keyframes != node.end() && !keyframes->is_null()) {
        parseKeyframes(*keyframes, layer, diagnostics);
    }
    return true;
}

} // namespace

AnimationLoader::AnimationLoader() {
    diagnostics_.setTag("[AnimationLoader]");
}

std::optional<Animation> AnimationLoader::loadFromString(const std::string& description) {
    json root;
    try {
        root = json::parse(description);
    } catch (const json::exception& e) {
        diagnostics_.reportMalformedDescription(std::string("JSON parse error: ") + e.what());
        return std::nullopt;
    }

    if (!root.is_object()) {
        diagnostics_.reportMalformedDescription("description root is not an object");
        return std::nullopt;
    }

    Animation animation;
    std::string error;
    auto project = root.find("project");
    if (!parseProject(project != root.end() ? *project : json::object(), animation.project, error)) {
        diagnostics_.reportMalformedDescription(error);
        return std::nullopt;
    }

    auto layers = root.find("layers");
    if (layers == root.end() || layers->is_null()) {
        return animation;
    }
    if (!layers->is_array()) {
        diagnostics_.reportMalformedDescription("\"layers\" is not an array");
        return std::nullopt;
    }

    size_t dropped = 0;
    for (size_t i = 0; i < layers->size(); i++) {
        Layer layer;
        if (parseLayer((*layers)[i], i, layer, diagnostics_)) {
            animation.layers.push_back(std::move(layer));
        } else {
            dropped++;
        }
    }

    if (diagnostics_.isVerbose()) {
        std::cout << "[AnimationLoader] Loaded " << animation.layers.size() << " layers";
        if (dropped > 0) std::cout << " (" << dropped << " dropped)";
        std::cout << std::endl;
    }
    return animation;
}

std::optional<Animation> AnimationLoader::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        diagnostics_.reportMalformedDescription("cannot open file: " + filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

} // namespace aerender
