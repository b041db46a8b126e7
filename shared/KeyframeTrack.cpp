// KeyframeTrack.cpp - Keyframe track evaluation
// See KeyframeTrack.h for class documentation

#include "KeyframeTrack.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace aerender {

KeyframeTrack::KeyframeTrack(std::vector<Keyframe> keyframes)
    : keyframes_(std::move(keyframes)) {
    // Input order is not trusted; equal times keep their original order
    std::stable_sort(keyframes_.begin(), keyframes_.end(),
                     [](const Keyframe& a, const Keyframe& b) { return a.time < b.time; });
}

KeyframeTrack KeyframeTrack::fromRaw(const std::vector<RawKeyframe>& raw) {
    std::vector<Keyframe> valid;
    valid.reserve(raw.size());
    size_t discarded = 0;

    for (const auto& entry : raw) {
        if (!entry.time || !entry.value ||
            !std::isfinite(*entry.time) || !std::isfinite(*entry.value)) {
            discarded++;
            continue;
        }
        valid.push_back({*entry.time, *entry.value});
    }

    KeyframeTrack track(std::move(valid));
    track.discarded_ = discarded;
    return track;
}

std::optional<double> KeyframeTrack::evaluate(double time) const {
    if (keyframes_.empty()) return std::nullopt;

    // Clamp before first / after last keyframe, no extrapolation
    if (time <= keyframes_.front().time) return keyframes_.front().value;
    if (time >= keyframes_.back().time) return keyframes_.back().value;

    // First bracketing pair wins; duplicate times fall through to ratio 0
    for (size_t i = 0; i + 1 < keyframes_.size(); i++) {
        const Keyframe& k1 = keyframes_[i];
        const Keyframe& k2 = keyframes_[i + 1];
        if (k1.time <= time && time <= k2.time) {
            double span = k2.time - k1.time;
            double t = span > 0.0 ? (time - k1.time) / span : 0.0;
            return k1.value + (k2.value - k1.value) * t;
        }
    }

    // Unreachable for a sorted track, kept for NaN time input
    return std::nullopt;
}

double KeyframeTrack::valueAt(double time, double defaultValue) const {
    auto value = evaluate(time);
    return value ? *value : defaultValue;
}

} // namespace aerender
