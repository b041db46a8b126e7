// KeyframeTrack.h - Piecewise-linear keyframe track for one animatable property
// Platform-independent C++17 implementation, no Skia dependencies.
//
// A track is an ordered list of (time, value) samples. Evaluation clamps before the
// first and after the last sample and interpolates linearly in between.

#ifndef AE_KEYFRAME_TRACK_H
#define AE_KEYFRAME_TRACK_H

#include <cstddef>
#include <optional>
#include <vector>

namespace aerender {

// A single validated sample
struct Keyframe {
    double time = 0.0;   // Seconds from animation start
    double value = 0.0;  // Property value at that time
};

// A sample as it arrives from the description, before validation.
// Either field may be missing.
struct RawKeyframe {
    std::optional<double> time;
    std::optional<double> value;
};

class KeyframeTrack {
public:
    KeyframeTrack() = default;

    // Build a track from validated samples. Samples are stable-sorted by time.
    explicit KeyframeTrack(std::vector<Keyframe> keyframes);

    // Build a track from unvalidated samples. Entries missing either field, or holding
    // a non-finite number, are discarded (not treated as zero).
    static KeyframeTrack fromRaw(const std::vector<RawKeyframe>& raw);

    // Value at time, or nullopt when the track holds no valid sample
    std::optional<double> evaluate(double time) const;

    // Value at time, falling back to defaultValue for an empty track
    double valueAt(double time, double defaultValue) const;

    bool empty() const { return keyframes_.empty(); }
    size_t size() const { return keyframes_.size(); }

    // Number of raw entries rejected by fromRaw()
    size_t discardedCount() const { return discarded_; }

    // Samples in ascending time order
    const std::vector<Keyframe>& keyframes() const { return keyframes_; }

private:
    std::vector<Keyframe> keyframes_;
    size_t discarded_ = 0;
};

} // namespace aerender

#endif // AE_KEYFRAME_TRACK_H
