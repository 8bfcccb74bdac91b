#pragma once

#include <cstdint>
#include <string>

namespace scenereel {

// Frame-accurate position in a video. Seconds are derived from the frame
// index and the stream's frame rate.
class Timecode {
public:
    Timecode() = default;
    Timecode(int64_t frame, double fps);

    static Timecode from_seconds(double seconds, double fps);

    int64_t frames() const { return frame_; }
    double fps() const { return fps_; }
    double seconds() const;

    // HH:MM:SS.mmm
    std::string to_string() const;

    bool operator==(const Timecode& other) const { return frame_ == other.frame_; }
    bool operator!=(const Timecode& other) const { return frame_ != other.frame_; }
    bool operator<(const Timecode& other) const { return frame_ < other.frame_; }

private:
    int64_t frame_ = 0;
    double fps_ = 0.0;
};

// Parses "H:MM:SS[.fff]" into seconds. Throws std::invalid_argument when the
// string does not have exactly three colon-separated numeric fields.
double parse_timestamp(const std::string& timestamp);

} // namespace scenereel
