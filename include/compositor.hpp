#pragma once

#include "config.hpp"
#include "scene_types.hpp"
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scenereel {

// Draws `text` centered on a black box over an RGB frame; returns a new
// RGB frame and leaves the input untouched.
cv::Mat add_caption(const cv::Mat& rgb, const std::string& text, const CaptionStyle& style = {});

// Concatenates clips into one H.264/AAC MP4
class Compositor {
public:
    explicit Compositor(const RenderConfig& config, const CaptionStyle& style = {});

    // Clips are played in order on a canvas large enough for the biggest
    // one, at the highest input frame rate. A replacement audio track is
    // trimmed or padded with silence to the video length; without one the
    // clips' own audio is kept, each clip's track fitted to that clip and
    // silence standing in for clips that have none. Throws
    // std::invalid_argument for an empty clip list and std::runtime_error for
    // unreadable input or a failed encode.
    ClipReference compose(const std::vector<std::string>& clip_paths,
                          const std::string& output_path,
                          const std::optional<std::string>& caption = std::nullopt,
                          const std::optional<std::string>& audio_path = std::nullopt) const;

private:
    RenderConfig config_;
    CaptionStyle style_;
};

} // namespace scenereel
