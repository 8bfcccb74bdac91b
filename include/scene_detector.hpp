#pragma once

#include "config.hpp"
#include "scene_types.hpp"
#include <opencv2/opencv.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scenereel {

// Fast-cut detector: compares consecutive frames in HSV space and reports
// a cut when the mean absolute difference, averaged over H, S and V,
// reaches the threshold.
class ContentDetector {
public:
    ContentDetector(double threshold, int min_scene_len);

    // Feeds one BGR frame. Returns the frame number that starts a new
    // scene, if this frame is a cut.
    std::optional<int64_t> process_frame(int64_t frame_num, const cv::Mat& bgr);

    // Score computed for the last frame passed in (0 for the first)
    double last_content_value() const { return last_content_value_; }

private:
    double threshold_;
    int min_scene_len_;
    cv::Mat last_hsv_;
    std::optional<int64_t> last_cut_;
    double last_content_value_ = 0.0;
};

// Downscale factor used before detection, chosen from the frame width
int compute_downscale_factor(int frame_width);

class SceneDetector {
public:
    explicit SceneDetector(const DetectionConfig& config);

    // Ordered, non-overlapping intervals covering the whole video. Throws
    // std::runtime_error if the video cannot be opened.
    std::vector<SceneInterval> find_scenes(const std::string& video_path);

    // Turns cut frame numbers into intervals over [0, num_frames)
    static std::vector<SceneInterval> scenes_from_cuts(const std::vector<int64_t>& cuts,
                                                       int64_t num_frames, double fps);

private:
    DetectionConfig config_;
};

} // namespace scenereel
