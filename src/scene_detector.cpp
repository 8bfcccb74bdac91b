#include "scene_detector.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace scenereel {

ContentDetector::ContentDetector(double threshold, int min_scene_len)
    : threshold_(threshold), min_scene_len_(min_scene_len) {
    if (threshold_ <= 0.0) {
        throw std::invalid_argument("Detection threshold must be positive");
    }
    if (min_scene_len_ < 1) {
        throw std::invalid_argument("Minimum scene length must be at least one frame");
    }
}

std::optional<int64_t> ContentDetector::process_frame(int64_t frame_num, const cv::Mat& bgr) {
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        throw std::invalid_argument("ContentDetector expects a non-empty 8-bit BGR frame");
    }

    if (!last_cut_) {
        last_cut_ = frame_num;
    }

    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

    std::optional<int64_t> cut;
    if (!last_hsv_.empty() && last_hsv_.size() == hsv.size()) {
        cv::Mat diff;
        cv::absdiff(hsv, last_hsv_, diff);
        cv::Scalar channel_means = cv::mean(diff);
        last_content_value_ = (channel_means[0] + channel_means[1] + channel_means[2]) / 3.0;

        if (last_content_value_ >= threshold_ && frame_num - *last_cut_ >= min_scene_len_) {
            cut = frame_num;
            last_cut_ = frame_num;
        }
    } else {
        last_content_value_ = 0.0;
    }

    last_hsv_ = hsv;
    return cut;
}

int compute_downscale_factor(int frame_width) {
    if (frame_width >= 3200) return 12;
    if (frame_width >= 2100) return 8;
    if (frame_width >= 1700) return 6;
    if (frame_width >= 1200) return 5;
    if (frame_width >= 900) return 3;
    if (frame_width >= 400) return 2;
    return 1;
}

SceneDetector::SceneDetector(const DetectionConfig& config) : config_(config) {}

std::vector<SceneInterval> SceneDetector::find_scenes(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw std::runtime_error("Failed to open video: " + video_path);
    }

    double fps = cap.get(cv::CAP_PROP_FPS);
    if (fps <= 0.0) {
        throw std::runtime_error("Video reports no frame rate: " + video_path);
    }

    int width = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH));
    int factor = config_.downscale_factor > 0 ? config_.downscale_factor
                                              : compute_downscale_factor(width);

    std::cout << "Detecting scenes in " << video_path << " (threshold: " << config_.threshold
              << ", min length: " << config_.min_scene_len << ", downscale: " << factor << ")"
              << std::endl;

    ContentDetector detector(config_.threshold, config_.min_scene_len);
    std::vector<int64_t> cuts;
    int64_t frame_num = 0;
    cv::Mat frame, small;

    while (cap.read(frame)) {
        if (factor > 1) {
            cv::resize(frame, small, cv::Size(std::max(1, frame.cols / factor),
                                              std::max(1, frame.rows / factor)),
                       0, 0, cv::INTER_AREA);
        } else {
            small = frame;
        }

        if (auto cut = detector.process_frame(frame_num, small)) {
            cuts.push_back(*cut);
        }
        ++frame_num;
    }
    cap.release();

    auto scenes = scenes_from_cuts(cuts, frame_num, fps);
    std::cout << "Detected " << scenes.size() << " scene(s) over " << frame_num << " frames" << std::endl;
    return scenes;
}

std::vector<SceneInterval> SceneDetector::scenes_from_cuts(const std::vector<int64_t>& cuts,
                                                           int64_t num_frames, double fps) {
    std::vector<SceneInterval> scenes;
    if (num_frames <= 0) {
        return scenes;
    }

    std::vector<int64_t> sorted_cuts;
    for (int64_t cut : cuts) {
        if (cut > 0 && cut < num_frames) {
            sorted_cuts.push_back(cut);
        }
    }
    std::sort(sorted_cuts.begin(), sorted_cuts.end());
    sorted_cuts.erase(std::unique(sorted_cuts.begin(), sorted_cuts.end()), sorted_cuts.end());

    int64_t start = 0;
    for (int64_t cut : sorted_cuts) {
        scenes.push_back({Timecode(start, fps), Timecode(cut, fps)});
        start = cut;
    }
    scenes.push_back({Timecode(start, fps), Timecode(num_frames, fps)});

    return scenes;
}

} // namespace scenereel
