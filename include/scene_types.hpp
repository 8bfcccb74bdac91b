#pragma once

#include "timecode.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace scenereel {

struct VideoInfo {
    int total_frames;
    double fps;
    double duration;
    cv::Size frame_size;
    std::string codec;
};

struct SceneInterval {
    Timecode start;
    Timecode end; // exclusive
};

struct SceneFrames {
    int scene_index = 0;
    Timecode start_time;
    Timecode end_time;
    std::vector<cv::Mat> frames; // BGR, CV_8UC3
    cv::Mat first_frame;         // empty when no frame could be decoded
};

enum class SceneCategory {
    Action,
    Context
};

// "Action Scene" / "Context Scene"
std::string to_string(SceneCategory category);

struct SceneClassification {
    SceneCategory category = SceneCategory::Context;
    double confidence = 0.0;
    std::string start_time;
    std::string end_time;
    double duration = 0.0;
    cv::Mat first_frame;
    std::string best_description;

    double action_confidence = 0.0;
    double context_confidence = 0.0;
    std::vector<double> phrase_scores;
    int valid_frames = 0;
};

struct ClipReference {
    std::string path;
};

} // namespace scenereel
