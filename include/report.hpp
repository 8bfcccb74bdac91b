#pragma once

#include "scene_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace scenereel {

// JPEG-encodes a BGR frame and returns it as base64 text; empty for an
// empty frame. Throws std::runtime_error if encoding fails.
std::string image_to_base64(const cv::Mat& bgr);

std::string base64_encode(const unsigned char* data, size_t length);

nlohmann::json to_json(const VideoInfo& info);
nlohmann::json to_json(const SceneClassification& record);
nlohmann::json to_json(const PipelineResult& result);

// Pretty-printed JSON to `path`, or stdout when the path is empty
void write_report(const nlohmann::json& report, const std::string& path);

} // namespace scenereel
