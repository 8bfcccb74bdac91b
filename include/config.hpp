#pragma once

#include <opencv2/opencv.hpp>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

namespace scenereel {

struct DownloadConfig {
    std::string storage_root = "static/videos";
    std::string container = "mp4";
    std::string downloader = "yt-dlp";
};

struct DetectionConfig {
    double threshold = 27.0;
    int min_scene_len = 15;     // frames
    int downscale_factor = 0;   // 0 = derive from frame width
};

struct ExtractionConfig {
    int frame_stride = 1;       // 1 = every frame
};

struct ModelConfig {
    std::string image_encoder_path = "models/clip-vit-base-patch32/image_encoder.onnx";
    std::string text_encoder_path = "models/clip-vit-base-patch32/text_encoder.onnx";
    std::string tokenizer_path = "models/clip-vit-base-patch32/tokenizer.json";
    int image_size = 224;
    int context_length = 77;
    bool normalize_features = false;
    float logit_scale = 1.0f;
    bool use_gpu = true;
    int num_threads = static_cast<int>(std::thread::hardware_concurrency());
};

struct RenderConfig {
    std::string ffmpeg = "ffmpeg";
    std::string output_directory = "static/videos/clips";
};

struct CaptionStyle {
    int font = cv::FONT_HERSHEY_COMPLEX;
    double font_scale = 2.0;
    int thickness = 3;
    cv::Scalar color{255, 255, 0}; // BGR
    int padding = 10;
};

struct VocabularyConfig {
    std::vector<std::string> phrases;
    std::vector<size_t> action_indices;
};

struct PipelineConfig {
    DownloadConfig download;
    DetectionConfig detection;
    ExtractionConfig extraction;
    ModelConfig model;
    RenderConfig render;
    CaptionStyle caption;
    VocabularyConfig vocabulary;
};

// Compiled-in defaults, including the built-in phrase vocabulary
PipelineConfig default_config();

// Reads a JSON file over the defaults; keys absent from the file keep their
// default value. Throws std::runtime_error on I/O or parse failure and
// std::invalid_argument when validation fails.
PipelineConfig load_config(const std::string& path);

// Throws std::invalid_argument naming the offending key
void validate_config(const PipelineConfig& config);

} // namespace scenereel
