#include "config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace scenereel {

using json = nlohmann::json;

namespace {

std::invalid_argument config_error(const std::string& key, const std::string& message) {
    return std::invalid_argument("Config error at '" + key + "': " + message);
}

template <typename T>
T get_or(const json& parent, const char* key, const std::string& section, const T& fallback) {
    if (!parent.is_object() || !parent.contains(key)) {
        return fallback;
    }
    try {
        return parent.at(key).get<T>();
    } catch (const json::exception& e) {
        throw config_error(section + "." + key, e.what());
    }
}

void load_download(const json& root, DownloadConfig& cfg) {
    if (!root.contains("download")) return;
    const json& node = root["download"];
    cfg.storage_root = get_or<std::string>(node, "storage_root", "download", cfg.storage_root);
    cfg.container = get_or<std::string>(node, "container", "download", cfg.container);
    cfg.downloader = get_or<std::string>(node, "downloader", "download", cfg.downloader);
}

void load_detection(const json& root, DetectionConfig& cfg) {
    if (!root.contains("detection")) return;
    const json& node = root["detection"];
    cfg.threshold = get_or<double>(node, "threshold", "detection", cfg.threshold);
    cfg.min_scene_len = get_or<int>(node, "min_scene_len", "detection", cfg.min_scene_len);
    cfg.downscale_factor = get_or<int>(node, "downscale_factor", "detection", cfg.downscale_factor);
}

void load_extraction(const json& root, ExtractionConfig& cfg) {
    if (!root.contains("extraction")) return;
    cfg.frame_stride = get_or<int>(root["extraction"], "frame_stride", "extraction", cfg.frame_stride);
}

void load_model(const json& root, ModelConfig& cfg) {
    if (!root.contains("model")) return;
    const json& node = root["model"];
    cfg.image_encoder_path = get_or<std::string>(node, "image_encoder_path", "model", cfg.image_encoder_path);
    cfg.text_encoder_path = get_or<std::string>(node, "text_encoder_path", "model", cfg.text_encoder_path);
    cfg.tokenizer_path = get_or<std::string>(node, "tokenizer_path", "model", cfg.tokenizer_path);
    cfg.image_size = get_or<int>(node, "image_size", "model", cfg.image_size);
    cfg.context_length = get_or<int>(node, "context_length", "model", cfg.context_length);
    cfg.normalize_features = get_or<bool>(node, "normalize_features", "model", cfg.normalize_features);
    cfg.logit_scale = get_or<float>(node, "logit_scale", "model", cfg.logit_scale);
    cfg.use_gpu = get_or<bool>(node, "use_gpu", "model", cfg.use_gpu);
    cfg.num_threads = get_or<int>(node, "num_threads", "model", cfg.num_threads);
}

void load_render(const json& root, RenderConfig& cfg) {
    if (!root.contains("render")) return;
    const json& node = root["render"];
    cfg.ffmpeg = get_or<std::string>(node, "ffmpeg", "render", cfg.ffmpeg);
    cfg.output_directory = get_or<std::string>(node, "output_directory", "render", cfg.output_directory);
}

void load_caption(const json& root, CaptionStyle& cfg) {
    if (!root.contains("caption")) return;
    const json& node = root["caption"];
    cfg.font_scale = get_or<double>(node, "font_scale", "caption", cfg.font_scale);
    cfg.thickness = get_or<int>(node, "thickness", "caption", cfg.thickness);
    cfg.padding = get_or<int>(node, "padding", "caption", cfg.padding);

    if (node.contains("color")) {
        auto bgr = get_or<std::vector<double>>(node, "color", "caption", {});
        if (bgr.size() != 3) {
            throw config_error("caption.color", "expected [b, g, r]");
        }
        cfg.color = cv::Scalar(bgr[0], bgr[1], bgr[2]);
    }
}

void load_vocabulary(const json& root, VocabularyConfig& cfg) {
    if (!root.contains("vocabulary")) return;
    const json& node = root["vocabulary"];

    if (node.contains("phrases")) {
        cfg.phrases = get_or<std::vector<std::string>>(node, "phrases", "vocabulary", {});
        // A replaced phrase list without explicit indices keeps the leading-ten convention
        cfg.action_indices.clear();
        for (size_t i = 0; i < std::min<size_t>(10, cfg.phrases.size()); ++i) {
            cfg.action_indices.push_back(i);
        }
    }
    cfg.action_indices = get_or<std::vector<size_t>>(node, "action_indices", "vocabulary", cfg.action_indices);
}

} // namespace

PipelineConfig default_config() {
    PipelineConfig config;

    config.vocabulary.phrases = {
        // action
        "a person running",
        "people fighting",
        "a car chase",
        "an explosion",
        "people dancing",
        "a person jumping",
        "a sports match in progress",
        "people playing a game",
        "a crowd cheering and moving",
        "a fast moving vehicle",
        // context
        "a landscape view",
        "a city skyline",
        "an empty room",
        "people talking calmly",
        "a close-up of a face",
        "a title card with text",
        "a quiet indoor scene",
        "a static establishing shot"
    };
    for (size_t i = 0; i < 10; ++i) {
        config.vocabulary.action_indices.push_back(i);
    }

    return config;
}

void validate_config(const PipelineConfig& config) {
    if (config.download.storage_root.empty()) throw config_error("download.storage_root", "must not be empty");
    if (config.download.container.empty()) throw config_error("download.container", "must not be empty");

    if (config.detection.threshold <= 0.0) throw config_error("detection.threshold", "must be > 0");
    if (config.detection.min_scene_len < 1) throw config_error("detection.min_scene_len", "must be >= 1");
    if (config.detection.downscale_factor < 0) throw config_error("detection.downscale_factor", "must be >= 0");

    if (config.extraction.frame_stride < 1) throw config_error("extraction.frame_stride", "must be >= 1");

    if (config.model.image_size <= 0) throw config_error("model.image_size", "must be > 0");
    if (config.model.context_length < 2) throw config_error("model.context_length", "must be >= 2");
    if (config.model.logit_scale <= 0.0f) throw config_error("model.logit_scale", "must be > 0");
    if (config.model.num_threads < 0) throw config_error("model.num_threads", "must be >= 0");

    if (config.render.ffmpeg.empty()) throw config_error("render.ffmpeg", "must not be empty");
    if (config.caption.font_scale <= 0.0) throw config_error("caption.font_scale", "must be > 0");
    if (config.caption.thickness < 1) throw config_error("caption.thickness", "must be >= 1");

    const auto& vocab = config.vocabulary;
    if (vocab.phrases.empty()) throw config_error("vocabulary.phrases", "must not be empty");
    std::set<size_t> unique(vocab.action_indices.begin(), vocab.action_indices.end());
    if (unique.empty()) throw config_error("vocabulary.action_indices", "must not be empty");
    if (*unique.rbegin() >= vocab.phrases.size()) {
        throw config_error("vocabulary.action_indices", "index out of range");
    }
    if (unique.size() >= vocab.phrases.size()) {
        throw config_error("vocabulary.action_indices", "at least one context phrase is required");
    }
}

PipelineConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    json root;
    try {
        file >> root;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file '" + path + "': " + e.what());
    }

    PipelineConfig config = default_config();
    load_download(root, config.download);
    load_detection(root, config.detection);
    load_extraction(root, config.extraction);
    load_model(root, config.model);
    load_render(root, config.render);
    load_caption(root, config.caption);
    load_vocabulary(root, config.vocabulary);

    validate_config(config);
    std::cout << "Loaded configuration from: " << path << std::endl;
    return config;
}

} // namespace scenereel
