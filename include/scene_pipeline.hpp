#pragma once

#include "config.hpp"
#include "embedding_model.hpp"
#include "scene_types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scenereel {

struct SceneSelection {
    std::optional<SceneCategory> category; // all categories when unset
    double min_confidence = 0.0;
    std::optional<size_t> max_scenes;      // keeps the most confident
};

struct PipelineOptions {
    SceneSelection selection;
    bool render = true;
    std::optional<std::string> compose_output;
    std::optional<std::string> caption;
    std::optional<std::string> audio_path;
};

struct PipelineResult {
    std::string video_path;
    VideoInfo video_info{};
    std::vector<SceneInterval> scenes;
    std::map<int, SceneClassification> classifications;
    std::vector<int> selected;            // scene indices, in scene order
    std::map<int, ClipReference> clips;   // keyed by scene index
    std::optional<ClipReference> composite;
    std::chrono::milliseconds processing_time{0};
};

class ScenePipeline {
public:
    // Without a model the configured CLIP encoders are loaded on first use
    explicit ScenePipeline(const PipelineConfig& config, std::unique_ptr<EmbeddingModel> model = nullptr);
    ~ScenePipeline();

    VideoInfo get_video_info(const std::string& video_path);

    // URL -> downloaded file; local path -> itself. Throws std::runtime_error
    // when nothing usable is found.
    std::string acquire(const std::string& input);

    std::vector<SceneInterval> find_scenes(const std::string& video_path);
    std::map<int, SceneFrames> extract_frames(const std::string& video_path,
                                              const std::vector<SceneInterval>& scenes);
    std::map<int, SceneClassification> classify(const std::map<int, SceneFrames>& scenes);

    static std::vector<int> select_scenes(const std::map<int, SceneClassification>& classifications,
                                          const SceneSelection& selection);

    std::map<int, ClipReference> render_scenes(const std::string& video_path,
                                               const std::map<int, SceneClassification>& classifications,
                                               const std::vector<int>& selected);

    ClipReference compose(const std::vector<ClipReference>& clips,
                          const std::string& output_path,
                          const std::optional<std::string>& caption = std::nullopt,
                          const std::optional<std::string>& audio_path = std::nullopt);

    PipelineResult run(const std::string& input, const PipelineOptions& options = {});

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace scenereel
