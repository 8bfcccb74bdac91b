#include "scene_pipeline.hpp"
#include "compositor.hpp"
#include "description_vocabulary.hpp"
#include "frame_extractor.hpp"
#include "scene_classifier.hpp"
#include "scene_detector.hpp"
#include "scene_renderer.hpp"
#include "video_downloader.hpp"
#include "video_io.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace scenereel {

namespace {

const PipelineConfig& validated(const PipelineConfig& config) {
    validate_config(config);
    return config;
}

} // namespace

class ScenePipeline::Impl {
public:
    Impl(const PipelineConfig& config, std::unique_ptr<EmbeddingModel> model)
        : config_(validated(config))
        , vocabulary_(DescriptionVocabulary::from_config(config.vocabulary))
        , downloader_(config.download)
        , detector_(config.detection)
        , extractor_(config.extraction)
        , renderer_(config.render)
        , compositor_(config.render, config.caption)
        , pending_model_(std::move(model)) {
        std::cout << "ScenePipeline initialized with:" << std::endl;
        std::cout << "  Detection threshold: " << config_.detection.threshold << std::endl;
        std::cout << "  Min scene length: " << config_.detection.min_scene_len << " frames" << std::endl;
        std::cout << "  Frame stride: " << config_.extraction.frame_stride << std::endl;
        std::cout << "  Vocabulary: " << vocabulary_.size() << " phrases" << std::endl;
        std::cout << "  Clip directory: " << config_.render.output_directory << std::endl;
    }

    std::string acquire(const std::string& input) {
        if (is_remote(input)) {
            auto path = downloader_.download(input);
            if (!path) {
                throw std::runtime_error("No progressive " + config_.download.container +
                                         " stream available for " + input);
            }
            return *path;
        }
        if (!std::filesystem::exists(input)) {
            throw std::runtime_error("Input video not found: " + input);
        }
        return input;
    }

    // The classifier owns nothing heavy until a scene actually needs scoring
    SceneClassifier& classifier() {
        if (!classifier_) {
            if (pending_model_) {
                int image_size = config_.model.image_size;
                context_ = std::make_unique<ClassifierContext>(
                    std::move(pending_model_),
                    [image_size](const cv::Mat& rgb) { return preprocess_clip_image(rgb, image_size); },
                    select_device(config_.model.use_gpu));
            } else {
                context_ = std::make_unique<ClassifierContext>(ClassifierContext::from_config(config_.model));
            }
            classifier_ = std::make_unique<SceneClassifier>(*context_, vocabulary_,
                                                            config_.model.normalize_features,
                                                            config_.model.logit_scale);
        }
        return *classifier_;
    }

    std::map<int, ClipReference> render_scenes(const std::string& video_path,
                                               const std::map<int, SceneClassification>& classifications,
                                               const std::vector<int>& selected) {
        std::map<int, ClipReference> clips;
        for (int index : selected) {
            auto it = classifications.find(index);
            if (it == classifications.end()) {
                std::cerr << "Warning: scene " << index + 1 << " was not classified, not rendering" << std::endl;
                continue;
            }
            if (auto clip = renderer_.save_clip(video_path, it->second, config_.render.output_directory, index)) {
                clips.emplace(index, std::move(*clip));
            }
        }
        std::cout << "Rendered " << clips.size() << " of " << selected.size() << " selected scenes" << std::endl;
        return clips;
    }

    PipelineConfig config_;
    DescriptionVocabulary vocabulary_;
    VideoDownloader downloader_;
    SceneDetector detector_;
    FrameExtractor extractor_;
    SceneRenderer renderer_;
    Compositor compositor_;

private:
    std::unique_ptr<EmbeddingModel> pending_model_;
    std::unique_ptr<ClassifierContext> context_;
    std::unique_ptr<SceneClassifier> classifier_;
};

ScenePipeline::ScenePipeline(const PipelineConfig& config, std::unique_ptr<EmbeddingModel> model)
    : pimpl_(std::make_unique<Impl>(config, std::move(model))) {}

ScenePipeline::~ScenePipeline() = default;

VideoInfo ScenePipeline::get_video_info(const std::string& video_path) {
    return scenereel::get_video_info(video_path);
}

std::string ScenePipeline::acquire(const std::string& input) {
    return pimpl_->acquire(input);
}

std::vector<SceneInterval> ScenePipeline::find_scenes(const std::string& video_path) {
    return pimpl_->detector_.find_scenes(video_path);
}

std::map<int, SceneFrames> ScenePipeline::extract_frames(const std::string& video_path,
                                                         const std::vector<SceneInterval>& scenes) {
    return pimpl_->extractor_.extract(video_path, scenes);
}

std::map<int, SceneClassification> ScenePipeline::classify(const std::map<int, SceneFrames>& scenes) {
    return pimpl_->classifier().classify(scenes);
}

std::vector<int> ScenePipeline::select_scenes(const std::map<int, SceneClassification>& classifications,
                                              const SceneSelection& selection) {
    std::vector<int> selected;
    for (const auto& [index, record] : classifications) {
        if (selection.category && record.category != *selection.category) continue;
        if (record.confidence < selection.min_confidence) continue;
        selected.push_back(index);
    }

    if (selection.max_scenes && selected.size() > *selection.max_scenes) {
        std::stable_sort(selected.begin(), selected.end(), [&classifications](int a, int b) {
            return classifications.at(a).confidence > classifications.at(b).confidence;
        });
        selected.resize(*selection.max_scenes);
        std::sort(selected.begin(), selected.end());
    }

    return selected;
}

std::map<int, ClipReference> ScenePipeline::render_scenes(const std::string& video_path,
                                                          const std::map<int, SceneClassification>& classifications,
                                                          const std::vector<int>& selected) {
    return pimpl_->render_scenes(video_path, classifications, selected);
}

ClipReference ScenePipeline::compose(const std::vector<ClipReference>& clips,
                                     const std::string& output_path,
                                     const std::optional<std::string>& caption,
                                     const std::optional<std::string>& audio_path) {
    std::vector<std::string> paths;
    for (const auto& clip : clips) {
        paths.push_back(clip.path);
    }
    return pimpl_->compositor_.compose(paths, output_path, caption, audio_path);
}

PipelineResult ScenePipeline::run(const std::string& input, const PipelineOptions& options) {
    if (options.compose_output && !options.render) {
        throw std::invalid_argument("Composing requires rendered scene clips");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    PipelineResult result;
    result.video_path = acquire(input);
    result.video_info = get_video_info(result.video_path);
    result.scenes = find_scenes(result.video_path);

    {
        // Decoded frames are only needed for classification
        auto frames = extract_frames(result.video_path, result.scenes);
        result.classifications = classify(frames);
    }

    result.selected = select_scenes(result.classifications, options.selection);
    std::cout << "Selected " << result.selected.size() << " of " << result.classifications.size()
              << " classified scenes" << std::endl;

    if (options.render) {
        result.clips = render_scenes(result.video_path, result.classifications, result.selected);
    }

    if (options.compose_output) {
        std::vector<ClipReference> ordered;
        for (int index : result.selected) {
            auto it = result.clips.find(index);
            if (it != result.clips.end()) {
                ordered.push_back(it->second);
            }
        }
        if (ordered.empty()) {
            std::cerr << "Warning: no rendered clips to compose" << std::endl;
        } else {
            result.composite = compose(ordered, *options.compose_output, options.caption, options.audio_path);
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    return result;
}

} // namespace scenereel
