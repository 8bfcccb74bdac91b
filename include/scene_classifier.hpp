#pragma once

#include "config.hpp"
#include "description_vocabulary.hpp"
#include "embedding_model.hpp"
#include "scene_types.hpp"
#include <opencv2/opencv.hpp>
#include <torch/torch.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scenereel {

// RGB 8-bit frame -> model-ready [1, 3, H, W] tensor
using PreprocessFn = std::function<torch::Tensor(const cv::Mat&)>;

// Model, preprocessing and device, built once and shared read-only by
// every classification call.
class ClassifierContext {
public:
    ClassifierContext(std::unique_ptr<EmbeddingModel> model, PreprocessFn preprocess, torch::Device device);

    // ClipOnnxModel with CLIP preprocessing on the configured device
    static ClassifierContext from_config(const ModelConfig& config);

    EmbeddingModel& model() const { return *model_; }
    const PreprocessFn& preprocess() const { return preprocess_; }
    torch::Device device() const { return device_; }

private:
    std::unique_ptr<EmbeddingModel> model_;
    PreprocessFn preprocess_;
    torch::Device device_;
};

struct FrameScore {
    torch::Tensor probabilities; // [M] softmax over phrases, CPU double
};

struct FrameError {
    int frame_index = 0;
    std::string message;
};

using FrameResult = std::variant<FrameScore, FrameError>;

struct ScoreSummary {
    SceneCategory category = SceneCategory::Context;
    double confidence = 0.0;
    double action_confidence = 0.0;
    double context_confidence = 0.0;
    size_t best_index = 0;
    std::string best_description;
};

// Reduces mean per-phrase scores to a category decision. Action wins only
// on a strictly greater mean; the best phrase is the first maximum.
// Throws std::invalid_argument if the score count does not match.
ScoreSummary summarize_scores(const std::vector<double>& mean_scores,
                              const DescriptionVocabulary& vocabulary);

class SceneClassifier {
public:
    // Encodes the vocabulary text once. Throws std::runtime_error if the
    // text features do not have one row per phrase.
    SceneClassifier(const ClassifierContext& context, DescriptionVocabulary vocabulary,
                    bool normalize_features = false, float logit_scale = 1.0f);

    // Scenes that cannot be scored are absent from the result
    std::map<int, SceneClassification> classify(const std::map<int, SceneFrames>& scenes) const;

    std::optional<SceneClassification> classify_scene(const SceneFrames& scene) const;

    // Scores one BGR frame against every phrase; failures are returned, not thrown
    FrameResult score_frame(const cv::Mat& bgr, int frame_index = 0) const;

    const DescriptionVocabulary& vocabulary() const { return vocabulary_; }

private:
    const ClassifierContext& context_;
    DescriptionVocabulary vocabulary_;
    bool normalize_features_;
    float logit_scale_;
    torch::Tensor text_features_; // [M, D] on the context device
};

} // namespace scenereel
