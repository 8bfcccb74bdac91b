#include "scene_classifier.hpp"
#include <iostream>
#include <stdexcept>

namespace scenereel {

ClassifierContext::ClassifierContext(std::unique_ptr<EmbeddingModel> model, PreprocessFn preprocess,
                                     torch::Device device)
    : model_(std::move(model)), preprocess_(std::move(preprocess)), device_(device) {
    if (!model_) {
        throw std::invalid_argument("ClassifierContext requires an embedding model");
    }
    if (!preprocess_) {
        throw std::invalid_argument("ClassifierContext requires a preprocessing function");
    }
}

ClassifierContext ClassifierContext::from_config(const ModelConfig& config) {
    torch::Device device = select_device(config.use_gpu);
    int image_size = config.image_size;
    return ClassifierContext(
        std::make_unique<ClipOnnxModel>(config, device),
        [image_size](const cv::Mat& rgb) { return preprocess_clip_image(rgb, image_size); },
        device);
}

ScoreSummary summarize_scores(const std::vector<double>& mean_scores,
                              const DescriptionVocabulary& vocabulary) {
    if (mean_scores.size() != vocabulary.size()) {
        throw std::invalid_argument("Expected " + std::to_string(vocabulary.size()) +
                                    " phrase scores, got " + std::to_string(mean_scores.size()));
    }

    ScoreSummary summary;

    double action_sum = 0.0;
    for (size_t index : vocabulary.action_indices()) {
        action_sum += mean_scores[index];
    }
    double context_sum = 0.0;
    for (size_t index : vocabulary.context_indices()) {
        context_sum += mean_scores[index];
    }
    summary.action_confidence = action_sum / static_cast<double>(vocabulary.action_indices().size());
    summary.context_confidence = context_sum / static_cast<double>(vocabulary.context_indices().size());

    for (size_t i = 1; i < mean_scores.size(); ++i) {
        if (mean_scores[i] > mean_scores[summary.best_index]) {
            summary.best_index = i;
        }
    }
    summary.best_description = vocabulary.phrase(summary.best_index);

    // Equal means resolve to context
    if (summary.action_confidence > summary.context_confidence) {
        summary.category = SceneCategory::Action;
        summary.confidence = summary.action_confidence;
    } else {
        summary.category = SceneCategory::Context;
        summary.confidence = summary.context_confidence;
    }

    return summary;
}

SceneClassifier::SceneClassifier(const ClassifierContext& context, DescriptionVocabulary vocabulary,
                                 bool normalize_features, float logit_scale)
    : context_(context)
    , vocabulary_(std::move(vocabulary))
    , normalize_features_(normalize_features)
    , logit_scale_(logit_scale) {
    torch::NoGradGuard no_grad;

    text_features_ = context_.model().encode_text(vocabulary_.phrases())
                         .to(context_.device(), torch::kFloat);
    if (text_features_.dim() != 2 || text_features_.size(0) != static_cast<int64_t>(vocabulary_.size())) {
        throw std::runtime_error("Text encoder returned " + std::to_string(text_features_.dim()) +
                                 "-d features; expected one row per phrase");
    }
    if (normalize_features_) {
        text_features_ = text_features_ / text_features_.norm(2, -1, true);
    }

    std::cout << "Scene classifier ready: " << vocabulary_.size() << " phrases ("
              << vocabulary_.action_indices().size() << " action), model: "
              << context_.model().name() << std::endl;
}

FrameResult SceneClassifier::score_frame(const cv::Mat& bgr, int frame_index) const {
    if (bgr.empty() || bgr.type() != CV_8UC3) {
        return FrameError{frame_index, "not an 8-bit 3-channel image"};
    }

    try {
        torch::NoGradGuard no_grad;

        cv::Mat rgb;
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

        torch::Tensor pixels = context_.preprocess()(rgb).to(context_.device());
        torch::Tensor image_features = context_.model().encode_image(pixels)
                                           .to(context_.device(), torch::kFloat);
        if (image_features.dim() == 1) {
            image_features = image_features.unsqueeze(0);
        }
        if (normalize_features_) {
            image_features = image_features / image_features.norm(2, -1, true);
        }

        torch::Tensor logits = logit_scale_ * image_features.matmul(text_features_.t());
        torch::Tensor probabilities = torch::softmax(logits, -1).squeeze(0)
                                          .to(torch::kCPU, torch::kDouble);
        if (probabilities.numel() != static_cast<int64_t>(vocabulary_.size())) {
            return FrameError{frame_index, "score vector does not match the vocabulary size"};
        }
        return FrameScore{probabilities};
    } catch (const c10::Error& e) {
        return FrameError{frame_index, e.what_without_backtrace()};
    } catch (const std::exception& e) {
        return FrameError{frame_index, e.what()};
    }
}

std::optional<SceneClassification> SceneClassifier::classify_scene(const SceneFrames& scene) const {
    const int scene_number = scene.scene_index + 1;

    if (scene.first_frame.empty() || scene.first_frame.type() != CV_8UC3) {
        std::cerr << "Error: scene " << scene_number << " has no valid first frame, skipping" << std::endl;
        return std::nullopt;
    }

    torch::Tensor running = torch::zeros({static_cast<int64_t>(vocabulary_.size())}, torch::kDouble);
    int valid_frames = 0;
    std::vector<FrameError> errors;

    for (size_t i = 0; i < scene.frames.size(); ++i) {
        FrameResult result = score_frame(scene.frames[i], static_cast<int>(i));
        if (auto* score = std::get_if<FrameScore>(&result)) {
            running += score->probabilities;
            ++valid_frames;
        } else {
            errors.push_back(std::get<FrameError>(result));
        }
    }

    for (const auto& error : errors) {
        std::cerr << "Warning: scene " << scene_number << " frame " << error.frame_index
                  << " skipped: " << error.message << std::endl;
    }

    if (valid_frames == 0) {
        std::cerr << "Error: no frame of scene " << scene_number << " could be scored, skipping" << std::endl;
        return std::nullopt;
    }

    torch::Tensor mean = (running / valid_frames).contiguous();
    std::vector<double> mean_scores(mean.data_ptr<double>(), mean.data_ptr<double>() + mean.numel());
    ScoreSummary summary = summarize_scores(mean_scores, vocabulary_);

    SceneClassification record;
    record.category = summary.category;
    record.confidence = summary.confidence;
    record.start_time = scene.start_time.to_string();
    record.end_time = scene.end_time.to_string();
    record.duration = scene.end_time.seconds() - scene.start_time.seconds();
    record.first_frame = scene.first_frame;
    record.best_description = summary.best_description;
    record.action_confidence = summary.action_confidence;
    record.context_confidence = summary.context_confidence;
    record.phrase_scores = std::move(mean_scores);
    record.valid_frames = valid_frames;

    std::cout << "Scene " << scene_number << ": " << to_string(record.category)
              << " (confidence: " << record.confidence << ", " << valid_frames << "/"
              << scene.frames.size() << " frames, best match: \"" << record.best_description << "\")"
              << std::endl;

    return record;
}

std::map<int, SceneClassification> SceneClassifier::classify(const std::map<int, SceneFrames>& scenes) const {
    std::map<int, SceneClassification> results;
    for (const auto& [index, scene] : scenes) {
        if (auto record = classify_scene(scene)) {
            results.emplace(index, std::move(*record));
        }
    }
    std::cout << "Classified " << results.size() << " of " << scenes.size() << " scenes" << std::endl;
    return results;
}

} // namespace scenereel
