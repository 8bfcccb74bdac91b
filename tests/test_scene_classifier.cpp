#include <gtest/gtest.h>
#include "config.hpp"
#include "scene_classifier.hpp"
#include "test_utils.hpp"
#include <cmath>
#include <numeric>

namespace scenereel {

using test_support::FakeEmbeddingModel;

class SceneClassifierTest : public ::testing::Test {
protected:
    // Context around a fake model whose per-frame logits are `logits`
    std::unique_ptr<ClassifierContext> make_context(std::vector<float> logits) {
        auto model = std::make_unique<FakeEmbeddingModel>(std::move(logits));
        model_ = model.get();
        return std::make_unique<ClassifierContext>(
            std::move(model),
            [](const cv::Mat& rgb) { return preprocess_clip_image(rgb, 32); },
            torch::Device(torch::kCPU));
    }

    static SceneFrames make_scene(int index, int start_frame, int end_frame, int num_frames,
                                  double fps = 10.0) {
        SceneFrames scene;
        scene.scene_index = index;
        scene.start_time = Timecode(start_frame, fps);
        scene.end_time = Timecode(end_frame, fps);
        for (int i = 0; i < num_frames; ++i) {
            scene.frames.emplace_back(24, 32, CV_8UC3, cv::Scalar(10 * i, 100, 200));
        }
        if (!scene.frames.empty()) {
            scene.first_frame = scene.frames.front();
        }
        return scene;
    }

    static DescriptionVocabulary default_vocabulary() {
        return DescriptionVocabulary::from_config(default_config().vocabulary);
    }

    static std::vector<float> action_logits(size_t count, const DescriptionVocabulary& vocab) {
        std::vector<float> logits(count, 0.0f);
        for (size_t index : vocab.action_indices()) {
            logits[index] = 2.0f;
        }
        return logits;
    }

    FakeEmbeddingModel* model_ = nullptr;
};

TEST_F(SceneClassifierTest, TextFeaturesEncodedOnce) {
    auto vocab = default_vocabulary();
    auto context = make_context(std::vector<float>(vocab.size(), 0.0f));
    SceneClassifier classifier(*context, vocab);

    classifier.classify_scene(make_scene(0, 0, 10, 3));
    classifier.classify_scene(make_scene(1, 10, 20, 3));

    EXPECT_EQ(model_->text_calls, 1);
    EXPECT_EQ(model_->image_calls, 6);
}

TEST_F(SceneClassifierTest, ActionLogitsGiveActionScene) {
    auto vocab = default_vocabulary();
    auto context = make_context(action_logits(vocab.size(), vocab));
    SceneClassifier classifier(*context, vocab);

    auto record = classifier.classify_scene(make_scene(0, 0, 20, 5));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->category, SceneCategory::Action);
    EXPECT_EQ(to_string(record->category), "Action Scene");
    EXPECT_GT(record->action_confidence, record->context_confidence);
    EXPECT_DOUBLE_EQ(record->confidence, record->action_confidence);

    // All action phrases tie; the first one wins
    EXPECT_EQ(record->best_description, vocab.phrase(0));

    double e2 = std::exp(2.0);
    double expected = e2 / (10.0 * e2 + 8.0);
    EXPECT_NEAR(record->action_confidence, expected, 1e-5);
}

TEST_F(SceneClassifierTest, ContextLogitsGiveContextScene) {
    auto vocab = default_vocabulary();
    std::vector<float> logits(vocab.size(), 0.0f);
    logits[vocab.context_indices()[2]] = 5.0f;
    auto context = make_context(logits);
    SceneClassifier classifier(*context, vocab);

    auto record = classifier.classify_scene(make_scene(0, 0, 20, 2));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->category, SceneCategory::Context);
    EXPECT_EQ(to_string(record->category), "Context Scene");
    EXPECT_EQ(record->best_description, vocab.phrase(vocab.context_indices()[2]));
    EXPECT_DOUBLE_EQ(record->confidence, record->context_confidence);
}

TEST_F(SceneClassifierTest, EqualConfidenceIsContext) {
    DescriptionVocabulary vocab({"people fighting", "a quiet room"}, {0});
    auto context = make_context({0.0f, 0.0f});
    SceneClassifier classifier(*context, vocab);

    auto record = classifier.classify_scene(make_scene(0, 0, 30, 4));
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->action_confidence, 0.5);
    EXPECT_DOUBLE_EQ(record->context_confidence, 0.5);
    EXPECT_EQ(record->category, SceneCategory::Context);
    EXPECT_EQ(record->best_description, "people fighting");
}

TEST_F(SceneClassifierTest, ScoresAreProbabilities) {
    auto vocab = default_vocabulary();
    std::vector<float> logits(vocab.size());
    for (size_t i = 0; i < logits.size(); ++i) {
        logits[i] = static_cast<float>(i % 5) - 2.0f;
    }
    auto context = make_context(logits);
    SceneClassifier classifier(*context, vocab);

    auto record = classifier.classify_scene(make_scene(0, 0, 20, 3));
    ASSERT_TRUE(record.has_value());
    ASSERT_EQ(record->phrase_scores.size(), vocab.size());

    for (double score : record->phrase_scores) {
        EXPECT_GE(score, 0.0);
        EXPECT_LE(score, 1.0);
    }
    double total = std::accumulate(record->phrase_scores.begin(), record->phrase_scores.end(), 0.0);
    EXPECT_NEAR(total, 1.0, 1e-5);
    EXPECT_GE(record->confidence, 0.0);
    EXPECT_LE(record->confidence, 1.0);
}

TEST_F(SceneClassifierTest, TimingFields) {
    auto vocab = default_vocabulary();
    auto context = make_context(std::vector<float>(vocab.size(), 0.0f));
    SceneClassifier classifier(*context, vocab);

    auto record = classifier.classify_scene(make_scene(3, 10, 40, 2));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->start_time, "00:00:01.000");
    EXPECT_EQ(record->end_time, "00:00:04.000");
    EXPECT_DOUBLE_EQ(record->duration, 3.0);
    EXPECT_FALSE(record->first_frame.empty());
}

TEST_F(SceneClassifierTest, InvalidFirstFrameSkipsScene) {
    auto vocab = default_vocabulary();
    auto context = make_context(std::vector<float>(vocab.size(), 0.0f));
    SceneClassifier classifier(*context, vocab);

    SceneFrames empty_scene = make_scene(0, 0, 10, 0);
    EXPECT_FALSE(classifier.classify_scene(empty_scene).has_value());

    SceneFrames gray_scene = make_scene(1, 0, 10, 2);
    gray_scene.first_frame = cv::Mat(24, 32, CV_8UC1, cv::Scalar(0));
    EXPECT_FALSE(classifier.classify_scene(gray_scene).has_value());
    EXPECT_EQ(model_->image_calls, 0);
}

TEST_F(SceneClassifierTest, MalformedFrameIsSkipped) {
    auto vocab = default_vocabulary();
    auto context = make_context(action_logits(vocab.size(), vocab));
    SceneClassifier classifier(*context, vocab);

    SceneFrames scene = make_scene(0, 0, 20, 5);
    scene.frames[2] = cv::Mat();
    scene.frames[3] = cv::Mat(24, 32, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));

    auto record = classifier.classify_scene(scene);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->valid_frames, 3);
    EXPECT_EQ(record->category, SceneCategory::Action);
}

TEST_F(SceneClassifierTest, AllFramesFailingDropsScene) {
    auto vocab = default_vocabulary();
    auto context = make_context(std::vector<float>(vocab.size(), 0.0f));
    model_->fail_images = true;
    SceneClassifier classifier(*context, vocab);

    EXPECT_FALSE(classifier.classify_scene(make_scene(0, 0, 20, 4)).has_value());
    EXPECT_EQ(model_->image_calls, 4);
}

TEST_F(SceneClassifierTest, ScoreFrameReportsErrors) {
    auto vocab = default_vocabulary();
    auto context = make_context(std::vector<float>(vocab.size(), 0.0f));
    SceneClassifier classifier(*context, vocab);

    FrameResult bad = classifier.score_frame(cv::Mat(), 7);
    ASSERT_TRUE(std::holds_alternative<FrameError>(bad));
    EXPECT_EQ(std::get<FrameError>(bad).frame_index, 7);

    model_->fail_images = true;
    FrameResult failed = classifier.score_frame(cv::Mat(24, 32, CV_8UC3, cv::Scalar(1, 2, 3)), 1);
    ASSERT_TRUE(std::holds_alternative<FrameError>(failed));
    EXPECT_EQ(std::get<FrameError>(failed).message, "image encoder unavailable");

    model_->fail_images = false;
    FrameResult good = classifier.score_frame(cv::Mat(24, 32, CV_8UC3, cv::Scalar(1, 2, 3)), 2);
    ASSERT_TRUE(std::holds_alternative<FrameScore>(good));
    EXPECT_EQ(std::get<FrameScore>(good).probabilities.numel(), static_cast<int64_t>(vocab.size()));
}

TEST_F(SceneClassifierTest, ClassifyKeepsOnlyScoredScenes) {
    auto vocab = default_vocabulary();
    auto context = make_context(action_logits(vocab.size(), vocab));
    SceneClassifier classifier(*context, vocab);

    std::map<int, SceneFrames> scenes;
    scenes[0] = make_scene(0, 0, 10, 2);
    scenes[1] = make_scene(1, 10, 20, 0);
    scenes[2] = make_scene(2, 20, 30, 2);

    auto results = classifier.classify(scenes);
    EXPECT_EQ(results.size(), 2u);
    EXPECT_EQ(results.count(0), 1u);
    EXPECT_EQ(results.count(1), 0u);
    EXPECT_EQ(results.count(2), 1u);
}

TEST_F(SceneClassifierTest, NormalizedFeaturesStillClassify) {
    auto vocab = default_vocabulary();
    auto context = make_context(action_logits(vocab.size(), vocab));
    SceneClassifier classifier(*context, vocab, true, 100.0f);

    auto record = classifier.classify_scene(make_scene(0, 0, 10, 2));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->category, SceneCategory::Action);
}

TEST_F(SceneClassifierTest, TextFeatureShapeMismatchThrows) {
    class WrongTextModel : public FakeEmbeddingModel {
    public:
        WrongTextModel() : FakeEmbeddingModel({0.0f}) {}
        torch::Tensor encode_text(const std::vector<std::string>&) override {
            return torch::zeros({1, 4});
        }
    };

    ClassifierContext context(std::make_unique<WrongTextModel>(),
                              [](const cv::Mat& rgb) { return preprocess_clip_image(rgb, 32); },
                              torch::Device(torch::kCPU));
    EXPECT_THROW(SceneClassifier(context, default_vocabulary()), std::runtime_error);
}

TEST(SummarizeScoresTest, ExactTieIsContext) {
    DescriptionVocabulary vocab({"a", "b", "c", "d"}, {0, 1});
    auto summary = summarize_scores({0.25, 0.25, 0.25, 0.25}, vocab);
    EXPECT_EQ(summary.category, SceneCategory::Context);
    EXPECT_DOUBLE_EQ(summary.confidence, 0.25);
    EXPECT_EQ(summary.best_index, 0u);
}

TEST(SummarizeScoresTest, MeansOverEachSide) {
    DescriptionVocabulary vocab({"a", "b", "c", "d"}, {1, 3});
    auto summary = summarize_scores({0.1, 0.4, 0.2, 0.3}, vocab);
    EXPECT_DOUBLE_EQ(summary.action_confidence, 0.35);
    EXPECT_DOUBLE_EQ(summary.context_confidence, 0.15);
    EXPECT_EQ(summary.category, SceneCategory::Action);
    EXPECT_EQ(summary.best_description, "b");
}

TEST(SummarizeScoresTest, SizeMismatchThrows) {
    DescriptionVocabulary vocab({"a", "b"}, {0});
    EXPECT_THROW(summarize_scores({1.0}, vocab), std::invalid_argument);
}

TEST(ClassifierContextTest, RequiresModelAndPreprocess) {
    EXPECT_THROW(ClassifierContext(nullptr, [](const cv::Mat&) { return torch::zeros({1}); },
                                   torch::Device(torch::kCPU)),
                 std::invalid_argument);
    EXPECT_THROW(ClassifierContext(std::make_unique<FakeEmbeddingModel>(std::vector<float>{0.0f}),
                                   PreprocessFn(), torch::Device(torch::kCPU)),
                 std::invalid_argument);
}

TEST(ClipPreprocessTest, ShapeAndNormalization) {
    cv::Mat rgb(120, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    auto tensor = preprocess_clip_image(rgb, 224);

    ASSERT_EQ(tensor.dim(), 4);
    EXPECT_EQ(tensor.size(0), 1);
    EXPECT_EQ(tensor.size(1), 3);
    EXPECT_EQ(tensor.size(2), 224);
    EXPECT_EQ(tensor.size(3), 224);

    // White maps to (1 - mean) / std per channel
    float red = tensor[0][0][112][112].item<float>();
    EXPECT_NEAR(red, (1.0f - 0.48145466f) / 0.26862954f, 1e-3);
}

TEST(ClipPreprocessTest, RejectsNonRgbInput) {
    EXPECT_THROW(preprocess_clip_image(cv::Mat(), 224), std::invalid_argument);
    EXPECT_THROW(preprocess_clip_image(cv::Mat(10, 10, CV_8UC1), 224), std::invalid_argument);
}

} // namespace scenereel
