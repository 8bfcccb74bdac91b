#include <gtest/gtest.h>
#include "scene_detector.hpp"
#include "test_utils.hpp"
#include <opencv2/opencv.hpp>

namespace scenereel {

class SceneDetectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Three hard cuts' worth of content: black, white, red
        if (!test_support::write_color_video("test_scenes.avi", {{cv::Scalar(0, 0, 0), 20},
                                                            {cv::Scalar(255, 255, 255), 20},
                                                            {cv::Scalar(0, 0, 255), 20}})) {
            FAIL() << "Could not create test video file";
        }
        if (!test_support::write_color_video("test_single_scene.avi", {{cv::Scalar(40, 90, 160), 30}})) {
            FAIL() << "Could not create test video file";
        }
    }

    void TearDown() override {
        std::remove("test_scenes.avi");
        std::remove("test_single_scene.avi");
    }

    DetectionConfig config_;
};

TEST_F(SceneDetectionTest, FindsHardCuts) {
    SceneDetector detector(config_);
    auto scenes = detector.find_scenes("test_scenes.avi");

    ASSERT_EQ(scenes.size(), 3u);
    EXPECT_EQ(scenes[0].start.frames(), 0);
    EXPECT_EQ(scenes[0].end.frames(), 20);
    EXPECT_EQ(scenes[1].start.frames(), 20);
    EXPECT_EQ(scenes[1].end.frames(), 40);
    EXPECT_EQ(scenes[2].start.frames(), 40);
    EXPECT_EQ(scenes[2].end.frames(), 60);

    EXPECT_EQ(scenes[1].start.to_string(), "00:00:02.000");
    EXPECT_DOUBLE_EQ(scenes[2].end.seconds(), 6.0);
}

TEST_F(SceneDetectionTest, IntervalsAreContiguous) {
    SceneDetector detector(config_);
    auto scenes = detector.find_scenes("test_scenes.avi");

    ASSERT_FALSE(scenes.empty());
    EXPECT_EQ(scenes.front().start.frames(), 0);
    for (size_t i = 1; i < scenes.size(); ++i) {
        EXPECT_EQ(scenes[i].start, scenes[i - 1].end);
        EXPECT_LT(scenes[i].start, scenes[i].end);
    }
}

TEST_F(SceneDetectionTest, NoCutsMeansOneScene) {
    SceneDetector detector(config_);
    auto scenes = detector.find_scenes("test_single_scene.avi");

    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_EQ(scenes[0].start.frames(), 0);
    EXPECT_EQ(scenes[0].end.frames(), 30);
}

TEST_F(SceneDetectionTest, HighThresholdSuppressesCuts) {
    config_.threshold = 255.0;
    SceneDetector detector(config_);
    EXPECT_EQ(detector.find_scenes("test_scenes.avi").size(), 1u);
}

TEST_F(SceneDetectionTest, MinimumSceneLengthMergesShortScenes) {
    config_.min_scene_len = 25;
    SceneDetector detector(config_);
    auto scenes = detector.find_scenes("test_scenes.avi");

    // The cut at 20 is too close to the start; the one at 40 survives
    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_EQ(scenes[0].end.frames(), 40);
}

TEST_F(SceneDetectionTest, InvalidVideoPath) {
    SceneDetector detector(config_);
    EXPECT_THROW(detector.find_scenes("nonexistent_video.avi"), std::runtime_error);
}

TEST(ContentDetectorTest, ScoresHsvDifference) {
    ContentDetector detector(27.0, 1);
    cv::Mat black(48, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat white(48, 64, CV_8UC3, cv::Scalar(255, 255, 255));

    EXPECT_FALSE(detector.process_frame(0, black).has_value());
    EXPECT_DOUBLE_EQ(detector.last_content_value(), 0.0);

    EXPECT_FALSE(detector.process_frame(1, black).has_value());
    EXPECT_DOUBLE_EQ(detector.last_content_value(), 0.0);

    // Only V changes: 255 / 3
    auto cut = detector.process_frame(2, white);
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(*cut, 2);
    EXPECT_DOUBLE_EQ(detector.last_content_value(), 85.0);
}

TEST(ContentDetectorTest, RespectsMinimumSceneLength) {
    ContentDetector detector(27.0, 15);
    cv::Mat black(48, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat white(48, 64, CV_8UC3, cv::Scalar(255, 255, 255));

    detector.process_frame(0, black);
    EXPECT_FALSE(detector.process_frame(5, white).has_value());
    EXPECT_GE(detector.last_content_value(), 27.0);

    auto cut = detector.process_frame(20, black);
    ASSERT_TRUE(cut.has_value());
    EXPECT_EQ(*cut, 20);

    // Measured from the last cut, not from the start
    EXPECT_FALSE(detector.process_frame(30, white).has_value());
}

TEST(ContentDetectorTest, RejectsBadInput) {
    EXPECT_THROW(ContentDetector(0.0, 15), std::invalid_argument);
    EXPECT_THROW(ContentDetector(27.0, 0), std::invalid_argument);

    ContentDetector detector(27.0, 15);
    EXPECT_THROW(detector.process_frame(0, cv::Mat()), std::invalid_argument);
    EXPECT_THROW(detector.process_frame(0, cv::Mat(4, 4, CV_8UC1, cv::Scalar(0))), std::invalid_argument);
}

TEST(DownscaleFactorTest, FollowsWidthTable) {
    EXPECT_EQ(compute_downscale_factor(320), 1);
    EXPECT_EQ(compute_downscale_factor(400), 2);
    EXPECT_EQ(compute_downscale_factor(640), 2);
    EXPECT_EQ(compute_downscale_factor(900), 3);
    EXPECT_EQ(compute_downscale_factor(1280), 5);
    EXPECT_EQ(compute_downscale_factor(1920), 6);
    EXPECT_EQ(compute_downscale_factor(2560), 8);
    EXPECT_EQ(compute_downscale_factor(3840), 12);
}

TEST(ScenesFromCutsTest, CoversWholeVideo) {
    auto scenes = SceneDetector::scenes_from_cuts({}, 100, 25.0);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_EQ(scenes[0].start.frames(), 0);
    EXPECT_EQ(scenes[0].end.frames(), 100);
}

TEST(ScenesFromCutsTest, SortsAndDropsInvalidCuts) {
    auto scenes = SceneDetector::scenes_from_cuts({60, 0, 30, 30, 150}, 100, 25.0);
    ASSERT_EQ(scenes.size(), 3u);
    EXPECT_EQ(scenes[0].end.frames(), 30);
    EXPECT_EQ(scenes[1].start.frames(), 30);
    EXPECT_EQ(scenes[1].end.frames(), 60);
    EXPECT_EQ(scenes[2].end.frames(), 100);
}

TEST(ScenesFromCutsTest, EmptyVideo) {
    EXPECT_TRUE(SceneDetector::scenes_from_cuts({10}, 0, 25.0).empty());
}

} // namespace scenereel
