#pragma once

#include "embedding_model.hpp"
#include "process_runner.hpp"
#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scenereel {
namespace test_support {

// Solid-color segments written back to back as an MJPG AVI
inline bool write_color_video(const std::string& filename,
                              const std::vector<std::pair<cv::Scalar, int>>& segments,
                              double fps = 10.0, cv::Size size = cv::Size(160, 120)) {
    cv::VideoWriter writer;
    int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
    if (!writer.open(filename, fourcc, fps, size)) {
        return false;
    }

    for (const auto& [color, count] : segments) {
        cv::Mat frame(size, CV_8UC3, color);
        for (int i = 0; i < count; ++i) {
            writer << frame;
        }
    }
    writer.release();
    return true;
}

// Encoding tests need an ffmpeg build with libx264
inline bool ffmpeg_available() {
    return command_available("ffmpeg") &&
           run_command("ffmpeg -hide_banner -encoders 2>/dev/null | grep -q libx264") == 0;
}

// Identity text features, so an image feature vector is its own logit row
class FakeEmbeddingModel : public EmbeddingModel {
public:
    explicit FakeEmbeddingModel(std::vector<float> logits) : logits_(std::move(logits)) {}

    torch::Tensor encode_image(const torch::Tensor& /*pixel_values*/) override {
        ++image_calls;
        if (fail_images) {
            throw std::runtime_error("image encoder unavailable");
        }
        return torch::tensor(logits_).unsqueeze(0);
    }

    torch::Tensor encode_text(const std::vector<std::string>& phrases) override {
        ++text_calls;
        return torch::eye(static_cast<int64_t>(phrases.size()));
    }

    std::string name() const override { return "fake"; }

    bool fail_images = false;
    int image_calls = 0;
    int text_calls = 0;

private:
    std::vector<float> logits_;
};

} // namespace test_support
} // namespace scenereel
