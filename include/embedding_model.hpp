#pragma once

#include "config.hpp"
#include <opencv2/opencv.hpp>
#include <torch/torch.h>
#include <memory>
#include <string>
#include <vector>

namespace scenereel {

// Joint image/text embedding model. Both encoders project into the same
// feature space so that image · textᵀ gives similarity logits.
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    // [1, 3, H, W] normalized pixels -> [1, D]
    virtual torch::Tensor encode_image(const torch::Tensor& pixel_values) = 0;

    // M phrases -> [M, D]
    virtual torch::Tensor encode_text(const std::vector<std::string>& phrases) = 0;

    virtual std::string name() const = 0;
};

// CLIP image preprocessing for an RGB 8-bit frame: bicubic resize of the
// short side, center crop, scale to [0, 1], per-channel mean/std
// normalization. Returns [1, 3, size, size] float.
torch::Tensor preprocess_clip_image(const cv::Mat& rgb, int size = 224);

// CUDA when requested and present, otherwise CPU
torch::Device select_device(bool use_gpu);

// CLIP exported as separate ONNX image and text encoders
class ClipOnnxModel : public EmbeddingModel {
public:
    ClipOnnxModel(const ModelConfig& config, torch::Device device);
    ~ClipOnnxModel() override;

    torch::Tensor encode_image(const torch::Tensor& pixel_values) override;
    torch::Tensor encode_text(const std::vector<std::string>& phrases) override;
    std::string name() const override { return "clip-onnx"; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace scenereel
