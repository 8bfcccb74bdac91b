#include "embedding_model.hpp"
#include "clip_tokenizer.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace scenereel {

namespace {

const float kClipMean[3] = {0.48145466f, 0.4578275f, 0.40821073f};
const float kClipStd[3] = {0.26862954f, 0.26130258f, 0.27577711f};

// One exported encoder graph with its discovered input/output names
struct OnnxEncoder {
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    std::string embeds_output;

    bool has_input(const std::string& name) const {
        return std::find(input_names.begin(), input_names.end(), name) != input_names.end();
    }

    const std::string& input_or_first(const std::string& name) const {
        auto it = std::find(input_names.begin(), input_names.end(), name);
        return it != input_names.end() ? *it : input_names.front();
    }
};

torch::Tensor output_to_tensor(Ort::Value& output) {
    auto info = output.GetTensorTypeAndShapeInfo();
    std::vector<int64_t> shape = info.GetShape();
    float* data = output.GetTensorMutableData<float>();
    return torch::from_blob(data, shape, torch::kFloat).clone();
}

} // namespace

torch::Tensor preprocess_clip_image(const cv::Mat& rgb, int size) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument("CLIP preprocessing expects a non-empty 8-bit 3-channel image");
    }

    double scale = static_cast<double>(size) / std::min(rgb.cols, rgb.rows);
    int resized_w = std::max(size, static_cast<int>(std::lround(rgb.cols * scale)));
    int resized_h = std::max(size, static_cast<int>(std::lround(rgb.rows * scale)));

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(resized_w, resized_h), 0, 0, cv::INTER_CUBIC);

    cv::Rect crop((resized_w - size) / 2, (resized_h - size) / 2, size, size);
    cv::Mat cropped;
    resized(crop).convertTo(cropped, CV_32FC3, 1.0 / 255.0);

    // HWC -> CHW
    torch::Tensor tensor = torch::from_blob(cropped.data, {size, size, 3}, torch::kFloat).clone();
    tensor = tensor.permute({2, 0, 1});

    auto mean = torch::tensor({kClipMean[0], kClipMean[1], kClipMean[2]}).view({3, 1, 1});
    auto stddev = torch::tensor({kClipStd[0], kClipStd[1], kClipStd[2]}).view({3, 1, 1});
    tensor = (tensor - mean) / stddev;

    return tensor.unsqueeze(0).contiguous();
}

torch::Device select_device(bool use_gpu) {
    if (use_gpu) {
        if (torch::cuda::is_available()) {
            std::cout << "Using CUDA for scene classification" << std::endl;
            return torch::Device(torch::kCUDA);
        }
        std::cout << "CUDA not available, using CPU for scene classification" << std::endl;
    } else {
        std::cout << "Using CPU for scene classification (GPU disabled)" << std::endl;
    }
    return torch::Device(torch::kCPU);
}

class ClipOnnxModel::Impl {
public:
    Impl(const ModelConfig& config, torch::Device device)
        : config_(config), device_(device) {
        ort_env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_ERROR, "SceneReel");

        Ort::SessionOptions session_options;
        if (config_.num_threads > 0) {
            session_options.SetIntraOpNumThreads(config_.num_threads);
        }
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        if (device_.is_cuda()) {
            try {
                OrtCUDAProviderOptions cuda_options{};
                session_options.AppendExecutionProvider_CUDA(cuda_options);
            } catch (const Ort::Exception& e) {
                std::cerr << "Warning: CUDA execution provider unavailable, using CPU: " << e.what() << std::endl;
            }
        }

        load_encoder(image_encoder_, config_.image_encoder_path, "image_embeds", session_options);
        load_encoder(text_encoder_, config_.text_encoder_path, "text_embeds", session_options);
        tokenizer_ = std::make_unique<ClipTokenizer>(config_.tokenizer_path, config_.context_length);
    }

    void load_encoder(OnnxEncoder& encoder, const std::string& path,
                      const std::string& preferred_output, const Ort::SessionOptions& session_options) {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("CLIP encoder not found: " + path);
        }

        std::cout << "Loading CLIP encoder from: " << path << std::endl;
        try {
            encoder.session = std::make_unique<Ort::Session>(*ort_env_, path.c_str(), session_options);
        } catch (const Ort::Exception& e) {
            throw std::runtime_error("Failed to load CLIP encoder '" + path + "': " + e.what());
        }

        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < encoder.session->GetInputCount(); ++i) {
            auto input_name = encoder.session->GetInputNameAllocated(i, allocator);
            encoder.input_names.emplace_back(input_name.get());
        }
        for (size_t i = 0; i < encoder.session->GetOutputCount(); ++i) {
            auto output_name = encoder.session->GetOutputNameAllocated(i, allocator);
            encoder.output_names.emplace_back(output_name.get());
        }
        if (encoder.input_names.empty() || encoder.output_names.empty()) {
            throw std::runtime_error("CLIP encoder has no inputs or outputs: " + path);
        }

        // Projected embeddings when exported by name, otherwise the first output
        auto it = std::find(encoder.output_names.begin(), encoder.output_names.end(), preferred_output);
        encoder.embeds_output = it != encoder.output_names.end() ? *it : encoder.output_names.front();
    }

    torch::Tensor run(OnnxEncoder& encoder, const std::vector<const char*>& input_names,
                      std::vector<Ort::Value>& inputs) {
        const char* output_name = encoder.embeds_output.c_str();
        auto outputs = encoder.session->Run(Ort::RunOptions{nullptr},
                                            input_names.data(), inputs.data(), inputs.size(),
                                            &output_name, 1);
        if (outputs.empty() || !outputs.front().IsTensor()) {
            throw std::runtime_error("CLIP encoder returned no tensor");
        }
        torch::Tensor features = output_to_tensor(outputs.front());
        if (features.dim() != 2) {
            throw std::runtime_error("CLIP encoder output '" + encoder.embeds_output +
                                     "' is not a [batch, dim] embedding");
        }
        return features;
    }

    torch::Tensor encode_image(const torch::Tensor& pixel_values) {
        torch::Tensor cpu = pixel_values.to(torch::kCPU, torch::kFloat).contiguous();
        std::vector<int64_t> shape(cpu.sizes().begin(), cpu.sizes().end());

        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<Ort::Value> inputs;
        inputs.push_back(Ort::Value::CreateTensor<float>(memory_info, cpu.data_ptr<float>(),
                                                         static_cast<size_t>(cpu.numel()),
                                                         shape.data(), shape.size()));

        std::vector<const char*> names = {image_encoder_.input_or_first("pixel_values").c_str()};

        try {
            return run(image_encoder_, names, inputs).to(device_);
        } catch (const Ort::Exception& e) {
            throw std::runtime_error("CLIP image encoder failed: " + std::string(e.what()));
        }
    }

    torch::Tensor encode_text(const std::vector<std::string>& phrases) {
        TokenBatch batch = tokenizer_->encode_batch(phrases);
        std::vector<int64_t> shape = {batch.batch_size, batch.sequence_length};

        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<Ort::Value> inputs;
        std::vector<const char*> names;

        inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, batch.input_ids.data(),
                                                           batch.input_ids.size(),
                                                           shape.data(), shape.size()));
        names.push_back(text_encoder_.input_or_first("input_ids").c_str());

        if (text_encoder_.has_input("attention_mask")) {
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, batch.attention_mask.data(),
                                                               batch.attention_mask.size(),
                                                               shape.data(), shape.size()));
            names.push_back("attention_mask");
        }

        try {
            return run(text_encoder_, names, inputs).to(device_);
        } catch (const Ort::Exception& e) {
            throw std::runtime_error("CLIP text encoder failed: " + std::string(e.what()));
        }
    }

private:
    ModelConfig config_;
    torch::Device device_;
    std::unique_ptr<Ort::Env> ort_env_;
    OnnxEncoder image_encoder_;
    OnnxEncoder text_encoder_;
    std::unique_ptr<ClipTokenizer> tokenizer_;
};

ClipOnnxModel::ClipOnnxModel(const ModelConfig& config, torch::Device device)
    : pimpl_(std::make_unique<Impl>(config, device)) {}

ClipOnnxModel::~ClipOnnxModel() = default;

torch::Tensor ClipOnnxModel::encode_image(const torch::Tensor& pixel_values) {
    return pimpl_->encode_image(pixel_values);
}

torch::Tensor ClipOnnxModel::encode_text(const std::vector<std::string>& phrases) {
    return pimpl_->encode_text(phrases);
}

} // namespace scenereel
