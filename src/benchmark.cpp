#include "config.hpp"
#include "description_vocabulary.hpp"
#include "embedding_model.hpp"
#include "frame_extractor.hpp"
#include "scene_classifier.hpp"
#include "scene_detector.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <opencv2/opencv.hpp>
#include <random>
#include <thread>

namespace scenereel {

// Stand-in for CLIP: mean color as the image feature, fixed random text
// features. Keeps classification cost dominated by the pipeline itself.
class ColorEmbeddingModel : public EmbeddingModel {
public:
    torch::Tensor encode_image(const torch::Tensor& pixel_values) override {
        return pixel_values.mean({2, 3});
    }

    torch::Tensor encode_text(const std::vector<std::string>& phrases) override {
        torch::manual_seed(42);
        return torch::randn({static_cast<int64_t>(phrases.size()), 3});
    }

    std::string name() const override { return "color-benchmark"; }
};

class BenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        config_ = default_config();
        create_synthetic_video();
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        std::remove("benchmark_video.avi");
    }

protected:
    void create_synthetic_video() {
        cv::VideoWriter writer;
        int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        writer.open("benchmark_video.avi", fourcc, 30.0, cv::Size(1280, 720));

        if (!writer.isOpened()) {
            throw std::runtime_error("Failed to create benchmark video file");
        }

        std::mt19937 gen(7);
        std::uniform_int_distribution<> dis(0, 255);

        // 10 seconds at 30fps, a new background every 2 seconds
        cv::Scalar background;
        for (int i = 0; i < 300; ++i) {
            if (i % 60 == 0) {
                background = cv::Scalar(dis(gen), dis(gen), dis(gen));
            }
            cv::Mat frame(720, 1280, CV_8UC3, background);

            int circle_x = (i * 5) % frame.cols;
            int circle_y = 300 + static_cast<int>(100 * std::sin(i * 0.1));
            cv::circle(frame, cv::Point(circle_x, circle_y), 50, cv::Scalar(255, 255, 255), -1);

            writer << frame;
        }
        writer.release();
    }

    PipelineConfig config_;
};

// Per-frame cost of the HSV content detector at detection resolution
static void BM_ContentDetector(benchmark::State& state) {
    const int width = static_cast<int>(state.range(0));
    const int height = width * 9 / 16;
    const int factor = compute_downscale_factor(width);

    cv::Mat a(height, width, CV_8UC3), b(height, width, CV_8UC3);
    cv::randu(a, cv::Scalar::all(0), cv::Scalar::all(255));
    cv::randu(b, cv::Scalar::all(0), cv::Scalar::all(255));
    cv::Mat small_a, small_b;
    cv::resize(a, small_a, cv::Size(width / factor, height / factor), 0, 0, cv::INTER_AREA);
    cv::resize(b, small_b, cv::Size(width / factor, height / factor), 0, 0, cv::INTER_AREA);

    ContentDetector detector(27.0, 15);
    int64_t frame_num = 0;
    for (auto _ : state) {
        auto cut = detector.process_frame(frame_num, (frame_num % 2) ? small_a : small_b);
        benchmark::DoNotOptimize(cut);
        ++frame_num;
    }
    state.counters["downscale"] = factor;
    state.SetItemsProcessed(state.iterations());
}

static void BM_ClipPreprocess(benchmark::State& state) {
    cv::Mat rgb(720, 1280, CV_8UC3);
    cv::randu(rgb, cv::Scalar::all(0), cv::Scalar::all(255));

    for (auto _ : state) {
        auto tensor = preprocess_clip_image(rgb, 224);
        benchmark::DoNotOptimize(tensor.data_ptr());
    }
    state.SetItemsProcessed(state.iterations());
}

// Scene detection over the whole synthetic video
BENCHMARK_DEFINE_F(BenchmarkFixture, SceneDetection)(benchmark::State& state) {
    SceneDetector detector(config_.detection);

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto scenes = detector.find_scenes("benchmark_video.avi");

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["scenes"] = static_cast<double>(scenes.size());
    }
}

// Classification of every detected scene with the stand-in model
BENCHMARK_DEFINE_F(BenchmarkFixture, SceneClassification)(benchmark::State& state) {
    config_.extraction.frame_stride = static_cast<int>(state.range(0));

    SceneDetector detector(config_.detection);
    FrameExtractor extractor(config_.extraction);
    auto scenes = detector.find_scenes("benchmark_video.avi");
    auto frames = extractor.extract("benchmark_video.avi", scenes);

    ClassifierContext context(std::make_unique<ColorEmbeddingModel>(),
                              [](const cv::Mat& rgb) { return preprocess_clip_image(rgb, 224); },
                              torch::Device(torch::kCPU));
    SceneClassifier classifier(context, DescriptionVocabulary::from_config(config_.vocabulary));

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto results = classifier.classify(frames);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["scenes"] = static_cast<double>(results.size());
        state.counters["stride"] = static_cast<double>(config_.extraction.frame_stride);
    }
}

BENCHMARK(BM_ContentDetector)->Arg(640)->Arg(1280)->Arg(1920)->Arg(3840);
BENCHMARK(BM_ClipPreprocess)->Unit(benchmark::kMicrosecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, SceneDetection)->UseManualTime()->Unit(benchmark::kMillisecond);
BENCHMARK_REGISTER_F(BenchmarkFixture, SceneClassification)->Arg(1)->Arg(5)->Arg(15)->UseManualTime()->Unit(benchmark::kMillisecond);

} // namespace scenereel

int main(int argc, char** argv) {
    std::cout << "SceneReel - Performance Benchmarks" << std::endl;
    std::cout << "==================================" << std::endl;

    std::cout << "System Information:" << std::endl;
    std::cout << "  CPU Cores: " << std::thread::hardware_concurrency() << std::endl;
    std::cout << "  CUDA available: " << (torch::cuda::is_available() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
