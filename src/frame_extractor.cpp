#include "frame_extractor.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>
#include <stdexcept>

namespace scenereel {

class FrameExtractor::Impl {
public:
    explicit Impl(const ExtractionConfig& config) : config_(config) {}

    SceneFrames extract_scene(cv::VideoCapture& cap, int scene_index, const SceneInterval& scene) {
        SceneFrames bundle;
        bundle.scene_index = scene_index;
        bundle.start_time = scene.start;
        bundle.end_time = scene.end;

        const int64_t end = scene.end.frames();
        cap.set(cv::CAP_PROP_POS_FRAMES, static_cast<double>(scene.start.frames()));

        int64_t offset = 0;
        cv::Mat frame;
        while (static_cast<int64_t>(cap.get(cv::CAP_PROP_POS_FRAMES)) < end) {
            int64_t before = static_cast<int64_t>(cap.get(cv::CAP_PROP_POS_FRAMES));
            if (!cap.read(frame)) {
                // No progress means the stream is exhausted
                if (static_cast<int64_t>(cap.get(cv::CAP_PROP_POS_FRAMES)) <= before) {
                    break;
                }
                ++offset;
                continue;
            }

            if (offset % config_.frame_stride == 0) {
                bundle.frames.push_back(frame.clone());
            }
            ++offset;
        }

        if (!bundle.frames.empty()) {
            bundle.first_frame = bundle.frames.front();
        }
        return bundle;
    }

    int frame_stride() const { return config_.frame_stride; }

private:
    ExtractionConfig config_;
};

FrameExtractor::FrameExtractor(const ExtractionConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {
    if (config.frame_stride < 1) {
        throw std::invalid_argument("frame_stride must be >= 1");
    }
}

FrameExtractor::~FrameExtractor() = default;

std::map<int, SceneFrames> FrameExtractor::extract(const std::string& video_path,
                                                   const std::vector<SceneInterval>& scenes) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw std::runtime_error("Failed to open video: " + video_path);
    }

    std::cout << "Extracting frames from " << video_path
              << " (scenes: " << scenes.size()
              << ", stride: " << pimpl_->frame_stride() << ")" << std::endl;

    std::map<int, SceneFrames> result;
    for (size_t i = 0; i < scenes.size(); ++i) {
        int index = static_cast<int>(i);
        result[index] = pimpl_->extract_scene(cap, index, scenes[i]);
        if (result[index].frames.empty()) {
            std::cerr << "Warning: no frames decoded for scene " << index + 1 << std::endl;
        }
    }

    cap.release();
    return result;
}

} // namespace scenereel
