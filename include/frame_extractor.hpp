#pragma once

#include "config.hpp"
#include "scene_types.hpp"
#include <opencv2/opencv.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace scenereel {

class FrameExtractor {
public:
    explicit FrameExtractor(const ExtractionConfig& config);
    ~FrameExtractor();

    // Decodes the frames of every interval, keyed by scene index
    std::map<int, SceneFrames> extract(const std::string& video_path,
                                       const std::vector<SceneInterval>& scenes);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace scenereel
