#pragma once

#include "config.hpp"
#include "scene_types.hpp"
#include <optional>
#include <string>

namespace scenereel {

// Cuts classified scenes out of the source video as H.264/AAC MP4 clips
class SceneRenderer {
public:
    explicit SceneRenderer(const RenderConfig& config);

    // Encodes [start_time, end_time) of `record` into `output_directory`.
    // Every failure is logged and reported as std::nullopt.
    std::optional<ClipReference> save_clip(const std::string& video_path,
                                           const SceneClassification& record,
                                           const std::string& output_directory,
                                           int scene_id) const;

    // scene_<id + 1>_<Category_Name>.mp4
    static std::string clip_filename(int scene_id, SceneCategory category);

private:
    RenderConfig config_;
};

} // namespace scenereel
