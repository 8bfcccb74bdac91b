#include "scene_renderer.hpp"
#include "process_runner.hpp"
#include "timecode.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace scenereel {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds;
    return oss.str();
}

} // namespace

SceneRenderer::SceneRenderer(const RenderConfig& config) : config_(config) {}

std::string SceneRenderer::clip_filename(int scene_id, SceneCategory category) {
    std::string name = to_string(category);
    std::replace(name.begin(), name.end(), ' ', '_');
    return "scene_" + std::to_string(scene_id + 1) + "_" + name + ".mp4";
}

std::optional<ClipReference> SceneRenderer::save_clip(const std::string& video_path,
                                                      const SceneClassification& record,
                                                      const std::string& output_directory,
                                                      int scene_id) const {
    try {
        double start = parse_timestamp(record.start_time);
        double end = parse_timestamp(record.end_time);
        if (end <= start) {
            std::cerr << "Error: scene " << scene_id + 1 << " has an empty interval ("
                      << record.start_time << " - " << record.end_time << "), not rendering" << std::endl;
            return std::nullopt;
        }

        std::filesystem::create_directories(output_directory);
        std::string output_path = (std::filesystem::path(output_directory) /
                                   clip_filename(scene_id, record.category)).string();

        std::string cmd = shell_quote(config_.ffmpeg) +
                          " -y -hide_banner -loglevel error" +
                          " -ss " + format_seconds(start) +
                          " -i " + shell_quote(video_path) +
                          " -t " + format_seconds(end - start) +
                          " -map 0:v:0 -map 0:a? -c:v libx264 -pix_fmt yuv420p -c:a aac" +
                          " -movflags +faststart " + shell_quote(output_path);

        int status = run_command(cmd);
        if (status != 0) {
            std::cerr << "Error: ffmpeg exited with status " << status << " while rendering scene "
                      << scene_id + 1 << std::endl;
            return std::nullopt;
        }

        if (!std::filesystem::exists(output_path)) {
            std::cerr << "Error: rendered clip is missing: " << output_path << std::endl;
            return std::nullopt;
        }

        std::cout << "Saved scene " << scene_id + 1 << " to " << output_path << std::endl;
        return ClipReference{output_path};
    } catch (const std::exception& e) {
        std::cerr << "Error: failed to render scene " << scene_id + 1 << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace scenereel
