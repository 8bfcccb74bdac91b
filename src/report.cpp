#include "report.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scenereel {

using json = nlohmann::json;

std::string base64_encode(const unsigned char* data, size_t length) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((length + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < length; i += 3) {
        uint32_t chunk = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += alphabet[(chunk >> 6) & 0x3F];
        out += alphabet[chunk & 0x3F];
    }

    size_t remaining = length - i;
    if (remaining == 1) {
        uint32_t chunk = data[i] << 16;
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        uint32_t chunk = (data[i] << 16) | (data[i + 1] << 8);
        out += alphabet[(chunk >> 18) & 0x3F];
        out += alphabet[(chunk >> 12) & 0x3F];
        out += alphabet[(chunk >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

std::string image_to_base64(const cv::Mat& bgr) {
    if (bgr.empty()) {
        return "";
    }

    std::vector<unsigned char> buffer;
    if (!cv::imencode(".jpg", bgr, buffer)) {
        throw std::runtime_error("JPEG encoding failed");
    }
    return base64_encode(buffer.data(), buffer.size());
}

json to_json(const VideoInfo& info) {
    json info_json;
    info_json["total_frames"] = info.total_frames;
    info_json["fps"] = info.fps;
    info_json["duration"] = info.duration;
    info_json["frame_size"] = {info.frame_size.width, info.frame_size.height};
    info_json["codec"] = info.codec;
    return info_json;
}

json to_json(const SceneClassification& record) {
    json record_json;
    record_json["category"] = to_string(record.category);
    record_json["confidence"] = record.confidence;
    record_json["action_confidence"] = record.action_confidence;
    record_json["context_confidence"] = record.context_confidence;
    record_json["start_time"] = record.start_time;
    record_json["end_time"] = record.end_time;
    record_json["duration"] = record.duration;
    record_json["best_description"] = record.best_description;
    record_json["phrase_scores"] = record.phrase_scores;
    record_json["valid_frames"] = record.valid_frames;
    record_json["first_frame"] = image_to_base64(record.first_frame);
    return record_json;
}

json to_json(const PipelineResult& result) {
    json output_json;
    output_json["video_path"] = result.video_path;
    output_json["video_info"] = to_json(result.video_info);

    json scenes = json::array();
    for (size_t i = 0; i < result.scenes.size(); ++i) {
        const auto& scene = result.scenes[i];
        json scene_json;
        scene_json["index"] = static_cast<int>(i);
        scene_json["start_time"] = scene.start.to_string();
        scene_json["end_time"] = scene.end.to_string();
        scene_json["start_frame"] = scene.start.frames();
        scene_json["end_frame"] = scene.end.frames();

        auto record = result.classifications.find(static_cast<int>(i));
        if (record != result.classifications.end()) {
            scene_json["classification"] = to_json(record->second);
        }
        auto clip = result.clips.find(static_cast<int>(i));
        if (clip != result.clips.end()) {
            scene_json["clip_path"] = clip->second.path;
        }
        scenes.push_back(scene_json);
    }
    output_json["scenes"] = scenes;
    output_json["selected_scenes"] = result.selected;

    if (result.composite) {
        output_json["composite_path"] = result.composite->path;
    }
    output_json["processing_time_ms"] = result.processing_time.count();
    return output_json;
}

void write_report(const json& report, const std::string& path) {
    if (path.empty()) {
        std::cout << report.dump(2) << std::endl;
        return;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not write report: " + path);
    }
    file << report.dump(2);
    std::cout << "Results saved to: " << path << std::endl;
}

} // namespace scenereel
