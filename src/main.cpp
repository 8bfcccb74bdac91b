#include "config.hpp"
#include "report.hpp"
#include "scene_pipeline.hpp"
#include "video_io.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT\n"
              << "INPUT is a video URL or a local video file.\n"
              << "Options:\n"
              << "  --config FILE          JSON configuration file\n"
              << "  --output-dir DIR       Directory for rendered scene clips\n"
              << "  --category CAT         Keep only action or context scenes\n"
              << "  --min-confidence X     Minimum category confidence (default: 0)\n"
              << "  --max-scenes N         Keep at most N scenes, most confident first\n"
              << "  --no-render            Classify only, do not write clips\n"
              << "  --compose FILE         Concatenate the rendered clips into FILE\n"
              << "  --caption TEXT         Caption drawn on the composite\n"
              << "  --audio FILE           Replacement audio track for the composite\n"
              << "  --output FILE          Output JSON file\n"
              << "  --cpu                  Force CPU usage\n"
              << "  --info                 Show video information only\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path;
    std::string input;
    std::string output_file;
    std::optional<std::string> output_dir;
    bool force_cpu = false;
    bool info_only = false;
    scenereel::PipelineOptions options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&](const char* name) -> std::string {
                if (++i >= argc) {
                    throw std::invalid_argument(std::string("Missing value for ") + name);
                }
                return argv[i];
            };

            if (arg == "--config") {
                config_path = next("--config");
            } else if (arg == "--output-dir") {
                output_dir = next("--output-dir");
            } else if (arg == "--category") {
                std::string category = next("--category");
                if (category == "action") {
                    options.selection.category = scenereel::SceneCategory::Action;
                } else if (category == "context") {
                    options.selection.category = scenereel::SceneCategory::Context;
                } else {
                    throw std::invalid_argument("--category must be 'action' or 'context'");
                }
            } else if (arg == "--min-confidence") {
                options.selection.min_confidence = std::stod(next("--min-confidence"));
            } else if (arg == "--max-scenes") {
                options.selection.max_scenes = std::stoul(next("--max-scenes"));
            } else if (arg == "--no-render") {
                options.render = false;
            } else if (arg == "--compose") {
                options.compose_output = next("--compose");
            } else if (arg == "--caption") {
                options.caption = next("--caption");
            } else if (arg == "--audio") {
                options.audio_path = next("--audio");
            } else if (arg == "--output") {
                output_file = next("--output");
            } else if (arg == "--cpu") {
                force_cpu = true;
            } else if (arg == "--info") {
                info_only = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (input.empty()) {
                input = arg;
            } else {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (input.empty()) {
        std::cerr << "Error: No input video provided\n";
        return 1;
    }

    try {
        scenereel::quiet_opencv_logging();

        scenereel::PipelineConfig config = config_path.empty()
            ? scenereel::default_config()
            : scenereel::load_config(config_path);
        if (output_dir) config.render.output_directory = *output_dir;
        if (force_cpu) config.model.use_gpu = false;
        scenereel::validate_config(config);

        scenereel::ScenePipeline pipeline(config);

        if (info_only) {
            std::string video_path = pipeline.acquire(input);
            json info_json = scenereel::to_json(pipeline.get_video_info(video_path));
            info_json["video_path"] = video_path;
            std::cout << info_json.dump(2) << std::endl;
            return 0;
        }

        auto result = pipeline.run(input, options);
        scenereel::write_report(scenereel::to_json(result), output_file);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
