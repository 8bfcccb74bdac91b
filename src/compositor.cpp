#include "compositor.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace scenereel {

namespace {

struct ClipSource {
    std::string path;
    double fps = 0.0;
    int frame_count = 0;
    cv::Size size;
    bool has_audio = false;
    int64_t output_frames = 0; // at the composite frame rate
};

ClipSource probe_clip(const std::string& path) {
    cv::VideoCapture cap(path);
    if (!cap.isOpened()) {
        throw std::runtime_error("Cannot open clip: " + path);
    }

    ClipSource source;
    source.path = path;
    source.fps = cap.get(cv::CAP_PROP_FPS);
    source.frame_count = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    source.size = cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                           static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));

    if (source.fps <= 0.0 || source.size.width <= 0 || source.size.height <= 0) {
        throw std::runtime_error("Clip reports no frame rate or size: " + path);
    }
    return source;
}

// ffmpeg exits non-zero when the map matches no stream
bool has_audio_stream(const std::string& ffmpeg, const std::string& path) {
    return run_command(shell_quote(ffmpeg) + " -nostdin -v quiet -i " + shell_quote(path) +
                       " -map 0:a:0 -frames:a 1 -f null - > /dev/null 2>&1") == 0;
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

// One audio segment per clip, each exactly as long as the clip's video, so
// clip boundaries stay aligned and the video length decides the duration.
// Clips without audio contribute silence.
std::string concat_audio_filter(const std::vector<ClipSource>& sources, double fps) {
    std::ostringstream graph;
    int input = 1;
    for (size_t i = 0; i < sources.size(); ++i) {
        const std::string duration = format_number(sources[i].output_frames / fps);
        if (sources[i].has_audio) {
            graph << "[" << input++ << ":a:0]aresample=48000,"
                  << "aformat=sample_fmts=fltp:channel_layouts=stereo,apad,";
        } else {
            graph << "anullsrc=r=48000:cl=stereo,";
        }
        graph << "atrim=duration=" << duration << ",asetpts=PTS-STARTPTS[a" << i << "];";
    }
    for (size_t i = 0; i < sources.size(); ++i) {
        graph << "[a" << i << "]";
    }
    graph << "concat=n=" << sources.size() << ":v=0:a=1[aout]";
    return graph.str();
}

} // namespace

cv::Mat add_caption(const cv::Mat& rgb, const std::string& text, const CaptionStyle& style) {
    if (rgb.empty() || rgb.type() != CV_8UC3) {
        throw std::invalid_argument("Caption overlay expects a non-empty 8-bit RGB frame");
    }

    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

    int baseline = 0;
    cv::Size text_size = cv::getTextSize(text, style.font, style.font_scale, style.thickness, &baseline);
    int text_x = (bgr.cols - text_size.width) / 2;
    int text_y = (bgr.rows + text_size.height) / 2;

    cv::rectangle(bgr,
                  cv::Point(text_x, text_y - text_size.height - style.padding),
                  cv::Point(text_x + text_size.width, text_y + style.padding),
                  cv::Scalar(0, 0, 0), cv::FILLED);
    cv::putText(bgr, text, cv::Point(text_x, text_y), style.font, style.font_scale,
                style.color, style.thickness, cv::LINE_AA);

    cv::Mat result;
    cv::cvtColor(bgr, result, cv::COLOR_BGR2RGB);
    return result;
}

Compositor::Compositor(const RenderConfig& config, const CaptionStyle& style)
    : config_(config), style_(style) {}

ClipReference Compositor::compose(const std::vector<std::string>& clip_paths,
                                  const std::string& output_path,
                                  const std::optional<std::string>& caption,
                                  const std::optional<std::string>& audio_path) const {
    if (clip_paths.empty()) {
        throw std::invalid_argument("No clips to compose");
    }
    if (audio_path && !std::filesystem::exists(*audio_path)) {
        throw std::runtime_error("Audio track not found: " + *audio_path);
    }

    std::vector<ClipSource> sources;
    for (const auto& path : clip_paths) {
        sources.push_back(probe_clip(path));
    }

    // libx264 with yuv420p needs even dimensions
    cv::Size canvas_size(0, 0);
    double fps = 0.0;
    for (const auto& source : sources) {
        canvas_size.width = std::max(canvas_size.width, source.size.width);
        canvas_size.height = std::max(canvas_size.height, source.size.height);
        fps = std::max(fps, source.fps);
    }
    canvas_size.width += canvas_size.width % 2;
    canvas_size.height += canvas_size.height % 2;

    bool any_audio = false;
    for (auto& source : sources) {
        source.output_frames = std::llround(source.frame_count / source.fps * fps);
        if (!audio_path) {
            source.has_audio = has_audio_stream(config_.ffmpeg, source.path);
            any_audio = any_audio || source.has_audio;
        }
    }

    std::cout << "Composing " << sources.size() << " clip(s) into " << output_path << " ("
              << canvas_size.width << "x" << canvas_size.height << " @ " << fps << " fps)" << std::endl;

    auto parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::string audio_args;
    if (audio_path) {
        audio_args = " -i " + shell_quote(*audio_path) + " -map 0:v:0 -map 1:a:0 -af apad -shortest";
    } else if (any_audio) {
        for (const auto& source : sources) {
            if (source.has_audio) {
                audio_args += " -i " + shell_quote(source.path);
            }
        }
        audio_args += " -filter_complex " + shell_quote(concat_audio_filter(sources, fps)) +
                      " -map 0:v:0 -map '[aout]' -shortest";
    } else {
        audio_args = " -map 0:v:0";
    }

    std::string cmd = shell_quote(config_.ffmpeg) +
                      " -y -hide_banner -loglevel error" +
                      " -f rawvideo -pix_fmt rgb24 -s " + std::to_string(canvas_size.width) + "x" +
                      std::to_string(canvas_size.height) + " -r " + format_number(fps) + " -i -" +
                      audio_args +
                      " -c:v libx264 -pix_fmt yuv420p -c:a aac -movflags +faststart " +
                      shell_quote(output_path);

    PipeWriter encoder(cmd);
    int64_t written = 0;
    cv::Mat canvas(canvas_size, CV_8UC3);

    for (const auto& source : sources) {
        cv::VideoCapture cap(source.path);
        if (!cap.isOpened()) {
            throw std::runtime_error("Cannot open clip: " + source.path);
        }

        // Resample by time: output frame k shows the source frame at k / fps
        const int64_t output_frames = source.output_frames;
        const cv::Rect placement((canvas_size.width - source.size.width) / 2,
                                 (canvas_size.height - source.size.height) / 2,
                                 source.size.width, source.size.height);

        cv::Mat frame, rgb;
        int64_t decoded_index = -1;
        for (int64_t k = 0; k < output_frames; ++k) {
            int64_t wanted = static_cast<int64_t>(std::floor(k * source.fps / fps));
            bool exhausted = false;
            while (decoded_index < wanted) {
                if (!cap.read(frame)) {
                    exhausted = true;
                    break;
                }
                ++decoded_index;
            }
            if (exhausted) {
                // Frame count overestimated; stop this clip at its real end
                break;
            }

            cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);
            canvas.setTo(cv::Scalar(0, 0, 0));
            if (rgb.size() == source.size) {
                rgb.copyTo(canvas(placement));
            } else {
                cv::Mat fitted;
                cv::resize(rgb, fitted, source.size);
                fitted.copyTo(canvas(placement));
            }

            const cv::Mat& out = caption ? add_caption(canvas, *caption, style_) : canvas;
            encoder.write(out.data, out.total() * out.elemSize());
            ++written;
        }
        cap.release();
    }

    int status = encoder.close();
    if (written == 0) {
        throw std::runtime_error("No frames could be decoded from the input clips");
    }
    if (status != 0) {
        throw std::runtime_error("ffmpeg exited with status " + std::to_string(status) +
                                 " while composing " + output_path);
    }
    if (!std::filesystem::exists(output_path)) {
        throw std::runtime_error("Composite was not written: " + output_path);
    }

    std::cout << "Wrote " << written << " frames (" << written / fps << "s) to " << output_path << std::endl;
    return ClipReference{output_path};
}

} // namespace scenereel
