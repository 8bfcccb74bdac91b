#include "video_downloader.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace scenereel {

std::vector<StreamInfo> parse_stream_catalog(const nlohmann::json& metadata) {
    std::vector<StreamInfo> streams;
    if (!metadata.contains("formats") || !metadata["formats"].is_array()) {
        return streams;
    }

    for (const auto& format : metadata["formats"]) {
        StreamInfo info;
        info.format_id = format.value("format_id", "");
        info.container = format.value("ext", "");

        if (format.contains("width") && format["width"].is_number()) {
            info.width = format["width"].get<int>();
        }
        if (format.contains("height") && format["height"].is_number()) {
            info.height = format["height"].get<int>();
        }

        // yt-dlp reports "none" for a missing track; null means unknown
        auto has_track = [&format](const char* key) {
            return format.contains(key) && format[key].is_string() &&
                   format[key].get<std::string>() != "none";
        };
        info.progressive = has_track("vcodec") && has_track("acodec");

        if (!info.format_id.empty()) {
            streams.push_back(std::move(info));
        }
    }

    return streams;
}

std::optional<StreamInfo> select_best_progressive(const std::vector<StreamInfo>& streams,
                                                  const std::string& container) {
    std::optional<StreamInfo> best;
    for (const auto& stream : streams) {
        if (!stream.progressive || stream.container != container) {
            continue;
        }
        if (!best || stream.height > best->height ||
            (stream.height == best->height && stream.width > best->width)) {
            best = stream;
        }
    }
    return best;
}

bool is_remote(const std::string& input) {
    return input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0;
}

class VideoDownloader::Impl {
public:
    explicit Impl(const DownloadConfig& config) : config_(config) {}

    std::optional<std::string> download(const std::string& url) {
        std::cout << "Fetching stream catalog for " << url << std::endl;

        std::string catalog_cmd = shell_quote(config_.downloader) +
                                  " --quiet --no-warnings --dump-single-json " + shell_quote(url);
        nlohmann::json metadata;
        try {
            metadata = nlohmann::json::parse(execute_command(catalog_cmd));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Malformed stream catalog for " + url + ": " + e.what());
        }

        auto stream = select_best_progressive(parse_stream_catalog(metadata), config_.container);
        if (!stream) {
            std::cout << "No progressive " << config_.container << " stream available for " << url << std::endl;
            return std::nullopt;
        }

        std::cout << "Selected stream " << stream->format_id << " (" << stream->width << "x"
                  << stream->height << ")" << std::endl;

        std::filesystem::create_directories(config_.storage_root);
        std::string output_template = (std::filesystem::path(config_.storage_root) / "%(title)s.%(ext)s").string();

        std::string download_cmd = shell_quote(config_.downloader) +
                                   " --quiet --no-warnings --no-simulate --print after_move:filepath" +
                                   " -f " + shell_quote(stream->format_id) +
                                   " -o " + shell_quote(output_template) + " " + shell_quote(url);
        std::string output = execute_command(download_cmd);

        // The final path is the last non-empty line printed
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.pop_back();
        }
        std::string path = output.substr(output.find_last_of('\n') == std::string::npos
                                             ? 0 : output.find_last_of('\n') + 1);

        if (path.empty() || !std::filesystem::exists(path)) {
            throw std::runtime_error("Download reported no output file for " + url);
        }

        std::cout << "Downloaded video to: " << path << std::endl;
        return path;
    }

private:
    DownloadConfig config_;
};

VideoDownloader::VideoDownloader(const DownloadConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

VideoDownloader::~VideoDownloader() = default;

std::optional<std::string> VideoDownloader::download(const std::string& url) {
    return pimpl_->download(url);
}

} // namespace scenereel
