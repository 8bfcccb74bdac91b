#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scenereel {

struct StreamInfo {
    std::string format_id;
    std::string container;   // file extension, e.g. "mp4"
    int width = 0;
    int height = 0;
    bool progressive = false; // audio and video in one file
};

// Flattens the "formats" array of a yt-dlp metadata document
std::vector<StreamInfo> parse_stream_catalog(const nlohmann::json& metadata);

// Highest-resolution progressive stream in `container`, if any
std::optional<StreamInfo> select_best_progressive(const std::vector<StreamInfo>& streams,
                                                  const std::string& container);

// True for http:// and https:// inputs
bool is_remote(const std::string& input);

class VideoDownloader {
public:
    explicit VideoDownloader(const DownloadConfig& config);
    ~VideoDownloader();

    // Returns the local path of the downloaded file, or std::nullopt when the
    // source offers no matching progressive stream. Transport and tool
    // failures throw std::runtime_error.
    std::optional<std::string> download(const std::string& url);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace scenereel
