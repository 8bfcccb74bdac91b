#include "video_io.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <stdexcept>

namespace scenereel {

VideoInfo get_video_info(const std::string& video_path) {
    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) {
        throw std::runtime_error("Cannot open video file: " + video_path);
    }

    VideoInfo info;
    info.total_frames = static_cast<int>(cap.get(cv::CAP_PROP_FRAME_COUNT));
    info.fps = cap.get(cv::CAP_PROP_FPS);
    info.duration = info.fps > 0.0 ? info.total_frames / info.fps : 0.0;
    info.frame_size = cv::Size(
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
        static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT))
    );
    info.codec = fourcc_to_string(static_cast<int>(cap.get(cv::CAP_PROP_FOURCC)));

    return info;
}

std::string fourcc_to_string(int fourcc) {
    char codec_chars[5];
    codec_chars[0] = static_cast<char>(fourcc & 0xFF);
    codec_chars[1] = static_cast<char>((fourcc >> 8) & 0xFF);
    codec_chars[2] = static_cast<char>((fourcc >> 16) & 0xFF);
    codec_chars[3] = static_cast<char>((fourcc >> 24) & 0xFF);
    codec_chars[4] = '\0';

    std::string codec;
    for (int i = 0; i < 4 && codec_chars[i] != '\0'; ++i) {
        codec += codec_chars[i];
    }
    return codec;
}

void quiet_opencv_logging() {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_ERROR);
}

} // namespace scenereel
