#pragma once

#include "scene_types.hpp"
#include <string>

namespace scenereel {

// Probes container metadata through OpenCV. Throws std::runtime_error if
// the file cannot be opened.
VideoInfo get_video_info(const std::string& video_path);

// Four-character code as printable text, e.g. "avc1"
std::string fourcc_to_string(int fourcc);

// Lowers OpenCV's own log output to errors only
void quiet_opencv_logging();

} // namespace scenereel
