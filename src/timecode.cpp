#include "timecode.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace scenereel {

Timecode::Timecode(int64_t frame, double fps) : frame_(frame), fps_(fps) {
    if (frame < 0) {
        throw std::invalid_argument("Timecode frame must be non-negative");
    }
    if (!(fps > 0.0)) {
        throw std::invalid_argument("Timecode frame rate must be positive");
    }
}

Timecode Timecode::from_seconds(double seconds, double fps) {
    if (seconds < 0.0) {
        throw std::invalid_argument("Timecode seconds must be non-negative");
    }
    return Timecode(static_cast<int64_t>(std::llround(seconds * fps)), fps);
}

double Timecode::seconds() const {
    return fps_ > 0.0 ? static_cast<double>(frame_) / fps_ : 0.0;
}

std::string Timecode::to_string() const {
    // Work in integer milliseconds so rounding never produces "60.000" seconds
    int64_t total_ms = static_cast<int64_t>(std::llround(seconds() * 1000.0));
    int64_t hours = total_ms / 3600000;
    total_ms %= 3600000;
    int64_t minutes = total_ms / 60000;
    total_ms %= 60000;
    int64_t secs = total_ms / 1000;
    int64_t millis = total_ms % 1000;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld.%03lld",
                  static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(secs), static_cast<long long>(millis));
    return buffer;
}

double parse_timestamp(const std::string& timestamp) {
    std::vector<std::string> fields;
    std::stringstream ss(timestamp);
    std::string field;
    while (std::getline(ss, field, ':')) {
        fields.push_back(field);
    }

    // getline drops an empty trailing field, so "0:01:30:" would pass as three
    if (fields.size() != 3 || timestamp.back() == ':') {
        throw std::invalid_argument("Timestamp must be H:MM:SS[.fff]: '" + timestamp + "'");
    }

    double values[3];
    for (size_t i = 0; i < 3; ++i) {
        // Plain decimal only: stod would also take signs, "nan", "inf" and hex
        bool decimal = !fields[i].empty() &&
                       std::all_of(fields[i].begin(), fields[i].end(), [](char c) {
                           return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
                       });
        if (!decimal) {
            throw std::invalid_argument("Non-numeric timestamp field in '" + timestamp + "'");
        }

        size_t consumed = 0;
        try {
            values[i] = std::stod(fields[i], &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument("Non-numeric timestamp field in '" + timestamp + "'");
        }
        if (consumed != fields[i].size() || !std::isfinite(values[i])) {
            throw std::invalid_argument("Invalid timestamp field in '" + timestamp + "'");
        }
    }

    // Hours and minutes are whole units; only the seconds field is fractional
    return static_cast<double>(static_cast<int64_t>(values[0])) * 3600.0 +
           static_cast<double>(static_cast<int64_t>(values[1])) * 60.0 +
           values[2];
}

} // namespace scenereel
