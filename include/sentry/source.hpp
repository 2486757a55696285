#pragma once
#include <opencv2/videoio.hpp>
#include <string>

namespace sentry {
// True when s is all digits and fits an int; index receives the value.
bool parse_camera_index(const std::string& s, int& index);

// Opens a camera index, video file or image-sequence pattern. Backend errors
// are logged and reported as false.
bool open_source(cv::VideoCapture& cap, const std::string& in);
}
