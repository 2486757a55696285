#include "sentry/source.hpp"
#include "sentry/logger.hpp"
#include <cctype>
#include <climits>

namespace sentry {
bool parse_camera_index(const std::string& s, int& index) {
  if (s.empty()) return false;
  long long v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
    if (v > INT_MAX) return false;
  }
  index = static_cast<int>(v);
  return true;
}

bool open_source(cv::VideoCapture& cap, const std::string& in) {
  try {
    int cam = 0;
    if (parse_camera_index(in, cam)) cap.open(cam);
    else cap.open(in);
  } catch (const cv::Exception& e) {
    Logger::error("open %s: %s", in.c_str(), e.what());
    return false;
  }
  return cap.isOpened();
}
}
