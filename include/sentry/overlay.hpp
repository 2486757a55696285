#pragma once
#include "frame.hpp"

namespace sentry {
// Copy of bgr with every box outlined and labelled "Object i", plus a
// "Detected: <count> objects" banner at the top left. bgr is not modified.
cv::Mat draw_detections(const cv::Mat& bgr, const Boxes& boxes, int count);
}
