#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace sentry {
struct Frame { int id; cv::Mat bgr; };

using Boxes = std::vector<cv::Rect>;

struct DetectionResult {
    Boxes boxes;
    cv::Mat mask;   // cleaned binary mask, CV_8UC1, 0 or 255
};
}
