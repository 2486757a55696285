#include "sentry/overlay.hpp"
#include "sentry/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <string>

namespace sentry {
namespace {
const cv::Scalar kBoxColor{0, 255, 0};
const cv::Scalar kBannerColor{0, 0, 255};
constexpr int kThickness = 2;
}

cv::Mat draw_detections(const cv::Mat& bgr, const Boxes& boxes, int count){
  if (bgr.empty()) throw InvalidFrame("cannot annotate an empty frame");
  cv::Mat out = bgr.clone();
  for (size_t i = 0; i < boxes.size(); ++i) {
    const cv::Rect& b = boxes[i];
    cv::rectangle(out, b, kBoxColor, kThickness);
    cv::putText(out, "Object " + std::to_string(i + 1), {b.x, b.y - 10},
                cv::FONT_HERSHEY_SIMPLEX, 0.5, kBoxColor, kThickness);
  }
  cv::putText(out, "Detected: " + std::to_string(count) + " objects", {10, 30},
              cv::FONT_HERSHEY_SIMPLEX, 1.0, kBannerColor, kThickness);
  return out;
}
}
