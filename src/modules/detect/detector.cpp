#include "sentry/detector.hpp"
#include "sentry/errors.hpp"
#include "sentry/logger.hpp"
#include <string>

namespace sentry {
MotionDetector::MotionDetector(const DetectionConfig& cfg, int channels)
    : cfg_(cfg), channels_(channels) {
  cfg_.validate();
  if (channels_ != 1 && channels_ != 3) throw InvalidConfig("channels must be 1 or 3");
  model_ = cv::createBackgroundSubtractorMOG2(cfg_.history, cfg_.var_threshold, cfg_.detect_shadows);
  kernel_ = make_kernel(cfg_.kernel_shape, cfg_.morph_kernel_size);
  Logger::debug("detector: history=%d var_threshold=%.1f shadows=%d kernel=%d min_area=%d",
                cfg_.history, cfg_.var_threshold, cfg_.detect_shadows ? 1 : 0,
                cfg_.morph_kernel_size, cfg_.min_contour_area);
}

void MotionDetector::check_frame(const cv::Mat& bgr) const {
  if (bgr.empty() || bgr.cols <= 0 || bgr.rows <= 0) throw InvalidFrame("empty frame");
  if (bgr.depth() != CV_8U) throw InvalidFrame("expected 8-bit pixels");
  if (bgr.channels() != channels_)
    throw InvalidFrame("expected " + std::to_string(channels_) + " channels, got " +
                       std::to_string(bgr.channels()));
  if (frames_seen_ > 0 && bgr.size() != size_)
    throw InvalidFrame("frame size changed from " + std::to_string(size_.width) + "x" +
                       std::to_string(size_.height) + " to " + std::to_string(bgr.cols) + "x" +
                       std::to_string(bgr.rows));
}

DetectionResult MotionDetector::detect(const cv::Mat& bgr) {
  check_frame(bgr);
  if (frames_seen_ == 0) size_ = bgr.size();

  cv::Mat raw;
  model_->apply(bgr, raw, cfg_.learning_rate);
  ++frames_seen_;

  DetectionResult res;
  res.mask = clean_mask(binarize_mask(raw, model_->getShadowValue()), kernel_);
  res.boxes = find_regions(res.mask, cfg_.min_contour_area);
  return res;
}
}
