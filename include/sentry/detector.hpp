#pragma once
#include "config.hpp"
#include "frame.hpp"
#include <opencv2/video/background_segm.hpp>

namespace sentry {
// Shadow pixels and anything not above shadow_value become background (0).
cv::Mat binarize_mask(const cv::Mat& raw, int shadow_value);

// Opening followed by closing with the same structuring element.
cv::Mat clean_mask(const cv::Mat& binary, const cv::Mat& kernel);

// Bounding boxes of the 8-connected foreground regions of a binary mask whose
// box area is at least min_area, in labelling order (deterministic for a given mask).
Boxes find_regions(const cv::Mat& binary, int min_area);

cv::Mat make_kernel(KernelShape shape, int size);

/**
 * Motion detector over a Gaussian-mixture background model.
 *
 * Every detect() call teaches the model, so a detector must see each frame of
 * one camera exactly once and in order. Not thread-safe: one writer only.
 * Move-only: a copy would share the background model.
 */
class MotionDetector {
public:
    explicit MotionDetector(const DetectionConfig& cfg, int channels = 3);

    MotionDetector(const MotionDetector&) = delete;
    MotionDetector& operator=(const MotionDetector&) = delete;
    MotionDetector(MotionDetector&&) = default;
    MotionDetector& operator=(MotionDetector&&) = default;

    DetectionResult detect(const cv::Mat& bgr);

    const DetectionConfig& config() const { return cfg_; }
    int channels() const { return channels_; }
    long frames_seen() const { return frames_seen_; }

private:
    void check_frame(const cv::Mat& bgr) const;

    DetectionConfig cfg_;
    int channels_;
    cv::Ptr<cv::BackgroundSubtractorMOG2> model_;
    cv::Mat kernel_;
    cv::Size size_{};
    long frames_seen_{0};
};
}
