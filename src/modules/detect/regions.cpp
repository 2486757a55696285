#include "sentry/detector.hpp"
#include <opencv2/imgproc.hpp>

namespace sentry {
cv::Mat binarize_mask(const cv::Mat& raw, int shadow_value) {
  cv::Mat bin;
  cv::threshold(raw, bin, shadow_value, 255, cv::THRESH_BINARY);
  return bin;
}

cv::Mat make_kernel(KernelShape shape, int size) {
  int s = shape == KernelShape::Ellipse ? cv::MORPH_ELLIPSE : cv::MORPH_RECT;
  return cv::getStructuringElement(s, cv::Size(size, size));
}

cv::Mat clean_mask(const cv::Mat& binary, const cv::Mat& kernel) {
  cv::Mat out;
  cv::morphologyEx(binary, out, cv::MORPH_OPEN, kernel);
  cv::morphologyEx(out, out, cv::MORPH_CLOSE, kernel);
  return out;
}

Boxes find_regions(const cv::Mat& binary, int min_area){
  cv::Mat labels, stats, centroids;
  int n = cv::connectedComponentsWithStats(binary, labels, stats, centroids, 8, CV_32S);
  Boxes out;
  for (int i = 1; i < n; ++i) {   // label 0 is background
    cv::Rect r(stats.at<int>(i, cv::CC_STAT_LEFT), stats.at<int>(i, cv::CC_STAT_TOP),
               stats.at<int>(i, cv::CC_STAT_WIDTH), stats.at<int>(i, cv::CC_STAT_HEIGHT));
    if (r.area() >= min_area) out.push_back(r);
  }
  return out;
}
}
