#include "sentry/session.hpp"
#include "sentry/logger.hpp"

namespace sentry {
Session::Session(const SessionConfig& cfg)
    : detector_(cfg.detection), analyzer_(cfg.analyzer) {}

FrameReport Session::process(const Frame& f) {
  std::lock_guard<std::mutex> lk(mu_);
  FrameReport rep;
  rep.frame = f.id;
  rep.boxes = detector_.detect(f.bgr).boxes;
  analyzer_.update(static_cast<int>(rep.boxes.size()));
  rep.stats = analyzer_.stats();
  ++processed_;
  Logger::debug("frame %d: %zu objects (avg %.2f)", f.id, rep.boxes.size(), rep.stats.average);
  return rep;
}

long Session::frames_processed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return processed_;
}
}
