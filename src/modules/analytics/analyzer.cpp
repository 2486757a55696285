#include "sentry/analyzer.hpp"
#include "sentry/errors.hpp"
#include <algorithm>

namespace sentry {
SurveillanceAnalyzer::SurveillanceAnalyzer(const AnalyzerConfig& cfg) {
  cfg.validate();
  ring_.assign(static_cast<std::size_t>(cfg.capacity), 0);
}

void SurveillanceAnalyzer::update(int count) {
  // history holds non-negative counts only
  count = std::max(count, 0);
  std::lock_guard<std::mutex> lk(mu_);
  if (count_ < ring_.size()) {
    ring_[index(count_)] = count;
    ++count_;
  } else {
    ring_[head_] = count;
    head_ = (head_ + 1) % ring_.size();
  }
}

Stats SurveillanceAnalyzer::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  Stats s;
  if (count_ == 0) return s;
  long long sum = 0;
  s.max = s.min = ring_[head_];
  for (std::size_t i = 0; i < count_; ++i) {
    int v = ring_[index(i)];
    sum += v;
    s.max = std::max(s.max, v);
    s.min = std::min(s.min, v);
  }
  s.current = ring_[index(count_ - 1)];
  s.average = static_cast<double>(sum) / static_cast<double>(count_);
  return s;
}

std::vector<int> SurveillanceAnalyzer::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<int> out; out.reserve(count_);
  for (std::size_t i = 0; i < count_; ++i) out.push_back(ring_[index(i)]);
  return out;
}

void SurveillanceAnalyzer::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  head_ = 0;
  count_ = 0;
}

std::size_t SurveillanceAnalyzer::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return count_;
}
}
