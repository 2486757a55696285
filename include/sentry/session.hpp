#pragma once
#include "analyzer.hpp"
#include "detector.hpp"
#include <mutex>

namespace sentry {
struct FrameReport {
    int frame{0};
    Boxes boxes;
    Stats stats;
};

// One camera feed: a detector and an analyzer advanced together, frame by frame.
// process() holds the session lock for the whole detect+update, so the
// background model never sees two writers.
class Session {
public:
    explicit Session(const SessionConfig& cfg = {});

    FrameReport process(const Frame& f);

    Stats stats() const { return analyzer_.stats(); }
    std::vector<int> history() const { return analyzer_.history(); }
    void reset_history() { analyzer_.reset(); }
    long frames_processed() const;

    const MotionDetector& detector() const { return detector_; }

private:
    mutable std::mutex mu_;
    MotionDetector detector_;
    SurveillanceAnalyzer analyzer_;
    long processed_{0};
};
}
