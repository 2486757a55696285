#pragma once
#include "frame.hpp"
#include "metrics.hpp"
#include "session.hpp"
#include <functional>

namespace sentry {
struct Pipeline {
    std::function<bool(Frame&)> capture;
    std::function<FrameReport(const Frame&)> detect;
    std::function<void(const Frame&, const FrameReport&)> overlay;
};

// Drives capture -> detect -> overlay until capture returns false or
// max_frames frames went through. Returns the number of frames processed.
// Stage exceptions propagate to the caller.
int run_pipeline(Pipeline& pl, Metrics& metrics, int max_frames);

// Stage callables bound to a session; overlay may be left empty.
Pipeline make_session_pipeline(Session& session, std::function<bool(Frame&)> capture,
                               std::function<void(const Frame&, const FrameReport&)> overlay = {});
}
