#include "sentry/pipeline.hpp"
#include "sentry/tracer.hpp"
#include <chrono>
#include <utility>

namespace sentry {
int run_pipeline(Pipeline& pl, Metrics& metrics, int max_frames) {
  int done = 0;
  Frame fr{0, {}};
  while (done < max_frames) {
    auto t0 = ScopeStamp::clk::now();
    if (!pl.capture(fr)) break;
    // capture span goes under the id the capture assigned
    metrics.record("capture", fr.id,
                   std::chrono::duration<double, std::milli>(ScopeStamp::clk::now() - t0).count());
    SENTRY_TRACE_METRICS(metrics, "frame", fr.id);
    FrameReport rep;
    {
      SENTRY_TRACE_METRICS(metrics, "detect", fr.id);
      rep = pl.detect(fr);
    }
    if (pl.overlay) {
      SENTRY_TRACE_METRICS(metrics, "overlay", fr.id);
      pl.overlay(fr, rep);
    }
    ++done;
  }
  return done;
}

Pipeline make_session_pipeline(Session& session, std::function<bool(Frame&)> capture,
                               std::function<void(const Frame&, const FrameReport&)> overlay) {
  Pipeline pl;
  pl.capture = std::move(capture);
  pl.detect = [&session](const Frame& f) { return session.process(f); };
  pl.overlay = std::move(overlay);
  return pl;
}
}
