#include <doctest/doctest.h>
#include "sentry/errors.hpp"
#include "sentry/pipeline.hpp"

using namespace sentry;

namespace {
SessionConfig small_session() {
  SessionConfig c;
  c.detection.min_contour_area = 100;
  return c;
}
}

TEST_CASE("session advances detector and analyzer together"){
  Session s(small_session());
  FrameReport last;
  for (int i = 1; i <= 120; ++i) last = s.process({i, cv::Mat::zeros(60, 80, CV_8UC3)});
  CHECK(s.frames_processed() == 120);
  CHECK(s.history().size() == 100);
  CHECK(last.frame == 120);
  CHECK(last.stats.current == static_cast<int>(last.boxes.size()));
  CHECK(s.stats().current == last.stats.current);
  CHECK(s.detector().frames_seen() == 120);

  s.reset_history();
  CHECK(s.history().empty());
  CHECK(s.frames_processed() == 120);
}

TEST_CASE("rejected frame leaves the session unchanged"){
  Session s(small_session());
  s.process({1, cv::Mat::zeros(60, 80, CV_8UC3)});
  CHECK_THROWS_AS(s.process({2, cv::Mat()}), InvalidFrame);
  CHECK(s.frames_processed() == 1);
  CHECK(s.history().size() == 1);
}

TEST_CASE("invalid session config"){
  SessionConfig c;
  c.detection.morph_kernel_size = 2;
  CHECK_THROWS_AS(Session{c}, InvalidConfig);
}

TEST_CASE("pipeline stops at max_frames"){
  Session s(small_session());
  int produced = 0, drawn = 0;
  Metrics m;
  Pipeline pl = make_session_pipeline(
      s,
      [&](Frame& f){ f.id = ++produced; f.bgr = cv::Mat::zeros(60, 80, CV_8UC3); return true; },
      [&](const Frame&, const FrameReport&){ ++drawn; });
  CHECK(run_pipeline(pl, m, 7) == 7);
  CHECK(produced == 7);
  CHECK(drawn == 7);
  CHECK(s.frames_processed() == 7);
  CHECK(m.mean_ms("detect") >= 0.0);
  CHECK(m.summary().count("overlay") == 1);
}

TEST_CASE("pipeline stops at end of stream without overlay"){
  Session s(small_session());
  int left = 3, id = 0;
  Metrics m;
  Pipeline pl = make_session_pipeline(s, [&](Frame& f){
    if (left-- == 0) return false;
    f.id = ++id; f.bgr = cv::Mat::zeros(60, 80, CV_8UC3); return true;
  });
  CHECK(run_pipeline(pl, m, 100) == 3);
  CHECK(s.history().size() == 3);
  CHECK(m.summary().count("overlay") == 0);
}

TEST_CASE("capture latency is recorded under the captured frame id"){
  Session s(small_session());
  int next = 100;
  Metrics m;
  Pipeline pl = make_session_pipeline(s, [&](Frame& f){
    f.id = next; next += 10; f.bgr = cv::Mat::zeros(60, 80, CV_8UC3); return true;
  });
  CHECK(run_pipeline(pl, m, 3) == 3);
  std::vector<int> capture_ids, detect_ids;
  for (auto& sp : m.spans()) {
    if (sp.stage == "capture") capture_ids.push_back(sp.frame);
    if (sp.stage == "detect") detect_ids.push_back(sp.frame);
  }
  CHECK(capture_ids == std::vector<int>{100, 110, 120});
  CHECK(capture_ids == detect_ids);
}

TEST_CASE("opencv errors from a stage reach the caller"){
  Session s(small_session());
  int id = 0;
  Metrics m;
  Pipeline pl = make_session_pipeline(
      s,
      [&](Frame& f){ f.id = ++id; f.bgr = cv::Mat::zeros(60, 80, CV_8UC3); return true; },
      [](const Frame&, const FrameReport&){ CV_Error(cv::Error::StsError, "no display"); });
  CHECK_THROWS_AS(run_pipeline(pl, m, 5), cv::Exception);
  CHECK(s.frames_processed() == 1);
}
