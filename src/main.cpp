#include <opencv2/highgui.hpp>
#include <opencv2/videoio.hpp>
#include <string>
#include "sentry/config.hpp"
#include "sentry/errors.hpp"
#include "sentry/logger.hpp"
#include "sentry/overlay.hpp"
#include "sentry/pipeline.hpp"
#include "sentry/source.hpp"

using namespace sentry;

int main(int argc, char** argv) {
    if (argc < 2) {
        Logger::error("usage: %s <video|image-pattern|camera-index> [config.yaml]", argv[0]);
        return 1;
    }
    std::string in = argv[1];

    AppConfig cfg;
    try {
        if (argc > 2) cfg = load_config(argv[2]);
    } catch (const InvalidConfig& e) {
        Logger::error("%s", e.what());
        return 2;
    }
    Logger::set_level(cfg.log_level);

    cv::VideoCapture cap;
    if (!open_source(cap, in)) { Logger::error("fail open %s", in.c_str()); return 1; }

    Metrics metrics;
    Session session(cfg.session);

    int fid = 0;
    auto capture = [&](Frame& f){
        cv::Mat img;
        if (!cap.read(img)) return false;
        f.id = ++fid;
        f.bgr = img;
        return true;
    };
    std::function<void(const Frame&, const FrameReport&)> overlay;
    if (cfg.display) {
        overlay = [](const Frame& f, const FrameReport& r){
            cv::imshow("sentry", draw_detections(f.bgr, r.boxes, static_cast<int>(r.boxes.size())));
            cv::waitKey(1);
        };
    }
    Pipeline pl = make_session_pipeline(session, capture, overlay);

    int n = 0;
    try {
        n = run_pipeline(pl, metrics, cfg.max_frames);
    } catch (const Error& e) {
        Logger::error("frame %d: %s", fid, e.what());
        return 1;
    } catch (const cv::Exception& e) {
        Logger::error("frame %d: opencv: %s", fid, e.what());
        return 1;
    }

    Stats s = session.stats();
    Logger::info("processed %d frames from %s", n, in.c_str());
    Logger::info("objects: current=%d average=%.2f max=%d min=%d", s.current, s.average, s.max, s.min);
    for (auto& kv : metrics.summary())
        Logger::info("stage %s: %.3f ms/frame", kv.first.c_str(), kv.second);

    if (!cfg.latency_csv.empty()) {
        if (!metrics.dump_csv(cfg.latency_csv)) {
            Logger::warn("could not write %s", cfg.latency_csv.c_str());
        } else {
            Logger::info("done. %s saved", cfg.latency_csv.c_str());
        }
    }
    return 0;
}
