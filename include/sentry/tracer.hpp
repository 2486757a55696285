#pragma once
#include "metrics.hpp"
#include <chrono>
#include <string>
#include <utility>

#define SENTRY_CONCAT_(a, b) a##b
#define SENTRY_CONCAT(a, b) SENTRY_CONCAT_(a, b)

#define SENTRY_TRACE_METRICS(metrics, stage, frame) \
    sentry::ScopeStamp SENTRY_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, frame)

namespace sentry {
struct ScopeStamp {
    using clk = std::chrono::steady_clock;

    Metrics& m;
    std::string stage;
    int frame;
    clk::time_point start;

    ScopeStamp(Metrics& met, std::string s, int f)
        : m(met), stage(std::move(s)), frame(f), start(clk::now()) {}

    ~ScopeStamp() {
        m.record(stage, frame, std::chrono::duration<double, std::milli>(clk::now() - start).count());
    }
};
}
