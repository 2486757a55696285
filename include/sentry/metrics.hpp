#pragma once
#include <map>
#include <string>
#include <vector>
#include <fstream>

namespace sentry {
struct Span { std::string stage; double ms; int frame; };

// Per-stage latency record. Not thread-safe; owned by the driving loop.
class Metrics {
public:
    void record(const std::string& stage, int frame, double ms) {
        spans_.push_back({stage, ms, frame});
    }

    double mean_ms(const std::string& stage) const {
        double sum = 0.0; int n = 0;
        for (auto& s : spans_) if (s.stage == stage) { sum += s.ms; ++n; }
        return n ? sum / n : 0.0;
    }

    std::map<std::string, double> summary() const {
        std::map<std::string, double> out;
        for (auto& s : spans_) if (!out.count(s.stage)) out[s.stage] = mean_ms(s.stage);
        return out;
    }

    const std::vector<Span>& spans() const { return spans_; }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        f << "frame,stage,duration_ms\n";
        for (auto& s : spans_) f << s.frame << "," << s.stage << "," << s.ms << "\n";
        return static_cast<bool>(f);
    }

private:
    std::vector<Span> spans_;
};
}   // namespace sentry
