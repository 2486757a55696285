#pragma once
#include "config.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace sentry {
struct Stats {
    int current{0};
    double average{0.0};
    int max{0};
    int min{0};
};

// Rolling object-count statistics over the last kHistoryCapacity frames.
// update() and the readers are serialized, so a reader sees a whole update or none of it.
class SurveillanceAnalyzer {
public:
    explicit SurveillanceAnalyzer(const AnalyzerConfig& cfg = {});

    void update(int count);
    Stats stats() const;
    std::vector<int> history() const;   // oldest first
    void reset();

    std::size_t size() const;
    std::size_t capacity() const { return ring_.size(); }

private:
    std::size_t index(std::size_t i) const { return (head_ + i) % ring_.size(); }

    mutable std::mutex mu_;
    std::vector<int> ring_;    // fixed storage, never reallocated
    std::size_t head_{0};      // oldest entry
    std::size_t count_{0};
};
}
