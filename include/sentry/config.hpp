#pragma once
#include "logger.hpp"
#include <string>

namespace sentry {
enum class KernelShape { Rect, Ellipse };

struct DetectionConfig {
    int min_contour_area{500};
    int morph_kernel_size{5};
    bool detect_shadows{true};
    KernelShape kernel_shape{KernelShape::Rect};
    int history{500};             // background model history length, frames
    double var_threshold{16.0};   // squared Mahalanobis distance threshold
    double learning_rate{-1.0};   // -1: derived from history

    void validate() const;
};

constexpr int kHistoryCapacity = 100;

struct AnalyzerConfig {
    int capacity{kHistoryCapacity};

    void validate() const;
};

struct SessionConfig {
    DetectionConfig detection{};
    AnalyzerConfig analyzer{};
};

struct AppConfig {
    SessionConfig session{};
    int max_frames{300};
    bool display{false};
    std::string latency_csv{};    // empty: no latency dump
    LogLevel log_level{LogLevel::Info};

    void validate() const;
};

KernelShape parse_kernel_shape(const std::string& name);
LogLevel parse_log_level(const std::string& name);

// Values absent from the file keep their defaults. Throws InvalidConfig.
AppConfig load_config(const std::string& path);
AppConfig load_config_string(const std::string& yaml);
}
