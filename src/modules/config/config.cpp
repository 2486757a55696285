#include "sentry/config.hpp"
#include "sentry/errors.hpp"
#include <yaml-cpp/yaml.h>

namespace sentry {
void DetectionConfig::validate() const {
  if (min_contour_area <= 0) throw InvalidConfig("min_contour_area must be positive");
  if (morph_kernel_size <= 0 || morph_kernel_size % 2 == 0)
    throw InvalidConfig("morph_kernel_size must be a positive odd integer");
  if (history <= 0) throw InvalidConfig("history must be positive");
  if (var_threshold <= 0.0) throw InvalidConfig("var_threshold must be positive");
  if (learning_rate != -1.0 && (learning_rate < 0.0 || learning_rate > 1.0))
    throw InvalidConfig("learning_rate must be -1 or within [0, 1]");
}

void AnalyzerConfig::validate() const {
  if (capacity != kHistoryCapacity)
    throw InvalidConfig("history capacity is fixed at " + std::to_string(kHistoryCapacity));
}

void AppConfig::validate() const {
  session.detection.validate();
  session.analyzer.validate();
  if (max_frames <= 0) throw InvalidConfig("max_frames must be positive");
}

KernelShape parse_kernel_shape(const std::string& name) {
  if (name == "rect") return KernelShape::Rect;
  if (name == "ellipse") return KernelShape::Ellipse;
  throw InvalidConfig("unknown kernel_shape '" + name + "'");
}

LogLevel parse_log_level(const std::string& name) {
  if (name == "debug") return LogLevel::Debug;
  if (name == "info") return LogLevel::Info;
  if (name == "warn") return LogLevel::Warn;
  if (name == "error") return LogLevel::Error;
  throw InvalidConfig("unknown log_level '" + name + "'");
}

namespace {
template <typename T>
void read_key(const YAML::Node& n, const char* key, T& out) {
  if (n && n[key]) out = n[key].as<T>();
}

AppConfig from_node(const YAML::Node& root) {
  AppConfig cfg;
  if (!root.IsNull() && !root.IsMap()) throw InvalidConfig("top level must be a mapping");

  const YAML::Node det = root["detection"];
  auto& d = cfg.session.detection;
  read_key(det, "min_contour_area", d.min_contour_area);
  read_key(det, "morph_kernel_size", d.morph_kernel_size);
  read_key(det, "detect_shadows", d.detect_shadows);
  read_key(det, "history", d.history);
  read_key(det, "var_threshold", d.var_threshold);
  read_key(det, "learning_rate", d.learning_rate);
  if (det && det["kernel_shape"]) d.kernel_shape = parse_kernel_shape(det["kernel_shape"].as<std::string>());

  read_key(root["analyzer"], "capacity", cfg.session.analyzer.capacity);

  const YAML::Node app = root["app"];
  read_key(app, "max_frames", cfg.max_frames);
  read_key(app, "display", cfg.display);
  read_key(app, "latency_csv", cfg.latency_csv);
  if (app && app["log_level"]) cfg.log_level = parse_log_level(app["log_level"].as<std::string>());

  cfg.validate();
  return cfg;
}
}  // namespace

AppConfig load_config(const std::string& path) {
  try {
    return from_node(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw InvalidConfig(path + ": " + e.what());
  }
}

AppConfig load_config_string(const std::string& yaml) {
  try {
    return from_node(YAML::Load(yaml));
  } catch (const YAML::Exception& e) {
    throw InvalidConfig(e.what());
  }
}
}
