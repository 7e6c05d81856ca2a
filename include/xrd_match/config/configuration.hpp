#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace xrd_match::config {

namespace fs = std::filesystem;

struct DetectionConfig {
  double height = 100.0;
  int distance = 15;        // samples
  double prominence = 50.0;
  double width = 2.0;       // samples

  // Thresholds relax toward the data's own scale:
  //   height     = min(height, max(mean + sigma_factor * std, height_fraction * max))
  //   prominence = min(prominence, max(std, prominence_fraction * max))
  struct AdaptiveConfig {
    bool enabled = true;
    double sigma_factor = 2.0;
    double height_fraction = 0.05;
    double prominence_fraction = 0.02;
  } adaptive;
};

struct MatchingConfig {
  double tolerance = 0.2;                // degrees
  std::string policy = "phase_first";    // phase_first | peak_first
};

struct CleaningConfig {
  bool enabled = true;      // false: only missing/out-of-range rows are dropped
  double angle_min = 0.0;
  double angle_max = 180.0;
  double intensity_threshold = 0.0;
  int smooth_window = 1;    // Savitzky-Golay window, 1 = off
};

struct ReferenceConfig {
  std::string format = "auto";              // auto | raw | extracted
  std::string pattern = "reference_*.txt";  // used with --reference-dir
  std::vector<std::string> symbols;         // empty = default pool
  double card_intensity_threshold = 40.0;   // extract-card
  std::string card_symbol = "♠";
};

struct OutputConfig {
  bool write_report = true;
  bool write_matches_csv = true;
  bool write_peaks_csv = true;
};

struct Config {
  DetectionConfig detection;
  MatchingConfig matching;
  CleaningConfig cleaning;
  ReferenceConfig reference;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // reference.symbols, or the default pool when none are configured
  std::vector<std::string> symbol_pool() const;
};

// Circled numerals 1..20; the pool size caps the number of raw reference files.
const std::vector<std::string> &default_symbol_pool();

std::string get_schema_json();

} // namespace xrd_match::config
