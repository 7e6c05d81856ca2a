#pragma once

#include "xrd_match/core/types.hpp"

#include <vector>

namespace xrd_match::detection {

// Data-driven relaxation of the nominal thresholds.
struct AdaptiveTunables {
  bool enabled = true;
  double sigma_factor = 2.0;
  double height_fraction = 0.05;
  double prominence_fraction = 0.02;
};

struct DetectionParams {
  double height = 100.0;
  double distance = 15.0;   // samples, rounded up
  double prominence = 50.0;
  double width = 2.0;       // samples, at half prominence
  AdaptiveTunables adaptive;
};

struct EffectiveThresholds {
  double height = 0.0;
  double prominence = 0.0;
  double mean = 0.0;
  double stddev = 0.0;
  double max = 0.0;
};

// Candidate counts after each filter, in application order.
struct DetectionStats {
  int local_maxima = 0;
  int after_height = 0;
  int after_distance = 0;
  int after_prominence = 0;
  int after_width = 0;
};

struct DetectionResult {
  std::vector<DetectedPeak> peaks;  // ascending index
  EffectiveThresholds thresholds;
  DetectionStats stats;
};

// min(nominal, max(mean + k*std, f_h*max)) for height and
// min(nominal, max(std, f_p*max)) for prominence, when max > 0.
EffectiveThresholds effective_thresholds(const VectorXd &intensity,
                                         const DetectionParams &params);

// Indices of local maxima. A flat top counts once, at its middle sample
// (rounded down), if both neighbours of the plateau are lower.
std::vector<int> find_local_maxima(const VectorXd &x);

struct Prominence {
  double value = 0.0;
  int left_base = 0;
  int right_base = 0;
};

std::vector<Prominence> peak_prominences(const VectorXd &x, const std::vector<int> &peaks);

// Width at rel_height of the prominence, linearly interpolated, in samples.
std::vector<double> peak_widths(const VectorXd &x, const std::vector<int> &peaks,
                                const std::vector<Prominence> &prominences,
                                double rel_height = 0.5);

// Keeps peaks at least ceil(distance) samples apart, higher peaks first;
// among equal heights the earlier peak wins.
std::vector<int> select_by_distance(const VectorXd &x, const std::vector<int> &peaks,
                                    double distance);

// Throws ValidationError for an empty sample or distance < 1.
DetectionResult detect_peaks(const Sample &sample, const DetectionParams &params);

} // namespace xrd_match::detection
