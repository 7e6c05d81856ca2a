#pragma once

#include "xrd_match/core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace xrd_match::signal {

constexpr size_t kMinCleanPoints = 100;

struct CleaningOptions {
  double angle_min = 0.0;           // inclusive
  double angle_max = 180.0;         // inclusive
  double intensity_threshold = 0.0;
  int smooth_window = 1;            // > 1 enables Savitzky-Golay
};

struct CleanResult {
  Sample sample;

  size_t input_rows = 0;
  size_t dropped_missing = 0;
  size_t dropped_out_of_range = 0;  // angle outside (0,180) or intensity < 0
  size_t dropped_by_options = 0;
  size_t dropped_duplicates = 0;

  bool smoothing_applied = false;
  int smooth_window = 1;            // effective (odd) window
  std::string smoothing_error;      // set when smoothing was attempted and failed
};

// True for a physically plausible row: angle in (0,180), intensity >= 0.
bool is_valid_row(double angle, double intensity);

// Drops rows with a missing or out-of-range value, keeping the input order.
SeriesTable drop_invalid_rows(const SeriesTable &table);

// Filter, optionally smooth, sort and deduplicate a raw table into a Sample
// with strictly increasing angles. Throws DataInsufficientError when fewer
// than min_points rows remain.
CleanResult clean_series(const SeriesTable &table,
                         const std::optional<CleaningOptions> &options,
                         size_t min_points = kMinCleanPoints);

} // namespace xrd_match::signal
