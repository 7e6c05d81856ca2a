#pragma once

#include "xrd_match/config/configuration.hpp"
#include "xrd_match/core/events.hpp"
#include "xrd_match/core/types.hpp"
#include "xrd_match/detection/peak_detection.hpp"
#include "xrd_match/io/table_reader.hpp"
#include "xrd_match/reference/catalog.hpp"
#include "xrd_match/signal/cleaning.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace xrd_match::pipeline {

namespace fs = std::filesystem;
using core::json;

struct AnalysisResult {
  bool success = false;
  std::string status = "error";     // ok | error
  Stage last_stage = Stage::INGEST; // stage reached (failed stage when !success)
  std::string error;

  fs::path input;
  std::string input_sha256;
  io::ReadResult read;
  signal::CleanResult cleaned;
  detection::DetectionResult detection;

  reference::CatalogBuildResult references;
  bool identification_available = false;
  std::string identification_note;  // why identification is unavailable

  MatchSet match_set;
  MatchReport report;
};

std::optional<signal::CleaningOptions> cleaning_options(const config::Config &cfg);
detection::DetectionParams detection_params(const config::Config &cfg);

// Runs INGEST, CLEAN, DETECT, REFERENCES, MATCH and REPORT, emitting
// stage events to log. Missing reference data only disables
// identification; ingest or cleaning failures, a non-positive tolerance
// or an unknown policy end the run with success=false. Tolerance and policy
// are checked after DETECT, before any reference file is read. Outputs are written to outputs_dir unless it is empty.
AnalysisResult run_analysis(const fs::path &input,
                            const std::vector<fs::path> &reference_paths,
                            const config::Config &cfg, const std::string &run_id,
                            const fs::path &outputs_dir, std::ostream &log);

json report_to_json(const AnalysisResult &result, const config::Config &cfg,
                    const std::string &run_id);

// One row per detected peak; unidentified peaks leave the reference columns empty.
std::string matches_to_csv(const MatchSet &match_set);
std::string peaks_to_csv(const std::vector<DetectedPeak> &peaks);

} // namespace xrd_match::pipeline
