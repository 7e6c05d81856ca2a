#include "xrd_match/pipeline/analysis.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/utils.hpp"
#include "xrd_match/matching/phase_matching.hpp"
#include "xrd_match/metrics/match_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace xrd_match::pipeline {

namespace {

json peak_to_json(const DetectedPeak &p) {
    return {{"index", p.index},
            {"angle", p.angle},
            {"intensity", p.intensity},
            {"prominence", p.prominence},
            {"width", p.width}};
}

json reference_to_json(const ReferencePeak &r) {
    return {{"angle", r.angle}, {"intensity", r.intensity}, {"phase", r.phase_id}, {"symbol", r.symbol}};
}

json issues_to_json(const std::vector<reference::LoadIssue> &issues) {
    json arr = json::array();
    for (const auto &i : issues) {
        arr.push_back({{"file", i.file.string()}, {"severity", i.severity}, {"message", i.message}});
    }
    return arr;
}

std::string delimiter_name(const std::optional<char> &d) {
    if (!d) return "whitespace";
    if (*d == '\t') return "tab";
    return std::string(1, *d);
}

void fail_stage(AnalysisResult &res, Stage stage, const std::string &message,
                const std::string &run_id, core::EventEmitter &emitter, std::ostream &log) {
    res.success = false;
    res.status = "error";
    res.last_stage = stage;
    res.error = message;
    emitter.stage_end(run_id, stage, "error", {{"error", message}}, log);
    emitter.error(run_id, message, log);
}

// Tolerance and policy are checked before any reference file is read.
MatchPolicy resolve_policy(const config::MatchingConfig &matching) {
    if (!std::isfinite(matching.tolerance) || matching.tolerance <= 0.0) {
        throw InvalidToleranceError(matching.tolerance);
    }
    const auto policy = string_to_match_policy(matching.policy);
    if (!policy) {
        throw ValidationError("unknown matching.policy '" + matching.policy + "'");
    }
    return *policy;
}

std::string fmt(double v) {
    std::ostringstream oss;
    oss << std::setprecision(10) << v;
    return oss.str();
}

} // namespace

std::optional<signal::CleaningOptions> cleaning_options(const config::Config &cfg) {
    if (!cfg.cleaning.enabled) {
        return std::nullopt;
    }
    signal::CleaningOptions opts;
    opts.angle_min = cfg.cleaning.angle_min;
    opts.angle_max = cfg.cleaning.angle_max;
    opts.intensity_threshold = cfg.cleaning.intensity_threshold;
    opts.smooth_window = cfg.cleaning.smooth_window;
    return opts;
}

detection::DetectionParams detection_params(const config::Config &cfg) {
    detection::DetectionParams params;
    params.height = cfg.detection.height;
    params.distance = static_cast<double>(cfg.detection.distance);
    params.prominence = cfg.detection.prominence;
    params.width = cfg.detection.width;
    params.adaptive.enabled = cfg.detection.adaptive.enabled;
    params.adaptive.sigma_factor = cfg.detection.adaptive.sigma_factor;
    params.adaptive.height_fraction = cfg.detection.adaptive.height_fraction;
    params.adaptive.prominence_fraction = cfg.detection.adaptive.prominence_fraction;
    return params;
}

AnalysisResult run_analysis(const fs::path &input, const std::vector<fs::path> &reference_paths,
                            const config::Config &cfg, const std::string &run_id,
                            const fs::path &outputs_dir, std::ostream &log) {
    core::EventEmitter emitter;
    AnalysisResult res;
    res.input = input;

    // INGEST
    emitter.stage_start(run_id, Stage::INGEST, log);
    try {
        res.read = io::read_series(input);
        res.input_sha256 = core::sha256_file(input);
    } catch (const XrdMatchError &e) {
        fail_stage(res, Stage::INGEST, e.what(), run_id, emitter, log);
        return res;
    }
    emitter.stage_end(run_id, Stage::INGEST, "ok",
                      {{"rows", res.read.table.size()},
                       {"strategy", io::describe_read_options(res.read.options)},
                       {"encoding", res.read.hint.encoding},
                       {"header_detected", res.read.hint.detected},
                       {"failed_attempts", res.read.failures.size()}},
                      log);

    // CLEAN
    emitter.stage_start(run_id, Stage::CLEAN, log);
    try {
        res.cleaned = signal::clean_series(res.read.table, cleaning_options(cfg));
    } catch (const DataInsufficientError &e) {
        fail_stage(res, Stage::CLEAN, e.what(), run_id, emitter, log);
        return res;
    }
    if (!res.cleaned.smoothing_error.empty()) {
        emitter.warning(run_id, Stage::CLEAN, "smoothing skipped: " + res.cleaned.smoothing_error,
                        {{"smooth_window", res.cleaned.smooth_window}}, log);
    }
    const Sample &sample = res.cleaned.sample;
    emitter.stage_end(run_id, Stage::CLEAN, "ok",
                      {{"points", sample.size()},
                       {"dropped_missing", res.cleaned.dropped_missing},
                       {"dropped_out_of_range", res.cleaned.dropped_out_of_range},
                       {"dropped_by_options", res.cleaned.dropped_by_options},
                       {"dropped_duplicates", res.cleaned.dropped_duplicates},
                       {"smoothing_applied", res.cleaned.smoothing_applied},
                       {"angle_min", sample.angle(0)},
                       {"angle_max", sample.angle(sample.size() - 1)}},
                      log);

    // DETECT
    emitter.stage_start(run_id, Stage::DETECT, log);
    try {
        res.detection = detection::detect_peaks(sample, detection_params(cfg));
    } catch (const ValidationError &e) {
        fail_stage(res, Stage::DETECT, e.what(), run_id, emitter, log);
        return res;
    }
    emitter.stage_end(run_id, Stage::DETECT, "ok",
                      {{"peaks", res.detection.peaks.size()},
                       {"effective_height", res.detection.thresholds.height},
                       {"effective_prominence", res.detection.thresholds.prominence},
                       {"local_maxima", res.detection.stats.local_maxima},
                       {"after_height", res.detection.stats.after_height},
                       {"after_distance", res.detection.stats.after_distance},
                       {"after_prominence", res.detection.stats.after_prominence}},
                      log);

    MatchPolicy policy = MatchPolicy::PHASE_FIRST;
    try {
        policy = resolve_policy(cfg.matching);
    } catch (const ValidationError &e) {
        emitter.stage_start(run_id, Stage::MATCH, log);
        fail_stage(res, Stage::MATCH, e.what(), run_id, emitter, log);
        return res;
    }

    // REFERENCES
    emitter.stage_start(run_id, Stage::REFERENCES, log);
    try {
        if (reference_paths.empty()) {
            throw NoReferenceDataError("no reference files given");
        }
        res.references =
            reference::load_references(reference_paths,
                                       reference::string_to_reference_format(cfg.reference.format),
                                       cfg.symbol_pool());
        res.identification_available = true;
    } catch (const NoReferenceDataError &e) {
        res.identification_note = e.what();
    } catch (const ValidationError &e) {
        fail_stage(res, Stage::REFERENCES, e.what(), run_id, emitter, log);
        return res;
    }
    for (const auto &issue : res.references.issues) {
        emitter.warning(run_id, Stage::REFERENCES, issue.message,
                        {{"file", issue.file.string()}, {"severity", issue.severity}}, log);
    }
    if (res.identification_available) {
        emitter.stage_end(run_id, Stage::REFERENCES, "ok",
                          {{"files", reference_paths.size()},
                           {"phases", res.references.loaded_phases},
                           {"peaks", res.references.catalog.size()}},
                          log);
    } else {
        emitter.warning(run_id, Stage::REFERENCES, res.identification_note,
                        {{"identification_available", false}}, log);
        emitter.stage_end(run_id, Stage::REFERENCES, "skipped",
                          {{"reason", "no_reference_data"}}, log);
    }

    // MATCH
    emitter.stage_start(run_id, Stage::MATCH, log);
    res.match_set.policy = policy;
    res.match_set.tolerance = cfg.matching.tolerance;
    if (res.identification_available) {
        try {
            res.match_set = matching::match_peaks(res.detection.peaks, res.references.catalog,
                                                  cfg.matching.tolerance, policy);
        } catch (const NoReferenceDataError &e) {
            res.identification_available = false;
            res.identification_note = e.what();
            emitter.warning(run_id, Stage::MATCH, e.what(), {{"identification_available", false}},
                            log);
        }
    }
    if (!res.identification_available) {
        res.match_set.unmatched_peaks = res.detection.peaks;
    }
    res.report = metrics::compute_statistics(static_cast<int>(res.detection.peaks.size()),
                                             res.match_set);
    emitter.stage_end(run_id, Stage::MATCH, res.identification_available ? "ok" : "skipped",
                      {{"policy", match_policy_to_string(policy)},
                       {"tolerance", cfg.matching.tolerance},
                       {"matched_peaks", res.report.matched_peaks},
                       {"total_peaks", res.report.total_peaks},
                       {"match_rate", res.report.match_rate}},
                      log);

    // REPORT
    emitter.stage_start(run_id, Stage::REPORT, log);
    json written = json::array();
    if (!outputs_dir.empty()) {
        try {
            fs::create_directories(outputs_dir);
            if (cfg.output.write_report) {
                core::write_text(outputs_dir / "report.json",
                                 report_to_json(res, cfg, run_id).dump(2) + "\n");
                written.push_back("report.json");
            }
            if (cfg.output.write_matches_csv) {
                core::write_text(outputs_dir / "matches.csv", matches_to_csv(res.match_set));
                written.push_back("matches.csv");
            }
            if (cfg.output.write_peaks_csv) {
                core::write_text(outputs_dir / "peaks.csv", peaks_to_csv(res.detection.peaks));
                written.push_back("peaks.csv");
            }
        } catch (const IOError &e) {
            fail_stage(res, Stage::REPORT, e.what(), run_id, emitter, log);
            return res;
        } catch (const fs::filesystem_error &e) {
            fail_stage(res, Stage::REPORT, e.what(), run_id, emitter, log);
            return res;
        }
    }
    res.success = true;
    res.status = "ok";
    res.last_stage = Stage::DONE;
    emitter.stage_end(run_id, Stage::REPORT, "ok",
                      {{"outputs", written},
                       {"identification_available", res.identification_available}},
                      log);
    return res;
}

json report_to_json(const AnalysisResult &result, const config::Config &cfg,
                    const std::string &run_id) {
    json peaks = json::array();
    for (const auto &p : result.detection.peaks) {
        peaks.push_back(peak_to_json(p));
    }

    json matches = json::array();
    for (const auto &m : result.match_set.matches) {
        json entry = peak_to_json(m.peak);
        entry["reference"] = reference_to_json(m.reference);
        entry["reference_index"] = m.reference_index;
        entry["angle_delta"] = m.angle_delta;
        entry["quality"] = m.quality;
        matches.push_back(entry);
    }
    json unmatched_peaks = json::array();
    for (const auto &p : result.match_set.unmatched_peaks) {
        unmatched_peaks.push_back(peak_to_json(p));
    }
    json unmatched_refs = json::array();
    for (const auto &r : result.match_set.unmatched_references) {
        unmatched_refs.push_back(reference_to_json(r));
    }

    json phase_stats = json::array();
    for (const auto &s : result.report.phase_stats) {
        phase_stats.push_back({{"phase", s.phase_id},
                               {"symbol", s.symbol},
                               {"count", s.count},
                               {"percentage", s.percentage}});
    }

    const Sample &sample = result.cleaned.sample;
    json report = {
        {"run_id", run_id},
        {"created_at", core::get_iso_timestamp()},
        {"input",
         {{"path", result.input.string()},
          {"sha256", result.input_sha256},
          {"rows_read", result.read.table.size()},
          {"read_strategy", io::describe_read_options(result.read.options)},
          {"encoding", result.read.hint.encoding},
          {"delimiter", delimiter_name(result.read.options.delimiter)}}},
        {"cleaning",
         {{"points", sample.size()},
          {"angle_min", sample.empty() ? 0.0 : sample.angle(0)},
          {"angle_max", sample.empty() ? 0.0 : sample.angle(sample.size() - 1)},
          {"dropped_missing", result.cleaned.dropped_missing},
          {"dropped_out_of_range", result.cleaned.dropped_out_of_range},
          {"dropped_by_options", result.cleaned.dropped_by_options},
          {"dropped_duplicates", result.cleaned.dropped_duplicates},
          {"smoothing_applied", result.cleaned.smoothing_applied},
          {"smooth_window", result.cleaned.smooth_window}}},
        {"detection",
         {{"nominal",
           {{"height", cfg.detection.height},
            {"distance", cfg.detection.distance},
            {"prominence", cfg.detection.prominence},
            {"width", cfg.detection.width}}},
          {"effective_height", result.detection.thresholds.height},
          {"effective_prominence", result.detection.thresholds.prominence},
          {"intensity_mean", result.detection.thresholds.mean},
          {"intensity_std", result.detection.thresholds.stddev},
          {"intensity_max", result.detection.thresholds.max},
          {"peaks", peaks}}},
        {"references",
         {{"format", cfg.reference.format},
          {"phases", result.references.loaded_phases},
          {"peak_count", result.references.catalog.size()},
          {"issues", issues_to_json(result.references.issues)}}},
        {"identification_available", result.identification_available},
        {"matching",
         {{"policy", match_policy_to_string(result.match_set.policy)},
          {"tolerance", result.match_set.tolerance},
          {"matches", matches},
          {"unmatched_peaks", unmatched_peaks},
          {"unmatched_references", unmatched_refs}}},
        {"statistics",
         {{"total_peaks", result.report.total_peaks},
          {"matched_peaks", result.report.matched_peaks},
          {"match_rate", result.report.match_rate},
          {"phase_stats", phase_stats}}}};

    if (!result.identification_available) {
        report["identification_note"] = result.identification_note;
    }
    return report;
}

std::string matches_to_csv(const MatchSet &match_set) {
    struct Row {
        double angle;
        std::string text;
    };
    std::vector<Row> rows;

    for (const auto &m : match_set.matches) {
        rows.push_back({m.peak.angle, fmt(m.peak.angle) + "," + fmt(m.peak.intensity) + "," +
                                          fmt(m.reference.angle) + "," + m.reference.phase_id +
                                          "," + m.reference.symbol + "," + fmt(m.angle_delta) +
                                          "," + fmt(m.quality)});
    }
    for (const auto &p : match_set.unmatched_peaks) {
        rows.push_back({p.angle, fmt(p.angle) + "," + fmt(p.intensity) + ",,,,,"});
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const Row &a, const Row &b) { return a.angle < b.angle; });

    std::string out = "detected_angle,detected_intensity,reference_angle,phase,symbol,angle_delta,quality\n";
    for (const auto &r : rows) {
        out += r.text + "\n";
    }
    return out;
}

std::string peaks_to_csv(const std::vector<DetectedPeak> &peaks) {
    std::string out = "index,angle,intensity,prominence,width\n";
    for (const auto &p : peaks) {
        out += std::to_string(p.index) + "," + fmt(p.angle) + "," + fmt(p.intensity) + "," +
               fmt(p.prominence) + "," + fmt(p.width) + "\n";
    }
    return out;
}

} // namespace xrd_match::pipeline
