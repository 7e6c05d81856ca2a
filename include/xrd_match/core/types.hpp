#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xrd_match {

namespace fs = std::filesystem;

using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

// Two numeric columns as read from a text table. Missing cells are NaN.
struct SeriesTable {
    std::vector<double> x;
    std::vector<double> y;

    size_t size() const { return x.size(); }
    bool empty() const { return x.empty(); }
};

// Canonical diffraction pattern: angle strictly increasing, intensity >= 0.
struct Sample {
    VectorXd angle;      // 2-theta (degrees)
    VectorXd intensity;  // counts / a.u.

    Eigen::Index size() const { return angle.size(); }
    bool empty() const { return angle.size() == 0; }
};

struct ReferencePeak {
    double angle = 0.0;
    double intensity = 0.0;
    std::string phase_id;
    std::string symbol;
};

// Flat list of reference peaks from every loaded phase. Phase order is the
// order of first appearance.
using ReferenceCatalog = std::vector<ReferencePeak>;

inline std::vector<std::string> catalog_phase_order(const ReferenceCatalog& catalog) {
    std::vector<std::string> phases;
    for (const auto& ref : catalog) {
        if (std::find(phases.begin(), phases.end(), ref.phase_id) == phases.end()) {
            phases.push_back(ref.phase_id);
        }
    }
    return phases;
}

struct DetectedPeak {
    double angle = 0.0;
    double intensity = 0.0;
    int index = 0;            // position within the Sample
    double prominence = 0.0;
    double width = 0.0;       // samples, at half prominence
};

struct Match {
    DetectedPeak peak;
    ReferencePeak reference;
    size_t reference_index = 0;  // position within the catalog
    double angle_delta = 0.0;
    double quality = 0.0;        // 1 - delta / tolerance
};

// Peak-to-reference assignment policy
enum class MatchPolicy {
    PHASE_FIRST,  // per reference peak, strongest unused detected peak
    PEAK_FIRST    // per detected peak, closest catalog entry
};

inline std::string match_policy_to_string(MatchPolicy policy) {
    switch (policy) {
        case MatchPolicy::PHASE_FIRST: return "phase_first";
        case MatchPolicy::PEAK_FIRST: return "peak_first";
        default: return "unknown";
    }
}

inline std::optional<MatchPolicy> string_to_match_policy(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) {
                       return c == '-' ? '_' : static_cast<char>(std::tolower(c));
                   });

    if (norm == "phase_first") return MatchPolicy::PHASE_FIRST;
    if (norm == "peak_first") return MatchPolicy::PEAK_FIRST;
    return std::nullopt;
}

struct MatchSet {
    MatchPolicy policy = MatchPolicy::PHASE_FIRST;
    double tolerance = 0.0;
    std::vector<Match> matches;                       // ordered by detected angle
    std::vector<DetectedPeak> unmatched_peaks;        // found but unidentified
    std::vector<ReferencePeak> unmatched_references;  // expected but not found
};

struct PhaseStats {
    std::string phase_id;
    std::string symbol;
    int count = 0;
    double percentage = 0.0;  // share of matched peaks
};

struct MatchReport {
    int total_peaks = 0;
    int matched_peaks = 0;
    double match_rate = 0.0;  // percent
    std::vector<PhaseStats> phase_stats;  // descending count
};

// Analysis stage enumeration
enum class Stage {
    INGEST = 0,
    CLEAN = 1,
    DETECT = 2,
    REFERENCES = 3,
    MATCH = 4,
    REPORT = 5,
    DONE = 6
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::INGEST: return "INGEST";
        case Stage::CLEAN: return "CLEAN";
        case Stage::DETECT: return "DETECT";
        case Stage::REFERENCES: return "REFERENCES";
        case Stage::MATCH: return "MATCH";
        case Stage::REPORT: return "REPORT";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace xrd_match
