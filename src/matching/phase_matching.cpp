#include "xrd_match/matching/phase_matching.hpp"
#include "xrd_match/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace xrd_match::matching {

namespace {

Match make_match(const DetectedPeak &peak, const ReferenceCatalog &catalog, size_t ref_index,
                 double tolerance) {
    Match m;
    m.peak = peak;
    m.reference = catalog[ref_index];
    m.reference_index = ref_index;
    m.angle_delta = std::fabs(peak.angle - catalog[ref_index].angle);
    m.quality = 1.0 - m.angle_delta / tolerance;
    return m;
}

void match_phase_first(const std::vector<DetectedPeak> &peaks, const ReferenceCatalog &catalog,
                       double tolerance, MatchSet &out, std::vector<bool> &peak_used,
                       std::vector<bool> &ref_used) {
    std::vector<size_t> by_intensity(peaks.size());
    std::iota(by_intensity.begin(), by_intensity.end(), 0);
    std::stable_sort(by_intensity.begin(), by_intensity.end(),
                     [&](size_t a, size_t b) { return peaks[a].intensity > peaks[b].intensity; });

    for (const auto &phase : catalog_phase_order(catalog)) {
        for (size_t r = 0; r < catalog.size(); ++r) {
            if (catalog[r].phase_id != phase) continue;

            // First in-range candidate in descending-intensity order is the strongest.
            for (size_t p : by_intensity) {
                if (peak_used[p]) continue;
                if (std::fabs(peaks[p].angle - catalog[r].angle) > tolerance) continue;
                out.matches.push_back(make_match(peaks[p], catalog, r, tolerance));
                peak_used[p] = true;
                ref_used[r] = true;
                break;
            }
        }
    }
}

void match_peak_first(const std::vector<DetectedPeak> &peaks, const ReferenceCatalog &catalog,
                      double tolerance, MatchSet &out, std::vector<bool> &peak_used,
                      std::vector<bool> &ref_used) {
    for (size_t p = 0; p < peaks.size(); ++p) {
        bool found = false;
        size_t best = 0;
        double best_delta = 0.0;
        for (size_t r = 0; r < catalog.size(); ++r) {
            const double delta = std::fabs(peaks[p].angle - catalog[r].angle);
            if (delta > tolerance) continue;
            if (!found || delta < best_delta ||
                (delta == best_delta && catalog[r].intensity > catalog[best].intensity)) {
                found = true;
                best = r;
                best_delta = delta;
            }
        }
        if (found) {
            out.matches.push_back(make_match(peaks[p], catalog, best, tolerance));
            peak_used[p] = true;
            ref_used[best] = true;
        }
    }
}

} // namespace

MatchSet match_peaks(const std::vector<DetectedPeak> &peaks, const ReferenceCatalog &catalog,
                     double tolerance, MatchPolicy policy) {
    if (!std::isfinite(tolerance) || tolerance <= 0.0) {
        throw InvalidToleranceError(tolerance);
    }
    if (catalog.empty()) {
        throw NoReferenceDataError("reference catalog is empty");
    }

    MatchSet out;
    out.policy = policy;
    out.tolerance = tolerance;

    std::vector<bool> peak_used(peaks.size(), false);
    std::vector<bool> ref_used(catalog.size(), false);

    if (policy == MatchPolicy::PEAK_FIRST) {
        match_peak_first(peaks, catalog, tolerance, out, peak_used, ref_used);
    } else {
        match_phase_first(peaks, catalog, tolerance, out, peak_used, ref_used);
    }

    std::stable_sort(out.matches.begin(), out.matches.end(),
                     [](const Match &a, const Match &b) { return a.peak.angle < b.peak.angle; });

    for (size_t p = 0; p < peaks.size(); ++p) {
        if (!peak_used[p]) out.unmatched_peaks.push_back(peaks[p]);
    }
    for (size_t r = 0; r < catalog.size(); ++r) {
        if (!ref_used[r]) out.unmatched_references.push_back(catalog[r]);
    }
    return out;
}

} // namespace xrd_match::matching
