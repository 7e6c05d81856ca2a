#include "xrd_match/metrics/match_statistics.hpp"

#include <algorithm>
#include <iterator>

namespace xrd_match::metrics {

MatchReport compute_statistics(int total_detected, const MatchSet &match_set) {
    MatchReport report;
    report.total_peaks = total_detected;
    report.matched_peaks = static_cast<int>(match_set.matches.size());
    report.match_rate = total_detected > 0
                            ? 100.0 * report.matched_peaks / static_cast<double>(total_detected)
                            : 0.0;

    for (const auto &m : match_set.matches) {
        auto it = std::find_if(report.phase_stats.begin(), report.phase_stats.end(),
                               [&](const PhaseStats &s) { return s.phase_id == m.reference.phase_id; });
        if (it == report.phase_stats.end()) {
            PhaseStats s;
            s.phase_id = m.reference.phase_id;
            s.symbol = m.reference.symbol;
            report.phase_stats.push_back(s);
            it = std::prev(report.phase_stats.end());
        }
        ++it->count;
    }

    for (auto &s : report.phase_stats) {
        s.percentage = 100.0 * s.count / static_cast<double>(report.matched_peaks);
    }
    std::stable_sort(report.phase_stats.begin(), report.phase_stats.end(),
                     [](const PhaseStats &a, const PhaseStats &b) { return a.count > b.count; });
    return report;
}

} // namespace xrd_match::metrics
