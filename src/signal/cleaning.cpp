#include "xrd_match/signal/cleaning.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/signal/savgol.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace xrd_match::signal {

bool is_valid_row(double angle, double intensity) {
    return angle > 0.0 && angle < 180.0 && intensity >= 0.0;
}

SeriesTable drop_invalid_rows(const SeriesTable &table) {
    SeriesTable out;
    for (size_t i = 0; i < table.size(); ++i) {
        const double x = table.x[i];
        const double y = table.y[i];
        if (std::isnan(x) || std::isnan(y) || !is_valid_row(x, y)) continue;
        out.x.push_back(x);
        out.y.push_back(y);
    }
    return out;
}

CleanResult clean_series(const SeriesTable &table,
                         const std::optional<CleaningOptions> &options,
                         size_t min_points) {
    CleanResult res;
    res.input_rows = table.size();

    std::vector<double> angle;
    std::vector<double> intensity;
    angle.reserve(table.size());
    intensity.reserve(table.size());

    for (size_t i = 0; i < table.size(); ++i) {
        const double x = table.x[i];
        const double y = table.y[i];
        if (std::isnan(x) || std::isnan(y)) {
            ++res.dropped_missing;
            continue;
        }
        if (!is_valid_row(x, y)) {
            ++res.dropped_out_of_range;
            continue;
        }
        if (options && (x < options->angle_min || x > options->angle_max ||
                        y < options->intensity_threshold)) {
            ++res.dropped_by_options;
            continue;
        }
        angle.push_back(x);
        intensity.push_back(y);
    }

    if (options && options->smooth_window > 1) {
        int window = options->smooth_window;
        if (window % 2 == 0) ++window;
        res.smooth_window = window;

        if (intensity.size() > static_cast<size_t>(window)) {
            try {
                const Eigen::Map<const VectorXd> y(intensity.data(),
                                                   static_cast<Eigen::Index>(intensity.size()));
                const VectorXd smoothed = savgol_filter(y, window, std::min(3, window - 1));
                intensity.assign(smoothed.data(), smoothed.data() + smoothed.size());
                res.smoothing_applied = true;
            } catch (const XrdMatchError &e) {
                res.smoothing_error = e.what();
            }
        }
    }

    // Smoothing can undershoot below zero next to sharp peaks; such rows are
    // dropped, never clamped.
    if (res.smoothing_applied) {
        size_t w = 0;
        for (size_t r = 0; r < angle.size(); ++r) {
            if (!is_valid_row(angle[r], intensity[r])) {
                ++res.dropped_out_of_range;
                continue;
            }
            angle[w] = angle[r];
            intensity[w] = intensity[r];
            ++w;
        }
        angle.resize(w);
        intensity.resize(w);
    }

    std::vector<size_t> order(angle.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return angle[a] < angle[b]; });

    // First row of each angle wins, which also removes exact duplicates.
    std::vector<size_t> kept;
    kept.reserve(order.size());
    for (size_t idx : order) {
        if (!kept.empty() && angle[kept.back()] == angle[idx]) {
            ++res.dropped_duplicates;
            continue;
        }
        kept.push_back(idx);
    }

    if (kept.size() < min_points) {
        throw DataInsufficientError(kept.size(), min_points);
    }

    const Eigen::Index n = static_cast<Eigen::Index>(kept.size());
    res.sample.angle.resize(n);
    res.sample.intensity.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        res.sample.angle(i) = angle[kept[static_cast<size_t>(i)]];
        res.sample.intensity(i) = intensity[kept[static_cast<size_t>(i)]];
    }
    return res;
}

} // namespace xrd_match::signal
