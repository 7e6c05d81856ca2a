#include "xrd_match/detection/peak_detection.hpp"
#include "xrd_match/core/errors.hpp"
#include "xrd_match/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace xrd_match::detection {

EffectiveThresholds effective_thresholds(const VectorXd &intensity,
                                         const DetectionParams &params) {
    EffectiveThresholds t;
    t.height = params.height;
    t.prominence = params.prominence;
    if (intensity.size() == 0) {
        return t;
    }

    t.mean = core::mean_of(intensity);
    t.stddev = core::stddev_of(intensity);
    t.max = intensity.maxCoeff();

    if (params.adaptive.enabled && t.max > 0.0) {
        const auto &a = params.adaptive;
        const double adaptive_height = std::max(t.mean + a.sigma_factor * t.stddev,
                                                a.height_fraction * t.max);
        const double adaptive_prominence = std::max(t.stddev, a.prominence_fraction * t.max);
        t.height = std::min(params.height, adaptive_height);
        t.prominence = std::min(params.prominence, adaptive_prominence);
    }
    return t;
}

std::vector<int> find_local_maxima(const VectorXd &x) {
    std::vector<int> peaks;
    const int n = static_cast<int>(x.size());
    int i = 1;
    const int i_max = n - 1;
    while (i < i_max) {
        if (x(i - 1) < x(i)) {
            int ahead = i + 1;
            while (ahead < i_max && x(ahead) == x(i)) {
                ++ahead;
            }
            if (x(ahead) < x(i)) {
                const int left = i;
                const int right = ahead - 1;
                peaks.push_back((left + right) / 2);
                i = ahead;
            }
        }
        ++i;
    }
    return peaks;
}

std::vector<Prominence> peak_prominences(const VectorXd &x, const std::vector<int> &peaks) {
    std::vector<Prominence> out;
    out.reserve(peaks.size());
    const int n = static_cast<int>(x.size());

    for (int peak : peaks) {
        const double top = x(peak);
        Prominence p;

        // Walk outwards until strictly higher terrain or the signal bound.
        double left_min = top;
        p.left_base = peak;
        for (int i = peak; i >= 0 && x(i) <= top; --i) {
            if (x(i) < left_min) {
                left_min = x(i);
                p.left_base = i;
            }
        }

        double right_min = top;
        p.right_base = peak;
        for (int i = peak; i < n && x(i) <= top; ++i) {
            if (x(i) < right_min) {
                right_min = x(i);
                p.right_base = i;
            }
        }

        p.value = top - std::max(left_min, right_min);
        out.push_back(p);
    }
    return out;
}

std::vector<double> peak_widths(const VectorXd &x, const std::vector<int> &peaks,
                                const std::vector<Prominence> &prominences,
                                double rel_height) {
    std::vector<double> widths;
    widths.reserve(peaks.size());

    for (size_t k = 0; k < peaks.size(); ++k) {
        const int peak = peaks[k];
        const Prominence &p = prominences[k];
        const double level = x(peak) - p.value * rel_height;

        int i = peak;
        while (p.left_base < i && level < x(i)) --i;
        double left_ip = i;
        if (x(i) < level) {
            left_ip += (level - x(i)) / (x(i + 1) - x(i));
        }

        i = peak;
        while (i < p.right_base && level < x(i)) ++i;
        double right_ip = i;
        if (x(i) < level) {
            right_ip -= (level - x(i)) / (x(i - 1) - x(i));
        }

        widths.push_back(right_ip - left_ip);
    }
    return widths;
}

std::vector<int> select_by_distance(const VectorXd &x, const std::vector<int> &peaks,
                                    double distance) {
    const int min_gap = static_cast<int>(std::ceil(distance));
    const size_t n = peaks.size();
    if (n == 0 || min_gap <= 1) {
        return peaks;
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return x(peaks[a]) > x(peaks[b]); });

    std::vector<bool> keep(n, true);
    for (size_t j : order) {
        if (!keep[j]) continue;
        for (size_t k = j; k-- > 0 && peaks[j] - peaks[k] < min_gap;) {
            keep[k] = false;
        }
        for (size_t k = j + 1; k < n && peaks[k] - peaks[j] < min_gap; ++k) {
            keep[k] = false;
        }
    }

    std::vector<int> out;
    for (size_t k = 0; k < n; ++k) {
        if (keep[k]) out.push_back(peaks[k]);
    }
    return out;
}

DetectionResult detect_peaks(const Sample &sample, const DetectionParams &params) {
    if (sample.empty()) {
        throw ValidationError("peak detection needs a non-empty sample");
    }
    if (!(params.distance >= 1.0)) {
        throw ValidationError("peak distance must be >= 1, got " + std::to_string(params.distance));
    }

    const VectorXd &y = sample.intensity;
    DetectionResult res;
    res.thresholds = effective_thresholds(y, params);

    std::vector<int> candidates = find_local_maxima(y);
    res.stats.local_maxima = static_cast<int>(candidates.size());

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](int i) { return y(i) < res.thresholds.height; }),
                     candidates.end());
    res.stats.after_height = static_cast<int>(candidates.size());

    candidates = select_by_distance(y, candidates, params.distance);
    res.stats.after_distance = static_cast<int>(candidates.size());

    std::vector<Prominence> proms = peak_prominences(y, candidates);
    std::vector<int> kept;
    std::vector<Prominence> kept_proms;
    for (size_t k = 0; k < candidates.size(); ++k) {
        if (proms[k].value >= res.thresholds.prominence) {
            kept.push_back(candidates[k]);
            kept_proms.push_back(proms[k]);
        }
    }
    res.stats.after_prominence = static_cast<int>(kept.size());

    const std::vector<double> widths = peak_widths(y, kept, kept_proms);
    for (size_t k = 0; k < kept.size(); ++k) {
        if (widths[k] < params.width) continue;
        DetectedPeak peak;
        peak.index = kept[k];
        peak.angle = sample.angle(kept[k]);
        peak.intensity = y(kept[k]);
        peak.prominence = kept_proms[k].value;
        peak.width = widths[k];
        res.peaks.push_back(peak);
    }
    res.stats.after_width = static_cast<int>(res.peaks.size());
    return res;
}

} // namespace xrd_match::detection
