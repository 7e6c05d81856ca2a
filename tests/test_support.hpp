#pragma once

#include "xrd_match/core/types.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace xrd_match::testing {

namespace fs = std::filesystem;

// Scratch directory removed when the test case ends.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("xrd_match_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    fs::path write(const std::string& name, const std::string& content) const {
        const fs::path p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    fs::path path_;
};

struct Bump {
    double center;
    double height;
    double sigma;
};

// n evenly spaced angles over [lo, hi]; baseline plus Gaussian bumps plus
// normal noise from a fixed seed.
inline Sample synthetic_pattern(int n, double lo, double hi, double baseline,
                                double noise_std, const std::vector<Bump>& bumps,
                                unsigned seed = 42) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> noise(0.0, noise_std > 0.0 ? noise_std : 1.0);

    Sample s;
    s.angle.resize(n);
    s.intensity.resize(n);
    for (int i = 0; i < n; ++i) {
        const double a = lo + (hi - lo) * i / (n - 1);
        double y = baseline;
        for (const auto& b : bumps) {
            const double d = (a - b.center) / b.sigma;
            y += b.height * std::exp(-0.5 * d * d);
        }
        if (noise_std > 0.0) y += noise(rng);
        s.angle(i) = a;
        s.intensity(i) = std::max(0.0, y);
    }
    return s;
}

inline std::string to_text(const Sample& s, char sep = '\t') {
    std::string out;
    for (Eigen::Index i = 0; i < s.size(); ++i) {
        out += std::to_string(s.angle(i)) + sep + std::to_string(s.intensity(i)) + "\n";
    }
    return out;
}

inline SeriesTable to_table(const Sample& s) {
    SeriesTable t;
    t.x.assign(s.angle.data(), s.angle.data() + s.angle.size());
    t.y.assign(s.intensity.data(), s.intensity.data() + s.intensity.size());
    return t;
}

inline DetectedPeak peak_at(double angle, double intensity, int index = 0) {
    DetectedPeak p;
    p.angle = angle;
    p.intensity = intensity;
    p.index = index;
    return p;
}

inline ReferencePeak ref_at(double angle, const std::string& phase, double intensity = 0.0,
                            const std::string& symbol = "*") {
    return {angle, intensity, phase, symbol};
}

} // namespace xrd_match::testing
