#include "xrd_match/signal/savgol.hpp"
#include "xrd_match/core/errors.hpp"

#include <Eigen/QR>
#include <cmath>

namespace xrd_match::signal {

namespace {

// Vandermonde matrix over offsets -h..h
Eigen::MatrixXd design_matrix(int window, int polyorder) {
    const int half = window / 2;
    Eigen::MatrixXd a(window, polyorder + 1);
    for (int i = 0; i < window; ++i) {
        const double x = static_cast<double>(i - half);
        double p = 1.0;
        for (int k = 0; k <= polyorder; ++k) {
            a(i, k) = p;
            p *= x;
        }
    }
    return a;
}

void check_arguments(int window, int polyorder) {
    if (window < 1 || window % 2 == 0) {
        throw ValidationError("savgol window must be a positive odd number, got " +
                              std::to_string(window));
    }
    if (polyorder < 0 || polyorder >= window) {
        throw ValidationError("savgol polyorder must be in [0, window), got " +
                              std::to_string(polyorder));
    }
}

} // namespace

VectorXd savgol_coefficients(int window, int polyorder) {
    check_arguments(window, polyorder);
    const Eigen::MatrixXd a = design_matrix(window, polyorder);
    // Row 0 of the pseudo-inverse evaluates the fitted polynomial at offset 0.
    const Eigen::MatrixXd pinv = a.completeOrthogonalDecomposition().pseudoInverse();
    return pinv.row(0).transpose();
}

VectorXd savgol_filter(const VectorXd &y, int window, int polyorder) {
    check_arguments(window, polyorder);
    const Eigen::Index n = y.size();
    if (n < window) {
        throw ValidationError("savgol window " + std::to_string(window) +
                              " exceeds series length " + std::to_string(n));
    }
    if (!y.allFinite()) {
        throw ValidationError("savgol input contains non-finite values");
    }

    const int half = window / 2;
    const Eigen::MatrixXd a = design_matrix(window, polyorder);
    const Eigen::MatrixXd pinv = a.completeOrthogonalDecomposition().pseudoInverse();
    const VectorXd coeffs = pinv.row(0).transpose();

    VectorXd out(n);
    for (Eigen::Index i = half; i < n - half; ++i) {
        out(i) = coeffs.dot(y.segment(i - half, window));
    }

    const VectorXd head_fit = a * (pinv * y.head(window));
    const VectorXd tail_fit = a * (pinv * y.tail(window));
    for (int i = 0; i < half; ++i) {
        out(i) = head_fit(i);
        out(n - half + i) = tail_fit(window - half + i);
    }
    return out;
}

} // namespace xrd_match::signal
