#pragma once

#include "xrd_match/core/types.hpp"

namespace xrd_match::signal {

// Smoothing weights for a centered window (window odd, polyorder < window).
// Throws ValidationError on invalid arguments.
VectorXd savgol_coefficients(int window, int polyorder);

// Savitzky-Golay smoothing. Interior samples use the convolution weights;
// the first and last window/2 samples take the value of a polynomial fitted
// to the first/last full window. Requires y.size() >= window.
VectorXd savgol_filter(const VectorXd &y, int window, int polyorder);

} // namespace xrd_match::signal
