#ifndef CURVZGUESS_HPP
#define CURVZGUESS_HPP

#include <vector>
#include "curvZtypes.hpp"

// Parameter order for every transcendental family: {a, b, c, d}
//   sine:        y = a sin(bx + c) + d
//   logarithm:   y = a ln(bx + c) + d
//   exponential: y = a e^(bx + c) + d
using ParameterVector = std::vector<double>;

struct DataSummary {
    double x_min = 0.0, x_max = 0.0;
    double y_min = 0.0, y_max = 0.0;
    double y_mean = 0.0;
    double x_range = 1.0; // max - min, or 1 when all x coincide
    double y_range = 0.0;
};

DataSummary summarize_points(const std::vector<DataPoint>& points);

// --- sine ---

// 2 cycles over the x range, replaced by the zero-crossing estimate when more than 2 crossings.
double estimate_sine_frequency(const std::vector<DataPoint>& points, const DataSummary& summary);

// Dominant non-DC bin of the uniformly resampled, mean-removed signal (single-precision FFTW).
// Returns false with fewer than 4 points, a flat signal or a degenerate x range.
bool estimate_sine_frequency_fft(const std::vector<DataPoint>& points, double& angular_frequency);

// Phase in [0, 2π) at π/16 steps minimising the squared error for fixed a, b, d.
double scan_sine_phase(const std::vector<DataPoint>& points, double a, double b, double d);

ParameterVector sine_primary_estimate(const std::vector<DataPoint>& points);

// Primary estimate first, then the spectral estimate and the systematic variations.
std::vector<ParameterVector> sine_initial_guesses(const std::vector<DataPoint>& points);

// --- logarithm ---

struct LogRegression {
    bool success = false; // false when ln(x) has no spread
    double a = 0.0;
    double d = 0.0;
};

// Ordinary least squares of y against ln(x); all x must be positive.
LogRegression log_linear_regression(const std::vector<DataPoint>& points);

std::vector<ParameterVector> log_initial_guesses(const std::vector<DataPoint>& points, const LogRegression& regression);

// --- exponential ---

struct ExponentialEstimates {
    bool has_log_linear = false; // regression on ln(y), all y > 0
    ParameterVector log_linear;
    bool has_shifted = false;    // regression on ln(y - 0.9 min(y))
    ParameterVector shifted;
};

ExponentialEstimates exponential_estimates(const std::vector<DataPoint>& points);

std::vector<ParameterVector> exponential_initial_guesses(const std::vector<DataPoint>& points,
                                                         const ExponentialEstimates& estimates);

#endif // CURVZGUESS_HPP
