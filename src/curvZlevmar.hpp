#ifndef CURVZLEVMAR_HPP
#define CURVZLEVMAR_HPP

#include <functional>
#include <limits>
#include <string>
#include <vector>
#include "curvZdeadline.hpp"

// Model y = f(params, x).
using ModelFunction = std::function<double(const std::vector<double>& params, double x)>;

struct LevMarOptions {
    double damping = 1.0;              // initial lambda
    int max_iterations = 100;
    double error_tolerance = 1e-7;     // on the sum of squared residuals
    double gradient_difference = 1e-6; // forward-difference step, relative to max(1, |p|)
    double gradient_tolerance = 1e-12; // on max |J^T r|
    double damping_step_up = 11.0;
    double damping_step_down = 9.0;
};

struct LevMarResult {
    std::vector<double> parameters;
    double residual_sum_squares = std::numeric_limits<double>::infinity();
    int iterations = 0;
    bool converged = false;
    bool success = false; // parameters and residuals finite
    std::string message;
};

// Sum of squared residuals; NaN when the model is not finite at any x.
double sum_squared_residuals(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const ModelFunction& model,
    const std::vector<double>& params
);

// Damped Gauss-Newton with Marquardt diagonal scaling and a forward-difference
// Jacobian. The deadline, when given, is checked between iterations.
LevMarResult levenberg_marquardt(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const ModelFunction& model,
    const std::vector<double>& initial_params,
    const LevMarOptions& options,
    const Deadline* deadline = nullptr
);

#endif // CURVZLEVMAR_HPP
