#include "curvZlevmar.hpp"
#include "curvZlinsolve.hpp"
#include <algorithm> // For std::max
#include <cmath>     // For std::abs, std::isfinite

double sum_squared_residuals(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const ModelFunction& model,
    const std::vector<double>& params) {

    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double predicted = model(params, x[i]);
        if (!std::isfinite(predicted)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        const double r = y[i] - predicted;
        sum += r * r;
    }
    return sum;
}

LevMarResult levenberg_marquardt(
    const std::vector<double>& x,
    const std::vector<double>& y,
    const ModelFunction& model,
    const std::vector<double>& initial_params,
    const LevMarOptions& options,
    const Deadline* deadline) {

    LevMarResult result;
    result.parameters = initial_params;

    const size_t n = x.size();
    const size_t m = initial_params.size();
    if (n == 0 || n != y.size() || m == 0) {
        result.message = "Empty data or parameter vector.";
        return result;
    }

    std::vector<double> params = initial_params;
    double error = sum_squared_residuals(x, y, model, params);
    if (!std::isfinite(error)) {
        result.message = "Model is not finite at the initial parameters.";
        return result;
    }

    double lambda = options.damping;
    std::vector<double> residuals(n);
    std::vector<double> jacobian(n * m); // row-major, n rows
    std::vector<double> perturbed(m);

    int iter = 0;
    for (; iter < options.max_iterations; ++iter) {
        if (deadline && deadline->expired()) {
            result.message = "Time budget exhausted.";
            break;
        }
        if (error <= options.error_tolerance) {
            result.converged = true;
            result.message = "Residual below tolerance.";
            break;
        }

        bool jacobian_finite = true;
        for (size_t i = 0; i < n; ++i) {
            residuals[i] = y[i] - model(params, x[i]);
        }
        for (size_t j = 0; j < m && jacobian_finite; ++j) {
            perturbed = params;
            const double step = options.gradient_difference * std::max(1.0, std::abs(params[j]));
            perturbed[j] += step;
            for (size_t i = 0; i < n; ++i) {
                const double base = y[i] - residuals[i];
                const double derivative = (model(perturbed, x[i]) - base) / step;
                if (!std::isfinite(derivative)) {
                    jacobian_finite = false;
                    break;
                }
                jacobian[i * m + j] = derivative;
            }
        }
        if (!jacobian_finite) {
            result.message = "Jacobian is not finite.";
            break;
        }

        // Normal equations J^T J and J^T r
        std::vector<std::vector<double>> JtJ(m, std::vector<double>(m, 0.0));
        std::vector<double> Jtr(m, 0.0);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = 0; j < m; ++j) {
                const double jij = jacobian[i * m + j];
                Jtr[j] += jij * residuals[i];
                for (size_t k = 0; k < m; ++k) {
                    JtJ[j][k] += jij * jacobian[i * m + k];
                }
            }
        }

        double max_gradient = 0.0;
        for (double g : Jtr) max_gradient = std::max(max_gradient, std::abs(g));
        if (max_gradient < options.gradient_tolerance) {
            result.converged = true;
            result.message = "Gradient below tolerance.";
            break;
        }

        std::vector<std::vector<double>> damped = JtJ;
        for (size_t j = 0; j < m; ++j) {
            damped[j][j] += lambda * std::max(JtJ[j][j], 1e-12);
        }

        LinearSolveResult step = solve_linear_system(damped, Jtr);
        if (!step.success) {
            lambda *= options.damping_step_up;
            if (lambda > 1e16) {
                result.message = "Damping diverged on a singular system.";
                break;
            }
            continue;
        }

        std::vector<double> candidate = params;
        for (size_t j = 0; j < m; ++j) candidate[j] += step.solution[j];
        const double candidate_error = sum_squared_residuals(x, y, model, candidate);

        if (std::isfinite(candidate_error) && candidate_error < error) {
            params = candidate;
            error = candidate_error;
            lambda = std::max(lambda / options.damping_step_down, 1e-15);
        } else {
            lambda *= options.damping_step_up;
            // No downhill step left at any damping: a (local) minimum
            if (lambda > 1e16) {
                result.converged = true;
                result.message = "Step rejected at maximum damping.";
                break;
            }
        }
    }

    if (iter >= options.max_iterations && result.message.empty()) {
        result.message = "Iteration limit reached.";
    }

    result.parameters = params;
    result.residual_sum_squares = error;
    result.iterations = iter;
    result.success = std::isfinite(error);
    for (double p : params) {
        if (!std::isfinite(p)) result.success = false;
    }
    return result;
}
