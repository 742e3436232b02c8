#include "curvZapprox.hpp"
#include "curvZellipse.hpp"
#include "curvZformat.hpp"
#include "curvZlogger.hpp"
#include "curvZquality.hpp"
#include <algorithm> // For std::min, std::max
#include <cmath>
#include <limits>

namespace {

void split_points(const std::vector<DataPoint>& points, std::vector<double>& x, std::vector<double>& y) {
    x.clear();
    y.clear();
    for (const auto& p : points) {
        x.push_back(p.x);
        y.push_back(p.y);
    }
}

bool tracing(Logger* logger) {
    return logger && logger->verbose && logger->enabled();
}

double model_r_squared(const std::vector<DataPoint>& points, const ModelFunction& model, const ParameterVector& params) {
    return r_squared(points, [&](double xi) { return model(params, xi); });
}

// y = a f(bx + c) + d result; non-finite coefficients become an error.
FitResult transcendental_result(const std::string& function_name, const FitCandidate& fit, bool use_fractions) {
    FitResult result;
    result.coefficients = {
        {"a", fit.parameters[0]}, {"b", fit.parameters[1]},
        {"c", fit.parameters[2]}, {"d", fit.parameters[3]},
    };
    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to fit " + function_name + " curve - coefficients are not finite");
    }
    result.equation = build_transcendental_equation(function_name, fit.parameters[0], fit.parameters[1],
                                                    fit.parameters[2], fit.parameters[3], use_fractions);
    result.machine_equation = result.equation;
    const double r2 = std::isfinite(fit.r_squared) ? fit.r_squared : 0.0;
    result.r_squared = std::max(0.0, std::min(1.0, r2));
    result.success = true;
    return result;
}

LevMarOptions relaxed_options() {
    LevMarOptions options;
    options.damping = 1.0;
    options.max_iterations = 50;
    options.error_tolerance = 1e-6;
    return options;
}

} // namespace

std::optional<FitCandidate> run_multistart(
    const std::vector<DataPoint>& points,
    const MultiStartSearch& search,
    const std::vector<ParameterVector>& guesses,
    const Deadline& deadline,
    Logger* logger) {

    std::vector<double> x, y;
    split_points(points, x, y);

    std::optional<FitCandidate> best;
    double best_r2 = -std::numeric_limits<double>::infinity();

    for (size_t i = 0; i < guesses.size(); ++i) {
        // Only the start of a guess is gated; the first one always runs
        if (i > 0 && deadline.expired()) {
            if (tracing(logger)) {
                *logger << "[" << search.family << "] time budget exhausted after " << i << " of "
                        << guesses.size() << " guesses" << std::endl;
            }
            break;
        }

        const ParameterVector& guess = guesses[i];
        if (search.admissible && !search.admissible(guess)) continue;
        if (!std::isfinite(sum_squared_residuals(x, y, search.model, guess))) continue;

        LevMarResult lm = levenberg_marquardt(x, y, search.model, guess, search.lm, &deadline);
        if (!lm.success) continue;
        if (search.admissible && !search.admissible(lm.parameters)) continue;

        const double r2 = model_r_squared(points, search.model, lm.parameters);
        if (tracing(logger)) {
            *logger << "[" << search.family << "] guess " << (i + 1) << "/" << guesses.size()
                    << ": R^2 = " << r2 << " after " << lm.iterations << " iterations (" << lm.message << ")"
                    << std::endl;
        }

        if (std::isfinite(r2) && r2 >= 0.0 && r2 > best_r2) {
            best_r2 = r2;
            best = FitCandidate{lm.parameters, r2};
            if (r2 > kGoodEnoughRSquared) break;
        }
    }
    return best;
}

FitCandidate fit_with_fallback(
    const std::vector<DataPoint>& points,
    const MultiStartSearch& search,
    const std::vector<ParameterVector>& guesses,
    const ParameterVector& seed,
    const Deadline& deadline,
    Logger* logger) {

    std::optional<FitCandidate> best = run_multistart(points, search, guesses, deadline, logger);
    if (best) return *best;

    if (tracing(logger)) {
        *logger << "[" << search.family << "] no guess qualified, relaxed run from the primary estimate" << std::endl;
    }

    std::vector<double> x, y;
    split_points(points, x, y);
    const bool seed_usable = (!search.admissible || search.admissible(seed)) &&
                             std::isfinite(sum_squared_residuals(x, y, search.model, seed));
    if (seed_usable) {
        LevMarResult lm = levenberg_marquardt(x, y, search.model, seed, search.fallback);
        if (lm.success && (!search.admissible || search.admissible(lm.parameters))) {
            const double r2 = model_r_squared(points, search.model, lm.parameters);
            return FitCandidate{lm.parameters, std::isfinite(r2) ? std::max(0.0, r2) : 0.0};
        }
    }

    if (tracing(logger)) {
        *logger << "[" << search.family << "] relaxed run failed, returning the primary estimate" << std::endl;
    }
    return FitCandidate{seed, 0.0};
}

FitResult fit_sine(const std::vector<DataPoint>& points, const FitOptions& options) {
    if (points.size() < 3) {
        return make_error_result(FitError::WrongPointCount, "Need at least 3 points for sine approximation");
    }

    MultiStartSearch search;
    search.family = "sine";
    search.model = [](const ParameterVector& p, double xi) { return p[0] * std::sin(p[1] * xi + p[2]) + p[3]; };
    search.lm.damping = 1.8;
    search.lm.max_iterations = 200;
    search.lm.error_tolerance = 1e-9;
    search.lm.gradient_difference = 1e-8;
    search.fallback = relaxed_options();

    const std::vector<ParameterVector> guesses = sine_initial_guesses(points);
    const Deadline deadline(options.time_budget, options.clock);
    const FitCandidate fit = fit_with_fallback(points, search, guesses, guesses.front(), deadline, options.logger);
    return transcendental_result("sin", fit, options.use_fractions);
}

FitResult fit_logarithm(const std::vector<DataPoint>& points, const FitOptions& options) {
    if (points.size() < 3) {
        return make_error_result(FitError::WrongPointCount, "Need at least 3 points for logarithmic approximation");
    }
    for (const auto& p : points) {
        if (!(p.x > 0.0)) {
            return make_error_result(FitError::NonPositiveDomain,
                "Logarithmic fit requires all x values to be positive");
        }
    }

    const LogRegression regression = log_linear_regression(points);
    if (!regression.success) {
        // ln(x) has no spread: plain ln(x) shifted to the mean
        const DataSummary summary = summarize_points(points);
        return transcendental_result("ln", FitCandidate{{1.0, 1.0, 0.0, summary.y_mean}, 0.0}, options.use_fractions);
    }

    std::vector<double> xs;
    for (const auto& p : points) xs.push_back(p.x);

    MultiStartSearch search;
    search.family = "log";
    search.model = [](const ParameterVector& p, double xi) {
        const double argument = p[1] * xi + p[2];
        if (argument <= 0.0) return std::numeric_limits<double>::quiet_NaN();
        return p[0] * std::log(argument) + p[3];
    };
    search.admissible = [xs](const ParameterVector& p) {
        for (double xi : xs) {
            if (!(p[1] * xi + p[2] > 0.0)) return false;
        }
        return true;
    };
    search.lm.damping = 1.8;
    search.lm.max_iterations = 180;
    search.lm.error_tolerance = 1e-9;
    search.lm.gradient_difference = 1e-7;
    search.fallback = relaxed_options();

    const std::vector<ParameterVector> guesses = log_initial_guesses(points, regression);
    const Deadline deadline(options.time_budget, options.clock);
    const FitCandidate fit = fit_with_fallback(points, search, guesses, guesses.front(), deadline, options.logger);
    return transcendental_result("ln", fit, options.use_fractions);
}

FitResult fit_exponential(const std::vector<DataPoint>& points, const FitOptions& options) {
    if (points.size() < 3) {
        return make_error_result(FitError::WrongPointCount, "Need at least 3 points for exponential approximation");
    }

    std::vector<double> xs;
    for (const auto& p : points) xs.push_back(p.x);

    MultiStartSearch search;
    search.family = "exponential";
    search.model = [](const ParameterVector& p, double xi) { return p[0] * std::exp(p[1] * xi + p[2]) + p[3]; };
    const ModelFunction model = search.model;
    search.admissible = [xs, model](const ParameterVector& p) {
        for (double xi : xs) {
            if (!std::isfinite(model(p, xi))) return false; // overflow
        }
        return true;
    };
    search.lm.damping = 2.2;
    search.lm.max_iterations = 160;
    search.lm.error_tolerance = 1e-9;
    search.lm.gradient_difference = 1e-7;
    search.fallback = relaxed_options();

    const ExponentialEstimates estimates = exponential_estimates(points);
    const std::vector<ParameterVector> guesses = exponential_initial_guesses(points, estimates);

    ParameterVector seed;
    if (estimates.has_log_linear) {
        seed = estimates.log_linear;
    } else if (estimates.has_shifted) {
        seed = estimates.shifted;
    } else {
        const DataSummary s = summarize_points(points);
        seed = {s.y_range, 1.0 / s.x_range, 0.0, s.y_min};
    }

    const Deadline deadline(options.time_budget, options.clock);
    const FitCandidate fit = fit_with_fallback(points, search, guesses, seed, deadline, options.logger);
    return transcendental_result("e^", fit, options.use_fractions);
}

FitResult fit_ellipse_approx(const std::vector<DataPoint>& points, const FitOptions& options) {
    if (points.size() < 4) {
        return make_error_result(FitError::WrongPointCount, "Need at least 4 points for ellipse approximation");
    }

    const Deadline deadline(options.time_budget, options.clock);
    const EllipseFitResult fit = fit_axis_aligned_ellipse(points, &deadline);
    if (tracing(options.logger)) {
        *options.logger << "[ellipse-approx] " << fit.message << std::endl;
    }
    if (!fit.success) {
        return make_error_result(FitError::NoValidFit, "Unable to fit ellipse: " + fit.message);
    }

    const EllipseParameters& e = fit.params;
    FitResult result;
    result.coefficients = {{"h", e.h}, {"k", e.k}, {"a", e.a}, {"b", e.b}};
    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients, "Unable to fit ellipse - invalid coefficients");
    }
    result.r_squared = ellipse_r_squared(points, e.h, e.k, e.a, e.b);
    result.equation = build_ellipse_equation(e.h, e.k, e.a, e.b, options.use_fractions);
    result.machine_equation = build_ellipse_latex(e.h, e.k, e.a, e.b, options.use_fractions);
    result.success = true;
    return result;
}
