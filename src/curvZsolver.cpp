#include "curvZsolver.hpp"
#include "curvZexact.hpp"
#include "curvZlogger.hpp"
#include <exception>
#include <string>

namespace {

using SolverFunction = FitResult (*)(const std::vector<DataPoint>&, const FitOptions&);

FitResult solve_linear(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_linear(p, o.use_fractions); }
FitResult solve_quadratic(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_quadratic(p, o.use_fractions); }
FitResult solve_cubic(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_cubic(p, o.use_fractions); }
FitResult solve_circle(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_circle(p, o.use_fractions); }
FitResult solve_ellipse(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_ellipse_exact(p, o.use_fractions); }
FitResult solve_conic(const std::vector<DataPoint>& p, const FitOptions& o) { return fit_conic(p, o.use_fractions); }

// Same order as EquationKind
const SolverFunction kSolvers[kEquationKindCount] = {
    solve_linear,
    solve_quadratic,
    solve_cubic,
    solve_circle,
    solve_ellipse,
    solve_conic,
    fit_sine,
    fit_logarithm,
    fit_exponential,
    fit_ellipse_approx,
};

} // namespace

FitResult solve_equation(EquationKind kind, const std::vector<DataPoint>& points, const FitOptions& options) {
    const int index = static_cast<int>(kind);
    if (index < 0 || index >= kEquationKindCount) {
        return make_error_result(FitError::UnknownKind, "Unknown equation type");
    }

    if (is_exact_kind(kind) && !find_duplicate_points(points).empty()) {
        return make_error_result(FitError::DuplicatePoints,
            "Duplicate points detected. Each point must be unique for exact equations.");
    }

    try {
        FitResult result = kSolvers[index](points, options);
        if (result.success && !coefficients_are_finite(result.coefficients)) {
            return make_error_result(FitError::InvalidCoefficients,
                std::string("Invalid coefficients for ") + equation_kind_name(kind) + " equation");
        }
        return result;
    } catch (const std::exception& e) {
        const std::string what = e.what();
        const std::string message = what.empty() ? std::string("Unknown error") : what;
        if (options.logger) {
            *options.logger << "Error: " << equation_kind_name(kind) << " solver raised: " << message << std::endl;
        }
        return make_error_result(FitError::InvalidCoefficients,
            std::string("Failed to solve ") + equation_kind_name(kind) + " equation: " + message);
    }
}

FitResult solve_equation(EquationKind kind, const std::vector<DataPoint>& points, bool use_fractions) {
    FitOptions options;
    options.use_fractions = use_fractions;
    return solve_equation(kind, points, options);
}
