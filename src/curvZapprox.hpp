#ifndef CURVZAPPROX_HPP
#define CURVZAPPROX_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "curvZtypes.hpp"
#include "curvZdeadline.hpp"
#include "curvZguess.hpp"
#include "curvZlevmar.hpp"

class Logger;

struct FitOptions {
    bool use_fractions = true;
    std::chrono::milliseconds time_budget{2000}; // per approximation search
    Deadline::Clock clock;                       // empty: steady_clock
    Logger* logger = nullptr;                    // trace output when logger->verbose
};

// R² above this ends a multi-start search early.
constexpr double kGoodEnoughRSquared = 0.999;

struct FitCandidate {
    ParameterVector parameters;
    double r_squared = 0.0;
};

// Rejects parameter vectors the model cannot be evaluated at (e.g. ln of a non-positive argument).
using ParameterCheck = std::function<bool(const ParameterVector&)>;

struct MultiStartSearch {
    std::string family;     // for trace output
    ModelFunction model;
    ParameterCheck admissible;
    LevMarOptions lm;       // per-guess refinement
    LevMarOptions fallback; // single relaxed run when no guess qualifies
};

// Refines every guess in order until the deadline passes or R² exceeds kGoodEnoughRSquared.
// Keeps the highest finite, non-negative R². Empty when nothing qualified.
std::optional<FitCandidate> run_multistart(
    const std::vector<DataPoint>& points,
    const MultiStartSearch& search,
    const std::vector<ParameterVector>& guesses,
    const Deadline& deadline,
    Logger* logger
);

// Multi-start, then one relaxed run from `seed`, then `seed` itself with R² = 0.
FitCandidate fit_with_fallback(
    const std::vector<DataPoint>& points,
    const MultiStartSearch& search,
    const std::vector<ParameterVector>& guesses,
    const ParameterVector& seed,
    const Deadline& deadline,
    Logger* logger
);

// y = a sin(bx + c) + d, at least 3 points.
FitResult fit_sine(const std::vector<DataPoint>& points, const FitOptions& options = FitOptions());

// y = a ln(bx + c) + d, at least 3 points, all x > 0.
FitResult fit_logarithm(const std::vector<DataPoint>& points, const FitOptions& options = FitOptions());

// y = a e^(bx + c) + d, at least 3 points.
FitResult fit_exponential(const std::vector<DataPoint>& points, const FitOptions& options = FitOptions());

// (x-h)²/a² + (y-k)²/b² = 1 by least squares, at least 4 points.
FitResult fit_ellipse_approx(const std::vector<DataPoint>& points, const FitOptions& options = FitOptions());

#endif // CURVZAPPROX_HPP
