#ifndef CURVZTYPES_HPP
#define CURVZTYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

struct DataPoint {
    double x = 0.0;
    double y = 0.0;
};

// Exact kinds come first; the dispatch table in curvZsolver.cpp is indexed by this order.
enum class EquationKind {
    Linear = 0,
    Quadratic,
    Cubic,
    Circle,
    Ellipse,       // axis-aligned, 4 parameters, exactly 4 points
    Conic,         // general 5-parameter conic, exactly 5 points
    Sine,
    Logarithm,
    Exponential,
    EllipseApprox, // axis-aligned, least squares over >= 4 points
};

constexpr int kEquationKindCount = 10;

enum class FitError {
    None,
    DuplicatePoints,
    WrongPointCount,
    DegenerateGeometry,
    NonPositiveDomain,
    InvalidCoefficients,
    NoValidFit,
    UnknownKind,
};

struct FitResult {
    bool success = false;
    std::map<std::string, double> coefficients;
    std::string equation;
    std::optional<std::string> machine_equation; // graphing-calculator input
    std::optional<double> r_squared;             // [0, 1]
    std::optional<std::string> error;
    FitError error_kind = FitError::None;
};

// Builds a failed result: no coefficients, empty equation.
FitResult make_error_result(FitError kind, const std::string& message);

const char* equation_kind_name(EquationKind kind);
const char* fit_error_name(FitError kind);

// Accepts the names printed by equation_kind_name plus a few aliases ("exp", "logarithm").
bool parse_equation_kind(const std::string& name, EquationKind& kind);

bool is_exact_kind(EquationKind kind);

// Exact kinds: the exact number of points required. Approximation kinds: the minimum.
std::size_t required_point_count(EquationKind kind);

// True when every coefficient is finite (no NaN, no infinity).
bool coefficients_are_finite(const std::map<std::string, double>& coefficients);

#endif // CURVZTYPES_HPP
