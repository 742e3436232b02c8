#include "curvZexact.hpp"
#include "curvZformat.hpp"
#include "curvZlinsolve.hpp"
#include <algorithm> // For std::max
#include <cmath>     // For std::sqrt, std::abs, std::pow
#include <set>
#include <utility>   // For std::pair

namespace {

const char* polynomial_name(int degree) {
    return degree == 1 ? "linear" : degree == 2 ? "quadratic" : "cubic";
}

// Shared front door of every exact solver: uniqueness first, then the count.
bool check_exact_points(const std::vector<DataPoint>& points, size_t required,
                        const std::string& curve_name, FitResult& failure) {
    if (!find_duplicate_points(points).empty()) {
        failure = make_error_result(FitError::DuplicatePoints,
            "Duplicate points detected. Each point must be unique for exact equations.");
        return false;
    }
    if (points.size() != required) {
        failure = make_error_result(FitError::WrongPointCount,
            "Need exactly " + std::to_string(required) + " points for " + curve_name + " equation");
        return false;
    }
    return true;
}

// Centroid and scale used to condition the conic/ellipse systems.
struct Normalisation {
    double cx = 0.0;
    double cy = 0.0;
    double scale = 1.0;
};

Normalisation normalisation_for(const std::vector<DataPoint>& points) {
    Normalisation norm;
    for (const auto& p : points) {
        norm.cx += p.x;
        norm.cy += p.y;
    }
    norm.cx /= static_cast<double>(points.size());
    norm.cy /= static_cast<double>(points.size());

    double max_abs = 0.0;
    for (const auto& p : points) {
        max_abs = std::max(max_abs, std::abs(p.x - norm.cx));
        max_abs = std::max(max_abs, std::abs(p.y - norm.cy));
    }
    norm.scale = max_abs > 0.0 ? max_abs : 1.0;
    return norm;
}

} // namespace

std::vector<DataPoint> find_duplicate_points(const std::vector<DataPoint>& points) {
    std::set<std::pair<double, double>> seen;
    std::vector<DataPoint> duplicates;
    for (const auto& p : points) {
        if (!seen.insert({p.x, p.y}).second) {
            duplicates.push_back(p);
        }
    }
    return duplicates;
}

FitResult fit_polynomial(const std::vector<DataPoint>& points, int degree, bool use_fractions) {
    if (degree < 1 || degree > 3) {
        return make_error_result(FitError::UnknownKind,
            "Polynomial degree " + std::to_string(degree) + " is not supported (1 to 3).");
    }
    const std::string name = polynomial_name(degree);
    const size_t required = static_cast<size_t>(degree) + 1;

    FitResult failure;
    if (!check_exact_points(points, required, name, failure)) return failure;

    // Row i: [x^degree, ..., x, 1]
    std::vector<std::vector<double>> A;
    std::vector<double> B;
    for (const auto& p : points) {
        std::vector<double> row;
        for (int power = degree; power >= 0; --power) {
            row.push_back(std::pow(p.x, power));
        }
        A.push_back(row);
        B.push_back(p.y);
    }

    LinearSolveResult solved = solve_linear_system(A, B);
    if (!solved.success) {
        return make_error_result(FitError::DegenerateGeometry,
            "Unable to solve " + name + " equation - points may be collinear or invalid");
    }

    static const char* const kPowerTerms[] = {"", "x", "x²", "x³"};

    FitResult result;
    std::vector<PolynomialTerm> terms;
    for (int i = 0; i <= degree; ++i) {
        const int power = degree - i;
        const std::string coeff_name(1, static_cast<char>('a' + i));
        result.coefficients[coeff_name] = solved.solution[static_cast<size_t>(i)];
        terms.push_back({solved.solution[static_cast<size_t>(i)], kPowerTerms[power]});
    }

    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve " + name + " equation - points may be collinear or invalid");
    }

    result.equation = build_polynomial_equation(terms, use_fractions);
    result.machine_equation = result.equation;
    result.success = true;
    return result;
}

FitResult fit_linear(const std::vector<DataPoint>& points, bool use_fractions) {
    return fit_polynomial(points, 1, use_fractions);
}

FitResult fit_quadratic(const std::vector<DataPoint>& points, bool use_fractions) {
    return fit_polynomial(points, 2, use_fractions);
}

FitResult fit_cubic(const std::vector<DataPoint>& points, bool use_fractions) {
    return fit_polynomial(points, 3, use_fractions);
}

FitResult fit_circle(const std::vector<DataPoint>& points, bool use_fractions) {
    FitResult failure;
    if (!check_exact_points(points, 3, "circle", failure)) return failure;

    // x² + y² + Dx + Ey + F = 0  ->  [x, y, 1] . [D, E, F] = -(x² + y²)
    std::vector<std::vector<double>> A;
    std::vector<double> B;
    for (const auto& p : points) {
        A.push_back({p.x, p.y, 1.0});
        B.push_back(-(p.x * p.x + p.y * p.y));
    }

    LinearSolveResult solved = solve_linear_system(A, B);
    if (!solved.success) {
        return make_error_result(FitError::DegenerateGeometry,
            "Unable to solve circle equation - points may be collinear");
    }

    const double D = solved.solution[0];
    const double E = solved.solution[1];
    const double F = solved.solution[2];
    const double h = -D / 2.0;
    const double k = -E / 2.0;
    const double r_squared = h * h + k * k - F;

    if (!(r_squared > 0.0)) {
        return make_error_result(FitError::DegenerateGeometry,
            "Points do not form a valid circle - points may be collinear");
    }

    FitResult result;
    result.coefficients = {{"h", h}, {"k", k}, {"r", std::sqrt(r_squared)}};
    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve circle equation - invalid coefficients");
    }

    result.equation = build_circle_equation(h, k, result.coefficients["r"], use_fractions);
    result.machine_equation = result.equation;
    result.success = true;
    return result;
}

FitResult fit_ellipse_exact(const std::vector<DataPoint>& points, bool use_fractions) {
    FitResult failure;
    if (!check_exact_points(points, 4, "ellipse", failure)) return failure;

    // Solved in centred, scaled coordinates u = (x - cx)/s, v = (y - cy)/s:
    //   A u² + B v² + C u + D v = 1
    // The centroid lies inside any ellipse through the points, so A, B > 0 for a real ellipse.
    const Normalisation norm = normalisation_for(points);
    std::vector<std::vector<double>> M;
    std::vector<double> rhs;
    for (const auto& p : points) {
        const double u = (p.x - norm.cx) / norm.scale;
        const double v = (p.y - norm.cy) / norm.scale;
        M.push_back({u * u, v * v, u, v});
        rhs.push_back(1.0);
    }

    LinearSolveResult solved = solve_linear_system(M, rhs);
    if (!solved.success) {
        return make_error_result(FitError::DegenerateGeometry,
            "Unable to solve ellipse equation - points may be collinear or degenerate");
    }

    const double A = solved.solution[0];
    const double B = solved.solution[1];
    const double C = solved.solution[2];
    const double D = solved.solution[3];

    if (!(A > 0.0) || !(B > 0.0)) {
        return make_error_result(FitError::DegenerateGeometry,
            "Points do not lie on an axis-aligned ellipse (non-positive squared-term coefficients)");
    }

    const double constant = 1.0 + C * C / (4.0 * A) + D * D / (4.0 * B);
    if (!(constant > 0.0)) {
        return make_error_result(FitError::DegenerateGeometry,
            "Points do not lie on an axis-aligned ellipse (non-positive constant term)");
    }

    const double h = norm.cx + norm.scale * (-C / (2.0 * A));
    const double k = norm.cy + norm.scale * (-D / (2.0 * B));
    const double a = norm.scale * std::sqrt(constant / A);
    const double b = norm.scale * std::sqrt(constant / B);

    FitResult result;
    result.coefficients = {{"h", h}, {"k", k}, {"a", a}, {"b", b}};
    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve ellipse equation - invalid coefficients");
    }

    result.equation = build_ellipse_equation(h, k, a, b, use_fractions);
    result.machine_equation = build_ellipse_latex(h, k, a, b, use_fractions);
    result.success = true;
    return result;
}

ConicClass classify_conic(double A, double B, double C, double tolerance) {
    const double discriminant = B * B - 4.0 * A * C;
    if (std::abs(discriminant) < tolerance) return ConicClass::Parabola;
    if (discriminant > 0.0) return ConicClass::Hyperbola;
    if (std::abs(A - C) < tolerance && std::abs(B) < tolerance) return ConicClass::Circle;
    return ConicClass::Ellipse;
}

const char* conic_class_name(ConicClass conic_class) {
    switch (conic_class) {
        case ConicClass::Parabola: return "Parabola";
        case ConicClass::Hyperbola: return "Hyperbola";
        case ConicClass::Circle: return "Circle";
        case ConicClass::Ellipse: return "Ellipse";
    }
    return "Conic";
}

FitResult fit_conic(const std::vector<DataPoint>& points, bool use_fractions) {
    FitResult failure;
    if (!check_exact_points(points, 5, "conic", failure)) return failure;

    // A u² + B uv + C v² + D u + E v = 1 in centred, scaled coordinates (F = -1).
    const Normalisation norm = normalisation_for(points);
    std::vector<std::vector<double>> M;
    std::vector<double> rhs;
    for (const auto& p : points) {
        const double u = (p.x - norm.cx) / norm.scale;
        const double v = (p.y - norm.cy) / norm.scale;
        M.push_back({u * u, u * v, v * v, u, v});
        rhs.push_back(1.0);
    }

    LinearSolveResult solved = solve_linear_system(M, rhs);
    if (!solved.success) {
        return make_error_result(FitError::DegenerateGeometry,
            "Unable to solve conic equation - points may be invalid");
    }

    const double a = solved.solution[0];
    const double b = solved.solution[1];
    const double c = solved.solution[2];
    const double d = solved.solution[3];
    const double e = solved.solution[4];
    const double s = norm.scale;
    const double cx = norm.cx;
    const double cy = norm.cy;

    // Multiply through by s² and expand u = (x - cx)/s, v = (y - cy)/s.
    double coef[6] = {
        a,
        b,
        c,
        -2.0 * a * cx - b * cy + d * s,
        -2.0 * c * cy - b * cx + e * s,
        a * cx * cx + b * cx * cy + c * cy * cy - d * s * cx - e * s * cy - s * s,
    };

    double largest = 0.0;
    for (double v : coef) largest = std::max(largest, std::abs(v));
    if (!(largest > 0.0) || !std::isfinite(largest)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve conic equation - invalid coefficients");
    }
    for (double& v : coef) v /= largest;

    // Leading non-vanishing coefficient positive
    for (double v : coef) {
        if (std::abs(v) > kDisplayZero) {
            if (v < 0.0) {
                for (double& w : coef) w = -w;
            }
            break;
        }
    }

    FitResult result;
    result.coefficients = {
        {"A", coef[0]}, {"B", coef[1]}, {"C", coef[2]},
        {"D", coef[3]}, {"E", coef[4]}, {"F", coef[5]},
    };
    if (!coefficients_are_finite(result.coefficients)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve conic equation - invalid coefficients");
    }

    // Classify on the quadratic part alone; F grows with the offset from the origin.
    const double quad_scale = std::max({std::abs(coef[0]), std::abs(coef[1]), std::abs(coef[2])});
    if (!(quad_scale > 0.0)) {
        return make_error_result(FitError::InvalidCoefficients,
            "Unable to solve conic equation - invalid coefficients");
    }
    const ConicClass conic_class = classify_conic(coef[0] / quad_scale, coef[1] / quad_scale, coef[2] / quad_scale);
    const std::string body = build_conic_equation(coef[0], coef[1], coef[2], coef[3], coef[4], coef[5], use_fractions);
    result.equation = std::string(conic_class_name(conic_class)) + ": " + body;
    result.machine_equation = body;
    result.success = true;
    return result;
}
