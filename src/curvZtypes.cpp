#include "curvZtypes.hpp"
#include <cmath> // For std::isfinite

FitResult make_error_result(FitError kind, const std::string& message) {
    FitResult result;
    result.success = false;
    result.error_kind = kind;
    result.error = message;
    return result;
}

const char* equation_kind_name(EquationKind kind) {
    switch (kind) {
        case EquationKind::Linear: return "linear";
        case EquationKind::Quadratic: return "quadratic";
        case EquationKind::Cubic: return "cubic";
        case EquationKind::Circle: return "circle";
        case EquationKind::Ellipse: return "ellipse";
        case EquationKind::Conic: return "conic";
        case EquationKind::Sine: return "sine";
        case EquationKind::Logarithm: return "log";
        case EquationKind::Exponential: return "exponential";
        case EquationKind::EllipseApprox: return "ellipse-approx";
    }
    return "unknown";
}

const char* fit_error_name(FitError kind) {
    switch (kind) {
        case FitError::None: return "None";
        case FitError::DuplicatePoints: return "DuplicatePoints";
        case FitError::WrongPointCount: return "WrongPointCount";
        case FitError::DegenerateGeometry: return "DegenerateGeometry";
        case FitError::NonPositiveDomain: return "NonPositiveDomain";
        case FitError::InvalidCoefficients: return "InvalidCoefficients";
        case FitError::NoValidFit: return "NoValidFit";
        case FitError::UnknownKind: return "UnknownKind";
    }
    return "UnknownKind";
}

bool parse_equation_kind(const std::string& name, EquationKind& kind) {
    for (int i = 0; i < kEquationKindCount; ++i) {
        EquationKind candidate = static_cast<EquationKind>(i);
        if (name == equation_kind_name(candidate)) {
            kind = candidate;
            return true;
        }
    }
    if (name == "logarithm" || name == "ln") {
        kind = EquationKind::Logarithm;
        return true;
    }
    if (name == "exp") {
        kind = EquationKind::Exponential;
        return true;
    }
    return false;
}

bool is_exact_kind(EquationKind kind) {
    switch (kind) {
        case EquationKind::Linear:
        case EquationKind::Quadratic:
        case EquationKind::Cubic:
        case EquationKind::Circle:
        case EquationKind::Ellipse:
        case EquationKind::Conic:
            return true;
        default:
            return false;
    }
}

std::size_t required_point_count(EquationKind kind) {
    switch (kind) {
        case EquationKind::Linear: return 2;
        case EquationKind::Quadratic: return 3;
        case EquationKind::Cubic: return 4;
        case EquationKind::Circle: return 3;
        case EquationKind::Ellipse: return 4;
        case EquationKind::Conic: return 5;
        case EquationKind::Sine: return 3;
        case EquationKind::Logarithm: return 3;
        case EquationKind::Exponential: return 3;
        case EquationKind::EllipseApprox: return 4;
    }
    return 0;
}

bool coefficients_are_finite(const std::map<std::string, double>& coefficients) {
    for (const auto& entry : coefficients) {
        if (!std::isfinite(entry.second)) return false;
    }
    return true;
}
