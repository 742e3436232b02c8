#include "curvZformat.hpp"
#include <algorithm> // For std::min
#include <cmath>     // For std::abs, std::round, std::pow
#include <cstdio>    // For std::snprintf
#include <numeric>   // For std::gcd
#include <vector>

namespace {

std::string fixed_string(double value, int decimals) {
    const int length = std::snprintf(nullptr, 0, "%.*f", decimals, value);
    if (length <= 0) return std::string();
    std::vector<char> buffer(static_cast<size_t>(length) + 1);
    std::snprintf(buffer.data(), buffer.size(), "%.*f", decimals, value);
    return std::string(buffer.data(), static_cast<size_t>(length));
}

std::string integer_string(double value) {
    const double rounded = std::round(value);
    if (rounded == 0.0) return "0"; // avoid "-0"
    if (std::abs(rounded) < 1e15) {
        return std::to_string(static_cast<long long>(rounded));
    }
    return fixed_string(rounded, 0);
}

// A fraction is bracketed so that "/(1/10)²" cannot be read as "/1/(10²)".
std::string semi_axis_string(double value, bool use_fractions) {
    const std::string text = format_coefficient(value, false, use_fractions, 6);
    if (text.find('/') != std::string::npos) return "(" + text + ")";
    return text;
}

bool near_unit(double value, double target) {
    return std::abs(value - target) < kDisplayZero;
}

} // namespace

std::string to_fraction(double decimal, double tolerance) {
    if (!std::isfinite(decimal)) return format_number(decimal);

    if (std::abs(decimal - std::round(decimal)) < tolerance) {
        return integer_string(decimal);
    }

    const std::string sign = decimal < 0 ? "-" : "";
    const double abs_decimal = std::abs(decimal);

    for (long long denominator = 2; denominator <= 100; ++denominator) {
        const long long numerator = static_cast<long long>(std::round(abs_decimal * denominator));
        if (std::abs(abs_decimal - static_cast<double>(numerator) / denominator) < tolerance) {
            const long long divisor = std::gcd(numerator, denominator);
            const long long simple_num = numerator / divisor;
            const long long simple_den = denominator / divisor;
            if (simple_den == 1) {
                return sign + std::to_string(simple_num);
            }
            return sign + std::to_string(simple_num) + "/" + std::to_string(simple_den);
        }
    }

    return format_number(decimal);
}

std::string format_number(double num, int precision) {
    if (std::isnan(num)) return "NaN";
    if (std::isinf(num)) return num > 0 ? "Infinity" : "-Infinity";

    if (std::abs(num - std::round(num)) < std::pow(10.0, -precision)) {
        return integer_string(num);
    }

    std::string short_form = fixed_string(num, precision + 2);
    const size_t dot = short_form.find('.');
    if (dot != std::string::npos) {
        while (!short_form.empty() && short_form.back() == '0') short_form.pop_back();
        if (!short_form.empty() && short_form.back() == '.') short_form.pop_back();
        const size_t short_dot = short_form.find('.');
        if (short_dot != std::string::npos &&
            static_cast<int>(short_form.size() - short_dot - 1) <= std::min(3, precision)) {
            return short_form;
        }
    }

    return fixed_string(num, precision);
}

std::string format_coefficient(double num, bool show_sign, bool use_fractions, int precision) {
    if (std::abs(num) < kDisplayZero) {
        return show_sign ? "" : "0";
    }

    if (show_sign) {
        const double magnitude = std::abs(num);
        const std::string body = use_fractions ? to_fraction(magnitude) : format_number(magnitude, precision);
        return (num > 0 ? " + " : " - ") + body;
    }

    return use_fractions ? to_fraction(num) : format_number(num, precision);
}

std::string build_polynomial_equation(const std::vector<PolynomialTerm>& terms, bool use_fractions) {
    std::string body;

    for (const auto& t : terms) {
        if (std::abs(t.coef) < kDisplayZero) continue;
        const bool is_first = body.empty();

        if (!t.term.empty() && near_unit(std::abs(t.coef), 1.0)) {
            if (is_first) {
                body += (t.coef > 0 ? "" : "-") + t.term;
            } else {
                body += (t.coef > 0 ? " + " : " - ") + t.term;
            }
            continue;
        }
        body += format_coefficient(t.coef, !is_first, use_fractions) + t.term;
    }

    return "y = " + (body.empty() ? std::string("0") : body);
}

std::string build_circle_equation(double h, double k, double r, bool use_fractions) {
    std::string equation = "(x";
    if (std::abs(h) > kDisplayZero) equation += format_coefficient(-h, true, use_fractions, 6);
    equation += ")² + (y";
    if (std::abs(k) > kDisplayZero) equation += format_coefficient(-k, true, use_fractions, 6);
    equation += ")² = ";
    equation += format_coefficient(r, false, use_fractions, 6) + "²";
    return equation;
}

std::string build_ellipse_equation(double h, double k, double a, double b, bool use_fractions) {
    std::string equation = "(x";
    if (std::abs(h) > kDisplayZero) equation += format_coefficient(-h, true, use_fractions, 6);
    equation += ")²/" + semi_axis_string(a, use_fractions) + "²";
    equation += " + (y";
    if (std::abs(k) > kDisplayZero) equation += format_coefficient(-k, true, use_fractions, 6);
    equation += ")²/" + semi_axis_string(b, use_fractions) + "²";
    equation += " = 1";
    return equation;
}

std::string build_ellipse_latex(double h, double k, double a, double b, bool use_fractions) {
    std::string latex = "\\frac{\\left(x";
    if (std::abs(h) > kDisplayZero) latex += format_coefficient(-h, true, use_fractions, 6);
    latex += "\\right)^{2}}{" + format_coefficient(a, false, use_fractions, 6) + "^{2}}";
    latex += " + \\frac{\\left(y";
    if (std::abs(k) > kDisplayZero) latex += format_coefficient(-k, true, use_fractions, 6);
    latex += "\\right)^{2}}{" + format_coefficient(b, false, use_fractions, 6) + "^{2}}";
    latex += " = 1";
    return latex;
}

std::string build_conic_equation(double A, double B, double C, double D, double E, double F, bool use_fractions) {
    const PolynomialTerm terms[] = {
        {A, "x²"}, {B, "xy"}, {C, "y²"}, {D, "x"}, {E, "y"}, {F, ""},
    };

    std::string body;
    for (const auto& t : terms) {
        if (std::abs(t.coef) <= kDisplayZero) continue;
        const bool is_first = body.empty();
        if (!t.term.empty() && near_unit(std::abs(t.coef), 1.0)) {
            if (is_first) {
                body += (t.coef > 0 ? "" : "-") + t.term;
            } else {
                body += (t.coef > 0 ? " + " : " - ") + t.term;
            }
            continue;
        }
        body += format_coefficient(t.coef, !is_first, use_fractions, 7) + t.term;
    }

    return (body.empty() ? std::string("0") : body) + " = 0";
}

std::string build_transcendental_equation(const std::string& function_name,
                                          double a, double b, double c, double d,
                                          bool use_fractions) {
    std::string equation = "y = ";

    if (near_unit(a, 1.0)) {
        equation += function_name + "(";
    } else if (near_unit(a, -1.0)) {
        equation += "-" + function_name + "(";
    } else {
        equation += format_coefficient(a, false, use_fractions) + " * " + function_name + "(";
    }

    if (near_unit(b, 1.0)) {
        equation += "x";
    } else if (near_unit(b, -1.0)) {
        equation += "-x";
    } else {
        equation += format_coefficient(b, false, use_fractions) + "x";
    }

    if (std::abs(c) > kDisplayZero) {
        equation += format_coefficient(c, true, use_fractions);
    }
    equation += ")";

    if (std::abs(d) > kDisplayZero) {
        equation += format_coefficient(d, true, use_fractions);
    }
    return equation;
}
