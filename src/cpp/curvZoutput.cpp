#include "curvZoutput.hpp"
#include <fstream>
#include <iostream>
#include <cmath>
#include <iomanip>
#include <algorithm>
#include <limits>
#include <cstdio> // For popen, pclose

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

bool lookup(const std::map<std::string, double>& coefficients, const char* name, double& value) {
    auto it = coefficients.find(name);
    if (it == coefficients.end()) return false;
    value = it->second;
    return true;
}

// y(x) for the explicit families; NaN where undefined.
bool explicit_model(EquationKind kind, const std::map<std::string, double>& c, double x, double& y) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    double a = 0.0, b = 0.0, cc = 0.0, d = 0.0;
    switch (kind) {
        case EquationKind::Linear:
            if (!lookup(c, "a", a) || !lookup(c, "b", b)) return false;
            y = a * x + b;
            return true;
        case EquationKind::Quadratic:
            if (!lookup(c, "a", a) || !lookup(c, "b", b) || !lookup(c, "c", cc)) return false;
            y = (a * x + b) * x + cc;
            return true;
        case EquationKind::Cubic:
            if (!lookup(c, "a", a) || !lookup(c, "b", b) || !lookup(c, "c", cc) || !lookup(c, "d", d)) return false;
            y = ((a * x + b) * x + cc) * x + d;
            return true;
        case EquationKind::Sine:
        case EquationKind::Logarithm:
        case EquationKind::Exponential:
            if (!lookup(c, "a", a) || !lookup(c, "b", b) || !lookup(c, "c", cc) || !lookup(c, "d", d)) return false;
            if (kind == EquationKind::Sine) {
                y = a * std::sin(b * x + cc) + d;
            } else if (kind == EquationKind::Logarithm) {
                const double argument = b * x + cc;
                y = argument > 0.0 ? a * std::log(argument) + d : nan;
            } else {
                y = a * std::exp(b * x + cc) + d;
            }
            return true;
        default:
            return false;
    }
}

void x_window(const std::vector<DataPoint>& points, double padding, double& x_lo, double& x_hi) {
    double x_min = points.empty() ? 0.0 : points[0].x;
    double x_max = x_min;
    for (const auto& p : points) {
        x_min = std::min(x_min, p.x);
        x_max = std::max(x_max, p.x);
    }
    double span = x_max - x_min;
    if (!(span > 0.0)) span = 1.0;
    x_lo = x_min - padding * span;
    x_hi = x_max + padding * span;
}

// Appends (x, y) to the open segment, or closes it when y is not finite.
void append_sample(CurveSegments& segments, std::vector<DataPoint>& current, double x, double y) {
    if (std::isfinite(y)) {
        current.push_back({x, y});
    } else if (!current.empty()) {
        segments.push_back(current);
        current.clear();
    }
}

void finish_segment(CurveSegments& segments, std::vector<DataPoint>& current) {
    if (!current.empty()) {
        segments.push_back(current);
        current.clear();
    }
}

CurveSegments sample_parametric(double h, double k, double a, double b, int n) {
    std::vector<DataPoint> loop;
    for (int i = 0; i <= n; ++i) {
        const double t = 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(n);
        loop.push_back({h + a * std::cos(t), k + b * std::sin(t)});
    }
    return {loop};
}

CurveSegments sample_conic(const std::map<std::string, double>& c, const std::vector<DataPoint>& points, int n) {
    double A, B, C, D, E, F;
    if (!lookup(c, "A", A) || !lookup(c, "B", B) || !lookup(c, "C", C) ||
        !lookup(c, "D", D) || !lookup(c, "E", E) || !lookup(c, "F", F)) {
        return {};
    }

    double x_lo, x_hi;
    x_window(points, 0.5, x_lo, x_hi);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    CurveSegments segments;
    std::vector<DataPoint> upper, lower;
    double previous_qb = 0.0;
    for (int i = 0; i < n; ++i) {
        const double x = x_lo + (x_hi - x_lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        // C y² + (B x + E) y + (A x² + D x + F) = 0
        const double qa = C;
        const double qb = B * x + E;
        const double qc = (A * x + D) * x + F;
        double y1 = nan, y2 = nan;
        if (std::abs(qa) < 1e-12) {
            // Pole where B x + E changes sign
            if (previous_qb * qb < 0.0) finish_segment(segments, upper);
            if (std::abs(qb) > 1e-12) y1 = -qc / qb;
            previous_qb = qb;
        } else {
            const double discriminant = qb * qb - 4.0 * qa * qc;
            if (discriminant >= 0.0) {
                const double root = std::sqrt(discriminant);
                y1 = (-qb + root) / (2.0 * qa);
                y2 = (-qb - root) / (2.0 * qa);
            }
        }
        append_sample(segments, upper, x, y1);
        append_sample(segments, lower, x, y2);
    }
    finish_segment(segments, upper);
    finish_segment(segments, lower);
    return segments;
}

} // namespace

bool write_fit_report(
    const std::string& output_path,
    EquationKind kind,
    const std::vector<DataPoint>& points,
    const FitResult& result) {
    std::ofstream outfile(output_path);
    if (!outfile) {
        std::cerr << "Error: Cannot open file for writing: " << output_path << std::endl;
        return false;
    }

    outfile << "# curvZfit report" << std::endl;
    outfile << "# Type: " << equation_kind_name(kind) << std::endl;
    outfile << "# Points: " << points.size() << std::endl;
    outfile << std::setprecision(10);
    for (size_t i = 0; i < points.size(); ++i) {
        outfile << "#   " << i << ", " << points[i].x << ", " << points[i].y << std::endl;
    }

    if (!result.success) {
        outfile << "Status: failed (" << fit_error_name(result.error_kind) << ")" << std::endl;
        outfile << "Error: " << result.error.value_or("Unknown error") << std::endl;
        return true;
    }

    outfile << "Status: success" << std::endl;
    outfile << "Equation: " << result.equation << std::endl;
    if (result.machine_equation) {
        outfile << "Machine equation: " << *result.machine_equation << std::endl;
    }
    if (result.r_squared) {
        outfile << "R^2: " << std::fixed << std::setprecision(6) << *result.r_squared << std::endl;
        outfile << std::defaultfloat << std::setprecision(10);
    }
    outfile << "Coefficients:" << std::endl;
    for (const auto& entry : result.coefficients) {
        outfile << "  " << entry.first << " = " << entry.second << std::endl;
    }
    return true;
}

CurveSegments sample_fit_curve(
    EquationKind kind,
    const std::map<std::string, double>& coefficients,
    const std::vector<DataPoint>& points,
    int n) {
    if (n < 2) n = 2;

    if (kind == EquationKind::Circle) {
        double h, k, r;
        if (!lookup(coefficients, "h", h) || !lookup(coefficients, "k", k) || !lookup(coefficients, "r", r)) return {};
        return sample_parametric(h, k, r, r, n);
    }
    if (kind == EquationKind::Ellipse || kind == EquationKind::EllipseApprox) {
        double h, k, a, b;
        if (!lookup(coefficients, "h", h) || !lookup(coefficients, "k", k) ||
            !lookup(coefficients, "a", a) || !lookup(coefficients, "b", b)) {
            return {};
        }
        return sample_parametric(h, k, a, b, n);
    }
    if (kind == EquationKind::Conic) {
        return sample_conic(coefficients, points, n);
    }

    double x_lo, x_hi;
    x_window(points, 0.1, x_lo, x_hi);

    CurveSegments segments;
    std::vector<DataPoint> current;
    for (int i = 0; i < n; ++i) {
        const double x = x_lo + (x_hi - x_lo) * static_cast<double>(i) / static_cast<double>(n - 1);
        double y = 0.0;
        if (!explicit_model(kind, coefficients, x, y)) return {};
        append_sample(segments, current, x, y);
    }
    finish_segment(segments, current);
    return segments;
}

bool write_curve_samples(const std::string& output_path, const CurveSegments& segments) {
    std::ofstream outfile(output_path);
    if (!outfile) {
        std::cerr << "Error: Cannot open file for writing: " << output_path << std::endl;
        return false;
    }

    outfile << "# x y" << std::endl;
    outfile << std::setprecision(10);
    for (const auto& segment : segments) {
        for (const auto& p : segment) {
            outfile << p.x << " " << p.y << std::endl;
        }
        outfile << std::endl; // Blank line between segments
    }
    return true;
}

void plot_fit_with_gnuplot(
    const std::string& output_path,
    const std::string& title,
    const std::vector<DataPoint>& points,
    const CurveSegments& segments) {

    FILE *gpipe = popen("gnuplot -persist", "w");
    if (!gpipe) {
        std::cerr << "Error: Could not open gnuplot pipe for fit plot." << std::endl;
        return;
    }

    fprintf(gpipe, "set terminal pngcairo enhanced font 'sans,10' size 1024, 768\n");
    fprintf(gpipe, "set output '%s'\n", output_path.c_str());
    fprintf(gpipe, "set title \"%s\" noenhanced\n", title.c_str());
    fprintf(gpipe, "set xlabel \"x\"\n");
    fprintf(gpipe, "set ylabel \"y\"\n");
    fprintf(gpipe, "set grid\n");
    fprintf(gpipe, "plot '-' using 1:2 with points pt 7 ps 1.2 title 'points', "
                   "'-' using 1:2 with lines lw 2 title 'fit'\n"); // Read data from stdin

    for (const auto& p : points) {
        fprintf(gpipe, "%.10g %.10g\n", p.x, p.y);
    }
    fprintf(gpipe, "e\n");

    for (const auto& segment : segments) {
        for (const auto& p : segment) {
            fprintf(gpipe, "%.10g %.10g\n", p.x, p.y);
        }
        fprintf(gpipe, "\n"); // Blank line breaks the line between segments
    }
    fprintf(gpipe, "e\n");

    fflush(gpipe);
    pclose(gpipe);
}
