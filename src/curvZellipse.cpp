#include "curvZellipse.hpp"
#include "curvZlinsolve.hpp"
#include <algorithm> // For std::min, std::max
#include <cmath>
#include <limits>

namespace {

const int kMaxIterations = 300;
const double kInitialLambda = 0.001;
const double kMinLambda = 1e-15;
const double kLambdaCeiling = 1e2;
const double kMinSemiAxis = 0.01;

double mean_squared_residual(const std::vector<DataPoint>& points, const EllipseParameters& e) {
    double sum = 0.0;
    for (const auto& p : points) {
        const double dx = p.x - e.h;
        const double dy = p.y - e.k;
        const double r = (dx * dx) / (e.a * e.a) + (dy * dy) / (e.b * e.b) - 1.0;
        sum += r * r;
    }
    return sum / static_cast<double>(points.size());
}

void refine_ellipse(const std::vector<DataPoint>& points, EllipseParameters& e) {
    const size_t n = points.size();
    double lambda = kInitialLambda;
    double prev_error = std::numeric_limits<double>::infinity();

    for (int iter = 0; iter < kMaxIterations; ++iter) {
        std::vector<std::vector<double>> JtJ(4, std::vector<double>(4, 0.0));
        std::vector<double> JtR(4, 0.0);
        double current_error = 0.0;

        for (const auto& p : points) {
            const double dx = p.x - e.h;
            const double dy = p.y - e.k;
            const double a2 = e.a * e.a;
            const double b2 = e.b * e.b;
            const double r = (dx * dx) / a2 + (dy * dy) / b2 - 1.0;
            current_error += r * r;

            // d r / d[h, k, a, b]
            const double J[4] = {
                (-2.0 * dx) / a2,
                (-2.0 * dy) / b2,
                (-2.0 * dx * dx) / (a2 * e.a),
                (-2.0 * dy * dy) / (b2 * e.b),
            };
            for (int j = 0; j < 4; ++j) {
                JtR[j] += J[j] * r;
                for (int k = 0; k < 4; ++k) {
                    JtJ[j][k] += J[j] * J[k];
                }
            }
        }
        current_error /= static_cast<double>(n);

        if (current_error < 1e-14 || std::abs(prev_error - current_error) < 1e-12) {
            break;
        }

        for (int i = 0; i < 4; ++i) {
            JtJ[i][i] += lambda;
            JtR[i] = -JtR[i];
        }

        LinearSolveResult step = solve_linear_system(JtJ, JtR);
        if (!step.success) {
            lambda = std::min(lambda * 5.0, 1e3);
            if (lambda > kLambdaCeiling) break;
            continue;
        }

        EllipseParameters candidate;
        candidate.h = e.h + step.solution[0];
        candidate.k = e.k + step.solution[1];
        candidate.a = std::max(kMinSemiAxis, e.a + step.solution[2]);
        candidate.b = std::max(kMinSemiAxis, e.b + step.solution[3]);

        const double new_error = mean_squared_residual(points, candidate);
        if (new_error < current_error) {
            e = candidate;
            lambda = std::max(lambda * 0.3, kMinLambda);
            prev_error = current_error;
        } else {
            lambda = std::min(lambda * 3.0, 1e3);
            if (lambda > kLambdaCeiling) break;
        }
    }
}

bool is_usable(const EllipseParameters& e) {
    return std::isfinite(e.h) && std::isfinite(e.k) && std::isfinite(e.a) && std::isfinite(e.b)
        && e.a > 0.0 && e.b > 0.0;
}

} // namespace

std::vector<EllipseParameters> ellipse_initializations(const std::vector<DataPoint>& points) {
    const double n = static_cast<double>(points.size());
    double x_mean = 0.0, y_mean = 0.0;
    double x_min = points[0].x, x_max = points[0].x;
    double y_min = points[0].y, y_max = points[0].y;
    for (const auto& p : points) {
        x_mean += p.x;
        y_mean += p.y;
        x_min = std::min(x_min, p.x);
        x_max = std::max(x_max, p.x);
        y_min = std::min(y_min, p.y);
        y_max = std::max(y_max, p.y);
    }
    x_mean /= n;
    y_mean /= n;

    double var_x = 0.0, var_y = 0.0;
    for (const auto& p : points) {
        var_x += (p.x - x_mean) * (p.x - x_mean);
        var_y += (p.y - y_mean) * (p.y - y_mean);
    }
    const double std_x = std::sqrt(var_x / n);
    const double std_y = std::sqrt(var_y / n);

    std::vector<EllipseParameters> inits;
    inits.push_back({x_mean, y_mean, std::max(std_x * 1.5, 0.1), std::max(std_y * 1.5, 0.1)});
    inits.push_back({(x_min + x_max) / 2.0, (y_min + y_max) / 2.0,
                     std::max((x_max - x_min) / 2.0, 0.1), std::max((y_max - y_min) / 2.0, 0.1)});

    // Points 1 and 3 taken as x-extremes, 2 and 4 as y-extremes
    const DataPoint& p1 = points[0];
    const DataPoint& p2 = points[1];
    const DataPoint& p3 = points[2];
    const DataPoint& p4 = points[3];
    inits.push_back({(p1.x + p3.x) / 2.0, (p2.y + p4.y) / 2.0,
                     std::max(std::abs(p3.x - p1.x) / 2.0, 0.1), std::max(std::abs(p4.y - p2.y) / 2.0, 0.1)});

    inits.push_back({x_mean, y_mean, std::max(std_x * 2.5, 0.5), std::max(std_y * 2.5, 0.5)});
    return inits;
}

double ellipse_rms_residual(const std::vector<DataPoint>& points, const EllipseParameters& params) {
    if (points.empty()) return 0.0;
    return std::sqrt(mean_squared_residual(points, params));
}

EllipseFitResult fit_axis_aligned_ellipse(const std::vector<DataPoint>& points, const Deadline* deadline) {
    EllipseFitResult result;
    if (points.size() < 4) {
        result.message = "Need at least 4 points for ellipse approximation";
        return result;
    }

    double best_error = std::numeric_limits<double>::infinity();
    for (EllipseParameters init : ellipse_initializations(points)) {
        if (result.initializations_tried > 0 && deadline && deadline->expired()) break;
        ++result.initializations_tried;

        refine_ellipse(points, init);
        const double rms = ellipse_rms_residual(points, init);
        if (rms < best_error && is_usable(init)) {
            best_error = rms;
            result.params = init;
            result.success = true;
        }
    }

    if (!result.success) {
        result.message = "No valid ellipse solution found";
        return result;
    }
    result.rms_error = best_error;
    result.message = "Best of " + std::to_string(result.initializations_tried) + " initialisations, RMS residual " +
                     std::to_string(best_error);
    return result;
}
