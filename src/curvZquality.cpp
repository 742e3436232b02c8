#include "curvZquality.hpp"
#include <algorithm> // For std::min, std::max
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

double r_squared(const std::vector<DataPoint>& points, const std::function<double(double)>& predict) {
    if (points.empty()) return 0.0;

    double y_mean = 0.0;
    for (const auto& p : points) y_mean += p.y;
    y_mean /= static_cast<double>(points.size());

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (const auto& p : points) {
        const double predicted = predict(p.x);
        if (!std::isfinite(predicted)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        ss_res += (p.y - predicted) * (p.y - predicted);
        ss_tot += (p.y - y_mean) * (p.y - y_mean);
    }

    if (ss_tot == 0.0) {
        const double scale = 1.0 + static_cast<double>(points.size()) * y_mean * y_mean;
        return ss_res <= 1e-12 * scale ? 1.0 : 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

double distance_to_ellipse(double px, double py, double h, double k, double a, double b) {
    const double x = px - h;
    const double y = py - k;

    if (std::abs(x) < 1e-10 && std::abs(y) < 1e-10) {
        return std::min(a, b);
    }

    auto distance_at = [&](double t) {
        const double ex = a * std::cos(t);
        const double ey = b * std::sin(t);
        return std::sqrt((x - ex) * (x - ex) + (y - ey) * (y - ey));
    };

    const int num_samples = 100;
    int best_index = 0;
    double best_distance = std::numeric_limits<double>::infinity();
    for (int i = 0; i < num_samples; ++i) {
        const double d = distance_at(2.0 * M_PI * i / num_samples);
        if (d < best_distance) {
            best_distance = d;
            best_index = i;
        }
    }

    // Newton on f(t) = |P - E(t)|²
    double t = 2.0 * M_PI * best_index / num_samples;
    for (int iter = 0; iter < 5; ++iter) {
        const double cos_t = std::cos(t);
        const double sin_t = std::sin(t);
        const double ex = a * cos_t;
        const double ey = b * sin_t;
        const double dex = -a * sin_t;
        const double dey = b * cos_t;
        const double f_prime = 2.0 * (ex - x) * dex + 2.0 * (ey - y) * dey;
        const double f_double_prime = 2.0 * (dex * dex + (ex - x) * (-a * cos_t))
                                    + 2.0 * (dey * dey + (ey - y) * (-b * sin_t));
        if (std::abs(f_double_prime) > 1e-10) {
            t -= f_prime / f_double_prime;
        }
    }

    const double refined = distance_at(t);
    return (std::isfinite(refined) && refined < best_distance) ? refined : best_distance;
}

double ellipse_r_squared(const std::vector<DataPoint>& points, double h, double k, double a, double b) {
    const size_t n = points.size();
    if (n == 0) return 0.0;

    double x_mean = 0.0, y_mean = 0.0;
    for (const auto& p : points) {
        x_mean += p.x;
        y_mean += p.y;
    }
    x_mean /= static_cast<double>(n);
    y_mean /= static_cast<double>(n);

    double tss = 0.0;
    double rss = 0.0;
    for (const auto& p : points) {
        tss += (p.x - x_mean) * (p.x - x_mean) + (p.y - y_mean) * (p.y - y_mean);
        const double d = distance_to_ellipse(p.x, p.y, h, k, a, b);
        rss += d * d;
    }

    if (!std::isfinite(rss) || !std::isfinite(tss)) return 0.0;
    if (tss == 0.0) return rss == 0.0 ? 1.0 : 0.0;

    return std::max(0.0, std::min(1.0, 1.0 - rss / tss));
}
