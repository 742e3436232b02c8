#include "curvZguess.hpp"
#include <algorithm> // For std::sort, std::min, std::max
#include <cmath>
#include <limits>
#include <fftw3.h>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

std::vector<DataPoint> sorted_by_x(const std::vector<DataPoint>& points) {
    std::vector<DataPoint> sorted = points;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const DataPoint& l, const DataPoint& r) { return l.x < r.x; });
    return sorted;
}

// Least squares slope/intercept of v against u.
bool simple_regression(const std::vector<double>& u, const std::vector<double>& v,
                       double& slope, double& intercept) {
    const double n = static_cast<double>(u.size());
    double su = 0.0, sv = 0.0, suv = 0.0, suu = 0.0;
    for (size_t i = 0; i < u.size(); ++i) {
        su += u[i];
        sv += v[i];
        suv += u[i] * v[i];
        suu += u[i] * u[i];
    }
    const double denominator = n * suu - su * su;
    if (!(std::abs(denominator) >= 1e-10)) {
        return false;
    }
    slope = (n * suv - su * sv) / denominator;
    intercept = (sv - slope * su) / n;
    return std::isfinite(slope) && std::isfinite(intercept);
}

} // namespace

DataSummary summarize_points(const std::vector<DataPoint>& points) {
    DataSummary s;
    if (points.empty()) return s;

    s.x_min = s.x_max = points[0].x;
    s.y_min = s.y_max = points[0].y;
    double y_sum = 0.0;
    for (const auto& p : points) {
        s.x_min = std::min(s.x_min, p.x);
        s.x_max = std::max(s.x_max, p.x);
        s.y_min = std::min(s.y_min, p.y);
        s.y_max = std::max(s.y_max, p.y);
        y_sum += p.y;
    }
    s.y_mean = y_sum / static_cast<double>(points.size());
    s.y_range = s.y_max - s.y_min;
    const double x_range = s.x_max - s.x_min;
    s.x_range = (x_range > 0.0 && std::isfinite(x_range)) ? x_range : 1.0;
    return s;
}

double estimate_sine_frequency(const std::vector<DataPoint>& points, const DataSummary& summary) {
    double frequency = (2.0 * M_PI) / (summary.x_range * 0.5);

    // 平均を引いた y の符号反転回数から周期を見積もる
    const std::vector<DataPoint> sorted = sorted_by_x(points);
    int crossings = 0;
    for (size_t i = 1; i < sorted.size(); ++i) {
        if ((sorted[i].y - summary.y_mean) * (sorted[i - 1].y - summary.y_mean) < 0.0) {
            ++crossings;
        }
    }
    if (crossings > 2) {
        const double estimated_period = (2.0 * summary.x_range) / crossings;
        const double estimate = (2.0 * M_PI) / estimated_period;
        if (estimate > 0.0 && std::isfinite(estimate)) {
            frequency = estimate;
        }
    }
    return frequency;
}

bool estimate_sine_frequency_fft(const std::vector<DataPoint>& points, double& angular_frequency) {
    if (points.size() < 4) return false;

    const std::vector<DataPoint> sorted = sorted_by_x(points);
    const double x_min = sorted.front().x;
    const double x_range = sorted.back().x - x_min;
    if (!(x_range > 0.0) || !std::isfinite(x_range)) return false;

    // The transform runs in single precision; y must survive the cast to float
    const double float_limit = 0.5 * static_cast<double>(std::numeric_limits<float>::max());
    for (const DataPoint& p : sorted) {
        if (!(std::abs(p.y) < float_limit)) return false;
    }

    int N = 64;
    while (N < static_cast<int>(4 * points.size()) && N < 4096) N *= 2;

    float* fft_in = fftwf_alloc_real(static_cast<size_t>(N));
    fftwf_complex* fft_out = fftwf_alloc_complex(static_cast<size_t>(N / 2 + 1));
    if (!fft_in || !fft_out) {
        if (fft_in) fftwf_free(fft_in);
        if (fft_out) fftwf_free(fft_out);
        return false;
    }
    fftwf_plan plan = fftwf_plan_dft_r2c_1d(N, fft_in, fft_out, FFTW_ESTIMATE);

    // Linear interpolation onto x_min + j * x_range / N
    double mean = 0.0;
    size_t seg = 0;
    for (int j = 0; j < N; ++j) {
        const double xs = x_min + x_range * j / N;
        while (seg + 2 < sorted.size() && sorted[seg + 1].x <= xs) ++seg;
        const DataPoint& p0 = sorted[seg];
        const DataPoint& p1 = sorted[seg + 1];
        const double span = p1.x - p0.x;
        const double t = span > 0.0 ? (xs - p0.x) / span : 0.0;
        const double y = p0.y + t * (p1.y - p0.y);
        fft_in[j] = static_cast<float>(y);
        mean += y;
    }
    mean /= N;
    for (int j = 0; j < N; ++j) fft_in[j] -= static_cast<float>(mean);

    fftwf_execute(plan);

    int peak_bin = 0;
    double peak_power = 0.0;
    for (int bin = 1; bin <= N / 2; ++bin) {
        const double re = fft_out[bin][0];
        const double im = fft_out[bin][1];
        const double power = re * re + im * im;
        if (power > peak_power) {
            peak_power = power;
            peak_bin = bin;
        }
    }

    fftwf_destroy_plan(plan);
    fftwf_free(fft_in);
    fftwf_free(fft_out);

    if (peak_bin == 0 || !(peak_power > 1e-12) || !std::isfinite(peak_power)) return false;
    angular_frequency = 2.0 * M_PI * peak_bin / x_range;
    return std::isfinite(angular_frequency);
}

double scan_sine_phase(const std::vector<DataPoint>& points, double a, double b, double d) {
    double best_phase = 0.0;
    double best_error = std::numeric_limits<double>::infinity();
    for (int step = 0; step < 32; ++step) {
        const double phase = step * M_PI / 16.0;
        double error = 0.0;
        for (const auto& p : points) {
            const double predicted = a * std::sin(b * p.x + phase) + d;
            error += (p.y - predicted) * (p.y - predicted);
        }
        if (error < best_error) {
            best_error = error;
            best_phase = phase;
        }
    }
    return best_phase;
}

ParameterVector sine_primary_estimate(const std::vector<DataPoint>& points) {
    const DataSummary summary = summarize_points(points);
    const double a = summary.y_range / 2.0;
    const double d = summary.y_mean;
    const double b = estimate_sine_frequency(points, summary);
    const double c = scan_sine_phase(points, a, b, d);
    return {a, b, c, d};
}

std::vector<ParameterVector> sine_initial_guesses(const std::vector<DataPoint>& points) {
    const DataSummary summary = summarize_points(points);
    const ParameterVector primary = sine_primary_estimate(points);
    const double a = primary[0], b = primary[1], c = primary[2], d = primary[3];

    std::vector<ParameterVector> guesses;
    guesses.push_back(primary);

    double spectral_b = 0.0;
    if (estimate_sine_frequency_fft(points, spectral_b) && std::abs(spectral_b - b) > 1e-9 * std::abs(b)) {
        guesses.push_back({a, spectral_b, scan_sine_phase(points, a, spectral_b, d), d});
    }

    for (double factor : {0.5, 1.2, 1.5, 2.0}) {
        guesses.push_back({a * factor, b, c, d});
    }
    for (double factor : {0.5, 1.5, 2.0, 3.0}) {
        guesses.push_back({a, b * factor, c, d});
    }
    for (int step = 0; step < 8; ++step) {
        guesses.push_back({a, b, step * M_PI / 4.0, d});
    }

    // Opposite phase
    guesses.push_back({-a, b, c + M_PI, d});
    guesses.push_back({-a * 1.2, b, c + M_PI, d});

    // Offset alternatives
    guesses.push_back({a, b, c, (summary.y_max + summary.y_min) / 2.0});
    guesses.push_back({a, b, c, 0.0});
    return guesses;
}

LogRegression log_linear_regression(const std::vector<DataPoint>& points) {
    LogRegression regression;
    std::vector<double> ln_x, y;
    for (const auto& p : points) {
        if (!(p.x > 0.0)) return regression;
        ln_x.push_back(std::log(p.x));
        y.push_back(p.y);
    }
    regression.success = simple_regression(ln_x, y, regression.a, regression.d);
    return regression;
}

std::vector<ParameterVector> log_initial_guesses(const std::vector<DataPoint>& points, const LogRegression& regression) {
    const DataSummary summary = summarize_points(points);
    const double a = regression.a;
    const double d = regression.d;
    return {
        {a, 1.0, 0.0, d},                       // primary
        {a, 0.5, 0.0, d},                       // compressed x
        {a, 2.0, 0.0, d},                       // stretched x
        {a * 1.5, 1.0, 0.0, d},                 // larger amplitude
        {a, 1.0, summary.x_min * 0.1, d},       // small offset
        {a, 1.0, summary.x_min * 0.5, d},       // medium offset
    };
}

ExponentialEstimates exponential_estimates(const std::vector<DataPoint>& points) {
    ExponentialEstimates estimates;
    const DataSummary summary = summarize_points(points);

    std::vector<double> x;
    for (const auto& p : points) x.push_back(p.x);

    // Strategy 1: ln(y) = ln(a) + b x
    bool all_positive = true;
    std::vector<double> ln_y;
    for (const auto& p : points) {
        if (!(p.y > 0.0)) {
            all_positive = false;
            break;
        }
        ln_y.push_back(std::log(p.y));
    }
    double slope = 0.0, intercept = 0.0;
    if (all_positive && simple_regression(x, ln_y, slope, intercept)) {
        estimates.log_linear = {std::exp(intercept), slope, 0.0, 0.0};
        estimates.has_log_linear = std::isfinite(estimates.log_linear[0]);
    }

    // Strategy 2: shift below the minimum first
    const double d_est = summary.y_min * 0.9;
    bool shifted_positive = true;
    std::vector<double> ln_shifted;
    for (const auto& p : points) {
        const double shifted = p.y - d_est;
        if (!(shifted > 0.0)) {
            shifted_positive = false;
            break;
        }
        ln_shifted.push_back(std::log(shifted));
    }
    if (shifted_positive && simple_regression(x, ln_shifted, slope, intercept)) {
        estimates.shifted = {std::exp(intercept), slope, 0.0, d_est};
        estimates.has_shifted = std::isfinite(estimates.shifted[0]);
    }
    return estimates;
}

std::vector<ParameterVector> exponential_initial_guesses(const std::vector<DataPoint>& points,
                                                         const ExponentialEstimates& estimates) {
    const DataSummary s = summarize_points(points);
    std::vector<ParameterVector> guesses;
    if (estimates.has_log_linear) guesses.push_back(estimates.log_linear);
    if (estimates.has_shifted) guesses.push_back(estimates.shifted);

    guesses.push_back({s.y_range, 1.0 / s.x_range, 0.0, s.y_min});        // growing
    guesses.push_back({s.y_range, -1.0 / s.x_range, 0.0, s.y_max});       // decaying
    guesses.push_back({s.y_range * 0.5, 2.0 / s.x_range, 0.0, s.y_min});  // faster growth
    guesses.push_back({s.y_range * 2.0, 0.5 / s.x_range, 0.0, s.y_min});  // slower growth
    guesses.push_back({(s.y_max + s.y_min) / 2.0, 0.1, 0.0, (s.y_max + s.y_min) / 2.0}); // gentle
    return guesses;
}
