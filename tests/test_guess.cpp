#include <gtest/gtest.h>
#include <cmath>
#include "curvZguess.hpp"
#include "curvZellipse.hpp"

namespace {

std::vector<DataPoint> sine_samples(double a, double b, double c, double d) {
    std::vector<DataPoint> pts;
    for (int i = 0; i <= 24; ++i) {
        const double x = 0.25 * i;
        pts.push_back({x, a * std::sin(b * x + c) + d});
    }
    return pts;
}

} // namespace

TEST(InitialGuess, SummaryGuardsZeroXRange) {
    DataSummary s = summarize_points({{2, 1}, {2, 5}, {2, 3}});
    EXPECT_EQ(s.x_range, 1.0);
    EXPECT_EQ(s.y_range, 4.0);
    EXPECT_EQ(s.y_mean, 3.0);
    EXPECT_EQ(s.y_min, 1.0);
    EXPECT_EQ(s.y_max, 5.0);
}

TEST(InitialGuess, SineFrequencyFromZeroCrossings) {
    std::vector<DataPoint> pts = sine_samples(3, 2, 1, 5);
    const double b = estimate_sine_frequency(pts, summarize_points(pts));
    EXPECT_NEAR(b, 2.0, 0.3);
}

TEST(InitialGuess, SineFrequencyFromSpectrum) {
    double b = 0.0;
    ASSERT_TRUE(estimate_sine_frequency_fft(sine_samples(3, 2, 1, 5), b));
    EXPECT_NEAR(b, 2.0, 0.5);
}

TEST(InitialGuess, SpectrumNeedsVariationAndPoints) {
    double b = 0.0;
    EXPECT_FALSE(estimate_sine_frequency_fft({{0, 1}, {1, 2}, {2, 3}}, b));
    EXPECT_FALSE(estimate_sine_frequency_fft({{0, 1}, {1, 1}, {2, 1}, {3, 1}}, b));
    EXPECT_FALSE(estimate_sine_frequency_fft({{1, 1}, {1, 2}, {1, 3}, {1, 4}}, b));
}

TEST(InitialGuess, SpectrumSkipsValuesBeyondSinglePrecision) {
    double b = 7.0;
    EXPECT_FALSE(estimate_sine_frequency_fft(sine_samples(1e300, 2, 1, 0), b));
    EXPECT_EQ(b, 7.0);
    EXPECT_TRUE(estimate_sine_frequency_fft(sine_samples(1e30, 2, 1, 0), b));
}

TEST(InitialGuess, SinePrimaryComesFirst) {
    std::vector<DataPoint> pts = sine_samples(3, 2, 1, 5);
    std::vector<ParameterVector> guesses = sine_initial_guesses(pts);
    ParameterVector primary = sine_primary_estimate(pts);
    ASSERT_GE(guesses.size(), 20u);
    EXPECT_EQ(guesses.front(), primary);
    EXPECT_NEAR(primary[0], 3.0, 0.1);
    EXPECT_NEAR(primary[3], 5.0, 0.5);
    for (const auto& g : guesses) {
        ASSERT_EQ(g.size(), 4u);
    }
}

TEST(InitialGuess, LogRegressionAndGuesses) {
    std::vector<DataPoint> pts;
    for (int x = 1; x <= 6; ++x) pts.push_back({double(x), 2.0 * std::log(double(x)) + 1.0});
    LogRegression reg = log_linear_regression(pts);
    ASSERT_TRUE(reg.success);
    EXPECT_NEAR(reg.a, 2.0, 1e-9);
    EXPECT_NEAR(reg.d, 1.0, 1e-9);

    std::vector<ParameterVector> guesses = log_initial_guesses(pts, reg);
    ASSERT_EQ(guesses.size(), 6u);
    EXPECT_NEAR(guesses[0][0], 2.0, 1e-9);
    EXPECT_EQ(guesses[0][1], 1.0);
    EXPECT_EQ(guesses[0][2], 0.0);
}

TEST(InitialGuess, LogRegressionNeedsSpreadInX) {
    EXPECT_FALSE(log_linear_regression({{2, 1}, {2, 2}, {2, 3}}).success);
    EXPECT_FALSE(log_linear_regression({{-1, 1}, {2, 2}, {3, 3}}).success);
}

TEST(InitialGuess, ExponentialStrategies) {
    std::vector<DataPoint> pts;
    for (int i = 0; i <= 8; ++i) pts.push_back({0.5 * i, 2.0 * std::exp(0.25 * i)});
    ExponentialEstimates est = exponential_estimates(pts);
    ASSERT_TRUE(est.has_log_linear);
    EXPECT_NEAR(est.log_linear[0], 2.0, 1e-9);
    EXPECT_NEAR(est.log_linear[1], 0.5, 1e-9);
    EXPECT_TRUE(est.has_shifted);

    std::vector<ParameterVector> guesses = exponential_initial_guesses(pts, est);
    EXPECT_EQ(guesses.size(), 7u);
    EXPECT_EQ(guesses.front(), est.log_linear);
}

TEST(InitialGuess, ExponentialWithNegativeValuesSkipsLogLinear) {
    std::vector<DataPoint> pts = {{0, -3}, {1, -1}, {2, 4}};
    ExponentialEstimates est = exponential_estimates(pts);
    EXPECT_FALSE(est.has_log_linear);
    std::vector<ParameterVector> guesses = exponential_initial_guesses(pts, est);
    EXPECT_EQ(guesses.size(), (est.has_shifted ? 6u : 5u));
}

TEST(InitialGuess, EllipseInitialisations) {
    std::vector<DataPoint> pts = {{4, 0}, {-2, 0}, {1, 2}, {1, -2}, {3, 1.5}};
    std::vector<EllipseParameters> inits = ellipse_initializations(pts);
    ASSERT_EQ(inits.size(), 4u);
    for (const auto& e : inits) {
        EXPECT_GT(e.a, 0.0);
        EXPECT_GT(e.b, 0.0);
    }
}
