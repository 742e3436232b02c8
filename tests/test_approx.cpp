#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include <memory>
#include <sstream>
#include "curvZapprox.hpp"
#include "curvZlogger.hpp"

namespace {

std::vector<DataPoint> sine_samples() {
    std::vector<DataPoint> pts;
    for (int i = 0; i <= 24; ++i) {
        const double x = 0.25 * i;
        pts.push_back({x, 3.0 * std::sin(2.0 * x + 1.0) + 5.0});
    }
    return pts;
}

FitOptions generous_budget() {
    FitOptions options;
    options.time_budget = std::chrono::milliseconds(60000);
    return options;
}

// Every call moves time forward by `step` milliseconds.
Deadline::Clock stepping_clock(std::shared_ptr<long long> calls, long long step) {
    return [calls, step]() {
        ++*calls;
        return std::chrono::milliseconds(*calls * step);
    };
}

void expect_valid_result(const FitResult& r) {
    if (r.success) {
        EXPECT_FALSE(r.equation.empty());
        EXPECT_TRUE(coefficients_are_finite(r.coefficients));
        ASSERT_TRUE(r.r_squared.has_value());
        EXPECT_GE(*r.r_squared, 0.0);
        EXPECT_LE(*r.r_squared, 1.0);
    } else {
        EXPECT_TRUE(r.error.has_value());
        EXPECT_TRUE(r.coefficients.empty());
    }
}

} // namespace

TEST(ApproxFit, SineRecoversCleanSignal) {
    const std::vector<DataPoint> pts = sine_samples();
    FitResult r = fit_sine(pts, generous_budget());
    ASSERT_TRUE(r.success);
    ASSERT_TRUE(r.r_squared.has_value());
    EXPECT_GT(*r.r_squared, 0.999);

    const double a = r.coefficients.at("a");
    const double b = r.coefficients.at("b");
    const double c = r.coefficients.at("c");
    const double d = r.coefficients.at("d");
    for (const auto& p : pts) {
        EXPECT_NEAR(a * std::sin(b * p.x + c) + d, p.y, 0.2);
    }
    EXPECT_NE(r.equation.find("sin("), std::string::npos);
}

TEST(ApproxFit, SineIsDeterministic) {
    const std::vector<DataPoint> pts = sine_samples();
    FitResult first = fit_sine(pts, generous_budget());
    FitResult second = fit_sine(pts, generous_budget());
    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_EQ(first.coefficients, second.coefficients);
    EXPECT_EQ(first.equation, second.equation);
}

TEST(ApproxFit, SineNeedsThreePoints) {
    FitResult r = fit_sine({{0, 1}, {1, 2}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, FitError::WrongPointCount);
    EXPECT_EQ(*r.error, "Need at least 3 points for sine approximation");
}

TEST(ApproxFit, ExpiredBudgetStillReturnsACurve) {
    auto calls = std::make_shared<long long>(0);
    FitOptions options;
    options.clock = stepping_clock(calls, 10000);

    FitResult r = fit_sine(sine_samples(), options);
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(r.equation.empty());
    expect_valid_result(r);
    // Start time, the first guess's LM check and the check before the second guess
    EXPECT_LE(*calls, 5);
}

TEST(ApproxFit, ExponentialGrowth) {
    std::vector<DataPoint> pts;
    for (int i = 0; i <= 8; ++i) {
        const double x = 0.5 * i;
        pts.push_back({x, 2.0 * std::exp(0.5 * x) + 1.0});
    }
    FitResult r = fit_exponential(pts, generous_budget());
    ASSERT_TRUE(r.success);
    EXPECT_GT(*r.r_squared, 0.99);
    EXPECT_NE(r.equation.find("e^("), std::string::npos);
}

TEST(ApproxFit, ExponentialDecayWithNegativeValues) {
    std::vector<DataPoint> pts;
    for (int i = 0; i <= 10; ++i) {
        const double x = 0.4 * i;
        pts.push_back({x, 5.0 * std::exp(-0.8 * x) - 2.0});
    }
    FitResult r = fit_exponential(pts, generous_budget());
    ASSERT_TRUE(r.success);
    expect_valid_result(r);
}

TEST(ApproxFit, LogarithmRecoversCurve) {
    std::vector<DataPoint> pts;
    for (int x = 1; x <= 10; ++x) pts.push_back({double(x), 2.0 * std::log(double(x)) + 1.0});
    FitResult r = fit_logarithm(pts, generous_budget());
    ASSERT_TRUE(r.success);
    EXPECT_GT(*r.r_squared, 0.9999);
    const double a = r.coefficients.at("a");
    const double b = r.coefficients.at("b");
    const double c = r.coefficients.at("c");
    const double d = r.coefficients.at("d");
    for (const auto& p : pts) {
        ASSERT_GT(b * p.x + c, 0.0);
        EXPECT_NEAR(a * std::log(b * p.x + c) + d, p.y, 1e-3);
    }
}

TEST(ApproxFit, LogarithmRejectsNonPositiveX) {
    FitResult r = fit_logarithm({{0, 1}, {1, 2}, {2, 3}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, FitError::NonPositiveDomain);
    EXPECT_EQ(*r.error, "Logarithmic fit requires all x values to be positive");
}

TEST(ApproxFit, LogarithmWithoutSpreadInX) {
    FitResult r = fit_logarithm({{2, 1}, {2, 2}, {2, 3}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.coefficients.at("a"), 1.0);
    EXPECT_EQ(r.coefficients.at("b"), 1.0);
    EXPECT_EQ(r.coefficients.at("c"), 0.0);
    EXPECT_EQ(r.coefficients.at("d"), 2.0);
    EXPECT_EQ(r.equation, "y = ln(x) + 2");
    EXPECT_EQ(*r.r_squared, 0.0);
}

TEST(ApproxFit, EllipseApproximation) {
    std::vector<DataPoint> pts;
    for (int i = 0; i < 12; ++i) {
        const double t = 2.0 * 3.14159265358979 * i / 12.0;
        pts.push_back({1.0 + 3.0 * std::cos(t), -2.0 + 2.0 * std::sin(t)});
    }
    FitResult r = fit_ellipse_approx(pts, generous_budget());
    ASSERT_TRUE(r.success);
    EXPECT_NEAR(r.coefficients.at("h"), 1.0, 1e-3);
    EXPECT_NEAR(r.coefficients.at("k"), -2.0, 1e-3);
    EXPECT_NEAR(r.coefficients.at("a"), 3.0, 1e-3);
    EXPECT_NEAR(r.coefficients.at("b"), 2.0, 1e-3);
    EXPECT_GT(*r.r_squared, 0.99);
    ASSERT_TRUE(r.machine_equation.has_value());
    EXPECT_EQ(r.machine_equation->substr(0, 6), "\\frac{");
}

TEST(ApproxFit, EllipseApproximationNeedsFourPoints) {
    FitResult r = fit_ellipse_approx({{0, 1}, {1, 0}, {0, -1}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, FitError::WrongPointCount);
}

TEST(ApproxFit, PathologicalInputsNeverThrow) {
    const std::vector<std::vector<DataPoint>> inputs = {
        {{1, 1}, {1, 2}, {1, 3}},                 // single x
        {{0, 0}, {1, 0}, {2, 0}, {3, 0}},         // flat
        {{1000, 1}, {1001, 2}, {1002, 3}},        // exp overflow territory
        {{1e-9, 1e9}, {2e-9, -1e9}, {3e-9, 1e9}}, // extreme scales
    };
    for (const auto& pts : inputs) {
        FitResult sine, exponential, ellipse;
        EXPECT_NO_THROW(sine = fit_sine(pts));
        EXPECT_NO_THROW(exponential = fit_exponential(pts));
        EXPECT_NO_THROW(ellipse = fit_ellipse_approx(pts));
        expect_valid_result(sine);
        expect_valid_result(exponential);
        expect_valid_result(ellipse);
    }
}

TEST(ApproxFit, VerboseLoggerTracesGuesses) {
    std::ostringstream captured;
    Logger logger;
    logger.attach_console(captured);
    logger.verbose = true;

    FitOptions options = generous_budget();
    options.logger = &logger;
    FitResult r = fit_sine(sine_samples(), options);
    ASSERT_TRUE(r.success);
    EXPECT_NE(captured.str().find("[sine] guess 1/"), std::string::npos);
}

TEST(ApproxFit, QuietWithoutVerbose) {
    std::ostringstream captured;
    Logger logger;
    logger.attach_console(captured);

    FitOptions options = generous_budget();
    options.logger = &logger;
    fit_sine(sine_samples(), options);
    EXPECT_TRUE(captured.str().empty());
}

TEST(ApproxFit, MultiStartKeepsBestCandidate) {
    MultiStartSearch search;
    search.family = "line";
    search.model = [](const ParameterVector& p, double x) { return p[0] * x + p[1]; };
    const std::vector<DataPoint> pts = {{0, 1}, {1, 3}, {2, 5}, {3, 7}};

    std::optional<FitCandidate> best = run_multistart(pts, search, {{0.0, 0.0}}, Deadline::unlimited(), nullptr);
    ASSERT_TRUE(best.has_value());
    EXPECT_GT(best->r_squared, 0.999);
    EXPECT_NEAR(best->parameters[0], 2.0, 1e-3);
}

TEST(ApproxFit, MultiStartStopsAfterNearPerfectGuess) {
    std::ostringstream captured;
    Logger logger;
    logger.attach_console(captured);
    logger.verbose = true;

    auto inspected = std::make_shared<std::vector<ParameterVector>>();
    MultiStartSearch search;
    search.family = "line";
    search.model = [](const ParameterVector& p, double x) { return p[0] * x + p[1]; };
    search.admissible = [inspected](const ParameterVector& p) {
        inspected->push_back(p);
        return true;
    };
    const std::vector<DataPoint> pts = {{0, 1}, {1, 3}, {2, 5}, {3, 7}};

    std::optional<FitCandidate> best = run_multistart(
        pts, search, {{2.0, 1.0}, {-5.0, 9.0}, {40.0, -3.0}}, Deadline::unlimited(), &logger);
    ASSERT_TRUE(best.has_value());
    EXPECT_GT(best->r_squared, 0.999);

    // The first guess is checked before and after refinement; the rest are never looked at
    EXPECT_EQ(inspected->size(), 2u);
    for (const ParameterVector& p : *inspected) {
        EXPECT_NEAR(p[0], 2.0, 1e-9);
        EXPECT_NEAR(p[1], 1.0, 1e-9);
    }
    EXPECT_NE(captured.str().find("[line] guess 1/3"), std::string::npos);
    EXPECT_EQ(captured.str().find("[line] guess 2/3"), std::string::npos);
}

TEST(ApproxFit, FallbackReturnsSeedWhenNothingQualifies) {
    MultiStartSearch search;
    search.family = "never";
    search.model = [](const ParameterVector& p, double x) { return p[0] * x; };
    search.admissible = [](const ParameterVector&) { return false; };
    const std::vector<DataPoint> pts = {{0, 1}, {1, 3}, {2, 5}};

    FitCandidate c = fit_with_fallback(pts, search, {{1.0}}, {42.0}, Deadline::unlimited(), nullptr);
    ASSERT_EQ(c.parameters.size(), 1u);
    EXPECT_EQ(c.parameters[0], 42.0);
    EXPECT_EQ(c.r_squared, 0.0);
}
