#include <gtest/gtest.h>
#include <chrono>
#include <cmath>
#include "curvZsolver.hpp"

TEST(Solver, DispatchesExactKinds) {
    FitResult line = solve_equation(EquationKind::Linear, {{0, 1}, {2, 5}});
    ASSERT_TRUE(line.success);
    EXPECT_EQ(line.equation, "y = 2x + 1");

    FitResult circle = solve_equation(EquationKind::Circle, {{0, 2}, {2, 0}, {0, -2}});
    ASSERT_TRUE(circle.success);
    EXPECT_NEAR(circle.coefficients.at("r"), 2.0, 1e-9);

    FitResult ellipse = solve_equation(EquationKind::Ellipse, {{3, -2}, {-1, -2}, {1, -1}, {1, -3}});
    ASSERT_TRUE(ellipse.success);
    EXPECT_NEAR(ellipse.coefficients.at("a"), 2.0, 1e-9);
}

TEST(Solver, DecimalModeChangesOnlyFormatting) {
    const std::vector<DataPoint> pts = {{0, 0.5}, {1, 0.75}};
    FitResult fractions = solve_equation(EquationKind::Linear, pts, true);
    FitResult decimals = solve_equation(EquationKind::Linear, pts, false);
    ASSERT_TRUE(fractions.success);
    ASSERT_TRUE(decimals.success);
    EXPECT_EQ(fractions.coefficients, decimals.coefficients);
    EXPECT_EQ(fractions.equation, "y = 1/4x + 1/2");
    EXPECT_EQ(decimals.equation, "y = 0.25x + 0.5");
}

TEST(Solver, DuplicatesCaughtForEveryExactKind) {
    const EquationKind exact[] = {
        EquationKind::Linear, EquationKind::Quadratic, EquationKind::Cubic,
        EquationKind::Circle, EquationKind::Ellipse, EquationKind::Conic,
    };
    for (EquationKind kind : exact) {
        FitResult r = solve_equation(kind, {{1, 1}, {1, 1}});
        EXPECT_FALSE(r.success) << equation_kind_name(kind);
        EXPECT_EQ(r.error_kind, FitError::DuplicatePoints) << equation_kind_name(kind);
        EXPECT_TRUE(r.coefficients.empty());
        EXPECT_TRUE(r.equation.empty());
    }
}

TEST(Solver, CircleWithFourPointsIsWrongCount) {
    FitResult r = solve_equation(EquationKind::Circle, {{0, 2}, {2, 0}, {0, -2}, {-2, 0}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, FitError::WrongPointCount);
    EXPECT_EQ(*r.error, "Need exactly 3 points for circle equation");
}

TEST(Solver, UnknownKindIsAnError) {
    FitResult r = solve_equation(static_cast<EquationKind>(42), {{0, 1}, {1, 2}});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, FitError::UnknownKind);
    EXPECT_TRUE(r.error.has_value());
}

TEST(Solver, ApproximationKindsReportRSquared) {
    std::vector<DataPoint> pts;
    for (int x = 1; x <= 8; ++x) pts.push_back({double(x), 0.5 * std::log(double(x)) - 1.0});
    FitOptions options;
    options.time_budget = std::chrono::milliseconds(60000);
    FitResult r = solve_equation(EquationKind::Logarithm, pts, options);
    ASSERT_TRUE(r.success);
    ASSERT_TRUE(r.r_squared.has_value());
    EXPECT_GT(*r.r_squared, 0.999);
    EXPECT_FALSE(r.error.has_value());
}

TEST(Solver, ErrorsFromApproximationKindsPassThrough) {
    FitResult r = solve_equation(EquationKind::Logarithm, {{-1, 1}, {1, 2}, {2, 3}});
    EXPECT_EQ(r.error_kind, FitError::NonPositiveDomain);
    FitResult e = solve_equation(EquationKind::EllipseApprox, {{0, 1}, {1, 0}});
    EXPECT_EQ(e.error_kind, FitError::WrongPointCount);
}

TEST(Types, KindNamesRoundTrip) {
    for (int i = 0; i < kEquationKindCount; ++i) {
        const EquationKind kind = static_cast<EquationKind>(i);
        EquationKind parsed = EquationKind::Linear;
        ASSERT_TRUE(parse_equation_kind(equation_kind_name(kind), parsed));
        EXPECT_EQ(parsed, kind);
    }
    EquationKind alias = EquationKind::Linear;
    EXPECT_TRUE(parse_equation_kind("exp", alias));
    EXPECT_EQ(alias, EquationKind::Exponential);
    EXPECT_TRUE(parse_equation_kind("logarithm", alias));
    EXPECT_EQ(alias, EquationKind::Logarithm);
    EXPECT_FALSE(parse_equation_kind("spline", alias));
}

TEST(Types, PointCountsAndFamilies) {
    EXPECT_EQ(required_point_count(EquationKind::Linear), 2u);
    EXPECT_EQ(required_point_count(EquationKind::Conic), 5u);
    EXPECT_EQ(required_point_count(EquationKind::EllipseApprox), 4u);
    EXPECT_TRUE(is_exact_kind(EquationKind::Ellipse));
    EXPECT_FALSE(is_exact_kind(EquationKind::Sine));
    EXPECT_STREQ(fit_error_name(FitError::NoValidFit), "NoValidFit");
}

TEST(Types, ErrorResultShape) {
    FitResult r = make_error_result(FitError::NoValidFit, "nothing fits");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.coefficients.empty());
    EXPECT_TRUE(r.equation.empty());
    EXPECT_EQ(*r.error, "nothing fits");
    EXPECT_FALSE(r.r_squared.has_value());
}
