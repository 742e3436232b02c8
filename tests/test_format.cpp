#include <gtest/gtest.h>
#include <cmath>
#include "curvZformat.hpp"

TEST(Format, FractionOfSimpleRationals) {
    EXPECT_EQ(to_fraction(0.5), "1/2");
    EXPECT_EQ(to_fraction(-0.75), "-3/4");
    EXPECT_EQ(to_fraction(1.0 / 3.0), "1/3");
    EXPECT_EQ(to_fraction(2.00001), "2");
    EXPECT_EQ(to_fraction(-4.0), "-4");
    EXPECT_EQ(to_fraction(-0.00001), "0");
}

TEST(Format, FractionFallsBackToDecimal) {
    EXPECT_EQ(to_fraction(3.14159265358979), "3.1416");
}

TEST(Format, NumberRendering) {
    EXPECT_EQ(format_number(2.5), "2.5");
    EXPECT_EQ(format_number(1.00001), "1");
    EXPECT_EQ(format_number(0.123456), "0.1235");
    EXPECT_EQ(format_number(-0.125), "-0.125");
    EXPECT_EQ(format_number(std::nan("")), "NaN");
    EXPECT_EQ(format_number(INFINITY), "Infinity");
}

TEST(Format, HugeValuesKeepEveryDigit) {
    const std::string decimal = format_number(1e70);
    EXPECT_EQ(decimal.size(), 71u);
    EXPECT_EQ(std::stod(decimal), 1e70);
    EXPECT_EQ(to_fraction(1e70), decimal);
    EXPECT_EQ(std::stod(format_number(-2.5e300)), -2.5e300);
}

TEST(Format, SignedCoefficient) {
    EXPECT_EQ(format_coefficient(0.0, true), "");
    EXPECT_EQ(format_coefficient(0.0, false), "0");
    EXPECT_EQ(format_coefficient(-2.0, true), " - 2");
    EXPECT_EQ(format_coefficient(0.5, true), " + 1/2");
    EXPECT_EQ(format_coefficient(-0.25, true, true), " - 1/4");
    EXPECT_EQ(format_coefficient(0.5, false, false), "0.5");
}

TEST(Format, PolynomialEquation) {
    EXPECT_EQ(build_polynomial_equation({{2.0, "x²"}, {-1.0, "x"}, {0.5, ""}}, true), "y = 2x² - x + 1/2");
    EXPECT_EQ(build_polynomial_equation({{0.0, "x²"}, {1.0, "x"}, {-3.0, ""}}, true), "y = x - 3");
    EXPECT_EQ(build_polynomial_equation({{-1.0, "x³"}, {0.0, "x²"}, {0.0, "x"}, {0.0, ""}}, true), "y = -x³");
    EXPECT_EQ(build_polynomial_equation({{0.0, "x"}, {0.0, ""}}, true), "y = 0");
    EXPECT_EQ(build_polynomial_equation({{0.5, "x"}, {0.0, ""}}, false), "y = 0.5x");
}

TEST(Format, CircleAndEllipseEquations) {
    EXPECT_EQ(build_circle_equation(1.0, -2.0, 3.0, true), "(x - 1)² + (y + 2)² = 3²");
    EXPECT_EQ(build_ellipse_equation(1.0, -2.0, 2.0, 1.0, true), "(x - 1)²/2² + (y + 2)²/1² = 1");
    EXPECT_EQ(build_ellipse_latex(1.0, -2.0, 2.0, 1.0, true),
              "\\frac{\\left(x - 1\\right)^{2}}{2^{2}} + \\frac{\\left(y + 2\\right)^{2}}{1^{2}} = 1");
}

TEST(Format, FractionalSemiAxesAreBracketed) {
    EXPECT_EQ(build_ellipse_equation(0.0, 0.0, 0.1, 0.5, true), "(x)²/(1/10)² + (y)²/(1/2)² = 1");
    EXPECT_EQ(build_ellipse_equation(0.0, 0.0, 0.1, 3.0, false), "(x)²/0.1² + (y)²/3² = 1");
}

TEST(Format, ConicEquation) {
    EXPECT_EQ(build_conic_equation(1.0, 0.0, 1.0, 0.0, 0.0, -4.0, true), "x² + y² - 4 = 0");
    EXPECT_EQ(build_conic_equation(0.0, 1.0, 0.0, 0.0, 0.0, -1.0, true), "xy - 1 = 0");
    EXPECT_EQ(build_conic_equation(0.0, 0.0, 0.0, 0.0, 0.0, 0.0, true), "0 = 0");
}

TEST(Format, TranscendentalEquation) {
    EXPECT_EQ(build_transcendental_equation("sin", 3.0, 2.0, 1.0, 5.0, true), "y = 3 * sin(2x + 1) + 5");
    EXPECT_EQ(build_transcendental_equation("ln", 1.0, 1.0, 0.0, 4.0, true), "y = ln(x) + 4");
    EXPECT_EQ(build_transcendental_equation("e^", -1.0, -1.0, 0.0, 0.0, true), "y = -e^(-x)");
    EXPECT_EQ(build_transcendental_equation("sin", 2.0, 1.0, -0.5, -1.0, false), "y = 2 * sin(x - 0.5) - 1");
}

TEST(Format, SameInputSameOutput) {
    const std::string first = build_conic_equation(0.25, 0.1, -0.3, 1.0 / 7.0, 2.0, -1.0, true);
    const std::string second = build_conic_equation(0.25, 0.1, -0.3, 1.0 / 7.0, 2.0, -1.0, true);
    EXPECT_EQ(first, second);
}
