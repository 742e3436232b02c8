#ifndef CURVZOUTPUT_HPP
#define CURVZOUTPUT_HPP

#include <map>
#include <string>
#include <vector>
#include "curvZtypes.hpp"

// A fitted curve as a list of connected polylines (conics may have two branches,
// explicit curves break where the model is undefined).
using CurveSegments = std::vector<std::vector<DataPoint>>;

// Text report: kind, input points, status, equations, R² and coefficients.
bool write_fit_report(
    const std::string& output_path,
    EquationKind kind,
    const std::vector<DataPoint>& points,
    const FitResult& result);

// Samples the fitted curve for plotting.
//   explicit kinds (polynomials, sine, log, exponential): n samples over the x range padded by 10%
//   circle, ellipse, ellipse-approx: n parametric samples around the full curve
//   conic: y solved from the quadratic per x over the x range padded by 50%, both branches
// Returns no segments when a required coefficient is missing.
CurveSegments sample_fit_curve(
    EquationKind kind,
    const std::map<std::string, double>& coefficients,
    const std::vector<DataPoint>& points,
    int n = 400);

// "x y" per line, blank line between segments (gnuplot data block layout).
bool write_curve_samples(const std::string& output_path, const CurveSegments& segments);

// PNG of the input points and the sampled curve through a gnuplot pipe.
void plot_fit_with_gnuplot(
    const std::string& output_path,
    const std::string& title,
    const std::vector<DataPoint>& points,
    const CurveSegments& segments);

#endif // CURVZOUTPUT_HPP
