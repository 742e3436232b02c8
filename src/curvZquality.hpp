#ifndef CURVZQUALITY_HPP
#define CURVZQUALITY_HPP

#include <functional>
#include <vector>
#include "curvZtypes.hpp"

// 1 - SS_res / SS_tot against mean(y). Not clamped; NaN when a prediction is not finite.
// With constant y the result is 1 for a reproducing model and 0 otherwise.
double r_squared(const std::vector<DataPoint>& points, const std::function<double(double)>& predict);

// Shortest distance from (px, py) to the boundary of (x-h)²/a² + (y-k)²/b² = 1.
// Coarse scan of 100 parametric angles, refined by Newton steps on the angle.
double distance_to_ellipse(double px, double py, double h, double k, double a, double b);

// Geometric R²: squared boundary distances against squared distances to the centroid.
// Clamped to [0, 1].
double ellipse_r_squared(const std::vector<DataPoint>& points, double h, double k, double a, double b);

#endif // CURVZQUALITY_HPP
