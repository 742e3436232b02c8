#ifndef CURVZELLIPSE_HPP
#define CURVZELLIPSE_HPP

#include <string>
#include <vector>
#include "curvZtypes.hpp"
#include "curvZdeadline.hpp"

struct EllipseParameters {
    double h = 0.0; // centre x
    double k = 0.0; // centre y
    double a = 1.0; // semi-axis along x
    double b = 1.0; // semi-axis along y
};

struct EllipseFitResult {
    EllipseParameters params;
    double rms_error = 0.0;   // RMS of (x-h)²/a² + (y-k)²/b² - 1
    int initializations_tried = 0;
    bool success = false;
    std::string message;
};

// Starting points: centroid + 1.5 stdev, bounding box, first-four-points, centroid + 2.5 stdev.
// Needs at least 4 points.
std::vector<EllipseParameters> ellipse_initializations(const std::vector<DataPoint>& points);

double ellipse_rms_residual(const std::vector<DataPoint>& points, const EllipseParameters& params);

// Runs one 4-parameter Levenberg-Marquardt refinement per initialisation and keeps the
// lowest RMS residual with finite, positive parameters. Needs at least 4 points.
// The deadline (if any) is checked before each initialisation after the first.
EllipseFitResult fit_axis_aligned_ellipse(const std::vector<DataPoint>& points, const Deadline* deadline = nullptr);

#endif // CURVZELLIPSE_HPP
