#ifndef CURVZSOLVER_HPP
#define CURVZSOLVER_HPP

#include <vector>
#include "curvZtypes.hpp"
#include "curvZapprox.hpp"

// Single entry point for every equation kind. Never throws: failures of any
// solver, including unexpected exceptions, come back as an error FitResult.
FitResult solve_equation(EquationKind kind, const std::vector<DataPoint>& points, const FitOptions& options);

FitResult solve_equation(EquationKind kind, const std::vector<DataPoint>& points, bool use_fractions = true);

#endif // CURVZSOLVER_HPP
