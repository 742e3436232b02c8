#ifndef CURVZREAD_HPP
#define CURVZREAD_HPP

#include <string>
#include <vector>
#include "curvZtypes.hpp"
#include "curvZlogger.hpp"

struct PointData {
    std::vector<DataPoint> points;
    bool success = false;
    std::string error_message;
};

// One point per line: "x,y", "x y" or "x<TAB>y". '#' starts a comment, blank lines are skipped.
// A malformed line fails the whole read and names its line number.
PointData read_points_file(const std::string& filepath, Logger& logger);

// Same grammar from a single string; points may also be separated by ';' or whitespace
// ("0,1 1,3;2,5").
PointData parse_points_text(const std::string& text);

#endif // CURVZREAD_HPP
