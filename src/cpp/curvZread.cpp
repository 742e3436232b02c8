#include "curvZread.hpp"
#include <fstream>
#include <iostream> // For std::cerr in case logger is not set up
#include <sstream>
#include <stdexcept>
#include <cmath>

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

bool parse_number(const std::string& token, double& value) {
    try {
        size_t processed_chars;
        value = std::stod(token, &processed_chars);
        return processed_chars == token.length() && std::isfinite(value);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// "x,y", "x y", "x\ty" (also "x, y")
bool parse_point(const std::string& text, DataPoint& point) {
    std::string normalized = text;
    size_t comma_pos = normalized.find(',');
    if (comma_pos != std::string::npos) {
        if (normalized.find(',', comma_pos + 1) != std::string::npos) return false;
        normalized[comma_pos] = ' ';
    }

    std::istringstream iss(normalized);
    std::string x_token, y_token, extra;
    if (!(iss >> x_token >> y_token) || (iss >> extra)) return false;
    return parse_number(x_token, point.x) && parse_number(y_token, point.y);
}

void report(Logger& logger, const std::string& message) {
    if (logger.enabled()) {
        logger << message << std::endl;
    } else {
        std::cerr << message << std::endl;
    }
}

} // namespace

PointData read_points_file(const std::string& filepath, Logger& logger) {
    PointData result;

    std::ifstream infile(filepath);
    if (!infile) {
        result.error_message = "Error opening file: " + filepath;
        report(logger, result.error_message);
        return result;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(infile, line)) {
        ++line_number;
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos) line.erase(comment_pos);
        line = trim(line);
        if (line.empty()) continue;

        DataPoint point;
        if (!parse_point(line, point)) {
            result.error_message = "Error: malformed point at line " + std::to_string(line_number) + " of " + filepath + ": " + line;
            report(logger, result.error_message);
            result.points.clear();
            return result;
        }
        result.points.push_back(point);
    }

    if (result.points.empty()) {
        result.error_message = "Error: no points found in " + filepath;
        report(logger, result.error_message);
        return result;
    }

    result.success = true;
    return result;
}

PointData parse_points_text(const std::string& text) {
    PointData result;

    // Split into tokens on ';' and whitespace, then glue "x," "y" pieces back together
    std::string normalized = text;
    for (char& c : normalized) {
        if (c == ';' || c == '\t' || c == '\n' || c == '\r') c = ' ';
    }
    std::istringstream iss(normalized);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        if (!tokens.empty() && (tokens.back().back() == ',' || token.front() == ',')) {
            tokens.back() += token;
        } else {
            tokens.push_back(token);
        }
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        DataPoint point;
        if (!parse_point(tokens[i], point)) {
            result.error_message = "Error: malformed point #" + std::to_string(i + 1) + ": " + tokens[i];
            result.points.clear();
            return result;
        }
        result.points.push_back(point);
    }

    if (result.points.empty()) {
        result.error_message = "Error: no points given";
        return result;
    }

    result.success = true;
    return result;
}
