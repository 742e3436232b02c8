#include "curvZlogger.hpp"

Logger::Logger() : console_stream(&std::cout), file_output_enabled(false), console_output_enabled(true) {
}

bool Logger::setup(bool enable_console, bool enable_file, const std::string& file_path) {
    console_output_enabled = enable_console;
    if (enable_console) {
        if (!console_stream) console_stream = &std::cout;
    } else {
        console_stream = nullptr;
    }

    if (file_stream.is_open()) {
        file_stream.close();
    }
    file_output_enabled = false;

    if (enable_file && !file_path.empty()) {
        file_stream.open(file_path);
        if (!file_stream.is_open()) {
            std::cerr << "Error: Could not open log file: " << file_path << std::endl;
            return false;
        }
        file_output_enabled = true;
    }
    return true;
}

void Logger::attach_console(std::ostream& stream) {
    console_stream = &stream;
    console_output_enabled = true;
}

bool Logger::enabled() const {
    return (console_output_enabled && console_stream) || (file_output_enabled && file_stream.is_open());
}

Logger& Logger::operator<<(StandardEndlManipulator manip) {
    if (console_output_enabled && console_stream) manip(*console_stream);
    if (file_output_enabled && file_stream.is_open()) manip(file_stream);
    return *this;
}

Logger& Logger::operator<<(StandardFlagManipulator manip) {
    if (console_output_enabled && console_stream) manip(*console_stream);
    if (file_output_enabled && file_stream.is_open()) manip(file_stream);
    return *this;
}

Logger& Logger::setprecision(int n) {
    if (console_output_enabled && console_stream) *console_stream << std::setprecision(n);
    if (file_output_enabled && file_stream.is_open()) file_stream << std::setprecision(n);
    return *this;
}

Logger::~Logger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}
