#ifndef CURVZLOGGER_HPP
#define CURVZLOGGER_HPP

#include <iostream>
#include <fstream>
#include <string>
#include <iomanip> // For std::setprecision

// Writes the same text to the console and/or a log file.
// Either sink may be disabled; with both disabled everything is dropped.
class Logger {
public:
    std::ostream* console_stream = nullptr;
    std::ofstream file_stream;
    bool file_output_enabled = false;
    bool console_output_enabled = true;
    bool verbose = false; // per-guess trace from the approximation engine

    Logger();

    // Returns false when the log file was requested but could not be opened.
    bool setup(bool enable_console, bool enable_file, const std::string& file_path);

    // Redirect console output (tests capture into a std::ostringstream).
    void attach_console(std::ostream& stream);

    bool enabled() const;

    template<typename T>
    Logger& operator<<(const T& val);

    typedef std::ostream& (*StandardEndlManipulator)(std::ostream&);
    typedef std::ios_base& (*StandardFlagManipulator)(std::ios_base&);

    Logger& operator<<(StandardEndlManipulator manip); // For std::endl
    Logger& operator<<(StandardFlagManipulator manip); // For std::fixed, std::scientific

    Logger& setprecision(int n);

    ~Logger();
};

template<typename T>
Logger& Logger::operator<<(const T& val) {
    if (console_output_enabled && console_stream) {
        *console_stream << val;
    }
    if (file_output_enabled && file_stream.is_open()) {
        file_stream << val;
    }
    return *this;
}

#endif // CURVZLOGGER_HPP
