#include <iostream>
#include <iomanip>
#include <filesystem>
#include <string>
#include <vector>
#include "curvZargs.hpp"
#include "curvZlogger.hpp"
#include "curvZread.hpp"
#include "curvZsolver.hpp"
#include "curvZoutput.hpp"

int main(int argc, char* argv[]) {

    ProgramOptions params;
    Logger logger;

    // parse_arguments prints help/version or the error itself.
    if (!parse_arguments(argc, argv, params)) {
        return 1;
    }

    // Creates the output directory when --output is given
    post_process_options(params);

    namespace fs = std::filesystem;
    std::string log_file_path;
    if (params.enable_text_log_output && !params.output_dir_final.empty()) {
        log_file_path = (fs::path(params.output_dir_final) / (params.output_basename + "_curvZfit_log.txt")).string();
    }

    if (!logger.setup(!params.noconsole, !log_file_path.empty(), log_file_path)) {
        return 1;
    }
    logger.verbose = params.verbose;

    if (!log_file_path.empty()) {
        logger << "Output directory for all files: " << params.output_dir_final << std::endl;
    }

    // === Step 1: 点列の読み込み ===
    std::vector<DataPoint> points;
    if (!params.input_filename.empty()) {
        PointData file_points = read_points_file(params.input_filename, logger);
        if (!file_points.success) {
            return 1;
        }
        points = file_points.points;
    }
    if (!params.points_text.empty()) {
        PointData text_points = parse_points_text(params.points_text);
        if (!text_points.success) {
            std::cerr << text_points.error_message << std::endl;
            return 1;
        }
        points.insert(points.end(), text_points.points.begin(), text_points.points.end());
    }

    logger << "Type: " << equation_kind_name(params.kind) << ", " << points.size() << " points" << std::endl;

    // === Step 2: フィッティング ===
    FitOptions options;
    options.use_fractions = params.use_fractions;
    options.time_budget = std::chrono::milliseconds(params.time_budget_ms);
    options.logger = &logger;

    FitResult result = solve_equation(params.kind, points, options);

    // === Step 3: 結果の出力 ===
    if (!result.success) {
        logger << "Error (" << fit_error_name(result.error_kind) << "): " << result.error.value_or("Unknown error") << std::endl;
    } else {
        logger << "Equation: " << result.equation << std::endl;
        if (result.machine_equation && *result.machine_equation != result.equation) {
            logger << "Machine equation: " << *result.machine_equation << std::endl;
        }
        if (result.r_squared) {
            logger << "R^2: " << std::fixed << std::setprecision(6) << *result.r_squared << std::endl;
            logger << std::defaultfloat;
        }
        logger.setprecision(10);
        for (const auto& entry : result.coefficients) {
            logger << "  " << entry.first << " = " << entry.second << std::endl;
        }
    }

    if (params.enable_text_log_output && !params.output_dir_final.empty()) {
        const fs::path out_dir(params.output_dir_final);
        const std::string stem = params.output_basename + "_" + equation_kind_name(params.kind);

        const std::string report_path = (out_dir / (stem + "_report.txt")).string();
        if (write_fit_report(report_path, params.kind, points, result)) {
            logger << "Report written to " << report_path << std::endl;
        }

        if (result.success) {
            CurveSegments curve = sample_fit_curve(params.kind, result.coefficients, points);
            const std::string samples_path = (out_dir / (stem + "_curve.txt")).string();
            if (write_curve_samples(samples_path, curve)) {
                logger << "Curve samples written to " << samples_path << std::endl;
            }
            if (params.plot) {
                const std::string png_path = (out_dir / (stem + "_fit.png")).string();
                plot_fit_with_gnuplot(png_path, result.equation, points, curve);
                logger << "Plot written to " << png_path << std::endl;
            }
        }
    } else if (params.plot) {
        std::cerr << "Warning: --plot は --output と併用してください．" << std::endl;
    }

    return result.success ? 0 : 2;
}
