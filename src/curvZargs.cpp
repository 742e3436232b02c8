#include "curvZargs.hpp"
#include <iostream> // For std::cerr
#include <filesystem> // For directory creation
#include <string>
#include <stdexcept>  // For std::invalid_argument, std::out_of_range

bool string_to_long(const std::string& s, long long& value) {
    try {
        size_t processed_chars;
        value = std::stoll(s, &processed_chars);
        return processed_chars == s.length();
    } catch (const std::invalid_argument&) {
        std::cerr << "エラー: 無効な整数形式です: " << s << std::endl;
        return false;
    } catch (const std::out_of_range&) {
        std::cerr << "エラー: 整数が範囲外です: " << s << std::endl;
        return false;
    }
}

void print_help(const char* prog_name) {
    std::cout << "curvZfit:" << std::endl;
    std::cout << ">> 与えられた点列から曲線の方程式を求めるツール．" << std::endl;
    std::cout << ">> 厳密解 (linear, quadratic, cubic, circle, ellipse, conic) と近似解 (sine, log, exponential, ellipse-approx) に対応する．" << std::endl;
    std::cout << "" << std::endl;
    std::cout << "使用法: " << prog_name << " --type <kind> (--input <file> | --points \"x,y x,y ...\") [オプション]" << std::endl;
    std::cout << "オプション:" << std::endl;
    std::cout << "    --type <kind>         方程式の種類 (必須): linear, quadratic, cubic, circle, ellipse, conic," << std::endl;
    std::cout << "                          sine, log, exponential, ellipse-approx" << std::endl;
    std::cout << "    --input <file>        点列ファイル (1 行 1 点: x,y / x y / x<TAB>y，# 以降はコメント)" << std::endl;
    std::cout << "    --points <list>       点列を直接指定 (例: --points \"0,1 1,3 2,5\"，; 区切りも可)" << std::endl;
    std::cout << "    --decimal             係数を分数ではなく小数で表示" << std::endl;
    std::cout << "    --budget <ms>         近似フィットの時間予算 (ミリ秒，デフォルト: 2000)" << std::endl;
    std::cout << "    --output              レポート・曲線サンプル・ログを入力ファイル基準の 'curvZ/curvZfit' サブディレクトリに出力" << std::endl;
    std::cout << "    --plot                点列とフィット曲線を gnuplot で PNG に描画 (--output と併用)" << std::endl;
    std::cout << "    --verbose             近似フィットの各初期値の経過を表示" << std::endl;
    std::cout << "    --noconsole           コンソール出力を抑制 (--output 指定時はファイル出力)" << std::endl;
    std::cout << "    --help                このヘルプメッセージを表示して終了" << std::endl;
    std::cout << "    --version             バージョン情報を表示して終了" << std::endl;
    std::cout << "" << std::endl;
    std::cout << "終了コード: 0 成功，1 引数/入力エラー，2 フィット失敗" << std::endl;
}

void print_version() {
    std::cout << "curvZfit v1.0" << std::endl;
}

bool parse_arguments(int argc, char* argv[], ProgramOptions& params) {
    if (argc == 1) { // 引数なしの場合
        print_help(argv[0]);
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_help(argv[0]);
            return false; // ヘルプ表示後，処理を続行しない
        } else if (arg == "--version") {
            print_version();
            return false; // バージョン表示後，処理を続行しない
        } else if (arg == "--type") {
            if (i + 1 < argc) {
                std::string name = argv[++i];
                if (!parse_equation_kind(name, params.kind)) {
                    std::cerr << "エラー: 不明な方程式の種類です: " << name << std::endl;
                    return false;
                }
                params.kind_specified = true;
            } else {
                std::cerr << "エラー: --type には方程式の種類が必要です．" << std::endl;
                return false;
            }
        } else if (arg == "--input") {
            if (i + 1 < argc) {
                params.input_filename = argv[++i];
                if (!std::filesystem::exists(params.input_filename) || !std::filesystem::is_regular_file(params.input_filename)) {
                    std::cerr << "エラー: 入力ファイルが見つからないか，通常ファイルではありません: " << params.input_filename << std::endl;
                    return false;
                }
            } else {
                std::cerr << "エラー: --input にはファイル名が必要です．" << std::endl;
                return false;
            }
        } else if (arg == "--points") {
            if (i + 1 < argc) {
                params.points_text = argv[++i];
            } else {
                std::cerr << "エラー: --points には点列が必要です．" << std::endl;
                return false;
            }
        } else if (arg == "--decimal") {
            params.use_fractions = false;
        } else if (arg == "--budget") {
            if (i + 1 < argc) {
                if (!string_to_long(argv[++i], params.time_budget_ms)) return false;
                if (params.time_budget_ms <= 0) {
                    std::cerr << "エラー: --budget の値は正の整数である必要があります．" << std::endl;
                    return false;
                }
            } else {
                std::cerr << "エラー: --budget にはミリ秒数が必要です．" << std::endl;
                return false;
            }
        } else if (arg == "--output") {
            params.enable_text_log_output = true;
        } else if (arg == "--plot") {
            params.plot = true;
        } else if (arg == "--verbose") {
            params.verbose = true;
        } else if (arg == "--noconsole") {
            params.noconsole = true;
        } else {
            std::cerr << "エラー: 不明なオプションです: " << arg << std::endl;
            std::cout << "curvZfit --help を実行してオプションを確認してください．" << std::endl;
            return false;
        }
    }

    // 必須オプションのチェック
    if (!params.kind_specified) {
        std::cerr << "エラー: --type オプションは必須です．" << std::endl;
        return false;
    }
    if (params.input_filename.empty() && params.points_text.empty()) {
        std::cerr << "エラー: --input または --points のどちらかが必要です．" << std::endl;
        return false;
    }

    return true; // パース成功
}

void post_process_options(ProgramOptions& params) {
    if (!params.enable_text_log_output) {
        return;
    }

    namespace fs = std::filesystem;
    // --points のみの場合はカレントディレクトリ基準
    fs::path base_output_dir = fs::current_path();
    if (!params.input_filename.empty()) {
        fs::path absolute_input_path = fs::absolute(fs::path(params.input_filename));
        base_output_dir = absolute_input_path.parent_path();
        params.output_basename = absolute_input_path.stem().string();
    }

    params.output_dir_final = (base_output_dir / "curvZ" / "curvZfit").string();
    try {
        fs::create_directories(params.output_dir_final);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "エラー: 出力ディレクトリ '" << params.output_dir_final << "' の作成に失敗しました: " << e.what() << std::endl;
        params.enable_text_log_output = false; // Disable if dir creation fails
        params.output_dir_final.clear();
    }
}
