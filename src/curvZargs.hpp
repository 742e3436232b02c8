#ifndef CURVZARGS_HPP
#define CURVZARGS_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "curvZtypes.hpp"

// ProgramOptions 構造体の定義
struct ProgramOptions {
    EquationKind kind = EquationKind::Linear;
    bool kind_specified = false;
    std::string input_filename;
    std::string points_text;       // --points "x,y x,y ..."
    bool use_fractions = true;     // --decimal で false
    long long time_budget_ms = 2000;
    bool enable_text_log_output = false;
    std::string output_dir_final;
    std::string output_basename = "curvZfit";
    bool plot = false;
    bool verbose = false;
    bool noconsole = false;
};

// ヘルパー関数: 文字列を整数に変換 (エラーチェック付き)
bool string_to_long(const std::string& s, long long& value);

void print_help(const char* prog_name);
void print_version();

// 引数を解析し、ProgramOptions 構造体に設定する関数
// 成功した場合は true、ヘルプ/バージョン表示やエラーの場合は false を返す
bool parse_arguments(int argc, char* argv[], ProgramOptions& params);

// パース後にオプションを最終処理する関数 (出力ディレクトリの作成)
void post_process_options(ProgramOptions& params);

#endif // CURVZARGS_HPP
