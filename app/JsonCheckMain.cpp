// @file JsonCheckMain.cpp
// @brief jvalid コマンド。JSONファイルを検証し、結果を終了コードで返す。

import jvalid.core.json_check;
import jvalid.io.json_check_io;
import jvalid.common.message_output;
import jvalid.common.thread_pool;
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace jvalid;

namespace {

constexpr int exitValid = 0;        ///< すべての入力が有効
constexpr int exitFailure = 1;      ///< 引数エラー・入出力エラー
constexpr int exitInvalid = 2;      ///< 無効なJSONが1つ以上あった

// コマンドラインオプション
struct CheckOptions {
    std::vector<std::string> inputs;      ///< 入力名（"-"は標準入力）
    bool quiet = false;                   ///< 終了コードのみ（エラー以外は出力しない）
    bool dumpTokens = false;              ///< トークン列を出力する
    std::size_t jobs = 1;                 ///< 並列数
    core::ValidatorOptions validator{};   ///< 検証設定
};

// 使い方を出力する
void printUsage() {
    std::cout << "Usage: jvalid [options] [file|-]...\n"
              << "Options:\n"
              << "  -q, --quiet           Only set exit code (errors still go to stderr)\n"
              << "  -d, --max-depth N     Maximum nesting depth (default "
              << core::ValidatorOptions::defaultMaxDepth << ", at most "
              << core::ValidatorOptions::maxDepthCeiling << ")\n"
              << "  -j, --jobs N          Validate files in parallel with N threads (0 = all cores)\n"
              << "  -t, --tokens          Print the token stream of each input\n"
              << "      --allow-bom       Skip a UTF-8 byte order mark at the start of input\n"
              << "  -h, --help            Show this help\n"
              << "If no file is specified, reads from stdin.\n"
              << "Exit status: 0 valid, 2 invalid JSON, 1 usage or I/O error.\n";
}

// 数値引数を解釈する
std::size_t parseCount(std::string_view option, std::string_view value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string_view::npos) {
        throw std::invalid_argument("Invalid value for " + std::string{option} + ": '" +
                                    std::string{value} + "'");
    }
    try {
        return static_cast<std::size_t>(std::stoull(std::string{value}));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value for " + std::string{option} + " is out of range");
    }
}

// コマンドライン引数を解釈する
CheckOptions parseArgs(int argc, char* argv[]) {
    CheckOptions opts;
    bool endOfOptions = false;
    for (int i = 1; i < argc; ++i) {
        std::string_view const arg{argv[i]};
        // 値を取るオプション（"-d N" / "--max-depth=N" の両形式）
        auto optionValue = [&](std::string_view shortName, std::string_view longName,
                               std::string_view& value) {
            if (arg == shortName || arg == longName) {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + std::string{arg});
                }
                value = argv[++i];
                return true;
            }
            if (arg.size() > longName.size() && arg.substr(0, longName.size()) == longName &&
                arg[longName.size()] == '=') {
                value = arg.substr(longName.size() + 1);
                return true;
            }
            return false;
        };

        std::string_view value;
        if (endOfOptions || arg == io::stdinName || arg.empty() || arg.front() != '-') {
            opts.inputs.emplace_back(arg);
        } else if (arg == "--") {
            endOfOptions = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            std::exit(EXIT_SUCCESS);
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-t" || arg == "--tokens") {
            opts.dumpTokens = true;
        } else if (arg == "--allow-bom") {
            opts.validator.allowByteOrderMark = true;
        } else if (optionValue("-d", "--max-depth", value)) {
            opts.validator.maxDepth = parseCount("--max-depth", value);
        } else if (optionValue("-j", "--jobs", value)) {
            opts.jobs = parseCount("--jobs", value);
        } else {
            throw std::invalid_argument("Unknown option: " + std::string{arg});
        }
    }

    if (opts.inputs.empty()) {
        opts.inputs.emplace_back(io::stdinName);
    }
    std::size_t stdinCount = 0;
    for (const auto& input : opts.inputs) {
        if (input == io::stdinName) {
            ++stdinCount;
        }
    }
    if (stdinCount > 1) {
        throw std::invalid_argument("Standard input ('-') may be given only once");
    }
    if (opts.jobs == 0) {
        opts.jobs = common::ThreadPool::defaultThreadCount();
    }
    opts.validator.check();
    return opts;
}

// 診断メッセージ用の入力名
std::string displayName(const std::string& input) {
    return input == io::stdinName ? "<stdin>" : input;
}

// 1入力分の結果を終了コードに反映する
// @note 入出力エラーは無効なJSONより優先する
int mergeStatus(int status, const io::FileVerdict& verdict) {
    if (!verdict.result) {
        return exitFailure;
    }
    if (!verdict.result->isValid() && status == exitValid) {
        return exitInvalid;
    }
    return status;
}

// 1入力分の結果を報告する
void reportVerdict(const io::FileVerdict& verdict, common::MessageOutput& out) {
    const std::string name = displayName(verdict.inputName);
    if (!verdict.result) {
        out.error(name + ": error: " + verdict.ioError);
    } else if (verdict.result->isValid()) {
        out.info(name + ": valid");
    } else {
        out.error(name + ":" + verdict.result->error().describe());
    }
}

// トークン列を出力しながら1入力ずつ検証する
int dumpAndValidate(const CheckOptions& opts, common::MessageOutput& out) {
    int status = exitValid;
    for (const auto& input : opts.inputs) {
        std::cout << "# " << displayName(input) << "\n";
        auto const verdict = io::checkInput(input, opts.validator, out, &std::cout);
        reportVerdict(verdict, out);
        status = mergeStatus(status, verdict);
    }
    return status;
}

}  // namespace

int main(int argc, char* argv[])
try {
    auto const opts = parseArgs(argc, argv);
    std::unique_ptr<common::MessageOutput> out;
    if (opts.quiet) {
        out = std::make_unique<common::QuietMessageOutput>();
    } else {
        out = std::make_unique<common::StdoutMessageOutput>();
    }

    if (opts.dumpTokens) {
        return dumpAndValidate(opts, *out);
    }

    int status = exitValid;
    for (const auto& verdict : io::validateJsonFiles(opts.inputs, opts.validator, *out, opts.jobs)) {
        reportVerdict(verdict, *out);
        status = mergeStatus(status, verdict);
    }
    return status;
} catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return exitFailure;
}
