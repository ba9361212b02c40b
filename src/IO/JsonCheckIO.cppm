// @file JsonCheckIO.cppm
// @brief ファイル・ストリームからの読み込みと、複数ファイルの一括検証。

module;
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

export module jvalid.io.json_check_io;

import jvalid.core.json_check;
import jvalid.common.message_output;
import jvalid.common.thread_pool;

namespace jvalid::io {

/// @brief 標準入力を表す入力名。
export inline constexpr const char* stdinName = "-";

/// @brief ストリームの内容をすべて読み込む。
/// @param inputStream 入力元のストリーム。
/// @return 読み込んだバイト列。
export std::string readSourceStream(std::istream& inputStream) {
    std::ostringstream oss;
    oss << inputStream.rdbuf();

    // 読み込み失敗をチェック（空入力ではfailbitが立つためbadのみを見る）
    if (inputStream.bad()) {
        throw std::runtime_error("readSourceStream: Failed to read from input stream");
    }
    return oss.str();
}

/// @brief ファイルの内容をすべて読み込む。
/// @param filename 入力元のファイル名。
/// @return 読み込んだバイト列。
export std::string readSourceFile(const std::string& filename) {
    // ディレクトリは空の入力ではなく読み込みエラー
    std::error_code ec;
    if (std::filesystem::is_directory(filename, ec)) {
        throw std::runtime_error("readSourceFile: " + filename + " is a directory");
    }
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("readSourceFile: Cannot open file " + filename);
    }

    // すでにファイルを開いているので、seekg+tellgでサイズを得る。
    ifs.seekg(0, std::ios::end);
    std::streamsize fileSize = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    if (fileSize < 0) {
        // シークできない入力（FIFOなど）は逐次読み込み
        ifs.clear();
        return readSourceStream(ifs);
    }

    std::string buffer(static_cast<std::size_t>(fileSize), '\0');
    ifs.read(buffer.data(), fileSize);
    if (ifs.bad()) {
        throw std::runtime_error("readSourceFile: Error reading from file " + filename);
    }
    buffer.resize(static_cast<std::size_t>(ifs.gcount()));
    return buffer;
}

/// @brief 入力名（ファイル名または "-"）の内容を読み込む。
export std::string readSourceInput(const std::string& inputName) {
    if (inputName == stdinName) {
        return readSourceStream(std::cin);
    }
    return readSourceFile(inputName);
}

/// @brief ストリームの内容をJSONとして検証する。
export core::ValidationResult validateJsonStream(std::istream& inputStream,
    const core::ValidatorOptions& options, common::MessageOutput& messageOutput) {
    return core::validateJson(readSourceStream(inputStream), options, messageOutput);
}

/// @brief ファイルの内容をJSONとして検証する。
/// @note ファイルを読めない場合はstd::runtime_errorを送出する（検証結果ではない）。
export core::ValidationResult validateJsonFile(const std::string& filename,
    const core::ValidatorOptions& options, common::MessageOutput& messageOutput) {
    return core::validateJson(readSourceFile(filename), options, messageOutput);
}

/// @brief 一括検証における1入力分の結果。
export struct FileVerdict {
    std::string inputName;                        ///< 入力名
    std::optional<core::ValidationResult> result; ///< 検証結果（読み込みに失敗した場合は空）
    std::string ioError;                          ///< 読み込み失敗時のメッセージ

    /// @brief 読み込めて、かつ有効なJSONだったか。
    bool isValid() const { return result.has_value() && result->isValid(); }
};

/// @brief 1入力を読み込んで検証する。読み込み失敗は結果に記録する。
/// @param inputName 入力名（ファイル名または "-"）。
/// @param options 検証設定。
/// @param messageOutput 警告メッセージの出力先。
/// @param tokenOutput nullでなければ、検証の前にトークン列を書き出す。
/// @note トークン列の出力は表示のみで、結果は常にvalidateJson()の判定。
export FileVerdict checkInput(const std::string& inputName, const core::ValidatorOptions& options,
    common::MessageOutput& messageOutput, std::ostream* tokenOutput = nullptr) {
    FileVerdict verdict;
    verdict.inputName = inputName;
    std::string text;
    try {
        text = readSourceInput(inputName);
    } catch (const std::runtime_error& e) {
        verdict.ioError = e.what();
        return verdict;
    }
    if (tokenOutput != nullptr) {
        // 警告は検証側で1回だけ出す
        common::QuietMessageOutput dumpOutput;
        static_cast<void>(core::dumpTokens(text, *tokenOutput, options, dumpOutput));
    }
    verdict.result = core::validateJson(std::move(text), options, messageOutput);
    return verdict;
}

/// @brief 複数の入力を検証する。結果は入力と同じ順序で返す。
/// @param inputNames 入力名の一覧（"-"は標準入力、高々1つ）。
/// @param options 検証設定。
/// @param messageOutput 警告メッセージの出力先（複数スレッドから呼ばれる）。
/// @param jobs 並列数。1以下なら呼び出しスレッドで逐次実行する。
/// @note 各入力の検証は状態を共有しないため、同期なしで並列実行できる。
export std::vector<FileVerdict> validateJsonFiles(const std::vector<std::string>& inputNames,
    const core::ValidatorOptions& options, common::MessageOutput& messageOutput, std::size_t jobs) {
    options.check();

    if (jobs <= 1 || inputNames.size() <= 1) {
        std::vector<FileVerdict> verdicts;
        verdicts.reserve(inputNames.size());
        for (const auto& inputName : inputNames) {
            verdicts.push_back(checkInput(inputName, options, messageOutput));
        }
        return verdicts;
    }

    common::ThreadPool threadPool(std::min(jobs, inputNames.size()));
    return threadPool.map(inputNames, [&options, &messageOutput](const std::string& inputName) {
        return checkInput(inputName, options, messageOutput);
    });
}

}  // namespace jvalid::io
