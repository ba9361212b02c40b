// @file MessageOutput.cppm
// @brief 診断メッセージの出力先。検証処理とCLIが共通で使用する。

module;
#include <iostream>
#include <mutex>
#include <string>

export module jvalid.common.message_output;

export namespace jvalid::common {

// @brief メッセージ出力用の基底クラス。
class MessageOutput {
public:
    virtual ~MessageOutput() = default;

    /// @brief 情報メッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void info(const std::string& msg) = 0;

    /// @brief 警告メッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void warning(const std::string& msg) = 0;

    /// @brief エラーメッセージを出力する。
    /// @param msg 出力するメッセージ。
    virtual void error(const std::string& msg) = 0;
};

// @brief 標準出力・標準エラーへのメッセージ出力
// @note 一括検証では複数スレッドから呼ばれるため、1行単位で排他する。
class StdoutMessageOutput : public MessageOutput {
public:
    void info(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << msg << std::endl;
    }

    void warning(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "Warning: " << msg << std::endl;
    }

    void error(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << msg << std::endl;
    }

private:
    std::mutex mutex_;  ///< 出力行の混在を防ぐミューテックス
};

// @brief エラーのみを標準エラーに出力する（-q 指定時、ライブラリ既定）
class QuietMessageOutput : public MessageOutput {
public:
    void info(const std::string&) override {}

    void warning(const std::string&) override {}

    void error(const std::string& msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << msg << std::endl;
    }

private:
    std::mutex mutex_;
};

}  // namespace jvalid::common
