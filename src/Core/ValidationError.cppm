// @file ValidationError.cppm
// @brief 字句エラー・文法エラーの種別と、検証結果の定義。

module;
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

export module jvalid.core.validation_error;

export import jvalid.core.source_buffer;

export namespace jvalid::core {

// @brief 字句解析（トークナイザー）のエラー種別
enum class LexErrorKind {
    UnexpectedCharacter,  ///< 文字列・数値の外に現れた不正な文字
    InvalidString,        ///< 閉じていない文字列、不正なエスケープ、生の制御文字
    InvalidNumber,        ///< 数値の書式違反（先頭ゼロ、桁のない小数部・指数部など）
    InvalidEncoding       ///< 不正なUTF-8バイト列
};

// @brief 呼び出し元へ返すエラー種別。字句エラーも同名の種別に昇格する。
enum class ValidationErrorKind {
    UnexpectedCharacter,
    InvalidString,
    InvalidNumber,
    InvalidEncoding,
    UnexpectedToken,      ///< その位置に現れてはならないトークン（末尾カンマ直後の閉じ括弧）
    ExpectedToken,        ///< 期待したトークンと異なるトークン
    ExpectedString,       ///< オブジェクトのキーが文字列でない
    UnexpectedEof,        ///< 値・記号が必要な位置で入力が終わった
    TrailingData,         ///< ルート値の後に余分な入力がある
    TooDeep               ///< ネストが上限を超えた
};

/// @brief エラー種別の表示名を返す。
const char* errorKindName(ValidationErrorKind kind) {
    switch (kind) {
    case ValidationErrorKind::UnexpectedCharacter: return "UnexpectedCharacter";
    case ValidationErrorKind::InvalidString:       return "InvalidString";
    case ValidationErrorKind::InvalidNumber:       return "InvalidNumber";
    case ValidationErrorKind::InvalidEncoding:     return "InvalidEncoding";
    case ValidationErrorKind::UnexpectedToken:     return "UnexpectedToken";
    case ValidationErrorKind::ExpectedToken:       return "ExpectedToken";
    case ValidationErrorKind::ExpectedString:      return "ExpectedString";
    case ValidationErrorKind::UnexpectedEof:       return "UnexpectedEof";
    case ValidationErrorKind::TrailingData:        return "TrailingData";
    case ValidationErrorKind::TooDeep:             return "TooDeep";
    }
    return "Unknown";
}

/// @brief 字句エラー種別を検証エラー種別に昇格する。
constexpr ValidationErrorKind promote(LexErrorKind kind) {
    switch (kind) {
    case LexErrorKind::UnexpectedCharacter: return ValidationErrorKind::UnexpectedCharacter;
    case LexErrorKind::InvalidString:       return ValidationErrorKind::InvalidString;
    case LexErrorKind::InvalidNumber:       return ValidationErrorKind::InvalidNumber;
    case LexErrorKind::InvalidEncoding:     return ValidationErrorKind::InvalidEncoding;
    }
    return ValidationErrorKind::UnexpectedCharacter;
}

/// @brief 位置を "line:column" 形式の文字列にする。
std::string formatPosition(const SourcePosition& pos) {
    return std::to_string(pos.line) + ":" + std::to_string(pos.column);
}

// @brief トークナイザーが送出する字句エラー
class LexError : public std::runtime_error {
public:
    LexError(LexErrorKind kind, SourcePosition position, const std::string& detail)
        : std::runtime_error("JSON lex error at " + formatPosition(position) + ": " + detail),
          kind_(kind), position_(position), detail_(detail) {}

    LexErrorKind kind() const { return kind_; }
    const SourcePosition& position() const { return position_; }
    const std::string& detail() const { return detail_; }

private:
    LexErrorKind kind_;
    SourcePosition position_;
    std::string detail_;
};

/// @brief 呼び出し元に返す検証エラー（1回の検証で高々1つ）。
struct ValidationError {
    ValidationErrorKind kind{};   ///< エラー種別
    SourcePosition position{};    ///< 問題の文字・トークンの位置
    std::string expected;         ///< 期待したもの（ExpectedTokenなど。なければ空）
    std::string found;            ///< 実際に見つかったもの（なければ空）
    std::string detail;           ///< 補足説明

    /// @brief 字句エラーから検証エラーを作る。
    static ValidationError fromLexError(const LexError& e) {
        return ValidationError{promote(e.kind()), e.position(), {}, {}, e.detail()};
    }

    /// @brief 人が読むための1行の説明を返す。
    /// @note 例: "3:7: ExpectedToken: expected ':' but found number 1"
    std::string describe() const {
        std::string text = formatPosition(position) + ": " + errorKindName(kind);
        if (!expected.empty()) {
            text += ": expected " + expected;
            if (!found.empty()) {
                text += " but found " + found;
            }
        } else if (!found.empty()) {
            text += ": unexpected " + found;
        }
        if (!detail.empty()) {
            text += " (" + detail + ")";
        }
        return text;
    }
};

// @brief 文法エラー（バリデーターが送出する）
class GrammarError : public std::runtime_error {
public:
    explicit GrammarError(ValidationError error)
        : std::runtime_error("JSON grammar error at " + error.describe()),
          error_(std::move(error)) {}

    const ValidationError& error() const { return error_; }

private:
    ValidationError error_;
};

/// @brief 検証結果。Valid または Invalid(ValidationError)。
class ValidationResult {
public:
    static ValidationResult valid() { return ValidationResult{}; }

    static ValidationResult invalid(ValidationError error) {
        ValidationResult result;
        result.error_ = std::move(error);
        return result;
    }

    bool isValid() const { return !error_.has_value(); }

    explicit operator bool() const { return isValid(); }

    /// @brief エラー内容を返す。isValid()がfalseの場合のみ呼ぶこと。
    const ValidationError& error() const { return error_.value(); }

private:
    ValidationResult() = default;

    std::optional<ValidationError> error_;  ///< 無効の場合のみ値を持つ
};

}  // namespace jvalid::core
