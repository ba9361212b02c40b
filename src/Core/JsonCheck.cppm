// @file JsonCheck.cppm
// @brief JSONテキスト検証の統合インターフェース。トークナイザーとバリデーターを組み立てて結果を返す。

module;
#include <ostream>
#include <string>
#include <utility>

export module jvalid.core.json_check;

export import jvalid.core.json_validator;
export import jvalid.core.json_tokenizer;
export import jvalid.core.validator_options;
import jvalid.common.message_output;

export namespace jvalid::core {

/// @brief JSONテキストを検証する（コア関数）。
/// @param text 入力テキスト全体（UTF-8）。
/// @param options 検証設定。
/// @param messageOutput 警告メッセージの出力先。
/// @return Valid または Invalid(最初に見つかったエラー)。
/// @note 設定値が不正な場合はstd::invalid_argumentを送出する。
ValidationResult validateJson(std::string text, const ValidatorOptions& options,
                              common::MessageOutput& messageOutput) {
    options.check();

    SourceBuffer inputSource(std::move(text));
    JsonTokenizer<SourceBuffer> tokenizer(inputSource, messageOutput, options.allowByteOrderMark);
    TokenCursor<JsonTokenizer<SourceBuffer>> cursor(tokenizer);
    JsonValidator<JsonTokenizer<SourceBuffer>> validator(cursor, options);

    try {
        validator.validateDocument();
    } catch (const LexError& e) {
        return ValidationResult::invalid(ValidationError::fromLexError(e));
    } catch (const GrammarError& e) {
        return ValidationResult::invalid(e.error());
    }
    return ValidationResult::valid();
}

/// @brief JSONテキストを検証する（警告は出力しない）。
/// @param text 入力テキスト全体（UTF-8）。
/// @param options 検証設定。
ValidationResult validateJson(std::string text, const ValidatorOptions& options = {}) {
    common::QuietMessageOutput quietOutput;
    return validateJson(std::move(text), options, quietOutput);
}

/// @brief トークン列を1行1トークンで書き出す。
/// @param text 入力テキスト全体（UTF-8）。
/// @param os 出力先のストリーム。
/// @param options 検証設定（allowByteOrderMarkのみ使用）。
/// @param messageOutput 警告メッセージの出力先。
/// @return 字句エラーがなければValid。文法は検証しない。
/// @note 出力例: "1:1 ObjectOpen" / "1:2 String \"a\""
ValidationResult dumpTokens(std::string text, std::ostream& os, const ValidatorOptions& options,
                            common::MessageOutput& messageOutput) {
    SourceBuffer inputSource(std::move(text));
    JsonTokenizer<SourceBuffer> tokenizer(inputSource, messageOutput, options.allowByteOrderMark);
    try {
        for (;;) {
            const JsonToken token = tokenizer.nextToken();
            os << formatPosition(token.position) << ' ' << tokenTypeName(token.type());
            switch (token.type()) {
            case JsonTokenType::String:
                os << " \"" << token.text() << '"';
                break;
            case JsonTokenType::Number:
                os << ' ' << token.text();
                break;
            default:
                break;
            }
            os << '\n';
            if (token.type() == JsonTokenType::EndOfInput) {
                break;
            }
        }
    } catch (const LexError& e) {
        return ValidationResult::invalid(ValidationError::fromLexError(e));
    }
    return ValidationResult::valid();
}

}  // namespace jvalid::core
