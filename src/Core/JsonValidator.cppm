// @file JsonValidator.cppm
// @brief JSON文法の再帰下降バリデーター。トークン列がJSON値1つと入力終端からなることを確認する。

module;
#include <cstddef>
#include <string>

export module jvalid.core.json_validator;

export import jvalid.core.token_cursor;
export import jvalid.core.validation_error;
export import jvalid.core.validator_options;

export namespace jvalid::core {

// ******************************************************************************** JsonValidator
// @brief JSONバリデーター（文法規則ごとに1関数の再帰下降）
// @note value := object | array | string | number | true | false | null
//       object := '{' ( member (',' member)* )? '}'   member := string ':' value
//       array  := '[' ( value (',' value)* )? ']'
template <TokenSource Source>
class JsonValidator {
    // ******************************************************************************** 構築
public:
    // @brief コンストラクタ
    // @param cursor トークンカーソルの参照
    // @param options 検証設定（maxDepthを使用）
    JsonValidator(TokenCursor<Source>& cursor, const ValidatorOptions& options)
        : cursor_(cursor), maxDepth_(options.maxDepth) {}

    // ******************************************************************************** 検証
public:
    // @brief 入力全体を検証する
    // @note 最初のエラーでLexErrorまたはGrammarErrorを送出する
    void validateDocument() {
        depth_ = 0;
        validateValue();
        expectEndOfInput();
    }

private:
    // @brief value を検証
    void validateValue() {
        const JsonToken& t = cursor_.peek();
        switch (t.type()) {
            case JsonTokenType::ObjectOpen:
                validateObject();
                return;
            case JsonTokenType::ArrayOpen:
                validateArray();
                return;
            case JsonTokenType::String:
            case JsonTokenType::Number:
            case JsonTokenType::True:
            case JsonTokenType::False:
            case JsonTokenType::Null:
                cursor_.take();  // プリミティブは1トークンで完結
                return;
            default:
                expectedError("value", t);
        }
    }

    // @brief object を検証（'{' が次のトークンであること）
    void validateObject() {
        enterNested(cursor_.take());
        if (cursor_.nextIs(JsonTokenType::ObjectClose)) {
            cursor_.take();  // 空オブジェクト
            leaveNested();
            return;
        }
        for (;;) {
            validateMember();

            const JsonToken& t = cursor_.peek();
            if (t.type() == JsonTokenType::ObjectClose) {
                cursor_.take();
                break;
            }
            if (t.type() != JsonTokenType::Comma) {
                expectedError("',' or '}'", t);
            }
            cursor_.take();
            // 末尾カンマ
            if (cursor_.nextIs(JsonTokenType::ObjectClose)) {
                trailingCommaError(cursor_.peek());
            }
        }
        leaveNested();
    }

    // @brief member := string ':' value を検証
    void validateMember() {
        const JsonToken& key = cursor_.peek();
        if (key.type() == JsonTokenType::EndOfInput) {
            unexpectedEof("object key", key);
        }
        if (key.type() != JsonTokenType::String) {
            throw GrammarError(ValidationError{
                ValidationErrorKind::ExpectedString, key.position, "string key", describeToken(key), {}});
        }
        cursor_.take();

        const JsonToken& colon = cursor_.peek();
        if (colon.type() != JsonTokenType::Colon) {
            expectedError("':'", colon);
        }
        cursor_.take();

        validateValue();
    }

    // @brief array を検証（'[' が次のトークンであること）
    void validateArray() {
        enterNested(cursor_.take());
        if (cursor_.nextIs(JsonTokenType::ArrayClose)) {
            cursor_.take();  // 空配列
            leaveNested();
            return;
        }
        for (;;) {
            validateValue();

            const JsonToken& t = cursor_.peek();
            if (t.type() == JsonTokenType::ArrayClose) {
                cursor_.take();
                break;
            }
            if (t.type() != JsonTokenType::Comma) {
                expectedError("',' or ']'", t);
            }
            cursor_.take();
            // 末尾カンマ
            if (cursor_.nextIs(JsonTokenType::ArrayClose)) {
                trailingCommaError(cursor_.peek());
            }
        }
        leaveNested();
    }

    // @brief ルート値の後が入力終端であることを確認
    // @note ルート値の後ろは字句的に不正な内容もTrailingDataとして扱う
    void expectEndOfInput() {
        try {
            const JsonToken& t = cursor_.peek();
            if (t.type() != JsonTokenType::EndOfInput) {
                throw GrammarError(ValidationError{
                    ValidationErrorKind::TrailingData, t.position, "end of input", describeToken(t), {}});
            }
        } catch (const LexError& e) {
            throw GrammarError(ValidationError{
                ValidationErrorKind::TrailingData, e.position(), "end of input", {}, e.detail()});
        }
    }

    // ******************************************************************************** ネスト深さ
private:
    void enterNested(const JsonToken& open) {
        if (++depth_ > maxDepth_) {
            throw GrammarError(ValidationError{
                ValidationErrorKind::TooDeep, open.position, {}, {},
                "nesting depth exceeds limit of " + std::to_string(maxDepth_)});
        }
    }

    void leaveNested() { --depth_; }

    // ******************************************************************************** エラー送出
private:
    // @brief 期待と異なるトークン。入力終端ならUnexpectedEof、それ以外はExpectedToken。
    [[noreturn]] static void expectedError(const char* expected, const JsonToken& found) {
        if (found.type() == JsonTokenType::EndOfInput) {
            unexpectedEof(expected, found);
        }
        throw GrammarError(ValidationError{
            ValidationErrorKind::ExpectedToken, found.position, expected, describeToken(found), {}});
    }

    [[noreturn]] static void unexpectedEof(const char* expected, const JsonToken& eof) {
        throw GrammarError(ValidationError{
            ValidationErrorKind::UnexpectedEof, eof.position, expected, "end of input", {}});
    }

    // @brief カンマ直後の閉じ括弧
    [[noreturn]] static void trailingCommaError(const JsonToken& closer) {
        throw GrammarError(ValidationError{
            ValidationErrorKind::UnexpectedToken, closer.position, {}, describeToken(closer),
            "trailing comma before closing bracket"});
    }

    // ******************************************************************************** メンバー変数
private:
    TokenCursor<Source>& cursor_;  ///< トークンカーソルの参照
    std::size_t maxDepth_;         ///< 最大ネスト深さ
    std::size_t depth_ = 0;        ///< 現在のネスト深さ
};

}  // namespace jvalid::core
