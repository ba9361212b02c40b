// @file JsonToken.cppm
// @brief JSONトークンの定義。

module;
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

export module jvalid.core.json_token;

export import jvalid.core.source_buffer;

export namespace jvalid::core {

// ******************************************************************************** トークン型定義（内部実装詳細）
namespace json_token_detail {

// @brief 入力終端を示すタグ
struct EndOfInputTag {};

// @brief オブジェクト開始 '{' を示すタグ
struct ObjectOpenTag {};

// @brief オブジェクト終了 '}' を示すタグ
struct ObjectCloseTag {};

// @brief 配列開始 '[' を示すタグ
struct ArrayOpenTag {};

// @brief 配列終了 ']' を示すタグ
struct ArrayCloseTag {};

// @brief ':' を示すタグ
struct ColonTag {};

// @brief ',' を示すタグ
struct CommaTag {};

// @brief 文字列リテラル（エスケープ解除済みのUTF-8）
struct StrVal {
    std::string v;
};

// @brief 数値リテラル（入力中の表記そのまま）
struct NumVal {
    std::string text;
};

struct TrueTag {};
struct FalseTag {};
struct NullTag {};

}  // namespace json_token_detail

// @brief JSONトークンの種類を表す列挙型
// @note JsonTokenValueのalternativeと同じ順序で並べること
enum class JsonTokenType {
    EndOfInput,     ///< 入力終端
    ObjectOpen,     ///< '{'
    ObjectClose,    ///< '}'
    ArrayOpen,      ///< '['
    ArrayClose,     ///< ']'
    Colon,          ///< ':'
    Comma,          ///< ','
    String,         ///< 文字列リテラル
    Number,         ///< 数値リテラル
    True,           ///< true
    False,          ///< false
    Null            ///< null
};

// @brief JSONトークンのvariant表現
using JsonTokenValue =
    std::variant<json_token_detail::EndOfInputTag, json_token_detail::ObjectOpenTag,
                 json_token_detail::ObjectCloseTag, json_token_detail::ArrayOpenTag,
                 json_token_detail::ArrayCloseTag, json_token_detail::ColonTag,
                 json_token_detail::CommaTag, json_token_detail::StrVal, json_token_detail::NumVal,
                 json_token_detail::TrueTag, json_token_detail::FalseTag, json_token_detail::NullTag>;

// @brief JSONトークン（値と入力位置を保持）
struct JsonToken {
    JsonTokenValue value{};      ///< トークンの種類と値
    SourcePosition position{};   ///< 入力内での開始位置

    JsonToken() = default;
    JsonToken(const JsonToken&) = default;
    JsonToken(JsonToken&&) = default;
    JsonToken& operator=(const JsonToken&) = default;
    JsonToken& operator=(JsonToken&&) = default;

    template <typename T>
    JsonToken(T&& v, SourcePosition pos)
        : value(std::forward<T>(v)), position(pos) {}

    /// @brief トークンの種類を返す。
    JsonTokenType type() const {
        // JsonTokenValueとJsonTokenTypeの列挙値の順序が一致していることを前提とする
        return static_cast<JsonTokenType>(value.index());
    }

    /// @brief 文字列・数値リテラルのテキストを返す。それ以外は空文字列。
    std::string text() const {
        if (const auto* s = std::get_if<json_token_detail::StrVal>(&value)) {
            return s->v;
        }
        if (const auto* n = std::get_if<json_token_detail::NumVal>(&value)) {
            return n->text;
        }
        return {};
    }
};

/// @brief トークン種別の表示名を返す。
const char* tokenTypeName(JsonTokenType type) {
    switch (type) {
    case JsonTokenType::EndOfInput:  return "EndOfInput";
    case JsonTokenType::ObjectOpen:  return "ObjectOpen";
    case JsonTokenType::ObjectClose: return "ObjectClose";
    case JsonTokenType::ArrayOpen:   return "ArrayOpen";
    case JsonTokenType::ArrayClose:  return "ArrayClose";
    case JsonTokenType::Colon:       return "Colon";
    case JsonTokenType::Comma:       return "Comma";
    case JsonTokenType::String:      return "String";
    case JsonTokenType::Number:      return "Number";
    case JsonTokenType::True:        return "True";
    case JsonTokenType::False:       return "False";
    case JsonTokenType::Null:        return "Null";
    }
    return "Unknown";
}

/// @brief エラーメッセージ用にトークンを説明する文字列を返す。
/// @note 例: "'}'", "string \"abc\"", "number 12", "end of input"
std::string describeToken(const JsonToken& token) {
    switch (token.type()) {
    case JsonTokenType::EndOfInput:  return "end of input";
    case JsonTokenType::ObjectOpen:  return "'{'";
    case JsonTokenType::ObjectClose: return "'}'";
    case JsonTokenType::ArrayOpen:   return "'['";
    case JsonTokenType::ArrayClose:  return "']'";
    case JsonTokenType::Colon:       return "':'";
    case JsonTokenType::Comma:       return "','";
    case JsonTokenType::String: {
        // 長い文字列は先頭のみ表示する（UTF-8の文字境界で切る）
        constexpr std::size_t maxShown = 32;
        std::string s = token.text();
        if (s.size() > maxShown) {
            std::size_t cut = maxShown;
            while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
                --cut;  // 継続バイトの途中では切らない
            }
            s = s.substr(0, cut) + "...";
        }
        return "string \"" + s + "\"";
    }
    case JsonTokenType::Number:      return "number " + token.text();
    case JsonTokenType::True:        return "'true'";
    case JsonTokenType::False:       return "'false'";
    case JsonTokenType::Null:        return "'null'";
    }
    return "unknown token";
}

}  // namespace jvalid::core
