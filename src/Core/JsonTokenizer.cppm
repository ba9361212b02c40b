// @file JsonTokenizer.cppm
// @brief JSON（RFC 8259）トークナイザーの定義。入力から要求のたびに1トークンを生成する。

module;
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

// マクロ定義（数字の列挙）
#define CASE_PART_DIGITS19 \
    case '1': case '2': case '3': case '4': case '5': \
    case '6': case '7': case '8': case '9'
#define CASE_PART_DIGITS case '0': CASE_PART_DIGITS19

export module jvalid.core.json_tokenizer;

export import jvalid.core.json_token;
export import jvalid.core.validation_error;
import jvalid.common.message_output;
import jvalid.common.utf8;

export namespace jvalid::core {

// 入力文字列取得元のconcept
template <typename T>
concept InputSource = requires(T& t, const T& ct, std::size_t offset, std::size_t count) {
    { ct.peekAhead(offset) } -> std::same_as<char>;
    { ct.atEnd(offset) } -> std::same_as<bool>;
    { t.consume(count) } -> std::same_as<void>;
    { ct.location() } -> std::same_as<SourcePosition>;
    { ct.remaining() } -> std::same_as<std::string_view>;
    { t.rewind() } -> std::same_as<void>;
};

// ******************************************************************************** JsonTokenizer
// @brief JSONトークナイザー（入力文字列から1トークンずつ生成）
// @note 最初の不正な文字・エスケープでLexErrorを送出する。
template <InputSource Input>
class JsonTokenizer {
    // ******************************************************************************** 空白文字のスキップ
private:
    // @brief 空白文字をスキップ
    // @note RFC 8259の空白（space, tab, LF, CR）のみ。それ以外は意味のある文字として扱う。
    void skipWhitespace() {
        while (!inputSource_.atEnd()) {
            switch (peek()) {
                case ' ':
                case '\t':
                case '\n':
                case '\r':
                    consume();
                    continue;
                default:
                    return;
            }
        }
    }

    // @brief 入力先頭のBOMを読み飛ばす（許可されている場合のみ）
    void skipByteOrderMark() {
        if (allowByteOrderMark_ && matchUtf8Bytes(0, 0xEF, 0xBB) &&
            static_cast<unsigned char>(peekAhead(2)) == 0xBF) {
            warningOutput_.warning("Byte order mark at start of input ignored");
            consume(3);
        }
    }

    // ******************************************************************************** 文字列の解析
private:
    // @brief 文字列をパース
    // @param tokenPos 開始引用符の位置
    // @return エスケープを解除した文字列
    std::string parseString(const SourcePosition& tokenPos) {
        std::string result;
        consume(); // 開始引用符を消費

        for (;;) {
            if (inputSource_.atEnd()) {
                // 入力終端に到達（閉じ引用符なし）
                throw LexError(LexErrorKind::InvalidString, location(),
                               "unterminated string starting at " + formatPosition(tokenPos));
            }
            unsigned char c = static_cast<unsigned char>(peek());

            switch (c) {
            case '"':
                consume(); // 終了引用符を消費
                return result;
            case '\\':
                parseEscape(result);
                break;
            default:
                if (c < 0x20) {
                    // エスケープされていない制御文字
                    throw LexError(LexErrorKind::InvalidString, location(),
                                   "unescaped control character " + formatByte(c) + " in string");
                }
                if (c < 0x80) {
                    result += static_cast<char>(c);
                    consume();
                } else {
                    consumeUtf8Char(result);
                }
                break;
            }
        }
    }

    // @brief エスケープシーケンスを解析して結果に追加
    void parseEscape(std::string& result) {
        const SourcePosition escapePos = location();
        consume();  // '\'を消費
        if (inputSource_.atEnd()) {
            throw LexError(LexErrorKind::InvalidString, location(),
                           "unterminated escape sequence");
        }
        const char next = peek();
        switch (next) {
            case '"':  result += '"'; break;
            case '\\': result += '\\'; break;
            case '/':  result += '/'; break;
            case 'b':  result += '\b'; break;
            case 'f':  result += '\f'; break;
            case 'n':  result += '\n'; break;
            case 'r':  result += '\r'; break;
            case 't':  result += '\t'; break;
            case 'u':
                consume();  // 'u'
                parseUnicodeEscape(result, escapePos);
                return;
            default:
                throw LexError(LexErrorKind::InvalidString, location(),
                               std::string("invalid escape sequence '\\") + describeChar(next) + "'");
        }
        consume();
    }

    // @brief \uXXXX エスケープを解析して結果に追加
    // @note サロゲートペアは1コードポイントに合成する。対にならないサロゲートは
    //       文法上は有効なのでU+FFFDに置換して警告する。
    void parseUnicodeEscape(std::string& result, const SourcePosition& escapePos) {
        char32_t codePoint = parseHexEscape();
        if (!common::isSurrogate(codePoint)) {
            common::appendUtf8(result, codePoint);
            return;
        }
        if (common::isHighSurrogate(codePoint) && peek() == '\\' && peekAhead(1) == 'u') {
            const SourcePosition secondPos = location();
            consume(2);  // "\u"
            char32_t low = parseHexEscape();
            if (common::isLowSurrogate(low)) {
                common::appendUtf8(result, common::combineSurrogates(codePoint, low));
                return;
            }
            warnLoneSurrogate(codePoint, escapePos);
            common::appendUtf8(result, common::replacementCharacter);
            if (common::isSurrogate(low)) {
                warnLoneSurrogate(low, secondPos);
                low = common::replacementCharacter;
            }
            common::appendUtf8(result, low);
            return;
        }
        warnLoneSurrogate(codePoint, escapePos);
        common::appendUtf8(result, common::replacementCharacter);
    }

    // @brief 16進数4桁を読み取る（\uの直後から）
    // @return パースした値
    char32_t parseHexEscape() {
        char32_t codePoint = 0;
        for (int i = 0; i < 4; ++i) {
            int digitValue = inputSource_.atEnd() ? -1 : hexDigitToValue(peek());
            if (digitValue == -1) {
                throw LexError(LexErrorKind::InvalidString, location(),
                               "invalid \\u escape, expected 4 hex digits");
            }
            consume();
            codePoint = (codePoint << 4) | static_cast<char32_t>(digitValue);
        }
        return codePoint;
    }

    void warnLoneSurrogate(char32_t codePoint, const SourcePosition& pos) {
        warningOutput_.warning("Unpaired surrogate " + common::formatCodePoint(codePoint) +
                               " at " + formatPosition(pos) + " replaced with U+FFFD");
    }

    // @brief Unicode文字（マルチバイトUTF-8）を1文字消費して追加
    // @param result 追加先の文字列
    void consumeUtf8Char(std::string& result) {
        char32_t codePoint = 0;
        std::size_t byteCount = 0;
        if (!common::decodeUtf8FirstCodePoint(inputSource_.remaining(), codePoint, byteCount)) {
            invalidEncoding(byteCount);
        }
        result.append(inputSource_.remaining().substr(0, byteCount));
        consume(byteCount);
    }

    // @brief 不正なUTF-8の位置まで進めてLexErrorを送出する
    // @param validPrefix 不正と判明するまでに読んだバイト数
    [[noreturn]] void invalidEncoding(std::size_t validPrefix) {
        // 先頭バイト自体が不正な場合はその位置、継続バイトが不正な場合はそのバイトの位置
        consume(validPrefix);
        const SourcePosition pos = location();
        std::string detail = "invalid UTF-8 sequence";
        if (!inputSource_.atEnd()) {
            detail += " at byte " + formatByte(static_cast<unsigned char>(peek()));
        } else {
            detail += " truncated at end of input";
        }
        throw LexError(LexErrorKind::InvalidEncoding, pos, detail);
    }

    // ******************************************************************************** 数値の解析
private:
    // @brief 数値をパース
    // @note 数値に使われる文字を最長一致で読み取ってから書式を検証する
    std::string parseNumber(const SourcePosition& tokenPos) {
        std::size_t length = 0;
        while (!inputSource_.atEnd(length) && isNumberChar(inputSource_.remaining()[length])) {
            ++length;
        }
        std::string text(inputSource_.remaining().substr(0, length));
        if (!isValidNumberText(text)) {
            throw LexError(LexErrorKind::InvalidNumber, tokenPos, "invalid number '" + text + "'");
        }
        consume(length);
        return text;
    }

    // @brief 数値の一部になり得る文字かどうか
    static constexpr bool isNumberChar(char c) {
        switch (c) {
            CASE_PART_DIGITS:
            case '-': case '+': case '.': case 'e': case 'E':
                return true;
            default:
                return false;
        }
    }

    // @brief 10進数の桁かどうかを判定
    static constexpr bool isDecimalDigit(char c) {
        switch (c) {
            CASE_PART_DIGITS:
                return true;
            default:
                return false;
        }
    }

    // @brief 数値表記が -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)? に一致するか
    static constexpr bool isValidNumberText(std::string_view text) {
        std::size_t i = 0;
        const std::size_t n = text.size();

        // 符号
        if (i < n && text[i] == '-') {
            ++i;
        }

        // 整数部: 0 単独、または1-9で始まる数字列
        if (i >= n) {
            return false;
        }
        if (text[i] == '0') {
            ++i;
        } else if (isDecimalDigit(text[i])) {
            while (i < n && isDecimalDigit(text[i])) {
                ++i;
            }
        } else {
            return false;
        }

        // 小数部: 最低1桁
        if (i < n && text[i] == '.') {
            ++i;
            const std::size_t start = i;
            while (i < n && isDecimalDigit(text[i])) {
                ++i;
            }
            if (i == start) {
                return false;
            }
        }

        // 指数部: 最低1桁
        if (i < n && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            if (i < n && (text[i] == '+' || text[i] == '-')) {
                ++i;
            }
            const std::size_t start = i;
            while (i < n && isDecimalDigit(text[i])) {
                ++i;
            }
            if (i == start) {
                return false;
            }
        }

        // 余りがあれば不正（先頭ゼロの後の数字、2つ目の小数点など）
        return i == n;
    }

    // @brief 16進数の桁を数値に変換
    static constexpr int hexDigitToValue(char c) {
        switch (c) {
            case '0': return 0;
            case '1': return 1;
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'a': case 'A': return 10;
            case 'b': case 'B': return 11;
            case 'c': case 'C': return 12;
            case 'd': case 'D': return 13;
            case 'e': case 'E': return 14;
            case 'f': case 'F': return 15;
            default: return -1;
        }
    }

    // ******************************************************************************** リテラルの解析
private:
    // @brief 予約語（true/false/null）を照合して消費する
    // @tparam N 予約語の長さ（null終端を含む）
    // @param keyword 予約語の文字配列
    // @note 途中で一致しない、または直後に識別子の文字が続く場合はUnexpectedCharacter
    template <std::size_t N>
    void matchKeyword(const char (&keyword)[N]) {
        constexpr std::size_t len = N - 1;  // null終端を除く
        for (std::size_t i = 0; i < len; ++i) {
            if (inputSource_.atEnd(i) || peekAhead(i) != keyword[i]) {
                consume(i);
                if (inputSource_.atEnd()) {
                    throw LexError(LexErrorKind::UnexpectedCharacter, location(),
                                   std::string("unexpected end of input in literal '") + keyword + "'");
                }
                unexpectedCharacter(std::string("in literal '") + keyword + "'");
            }
        }
        consume(len);
        if (!inputSource_.atEnd() && isIdentifierByte(peek())) {
            unexpectedCharacter(std::string("after literal '") + keyword + "'");
        }
    }

    // @brief 予約語の直後に続いてはならない文字か
    static constexpr bool isIdentifierByte(char c) {
        const auto u = static_cast<unsigned char>(c);
        return (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') ||
               u == '_' || u == '$' || u >= 0x80;
    }

    // ******************************************************************************** エラー報告
private:
    // @brief 現在位置の文字を不正としてLexErrorを送出する
    // @param context エラーメッセージに付加する状況説明（空なら付加しない）
    [[noreturn]] void unexpectedCharacter(const std::string& context = {}) {
        const unsigned char c = static_cast<unsigned char>(peek());
        std::string what;
        if (c >= 0x80) {
            char32_t codePoint = 0;
            std::size_t byteCount = 0;
            if (!common::decodeUtf8FirstCodePoint(inputSource_.remaining(), codePoint, byteCount)) {
                invalidEncoding(byteCount);
            }
            what = common::formatCodePoint(codePoint);
            if (codePoint == 0xFEFF) {
                what += " (byte order mark)";
            }
        } else {
            what = "'" + describeChar(static_cast<char>(c)) + "'";
        }
        std::string detail = "unexpected character " + what;
        if (!context.empty()) {
            detail += " " + context;
        }
        throw LexError(LexErrorKind::UnexpectedCharacter, location(), detail);
    }

    // @brief エラーメッセージ用に1文字を表示可能な形にする
    static std::string describeChar(char c) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) {
            return formatByte(u);
        }
        return std::string(1, c);
    }

    static std::string formatByte(unsigned char c) {
        static constexpr char hexDigits[] = "0123456789ABCDEF";
        std::string text = "0x";
        text += hexDigits[c >> 4];
        text += hexDigits[c & 0xF];
        return text;
    }

    // ********************************************************************************
    // 入力文字取得・判定
   private:
    // @brief 現在位置の文字を取得（範囲外の場合は'\0'）
    char peek() const { return inputSource_.peekAhead(0); }

    // @brief 指定した位置先の文字を取得（範囲外の場合は'\0'）
    // @param offset 現在位置からのオフセット（0の場合はpeek()と同じ）
    char peekAhead(std::size_t offset) const {
        return inputSource_.peekAhead(offset);
    }

    // @brief 現在位置から指定された文字数だけ読み進める
    // @param count 進める文字数（デフォルトは1）
    void consume(std::size_t count = 1) { inputSource_.consume(count); }

    SourcePosition location() const { return inputSource_.location(); }

    // @brief 指定位置以降のバイト列が指定パターンと一致するかチェック（2バイト版）
    // @param offset 現在位置からのオフセット
    // @param byte1 1バイト目の期待値
    // @param byte2 2バイト目の期待値
    // @return 一致すればtrue
    bool matchUtf8Bytes(std::size_t offset, unsigned char byte1, unsigned char byte2) const {
        return !inputSource_.atEnd(offset + 1) &&
               static_cast<unsigned char>(peekAhead(offset)) == byte1 &&
               static_cast<unsigned char>(peekAhead(offset + 1)) == byte2;
    }

    // ******************************************************************************** 構築
public:
    // @brief コンストラクタ
    // @param inputSource 入力文字列取得元の参照
    // @param warnOut 警告メッセージの出力先
    // @param allowByteOrderMark 入力先頭のBOMを読み飛ばすか
    JsonTokenizer(Input& inputSource, common::MessageOutput& warnOut, bool allowByteOrderMark = false)
        : inputSource_(inputSource), warningOutput_(warnOut), allowByteOrderMark_(allowByteOrderMark) {}

    // ******************************************************************************** トークン生成
public:
    // @brief 次のトークンを1つ生成して返す
    // @return 生成したトークン。入力終端ではEndOfInputトークン。
    // @note EndOfInputを返した後の呼び出しは想定しない
    JsonToken nextToken() {
        if (atStart_) {
            atStart_ = false;
            skipByteOrderMark();
        }
        skipWhitespace();
        const SourcePosition tokenPos = location();
        if (inputSource_.atEnd()) {
            return JsonToken{json_token_detail::EndOfInputTag{}, tokenPos};
        }

        // 先頭文字でトークンの種類を判定
        switch (peek()) {
            case '{':
                consume();
                return JsonToken{json_token_detail::ObjectOpenTag{}, tokenPos};
            case '}':
                consume();
                return JsonToken{json_token_detail::ObjectCloseTag{}, tokenPos};
            case '[':
                consume();
                return JsonToken{json_token_detail::ArrayOpenTag{}, tokenPos};
            case ']':
                consume();
                return JsonToken{json_token_detail::ArrayCloseTag{}, tokenPos};
            case ':':
                consume();
                return JsonToken{json_token_detail::ColonTag{}, tokenPos};
            case ',':
                consume();
                return JsonToken{json_token_detail::CommaTag{}, tokenPos};
            case '"':
                return JsonToken{json_token_detail::StrVal{parseString(tokenPos)}, tokenPos};
            case '-':
            CASE_PART_DIGITS:
                return JsonToken{json_token_detail::NumVal{parseNumber(tokenPos)}, tokenPos};
            case 't':
                matchKeyword("true");
                return JsonToken{json_token_detail::TrueTag{}, tokenPos};
            case 'f':
                matchKeyword("false");
                return JsonToken{json_token_detail::FalseTag{}, tokenPos};
            case 'n':
                matchKeyword("null");
                return JsonToken{json_token_detail::NullTag{}, tokenPos};
            default:
                unexpectedCharacter();
        }
    }

    // @brief 入力先頭に戻し、最初からトークンを生成し直せるようにする
    void reset() {
        inputSource_.rewind();
        atStart_ = true;
    }

    // ******************************************************************************** メンバー変数
private:
    Input& inputSource_;                      ///< 入力文字列取得元の参照
    common::MessageOutput& warningOutput_;    ///< 警告メッセージ出力先
    bool allowByteOrderMark_;                 ///< 先頭BOMを許可するか
    bool atStart_ = true;                     ///< まだ1トークンも生成していないか
};

}  // namespace jvalid::core
