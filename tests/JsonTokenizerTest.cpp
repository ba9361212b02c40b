import jvalid.core.json_check;
import jvalid.test_helper;
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jvalid::core;
using jvalid::test::RecordingMessageOutput;
using jvalid::test::tokenTypes;
using jvalid::test::tokenizeAll;

namespace {

/// @brief 字句エラーになることを確認し、送出されたLexErrorを返す。
LexError expectLexError(const std::string& text, LexErrorKind kind) {
    try {
        tokenizeAll(text);
    } catch (const LexError& e) {
        EXPECT_EQ(e.kind(), kind) << "input: " << text << "\nactual: " << e.what();
        return e;
    }
    ADD_FAILURE() << "no lex error for input: " << text;
    return LexError(kind, SourcePosition{}, "");
}

} // namespace

TEST(JsonTokenizerTest, StructuralCharacters) {
    EXPECT_EQ(tokenTypes("{}[]:,"), (std::vector<JsonTokenType>{
        JsonTokenType::ObjectOpen, JsonTokenType::ObjectClose,
        JsonTokenType::ArrayOpen, JsonTokenType::ArrayClose,
        JsonTokenType::Colon, JsonTokenType::Comma, JsonTokenType::EndOfInput}));
}

TEST(JsonTokenizerTest, EmptyInputYieldsSingleEndOfInput) {
    auto tokens = tokenizeAll("");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type(), JsonTokenType::EndOfInput);
    EXPECT_EQ(tokens[0].position.offset, 0u);
}

TEST(JsonTokenizerTest, OnlyJsonWhitespaceIsSkipped) {
    EXPECT_EQ(tokenTypes(" \t\r\n[ \n]\r\n"), (std::vector<JsonTokenType>{
        JsonTokenType::ArrayOpen, JsonTokenType::ArrayClose, JsonTokenType::EndOfInput}));

    // 垂直タブ・改ページ・NBSPは空白ではない
    expectLexError("\v[]", LexErrorKind::UnexpectedCharacter);
    expectLexError("\f[]", LexErrorKind::UnexpectedCharacter);
    expectLexError("\xC2\xA0[]", LexErrorKind::UnexpectedCharacter);
}

TEST(JsonTokenizerTest, Literals) {
    EXPECT_EQ(tokenTypes("true false null"), (std::vector<JsonTokenType>{
        JsonTokenType::True, JsonTokenType::False, JsonTokenType::Null, JsonTokenType::EndOfInput}));
    EXPECT_EQ(tokenTypes("[true,null]"), (std::vector<JsonTokenType>{
        JsonTokenType::ArrayOpen, JsonTokenType::True, JsonTokenType::Comma,
        JsonTokenType::Null, JsonTokenType::ArrayClose, JsonTokenType::EndOfInput}));
}

TEST(JsonTokenizerTest, LiteralPrefixFollowedByGarbageIsRejected) {
    auto e = expectLexError("truex", LexErrorKind::UnexpectedCharacter);
    EXPECT_EQ(e.position().offset, 4u);

    expectLexError("nul", LexErrorKind::UnexpectedCharacter);
    expectLexError("fals", LexErrorKind::UnexpectedCharacter);
    expectLexError("null1", LexErrorKind::UnexpectedCharacter);
    expectLexError("True", LexErrorKind::UnexpectedCharacter);

    auto e2 = expectLexError("tRue", LexErrorKind::UnexpectedCharacter);
    EXPECT_EQ(e2.position().offset, 1u);
}

TEST(JsonTokenizerTest, UnknownCharacterIsRejected) {
    auto e = expectLexError("[1, @]", LexErrorKind::UnexpectedCharacter);
    EXPECT_EQ(e.position().offset, 4u);
    EXPECT_EQ(e.position().column, 5u);

    expectLexError("'a'", LexErrorKind::UnexpectedCharacter);
    expectLexError("+1", LexErrorKind::UnexpectedCharacter);
    expectLexError(".5", LexErrorKind::UnexpectedCharacter);
    expectLexError("/* comment */", LexErrorKind::UnexpectedCharacter);
    expectLexError(std::string("[\0]", 3), LexErrorKind::UnexpectedCharacter);
}

// ********************************************************************************
// 文字列
// ********************************************************************************

TEST(JsonTokenizerTest, StringEscapesAreDecoded) {
    auto tokens = tokenizeAll(R"("a\"b\\c\/d\b\f\n\r\t")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type(), JsonTokenType::String);
    EXPECT_EQ(tokens[0].text(), "a\"b\\c/d\b\f\n\r\t");
}

TEST(JsonTokenizerTest, UnicodeEscapes) {
    // 大文字小文字どちらの16進数も受け付ける
    EXPECT_EQ(tokenizeAll(R"("\u0041\u00e9\u00E9")")[0].text(), "A\xC3\xA9\xC3\xA9");
    // サロゲートペアは1コードポイントに合成する（U+1F600）
    EXPECT_EQ(tokenizeAll(R"("\uD83D\uDE00")")[0].text(), "\xF0\x9F\x98\x80");
}

TEST(JsonTokenizerTest, UnpairedSurrogateIsReplacedWithWarning) {
    RecordingMessageOutput output;
    SourceBuffer source{std::string(R"("\uD800x")")};
    JsonTokenizer<SourceBuffer> tokenizer(source, output);
    auto token = tokenizer.nextToken();
    EXPECT_EQ(token.type(), JsonTokenType::String);
    EXPECT_EQ(token.text(), "\xEF\xBF\xBDx");
    ASSERT_EQ(output.warnings.size(), 1u);
    EXPECT_NE(output.warnings[0].find("U+D800"), std::string::npos);
}

TEST(JsonTokenizerTest, RawUtf8IsKeptInStrings) {
    EXPECT_EQ(tokenizeAll("\"\xE3\x81\x82\xF0\x9F\x98\x80\"")[0].text(), "\xE3\x81\x82\xF0\x9F\x98\x80");
}

TEST(JsonTokenizerTest, InvalidStrings) {
    // 閉じ引用符なし
    expectLexError(R"("unterminated)", LexErrorKind::InvalidString);
    // 不完全な\uエスケープ
    expectLexError(R"("\u12")", LexErrorKind::InvalidString);
    expectLexError(R"("\u12)", LexErrorKind::InvalidString);
    expectLexError(R"("\uXYZW")", LexErrorKind::InvalidString);
    // 未定義のエスケープ
    expectLexError(R"("\a")", LexErrorKind::InvalidString);
    expectLexError(R"("\x41")", LexErrorKind::InvalidString);
    expectLexError(R"("\')", LexErrorKind::InvalidString);
    // 入力終端でのエスケープ
    expectLexError("\"abc\\", LexErrorKind::InvalidString);
}

TEST(JsonTokenizerTest, RawControlCharacterInStringIsRejected) {
    auto e = expectLexError("\"a\tb\"", LexErrorKind::InvalidString);
    EXPECT_EQ(e.position().offset, 2u);
    expectLexError("\"line\nbreak\"", LexErrorKind::InvalidString);
    expectLexError(std::string("\"\0\"", 3), LexErrorKind::InvalidString);
    // DEL(0x7F)は制御文字扱いしない
    EXPECT_EQ(tokenizeAll("\"\x7F\"")[0].text(), "\x7F");
}

TEST(JsonTokenizerTest, InvalidUtf8IsInvalidEncoding) {
    // 継続バイトの欠落
    auto e = expectLexError("\"\xC3(\"", LexErrorKind::InvalidEncoding);
    EXPECT_EQ(e.position().offset, 2u);
    // 単独の継続バイト
    expectLexError("\"\x80\"", LexErrorKind::InvalidEncoding);
    // オーバーロング表現は先頭バイトの位置
    auto overlong = expectLexError("[\"ab\xC0\x80zz\"]", LexErrorKind::InvalidEncoding);
    EXPECT_EQ(overlong.position().offset, 4u);
    EXPECT_EQ(overlong.position().column, 5u);
    EXPECT_NE(overlong.detail().find("0xC0"), std::string::npos) << overlong.detail();
    // 完全な列でも終端切れとは報告しない
    auto overlong3 = expectLexError("\"ab\xE0\x80\x80", LexErrorKind::InvalidEncoding);
    EXPECT_EQ(overlong3.position().offset, 3u);
    EXPECT_EQ(overlong3.detail().find("truncated"), std::string::npos) << overlong3.detail();
    // UTF-8で符号化されたサロゲート
    auto surrogate = expectLexError("\"x\xED\xA0\x80\"", LexErrorKind::InvalidEncoding);
    EXPECT_EQ(surrogate.position().offset, 2u);
    // U+10FFFFを超える値
    auto outOfRange = expectLexError("\"\xF4\x90\x80\x80\"", LexErrorKind::InvalidEncoding);
    EXPECT_EQ(outOfRange.position().offset, 1u);
    // 入力終端で途切れた多バイト文字
    expectLexError("\"\xE3\x81", LexErrorKind::InvalidEncoding);
    // 文字列の外の不正なバイト
    expectLexError("[\xFF]", LexErrorKind::InvalidEncoding);
}

TEST(JsonTokenizerTest, ByteOrderMark) {
    expectLexError("\xEF\xBB\xBF{}", LexErrorKind::UnexpectedCharacter);

    RecordingMessageOutput output;
    SourceBuffer source{std::string("\xEF\xBB\xBF{}")};
    JsonTokenizer<SourceBuffer> tokenizer(source, output, true);
    auto open = tokenizer.nextToken();
    EXPECT_EQ(open.type(), JsonTokenType::ObjectOpen);
    EXPECT_EQ(open.position.offset, 3u);
    EXPECT_EQ(output.warnings.size(), 1u);
}

// ********************************************************************************
// 数値
// ********************************************************************************

TEST(JsonTokenizerTest, ValidNumbersKeepSourceText) {
    for (const std::string text : {"0", "-0", "1", "-12", "10", "0.5", "-0.0", "1.25",
                                   "1e10", "1E+2", "1e-2", "-0e0", "123.456e-7", "9007199254740993"}) {
        auto tokens = tokenizeAll(text);
        ASSERT_EQ(tokens.size(), 2u) << text;
        EXPECT_EQ(tokens[0].type(), JsonTokenType::Number) << text;
        EXPECT_EQ(tokens[0].text(), text);
    }
}

TEST(JsonTokenizerTest, InvalidNumbers) {
    for (const std::string text : {"01", "-01", "00", "-", "1.", "1.e3", "1e", "1e+",
                                   "-.5", "1.2.3", "1e2e3", "1-2", "2+"}) {
        auto e = expectLexError(text, LexErrorKind::InvalidNumber);
        EXPECT_EQ(e.position().offset, 0u) << text;
    }
}

TEST(JsonTokenizerTest, HexadecimalIsNotANumber) {
    // "0" の後の x は数値の外なので不正な文字になる
    auto e = expectLexError("0x10", LexErrorKind::UnexpectedCharacter);
    EXPECT_EQ(e.position().offset, 1u);
}

TEST(JsonTokenizerTest, NumberIsDelimitedByStructuralCharacters) {
    auto tokens = tokenizeAll("[-1.5e3,0]");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1].text(), "-1.5e3");
    EXPECT_EQ(tokens[3].text(), "0");
}

// ********************************************************************************
// 位置・決定性
// ********************************************************************************

TEST(JsonTokenizerTest, TokensCarryLineAndColumn) {
    auto tokens = tokenizeAll("{\n  \"a\": 1,\r\n  \"b\": true\n}");
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens[1].position, (SourcePosition{4, 2, 3}));    // "a"
    EXPECT_EQ(tokens[3].position, (SourcePosition{9, 2, 8}));    // 1
    EXPECT_EQ(tokens[5].position, (SourcePosition{15, 3, 3}));   // "b"
    EXPECT_EQ(tokens[8].position, (SourcePosition{25, 4, 1}));   // }
}

TEST(JsonTokenizerTest, ResetReproducesSameTokenSequence) {
    RecordingMessageOutput output;
    SourceBuffer source{std::string(R"({"k": [1, "v", null]})")};
    JsonTokenizer<SourceBuffer> tokenizer(source, output);

    std::vector<JsonToken> first;
    do {
        first.push_back(tokenizer.nextToken());
    } while (first.back().type() != JsonTokenType::EndOfInput);

    tokenizer.reset();
    for (const auto& expected : first) {
        auto token = tokenizer.nextToken();
        EXPECT_EQ(token.type(), expected.type());
        EXPECT_EQ(token.text(), expected.text());
        EXPECT_EQ(token.position, expected.position);
    }
}
