// @file Utf8.cppm
// @brief UTF-8のデコード・エンコード補助関数。

module;
#include <cstddef>
#include <string>
#include <string_view>

export module jvalid.common.utf8;

export namespace jvalid::common {

/// @brief 置換文字 U+FFFD。
inline constexpr char32_t replacementCharacter = 0xFFFD;

/// @brief コードポイントがサロゲート領域（U+D800～U+DFFF）かどうかを判定する。
constexpr bool isSurrogate(char32_t codePoint) {
    return codePoint >= 0xD800 && codePoint <= 0xDFFF;
}

/// @brief 上位サロゲート（U+D800～U+DBFF）かどうかを判定する。
constexpr bool isHighSurrogate(char32_t codePoint) {
    return codePoint >= 0xD800 && codePoint <= 0xDBFF;
}

/// @brief 下位サロゲート（U+DC00～U+DFFF）かどうかを判定する。
constexpr bool isLowSurrogate(char32_t codePoint) {
    return codePoint >= 0xDC00 && codePoint <= 0xDFFF;
}

/// @brief サロゲートペアを1コードポイントに合成する。
/// @param high 上位サロゲート
/// @param low 下位サロゲート
constexpr char32_t combineSurrogates(char32_t high, char32_t low) {
    return 0x10000 + (((high - 0xD800) << 10) | (low - 0xDC00));
}

/// @brief UTF-8継続バイト（10xxxxxx）をチェックして下位6ビットを抽出
/// @return 有効な継続バイトならそのビット値（0-63）、無効なら-1
constexpr int decodeUtf8ContinuationByte(unsigned char byte) {
    if ((byte & 0xC0) != 0x80) {
        return -1;
    }
    return byte & 0x3F;
}

/// @brief UTF-8文字列の先頭から1コードポイントをデコード
/// @param str UTF-8エンコード文字列
/// @param outCodePoint デコードされたコードポイント
/// @param outByteCount 消費したバイト数（失敗時は不正と判明した位置までのバイト数）
/// @return デコード成功時true。オーバーロング・サロゲート・範囲外はfalse。
bool decodeUtf8FirstCodePoint(std::string_view str, char32_t& outCodePoint, std::size_t& outByteCount) {
    outByteCount = 0;
    if (str.empty()) {
        return false;
    }

    unsigned char byte0 = static_cast<unsigned char>(str[0]);

    // 1バイト文字 (0xxxxxxx)
    if (byte0 < 0x80) {
        outCodePoint = static_cast<char32_t>(byte0);
        outByteCount = 1;
        return true;
    }

    std::size_t length = 0;
    char32_t codePoint = 0;
    if ((byte0 & 0xE0) == 0xC0) {
        length = 2;  // 110xxxxx 10xxxxxx
        codePoint = byte0 & 0x1F;
    } else if ((byte0 & 0xF0) == 0xE0) {
        length = 3;  // 1110xxxx 10xxxxxx 10xxxxxx
        codePoint = byte0 & 0x0F;
    } else if ((byte0 & 0xF8) == 0xF0) {
        length = 4;  // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
        codePoint = byte0 & 0x07;
    } else {
        // 継続バイトで始まる、または0xF8以上
        return false;
    }

    for (std::size_t i = 1; i < length; ++i) {
        if (i >= str.size()) {
            outByteCount = i;
            return false;
        }
        int bits = decodeUtf8ContinuationByte(static_cast<unsigned char>(str[i]));
        if (bits < 0) {
            outByteCount = i;
            return false;
        }
        codePoint = (codePoint << 6) | static_cast<char32_t>(bits);
    }

    bool valid = false;
    switch (length) {
    case 2:
        valid = codePoint >= 0x80;  // オーバーロングチェック
        break;
    case 3:
        valid = codePoint >= 0x800 && !isSurrogate(codePoint);  // オーバーロング&サロゲートチェック
        break;
    default:
        valid = codePoint >= 0x10000 && codePoint <= 0x10FFFF;  // 範囲チェック
        break;
    }
    if (!valid) {
        // 列全体が不正なので、不正な位置は先頭バイト
        return false;
    }
    outCodePoint = codePoint;
    outByteCount = length;
    return true;
}

/// @brief Unicode コードポイントをUTF-8にエンコードして文字列に追加
/// @param result 追加先の文字列
/// @param codePoint Unicodeコードポイント（U+10FFFF以下であること）
void appendUtf8(std::string& result, char32_t codePoint) {
    if (codePoint <= 0x7F) {
        // 1バイト (ASCII)
        result += static_cast<char>(codePoint);
    } else if (codePoint <= 0x7FF) {
        // 2バイト
        result += static_cast<char>(0xC0 | ((codePoint >> 6) & 0x1F));
        result += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint <= 0xFFFF) {
        // 3バイト
        result += static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F));
        result += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        // 4バイト
        result += static_cast<char>(0xF0 | ((codePoint >> 18) & 0x07));
        result += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

/// @brief コードポイントを "U+XXXX" 形式の文字列にする。
std::string formatCodePoint(char32_t codePoint) {
    static constexpr char hexDigits[] = "0123456789ABCDEF";
    std::string digits;
    for (char32_t v = codePoint; v != 0; v >>= 4) {
        digits.insert(digits.begin(), hexDigits[v & 0xF]);
    }
    while (digits.size() < 4) {
        digits.insert(digits.begin(), '0');
    }
    return "U+" + digits;
}

}  // namespace jvalid::common
