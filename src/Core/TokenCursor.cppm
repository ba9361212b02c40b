// @file TokenCursor.cppm
// @brief トークナイザーから1トークン先読みで取り出すカーソル。

module;
#include <concepts>
#include <optional>
#include <utility>

export module jvalid.core.token_cursor;

export import jvalid.core.json_token;

export namespace jvalid::core {

// @brief トークン供給元が満たすべきインターフェース
template <typename T>
concept TokenSource = requires(T& t) {
    { t.nextToken() } -> std::same_as<JsonToken>;
};

// ******************************************************************************** TokenCursor
// @brief 要求されたときだけトークンを生成するカーソル
// @note トークン列全体は保持せず、先読みは高々1トークン
template <TokenSource Source>
class TokenCursor {
public:
    // @brief コンストラクタ
    // @param source トークン供給元の参照
    explicit TokenCursor(Source& source) : source_(source) {}

    // コピー・ムーブ禁止
    TokenCursor(const TokenCursor&) = delete;
    TokenCursor& operator=(const TokenCursor&) = delete;

    // @brief 次のトークンを取得（消費しない）
    // @return 次のトークン。次にpeek()/take()を呼ぶまで有効。
    const JsonToken& peek() {
        if (!lookahead_) {
            lookahead_.emplace(source_.nextToken());
        }
        return *lookahead_;
    }

    // @brief 次のトークンの種類を返す（消費しない）
    JsonTokenType peekType() { return peek().type(); }

    // @brief 次のトークンが指定の種類ならtrue（消費しない）
    bool nextIs(JsonTokenType type) { return peekType() == type; }

    // @brief 次のトークンを取得して消費
    JsonToken take() {
        peek();
        JsonToken t = std::move(*lookahead_);
        lookahead_.reset();
        return t;
    }

    // @brief 先読みしたトークンを捨てる
    // @note トークナイザーをreset()する際に合わせて呼ぶこと
    void clear() { lookahead_.reset(); }

private:
    Source& source_;                       ///< トークン供給元の参照
    std::optional<JsonToken> lookahead_;   ///< 先読みしたトークン
};

}  // namespace jvalid::core
