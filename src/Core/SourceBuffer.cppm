// @file SourceBuffer.cppm
// @brief 検証対象テキストを保持する先読みバッファ。行・列の位置を追跡する。

module;
#include <cassert>
#include <cstddef>
#include <string>
#include <string_view>

export module jvalid.core.source_buffer;

export namespace jvalid::core {

/// @brief 入力中の位置。
struct SourcePosition {
    std::size_t offset{};   ///< 先頭からのバイトオフセット（0始まり）
    std::size_t line{1};    ///< 行番号（1始まり）
    std::size_t column{1};  ///< 列番号（1始まり、バイト単位）

    bool operator==(const SourcePosition&) const = default;
};

/// @brief 先読みバッファ。入力全体を所有し、検証中は内容を変更しない。
class SourceBuffer {
   public:
    using bufferType = std::string;

    static constexpr std::size_t defaultAheadSize = 8;  ///< 既定の先読みbyte数

    /// @brief コンストラクタ。
    /// @param buffer バッファ本体。入力全体が入っていること。
    /// @param aheadSize 先読みbyte数。
    explicit SourceBuffer(bufferType&& buffer, std::size_t aheadSize = defaultAheadSize)
        : consumingBuffer_(std::move(buffer)), consumingValidSize_(consumingBuffer_.size()),
        aheadSize_(aheadSize) {
        // 先読み用領域を'\0'で初期化しておく（番兵）。
        // 入力中の'\0'と区別するため、終端判定はatEnd()で行うこと。
        consumingBuffer_.resize(consumingValidSize_ + aheadSize_, '\0');
    }

    // コピー・ムーブ禁止
    SourceBuffer(const SourceBuffer&) = delete;
    SourceBuffer& operator=(const SourceBuffer&) = delete;
    SourceBuffer(SourceBuffer&&) = delete;
    SourceBuffer& operator=(SourceBuffer&&) = delete;

   public:
    /// @brief 現在の読み取り位置を行・列付きで返す。
    SourcePosition location() const { return location_; }

    /// @brief 入力の有効バイト数を返す。先読み用の番兵は含まない。
    std::size_t size() const { return consumingValidSize_; }

    /// @brief 現在位置からoffset先が入力終端以降かどうか。
    bool atEnd(std::size_t offset = 0) const {
        return location_.offset + offset >= consumingValidSize_;
    }

    /// @brief 先読みした文字を取得する。
    /// @param offset 現在位置からのオフセット（先読みbyte数未満）。
    /// @return 指定位置の文字。範囲外の場合は'\0'。
    char peekAhead(std::size_t offset) const {
        if (location_.offset + offset >= consumingValidSize_) {
            return '\0';
        }
        return consumingBuffer_[location_.offset + offset];
    }

    /// @brief 現在位置から入力終端までのバイト列を返す。
    std::string_view remaining() const {
        return std::string_view(consumingBuffer_.data() + location_.offset,
                                consumingValidSize_ - location_.offset);
    }

    /// @brief 現在位置から指定された文字数だけ読み進める。
    /// @param count 読み進める文字数。
    /// @note 文字を取得する場合は、事前にpeekAhead()を呼び出すこと。
    void consume(std::size_t count = 1) {
        assert(location_.offset + count <= consumingValidSize_);
        for (std::size_t i = 0; i < count; ++i) {
            const char c = consumingBuffer_[location_.offset];
            ++location_.offset;
            // CRLFはLFの側で1行と数える。
            if (c == '\n' || (c == '\r' && !(location_.offset < consumingValidSize_ &&
                                             consumingBuffer_[location_.offset] == '\n'))) {
                ++location_.line;
                location_.column = 1;
            } else {
                ++location_.column;
            }
        }
    }

    /// @brief 読み取り位置を先頭に戻す。
    void rewind() { location_ = SourcePosition{}; }

   private:
    //! トークン解析用の消費バッファ。末尾aheadSize_ byteは先読み用。
    std::string consumingBuffer_;
    std::size_t consumingValidSize_; ///< 消費バッファの有効データ長。先読み用除く。
    std::size_t aheadSize_;          ///< 先読みbyte数。
    SourcePosition location_{};      ///< 消費バッファ内の現在位置。
};

}  // namespace jvalid::core
