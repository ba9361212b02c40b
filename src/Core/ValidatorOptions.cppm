// @file ValidatorOptions.cppm
// @brief 検証処理の設定値。

module;
#include <cstddef>
#include <stdexcept>
#include <string>

export module jvalid.core.validator_options;

export namespace jvalid::core {

/// @brief 検証処理の設定。
struct ValidatorOptions {
    static constexpr std::size_t defaultMaxDepth = 512;    ///< 既定の最大ネスト深さ
    static constexpr std::size_t maxDepthCeiling = 10000;  ///< 指定可能な最大ネスト深さの上限

    /// @brief オブジェクト・配列の最大ネスト深さ。これを超えるとTooDeep。
    std::size_t maxDepth = defaultMaxDepth;

    /// @brief 入力先頭のUTF-8 BOM（EF BB BF）を読み飛ばすか。
    /// @note RFC 8259 8.1ではBOMを付加してはならないため既定は拒否。
    bool allowByteOrderMark = false;

    /// @brief 設定値の妥当性を確認する。
    /// @note 再帰下降の呼び出し深さはmaxDepthに比例するため上限を設ける。
    void check() const {
        if (maxDepth == 0) {
            throw std::invalid_argument("ValidatorOptions: maxDepth must be at least 1");
        }
        if (maxDepth > maxDepthCeiling) {
            throw std::invalid_argument("ValidatorOptions: maxDepth must not exceed " +
                                        std::to_string(maxDepthCeiling));
        }
    }
};

}  // namespace jvalid::core
