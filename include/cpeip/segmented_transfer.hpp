#pragma once

#include "cpeip/cip_types.hpp"
#include "cpeip/type_resolver.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cpeip {

/// 1メッセージに収まらない値を転送するときのチャンク上限
struct TransferLimits {
    std::uint16_t read_chunk_size = 494;   // 最大メッセージサイズ - 8
    std::uint16_t write_chunk_size = 400;  // 最大の基本型幅（8バイト）の倍数
};

/// 単純データセグメントを使って値を複数の ReadTag/WriteTag に分割して転送する
/// 各チャンクは直前のチャンクの応答を受け取ってから送る
class SegmentedTransfer {
public:
    SegmentedTransfer(CipExchange exchange, TransferLimits limits);

    /// 値全体のシリアライズ表現を読み取る
    /// 各チャンク応答の型ヘッダー（文字列は長さプレフィックスも）を除いて連結する
    /// @throws CipStatusError いずれかのチャンクでエラー応答が返った場合（部分値は返さない）
    /// @throws FrameDecodeError 連結結果が宣言サイズに満たない場合
    std::vector<std::uint8_t> read(const std::string& variable_name, const CipTypeDescriptor& type);

    /// 値のシリアライズ表現を書き込む
    /// @param payload 文字列は生の文字列バイト、配列は要素バイト列
    /// @throws std::invalid_argument 構造体への書き込み、またはペイロードが宣言サイズを超える場合
    void write(const std::string& variable_name, const CipTypeDescriptor& type,
               const std::vector<std::uint8_t>& payload);

    std::uint16_t readChunkSize() const noexcept { return limits_.read_chunk_size; }
    std::uint16_t writeChunkSize() const noexcept { return limits_.write_chunk_size; }

private:
    CipExchange exchange_;
    TransferLimits limits_;
};

} // namespace cpeip
