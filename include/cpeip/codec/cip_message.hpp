#pragma once

#include <cstdint>
#include <vector>

namespace cpeip::codec {

/// CIPサービスコード
enum class CipService : std::uint8_t {
    GetAttributeAll = 0x01,
    ReadTag = 0x4C,
    WriteTag = 0x4D,
    ReadModifyWriteTag = 0x4E,
    ReadTagFragmented = 0x52,
    WriteTagFragmented = 0x53,
    GetInstanceList = 0x5F
};

/// CIP要求
/// path はワード境界に揃っている（偶数バイト）こと
struct CipRequest {
    std::uint8_t service = 0;
    std::vector<std::uint8_t> path;
    std::vector<std::uint8_t> data;

    CipRequest() = default;
    CipRequest(CipService service_code, std::vector<std::uint8_t> request_path,
               std::vector<std::uint8_t> request_data = {});

    /// パス長（ワード数）
    std::uint8_t pathWords() const noexcept { return static_cast<std::uint8_t>(path.size() / 2); }
};

/// CIP応答
/// 一般ステータスが0以外でも構造的にはデコードされる。判定は ensureSuccess() で行う
struct CipReply {
    std::uint8_t service = 0;
    std::uint8_t reserved = 0;
    std::uint8_t general_status = 0;
    std::vector<std::uint8_t> extended_status;  // 2 * ワード数 バイト
    std::vector<std::uint8_t> data;

    bool ok() const noexcept { return general_status == 0; }
};

/// @throws std::invalid_argument パスが奇数バイト、または255ワードを超える場合
std::vector<std::uint8_t> encodeCipRequest(const CipRequest& request);

/// @throws FrameDecodeError 4 + 2 * 拡張ステータスワード数 より短い場合
CipReply decodeCipReply(const std::vector<std::uint8_t>& bytes);

/// 応答をワイヤ形式に戻す（テスト用モックサーバーでも使用）
std::vector<std::uint8_t> encodeCipReply(const CipReply& reply);

/// 一般ステータスが0以外なら CipStatusError を送出する
void ensureSuccess(const CipReply& reply);

/// ReadTag 要求データ（要素数）
std::vector<std::uint8_t> makeReadTagData(std::uint16_t elements = 1);

/// WriteTag 要求データ（型コード、付加情報長0、要素数、値）
std::vector<std::uint8_t> makeWriteTagData(std::uint8_t type_code, const std::vector<std::uint8_t>& value,
                                           std::uint16_t elements = 1);

/// ReadTag 応答データから型ヘッダー（型コード、付加情報長、付加情報）を除いた値部分を返す
/// @throws FrameDecodeError 型ヘッダーが不足している場合
std::vector<std::uint8_t> stripReadTagHeader(const std::vector<std::uint8_t>& reply_data);

} // namespace cpeip::codec
