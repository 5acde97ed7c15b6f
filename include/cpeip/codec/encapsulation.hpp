#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace cpeip::codec {

/// カプセル化コマンドコード
enum class EncapsulationCommand : std::uint16_t {
    Nop = 0x0000,
    ListServices = 0x0004,
    ListIdentity = 0x0063,
    ListInterfaces = 0x0064,
    RegisterSession = 0x0065,
    UnregisterSession = 0x0066,
    SendRRData = 0x006F
};

using SenderContext = std::array<std::uint8_t, 8>;

/// カプセル化メッセージ
/// 24バイト固定ヘッダー + ペイロード。長さフィールドは常にペイロードから算出する
struct EncapsulationMessage {
    static constexpr std::size_t kHeaderSize = 24;

    std::uint16_t command = 0;
    std::uint32_t session_handle = 0;
    std::uint32_t status = 0;
    SenderContext sender_context{};
    std::uint32_t options = 0;
    std::vector<std::uint8_t> payload;

    /// ヘッダーの長さフィールドに書き込まれる値
    std::uint16_t length() const noexcept { return static_cast<std::uint16_t>(payload.size()); }

    bool operator==(const EncapsulationMessage& other) const;
    bool operator!=(const EncapsulationMessage& other) const { return !(*this == other); }
};

/// コマンド固有データ（SendRRData のペイロード）
struct CommandSpecificData {
    std::uint32_t interface_handle = 0;
    std::uint16_t timeout = 0;                   // 秒単位
    std::vector<std::uint8_t> encapsulated_packet;  // CPFバイト列

    bool operator==(const CommandSpecificData& other) const;
};

/// メッセージをワイヤ形式にエンコードする
/// @throws std::invalid_argument ペイロードが65535バイトを超える場合
std::vector<std::uint8_t> encodeEncapsulation(const EncapsulationMessage& message);

/// ワイヤ形式からメッセージをデコードする
/// 宣言長とペイロード実長の照合は行わない（1フレーム単位の受信はトランスポート側の責務）
/// @throws FrameDecodeError 24バイト未満の場合
EncapsulationMessage decodeEncapsulation(const std::vector<std::uint8_t>& frame);

std::vector<std::uint8_t> encodeCommandSpecificData(const CommandSpecificData& data);

/// @throws FrameDecodeError 6バイト未満の場合
CommandSpecificData decodeCommandSpecificData(const std::vector<std::uint8_t>& payload);

} // namespace cpeip::codec
