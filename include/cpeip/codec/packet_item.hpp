#pragma once

#include <cstdint>
#include <vector>

namespace cpeip::codec {

/// Common Packet Format のアイテム種別
enum class ItemType : std::uint16_t {
    NullAddress = 0x0000,
    ConnectedTransportPacket = 0x00B1,
    UnconnectedMessage = 0x00B2,
    ListServicesResponse = 0x0100,
    SockaddrInfoOriginatorToTarget = 0x8000,
    SockaddrInfoTargetToOriginator = 0x8001,
    SequencedAddress = 0x8002
};

/// データ/アドレスアイテム
/// 長さはエンコード時に data から算出する
struct PacketItem {
    std::uint16_t type_id = 0;
    std::vector<std::uint8_t> data;

    PacketItem() = default;
    PacketItem(ItemType type, std::vector<std::uint8_t> item_data);
    PacketItem(std::uint16_t type, std::vector<std::uint8_t> item_data);

    bool is(ItemType type) const noexcept { return type_id == static_cast<std::uint16_t>(type); }

    bool operator==(const PacketItem& other) const {
        return type_id == other.type_id && data == other.data;
    }
};

/// アイテム列を CPF 形式にエンコードする
/// アイテムが1つだけの場合は先頭に空のヌルアドレスアイテムを補い、常に2アイテムで送る
std::vector<std::uint8_t> encodePacketItems(const std::vector<PacketItem>& items);

/// CPF 形式をデコードする
/// @throws FrameDecodeError アイテム数フィールドの不足、またはアイテム長がバッファを超える場合
std::vector<PacketItem> decodePacketItems(const std::vector<std::uint8_t>& packet);

/// 非接続メッセージとして要求データを1アイテムに包む
std::vector<std::uint8_t> encodeUnconnectedPacket(const std::vector<std::uint8_t>& cip_message);

/// 応答アイテム列から非接続メッセージアイテムのデータを取り出す
/// @throws FrameDecodeError 該当アイテムが存在しない場合
const std::vector<std::uint8_t>& findUnconnectedData(const std::vector<PacketItem>& items);

} // namespace cpeip::codec
