#include "cpeip/codec/packet_item.hpp"

#include "cpeip/errors.hpp"
#include "codec/little_endian.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace cpeip::codec {

using detail::appendLittleEndian;
using detail::readLittle16;

PacketItem::PacketItem(ItemType type, std::vector<std::uint8_t> item_data)
    : type_id(static_cast<std::uint16_t>(type)), data(std::move(item_data)) {}

PacketItem::PacketItem(std::uint16_t type, std::vector<std::uint8_t> item_data)
    : type_id(type), data(std::move(item_data)) {}

std::vector<std::uint8_t> encodePacketItems(const std::vector<PacketItem>& items) {
    std::vector<PacketItem> padded;
    const std::vector<PacketItem>* source = &items;
    if (items.size() == 1) {
        // 非接続メッセージはヌルアドレス + データの2アイテム構成で送る。
        padded.emplace_back(ItemType::NullAddress, std::vector<std::uint8_t>{});
        padded.push_back(items.front());
        source = &padded;
    }

    std::vector<std::uint8_t> packet;
    appendLittleEndian(packet, source->size(), 2);
    for (const auto& item : *source) {
        if (item.data.size() > std::numeric_limits<std::uint16_t>::max()) {
            throw std::invalid_argument("Packet item data exceeds 65535 bytes");
        }
        appendLittleEndian(packet, item.type_id, 2);
        appendLittleEndian(packet, item.data.size(), 2);
        packet.insert(packet.end(), item.data.begin(), item.data.end());
    }
    return packet;
}

std::vector<PacketItem> decodePacketItems(const std::vector<std::uint8_t>& packet) {
    if (packet.size() < 2) {
        throw FrameDecodeError(FrameDecodeError::Kind::TruncatedItem, "Packet item count missing");
    }

    const std::uint16_t count = readLittle16(packet, 0);
    std::vector<PacketItem> items;
    items.reserve(count);

    std::size_t offset = 2;
    for (std::uint16_t index = 0; index < count; ++index) {
        if (offset + 4 > packet.size()) {
            throw FrameDecodeError(FrameDecodeError::Kind::TruncatedItem,
                                   "Packet item " + std::to_string(index) + " header truncated");
        }
        const std::uint16_t type = readLittle16(packet, offset);
        const std::uint16_t length = readLittle16(packet, offset + 2);
        if (offset + 4 + length > packet.size()) {
            throw FrameDecodeError(FrameDecodeError::Kind::TruncatedItem,
                                   "Packet item " + std::to_string(index) + " declares " +
                                       std::to_string(length) + " bytes beyond buffer end");
        }
        items.emplace_back(type, std::vector<std::uint8_t>(packet.begin() + offset + 4,
                                                           packet.begin() + offset + 4 + length));
        offset += 4 + length;
    }
    return items;
}

std::vector<std::uint8_t> encodeUnconnectedPacket(const std::vector<std::uint8_t>& cip_message) {
    return encodePacketItems({PacketItem(ItemType::UnconnectedMessage, cip_message)});
}

const std::vector<std::uint8_t>& findUnconnectedData(const std::vector<PacketItem>& items) {
    for (const auto& item : items) {
        if (item.is(ItemType::UnconnectedMessage)) {
            return item.data;
        }
    }
    throw FrameDecodeError(FrameDecodeError::Kind::UnexpectedReply,
                           "Reply carries no unconnected message item");
}

} // namespace cpeip::codec
