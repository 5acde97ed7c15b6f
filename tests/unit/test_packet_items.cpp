#include "cpeip/codec/packet_item.hpp"
#include "cpeip/errors.hpp"

#include <cassert>
#include <cstdint>
#include <vector>

int main() {
    using namespace cpeip;
    using namespace cpeip::codec;

    // Test 1: A single item is preceded by a null address item
    {
        const auto packet = encodePacketItems({PacketItem(ItemType::UnconnectedMessage, {0x4C, 0x00})});
        const std::vector<std::uint8_t> expected = {
            0x02, 0x00,
            0x00, 0x00, 0x00, 0x00,
            0xB2, 0x00, 0x02, 0x00, 0x4C, 0x00};
        assert(packet == expected);

        const auto items = decodePacketItems(packet);
        assert(items.size() == 2);
        assert(items[0].is(ItemType::NullAddress));
        assert(items[0].data.empty());
        assert(items[1].is(ItemType::UnconnectedMessage));
        assert(findUnconnectedData(items) == std::vector<std::uint8_t>({0x4C, 0x00}));
    }

    // Test 2: Two or more items round trip unchanged
    {
        const std::vector<PacketItem> items = {
            PacketItem(ItemType::NullAddress, {}),
            PacketItem(ItemType::UnconnectedMessage, {0x01, 0x02, 0x03}),
            PacketItem(ItemType::SockaddrInfoOriginatorToTarget, {0xAA}),
        };
        assert(decodePacketItems(encodePacketItems(items)) == items);
    }

    // Test 3: Zero items encode as a bare count
    {
        const auto packet = encodePacketItems({});
        assert(packet == std::vector<std::uint8_t>({0x00, 0x00}));
        assert(decodePacketItems(packet).empty());
    }

    // Test 4: Declared length running past the buffer
    {
        const std::vector<std::uint8_t> packet = {0x01, 0x00, 0xB2, 0x00, 0x08, 0x00, 0x01, 0x02};
        bool threw = false;
        try {
            decodePacketItems(packet);
        } catch (const FrameDecodeError& e) {
            threw = e.kind() == FrameDecodeError::Kind::TruncatedItem;
        }
        assert(threw);
    }

    // Test 5: Count larger than the items present
    {
        const std::vector<std::uint8_t> packet = {0x03, 0x00, 0x00, 0x00, 0x00, 0x00};
        bool threw = false;
        try {
            decodePacketItems(packet);
        } catch (const FrameDecodeError& e) {
            threw = e.kind() == FrameDecodeError::Kind::TruncatedItem;
        }
        assert(threw);
    }

    // Test 6: Missing unconnected data item
    {
        bool threw = false;
        try {
            findUnconnectedData({PacketItem(ItemType::NullAddress, {})});
        } catch (const FrameDecodeError& e) {
            threw = e.kind() == FrameDecodeError::Kind::UnexpectedReply;
        }
        assert(threw);
    }

    return 0;
}
