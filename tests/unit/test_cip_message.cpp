#include "cpeip/codec/cip_message.hpp"
#include "cpeip/errors.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

int main() {
    using namespace cpeip;
    using namespace cpeip::codec;

    // Test 1: ReadTag request
    {
        CipRequest request(CipService::ReadTag, {0x91, 0x07, 'C', 'o', 'u', 'n', 't', 'e', 'r', 0x00},
                           makeReadTagData());
        const auto bytes = encodeCipRequest(request);
        const std::vector<std::uint8_t> expected = {
            0x4C, 0x05, 0x91, 0x07, 'C', 'o', 'u', 'n', 't', 'e', 'r', 0x00, 0x01, 0x00};
        assert(bytes == expected);
    }

    // Test 2: Odd path length is rejected
    {
        bool threw = false;
        try {
            encodeCipRequest(CipRequest(CipService::GetAttributeAll, {0x20, 0x6B, 0x25}));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Test 3: Data starts after the extended status words
    {
        const std::vector<std::uint8_t> bytes = {0xCC, 0x00, 0x00, 0x00, 0xC3, 0x00, 0x2A, 0x00};
        const auto reply = decodeCipReply(bytes);
        assert(reply.service == 0xCC);
        assert(reply.ok());
        assert(reply.extended_status.empty());
        assert(reply.data == std::vector<std::uint8_t>({0xC3, 0x00, 0x2A, 0x00}));

        const std::vector<std::uint8_t> with_status = {0xCC, 0x00, 0xFF, 0x01, 0x05, 0x21, 0x99};
        const auto failed = decodeCipReply(with_status);
        assert(!failed.ok());
        assert(failed.extended_status == std::vector<std::uint8_t>({0x05, 0x21}));
        assert(failed.data == std::vector<std::uint8_t>({0x99}));
        assert(encodeCipReply(failed) == with_status);
    }

    // Test 4: Truncated replies
    {
        bool threw = false;
        try {
            decodeCipReply({0xCC, 0x00, 0x00});
        } catch (const FrameDecodeError& e) {
            threw = e.kind() == FrameDecodeError::Kind::ReplyTooShort;
        }
        assert(threw);

        threw = false;
        try {
            decodeCipReply({0xCC, 0x00, 0x01, 0x02, 0x00, 0x00});
        } catch (const FrameDecodeError& e) {
            threw = e.kind() == FrameDecodeError::Kind::ReplyTooShort;
        }
        assert(threw);
    }

    // Test 5: Non-zero general status raises with the status preserved
    {
        CipReply reply;
        reply.service = 0xCD;
        reply.general_status = 0x05;
        reply.extended_status = {0x01, 0x02};

        bool threw = false;
        try {
            ensureSuccess(reply);
        } catch (const CipStatusError& e) {
            threw = true;
            assert(e.generalStatus() == 0x05);
            assert(e.extendedStatus() == std::vector<std::uint8_t>({0x01, 0x02}));
        }
        assert(threw);
    }

    // Test 6: Tag service data helpers
    {
        assert(makeWriteTagData(0xD0, {0x05, 0x00, 'H', 'E', 'L', 'L', 'O'}) ==
               std::vector<std::uint8_t>({0xD0, 0x00, 0x01, 0x00, 0x05, 0x00, 'H', 'E', 'L', 'L', 'O'}));

        assert(stripReadTagHeader({0xC3, 0x00, 0x2A, 0x00}) == std::vector<std::uint8_t>({0x2A, 0x00}));
        // 付加情報付きの型ヘッダー
        assert(stripReadTagHeader({0xA0, 0x02, 0x34, 0x12, 0x01}) == std::vector<std::uint8_t>({0x01}));

        bool threw = false;
        try {
            stripReadTagHeader({0xA0, 0x02, 0x34});
        } catch (const FrameDecodeError&) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
