#include "cpeip/codec/address_path.hpp"
#include "cpeip/errors.hpp"
#include "cpeip/segmented_transfer.hpp"
#include "util/eip_frames.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cpeip;
using namespace cpeip::testutil;

namespace {

struct Chunk {
    std::uint32_t offset = 0;
    std::uint16_t size = 0;
    std::vector<std::uint8_t> data;
};

/// 要求パス末尾の単純データセグメントを取り出す
Chunk chunkOf(const codec::CipRequest& request) {
    const auto& path = request.path;
    assert(path.size() >= 8);
    const std::size_t base = path.size() - 8;
    assert(path[base] == 0x80 && path[base + 1] == 0x03);

    Chunk chunk;
    chunk.offset = static_cast<std::uint32_t>(path[base + 2] | (path[base + 3] << 8) | (path[base + 4] << 16) |
                                              (path[base + 5] << 24));
    chunk.size = static_cast<std::uint16_t>(path[base + 6] | (path[base + 7] << 8));
    chunk.data = request.data;
    return chunk;
}

/// value の [offset, offset + size) を型ヘッダー付きで返す疑似コントローラ
struct FakeTag {
    std::vector<std::uint8_t> value;
    std::uint8_t type_code = 0xC6;
    bool string_prefix = false;
    std::size_t fail_at = 0;  // 1始まり。0なら失敗しない
    std::vector<Chunk> chunks;

    CipExchange exchange() {
        return [this](const codec::CipRequest& request) {
            chunks.push_back(chunkOf(request));
            if (fail_at != 0 && chunks.size() == fail_at) {
                return errorReply(request.service, 0x1E);
            }
            if (request.service == 0x4D) {
                return okReply(request.service, {});
            }
            const auto& chunk = chunks.back();
            std::vector<std::uint8_t> data{type_code, 0x00};
            if (string_prefix) {
                putLe(data, value.size(), 2);
            }
            const std::size_t end = std::min<std::size_t>(chunk.offset + chunk.size, value.size());
            if (chunk.offset < end) {
                data.insert(data.end(), value.begin() + chunk.offset, value.begin() + static_cast<std::ptrdiff_t>(end));
            }
            return okReply(request.service, data);
        };
    }
};

std::vector<std::uint8_t> pattern(std::size_t size) {
    std::vector<std::uint8_t> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>(i * 7);
    }
    return bytes;
}

CipTypeDescriptor usintArray(std::uint32_t count) {
    return CipTypeDescriptor::Array(CipTypeDescriptor::Scalar(CipDataType::Usint, 1), {ArrayDimension{count, 0}},
                                    count);
}

} // namespace

int main() {
    const TransferLimits limits{494, 400};

    // Test 1: Read issues ceil(S / C) chunks and accumulates S bytes
    for (std::uint32_t size : {0U, 1U, 493U, 494U, 495U, 1000U, 1482U}) {
        FakeTag tag;
        tag.value = pattern(size);
        SegmentedTransfer transfer(tag.exchange(), limits);

        const auto bytes = transfer.read("Buffer", usintArray(size));
        assert(bytes == tag.value);
        assert(tag.chunks.size() == (size + 493) / 494);
        for (std::size_t i = 0; i < tag.chunks.size(); ++i) {
            assert(tag.chunks[i].offset == i * 494);
            assert(tag.chunks[i].size == std::min<std::uint32_t>(494, size - tag.chunks[i].offset));
            assert(tag.chunks[i].data == std::vector<std::uint8_t>({0x01, 0x00}));
        }
    }

    // Test 2: Read path is the symbolic path plus the data segment
    {
        FakeTag tag;
        tag.value = pattern(4);
        SegmentedTransfer transfer(tag.exchange(), limits);
        transfer.read("Buf", usintArray(4));
        assert(tag.chunks.size() == 1);
        assert(tag.chunks[0].offset == 0 && tag.chunks[0].size == 4);
    }

    // Test 3: String chunks drop the repeated length prefix
    {
        FakeTag tag;
        tag.type_code = 0xD0;
        tag.string_prefix = true;
        tag.value = {'H', 'E', 'L', 'L', 'O', 0, 0, 0, 0, 0};
        SegmentedTransfer transfer(tag.exchange(), TransferLimits{4, 400});

        const auto bytes = transfer.read("Message", CipTypeDescriptor::String(10));
        assert(bytes == tag.value);
        assert(tag.chunks.size() == 3);
    }

    // Test 4: An error reply on any chunk aborts the read
    {
        FakeTag tag;
        tag.value = pattern(1000);
        tag.fail_at = 2;
        SegmentedTransfer transfer(tag.exchange(), limits);

        bool threw = false;
        try {
            transfer.read("Buffer", usintArray(1000));
        } catch (const CipStatusError& e) {
            threw = e.generalStatus() == 0x1E;
        }
        assert(threw);
        assert(tag.chunks.size() == 2);
    }

    // Test 5: A short accumulated value is a decode error
    {
        FakeTag tag;
        tag.value = pattern(100);
        SegmentedTransfer transfer(tag.exchange(), limits);

        bool threw = false;
        try {
            transfer.read("Buffer", usintArray(200));
        } catch (const FrameDecodeError&) {
            threw = true;
        }
        assert(threw);
    }

    // Test 6: Array writes in 400-byte chunks at fixed offsets
    {
        FakeTag tag;
        SegmentedTransfer transfer(tag.exchange(), limits);
        const auto payload = pattern(1000);
        transfer.write("Buffer", usintArray(1000), payload);

        assert(tag.chunks.size() == 3);
        const std::uint32_t offsets[] = {0, 400, 800};
        const std::uint16_t sizes[] = {400, 400, 200};
        for (std::size_t i = 0; i < 3; ++i) {
            const auto& chunk = tag.chunks[i];
            assert(chunk.offset == offsets[i]);
            assert(chunk.size == sizes[i]);
            assert(chunk.data[0] == 0xC6 && chunk.data[1] == 0x00);
            assert(chunk.data[2] == 0x01 && chunk.data[3] == 0x00);
            assert(chunk.data.size() == 4U + sizes[i]);
            assert(std::equal(chunk.data.begin() + 4, chunk.data.end(), payload.begin() + offsets[i]));
        }
    }

    // Test 7: String write carries the payload length of each chunk
    {
        FakeTag tag;
        SegmentedTransfer transfer(tag.exchange(), limits);
        transfer.write("Message", CipTypeDescriptor::String(10), {'H', 'E', 'L', 'L', 'O'});

        assert(tag.chunks.size() == 1);
        assert(tag.chunks[0].offset == 0 && tag.chunks[0].size == 10);
        assert(tag.chunks[0].data ==
               std::vector<std::uint8_t>({0xD0, 0x00, 0x01, 0x00, 0x05, 0x00, 'H', 'E', 'L', 'L', 'O'}));
    }

    // Test 8: Long string shorter than its declared size
    {
        FakeTag tag;
        SegmentedTransfer transfer(tag.exchange(), limits);
        transfer.write("Log", CipTypeDescriptor::String(900), std::vector<std::uint8_t>(450, 'x'));

        assert(tag.chunks.size() == 3);
        assert(tag.chunks[0].data[4] == 0x90 && tag.chunks[0].data[5] == 0x01);  // 400
        assert(tag.chunks[1].offset == 400);
        assert(tag.chunks[1].data[4] == 50 && tag.chunks[1].data.size() == 6U + 50);
        assert(tag.chunks[2].offset == 800 && tag.chunks[2].size == 100);
        assert(tag.chunks[2].data.size() == 6);
    }

    // Test 9: Rejected writes
    {
        FakeTag tag;
        SegmentedTransfer transfer(tag.exchange(), limits);

        bool threw = false;
        try {
            transfer.write("Pair", CipTypeDescriptor::Structure("PairType", 4, {}), {0, 0, 0, 0});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            transfer.write("Message", CipTypeDescriptor::String(2), {'A', 'B', 'C'});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(tag.chunks.empty());
    }

    // Test 10: Zero-size writes send nothing
    {
        FakeTag tag;
        SegmentedTransfer transfer(tag.exchange(), limits);
        transfer.write("Empty", usintArray(0), {});
        assert(tag.chunks.empty());
    }

    // Test 11: Declared sizes near the 32-bit limit end after the last chunk
    {
        const TransferLimits wide{0xFFF0, 0xFFF0};
        const auto huge = CipTypeDescriptor::String(0xFFFFFFFFU);
        const std::size_t expected_chunks = 65553;  // ceil(0xFFFFFFFF / 0xFFF0)

        FakeTag tag;
        tag.type_code = 0xD0;
        tag.string_prefix = true;
        SegmentedTransfer transfer(tag.exchange(), wide);

        const auto bytes = transfer.read("Huge", huge);
        assert(bytes.empty());
        assert(tag.chunks.size() == expected_chunks);
        assert(tag.chunks.back().offset == 0xFFFFFF00U);
        assert(tag.chunks.back().size == 0xFF);

        FakeTag sink;
        SegmentedTransfer writer(sink.exchange(), wide);
        writer.write("Huge", huge, {});
        assert(sink.chunks.size() == expected_chunks);
        assert(sink.chunks.back().offset == 0xFFFFFF00U);
    }

    return 0;
}
