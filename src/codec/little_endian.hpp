#pragma once

// コーデック内部で共有するリトルエンディアンの読み書きヘルパ。

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cpeip::codec::detail {

inline void appendLittleEndian(std::vector<std::uint8_t>& buffer, std::uint64_t value, std::size_t width) {
    for (std::size_t i = 0; i < width; ++i) {
        buffer.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// 呼び出し側で範囲チェック済みであること。
inline std::uint64_t readLittleEndian(const std::uint8_t* data, std::size_t width) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        value |= static_cast<std::uint64_t>(data[i]) << (8 * i);
    }
    return value;
}

inline std::uint16_t readLittle16(const std::vector<std::uint8_t>& buffer, std::size_t offset) {
    return static_cast<std::uint16_t>(buffer[offset] | (buffer[offset + 1] << 8));
}

inline std::uint32_t readLittle32(const std::vector<std::uint8_t>& buffer, std::size_t offset) {
    return static_cast<std::uint32_t>(readLittleEndian(buffer.data() + offset, 4));
}

} // namespace cpeip::codec::detail
