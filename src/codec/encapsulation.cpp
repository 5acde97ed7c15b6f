#include "cpeip/codec/encapsulation.hpp"

// カプセル化ヘッダーとコマンド固有データのエンコード/デコード。

#include "cpeip/errors.hpp"
#include "codec/little_endian.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace cpeip::codec {

using detail::appendLittleEndian;
using detail::readLittle16;
using detail::readLittle32;

bool EncapsulationMessage::operator==(const EncapsulationMessage& other) const {
    return command == other.command &&
           session_handle == other.session_handle &&
           status == other.status &&
           sender_context == other.sender_context &&
           options == other.options &&
           payload == other.payload;
}

bool CommandSpecificData::operator==(const CommandSpecificData& other) const {
    return interface_handle == other.interface_handle &&
           timeout == other.timeout &&
           encapsulated_packet == other.encapsulated_packet;
}

std::vector<std::uint8_t> encodeEncapsulation(const EncapsulationMessage& message) {
    if (message.payload.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("Encapsulation payload exceeds 65535 bytes");
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(EncapsulationMessage::kHeaderSize + message.payload.size());
    appendLittleEndian(frame, message.command, 2);
    appendLittleEndian(frame, message.length(), 2);
    appendLittleEndian(frame, message.session_handle, 4);
    appendLittleEndian(frame, message.status, 4);
    frame.insert(frame.end(), message.sender_context.begin(), message.sender_context.end());
    appendLittleEndian(frame, message.options, 4);
    frame.insert(frame.end(), message.payload.begin(), message.payload.end());
    return frame;
}

EncapsulationMessage decodeEncapsulation(const std::vector<std::uint8_t>& frame) {
    if (frame.size() < EncapsulationMessage::kHeaderSize) {
        throw FrameDecodeError(FrameDecodeError::Kind::FrameTooShort,
                               "Encapsulation frame too short: " + std::to_string(frame.size()) + " bytes");
    }

    EncapsulationMessage message;
    message.command = readLittle16(frame, 0);
    message.session_handle = readLittle32(frame, 4);
    message.status = readLittle32(frame, 8);
    std::copy(frame.begin() + 12, frame.begin() + 20, message.sender_context.begin());
    message.options = readLittle32(frame, 20);
    message.payload.assign(frame.begin() + EncapsulationMessage::kHeaderSize, frame.end());
    return message;
}

std::vector<std::uint8_t> encodeCommandSpecificData(const CommandSpecificData& data) {
    std::vector<std::uint8_t> payload;
    payload.reserve(6 + data.encapsulated_packet.size());
    appendLittleEndian(payload, data.interface_handle, 4);
    appendLittleEndian(payload, data.timeout, 2);
    payload.insert(payload.end(), data.encapsulated_packet.begin(), data.encapsulated_packet.end());
    return payload;
}

CommandSpecificData decodeCommandSpecificData(const std::vector<std::uint8_t>& payload) {
    constexpr std::size_t kPrefixSize = 6;
    if (payload.size() < kPrefixSize) {
        throw FrameDecodeError(FrameDecodeError::Kind::FrameTooShort,
                               "Command specific data too short: " + std::to_string(payload.size()) + " bytes");
    }

    CommandSpecificData data;
    data.interface_handle = readLittle32(payload, 0);
    data.timeout = readLittle16(payload, 4);
    data.encapsulated_packet.assign(payload.begin() + kPrefixSize, payload.end());
    return data;
}

} // namespace cpeip::codec
