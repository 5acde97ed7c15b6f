#include "cpeip/codec/cip_message.hpp"

// CIP 要求/応答のエンコードとデコード。

#include "cpeip/errors.hpp"
#include "codec/little_endian.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cpeip::codec {

CipRequest::CipRequest(CipService service_code, std::vector<std::uint8_t> request_path,
                       std::vector<std::uint8_t> request_data)
    : service(static_cast<std::uint8_t>(service_code)),
      path(std::move(request_path)),
      data(std::move(request_data)) {}

std::vector<std::uint8_t> encodeCipRequest(const CipRequest& request) {
    if (request.path.size() % 2 != 0) {
        throw std::invalid_argument("CIP request path must be word aligned");
    }
    if (request.path.size() / 2 > 0xFF) {
        throw std::invalid_argument("CIP request path exceeds 255 words");
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(2 + request.path.size() + request.data.size());
    bytes.push_back(request.service);
    bytes.push_back(request.pathWords());
    bytes.insert(bytes.end(), request.path.begin(), request.path.end());
    bytes.insert(bytes.end(), request.data.begin(), request.data.end());
    return bytes;
}

CipReply decodeCipReply(const std::vector<std::uint8_t>& bytes) {
    constexpr std::size_t kPrefixSize = 4;
    if (bytes.size() < kPrefixSize) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               "CIP reply too short: " + std::to_string(bytes.size()) + " bytes");
    }

    const std::size_t data_offset = kPrefixSize + static_cast<std::size_t>(bytes[3]) * 2;
    if (bytes.size() < data_offset) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               "CIP reply shorter than its extended status (" +
                                   std::to_string(bytes.size()) + " < " + std::to_string(data_offset) + ")");
    }

    CipReply reply;
    reply.service = bytes[0];
    reply.reserved = bytes[1];
    reply.general_status = bytes[2];
    reply.extended_status.assign(bytes.begin() + kPrefixSize, bytes.begin() + data_offset);
    reply.data.assign(bytes.begin() + data_offset, bytes.end());
    return reply;
}

std::vector<std::uint8_t> encodeCipReply(const CipReply& reply) {
    if (reply.extended_status.size() % 2 != 0 || reply.extended_status.size() / 2 > 0xFF) {
        throw std::invalid_argument("Extended status must be a whole number of words (max 255)");
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(4 + reply.extended_status.size() + reply.data.size());
    bytes.push_back(reply.service);
    bytes.push_back(reply.reserved);
    bytes.push_back(reply.general_status);
    bytes.push_back(static_cast<std::uint8_t>(reply.extended_status.size() / 2));
    bytes.insert(bytes.end(), reply.extended_status.begin(), reply.extended_status.end());
    bytes.insert(bytes.end(), reply.data.begin(), reply.data.end());
    return bytes;
}

void ensureSuccess(const CipReply& reply) {
    if (reply.general_status != 0) {
        throw CipStatusError(reply.general_status, reply.extended_status);
    }
}

std::vector<std::uint8_t> makeReadTagData(std::uint16_t elements) {
    std::vector<std::uint8_t> data;
    detail::appendLittleEndian(data, elements, 2);
    return data;
}

std::vector<std::uint8_t> makeWriteTagData(std::uint8_t type_code, const std::vector<std::uint8_t>& value,
                                           std::uint16_t elements) {
    std::vector<std::uint8_t> data;
    data.reserve(4 + value.size());
    data.push_back(type_code);
    data.push_back(0x00);
    detail::appendLittleEndian(data, elements, 2);
    data.insert(data.end(), value.begin(), value.end());
    return data;
}

std::vector<std::uint8_t> stripReadTagHeader(const std::vector<std::uint8_t>& reply_data) {
    if (reply_data.size() < 2) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               "ReadTag reply has no type header (" + std::to_string(reply_data.size()) + " bytes)");
    }
    const std::size_t header_size = 2 + static_cast<std::size_t>(reply_data[1]);
    if (reply_data.size() < header_size) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               "ReadTag reply shorter than its type header (" +
                                   std::to_string(reply_data.size()) + " < " + std::to_string(header_size) + ")");
    }
    return std::vector<std::uint8_t>(reply_data.begin() + header_size, reply_data.end());
}

} // namespace cpeip::codec
