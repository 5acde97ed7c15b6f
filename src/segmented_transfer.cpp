#include "cpeip/segmented_transfer.hpp"

#include "cpeip/codec/address_path.hpp"
#include "cpeip/codec/cip_message.hpp"
#include "cpeip/errors.hpp"
#include "cpeip/logging.hpp"
#include "codec/little_endian.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cpeip {

namespace {

// 文字列の各チャンクには2バイトの長さプレフィックスが付く
constexpr std::size_t kStringLengthPrefix = 2;

// 宣言サイズはコントローラ由来なので、事前確保はこの大きさまでにとどめる
constexpr std::size_t kMaxReserve = 64 * 1024;

std::uint8_t writeTypeCode(const CipTypeDescriptor& type) {
    switch (type.kind) {
        case TypeKind::String:
            return static_cast<std::uint8_t>(CipDataType::String);
        case TypeKind::Array:
            if (!type.element || type.element->kind == TypeKind::Structure ||
                type.element->kind == TypeKind::AbbreviatedStructure) {
                throw std::invalid_argument("Writing arrays of structures is not supported");
            }
            return type.element->code;
        case TypeKind::Scalar:
            return type.code;
        default:
            throw std::invalid_argument("Writing " + typeName(type.code) + " values is not supported");
    }
}

} // namespace

SegmentedTransfer::SegmentedTransfer(CipExchange exchange, TransferLimits limits)
    : exchange_(std::move(exchange)), limits_(limits) {
    if (limits_.read_chunk_size == 0 || limits_.write_chunk_size == 0) {
        throw std::invalid_argument("Transfer chunk sizes must be non-zero");
    }
}

std::vector<std::uint8_t> SegmentedTransfer::read(const std::string& variable_name, const CipTypeDescriptor& type) {
    const auto base_path = codec::makeVariablePath(variable_name);
    const std::size_t prefix = (type.kind == TypeKind::String) ? kStringLengthPrefix : 0;
    const std::uint64_t size = type.size;
    const std::uint64_t max_chunk = limits_.read_chunk_size;

    std::vector<std::uint8_t> value;
    value.reserve(std::min<std::size_t>(type.size, kMaxReserve));

    // オフセットは64bitで進める。32bitでは上限付近の宣言サイズで折り返してしまう
    for (std::uint64_t offset = 0; offset < size; offset += max_chunk) {
        const auto chunk = static_cast<std::uint16_t>(std::min(size - offset, max_chunk));
        CPEIP_LOG_DEBUG("Read ", variable_name, " offset=", offset, " size=", chunk);

        const codec::SimpleDataSegment segment{static_cast<std::uint32_t>(offset), chunk};
        codec::CipRequest request(codec::CipService::ReadTag, codec::appendSimpleDataSegment(base_path, segment),
                                  codec::makeReadTagData());
        const auto reply = exchange_(request);
        codec::ensureSuccess(reply);

        auto bytes = codec::stripReadTagHeader(reply.data);
        if (bytes.size() < prefix) {
            throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                                   "String chunk reply has no length prefix");
        }
        value.insert(value.end(), bytes.begin() + static_cast<std::ptrdiff_t>(prefix), bytes.end());
    }

    // 文字列はNUL終端までが値なので、宣言サイズに満たなくてもよい
    if (type.kind != TypeKind::String && value.size() < type.size) {
        std::ostringstream oss;
        oss << "Segmented read of " << variable_name << " returned " << value.size()
            << " bytes, expected " << type.size;
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort, oss.str());
    }
    if (value.size() > type.size) {
        value.resize(type.size);
    }
    return value;
}

void SegmentedTransfer::write(const std::string& variable_name, const CipTypeDescriptor& type,
                              const std::vector<std::uint8_t>& payload) {
    const std::uint8_t type_code = writeTypeCode(type);
    if (payload.size() > type.size) {
        std::ostringstream oss;
        oss << "Value for " << variable_name << " is " << payload.size() << " bytes, declared size is " << type.size;
        throw std::invalid_argument(oss.str());
    }

    const auto base_path = codec::makeVariablePath(variable_name);
    const std::uint64_t size = type.size;
    const std::uint64_t max_chunk = limits_.write_chunk_size;

    for (std::uint64_t offset = 0; offset < size; offset += max_chunk) {
        const auto chunk = static_cast<std::uint16_t>(std::min(size - offset, max_chunk));

        // 文字列は宣言サイズより短いことがあるので、チャンクに対応する部分だけを送る
        const auto begin = static_cast<std::size_t>(std::min<std::uint64_t>(offset, payload.size()));
        const auto end = static_cast<std::size_t>(std::min<std::uint64_t>(offset + chunk, payload.size()));

        std::vector<std::uint8_t> value;
        if (type.kind == TypeKind::String) {
            codec::detail::appendLittleEndian(value, end - begin, 2);
        }
        value.insert(value.end(), payload.begin() + static_cast<std::ptrdiff_t>(begin),
                     payload.begin() + static_cast<std::ptrdiff_t>(end));

        CPEIP_LOG_DEBUG("Write ", variable_name, " offset=", offset, " size=", chunk, " payload=", end - begin);

        const codec::SimpleDataSegment segment{static_cast<std::uint32_t>(offset), chunk};
        codec::CipRequest request(codec::CipService::WriteTag, codec::appendSimpleDataSegment(base_path, segment),
                                  codec::makeWriteTagData(type_code, value));
        codec::ensureSuccess(exchange_(request));
    }
}

} // namespace cpeip
