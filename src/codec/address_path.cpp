#include "cpeip/codec/address_path.hpp"

// CIP のパスセグメント（シンボリック/論理/単純データ）を組み立てる。

#include "codec/little_endian.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cpeip::codec {

using detail::appendLittleEndian;

namespace {

constexpr std::uint8_t kSymbolicSegment = 0x91;
constexpr std::uint8_t kClassSegment8 = 0x20;
constexpr std::uint8_t kClassSegment16 = 0x21;
constexpr std::uint8_t kInstanceSegment16 = 0x25;
constexpr std::uint8_t kElementSegment8 = 0x28;
constexpr std::uint8_t kElementSegment16 = 0x29;
constexpr std::uint8_t kElementSegment32 = 0x2A;
constexpr std::uint8_t kSimpleDataSegment = 0x80;
constexpr std::uint8_t kSimpleDataSegmentWords = 0x03;

std::uint32_t parseIndex(const std::string& text, const std::string& variable_name) {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid array index in variable name: " + variable_name);
    }
    const unsigned long long value = std::stoull(text);
    if (value > 0xFFFFFFFFULL) {
        throw std::invalid_argument("Array index out of range in variable name: " + variable_name);
    }
    return static_cast<std::uint32_t>(value);
}

// "Name[1,2]" を名前部分とインデックス列に分ける。
void appendMember(std::vector<std::uint8_t>& path, const std::string& member, const std::string& variable_name) {
    const std::size_t bracket = member.find('[');
    const std::string name = member.substr(0, bracket);
    const auto symbolic = makeSymbolicPath(name);
    path.insert(path.end(), symbolic.begin(), symbolic.end());
    if (bracket == std::string::npos) {
        return;
    }

    if (member.back() != ']') {
        throw std::invalid_argument("Unterminated array index in variable name: " + variable_name);
    }
    const std::string indices = member.substr(bracket + 1, member.size() - bracket - 2);
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = indices.find(',', start);
        const auto index = parseIndex(indices.substr(start, comma - start), variable_name);
        const auto element = makeElementSegment(index);
        path.insert(path.end(), element.begin(), element.end());
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
}

} // namespace

std::vector<std::uint8_t> makeSymbolicPath(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Symbolic segment name must not be empty");
    }
    if (name.size() > 0xFF) {
        throw std::invalid_argument("Symbolic segment name exceeds 255 bytes: " + name.substr(0, 32) + "...");
    }

    std::vector<std::uint8_t> path;
    path.reserve(2 + name.size() + 1);
    path.push_back(kSymbolicSegment);
    path.push_back(static_cast<std::uint8_t>(name.size()));
    path.insert(path.end(), name.begin(), name.end());
    if (path.size() % 2 != 0) {
        path.push_back(0x00);
    }
    return path;
}

std::vector<std::uint8_t> makeLogicalPath(std::uint16_t class_id, std::uint16_t instance_id) {
    std::vector<std::uint8_t> path;
    if (class_id <= 0xFF) {
        path.push_back(kClassSegment8);
        path.push_back(static_cast<std::uint8_t>(class_id));
    } else {
        path.push_back(kClassSegment16);
        path.push_back(0x00);
        appendLittleEndian(path, class_id, 2);
    }
    path.push_back(kInstanceSegment16);
    path.push_back(0x00);
    appendLittleEndian(path, instance_id, 2);
    return path;
}

std::vector<std::uint8_t> makeLogicalPath(ObjectClass class_id, std::uint16_t instance_id) {
    return makeLogicalPath(static_cast<std::uint16_t>(class_id), instance_id);
}

std::vector<std::uint8_t> makeElementSegment(std::uint32_t index) {
    std::vector<std::uint8_t> segment;
    if (index <= 0xFF) {
        segment.push_back(kElementSegment8);
        segment.push_back(static_cast<std::uint8_t>(index));
    } else if (index <= 0xFFFF) {
        segment.push_back(kElementSegment16);
        segment.push_back(0x00);
        appendLittleEndian(segment, index, 2);
    } else {
        segment.push_back(kElementSegment32);
        segment.push_back(0x00);
        appendLittleEndian(segment, index, 4);
    }
    return segment;
}

std::vector<std::uint8_t> makeVariablePath(const std::string& variable_name) {
    if (variable_name.empty()) {
        throw std::invalid_argument("Variable name must not be empty");
    }

    std::vector<std::uint8_t> path;
    std::size_t start = 0;
    while (true) {
        const std::size_t dot = variable_name.find('.', start);
        const std::string member = variable_name.substr(start, dot - start);
        if (member.empty()) {
            throw std::invalid_argument("Empty member in variable name: " + variable_name);
        }
        appendMember(path, member, variable_name);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return path;
}

std::vector<std::uint8_t> SimpleDataSegment::encode() const {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(8);
    bytes.push_back(kSimpleDataSegment);
    bytes.push_back(kSimpleDataSegmentWords);
    appendLittleEndian(bytes, offset, 4);
    appendLittleEndian(bytes, size, 2);
    return bytes;
}

std::vector<std::uint8_t> appendSimpleDataSegment(std::vector<std::uint8_t> path, const SimpleDataSegment& segment) {
    const auto bytes = segment.encode();
    path.insert(path.end(), bytes.begin(), bytes.end());
    return path;
}

} // namespace cpeip::codec
