#include "cpeip/value_codec.hpp"

// ValueCodec は型記述子に従い、コントローラ上のバイト表現と C++ の値を相互変換する。

#include "cpeip/errors.hpp"
#include "codec/little_endian.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace cpeip {

using codec::detail::appendLittleEndian;
using codec::detail::readLittleEndian;

namespace {

void requireBytes(std::size_t available, std::size_t required, const char* what) {
    if (available < required) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               std::string("Insufficient data for ") + what + " (" + std::to_string(available) +
                                   " < " + std::to_string(required) + ")");
    }
}

std::string decodeFixedString(const std::uint8_t* data, std::size_t max_size) {
    std::string text;
    for (std::size_t i = 0; i < max_size && data[i] != '\0'; ++i) {
        text.push_back(static_cast<char>(data[i]));
    }
    return text;
}

// 整数系の代替型を 64bit の符号付き/なしに寄せて範囲チェックする。
template <typename Target>
Target narrowInteger(const ElementValue& value) {
    return std::visit(
        [](const auto& v) -> Target {
            using Source = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<Source, std::string> || std::is_floating_point_v<Source>) {
                throw std::invalid_argument("Value does not match integer type");
            } else if constexpr (std::is_same_v<Source, bool>) {
                return static_cast<Target>(v ? 1 : 0);
            } else if constexpr (std::is_signed_v<Source>) {
                const auto wide = static_cast<std::int64_t>(v);
                if constexpr (std::is_signed_v<Target>) {
                    if (wide < std::numeric_limits<Target>::min() || wide > std::numeric_limits<Target>::max()) {
                        throw std::invalid_argument("Value out of range for target type");
                    }
                } else {
                    if (wide < 0 || static_cast<std::uint64_t>(wide) > std::numeric_limits<Target>::max()) {
                        throw std::invalid_argument("Value out of range for target type");
                    }
                }
                return static_cast<Target>(wide);
            } else {
                const auto wide = static_cast<std::uint64_t>(v);
                if (wide > static_cast<std::uint64_t>(std::numeric_limits<Target>::max())) {
                    throw std::invalid_argument("Value out of range for target type");
                }
                return static_cast<Target>(wide);
            }
        },
        value);
}

template <typename Target>
Target expectFloating(const ElementValue& value) {
    if (auto ptr = std::get_if<Target>(&value)) {
        return *ptr;
    }
    if (auto f = std::get_if<float>(&value)) {
        return static_cast<Target>(*f);
    }
    if (auto d = std::get_if<double>(&value)) {
        return static_cast<Target>(*d);
    }
    throw std::invalid_argument("Value does not match floating point type");
}

VariableValue toVariableValue(ElementValue element) {
    return std::visit(
        [](auto&& v) -> VariableValue {
            using Source = std::decay_t<decltype(v)>;
            return VariableValue(std::in_place_type<Source>, std::forward<decltype(v)>(v));
        },
        std::move(element));
}

ElementValue toElementValue(const VariableValue& value) {
    return std::visit(
        [](const auto& v) -> ElementValue {
            using Source = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<Source, std::vector<ElementValue>> ||
                          std::is_same_v<Source, std::vector<std::uint8_t>>) {
                throw std::invalid_argument("Array value supplied for a scalar variable");
            } else {
                return ElementValue(std::in_place_type<Source>, v);
            }
        },
        value);
}

void appendFixedString(const std::string& text, std::size_t slot, std::vector<std::uint8_t>& out) {
    if (text.size() > slot) {
        throw std::invalid_argument("String of " + std::to_string(text.size()) + " bytes exceeds element size " +
                                    std::to_string(slot));
    }
    out.insert(out.end(), text.begin(), text.end());
    out.insert(out.end(), slot - text.size(), 0x00);
}

} // namespace

std::uint64_t ValueCodec::fromBcd(std::uint64_t bcd) {
    std::uint64_t value = 0;
    std::uint64_t scale = 1;
    while (bcd != 0) {
        const std::uint64_t digit = bcd & 0x0F;
        if (digit > 9) {
            throw std::invalid_argument("Invalid BCD digit");
        }
        value += digit * scale;
        scale *= 10;
        bcd >>= 4;
    }
    return value;
}

std::uint64_t ValueCodec::toBcd(std::uint64_t value, std::size_t width) {
    std::uint64_t bcd = 0;
    std::size_t shift = 0;
    while (value != 0) {
        if (shift >= width * 8) {
            throw std::invalid_argument("Value does not fit BCD width");
        }
        bcd |= (value % 10) << shift;
        value /= 10;
        shift += 4;
    }
    return bcd;
}

ElementValue ValueCodec::decodeElement(std::uint8_t code, const std::uint8_t* data, std::size_t width) {
    const auto type = static_cast<CipDataType>(code);
    const std::size_t natural = elementaryWidth(type);
    if (natural == 0) {
        throw UnresolvedTypeError("No elementary decoding for type " + typeName(code));
    }
    if (width < natural) {
        throw FrameDecodeError(FrameDecodeError::Kind::ReplyTooShort,
                               typeName(code) + " requires " + std::to_string(natural) + " bytes, declared " +
                                   std::to_string(width));
    }

    const std::uint64_t raw = readLittleEndian(data, natural);
    switch (type) {
        case CipDataType::Boolean: {
            bool set = false;
            for (std::size_t i = 0; i < width; ++i) {
                set = set || data[i] != 0;
            }
            return set;
        }
        case CipDataType::Sint:
            return static_cast<std::int8_t>(raw);
        case CipDataType::Int:
            return static_cast<std::int16_t>(raw);
        case CipDataType::Dint:
        case CipDataType::Enum:
            return static_cast<std::int32_t>(raw);
        case CipDataType::Lint:
        case CipDataType::Time:
        case CipDataType::TimeNsec:
            return static_cast<std::int64_t>(raw);
        case CipDataType::Usint:
        case CipDataType::Byte:
            return static_cast<std::uint8_t>(raw);
        case CipDataType::Uint:
        case CipDataType::Word:
            return static_cast<std::uint16_t>(raw);
        case CipDataType::Udint:
        case CipDataType::Dword:
            return static_cast<std::uint32_t>(raw);
        case CipDataType::Ulint:
        case CipDataType::Lword:
        case CipDataType::DateNsec:
        case CipDataType::DateAndTimeNsec:
        case CipDataType::TimeOfDayNsec:
            return static_cast<std::uint64_t>(raw);
        case CipDataType::Real: {
            const auto bits = static_cast<std::uint32_t>(raw);
            float value;
            std::memcpy(&value, &bits, sizeof(float));
            return value;
        }
        case CipDataType::Lreal: {
            double value;
            std::memcpy(&value, &raw, sizeof(double));
            return value;
        }
        case CipDataType::UintBcd:
            return static_cast<std::uint16_t>(fromBcd(raw));
        case CipDataType::UdintBcd:
            return static_cast<std::uint32_t>(fromBcd(raw));
        case CipDataType::UlintBcd:
            return fromBcd(raw);
        default:
            break;
    }
    throw UnresolvedTypeError("No elementary decoding for type " + typeName(code));
}

void ValueCodec::encodeElement(std::uint8_t code, const ElementValue& value, std::size_t width,
                               std::vector<std::uint8_t>& out) {
    const auto type = static_cast<CipDataType>(code);
    const std::size_t natural = elementaryWidth(type);
    if (natural == 0) {
        throw std::invalid_argument("No elementary encoding for type " + typeName(code));
    }
    if (width < natural) {
        throw std::invalid_argument(typeName(code) + " requires " + std::to_string(natural) + " bytes");
    }

    std::uint64_t raw = 0;
    switch (type) {
        case CipDataType::Boolean:
            raw = narrowInteger<std::uint8_t>(value) != 0 ? 1 : 0;
            break;
        case CipDataType::Sint:
            raw = static_cast<std::uint8_t>(narrowInteger<std::int8_t>(value));
            break;
        case CipDataType::Int:
            raw = static_cast<std::uint16_t>(narrowInteger<std::int16_t>(value));
            break;
        case CipDataType::Dint:
        case CipDataType::Enum:
            raw = static_cast<std::uint32_t>(narrowInteger<std::int32_t>(value));
            break;
        case CipDataType::Lint:
        case CipDataType::Time:
        case CipDataType::TimeNsec:
            raw = static_cast<std::uint64_t>(narrowInteger<std::int64_t>(value));
            break;
        case CipDataType::Usint:
        case CipDataType::Byte:
            raw = narrowInteger<std::uint8_t>(value);
            break;
        case CipDataType::Uint:
        case CipDataType::Word:
            raw = narrowInteger<std::uint16_t>(value);
            break;
        case CipDataType::Udint:
        case CipDataType::Dword:
            raw = narrowInteger<std::uint32_t>(value);
            break;
        case CipDataType::Ulint:
        case CipDataType::Lword:
        case CipDataType::DateNsec:
        case CipDataType::DateAndTimeNsec:
        case CipDataType::TimeOfDayNsec:
            raw = narrowInteger<std::uint64_t>(value);
            break;
        case CipDataType::Real: {
            const float f = expectFloating<float>(value);
            std::uint32_t bits;
            std::memcpy(&bits, &f, sizeof(float));
            raw = bits;
            break;
        }
        case CipDataType::Lreal: {
            const double d = expectFloating<double>(value);
            std::memcpy(&raw, &d, sizeof(double));
            break;
        }
        case CipDataType::UintBcd:
        case CipDataType::UdintBcd:
        case CipDataType::UlintBcd:
            raw = toBcd(narrowInteger<std::uint64_t>(value), natural);
            break;
        default:
            throw std::invalid_argument("No elementary encoding for type " + typeName(code));
    }

    appendLittleEndian(out, raw, natural);
    out.insert(out.end(), width - natural, 0x00);
}

VariableValue ValueCodec::decode(const CipTypeDescriptor& type, const std::vector<std::uint8_t>& bytes) const {
    switch (type.kind) {
        case TypeKind::Scalar: {
            requireBytes(bytes.size(), type.size, typeName(type.code).c_str());
            return toVariableValue(decodeElement(type.code, bytes.data(), type.size));
        }
        case TypeKind::String: {
            const std::size_t length = std::min<std::size_t>(bytes.size(), type.size);
            return decodeFixedString(bytes.data(), length);
        }
        case TypeKind::Array: {
            if (!type.element) {
                throw UnresolvedTypeError("Array descriptor without element type");
            }
            const auto& element = *type.element;
            const std::size_t count = type.elementCount();
            const std::size_t width = element.size;
            requireBytes(bytes.size(), count * width, "array");

            if (element.kind == TypeKind::Scalar || element.kind == TypeKind::String) {
                std::vector<ElementValue> values;
                values.reserve(count);
                for (std::size_t i = 0; i < count; ++i) {
                    const std::uint8_t* base = bytes.data() + i * width;
                    if (element.kind == TypeKind::String) {
                        values.emplace_back(decodeFixedString(base, width));
                    } else {
                        values.push_back(decodeElement(element.code, base, width));
                    }
                }
                return values;
            }
            requireBytes(bytes.size(), type.size, "array");
            return std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + type.size);
        }
        case TypeKind::Structure: {
            requireBytes(bytes.size(), type.size, "structure");
            return std::vector<std::uint8_t>(bytes.begin(), bytes.begin() + type.size);
        }
        case TypeKind::AbbreviatedStructure:
            break;
    }
    throw UnresolvedTypeError("Cannot decode value of type " + typeName(type.code));
}

std::vector<std::uint8_t> ValueCodec::encode(const CipTypeDescriptor& type, const VariableValue& value) const {
    std::vector<std::uint8_t> out;
    switch (type.kind) {
        case TypeKind::Scalar: {
            encodeElement(type.code, toElementValue(value), type.size, out);
            return out;
        }
        case TypeKind::String: {
            const auto* text = std::get_if<std::string>(&value);
            if (!text) {
                throw std::invalid_argument("STRING variable requires std::string value");
            }
            if (text->size() > type.size) {
                throw std::invalid_argument("String of " + std::to_string(text->size()) +
                                            " bytes exceeds declared size " + std::to_string(type.size));
            }
            out.assign(text->begin(), text->end());
            return out;
        }
        case TypeKind::Array: {
            if (!type.element) {
                throw UnresolvedTypeError("Array descriptor without element type");
            }
            if (const auto* raw = std::get_if<std::vector<std::uint8_t>>(&value)) {
                out = *raw;
            } else if (const auto* elements = std::get_if<std::vector<ElementValue>>(&value)) {
                const auto& element = *type.element;
                if (elements->size() != type.elementCount()) {
                    throw std::invalid_argument("Array value has " + std::to_string(elements->size()) +
                                                " elements, expected " + std::to_string(type.elementCount()));
                }
                out.reserve(type.size);
                for (const auto& item : *elements) {
                    if (element.kind == TypeKind::String) {
                        const auto* text = std::get_if<std::string>(&item);
                        if (!text) {
                            throw std::invalid_argument("STRING array element requires std::string value");
                        }
                        appendFixedString(*text, element.size, out);
                    } else if (element.kind == TypeKind::Scalar) {
                        encodeElement(element.code, item, element.size, out);
                    } else {
                        throw std::invalid_argument("Arrays of structures require raw byte values");
                    }
                }
            } else {
                throw std::invalid_argument("ARRAY variable requires element list or raw bytes");
            }
            if (out.size() != type.size) {
                throw std::invalid_argument("Array value encodes to " + std::to_string(out.size()) +
                                            " bytes, declared " + std::to_string(type.size));
            }
            return out;
        }
        case TypeKind::Structure: {
            const auto* raw = std::get_if<std::vector<std::uint8_t>>(&value);
            if (!raw || raw->size() != type.size) {
                throw std::invalid_argument("STRUCT variable requires raw bytes of declared size");
            }
            return *raw;
        }
        case TypeKind::AbbreviatedStructure:
            break;
    }
    throw UnresolvedTypeError("Cannot encode value of type " + typeName(type.code));
}

} // namespace cpeip
