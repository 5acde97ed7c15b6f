#include "cpeip/cip_types.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace cpeip {

bool isElementaryScalar(std::uint8_t code) noexcept {
    switch (static_cast<CipDataType>(code)) {
        case CipDataType::Boolean:
        case CipDataType::Sint:
        case CipDataType::Int:
        case CipDataType::Dint:
        case CipDataType::Lint:
        case CipDataType::Usint:
        case CipDataType::Uint:
        case CipDataType::Udint:
        case CipDataType::Ulint:
        case CipDataType::Real:
        case CipDataType::Lreal:
        case CipDataType::Byte:
        case CipDataType::Word:
        case CipDataType::Dword:
        case CipDataType::Lword:
        case CipDataType::Time:
        case CipDataType::UintBcd:
        case CipDataType::UdintBcd:
        case CipDataType::UlintBcd:
        case CipDataType::Enum:
        case CipDataType::DateNsec:
        case CipDataType::TimeNsec:
        case CipDataType::DateAndTimeNsec:
        case CipDataType::TimeOfDayNsec:
            return true;
        default:
            return false;
    }
}

std::size_t elementaryWidth(CipDataType type) noexcept {
    switch (type) {
        case CipDataType::Boolean:
        case CipDataType::Sint:
        case CipDataType::Usint:
        case CipDataType::Byte:
            return 1;
        case CipDataType::Int:
        case CipDataType::Uint:
        case CipDataType::Word:
        case CipDataType::UintBcd:
            return 2;
        case CipDataType::Dint:
        case CipDataType::Udint:
        case CipDataType::Real:
        case CipDataType::Dword:
        case CipDataType::UdintBcd:
        case CipDataType::Enum:
            return 4;
        case CipDataType::Lint:
        case CipDataType::Ulint:
        case CipDataType::Lreal:
        case CipDataType::Lword:
        case CipDataType::Time:
        case CipDataType::UlintBcd:
        case CipDataType::DateNsec:
        case CipDataType::TimeNsec:
        case CipDataType::DateAndTimeNsec:
        case CipDataType::TimeOfDayNsec:
            return 8;
        default:
            return 0;
    }
}

std::string typeName(std::uint8_t code) {
    switch (static_cast<CipDataType>(code)) {
        case CipDataType::Boolean: return "BOOL";
        case CipDataType::Sint: return "SINT";
        case CipDataType::Int: return "INT";
        case CipDataType::Dint: return "DINT";
        case CipDataType::Lint: return "LINT";
        case CipDataType::Usint: return "USINT";
        case CipDataType::Uint: return "UINT";
        case CipDataType::Udint: return "UDINT";
        case CipDataType::Ulint: return "ULINT";
        case CipDataType::Real: return "REAL";
        case CipDataType::Lreal: return "LREAL";
        case CipDataType::String: return "STRING";
        case CipDataType::Byte: return "BYTE";
        case CipDataType::Word: return "WORD";
        case CipDataType::Dword: return "DWORD";
        case CipDataType::Lword: return "LWORD";
        case CipDataType::Time: return "TIME";
        case CipDataType::AbbreviatedStruct: return "ABBREVIATED STRUCT";
        case CipDataType::Struct: return "STRUCT";
        case CipDataType::Array: return "ARRAY";
        case CipDataType::UintBcd: return "UINT BCD";
        case CipDataType::UdintBcd: return "UDINT BCD";
        case CipDataType::UlintBcd: return "ULINT BCD";
        case CipDataType::Enum: return "ENUM";
        case CipDataType::DateNsec: return "DATE_NSEC";
        case CipDataType::TimeNsec: return "TIME_NSEC";
        case CipDataType::DateAndTimeNsec: return "DATE_AND_TIME_NSEC";
        case CipDataType::TimeOfDayNsec: return "TIME_OF_DAY_NSEC";
        case CipDataType::Union: return "UNION";
    }
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(code);
    return oss.str();
}

CipTypeDescriptor CipTypeDescriptor::Scalar(CipDataType type, std::uint32_t width) {
    return Scalar(static_cast<std::uint8_t>(type), width);
}

CipTypeDescriptor CipTypeDescriptor::Scalar(std::uint8_t code, std::uint32_t width) {
    CipTypeDescriptor descriptor;
    descriptor.kind = TypeKind::Scalar;
    descriptor.code = code;
    descriptor.size = width;
    return descriptor;
}

CipTypeDescriptor CipTypeDescriptor::String(std::uint32_t max_size) {
    CipTypeDescriptor descriptor;
    descriptor.kind = TypeKind::String;
    descriptor.code = static_cast<std::uint8_t>(CipDataType::String);
    descriptor.size = max_size;
    return descriptor;
}

CipTypeDescriptor CipTypeDescriptor::Array(CipTypeDescriptor element_type,
                                           std::vector<ArrayDimension> dims,
                                           std::uint32_t total_size) {
    CipTypeDescriptor descriptor;
    descriptor.kind = TypeKind::Array;
    descriptor.code = static_cast<std::uint8_t>(CipDataType::Array);
    descriptor.size = total_size;
    descriptor.dimensions = std::move(dims);
    descriptor.element = std::make_shared<const CipTypeDescriptor>(std::move(element_type));
    return descriptor;
}

CipTypeDescriptor CipTypeDescriptor::Structure(std::string name,
                                               std::uint32_t size_in_memory,
                                               std::vector<StructureMember> member_list) {
    CipTypeDescriptor descriptor;
    descriptor.kind = TypeKind::Structure;
    descriptor.code = static_cast<std::uint8_t>(CipDataType::Struct);
    descriptor.size = size_in_memory;
    descriptor.type_name = std::move(name);
    descriptor.members = std::move(member_list);
    return descriptor;
}

std::size_t CipTypeDescriptor::elementCount() const noexcept {
    if (dimensions.empty()) {
        return 0;
    }
    std::size_t count = 1;
    for (const auto& dim : dimensions) {
        count *= dim.extent;
    }
    return count;
}

bool CipTypeDescriptor::requiresSegmentedTransfer() const noexcept {
    return kind != TypeKind::Scalar;
}

} // namespace cpeip
