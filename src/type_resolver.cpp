#include "cpeip/type_resolver.hpp"

#include "cpeip/errors.hpp"
#include "cpeip/logging.hpp"
#include "codec/little_endian.hpp"

#include <cstddef>
#include <set>
#include <sstream>
#include <utility>

namespace cpeip {

namespace {

using codec::detail::readLittle16;
using codec::detail::readLittle32;

void requireLength(const std::vector<std::uint8_t>& data, std::size_t expected, const char* object_name) {
    if (data.size() < expected) {
        std::ostringstream oss;
        oss << object_name << " attributes too short: " << data.size() << " bytes, expected " << expected;
        throw FrameDecodeError(FrameDecodeError::Kind::AttributeTooShort, oss.str());
    }
}

// 次元数0の配列は要素数が定まらないので解決できない型として扱う
std::vector<ArrayDimension> makeDimensions(const std::vector<std::uint32_t>& extents,
                                           const std::vector<std::uint32_t>& starts) {
    if (extents.empty()) {
        throw UnresolvedTypeError("Array has no dimensions");
    }
    std::vector<ArrayDimension> dims;
    dims.reserve(extents.size());
    for (std::size_t i = 0; i < extents.size(); ++i) {
        dims.push_back(ArrayDimension{extents[i], i < starts.size() ? starts[i] : 0});
    }
    return dims;
}

// 要素型のリンクがない配列は要素コードと総サイズから要素幅を求める
CipTypeDescriptor elementFromCode(std::uint8_t element_code, std::uint32_t total_size,
                                  const std::vector<ArrayDimension>& dims) {
    std::uint64_t count = 1;
    for (const auto& dim : dims) {
        count *= dim.extent;
    }
    if (count == 0 || total_size % count != 0) {
        std::ostringstream oss;
        oss << "Array size " << total_size << " is not divisible into " << count << " elements";
        throw UnresolvedTypeError(oss.str());
    }
    const auto width = static_cast<std::uint32_t>(total_size / count);
    if (element_code == static_cast<std::uint8_t>(CipDataType::String)) {
        return CipTypeDescriptor::String(width);
    }
    if (isElementaryScalar(element_code)) {
        return CipTypeDescriptor::Scalar(element_code, width);
    }
    throw UnresolvedTypeError("Array element type " + typeName(element_code) + " has no type object link");
}

std::uint16_t toInstance16(std::uint32_t instance_id) {
    if (instance_id > 0xFFFF) {
        std::ostringstream oss;
        oss << "Instance id " << instance_id << " does not fit a 16-bit logical segment";
        throw UnresolvedTypeError(oss.str());
    }
    return static_cast<std::uint16_t>(instance_id);
}

} // namespace

VariableObjectAttributes VariableObjectAttributes::parse(const std::vector<std::uint8_t>& data) {
    requireLength(data, 8, "Variable Object");

    VariableObjectAttributes attributes;
    attributes.size = readLittle32(data, 0);
    attributes.data_type = data[4];
    attributes.array_data_type = data[5];
    const std::size_t dims = data[6];  // data[7] はパディング

    requireLength(data, 24 + dims * 8, "Variable Object");
    for (std::size_t i = 0; i < dims; ++i) {
        attributes.extents.push_back(readLittle32(data, 8 + i * 4));
    }
    attributes.bit_number = data[16 + dims * 4];
    attributes.type_instance_id = readLittle32(data, 20 + dims * 4);
    for (std::size_t i = 0; i < dims; ++i) {
        attributes.starts.push_back(readLittle32(data, 24 + dims * 4 + i * 4));
    }
    return attributes;
}

VariableTypeAttributes VariableTypeAttributes::parse(const std::vector<std::uint8_t>& data) {
    requireLength(data, 8, "Variable Type Object");

    VariableTypeAttributes attributes;
    attributes.size_in_memory = readLittle32(data, 0);
    attributes.data_type = data[5];
    attributes.array_data_type = data[6];
    const std::size_t dims = data[7];

    requireLength(data, 17 + dims * 4, "Variable Type Object");
    for (std::size_t i = 0; i < dims; ++i) {
        attributes.extents.push_back(readLittle32(data, 8 + i * 4));
    }
    attributes.member_count = readLittle16(data, 8 + dims * 4);
    attributes.crc = readLittle16(data, 14 + dims * 4);

    const std::size_t name_length = data[16 + dims * 4];
    // 名前の後ろは偶数境界に揃えられる
    const std::size_t pad = (name_length % 2 == 0) ? 1 : 0;
    const std::size_t name_offset = 17 + dims * 4;
    const std::size_t tail = pad + name_offset + name_length;

    requireLength(data, tail + 8 + dims * 4, "Variable Type Object");
    const auto name_begin = data.begin() + static_cast<std::ptrdiff_t>(name_offset);
    attributes.name.assign(name_begin, name_begin + static_cast<std::ptrdiff_t>(name_length));
    attributes.next_instance_id = readLittle32(data, tail);
    attributes.nesting_instance_id = readLittle32(data, tail + 4);
    for (std::size_t i = 0; i < dims; ++i) {
        attributes.starts.push_back(readLittle32(data, tail + 8 + i * 4));
    }
    return attributes;
}

TypeResolver::TypeResolver(CipExchange exchange, std::uint32_t max_chain_length)
    : exchange_(std::move(exchange)), max_chain_length_(max_chain_length) {}

codec::CipReply TypeResolver::getAttributeAll(codec::ObjectClass class_id, std::uint32_t instance_id) {
    codec::CipRequest request(codec::CipService::GetAttributeAll,
                              codec::makeLogicalPath(class_id, toInstance16(instance_id)));
    auto reply = exchange_(request);
    codec::ensureSuccess(reply);
    return reply;
}

VariableTypeAttributes TypeResolver::readTypeObject(std::uint32_t instance_id) {
    return VariableTypeAttributes::parse(
        getAttributeAll(codec::ObjectClass::VariableTypeObject, instance_id).data);
}

std::uint16_t TypeResolver::variableCount() {
    const auto reply = getAttributeAll(codec::ObjectClass::TagNameServer, 0);
    requireLength(reply.data, 4, "Tag Name Server");
    return readLittle16(reply.data, 2);
}

std::string TypeResolver::variableName(std::uint16_t instance_id) {
    const auto reply = getAttributeAll(codec::ObjectClass::TagNameServer, instance_id);
    requireLength(reply.data, 5, "Tag Name Server");
    const std::size_t length = reply.data[4];
    requireLength(reply.data, 5 + length, "Tag Name Server");
    return std::string(reply.data.begin() + 5, reply.data.begin() + 5 + static_cast<std::ptrdiff_t>(length));
}

std::vector<std::string> TypeResolver::listVariableNames() {
    const auto count = variableCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (std::uint32_t instance = 1; instance <= count; ++instance) {
        names.push_back(variableName(static_cast<std::uint16_t>(instance)));
    }
    return names;
}

CipTypeDescriptor TypeResolver::resolveVariable(std::uint16_t instance_id) {
    const auto attributes = VariableObjectAttributes::parse(
        getAttributeAll(codec::ObjectClass::VariableObject, instance_id).data);

    CipTypeDescriptor descriptor;
    const auto code = static_cast<CipDataType>(attributes.data_type);
    if (code == CipDataType::Array) {
        auto dims = makeDimensions(attributes.extents, attributes.starts);
        CipTypeDescriptor element;
        if (attributes.type_instance_id != 0) {
            const auto element_type = readTypeObject(attributes.type_instance_id);
            element = describeTypeObject(element_type, attributes.type_instance_id, 1);
        } else {
            element = elementFromCode(attributes.array_data_type, attributes.size, dims);
        }
        descriptor = CipTypeDescriptor::Array(std::move(element), std::move(dims), attributes.size);
    } else if (code == CipDataType::Struct) {
        if (attributes.type_instance_id == 0) {
            throw UnresolvedTypeError("Structure variable has no type object link");
        }
        const auto type_object = readTypeObject(attributes.type_instance_id);
        descriptor = describeStructure(type_object, attributes.type_instance_id, 1);
    } else if (code == CipDataType::String) {
        descriptor = CipTypeDescriptor::String(attributes.size);
    } else if (isElementaryScalar(attributes.data_type)) {
        descriptor = CipTypeDescriptor::Scalar(attributes.data_type, attributes.size);
    } else {
        throw UnresolvedTypeError("Unsupported data type " + typeName(attributes.data_type));
    }
    descriptor.instance_id = instance_id;
    return descriptor;
}

CipTypeDescriptor TypeResolver::describeTypeObject(const VariableTypeAttributes& attributes,
                                                   std::uint32_t instance_id, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        throw ChainTooLongError("Type nesting exceeds depth " + std::to_string(kMaxNestingDepth));
    }

    CipTypeDescriptor descriptor;
    const auto code = static_cast<CipDataType>(attributes.data_type);
    if (code == CipDataType::Struct) {
        return describeStructure(attributes, instance_id, depth);
    }
    if (code == CipDataType::Array) {
        auto dims = makeDimensions(attributes.extents, attributes.starts);
        CipTypeDescriptor element;
        if (attributes.nesting_instance_id != 0) {
            const auto element_type = readTypeObject(attributes.nesting_instance_id);
            element = describeTypeObject(element_type, attributes.nesting_instance_id, depth + 1);
        } else {
            element = elementFromCode(attributes.array_data_type, attributes.size_in_memory, dims);
        }
        descriptor = CipTypeDescriptor::Array(std::move(element), std::move(dims), attributes.size_in_memory);
    } else if (code == CipDataType::String) {
        descriptor = CipTypeDescriptor::String(attributes.size_in_memory);
    } else if (isElementaryScalar(attributes.data_type)) {
        descriptor = CipTypeDescriptor::Scalar(attributes.data_type, attributes.size_in_memory);
    } else {
        throw UnresolvedTypeError("Unsupported data type " + typeName(attributes.data_type) +
                                  " in type object '" + attributes.name + "'");
    }
    descriptor.instance_id = instance_id;
    return descriptor;
}

CipTypeDescriptor TypeResolver::describeStructure(const VariableTypeAttributes& attributes,
                                                  std::uint32_t instance_id, std::size_t depth) {
    if (depth > kMaxNestingDepth) {
        throw ChainTooLongError("Type nesting exceeds depth " + std::to_string(kMaxNestingDepth));
    }
    if (attributes.data_type != static_cast<std::uint8_t>(CipDataType::Struct)) {
        throw UnresolvedTypeError("Type object '" + attributes.name + "' is " +
                                  typeName(attributes.data_type) + ", expected STRUCT");
    }

    auto members = walkMembers(attributes.nesting_instance_id, attributes.member_count, depth);
    auto descriptor = CipTypeDescriptor::Structure(attributes.name, attributes.size_in_memory, std::move(members));
    descriptor.crc = attributes.crc;
    descriptor.instance_id = instance_id;
    return descriptor;
}

std::vector<StructureMember> TypeResolver::walkMembers(std::uint32_t first_member, std::uint16_t member_count,
                                                       std::size_t depth) {
    std::vector<StructureMember> members;
    std::set<std::uint32_t> visited;

    for (std::uint32_t id = first_member; id != 0;) {
        if (!visited.insert(id).second) {
            throw ChainTooLongError("Member chain revisits instance " + std::to_string(id));
        }
        if ((member_count > 0 && members.size() >= member_count) || members.size() >= max_chain_length_) {
            std::ostringstream oss;
            oss << "Member chain exceeds " << (member_count > 0 ? member_count : max_chain_length_) << " members";
            throw ChainTooLongError(oss.str());
        }

        const auto member_type = readTypeObject(id);
        members.push_back(StructureMember{member_type.name, describeTypeObject(member_type, id, depth + 1)});
        id = member_type.next_instance_id;
    }
    return members;
}

std::shared_ptr<const VariableRegistry> TypeResolver::discover(const std::string& system_prefix) {
    VariableRegistry registry(system_prefix);

    const auto count = variableCount();
    CPEIP_LOG_INFO("Discovering ", count, " variables");

    for (std::uint32_t instance = 1; instance <= count; ++instance) {
        const auto instance_id = static_cast<std::uint16_t>(instance);
        const auto name = variableName(instance_id);
        try {
            registry.add(VariableEntry{name, instance_id, resolveVariable(instance_id)});
            CPEIP_LOG_VERBOSE("Resolved ", name, " (instance ", instance_id, ")");
        } catch (const UnresolvedTypeError& e) {
            CPEIP_LOG_ERROR("Unresolved variable ", name, ": ", e.what());
            registry.addUnresolved(name, e.what());
        }
    }

    CPEIP_LOG_INFO("Discovery finished: ", registry.size(), " resolved, ",
                   registry.unresolved().size(), " unresolved");
    return std::make_shared<const VariableRegistry>(std::move(registry));
}

} // namespace cpeip
