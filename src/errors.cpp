#include "cpeip/errors.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace cpeip {

namespace {

std::string describeCipStatus(std::uint8_t general_status, const std::vector<std::uint8_t>& extended) {
    std::ostringstream oss;
    oss << "CIP general status 0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(general_status);
    if (!extended.empty()) {
        oss << " ext=";
        for (auto byte : extended) {
            oss << std::setw(2) << std::setfill('0') << static_cast<int>(byte) << ' ';
        }
    }
    return oss.str();
}

std::string describeEncapsulationStatus(std::uint32_t status) {
    std::ostringstream oss;
    oss << "Encapsulation status 0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0')
        << status;
    return oss.str();
}

} // namespace

ProtocolError::ProtocolError(const std::string& message)
    : std::runtime_error(message) {}

FrameDecodeError::FrameDecodeError(Kind kind, const std::string& message)
    : ProtocolError(message), kind_(kind) {}

CipStatusError::CipStatusError(std::uint8_t general_status, std::vector<std::uint8_t> extended_status)
    : ProtocolError(describeCipStatus(general_status, extended_status)),
      general_status_(general_status),
      extended_status_(std::move(extended_status)) {}

EncapsulationStatusError::EncapsulationStatusError(std::uint32_t status)
    : ProtocolError(describeEncapsulationStatus(status)), status_(status) {}

NameNotFoundError::NameNotFoundError(const std::string& name)
    : ProtocolError("Variable not found: " + name), name_(name) {}

UnresolvedTypeError::UnresolvedTypeError(const std::string& message)
    : ProtocolError(message) {}

ChainTooLongError::ChainTooLongError(const std::string& message)
    : ProtocolError(message) {}

} // namespace cpeip
