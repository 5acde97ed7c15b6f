#include "cpeip/session_config.hpp"

#include <sstream>

namespace cpeip {

namespace {

constexpr std::uint16_t kMaxMessageSizeLimit = 502;
constexpr std::uint16_t kSegmentHeaderOverhead = 8;
constexpr std::uint32_t kTimeoutWarningSeconds = 60;

} // namespace

std::vector<std::uint8_t> SessionConfig::registerSessionPayload() const {
    return {static_cast<std::uint8_t>(protocol_version & 0xFF),
            static_cast<std::uint8_t>((protocol_version >> 8) & 0xFF),
            static_cast<std::uint8_t>(session_options & 0xFF),
            static_cast<std::uint8_t>((session_options >> 8) & 0xFF)};
}

std::uint16_t SessionConfig::readChunkCeiling() const noexcept {
    if (max_message_size <= kSegmentHeaderOverhead) {
        return 0;
    }
    return static_cast<std::uint16_t>(max_message_size - kSegmentHeaderOverhead);
}

std::vector<std::string> SessionConfig::getValidationErrors() const {
    std::vector<std::string> errors;

    if (host.empty()) {
        errors.push_back("Host address is empty");
    }

    if (port == 0) {
        errors.push_back("Port must be non-zero");
    }

    if (timeout_seconds == 0) {
        errors.push_back("Timeout must be at least 1 second");
    }
    if (timeout_seconds > kTimeoutWarningSeconds) {
        std::ostringstream oss;
        oss << "Timeout is very large: " << timeout_seconds << " seconds";
        errors.push_back(oss.str());
    }

    if (max_message_size <= kSegmentHeaderOverhead || max_message_size > kMaxMessageSizeLimit) {
        errors.push_back("Max message size must be 9-" + std::to_string(kMaxMessageSizeLimit) +
                         " (actual: " + std::to_string(max_message_size) + ")");
    }

    // 書き込みは8バイト境界で分割する
    if (write_chunk_size == 0 || write_chunk_size % 8 != 0) {
        errors.push_back("Write chunk size must be a non-zero multiple of 8 (actual: " +
                         std::to_string(write_chunk_size) + ")");
    } else if (write_chunk_size > readChunkCeiling()) {
        errors.push_back("Write chunk size " + std::to_string(write_chunk_size) +
                         " exceeds the message ceiling " + std::to_string(readChunkCeiling()));
    }

    if (max_chain_length == 0) {
        errors.push_back("Max chain length must be non-zero");
    }

    return errors;
}

bool SessionConfig::isValid(std::string* error_message) const {
    auto errors = getValidationErrors();
    if (errors.empty()) {
        return true;
    }

    if (error_message) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) {
                oss << "; ";
            }
            oss << errors[i];
        }
        *error_message = oss.str();
    }

    return false;
}

void SessionConfig::validate() const {
    std::string error_message;
    if (!isValid(&error_message)) {
        throw std::invalid_argument("SessionConfig validation failed: " + error_message);
    }
}

} // namespace cpeip
