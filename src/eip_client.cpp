#include "cpeip/eip_client.hpp"

#include "cpeip/codec/address_path.hpp"
#include "cpeip/codec/encapsulation.hpp"
#include "cpeip/errors.hpp"
#include "cpeip/logging.hpp"
#include "cpeip/segmented_transfer.hpp"
#include "cpeip/session_config.hpp"
#include "cpeip/transport.hpp"
#include "cpeip/type_resolver.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cpeip {

namespace {

using codec::EncapsulationCommand;
using codec::EncapsulationMessage;

std::chrono::milliseconds toMilliseconds(std::uint32_t seconds) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(seconds));
}

std::string hex32(std::uint32_t value) {
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

codec::SenderContext makeContext(std::uint64_t counter) {
    codec::SenderContext context{};
    for (std::size_t i = 0; i < context.size(); ++i) {
        context[i] = static_cast<std::uint8_t>((counter >> (8 * i)) & 0xFF);
    }
    return context;
}

// "Var.Member[1,2]" のルート変数名部分
std::string rootName(const std::string& name) {
    const auto pos = name.find_first_of(".[");
    return name.substr(0, pos);
}

// ルート変数の型からメンバ/要素指定を辿る。構文自体の検査は makeVariablePath() に任せる
CipTypeDescriptor descend(CipTypeDescriptor type, const std::string& name) {
    std::size_t pos = rootName(name).size();
    while (pos < name.size()) {
        if (name[pos] == '[') {
            const auto close = name.find(']', pos);
            if (close == std::string::npos) {
                throw std::invalid_argument("Unterminated index in variable name: " + name);
            }
            if (type.kind != TypeKind::Array || !type.element) {
                throw std::invalid_argument("'" + name.substr(0, pos) + "' is not an array");
            }
            const auto indices = static_cast<std::size_t>(
                std::count(name.begin() + static_cast<std::ptrdiff_t>(pos),
                           name.begin() + static_cast<std::ptrdiff_t>(close), ',')) + 1;
            if (indices != type.dimensions.size()) {
                throw std::invalid_argument("Index count does not match array dimensions: " + name);
            }
            CipTypeDescriptor element = *type.element;
            type = std::move(element);
            pos = close + 1;
        } else if (name[pos] == '.') {
            const auto end = name.find_first_of(".[", pos + 1);
            const std::string member_name = name.substr(pos + 1, end == std::string::npos ? std::string::npos
                                                                                           : end - pos - 1);
            if (type.kind != TypeKind::Structure) {
                throw std::invalid_argument("'" + name.substr(0, pos) + "' is not a structure");
            }
            auto it = std::find_if(type.members.begin(), type.members.end(),
                                   [&](const StructureMember& member) { return member.name == member_name; });
            if (it == type.members.end()) {
                throw NameNotFoundError(name);
            }
            CipTypeDescriptor member = it->type;
            type = std::move(member);
            pos = (end == std::string::npos) ? name.size() : end;
        } else {
            throw std::invalid_argument("Unexpected character in variable name: " + name);
        }
    }
    return type;
}

} // namespace

struct EipClient::Impl {
    SessionConfig config{};
    TcpTransport transport;
    ValueCodec value_codec;
    std::uint32_t session_handle = 0;
    std::uint64_t context_counter = 0;
    std::shared_ptr<const VariableRegistry> registry;

    void ensureConnected() const {
        if (!transport.isConnected()) {
            throw TransportError("Client is not connected");
        }
    }

    void ensureSession() const {
        ensureConnected();
        if (session_handle == 0) {
            throw TransportError("No session registered");
        }
    }

    EncapsulationMessage makeMessage(EncapsulationCommand command, std::vector<std::uint8_t> payload) {
        EncapsulationMessage message;
        message.command = static_cast<std::uint16_t>(command);
        message.session_handle = session_handle;
        message.sender_context = makeContext(++context_counter);
        message.payload = std::move(payload);
        return message;
    }

    EncapsulationMessage receiveMessage() {
        auto frame = transport.receiveFrame(
            EncapsulationMessage::kHeaderSize, [](const std::uint8_t* header, std::size_t) {
                return static_cast<std::size_t>(header[2] | (header[3] << 8));
            });
        return codec::decodeEncapsulation(frame);
    }

    /// 1要求を送り、応答1フレームを受け取る
    /// 応答のコマンドと送信者コンテキストが要求と一致することを確認する
    EncapsulationMessage exchange(EncapsulationCommand command, std::vector<std::uint8_t> payload) {
        ensureConnected();
        const auto request = makeMessage(command, std::move(payload));
        transport.sendAll(codec::encodeEncapsulation(request));

        auto reply = receiveMessage();
        if (reply.command != request.command) {
            std::ostringstream oss;
            oss << "Reply command 0x" << std::hex << reply.command << " does not match request 0x" << request.command;
            throw FrameDecodeError(FrameDecodeError::Kind::UnexpectedReply, oss.str());
        }
        if (reply.sender_context != request.sender_context) {
            throw FrameDecodeError(FrameDecodeError::Kind::UnexpectedReply, "Reply sender context does not match");
        }
        if (reply.status != 0) {
            throw EncapsulationStatusError(reply.status);
        }
        return reply;
    }

    std::vector<codec::PacketItem> listCommand(EncapsulationCommand command) {
        auto reply = exchange(command, {});
        return codec::decodePacketItems(reply.payload);
    }

    codec::CipReply sendUnconnected(const codec::CipRequest& request) {
        ensureSession();

        codec::CommandSpecificData data;
        data.interface_handle = 0;
        data.timeout = static_cast<std::uint16_t>(std::min<std::uint32_t>(config.timeout_seconds, 0xFFFF));
        data.encapsulated_packet = codec::encodeUnconnectedPacket(codec::encodeCipRequest(request));

        auto reply = exchange(EncapsulationCommand::SendRRData, codec::encodeCommandSpecificData(data));
        const auto specific = codec::decodeCommandSpecificData(reply.payload);
        const auto items = codec::decodePacketItems(specific.encapsulated_packet);
        return codec::decodeCipReply(codec::findUnconnectedData(items));
    }

    codec::CipReply call(const codec::CipRequest& request) {
        auto reply = sendUnconnected(request);
        codec::ensureSuccess(reply);
        return reply;
    }

    CipExchange exchanger() {
        return [this](const codec::CipRequest& request) { return sendUnconnected(request); };
    }

    SegmentedTransfer segmented() {
        return SegmentedTransfer(exchanger(), TransferLimits{config.readChunkCeiling(), config.write_chunk_size});
    }
};

EipClient::EipClient() : impl_(std::make_unique<Impl>()) {}

EipClient::~EipClient() = default;

EipClient::EipClient(EipClient&&) noexcept = default;
EipClient& EipClient::operator=(EipClient&&) noexcept = default;

void EipClient::connect(const SessionConfig& config) {
    config.validate();
    impl_->config = config;
    impl_->session_handle = 0;
    impl_->registry.reset();

    impl_->transport.connect(config);
    impl_->transport.setTimeout(toMilliseconds(config.timeout_seconds), toMilliseconds(config.timeout_seconds));
    CPEIP_LOG_INFO("Connected to ", config.host, ":", config.port);

    try {
        registerSession();
    } catch (...) {
        impl_->transport.disconnect();
        throw;
    }
}

std::uint32_t EipClient::registerSession() {
    impl_->session_handle = 0;
    auto reply = impl_->exchange(EncapsulationCommand::RegisterSession, impl_->config.registerSessionPayload());
    if (reply.session_handle == 0) {
        throw FrameDecodeError(FrameDecodeError::Kind::UnexpectedReply, "RegisterSession returned a zero handle");
    }
    impl_->session_handle = reply.session_handle;
    CPEIP_LOG_INFO("Registered session ", hex32(impl_->session_handle));
    return impl_->session_handle;
}

void EipClient::close() {
    if (!impl_->transport.isConnected()) {
        impl_->session_handle = 0;
        return;
    }

    // UnregisterSession に応答は返らない
    try {
        if (impl_->session_handle != 0) {
            const auto request = impl_->makeMessage(EncapsulationCommand::UnregisterSession, {});
            impl_->transport.sendAll(codec::encodeEncapsulation(request));
            CPEIP_LOG_INFO("Unregistered session ", hex32(impl_->session_handle));
        }
    } catch (...) {
        impl_->transport.disconnect();
        impl_->session_handle = 0;
        throw;
    }

    impl_->transport.disconnect();
    impl_->session_handle = 0;
}

bool EipClient::isConnected() const noexcept {
    return impl_->transport.isConnected() && impl_->session_handle != 0;
}

std::uint32_t EipClient::sessionHandle() const noexcept {
    return impl_->session_handle;
}

std::vector<codec::PacketItem> EipClient::listServices() {
    return impl_->listCommand(EncapsulationCommand::ListServices);
}

std::vector<codec::PacketItem> EipClient::listIdentity() {
    return impl_->listCommand(EncapsulationCommand::ListIdentity);
}

std::vector<codec::PacketItem> EipClient::listInterfaces() {
    return impl_->listCommand(EncapsulationCommand::ListInterfaces);
}

codec::CipReply EipClient::sendUnconnected(const codec::CipRequest& request) {
    return impl_->sendUnconnected(request);
}

codec::CipReply EipClient::getAttributeAll(const std::vector<std::uint8_t>& path) {
    return impl_->call(codec::CipRequest(codec::CipService::GetAttributeAll, path));
}

codec::CipReply EipClient::getInstanceList(const std::vector<std::uint8_t>& path,
                                           const std::vector<std::uint8_t>& data) {
    return impl_->call(codec::CipRequest(codec::CipService::GetInstanceList, path, data));
}

codec::CipReply EipClient::readTag(const std::vector<std::uint8_t>& path, std::uint16_t elements) {
    return impl_->call(codec::CipRequest(codec::CipService::ReadTag, path, codec::makeReadTagData(elements)));
}

codec::CipReply EipClient::writeTag(const std::vector<std::uint8_t>& path, std::uint8_t type_code,
                                    const std::vector<std::uint8_t>& value, std::uint16_t elements) {
    return impl_->call(
        codec::CipRequest(codec::CipService::WriteTag, path, codec::makeWriteTagData(type_code, value, elements)));
}

std::shared_ptr<const VariableRegistry> EipClient::discover() {
    impl_->ensureSession();
    TypeResolver resolver(impl_->exchanger(), impl_->config.max_chain_length);
    impl_->registry = resolver.discover(impl_->config.system_variable_prefix);
    return impl_->registry;
}

std::shared_ptr<const VariableRegistry> EipClient::registry() const noexcept {
    return impl_->registry;
}

CipTypeDescriptor EipClient::describe(const std::string& name) {
    if (!impl_->registry) {
        discover();
    }
    const auto& entry = impl_->registry->lookup(rootName(name));
    return descend(entry.type, name);
}

VariableValue EipClient::readVariable(const std::string& name) {
    const auto type = describe(name);

    std::vector<std::uint8_t> bytes;
    if (type.requiresSegmentedTransfer()) {
        bytes = impl_->segmented().read(name, type);
    } else {
        const auto reply = readTag(codec::makeVariablePath(name));
        bytes = codec::stripReadTagHeader(reply.data);
    }
    return impl_->value_codec.decode(type, bytes);
}

void EipClient::writeVariable(const std::string& name, const VariableValue& value) {
    const auto type = describe(name);
    const auto payload = impl_->value_codec.encode(type, value);

    if (type.requiresSegmentedTransfer()) {
        impl_->segmented().write(name, type, payload);
    } else {
        writeTag(codec::makeVariablePath(name), type.code, payload);
    }
}

} // namespace cpeip
