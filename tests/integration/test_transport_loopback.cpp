#include "cpeip/codec/encapsulation.hpp"
#include "cpeip/session_config.hpp"
#include "cpeip/transport.hpp"
#include "util/mock_eip_server.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::size_t encapsulationLength(const std::uint8_t* header, std::size_t) {
    return static_cast<std::size_t>(header[2] | (header[3] << 8));
}

} // namespace

int main() {
    using namespace cpeip;
    using namespace cpeip::codec;
    using cpeip::testutil::MockEipServer;

    SessionConfig config{};
    config.host = "127.0.0.1";
    config.port = 56100;
    config.timeout_seconds = 2;

    // 要求と同じコマンドで、ペイロードを2倍にして返す
    MockEipServer server;
    server.start(config.port, [](const std::vector<std::uint8_t>& frame) {
        auto message = decodeEncapsulation(frame);
        auto payload = message.payload;
        message.payload.insert(message.payload.end(), payload.begin(), payload.end());
        return encodeEncapsulation(message);
    });

    std::this_thread::sleep_for(50ms);

    TcpTransport transport;
    transport.connect(config);
    assert(transport.isConnected());

    // Test 1: Frame with a body
    {
        EncapsulationMessage request;
        request.command = static_cast<std::uint16_t>(EncapsulationCommand::ListIdentity);
        request.sender_context = {9, 8, 7, 6, 5, 4, 3, 2};
        request.payload = {0x01, 0x02, 0x03};
        transport.sendAll(encodeEncapsulation(request));

        const auto frame = transport.receiveFrame(EncapsulationMessage::kHeaderSize, encapsulationLength);
        const auto reply = decodeEncapsulation(frame);
        assert(frame.size() == 24 + 6);
        assert(reply.command == request.command);
        assert(reply.sender_context == request.sender_context);
        assert(reply.payload == std::vector<std::uint8_t>({0x01, 0x02, 0x03, 0x01, 0x02, 0x03}));
    }

    // Test 2: Header-only frame
    {
        EncapsulationMessage request;
        request.command = static_cast<std::uint16_t>(EncapsulationCommand::Nop);
        transport.sendAll(encodeEncapsulation(request));

        const auto frame = transport.receiveFrame(EncapsulationMessage::kHeaderSize, encapsulationLength);
        assert(frame.size() == 24);
        assert(decodeEncapsulation(frame).payload.empty());
    }

    transport.disconnect();
    assert(!transport.isConnected());
    server.stop();

    // Test 3: Timeout when the target never answers
    {
        MockEipServer silent_server;
        silent_server.start(56101, [](const std::vector<std::uint8_t>&) {
            return std::vector<std::uint8_t>{};
        });

        std::this_thread::sleep_for(50ms);

        SessionConfig timeout_config = config;
        timeout_config.port = 56101;
        timeout_config.timeout_seconds = 1;

        TcpTransport timeout_transport;
        timeout_transport.connect(timeout_config);
        timeout_transport.setTimeout(300ms, 300ms);

        bool timeout_thrown = false;
        try {
            timeout_transport.receiveAll(4);
        } catch (const TransportTimeoutError&) {
            timeout_thrown = true;
        }
        assert(timeout_thrown);

        // receiveFrame でのタイムアウトは接続を閉じる
        bool frame_timeout = false;
        try {
            timeout_transport.receiveFrame(EncapsulationMessage::kHeaderSize, encapsulationLength);
        } catch (const TransportTimeoutError&) {
            frame_timeout = true;
        }
        assert(frame_timeout);
        assert(!timeout_transport.isConnected());

        silent_server.stop();
    }

    // Test 4: Connection refused
    {
        SessionConfig refused = config;
        refused.port = 56102;
        TcpTransport refused_transport;
        bool threw = false;
        try {
            refused_transport.connect(refused);
        } catch (const TransportError&) {
            threw = true;
        }
        assert(threw);
        assert(!refused_transport.isConnected());
    }

    return 0;
}
