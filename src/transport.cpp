#include "cpeip/transport.hpp"

// EtherNet/IP 明示メッセージ用の TCP ソケットラッパ。タイムアウトと切断処理をここに集約する。

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace cpeip {

namespace {

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle kInvalidSocket = INVALID_SOCKET;

std::string socketErrorMessage(int code) {
    if (code == 0) {
        code = WSAGetLastError();
    }
    return "WSA error " + std::to_string(code);
}

void closeSocket(SocketHandle socket) {
    if (socket != kInvalidSocket) {
        closesocket(socket);
    }
}

void ensureWinsock() {
    static std::once_flag once;
    std::call_once(once, []() {
        WSADATA data{};
        if (WSAStartup(MAKEWORD(2, 2), &data) != 0) {
            throw TransportError("WSAStartup failed");
        }
    });
}

int lastSocketError() {
    return WSAGetLastError();
}

#else

using SocketHandle = int;
constexpr SocketHandle kInvalidSocket = -1;

std::string socketErrorMessage(int code) {
    if (code == 0) {
        code = errno;
    }
    return std::string(std::strerror(code));
}

void closeSocket(SocketHandle socket) {
    if (socket != kInvalidSocket) {
        ::close(socket);
    }
}

void ensureWinsock() {}

int lastSocketError() {
    return errno;
}

#endif

bool isInterrupted(int code) {
#ifdef _WIN32
    return code == WSAEINTR;
#else
    return code == EINTR;
#endif
}

void setTimeoutOption(SocketHandle socket, int option, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return;
    }
#ifdef _WIN32
    DWORD timeout_ms = static_cast<DWORD>(timeout.count());
    ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&timeout_ms), sizeof(timeout_ms));
#else
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    ::setsockopt(socket, SOL_SOCKET, option, &tv, sizeof(tv));
#endif
}

void enableOption(SocketHandle socket, int level, int option) {
    const int enable = 1;
#ifdef _WIN32
    ::setsockopt(socket, level, option, reinterpret_cast<const char*>(&enable), sizeof(enable));
#else
    ::setsockopt(socket, level, option, &enable, sizeof(enable));
#endif
}

} // namespace

TransportError::TransportError(const std::string& message)
    : std::runtime_error(message) {}

TransportTimeoutError::TransportTimeoutError(const std::string& message)
    : TransportError(message) {}

struct TcpTransport::Impl {
    SocketHandle socket = kInvalidSocket;
    std::chrono::milliseconds send_timeout{0};
    std::chrono::milliseconds recv_timeout{0};
};

TcpTransport::TcpTransport()
    : impl_(std::make_unique<Impl>()) {}

TcpTransport::~TcpTransport() {
    disconnect();
}

TcpTransport::TcpTransport(TcpTransport&& other) noexcept = default;
TcpTransport& TcpTransport::operator=(TcpTransport&& other) noexcept = default;

void TcpTransport::connect(const SessionConfig& config) {
    if (config.host.empty()) {
        throw TransportError("SessionConfig.host must not be empty");
    }
    if (config.port == 0) {
        throw TransportError("SessionConfig.port must be non-zero");
    }

    ensureWinsock();
    disconnect();

    const auto timeout = std::chrono::milliseconds(std::max<std::uint32_t>(1, config.timeout_seconds) * 1000);
    impl_->send_timeout = timeout;
    impl_->recv_timeout = timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(config.port);
    const int gai_result = ::getaddrinfo(config.host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_result != 0) {
        throw TransportError(std::string("getaddrinfo failed: ") + gai_strerror(gai_result));
    }

    for (addrinfo* rp = results; rp != nullptr; rp = rp->ai_next) {
        SocketHandle socket = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (socket == kInvalidSocket) {
            continue;
        }
        if (::connect(socket, rp->ai_addr, static_cast<int>(rp->ai_addrlen)) == 0) {
            impl_->socket = socket;
            break;
        }
        closeSocket(socket);
    }

    ::freeaddrinfo(results);

    if (impl_->socket == kInvalidSocket) {
        std::ostringstream oss;
        oss << "Failed to connect to " << config.host << ":" << config.port;
        throw TransportError(oss.str());
    }

    applySocketOptions();
}

void TcpTransport::disconnect() noexcept {
    markDisconnected();
}

bool TcpTransport::isConnected() const noexcept {
    return impl_ && impl_->socket != kInvalidSocket;
}

void TcpTransport::setTimeout(std::chrono::milliseconds send_timeout,
                              std::chrono::milliseconds recv_timeout) {
    impl_->send_timeout = send_timeout;
    impl_->recv_timeout = recv_timeout;
    if (isConnected()) {
        applySocketOptions();
    }
}

void TcpTransport::sendAll(const std::uint8_t* data, std::size_t size) {
    ensureConnected();

    std::size_t total_sent = 0;
    while (total_sent < size) {
        const std::size_t chunk_size =
            std::min<std::size_t>(size - total_sent, static_cast<std::size_t>(std::numeric_limits<int>::max()));
        const auto sent = ::send(impl_->socket, reinterpret_cast<const char*>(data + total_sent),
                                 static_cast<int>(chunk_size), 0);
        if (sent < 0) {
            const int code = lastSocketError();
            if (isInterrupted(code)) {
                continue;
            }
            if (isTimeoutError(code)) {
                throw TransportTimeoutError(socketErrorMessage(code));
            }
            markDisconnected();
            throw TransportError(socketErrorMessage(code));
        }
        if (sent == 0) {
            markDisconnected();
            throw TransportError("Socket closed while sending");
        }
        total_sent += static_cast<std::size_t>(sent);
    }
}

void TcpTransport::sendAll(const std::vector<std::uint8_t>& data) {
    sendAll(data.data(), data.size());
}

std::size_t TcpTransport::receiveSome(std::uint8_t* buffer, std::size_t capacity) {
    ensureConnected();
    if (capacity == 0) {
        return 0;
    }

    const std::size_t chunk_size =
        std::min<std::size_t>(capacity, static_cast<std::size_t>(std::numeric_limits<int>::max()));
    while (true) {
        const auto received =
            ::recv(impl_->socket, reinterpret_cast<char*>(buffer), static_cast<int>(chunk_size), 0);
        if (received > 0) {
            return static_cast<std::size_t>(received);
        }
        if (received == 0) {
            markDisconnected();
            throw TransportError("Remote host closed the connection");
        }
        const int code = lastSocketError();
        if (isInterrupted(code)) {
            continue;
        }
        if (isTimeoutError(code)) {
            throw TransportTimeoutError(socketErrorMessage(code));
        }
        markDisconnected();
        throw TransportError(socketErrorMessage(code));
    }
}

void TcpTransport::receiveAll(std::uint8_t* buffer, std::size_t expected) {
    std::size_t total = 0;
    while (total < expected) {
        total += receiveSome(buffer + total, expected - total);
    }
}

std::vector<std::uint8_t> TcpTransport::receiveAll(std::size_t expected) {
    std::vector<std::uint8_t> buffer(expected);
    receiveAll(buffer.data(), expected);
    return buffer;
}

std::vector<std::uint8_t> TcpTransport::receiveFrame(std::size_t header_size,
                                                     const LengthExtractor& length_extractor) {
    if (header_size == 0) {
        throw TransportError("Header size must be greater than zero");
    }

    // 途中で失敗したフレームの残りがストリームに残らないよう、例外時は切断しておく。
    try {
        std::vector<std::uint8_t> frame(header_size);
        receiveAll(frame.data(), header_size);

        const std::size_t body_size = length_extractor(frame.data(), frame.size());
        if (body_size > 0) {
            frame.resize(header_size + body_size);
            receiveAll(frame.data() + header_size, body_size);
        }
        return frame;
    } catch (...) {
        markDisconnected();
        throw;
    }
}

void TcpTransport::ensureConnected() const {
    if (!isConnected()) {
        throw TransportError("Transport is not connected");
    }
}

void TcpTransport::applySocketOptions() {
    ensureConnected();

    enableOption(impl_->socket, SOL_SOCKET, SO_KEEPALIVE);
    // 要求/応答が小さく同期的なので Nagle は無効にする。
    enableOption(impl_->socket, IPPROTO_TCP, TCP_NODELAY);
    setTimeoutOption(impl_->socket, SO_SNDTIMEO, impl_->send_timeout);
    setTimeoutOption(impl_->socket, SO_RCVTIMEO, impl_->recv_timeout);
}

bool TcpTransport::isTimeoutError(int error_code) const {
#ifdef _WIN32
    return error_code == WSAEWOULDBLOCK || error_code == WSAETIMEDOUT;
#else
    return error_code == EWOULDBLOCK || error_code == EAGAIN || error_code == ETIMEDOUT;
#endif
}

void TcpTransport::markDisconnected() noexcept {
    if (!impl_) {
        return;
    }
    if (impl_->socket != kInvalidSocket) {
        closeSocket(impl_->socket);
        impl_->socket = kInvalidSocket;
    }
}

} // namespace cpeip
