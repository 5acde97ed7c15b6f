#include "util/mock_eip_server.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace cpeip::testutil {

namespace {

constexpr std::size_t kHeaderSize = 24;

#ifdef _WIN32
using SocketHandle = SOCKET;
constexpr SocketHandle kInvalidSocket = INVALID_SOCKET;

void closeSocket(SocketHandle s) {
    if (s != kInvalidSocket) {
        closesocket(s);
    }
}
#else
using SocketHandle = int;
constexpr SocketHandle kInvalidSocket = -1;

void closeSocket(SocketHandle s) {
    if (s != kInvalidSocket) {
        ::close(s);
    }
}
#endif

// 100ms 待って読み取り可能なら true
bool waitReadable(SocketHandle s) {
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(s, &readfds);

    timeval tv{};
    tv.tv_sec = 0;
    tv.tv_usec = 100000;

#ifdef _WIN32
    return ::select(0, &readfds, nullptr, nullptr, &tv) > 0;
#else
    return ::select(s + 1, &readfds, nullptr, nullptr, &tv) > 0;
#endif
}

void sendAll(SocketHandle s, const std::vector<std::uint8_t>& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const auto n = ::send(s, reinterpret_cast<const char*>(data.data() + sent),
                              static_cast<int>(data.size() - sent), 0);
        if (n <= 0) {
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

// 1クライアント分の送受信。クライアントが切断するか stop() されるまで続ける
void serveClient(SocketHandle client, const std::atomic<bool>& running, const MockEipServer::Handler& handler) {
    std::vector<std::uint8_t> pending;
    while (running.load()) {
        if (!waitReadable(client)) {
            continue;
        }

        std::uint8_t buffer[2048];
        const auto received = ::recv(client, reinterpret_cast<char*>(buffer), sizeof(buffer), 0);
        if (received <= 0) {
            return;
        }
        pending.insert(pending.end(), buffer, buffer + received);

        while (pending.size() >= kHeaderSize) {
            const std::size_t frame_size = kHeaderSize + static_cast<std::size_t>(pending[2] | (pending[3] << 8));
            if (pending.size() < frame_size) {
                break;
            }
            std::vector<std::uint8_t> frame(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(frame_size));
            pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(frame_size));

            auto response = handler(frame);
            if (!response.empty()) {
                sendAll(client, response);
            }
        }
    }
}

} // namespace

MockEipServer::MockEipServer() = default;
MockEipServer::~MockEipServer() { stop(); }

void MockEipServer::start(std::uint16_t port, Handler handler) {
    if (running_.exchange(true)) {
        throw std::runtime_error("MockEipServer already running");
    }
    port_.store(port, std::memory_order_relaxed);
    thread_ = std::thread(&MockEipServer::run, this, port, std::move(handler));
}

void MockEipServer::stop() {
    if (!running_.exchange(false)) {
        if (thread_.joinable()) {
            thread_.join();
        }
        return;
    }
    wakeListener();
    if (thread_.joinable()) {
        thread_.join();
    }
    port_.store(0, std::memory_order_relaxed);
}

bool MockEipServer::isRunning() const { return running_.load(); }

void MockEipServer::run(std::uint16_t port, Handler handler) {
#ifdef _WIN32
    WSADATA data{};
    WSAStartup(MAKEWORD(2, 2), &data);
#endif

    SocketHandle listen_socket = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_socket == kInvalidSocket) {
        running_ = false;
        return;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);

    int reuse = 1;
    setsockopt(listen_socket, SOL_SOCKET, SO_REUSEADDR,
#ifdef _WIN32
               reinterpret_cast<const char*>(&reuse),
#else
               &reuse,
#endif
               sizeof(reuse));

    if (::bind(listen_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(listen_socket, 1) < 0) {
        closeSocket(listen_socket);
        running_ = false;
        return;
    }

    while (running_.load()) {
        if (!waitReadable(listen_socket)) {
            continue;
        }
        if (!running_.load()) {
            break;
        }

        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);
        SocketHandle client = ::accept(listen_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client == kInvalidSocket) {
            continue;
        }

        serveClient(client, running_, handler);
        closeSocket(client);
    }

    running_ = false;
    closeSocket(listen_socket);

#ifdef _WIN32
    WSACleanup();
#endif
}

void MockEipServer::wakeListener() {
    const auto port = port_.load(std::memory_order_relaxed);
    if (port == 0) {
        return;
    }

    SocketHandle s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s == kInvalidSocket) {
        return;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    ::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    closeSocket(s);
}

} // namespace cpeip::testutil
