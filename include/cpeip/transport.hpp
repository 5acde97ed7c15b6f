#pragma once

#include "cpeip/session_config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cpeip {

/// 通信エラー（接続拒否、リセット、切断など）
/// コア層では再試行せず、そのまま呼び出し元へ伝播させる
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message);
};

class TransportTimeoutError : public TransportError {
public:
    explicit TransportTimeoutError(const std::string& message);
};

/// TCPソケットの薄いラッパ
/// 1回の receiveFrame() で必ず1フレーム分のバイト列を返す
class TcpTransport {
public:
    /// フレームヘッダーから後続ボディのバイト数を取り出す関数
    using LengthExtractor = std::function<std::size_t(const std::uint8_t*, std::size_t)>;

    TcpTransport();
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;
    TcpTransport(TcpTransport&&) noexcept;
    TcpTransport& operator=(TcpTransport&&) noexcept;

    /// @throws TransportError 名前解決または接続に失敗した場合
    void connect(const SessionConfig& config);
    void disconnect() noexcept;
    bool isConnected() const noexcept;

    void setTimeout(std::chrono::milliseconds send_timeout,
                    std::chrono::milliseconds recv_timeout);

    void sendAll(const std::uint8_t* data, std::size_t size);
    void sendAll(const std::vector<std::uint8_t>& data);

    void receiveAll(std::uint8_t* buffer, std::size_t expected);
    std::vector<std::uint8_t> receiveAll(std::size_t expected);

    /// 固定長ヘッダーを受信し、length_extractor が返すバイト数のボディを続けて受信する
    /// ボディ長0のフレームも許容する
    std::vector<std::uint8_t> receiveFrame(std::size_t header_size, const LengthExtractor& length_extractor);

private:
    std::size_t receiveSome(std::uint8_t* buffer, std::size_t capacity);
    void ensureConnected() const;
    void applySocketOptions();
    bool isTimeoutError(int error_code) const;
    void markDisconnected() noexcept;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cpeip
