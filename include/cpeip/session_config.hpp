#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace cpeip {

/// セッション設定
/// コントローラとの接続と、セグメント転送・型解決の上限値を保持する
/// connect()を呼ぶ前に適切な値を設定すること
struct SessionConfig {
    // ========================================
    // ネットワーク設定
    // ========================================

    std::string host;                   // コントローラのIPアドレスまたはホスト名（例: "192.168.250.1"）
    std::uint16_t port = 44818;         // EtherNet/IP 明示メッセージのTCPポート
    std::uint32_t timeout_seconds = 10; // ソケット送受信およびCPFタイムアウト欄（秒）

    // ========================================
    // セッション登録
    // ========================================

    std::uint16_t protocol_version = 1; // RegisterSession のプロトコルバージョン
    std::uint16_t session_options = 0;  // RegisterSession のオプションフラグ

    // ========================================
    // 転送設定
    // ========================================

    std::uint16_t max_message_size = 502;  // 1メッセージの最大サイズ（読み取りチャンク上限 = この値 - 8）
    std::uint16_t write_chunk_size = 400;  // セグメント書き込み1回あたりのバイト数

    // ========================================
    // 型解決設定
    // ========================================

    std::string system_variable_prefix = "_";  // システム変数を識別する名前の先頭文字列
    std::uint32_t max_chain_length = 1024;     // メンバーチェーンの最大長

    /// RegisterSession のコマンド固有データ（プロトコルバージョン、オプション）
    std::vector<std::uint8_t> registerSessionPayload() const;

    /// セグメント読み取り1回あたりの最大データ長
    std::uint16_t readChunkCeiling() const noexcept;

    // ========================================
    // バリデーションヘルパー
    // ========================================

    /// 設定が妥当かどうかをチェックする
    /// @param error_message エラー時にメッセージを格納するポインタ（オプション）
    bool isValid(std::string* error_message = nullptr) const;

    /// 設定を検証し、不正な場合は例外を投げる
    /// @throws std::invalid_argument 設定が不正な場合
    void validate() const;

    /// すべてのバリデーションエラーをリストで取得する
    std::vector<std::string> getValidationErrors() const;
};

} // namespace cpeip
