#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace cpeip {

/// プロトコル層で発生するエラーの基底クラス
/// トランスポート層のエラー（TransportError）とは区別して扱う
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message);
};

/// フレームの構造的なデコード失敗
/// 必須フィールドのオフセットよりバッファが短い場合に送出される
class FrameDecodeError : public ProtocolError {
public:
    enum class Kind {
        FrameTooShort,      // カプセル化ヘッダーまたはコマンド固有データが不足
        TruncatedItem,      // CPFアイテムの宣言長がバッファ末尾を超えている
        ReplyTooShort,      // CIP応答のプレフィックス/拡張ステータスが不足
        AttributeTooShort,  // 属性応答のレイアウトが宣言より短い
        UnexpectedReply     // コマンドや送信者コンテキストが要求と一致しない
    };

    FrameDecodeError(Kind kind, const std::string& message);

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/// CIP応答の一般ステータスが0以外
/// 応答自体は構造的に正しくデコードできている
class CipStatusError : public ProtocolError {
public:
    CipStatusError(std::uint8_t general_status, std::vector<std::uint8_t> extended_status);

    std::uint8_t generalStatus() const noexcept { return general_status_; }
    const std::vector<std::uint8_t>& extendedStatus() const noexcept { return extended_status_; }

private:
    std::uint8_t general_status_;
    std::vector<std::uint8_t> extended_status_;
};

/// カプセル化ヘッダーのステータスが0以外（不正なセッションハンドル等）
class EncapsulationStatusError : public ProtocolError {
public:
    explicit EncapsulationStatusError(std::uint32_t status);

    std::uint32_t status() const noexcept { return status_; }

private:
    std::uint32_t status_;
};

/// 変数レジストリに存在しない変数名
class NameNotFoundError : public ProtocolError {
public:
    explicit NameNotFoundError(const std::string& name);

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// 型解決できないデータ型（省略形構造体、未知の型コード等）
class UnresolvedTypeError : public ProtocolError {
public:
    explicit UnresolvedTypeError(const std::string& message);
};

/// メンバチェーンまたはネストが安全上限を超えた
class ChainTooLongError : public ProtocolError {
public:
    explicit ChainTooLongError(const std::string& message);
};

} // namespace cpeip
