#pragma once

#include "cpeip/codec/cip_message.hpp"
#include "cpeip/codec/packet_item.hpp"
#include "cpeip/value_codec.hpp"
#include "cpeip/variable_registry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cpeip {

// 前方宣言
struct SessionConfig;

/// EtherNet/IP 明示メッセージクライアント
/// 1つのTCP接続と1つのセッションを持ち、要求ごとに応答1フレームを待つ同期クライアント
/// スレッドセーフではない。並行に使う場合はスレッドごとにクライアントを用意すること
///
/// 使用例:
/// @code
/// SessionConfig config;
/// config.host = "192.168.250.1";
///
/// EipClient client;
/// client.connect(config);
///
/// auto counter = std::get<std::int16_t>(client.readVariable("Counter"));
/// client.writeVariable("Message", std::string("HELLO"));
///
/// client.close();
/// @endcode
class EipClient {
public:
    EipClient();
    ~EipClient();

    EipClient(const EipClient&) = delete;
    EipClient& operator=(const EipClient&) = delete;
    EipClient(EipClient&&) noexcept;
    EipClient& operator=(EipClient&&) noexcept;

    // ========================================
    // 接続管理
    // ========================================

    /// コントローラに接続し、セッションを登録する
    /// セッション登録に失敗した場合は接続を閉じてから例外を伝播する
    /// @throws std::invalid_argument 設定が不正な場合
    /// @throws TransportError 接続に失敗した場合
    void connect(const SessionConfig& config);

    /// RegisterSession を送り、返ってきたセッションハンドルを保持する
    /// @return セッションハンドル
    std::uint32_t registerSession();

    /// UnregisterSession を送ってソケットを閉じる
    /// 送信に失敗した場合もソケットは閉じ、例外はそのまま伝播する
    void close();

    bool isConnected() const noexcept;

    /// 登録済みのセッションハンドル（未登録なら0）
    std::uint32_t sessionHandle() const noexcept;

    // ========================================
    // セッション不要のコマンド
    // ========================================

    std::vector<codec::PacketItem> listServices();
    std::vector<codec::PacketItem> listIdentity();
    std::vector<codec::PacketItem> listInterfaces();

    // ========================================
    // 非接続メッセージ（CIPサービス）
    // ========================================

    /// CIP要求を SendRRData で送り、応答をそのまま返す（一般ステータスは検査しない）
    /// @throws FrameDecodeError 応答のコマンドまたは送信者コンテキストが一致しない場合
    /// @throws EncapsulationStatusError カプセル化ステータスが0以外の場合
    codec::CipReply sendUnconnected(const codec::CipRequest& request);

    /// 以下のサービス呼び出しは一般ステータスが0以外なら CipStatusError を送出する
    codec::CipReply getAttributeAll(const std::vector<std::uint8_t>& path);
    codec::CipReply getInstanceList(const std::vector<std::uint8_t>& path, const std::vector<std::uint8_t>& data);
    codec::CipReply readTag(const std::vector<std::uint8_t>& path, std::uint16_t elements = 1);
    codec::CipReply writeTag(const std::vector<std::uint8_t>& path, std::uint8_t type_code,
                             const std::vector<std::uint8_t>& value, std::uint16_t elements = 1);

    // ========================================
    // 変数アクセス
    // ========================================

    /// コントローラの変数と型を検出し、レジストリを作り直す
    std::shared_ptr<const VariableRegistry> discover();

    /// 直近の discover() の結果（未実行なら nullptr）
    std::shared_ptr<const VariableRegistry> registry() const noexcept;

    /// 変数を読み取る
    /// "Var.Member" や "Arr[3]" のようなメンバ/要素指定も受け付ける
    /// レジストリが未構築なら先に discover() を行う
    /// @throws NameNotFoundError 変数が存在しない場合
    /// @throws UnresolvedTypeError 型解決できなかった変数の場合
    VariableValue readVariable(const std::string& name);

    /// 変数に書き込む
    /// @throws std::invalid_argument 値の型が変数の型と一致しない、または構造体の場合
    void writeVariable(const std::string& name, const VariableValue& value);

    /// 変数名（メンバ/要素指定を含む）から型記述子を求める
    CipTypeDescriptor describe(const std::string& name);

private:
    // Pimplイディオムで実装の詳細を隠蔽
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cpeip
