#pragma once

#include "cpeip/cip_types.hpp"
#include "cpeip/codec/address_path.hpp"
#include "cpeip/codec/cip_message.hpp"
#include "cpeip/variable_registry.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cpeip {

/// CIP要求を1回送信し、応答を1つ受け取る関数
/// EipClient は非接続メッセージ送信を、テストは固定応答を返すラムダを渡す
using CipExchange = std::function<codec::CipReply(const codec::CipRequest&)>;

/// Variable Object（クラス0x6B）の GetAttributeAll 応答
struct VariableObjectAttributes {
    std::uint32_t size = 0;
    std::uint8_t data_type = 0;
    std::uint8_t array_data_type = 0;
    std::vector<std::uint32_t> extents;
    std::uint8_t bit_number = 0;
    std::uint32_t type_instance_id = 0;  // リンク先の Variable Type Object
    std::vector<std::uint32_t> starts;

    /// @throws FrameDecodeError 次元数から決まるレイアウトより短い場合
    static VariableObjectAttributes parse(const std::vector<std::uint8_t>& data);
};

/// Variable Type Object（クラス0x6C）の GetAttributeAll 応答
struct VariableTypeAttributes {
    std::uint32_t size_in_memory = 0;
    std::uint8_t data_type = 0;
    std::uint8_t array_data_type = 0;
    std::vector<std::uint32_t> extents;
    std::uint16_t member_count = 0;
    std::uint16_t crc = 0;
    std::string name;
    std::uint32_t next_instance_id = 0;     // 同じ構造体の次のメンバ（0で終端）
    std::uint32_t nesting_instance_id = 0;  // 構造体なら先頭メンバ、配列なら要素型
    std::vector<std::uint32_t> starts;

    /// @throws FrameDecodeError 名前長・次元数から決まるレイアウトより短い場合
    static VariableTypeAttributes parse(const std::vector<std::uint8_t>& data);
};

/// コントローラのオブジェクトモデルを辿って変数の型記述子を組み立てる
class TypeResolver {
public:
    static constexpr std::size_t kMaxNestingDepth = 16;

    explicit TypeResolver(CipExchange exchange, std::uint32_t max_chain_length = 1024);

    /// Tag Name Server のインスタンス0から変数の総数を読む
    std::uint16_t variableCount();

    /// Tag Name Server のインスタンスから変数名を読む
    std::string variableName(std::uint16_t instance_id);

    /// インスタンス1..N の順に変数名を返す
    std::vector<std::string> listVariableNames();

    /// Variable Object のインスタンスから型記述子を解決する
    /// @throws UnresolvedTypeError 省略形構造体や未知の型コードの場合
    /// @throws ChainTooLongError メンバチェーンやネストが上限を超えた場合
    CipTypeDescriptor resolveVariable(std::uint16_t instance_id);

    /// 全変数を検出してレジストリを構築する
    /// 型解決できない変数はレジストリに未解決として記録し、検出は続行する
    std::shared_ptr<const VariableRegistry> discover(const std::string& system_prefix = "_");

private:
    codec::CipReply getAttributeAll(codec::ObjectClass class_id, std::uint32_t instance_id);
    VariableTypeAttributes readTypeObject(std::uint32_t instance_id);

    CipTypeDescriptor describeTypeObject(const VariableTypeAttributes& attributes,
                                         std::uint32_t instance_id, std::size_t depth);
    CipTypeDescriptor describeStructure(const VariableTypeAttributes& attributes,
                                        std::uint32_t instance_id, std::size_t depth);
    std::vector<StructureMember> walkMembers(std::uint32_t first_member, std::uint16_t member_count,
                                             std::size_t depth);

    CipExchange exchange_;
    std::uint32_t max_chain_length_;
};

} // namespace cpeip
