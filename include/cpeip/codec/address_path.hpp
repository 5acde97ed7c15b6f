#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cpeip::codec {

/// コントローラ側オブジェクトのクラスID
enum class ObjectClass : std::uint16_t {
    TagNameServer = 0x6A,
    VariableObject = 0x6B,
    VariableTypeObject = 0x6C
};

/// シンボリックセグメント（0x91）を作成する
/// 全体が奇数バイトになる場合は末尾に0を1バイト補う。長さバイトは補う前の名前長
/// @param name 変数名（1〜255バイト）
/// @throws std::invalid_argument 名前が空、または255バイトを超える場合
std::vector<std::uint8_t> makeSymbolicPath(const std::string& name);

/// 論理クラス/インスタンスセグメントを作成する
/// クラスIDは0xFF以下なら8bit形式、それ以上は16bit形式。インスタンスIDは常に16bit形式で送る
std::vector<std::uint8_t> makeLogicalPath(std::uint16_t class_id, std::uint16_t instance_id);

std::vector<std::uint8_t> makeLogicalPath(ObjectClass class_id, std::uint16_t instance_id);

/// 要素（配列インデックス）セグメントを作成する
/// 値の大きさに応じて 8/16/32bit 形式を選ぶ
std::vector<std::uint8_t> makeElementSegment(std::uint32_t index);

/// 変数名からリクエストパスを作成する
/// "Var.Member[1,2]" のようなメンバ区切りと配列インデックスを解釈する
/// @throws std::invalid_argument 構文が不正な場合
std::vector<std::uint8_t> makeVariablePath(const std::string& variable_name);

/// 単純データセグメント（0x80, 長さ3ワード固定）
/// 値のシリアライズ表現における [offset, offset + size) を指定する
struct SimpleDataSegment {
    std::uint32_t offset = 0;  // バイト単位（ワード単位ではない）
    std::uint16_t size = 0;    // この要求で扱うバイト数

    std::vector<std::uint8_t> encode() const;
};

/// パスの末尾に単純データセグメントを付加したパスを返す
std::vector<std::uint8_t> appendSimpleDataSegment(std::vector<std::uint8_t> path, const SimpleDataSegment& segment);

} // namespace cpeip::codec
