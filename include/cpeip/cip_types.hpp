#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cpeip {

/// CIPデータ型コード
/// 0xC1〜0xDB はCIP標準、0x04〜0x0C はベンダ（Omron）拡張
enum class CipDataType : std::uint8_t {
    Boolean = 0xC1,
    Sint = 0xC2,
    Int = 0xC3,
    Dint = 0xC4,
    Lint = 0xC5,
    Usint = 0xC6,
    Uint = 0xC7,
    Udint = 0xC8,
    Ulint = 0xC9,
    Real = 0xCA,
    Lreal = 0xCB,
    String = 0xD0,
    Byte = 0xD1,
    Word = 0xD2,
    Dword = 0xD3,
    Lword = 0xD4,
    Time = 0xDB,
    AbbreviatedStruct = 0xA0,
    Struct = 0xA2,
    Array = 0xA3,
    UintBcd = 0x04,
    UdintBcd = 0x05,
    UlintBcd = 0x06,
    Enum = 0x07,
    DateNsec = 0x08,
    TimeNsec = 0x09,
    DateAndTimeNsec = 0x0A,
    TimeOfDayNsec = 0x0B,
    Union = 0x0C
};

/// 値として直接扱える基本型（文字列を除く）かどうか
bool isElementaryScalar(std::uint8_t code) noexcept;

/// 基本型の自然なバイト幅（不明な場合は0）
std::size_t elementaryWidth(CipDataType type) noexcept;

/// 型コードの表示名（ログ/エラーメッセージ用）
std::string typeName(std::uint8_t code);

/// 型記述子の種別タグ
enum class TypeKind {
    Scalar,
    String,
    Array,
    Structure,
    AbbreviatedStructure
};

/// 配列の1次元分（要素数と開始インデックス）
struct ArrayDimension {
    std::uint32_t extent = 0;
    std::uint32_t start = 0;

    bool operator==(const ArrayDimension& other) const {
        return extent == other.extent && start == other.start;
    }
};

struct StructureMember;

/// CIP型記述子
/// kind タグで Scalar/String/Array/Structure/AbbreviatedStructure を区別する
/// 各フィールドは kind に応じて意味を持つ
struct CipTypeDescriptor {
    TypeKind kind = TypeKind::Scalar;
    std::uint8_t code = 0;          // CIPデータ型コード
    std::uint32_t size = 0;         // 宣言バイトサイズ（Scalar: 幅、String: 最大サイズ）
    std::uint32_t instance_id = 0;  // コントローラのオブジェクトモデル上のインスタンスID

    // Array
    std::vector<ArrayDimension> dimensions;
    std::shared_ptr<const CipTypeDescriptor> element;

    // Structure
    std::string type_name;
    std::vector<StructureMember> members;
    std::uint16_t crc = 0;

    // ファクトリメソッド
    static CipTypeDescriptor Scalar(CipDataType type, std::uint32_t width);
    static CipTypeDescriptor Scalar(std::uint8_t code, std::uint32_t width);
    static CipTypeDescriptor String(std::uint32_t max_size);
    static CipTypeDescriptor Array(CipTypeDescriptor element_type,
                                   std::vector<ArrayDimension> dims,
                                   std::uint32_t total_size);
    static CipTypeDescriptor Structure(std::string name,
                                       std::uint32_t size_in_memory,
                                       std::vector<StructureMember> member_list);

    bool isScalar() const noexcept { return kind == TypeKind::Scalar; }

    /// 配列の総要素数（全次元の積）
    std::size_t elementCount() const noexcept;

    /// 複数メッセージ転送が必要な型か（String/Array/Structure）
    bool requiresSegmentedTransfer() const noexcept;
};

/// 構造体メンバ（名前と型）
struct StructureMember {
    std::string name;
    CipTypeDescriptor type;
};

} // namespace cpeip
