#pragma once

#include "cpeip/cip_types.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace cpeip {

/// 配列要素の値
using ElementValue = std::variant<bool,
                                  std::int8_t,
                                  std::int16_t,
                                  std::int32_t,
                                  std::int64_t,
                                  std::uint8_t,
                                  std::uint16_t,
                                  std::uint32_t,
                                  std::uint64_t,
                                  float,
                                  double,
                                  std::string>;

/// 変数の値
/// 基本型の配列は std::vector<ElementValue>、構造体（および構造体の配列）は生のバイト列で扱う
using VariableValue = std::variant<bool,                        // BOOL
                                   std::int8_t,                 // SINT
                                   std::int16_t,                // INT
                                   std::int32_t,                // DINT, ENUM
                                   std::int64_t,                // LINT, TIME, TIME_NSEC
                                   std::uint8_t,                // USINT, BYTE
                                   std::uint16_t,               // UINT, WORD, UINT BCD
                                   std::uint32_t,               // UDINT, DWORD, UDINT BCD
                                   std::uint64_t,               // ULINT, LWORD, ULINT BCD, DATE系
                                   float,                       // REAL
                                   double,                      // LREAL
                                   std::string,                 // STRING
                                   std::vector<ElementValue>,   // 基本型/文字列の配列
                                   std::vector<std::uint8_t>>;  // 構造体の生データ

/// 変数値のエンコード/デコードを行うクラス
/// 型記述子に従って、コントローラのシリアライズ表現とC++の型の間で変換する
class ValueCodec {
public:
    /// バイト列を型記述子に従ってデコードする
    /// @param type 型記述子
    /// @param bytes 値のバイト列（読み取り応答の型ヘッダーは除去済み）
    /// @throws FrameDecodeError データサイズが不足している場合
    /// @throws UnresolvedTypeError デコード方法が定義されていない型の場合
    VariableValue decode(const CipTypeDescriptor& type, const std::vector<std::uint8_t>& bytes) const;

    /// 値を型記述子に従ってエンコードする
    /// 文字列は長さプレフィックスなしの生の文字列バイト、配列は要素バイト列を返す
    /// @throws std::invalid_argument 値の型が記述子と一致しない、またはサイズ超過の場合
    std::vector<std::uint8_t> encode(const CipTypeDescriptor& type, const VariableValue& value) const;

    /// 基本型1要素をデコードする
    static ElementValue decodeElement(std::uint8_t code, const std::uint8_t* data, std::size_t width);

    /// 基本型1要素をエンコードする（width バイトに詰める）
    static void encodeElement(std::uint8_t code, const ElementValue& value, std::size_t width,
                              std::vector<std::uint8_t>& out);

    /// BCD変換ヘルパー
    static std::uint64_t fromBcd(std::uint64_t bcd);
    static std::uint64_t toBcd(std::uint64_t value, std::size_t width);
};

} // namespace cpeip
