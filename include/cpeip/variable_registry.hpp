#pragma once

#include "cpeip/cip_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cpeip {

/// 検出済み変数1件分
struct VariableEntry {
    std::string name;
    std::uint16_t instance_id = 0;  // Tag Name Server / Variable Object のインスタンスID
    CipTypeDescriptor type;
};

/// 変数名から型記述子を引くためのレジストリ
/// discover() 1回分の結果を保持し、構築後は変更しない
/// システム変数（名前が所定の接頭辞で始まるもの）とユーザー変数を区別して保持する
class VariableRegistry {
public:
    explicit VariableRegistry(std::string system_prefix = "_");

    /// 解決済みの変数を登録する（同名は上書き）
    void add(VariableEntry entry);

    /// 型解決できなかった変数を理由とともに登録する
    void addUnresolved(const std::string& name, const std::string& reason);

    /// @throws NameNotFoundError 名前が登録されていない場合
    /// @throws UnresolvedTypeError 型解決できなかった変数の場合
    const VariableEntry& lookup(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool isSystemVariable(const std::string& name) const;

    /// 検出順の変数名（解決済みのみ）
    const std::vector<std::string>& names() const noexcept { return order_; }

    std::vector<std::string> userVariables() const;
    std::vector<std::string> systemVariables() const;

    /// 型解決できなかった変数名と理由
    const std::map<std::string, std::string>& unresolved() const noexcept { return unresolved_; }

    std::size_t size() const noexcept { return entries_.size(); }

private:
    std::string system_prefix_;
    std::map<std::string, VariableEntry> entries_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> unresolved_;
};

} // namespace cpeip
