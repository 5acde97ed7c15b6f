#include "cpeip/variable_registry.hpp"

#include "cpeip/errors.hpp"

#include <algorithm>
#include <utility>

namespace cpeip {

VariableRegistry::VariableRegistry(std::string system_prefix)
    : system_prefix_(std::move(system_prefix)) {}

void VariableRegistry::add(VariableEntry entry) {
    const std::string name = entry.name;
    unresolved_.erase(name);
    auto result = entries_.insert_or_assign(name, std::move(entry));
    if (result.second) {
        order_.push_back(name);
    }
}

void VariableRegistry::addUnresolved(const std::string& name, const std::string& reason) {
    if (entries_.erase(name) > 0) {
        order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    }
    unresolved_[name] = reason;
}

const VariableEntry& VariableRegistry::lookup(const std::string& name) const {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        return it->second;
    }
    auto unresolved = unresolved_.find(name);
    if (unresolved != unresolved_.end()) {
        throw UnresolvedTypeError("Variable '" + name + "' has an unresolved type: " + unresolved->second);
    }
    throw NameNotFoundError(name);
}

bool VariableRegistry::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

bool VariableRegistry::isSystemVariable(const std::string& name) const {
    return !system_prefix_.empty() && name.compare(0, system_prefix_.size(), system_prefix_) == 0;
}

std::vector<std::string> VariableRegistry::userVariables() const {
    std::vector<std::string> result;
    for (const auto& name : order_) {
        if (!isSystemVariable(name)) {
            result.push_back(name);
        }
    }
    return result;
}

std::vector<std::string> VariableRegistry::systemVariables() const {
    std::vector<std::string> result;
    for (const auto& name : order_) {
        if (isSystemVariable(name)) {
            result.push_back(name);
        }
    }
    return result;
}

} // namespace cpeip
