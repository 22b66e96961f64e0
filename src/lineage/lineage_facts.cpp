#include <kpi_lineage/lineage/lineage_facts.hpp>

#include "lineage_utils.hpp"

#include <algorithm>

namespace kpi_lineage {

using lineage_utils::IEquals;
using lineage_utils::ToLower;

const char* OutputRoleName(OutputRole role) {
    switch (role) {
        case OutputRole::X:     return "x";
        case OutputRole::Y:     return "y";
        case OutputRole::Label: return "label";
        case OutputRole::Value: return "value";
    }
    return "";
}

std::optional<OutputRole> ParseOutputRole(std::string_view text) {
    for (auto role : kOutputRoles) {
        if (IEquals(text, OutputRoleName(role))) {
            return role;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// AliasMap
// ---------------------------------------------------------------------------
namespace {

constexpr std::size_t kNone = static_cast<std::size_t>(-1);

} // anonymous namespace

void AliasMap::Declare(std::string alias, std::string table, std::size_t offset) {
    if (alias.empty()) {
        return;
    }
    if (!declarations_.empty() && offset < declarations_.back().offset) {
        ordered_ = false;
    }
    std::size_t previous_other = kNone;
    if (!declarations_.empty()) {
        const auto last = declarations_.size() - 1;
        previous_other = IEquals(declarations_[last].alias, alias) ? previous_other_[last] : last;
    }
    previous_other_.push_back(previous_other);
    latest_[ToLower(alias)] = declarations_.size();
    declarations_.push_back({std::move(alias), std::move(table), offset});
}

const AliasDeclaration* AliasMap::FindDeclaration(std::string_view alias) const {
    const auto it = latest_.find(ToLower(alias));
    if (it == latest_.end()) {
        return nullptr;
    }
    return &declarations_[it->second];
}

std::optional<std::string> AliasMap::Find(std::string_view alias) const {
    if (const auto* decl = FindDeclaration(alias)) {
        return decl->table;
    }
    return std::nullopt;
}

bool AliasMap::Contains(std::string_view alias) const {
    return FindDeclaration(alias) != nullptr;
}

std::optional<AliasDeclaration> AliasMap::LatestBefore(std::size_t offset,
                                                       std::string_view exclude_alias) const {
    if (!ordered_) {
        for (auto it = declarations_.rbegin(); it != declarations_.rend(); ++it) {
            if (it->offset < offset &&
                (exclude_alias.empty() || !IEquals(it->alias, exclude_alias))) {
                return *it;
            }
        }
        return std::nullopt;
    }

    const auto end = std::lower_bound(declarations_.begin(), declarations_.end(), offset,
                                      [](const AliasDeclaration& decl, std::size_t value) {
                                          return decl.offset < value;
                                      });
    if (end == declarations_.begin()) {
        return std::nullopt;
    }
    auto index = static_cast<std::size_t>(end - declarations_.begin()) - 1;
    if (!exclude_alias.empty() && IEquals(declarations_[index].alias, exclude_alias)) {
        index = previous_other_[index];
        if (index == kNone) {
            return std::nullopt;
        }
    }
    return declarations_[index];
}

} // namespace kpi_lineage
