#include <kpi_lineage/lineage/alias_resolver.hpp>

#include "lineage_utils.hpp"

namespace kpi_lineage {

using lineage_utils::ToLower;

std::string ResolveColumnRef(const ColumnRef& ref, const AliasMap& alias_map) {
    if (!ref.raw_alias.has_value() || ref.raw_alias->empty()) {
        return ref.column;
    }
    // A known alias is spelled the way it was declared; an unknown one is
    // kept as literal text.
    if (const auto* decl = alias_map.FindDeclaration(*ref.raw_alias)) {
        return decl->alias + "." + ref.column;
    }
    return *ref.raw_alias + "." + ref.column;
}

// ---------------------------------------------------------------------------
// TableResolver
// ---------------------------------------------------------------------------
TableResolver::TableResolver(const AliasMap& alias_map, const std::vector<std::string>& sources)
    : alias_map_(alias_map), sources_(sources) {
    exact_.reserve(sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto lower = ToLower(sources[i]);
        exact_.emplace(lower, i);
        for (auto dot = lower.find('.'); dot != std::string::npos;
             dot = lower.find('.', dot + 1)) {
            if (dot + 1 < lower.size()) {
                suffix_.emplace(lower.substr(dot + 1), i);
            }
        }
    }
}

std::optional<std::string> TableResolver::Resolve(std::string_view qualifier) const {
    if (qualifier.empty()) {
        return std::nullopt;
    }
    if (auto table = alias_map_.Find(qualifier)) {
        return table;
    }
    const auto lower = ToLower(qualifier);
    if (const auto it = exact_.find(lower); it != exact_.end()) {
        return sources_[it->second];
    }
    if (const auto it = suffix_.find(lower); it != suffix_.end()) {
        return sources_[it->second];
    }
    return std::nullopt;
}

std::optional<std::string> ResolveTable(std::string_view qualifier,
                                        const AliasMap& alias_map,
                                        const std::vector<std::string>& sources) {
    return TableResolver(alias_map, sources).Resolve(qualifier);
}

UsingSides InferUsingSides(const AliasMap& alias_map, std::size_t join_offset,
                           const std::optional<std::string>& join_alias) {
    UsingSides sides;
    if (join_alias.has_value() && !join_alias->empty()) {
        sides.right_alias = *join_alias;
    }
    const auto left = alias_map.LatestBefore(
        join_offset, sides.right_alias.has_value() ? std::string_view(*sides.right_alias)
                                                   : std::string_view());
    if (left.has_value()) {
        sides.left_alias = left->alias;
    }
    return sides;
}

} // namespace kpi_lineage
