#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kpi_lineage {

// ---------------------------------------------------------------------------
// OutputRole — the four chart-data roles a SELECT list may alias to.
// ---------------------------------------------------------------------------
enum class OutputRole {
    X,
    Y,
    Label,
    Value,
};

constexpr std::array<OutputRole, 4> kOutputRoles = {
    OutputRole::X, OutputRole::Y, OutputRole::Label, OutputRole::Value};

/// "x", "y", "label" or "value".
const char* OutputRoleName(OutputRole role);

/// Case-insensitive inverse of OutputRoleName.
std::optional<OutputRole> ParseOutputRole(std::string_view text);

// ---------------------------------------------------------------------------
// ColumnRef — one side of a join predicate, as written.
// ---------------------------------------------------------------------------
struct ColumnRef {
    std::optional<std::string> raw_alias;
    std::string column;

    [[nodiscard]] bool Empty() const { return column.empty(); }

    // "alias.column" or "column".
    [[nodiscard]] std::string Text() const {
        if (raw_alias.has_value() && !raw_alias->empty()) {
            return *raw_alias + "." + column;
        }
        return column;
    }

    bool operator==(const ColumnRef& other) const {
        return raw_alias == other.raw_alias && column == other.column;
    }
    bool operator!=(const ColumnRef& other) const { return !(*this == other); }
};

enum class JoinForm {
    Equality,  // ON a.x = b.y
    Using,     // USING(col, ...), one fact per column
    Raw,       // anything else; only the predicate text is kept
};

// ---------------------------------------------------------------------------
// JoinFact — one JOIN clause (or one USING column of it) as extracted.
// ---------------------------------------------------------------------------
struct JoinFact {
    ColumnRef left;
    ColumnRef right;
    std::string predicate_text;
    JoinForm form = JoinForm::Raw;
    std::string kind;                        // "LEFT", "INNER", ... or empty
    std::string left_table;                  // table declared just before the JOIN
    std::string right_table;                 // table introduced by the JOIN
    std::optional<std::string> right_alias;
    int clause_index = 0;                    // 1-based JOIN clause number
    std::size_t offset = 0;                  // byte offset of the JOIN keyword

    bool operator==(const JoinFact& other) const {
        return left == other.left && right == other.right &&
               predicate_text == other.predicate_text && form == other.form &&
               kind == other.kind && left_table == other.left_table &&
               right_table == other.right_table &&
               right_alias == other.right_alias &&
               clause_index == other.clause_index && offset == other.offset;
    }
    bool operator!=(const JoinFact& other) const { return !(*this == other); }
};

struct AliasDeclaration {
    std::string alias;
    std::string table;
    std::size_t offset = 0;

    bool operator==(const AliasDeclaration& other) const {
        return alias == other.alias && table == other.table && offset == other.offset;
    }
};

// ---------------------------------------------------------------------------
// AliasMap — alias -> table for one query, in declaration order.
//
// Lookups are case-insensitive and go through a hash index. A re-declared
// alias keeps its history; Find returns the latest declaration.
// ---------------------------------------------------------------------------
class AliasMap {
public:
    void Declare(std::string alias, std::string table, std::size_t offset);

    [[nodiscard]] std::optional<std::string> Find(std::string_view alias) const;
    [[nodiscard]] const AliasDeclaration* FindDeclaration(std::string_view alias) const;
    [[nodiscard]] bool Contains(std::string_view alias) const;

    // Most recent declaration strictly before offset whose alias is not
    // exclude_alias. O(log n) while offsets arrive in increasing order.
    [[nodiscard]] std::optional<AliasDeclaration> LatestBefore(
        std::size_t offset, std::string_view exclude_alias = {}) const;

    [[nodiscard]] const std::vector<AliasDeclaration>& Declarations() const noexcept {
        return declarations_;
    }
    [[nodiscard]] bool Empty() const noexcept { return declarations_.empty(); }

    bool operator==(const AliasMap& other) const {
        return declarations_ == other.declarations_;
    }
    bool operator!=(const AliasMap& other) const { return !(*this == other); }

private:
    std::vector<AliasDeclaration> declarations_;
    std::unordered_map<std::string, std::size_t> latest_;  // lower-cased alias
    // Per declaration: index of the closest earlier declaration with another
    // alias, or npos.
    std::vector<std::size_t> previous_other_;
    bool ordered_ = true;
};

// ---------------------------------------------------------------------------
// LineageFacts — flat extractor output. Pure data.
// ---------------------------------------------------------------------------
struct LineageFacts {
    std::vector<std::string> sources;        // deduplicated, first-seen order
    AliasMap alias_map;
    std::vector<JoinFact> joins;             // source order
    std::vector<std::string> filters;        // WHERE split on top-level AND
    std::vector<std::string> group_by;
    std::vector<std::string> having;         // HAVING split on top-level AND
    std::map<OutputRole, std::string> outputs;
    std::optional<std::string> filter_date_column;

    bool operator==(const LineageFacts& other) const {
        return sources == other.sources && alias_map == other.alias_map &&
               joins == other.joins && filters == other.filters &&
               group_by == other.group_by && having == other.having &&
               outputs == other.outputs &&
               filter_date_column == other.filter_date_column;
    }
    bool operator!=(const LineageFacts& other) const { return !(*this == other); }
};

} // namespace kpi_lineage
