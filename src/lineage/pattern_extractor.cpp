#include <kpi_lineage/lineage/pattern_extractor.hpp>

#include <kpi_lineage/lineage/alias_resolver.hpp>
#include <kpi_lineage/lineage/sql_tokenizer.hpp>

#include "lineage_utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kpi_lineage {

namespace {

using lineage_utils::IEquals;
using lineage_utils::LastSegment;
using lineage_utils::ToUpper;

// Words that can never be a table alias or a bare column name.
constexpr std::string_view kReservedWords[] = {
    "SELECT", "FROM",   "WHERE",  "GROUP",     "ORDER",      "BY",     "LIMIT",
    "HAVING", "QUALIFY", "WINDOW", "JOIN",     "INNER",      "LEFT",   "RIGHT",
    "FULL",   "OUTER",  "CROSS",  "NATURAL",   "ON",         "USING",  "AS",
    "AND",    "OR",     "NOT",    "UNION",     "INTERSECT",  "EXCEPT", "WITH",
    "LATERAL", "UNNEST", "WHEN",  "THEN",      "ELSE",       "END",    "CASE",
    "SET",    "INTO",   "VALUES", "OFFSET",    "FETCH",      "TABLESAMPLE",
    "FOR",    "PIVOT",  "UNPIVOT", "IN",       "IS",         "NULL",   "LIKE",
    "BETWEEN", "EXISTS", "DISTINCT", "ALL",    "ASC",        "DESC",   "OVER",
    "PARTITION",
};

// Keywords that may appear inside an expression without being a column.
constexpr std::string_view kExpressionKeywords[] = {
    "TRUE",       "FALSE",     "CAST",      "SAFE_CAST", "INTERVAL",  "ROWS",
    "RANGE",      "PRECEDING", "FOLLOWING", "UNBOUNDED", "CURRENT",   "ROW",
    "ANY",        "SOME",      "ILIKE",     "YEAR",      "QUARTER",   "MONTH",
    "WEEK",       "DAY",       "DAYOFWEEK", "DAYOFYEAR", "HOUR",      "MINUTE",
    "SECOND",     "MILLISECOND", "MICROSECOND", "ISOWEEK", "ISOYEAR",
};

// Type keywords that prefix a typed literal: DATE '2024-01-01'.
constexpr std::string_view kLiteralPrefixes[] = {
    "DATE", "DATETIME", "TIMESTAMP", "TIME", "NUMERIC", "BIGNUMERIC", "JSON",
};

constexpr std::string_view kJoinPrefixWords[] = {
    "NATURAL", "INNER", "LEFT", "RIGHT", "FULL", "OUTER", "CROSS",
};

// A '(' after one of these opens a subquery or a list, not a call.
constexpr std::string_view kNonCallWords[] = {
    "IN", "EXISTS", "ANY", "ALL", "SOME", "ARRAY", "AS",
};

using ClauseList = std::vector<std::string_view>;

const ClauseList kWhereStops = {"GROUP BY", "ORDER BY", "LIMIT",     "HAVING", "QUALIFY",
                                "WINDOW",   "UNION",    "INTERSECT", "EXCEPT"};
const ClauseList kGroupByStops = {"ORDER BY", "LIMIT", "HAVING",    "QUALIFY",
                                  "WINDOW",   "UNION", "INTERSECT", "EXCEPT"};
const ClauseList kHavingStops = {"ORDER BY", "LIMIT",     "QUALIFY", "WINDOW",
                                 "UNION",    "INTERSECT", "EXCEPT"};
const ClauseList kSelectStops = {"FROM",    "WHERE",  "GROUP BY", "ORDER BY",
                                 "LIMIT",   "HAVING", "QUALIFY",  "WINDOW",
                                 "UNION",   "INTERSECT", "EXCEPT"};

template <std::size_t N>
bool IsOneOf(const SqlToken& token, const std::string_view (&words)[N]) {
    if (token.kind != SqlTokenKind::Word) {
        return false;
    }
    for (const auto& word : words) {
        if (IEquals(token.text, word)) {
            return true;
        }
    }
    return false;
}

bool IsReserved(const SqlToken& token) {
    return IsOneOf(token, kReservedWords);
}

bool IsJoinPrefix(const SqlToken& token) {
    return IsOneOf(token, kJoinPrefixWords);
}

// An identifier usable as a table name, alias or column.
bool IsNameToken(const SqlToken& token) {
    if (!token.IsIdentifier()) {
        return false;
    }
    return token.kind == SqlTokenKind::QuotedIdentifier || !IsReserved(token);
}

// `project.dataset.table` with segments of word characters and '-'.
bool IsThreePartName(std::string_view text) {
    int segments = 1;
    std::size_t segment_length = 0;
    for (char c : text) {
        if (c == '.') {
            if (segment_length == 0) {
                return false;
            }
            ++segments;
            segment_length = 0;
            continue;
        }
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            return false;
        }
        ++segment_length;
    }
    return segments == 3 && segment_length > 0;
}

std::string JoinStrings(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

ColumnRef MakeColumnRef(const std::vector<std::string>& parts) {
    ColumnRef ref;
    if (parts.empty()) {
        return ref;
    }
    ref.column = parts.back();
    if (parts.size() >= 2) {
        ref.raw_alias = JoinStrings(
            std::vector<std::string>(parts.begin(), parts.end() - 1), ".");
    }
    return ref;
}

// Dotted name chain starting at first: a.b.c. Returns the index after it.
std::size_t ReadNameChain(const std::vector<SqlToken>& tokens, std::size_t first,
                          std::size_t limit, std::vector<std::string>& parts) {
    std::size_t j = first;
    parts.push_back(tokens[j].text);
    ++j;
    while (j + 1 < limit && tokens[j].IsSymbol(".") && tokens[j + 1].IsIdentifier()) {
        parts.push_back(tokens[j + 1].text);
        j += 2;
    }
    return j;
}

// ---------------------------------------------------------------------------
// FactExtractor — one pass over the token stream of a single SQL text.
// ---------------------------------------------------------------------------
class FactExtractor {
public:
    FactExtractor(std::string_view sql, const std::optional<std::string>& known_date)
        : sql_(sql), tokens_(TokenizeSql(sql)) {
        if (known_date.has_value() && !known_date->empty()) {
            facts_.filter_date_column = *known_date;
        }
    }

    LineageFacts Run() {
        MarkCallScopes();
        IndexParens();
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            const auto& token = tokens_[i];
            if (token.kind == SqlTokenKind::QuotedIdentifier &&
                IsThreePartName(token.text)) {
                AddSource(token.text);
            } else if (token.IsKeyword("FROM") && !in_call_[i]) {
                ScanFromClause(i);
            } else if (token.IsKeyword("JOIN")) {
                ScanJoinClause(i);
            }
        }
        facts_.filters = ExtractPredicateList("WHERE", kWhereStops);
        facts_.group_by = ExtractGroupBy();
        facts_.having = ExtractPredicateList("HAVING", kHavingStops);
        ExtractSelectList();
        return std::move(facts_);
    }

private:
    struct TableRef {
        std::string table;
        std::size_t table_offset = 0;
        std::optional<std::string> alias;
        std::size_t alias_offset = 0;
        std::size_t next = 0;
    };

    // -----------------------------------------------------------------------
    // Token helpers
    // -----------------------------------------------------------------------

    // in_call_[i] is true when token i sits inside the parens of a function
    // call, where FROM belongs to EXTRACT(... FROM ...) and friends.
    void MarkCallScopes() {
        in_call_.assign(tokens_.size(), false);
        std::vector<bool> scopes;
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            in_call_[i] = !scopes.empty() && scopes.back();
            if (tokens_[i].IsSymbol("(")) {
                const bool is_call = i > 0 && tokens_[i - 1].kind == SqlTokenKind::Word &&
                                     !IsReserved(tokens_[i - 1]) &&
                                     !IsOneOf(tokens_[i - 1], kNonCallWords);
                scopes.push_back(is_call);
            } else if (tokens_[i].IsSymbol(")") && !scopes.empty()) {
                scopes.pop_back();
            }
        }
    }

    // closing_[i] is the index of the ')' closing the '(' at i, or
    // tokens_.size() when it is never closed.
    void IndexParens() {
        closing_.assign(tokens_.size(), tokens_.size());
        std::vector<std::size_t> open;
        for (std::size_t i = 0; i < tokens_.size(); ++i) {
            if (tokens_[i].IsSymbol("(")) {
                open.push_back(i);
            } else if (tokens_[i].IsSymbol(")") && !open.empty()) {
                closing_[open.back()] = i;
                open.pop_back();
            }
        }
    }

    std::size_t MatchingParen(std::size_t open) const {
        return closing_[open];
    }

    // True when token j starts one of the clauses ("GROUP BY" is two words).
    bool StartsClause(std::size_t j, const ClauseList& clauses) const {
        for (const auto& clause : clauses) {
            const auto space = clause.find(' ');
            if (space == std::string_view::npos) {
                if (tokens_[j].IsKeyword(clause)) {
                    return true;
                }
                continue;
            }
            if (tokens_[j].IsKeyword(clause.substr(0, space)) && j + 1 < tokens_.size() &&
                tokens_[j + 1].IsKeyword(clause.substr(space + 1))) {
                return true;
            }
        }
        return false;
    }

    // First token at depth below `depth`, or at `depth` that is ';' or a
    // clause start.
    std::size_t ClauseEnd(std::size_t start, int depth,
                          const ClauseList& stops) const {
        for (std::size_t j = start; j < tokens_.size(); ++j) {
            const auto& token = tokens_[j];
            if (token.depth < depth) {
                return j;
            }
            if (token.depth > depth) {
                continue;
            }
            if (token.IsSymbol(";") || StartsClause(j, stops)) {
                return j;
            }
        }
        return tokens_.size();
    }

    // Keyword position preferring the outermost query: the first match at
    // depth 0, else the first match anywhere.
    std::optional<std::size_t> FindClause(std::string_view first,
                                          std::string_view second = {}) const {
        std::optional<std::size_t> any;
        for (std::size_t j = 0; j < tokens_.size(); ++j) {
            if (!tokens_[j].IsKeyword(first)) {
                continue;
            }
            if (!second.empty() &&
                (j + 1 >= tokens_.size() || !tokens_[j + 1].IsKeyword(second))) {
                continue;
            }
            if (tokens_[j].depth == 0) {
                return j;
            }
            if (!any.has_value()) {
                any = j;
            }
        }
        return any;
    }

    // Token ranges [first, last) separated by top-level commas or ANDs.
    std::vector<std::pair<std::size_t, std::size_t>> SplitRange(std::size_t start,
                                                                std::size_t end, int depth,
                                                                bool on_and) const {
        std::vector<std::pair<std::size_t, std::size_t>> parts;
        std::size_t part_start = start;
        bool between_pending = false;
        for (std::size_t j = start; j < end; ++j) {
            const auto& token = tokens_[j];
            if (token.depth != depth) {
                continue;
            }
            bool split = false;
            if (on_and) {
                if (token.IsKeyword("BETWEEN")) {
                    between_pending = true;
                } else if (token.IsKeyword("AND")) {
                    if (between_pending) {
                        between_pending = false;
                    } else {
                        split = true;
                    }
                }
            } else {
                split = token.IsSymbol(",");
            }
            if (split) {
                if (j > part_start) {
                    parts.emplace_back(part_start, j);
                }
                part_start = j + 1;
            }
        }
        if (end > part_start) {
            parts.emplace_back(part_start, end);
        }
        return parts;
    }

    std::vector<std::string> RangeTexts(
        const std::vector<std::pair<std::size_t, std::size_t>>& ranges) const {
        std::vector<std::string> out;
        for (const auto& range : ranges) {
            auto text = TokenRangeText(sql_, tokens_, range.first, range.second);
            if (!text.empty()) {
                out.push_back(std::move(text));
            }
        }
        return out;
    }

    // -----------------------------------------------------------------------
    // Sources and aliases
    // -----------------------------------------------------------------------

    void AddSource(const std::string& table) {
        if (!table.empty() && seen_sources_.insert(table).second) {
            facts_.sources.push_back(table);
        }
    }

    // name[.name...] [[AS] alias]; nullopt for subqueries and table functions.
    std::optional<TableRef> ParseTableRef(std::size_t k) const {
        if (k >= tokens_.size() || !IsNameToken(tokens_[k])) {
            return std::nullopt;
        }
        const int depth = tokens_[k].depth;
        std::string name = tokens_[k].text;
        std::size_t j = k + 1;
        while (j + 1 < tokens_.size()) {
            const auto& sep = tokens_[j];
            const auto& next = tokens_[j + 1];
            if (sep.IsSymbol(".") && next.IsIdentifier()) {
                name += ".";
                name += next.text;
                j += 2;
                continue;
            }
            // Unquoted project ids may contain '-': my-project.dataset.table
            if (sep.IsSymbol("-") && sep.begin == tokens_[j - 1].end &&
                next.begin == sep.end && next.kind == SqlTokenKind::Word) {
                name += "-";
                name += next.text;
                j += 2;
                continue;
            }
            break;
        }
        if (j < tokens_.size() && tokens_[j].IsSymbol("(")) {
            return std::nullopt;
        }

        TableRef ref;
        ref.table = std::move(name);
        ref.table_offset = tokens_[k].begin;
        std::size_t a = j;
        const bool has_as = a < tokens_.size() && tokens_[a].IsKeyword("AS");
        if (has_as) {
            ++a;
        }
        if (a < tokens_.size() && tokens_[a].depth == depth && IsNameToken(tokens_[a])) {
            ref.alias = tokens_[a].text;
            ref.alias_offset = tokens_[a].begin;
            j = a + 1;
        } else if (has_as) {
            j = a;
        }
        ref.next = j;
        return ref;
    }

    void RegisterTable(const TableRef& ref, int depth) {
        AddSource(ref.table);
        if (ref.alias.has_value()) {
            facts_.alias_map.Declare(*ref.alias, ref.table, ref.alias_offset);
        }
        last_table_at_depth_[depth] = ref.table;
    }

    // Skips a derived table or table function: (SELECT ...) s, UNNEST(x) AS u.
    // The alias is declared as its own pseudo table so USING inference still
    // sees it. Returns the index after the construct.
    std::size_t SkipDerivedTable(std::size_t k, std::optional<std::string>& alias) {
        std::size_t open = k;
        if (open < tokens_.size() && tokens_[open].IsIdentifier() && open + 1 < tokens_.size() &&
            tokens_[open + 1].IsSymbol("(")) {
            ++open;
        }
        if (open >= tokens_.size() || !tokens_[open].IsSymbol("(")) {
            return k;
        }
        const int depth = tokens_[open].depth;
        std::size_t j = MatchingParen(open);
        if (j >= tokens_.size()) {
            return j;
        }
        ++j;
        if (j < tokens_.size() && tokens_[j].IsKeyword("AS")) {
            ++j;
        }
        if (j < tokens_.size() && tokens_[j].depth == depth && IsNameToken(tokens_[j])) {
            alias = tokens_[j].text;
            facts_.alias_map.Declare(tokens_[j].text, tokens_[j].text, tokens_[j].begin);
            ++j;
        }
        return j;
    }

    void ScanFromClause(std::size_t i) {
        const int depth = tokens_[i].depth;
        last_table_at_depth_.erase(depth);
        std::size_t k = i + 1;
        while (true) {
            auto ref = ParseTableRef(k);
            if (!ref.has_value()) {
                break;
            }
            RegisterTable(*ref, depth);
            k = ref->next;
            if (k < tokens_.size() && tokens_[k].depth == depth && tokens_[k].IsSymbol(",")) {
                ++k;
                continue;
            }
            break;
        }
    }

    // -----------------------------------------------------------------------
    // Joins
    // -----------------------------------------------------------------------

    std::string JoinKindBefore(std::size_t i) const {
        std::vector<std::string> words;
        std::size_t j = i;
        while (j > 0 && IsJoinPrefix(tokens_[j - 1]) && tokens_[j - 1].depth == tokens_[i].depth) {
            --j;
            words.insert(words.begin(), ToUpper(tokens_[j].text));
        }
        return JoinStrings(words, " ");
    }

    bool StartsJoin(std::size_t j) const {
        while (j < tokens_.size() && IsJoinPrefix(tokens_[j])) {
            ++j;
        }
        return j < tokens_.size() && tokens_[j].IsKeyword("JOIN");
    }

    std::size_t JoinSpanEnd(std::size_t start, int depth) const {
        for (std::size_t j = start; j < tokens_.size(); ++j) {
            const auto& token = tokens_[j];
            if (token.depth < depth) {
                return j;
            }
            if (token.depth > depth) {
                continue;
            }
            if (token.IsSymbol(";") || token.IsSymbol(",") || token.IsKeyword("JOIN") ||
                StartsClause(j, kWhereStops) || token.IsKeyword("WHERE")) {
                return j;
            }
            if (IsJoinPrefix(token) && StartsJoin(j)) {
                return j;
            }
        }
        return tokens_.size();
    }

    // Name chain ending at token last, not reaching before floor.
    std::optional<ColumnRef> RefEndingAt(std::size_t last, std::size_t floor) const {
        if (last < floor || last >= tokens_.size() || !IsNameToken(tokens_[last])) {
            return std::nullopt;
        }
        std::size_t first = last;
        while (first >= floor + 2 && tokens_[first - 1].IsSymbol(".") &&
               tokens_[first - 2].IsIdentifier()) {
            first -= 2;
        }
        std::vector<std::string> parts;
        for (std::size_t j = first; j <= last; j += 2) {
            parts.push_back(tokens_[j].text);
        }
        return MakeColumnRef(parts);
    }

    std::optional<ColumnRef> RefStartingAt(std::size_t first, std::size_t end) const {
        if (first >= end || !IsNameToken(tokens_[first])) {
            return std::nullopt;
        }
        std::vector<std::string> parts;
        const auto next = ReadNameChain(tokens_, first, end, parts);
        if (next < end && tokens_[next].IsSymbol("(")) {
            return std::nullopt;
        }
        return MakeColumnRef(parts);
    }

    void AddOnJoin(JoinFact fact, std::size_t start, std::size_t end) {
        fact.predicate_text = TokenRangeText(sql_, tokens_, start, end);
        for (std::size_t j = start; j < end; ++j) {
            if (!tokens_[j].IsSymbol("=") || j == start) {
                continue;
            }
            auto left = RefEndingAt(j - 1, start);
            auto right = RefStartingAt(j + 1, end);
            if (left.has_value() && right.has_value()) {
                fact.left = std::move(*left);
                fact.right = std::move(*right);
                fact.form = JoinForm::Equality;
                break;
            }
        }
        facts_.joins.push_back(std::move(fact));
    }

    void AddUsingJoin(JoinFact fact, std::size_t using_pos, std::size_t end) {
        std::vector<std::string> columns;
        std::size_t close = using_pos + 1;
        if (close < end && tokens_[close].IsSymbol("(")) {
            const auto open = close;
            close = std::min(MatchingParen(open), end);
            for (std::size_t j = open + 1; j < close; ++j) {
                if (tokens_[j].IsIdentifier()) {
                    columns.push_back(tokens_[j].text);
                }
            }
        }
        fact.predicate_text =
            TokenRangeText(sql_, tokens_, using_pos, std::min(close + 1, end));
        if (columns.empty()) {
            facts_.joins.push_back(std::move(fact));
            return;
        }

        const auto sides = InferUsingSides(facts_.alias_map, fact.offset, fact.right_alias);
        std::optional<std::string> left_qualifier = sides.left_alias;
        if (!left_qualifier.has_value() && !fact.left_table.empty()) {
            left_qualifier = LastSegment(fact.left_table);
        }
        std::optional<std::string> right_qualifier = sides.right_alias;
        if (!right_qualifier.has_value() && !fact.right_table.empty()) {
            right_qualifier = LastSegment(fact.right_table);
        }

        fact.form = JoinForm::Using;
        for (const auto& column : columns) {
            JoinFact per_column = fact;
            per_column.left = ColumnRef{left_qualifier, column};
            per_column.right = ColumnRef{right_qualifier, column};
            facts_.joins.push_back(std::move(per_column));
        }
    }

    void ScanJoinClause(std::size_t i) {
        const int depth = tokens_[i].depth;
        JoinFact fact;
        fact.clause_index = ++join_count_;
        fact.offset = tokens_[i].begin;
        fact.kind = JoinKindBefore(i);
        const auto left_it = last_table_at_depth_.find(depth);
        if (left_it != last_table_at_depth_.end()) {
            fact.left_table = left_it->second;
        }

        std::size_t k = i + 1;
        if (auto ref = ParseTableRef(k)) {
            fact.right_table = ref->table;
            fact.right_alias = ref->alias;
            RegisterTable(*ref, depth);
            k = ref->next;
        } else {
            k = SkipDerivedTable(k, fact.right_alias);
        }

        const auto end = JoinSpanEnd(k, depth);
        if (k < end && tokens_[k].IsKeyword("USING")) {
            AddUsingJoin(std::move(fact), k, end);
        } else if (k < end && tokens_[k].IsKeyword("ON")) {
            AddOnJoin(std::move(fact), k + 1, end);
        } else {
            fact.predicate_text = TokenRangeText(sql_, tokens_, k, end);
            facts_.joins.push_back(std::move(fact));
        }
    }

    // -----------------------------------------------------------------------
    // Clauses
    // -----------------------------------------------------------------------

    std::vector<std::string> ExtractPredicateList(std::string_view keyword,
                                                  const ClauseList& stops) {
        const auto pos = FindClause(keyword);
        if (!pos.has_value()) {
            return {};
        }
        const int depth = tokens_[*pos].depth;
        const auto start = *pos + 1;
        const auto end = ClauseEnd(start, depth, stops);
        return RangeTexts(SplitRange(start, end, depth, /*on_and=*/true));
    }

    std::vector<std::string> ExtractGroupBy() {
        const auto pos = FindClause("GROUP", "BY");
        if (!pos.has_value()) {
            return {};
        }
        const int depth = tokens_[*pos].depth;
        const auto start = *pos + 2;
        const auto end = ClauseEnd(start, depth, kGroupByStops);
        return RangeTexts(SplitRange(start, end, depth, /*on_and=*/false));
    }

    void ExtractSelectList() {
        const auto pos = FindClause("SELECT");
        if (!pos.has_value()) {
            return;
        }
        const int depth = tokens_[*pos].depth;
        std::size_t start = *pos + 1;
        while (start < tokens_.size() &&
               (tokens_[start].IsKeyword("DISTINCT") || tokens_[start].IsKeyword("ALL"))) {
            ++start;
        }
        const auto end = ClauseEnd(start, depth, kSelectStops);

        for (const auto& element : SplitRange(start, end, depth, /*on_and=*/false)) {
            const auto first = element.first;
            const auto last = element.second;
            if (last - first < 3 || !tokens_[last - 2].IsKeyword("AS") ||
                tokens_[last - 2].depth != depth || !tokens_[last - 1].IsIdentifier()) {
                continue;
            }
            const auto& alias = tokens_[last - 1].text;
            if (const auto role = ParseOutputRole(alias)) {
                if (facts_.outputs.count(*role) == 0) {
                    facts_.outputs[*role] = TokenRangeText(sql_, tokens_, first, last);
                }
            }
            if (!facts_.filter_date_column.has_value() && tokens_[first].IsKeyword("DATE") &&
                first + 1 < last && tokens_[first + 1].IsSymbol("(") &&
                MatchingParen(first + 1) == last - 3) {
                facts_.filter_date_column = alias;
            }
        }
    }

    std::string_view sql_;
    std::vector<SqlToken> tokens_;
    std::vector<bool> in_call_;
    std::vector<std::size_t> closing_;
    LineageFacts facts_;
    std::unordered_set<std::string> seen_sources_;
    std::map<int, std::string> last_table_at_depth_;
    int join_count_ = 0;
};

} // anonymous namespace

LineageFacts ExtractLineageFacts(std::string_view sql,
                                 const std::optional<std::string>& known_filter_date_column) {
    return FactExtractor(sql, known_filter_date_column).Run();
}

std::vector<ColumnRef> ScanColumnRefs(std::string_view expression) {
    const auto tokens = TokenizeSql(expression);
    std::vector<ColumnRef> refs;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (!token.IsIdentifier()) {
            continue;
        }
        if (i > 0 && (tokens[i - 1].IsSymbol(".") || tokens[i - 1].IsKeyword("AS"))) {
            continue;
        }
        std::vector<std::string> parts;
        const auto next = ReadNameChain(tokens, i, tokens.size(), parts);
        const bool is_call = next < tokens.size() && tokens[next].IsSymbol("(");
        const bool bare_word = parts.size() == 1 && token.kind == SqlTokenKind::Word;
        const bool is_keyword = bare_word && (IsReserved(token) ||
                                              IsOneOf(token, kExpressionKeywords));
        const bool is_literal_prefix = bare_word && IsOneOf(token, kLiteralPrefixes) &&
                                       next < tokens.size() &&
                                       tokens[next].kind == SqlTokenKind::String;
        if (!is_call && !is_keyword && !is_literal_prefix) {
            refs.push_back(MakeColumnRef(parts));
        }
        i = next - 1;
    }
    return refs;
}

} // namespace kpi_lineage
