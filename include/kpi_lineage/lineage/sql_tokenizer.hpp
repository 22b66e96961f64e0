#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kpi_lineage {

enum class SqlTokenKind {
    Word,              // identifiers and keywords, unquoted
    QuotedIdentifier,  // `...` or "..."; text holds the unquoted content
    String,            // '...'; text holds the unquoted content
    Number,
    Symbol,            // punctuation and operators ("=", "<=", "(", ...)
};

// One lexical token. begin/end are byte offsets into the tokenized text, so
// callers can recover the verbatim source of any token range. depth is the
// parenthesis nesting level; both parens of a pair sit at the outer level.
struct SqlToken {
    SqlTokenKind kind = SqlTokenKind::Symbol;
    std::string text;
    std::size_t begin = 0;
    std::size_t end = 0;
    int depth = 0;

    // Case-insensitive keyword test; only Word tokens match.
    [[nodiscard]] bool IsKeyword(std::string_view upper_keyword) const;
    [[nodiscard]] bool IsSymbol(std::string_view symbol) const {
        return kind == SqlTokenKind::Symbol && text == symbol;
    }
    [[nodiscard]] bool IsIdentifier() const {
        return kind == SqlTokenKind::Word || kind == SqlTokenKind::QuotedIdentifier;
    }
};

/// Split SQL text into tokens. Never fails: comments are dropped, an
/// unterminated quote runs to the end of input, unknown bytes become
/// single-character symbols, stray closing parens do not drive depth negative.
std::vector<SqlToken> TokenizeSql(std::string_view sql);

/// Verbatim source text covered by tokens [first, last), whitespace collapsed.
std::string TokenRangeText(std::string_view sql, const std::vector<SqlToken>& tokens,
                           std::size_t first, std::size_t last);

} // namespace kpi_lineage
