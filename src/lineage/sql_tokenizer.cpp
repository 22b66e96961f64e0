#include <kpi_lineage/lineage/sql_tokenizer.hpp>

#include "lineage_utils.hpp"

#include <cctype>

namespace kpi_lineage {

namespace {

bool IsWordStart(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || c == '@' || c == '$' || uc >= 0x80;
}

bool IsWordChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

constexpr std::string_view kTwoCharSymbols[] = {
    "<=", ">=", "<>", "!=", "||", "::", "=>", "==",
};

class Scanner {
public:
    explicit Scanner(std::string_view sql) : sql_(sql) {}

    std::vector<SqlToken> Run() {
        std::vector<SqlToken> tokens;
        while (true) {
            SkipWhitespaceAndComments();
            if (pos_ >= sql_.size()) {
                break;
            }
            tokens.push_back(Next());
        }
        return tokens;
    }

private:
    char Peek(std::size_t ahead = 0) const {
        return pos_ + ahead < sql_.size() ? sql_[pos_ + ahead] : '\0';
    }

    void SkipWhitespaceAndComments() {
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if ((c == '-' && Peek(1) == '-') || c == '#') {
                while (pos_ < sql_.size() && sql_[pos_] != '\n') ++pos_;
            } else if (c == '/' && Peek(1) == '*') {
                const auto close = sql_.find("*/", pos_ + 2);
                pos_ = close == std::string_view::npos ? sql_.size() : close + 2;
            } else {
                break;
            }
        }
    }

    SqlToken Next() {
        const char c = sql_[pos_];
        if (c == '`' || c == '"') {
            return Quoted(SqlTokenKind::QuotedIdentifier, c);
        }
        if (c == '\'') {
            return Quoted(SqlTokenKind::String, c);
        }
        if (IsDigit(c) || (c == '.' && IsDigit(Peek(1)))) {
            return NumberToken();
        }
        if (IsWordStart(c)) {
            return WordToken();
        }
        return SymbolToken();
    }

    // Backslash escapes and doubled quote characters stay inside the token.
    SqlToken Quoted(SqlTokenKind kind, char quote) {
        const auto start = pos_++;
        std::string content;
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (c == '\\' && pos_ + 1 < sql_.size()) {
                content.push_back(sql_[pos_ + 1]);
                pos_ += 2;
                continue;
            }
            if (c == quote) {
                if (Peek(1) == quote) {
                    content.push_back(quote);
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                break;
            }
            content.push_back(c);
            ++pos_;
        }
        return Make(kind, std::move(content), start);
    }

    SqlToken NumberToken() {
        const auto start = pos_;
        while (pos_ < sql_.size() && (IsDigit(sql_[pos_]) || sql_[pos_] == '.')) {
            ++pos_;
        }
        if ((Peek() == 'e' || Peek() == 'E') &&
            (IsDigit(Peek(1)) || ((Peek(1) == '+' || Peek(1) == '-') && IsDigit(Peek(2))))) {
            pos_ += 2;
            while (pos_ < sql_.size() && IsDigit(sql_[pos_])) ++pos_;
        }
        return Make(SqlTokenKind::Number, std::string(sql_.substr(start, pos_ - start)), start);
    }

    SqlToken WordToken() {
        const auto start = pos_++;
        while (pos_ < sql_.size() && IsWordChar(sql_[pos_])) {
            ++pos_;
        }
        return Make(SqlTokenKind::Word, std::string(sql_.substr(start, pos_ - start)), start);
    }

    SqlToken SymbolToken() {
        const auto start = pos_;
        for (auto sym : kTwoCharSymbols) {
            if (sql_.substr(pos_, 2) == sym) {
                pos_ += 2;
                return Make(SqlTokenKind::Symbol, std::string(sym), start);
            }
        }
        const char c = sql_[pos_++];
        if (c == '(') {
            auto token = Make(SqlTokenKind::Symbol, "(", start);
            ++depth_;
            return token;
        }
        if (c == ')') {
            if (depth_ > 0) --depth_;
            return Make(SqlTokenKind::Symbol, ")", start);
        }
        return Make(SqlTokenKind::Symbol, std::string(1, c), start);
    }

    SqlToken Make(SqlTokenKind kind, std::string text, std::size_t start) const {
        SqlToken token;
        token.kind = kind;
        token.text = std::move(text);
        token.begin = start;
        token.end = pos_;
        token.depth = depth_;
        return token;
    }

    std::string_view sql_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

} // anonymous namespace

bool SqlToken::IsKeyword(std::string_view upper_keyword) const {
    return kind == SqlTokenKind::Word && lineage_utils::IEquals(text, upper_keyword);
}

std::vector<SqlToken> TokenizeSql(std::string_view sql) {
    return Scanner(sql).Run();
}

std::string TokenRangeText(std::string_view sql, const std::vector<SqlToken>& tokens,
                           std::size_t first, std::size_t last) {
    if (first >= last || first >= tokens.size()) {
        return "";
    }
    if (last > tokens.size()) {
        last = tokens.size();
    }
    const auto begin = tokens[first].begin;
    const auto end = tokens[last - 1].end;
    if (begin >= end || end > sql.size()) {
        return "";
    }
    return lineage_utils::CollapseWhitespace(sql.substr(begin, end - begin));
}

} // namespace kpi_lineage
