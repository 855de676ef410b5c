// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// 구문 분류 및 테이블명/술어 추출 구현.
// "주석 제거 → 토큰화(괄호 깊이 포함) → 최상위 키워드 스캔" 순서로 동작한다.
//
// [토큰화 규칙]
// - '...'        : 문자열 리터럴. '' 만 이스케이프로 인정한다 (표준 SQL).
//                  MySQL 의 \' 이스케이프는 닫히지 않은 문자열로 판정되어
//                  ParseError (fail-close) 가 된다.
// - "..." `...`  : 인용 식별자. 내용만 테이블명으로 사용한다.
// - ( )          : 깊이를 추적한다. 불균형이면 ParseError.
// - ;            : 끝 세미콜론만 허용한다. 그 외는 복수 구문으로 ParseError.
// - #            : 주석이 아니다 (SQLite 바인드 파라미터, PostgreSQL 연산자).
// - $tag$..$tag$ : PostgreSQL 달러 인용 문자열. 경계를 엔진과 같게 판정할 수
//                  없으므로 ParseError (fail-close).
// - E'...'       : 백슬래시 이스케이프 문자열. 같은 이유로 ParseError.
//
// [서브쿼리 처리]
// FROM/JOIN 은 최상위 또는 "(SELECT" 로 열린 괄호 안에서만 테이블 원천으로 본다.
// EXTRACT(YEAR FROM d), TRIM(BOTH ' ' FROM s) 같은 함수 인자의 FROM 은 무시한다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

const char* command_to_string(SqlCommand cmd) noexcept {
    switch (cmd) {
        case SqlCommand::kSelect:   return "SELECT";
        case SqlCommand::kInsert:   return "INSERT";
        case SqlCommand::kUpdate:   return "UPDATE";
        case SqlCommand::kDelete:   return "DELETE";
        case SqlCommand::kDrop:     return "DROP";
        case SqlCommand::kTruncate: return "TRUNCATE";
        case SqlCommand::kAlter:    return "ALTER";
        case SqlCommand::kCreate:   return "CREATE";
        case SqlCommand::kGrant:    return "GRANT";
        case SqlCommand::kRevoke:   return "REVOKE";
        case SqlCommand::kCall:     return "CALL";
        case SqlCommand::kPrepare:  return "PREPARE";
        case SqlCommand::kExecute:  return "EXECUTE";
        case SqlCommand::kUnknown:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// 익명 네임스페이스: 내부 헬퍼 함수들
// ---------------------------------------------------------------------------
namespace {

constexpr std::size_t kNpos = std::numeric_limits<std::size_t>::max();

// SQL 에서 주석을 제거한다. 문자열 리터럴/인용 식별자 내부는 보존한다.
//
// 블록 주석 자리에는 공백 하나를 삽입하여 DROP/**/TABLE 이
// DROPTABLE 로 붙지 않도록 한다. 닫히지 않은 블록 주석은 끝까지 주석으로 본다.
std::string remove_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();
    char quote = '\0';

    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if (quote != '\0') {
            result.push_back(c);
            if (c == quote) {
                if (next == quote) {
                    result.push_back(next);
                    i += 2;
                    continue;
                }
                quote = '\0';
            }
            ++i;
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            result.push_back(c);
            ++i;
            continue;
        }

        if (c == '/' && next == '*') {
            i += 2;
            while (i + 1 < len && !(sql[i] == '*' && sql[i + 1] == '/')) {
                ++i;
            }
            i = (i + 1 < len) ? i + 2 : len;
            result.push_back(' ');
            continue;
        }

        if (c == '-' && next == '-') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        result.push_back(c);
        ++i;
    }

    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(static_cast<std::size_t>(begin - s.begin()),
                    static_cast<std::size_t>(end - begin));
}

// ---------------------------------------------------------------------------
// 토큰
// ---------------------------------------------------------------------------
enum class TokenKind : std::uint8_t {
    kWord,
    kQuotedIdent,
    kString,
    kNumber,
    kOpenParen,
    kCloseParen,
    kComma,
    kDot,
    kSemicolon,
    kOther,
};

struct Token {
    TokenKind   kind{TokenKind::kOther};
    std::string text{};   // kWord: 원문, kQuotedIdent: 따옴표 제거 내용
    std::string upper{};  // kWord 전용 대문자 사본
    std::size_t begin{0};
    std::size_t end{0};
    int         depth{0}; // 토큰 위치의 괄호 깊이 (괄호 토큰은 바깥 깊이)
};

using Tokens = std::vector<Token>;

bool is_word_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '$' || c >= 0x80;
}

// $$ 또는 $tag$ (tag 는 숫자로 시작하지 않는 식별자) 로 시작하는지.
// $1 같은 위치 파라미터나 식별자 내부의 $ 는 해당하지 않는다.
bool starts_dollar_quote(std::string_view s, std::size_t i) {
    if (i > 0 && is_word_char(static_cast<unsigned char>(s[i - 1]))) {
        return false;
    }
    std::size_t j = i + 1;
    if (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j])) != 0) {
        return false;
    }
    while (j < s.size()) {
        const auto ch = static_cast<unsigned char>(s[j]);
        if (ch == '$') {
            return true;
        }
        if (std::isalnum(ch) == 0 && ch != '_' && ch < 0x80) {
            return false;
        }
        ++j;
    }
    return false;
}

std::expected<Tokens, ParseError> tokenize(std::string_view s) {
    Tokens tokens;
    int depth = 0;
    const std::size_t len = s.size();
    std::size_t i = 0;

    const auto make_error = [&](std::string msg, std::size_t pos) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidSql,
            std::move(msg),
            std::string(s.substr(pos, 40))
        });
    };

    while (i < len) {
        const auto c = static_cast<unsigned char>(s[i]);

        if (std::isspace(c) != 0) {
            ++i;
            continue;
        }

        Token tok;
        tok.begin = i;
        tok.depth = depth;

        if (c == '$' && starts_dollar_quote(s, i)) {
            return make_error("Dollar-quoted strings are not supported", i);
        }

        if ((c == 'E' || c == 'e') && i + 1 < len && s[i + 1] == '\'' &&
            (i == 0 || !is_word_char(static_cast<unsigned char>(s[i - 1])))) {
            return make_error("Escape string literals (E'...') are not supported", i);
        }

        if (c == '\'' || c == '"' || c == '`') {
            const char quote = static_cast<char>(c);
            std::string content;
            std::size_t j = i + 1;
            bool closed = false;
            while (j < len) {
                if (s[j] == quote) {
                    if (j + 1 < len && s[j + 1] == quote) {
                        content.push_back(quote);
                        j += 2;
                        continue;
                    }
                    closed = true;
                    ++j;
                    break;
                }
                content.push_back(s[j]);
                ++j;
            }
            if (!closed) {
                return make_error("Unterminated quoted literal or identifier", i);
            }
            tok.kind = (quote == '\'') ? TokenKind::kString : TokenKind::kQuotedIdent;
            tok.text = (quote == '\'') ? std::string(s.substr(i, j - i)) : std::move(content);
            tok.end  = j;
            tokens.push_back(std::move(tok));
            i = j;
            continue;
        }

        if (c == '(') {
            tok.kind = TokenKind::kOpenParen;
            tok.end  = i + 1;
            tokens.push_back(std::move(tok));
            ++depth;
            ++i;
            continue;
        }

        if (c == ')') {
            --depth;
            if (depth < 0) {
                return make_error("Unbalanced parenthesis", i);
            }
            tok.kind  = TokenKind::kCloseParen;
            tok.depth = depth;
            tok.end   = i + 1;
            tokens.push_back(std::move(tok));
            ++i;
            continue;
        }

        const bool prev_is_name = !tokens.empty() &&
            (tokens.back().kind == TokenKind::kWord ||
             tokens.back().kind == TokenKind::kQuotedIdent ||
             tokens.back().kind == TokenKind::kCloseParen);

        if (std::isdigit(c) != 0 ||
            (c == '.' && !prev_is_name && i + 1 < len &&
             std::isdigit(static_cast<unsigned char>(s[i + 1])) != 0)) {
            std::size_t j = i + 1;
            while (j < len && (is_word_char(static_cast<unsigned char>(s[j])) || s[j] == '.')) {
                ++j;
            }
            tok.kind = TokenKind::kNumber;
            tok.text = std::string(s.substr(i, j - i));
            tok.end  = j;
            tokens.push_back(std::move(tok));
            i = j;
            continue;
        }

        if (is_word_char(c)) {
            std::size_t j = i + 1;
            while (j < len && is_word_char(static_cast<unsigned char>(s[j]))) {
                ++j;
            }
            tok.kind  = TokenKind::kWord;
            tok.text  = std::string(s.substr(i, j - i));
            tok.upper = to_upper(tok.text);
            tok.end   = j;
            tokens.push_back(std::move(tok));
            i = j;
            continue;
        }

        switch (c) {
            case ',': tok.kind = TokenKind::kComma;     break;
            case '.': tok.kind = TokenKind::kDot;       break;
            case ';': tok.kind = TokenKind::kSemicolon; break;
            default:  tok.kind = TokenKind::kOther;     break;
        }
        tok.text = std::string(1, static_cast<char>(c));
        tok.end  = i + 1;
        tokens.push_back(std::move(tok));
        ++i;
    }

    if (depth != 0) {
        return make_error("Unbalanced parenthesis", len > 40 ? len - 40 : 0);
    }
    return tokens;
}

// ---------------------------------------------------------------------------
// 토큰 탐색 헬퍼
// ---------------------------------------------------------------------------
bool is_word(const Tokens& t, std::size_t i, std::string_view kw) {
    return i < t.size() && t[i].kind == TokenKind::kWord && t[i].upper == kw;
}

bool is_kind(const Tokens& t, std::size_t i, TokenKind kind) {
    return i < t.size() && t[i].kind == kind;
}

// from 부터 depth 깊이에서 kws 중 하나와 일치하는 첫 단어 토큰의 인덱스.
std::size_t find_at_depth(const Tokens& t, std::size_t from, int depth,
                          std::initializer_list<std::string_view> kws) {
    for (std::size_t i = from; i < t.size(); ++i) {
        if (t[i].kind != TokenKind::kWord || t[i].depth != depth) {
            continue;
        }
        for (const auto kw : kws) {
            if (t[i].upper == kw) {
                return i;
            }
        }
    }
    return kNpos;
}

// open 위치의 '(' 와 짝이 되는 ')' 인덱스.
std::size_t matching_paren(const Tokens& t, std::size_t open) {
    const int depth = t[open].depth;
    for (std::size_t i = open + 1; i < t.size(); ++i) {
        if (t[i].kind == TokenKind::kCloseParen && t[i].depth == depth) {
            return i;
        }
    }
    return kNpos;
}

// 토큰 [first, last) 에 해당하는 원문 구간.
std::string slice(std::string_view clean, const Tokens& t, std::size_t first, std::size_t last) {
    if (first >= last || first >= t.size()) {
        return {};
    }
    last = std::min(last, t.size());
    const std::size_t b = t[first].begin;
    const std::size_t e = t[last - 1].end;
    return std::string(trim(clean.substr(b, e - b)));
}

bool is_reserved_after_table(const Token& tok) {
    static const std::unordered_set<std::string> kReserved = {
        "WHERE", "JOIN", "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "OUTER",
        "NATURAL", "ON", "USING", "SET", "GROUP", "ORDER", "LIMIT", "OFFSET",
        "HAVING", "UNION", "EXCEPT", "INTERSECT", "WINDOW", "RETURNING",
        "VALUES", "VALUE", "SELECT", "FROM", "FOR", "LATERAL", "STRAIGHT_JOIN",
        "DEFAULT", "AS", "WITH", "INDEXED", "NOT",
    };
    return tok.kind == TokenKind::kWord && kReserved.contains(tok.upper);
}

// schema.table 형태의 이름을 읽는다. 인용 부호는 제거한다.
// 인용되지 않은 부분은 소문자로 접고, 인용된 부분은 그대로 둔다 (PostgreSQL 규칙).
std::optional<std::pair<std::string, std::size_t>>
read_qualified_name(const Tokens& t, std::size_t i) {
    const auto is_name_token = [&](std::size_t k) {
        return k < t.size() &&
               (t[k].kind == TokenKind::kQuotedIdent ||
                (t[k].kind == TokenKind::kWord && !is_reserved_after_table(t[k])));
    };
    const auto part = [&](std::size_t k) {
        return t[k].kind == TokenKind::kQuotedIdent ? t[k].text : to_lower(t[k].text);
    };

    if (!is_name_token(i)) {
        return std::nullopt;
    }
    std::string name = part(i);
    ++i;
    while (is_kind(t, i, TokenKind::kDot) &&
           i + 1 < t.size() &&
           (t[i + 1].kind == TokenKind::kWord || t[i + 1].kind == TokenKind::kQuotedIdent)) {
        name += '.';
        name += part(i + 1);
        i += 2;
    }
    return std::make_pair(std::move(name), i);
}

// 이름은 read_qualified_name 에서 이미 접혀 있으므로 그대로 비교한다.
void add_table(std::vector<std::string>& out, std::string name) {
    if (std::find(out.begin(), out.end(), name) == out.end()) {
        out.push_back(std::move(name));
    }
}

// 테이블 이름 뒤의 별칭(AS x 또는 x)을 건너뛴다.
std::size_t skip_alias(const Tokens& t, std::size_t i) {
    if (is_word(t, i, "AS")) {
        return i + 2;
    }
    if (i < t.size() &&
        (t[i].kind == TokenKind::kQuotedIdent ||
         (t[i].kind == TokenKind::kWord && !is_reserved_after_table(t[i])))) {
        return i + 1;
    }
    return i;
}

// FROM a [AS x], b, (SELECT ...) y 형태의 테이블 목록을 읽는다.
// 반환: 목록 다음 토큰 인덱스
std::size_t read_table_list(const Tokens& t, std::size_t i, bool allow_list,
                            std::vector<std::string>& out) {
    while (i < t.size()) {
        while (is_word(t, i, "ONLY") || is_word(t, i, "LATERAL")) {
            ++i;
        }
        if (is_kind(t, i, TokenKind::kOpenParen)) {
            // 파생 테이블: 내부 FROM 은 collect_table_refs 의 전체 스캔이 처리한다.
            const auto close = matching_paren(t, i);
            if (close == kNpos) {
                return t.size();
            }
            i = skip_alias(t, close + 1);
        } else {
            auto name = read_qualified_name(t, i);
            if (!name) {
                return i;
            }
            i = name->second;
            if (is_kind(t, i, TokenKind::kOpenParen)) {
                // 테이블 함수 (generate_series(...) 등)
                const auto close = matching_paren(t, i);
                i = (close == kNpos) ? t.size() : close + 1;
            } else {
                add_table(out, std::move(name->first));
            }
            i = skip_alias(t, i);
        }

        if (allow_list && is_kind(t, i, TokenKind::kComma)) {
            ++i;
            continue;
        }
        break;
    }
    return i;
}

// 구문 전체에서 FROM / JOIN / USING <table> 뒤 테이블명을 수집한다.
// 함수 인자 괄호 안의 FROM 은 무시한다.
void collect_table_refs(const Tokens& t, std::vector<std::string>& out) {
    std::vector<bool> subquery_stack;
    for (std::size_t i = 0; i < t.size(); ++i) {
        const Token& tok = t[i];
        if (tok.kind == TokenKind::kOpenParen) {
            subquery_stack.push_back(is_word(t, i + 1, "SELECT") || is_word(t, i + 1, "WITH"));
            continue;
        }
        if (tok.kind == TokenKind::kCloseParen) {
            if (!subquery_stack.empty()) {
                subquery_stack.pop_back();
            }
            continue;
        }
        if (tok.kind != TokenKind::kWord) {
            continue;
        }
        const bool in_query = subquery_stack.empty() || subquery_stack.back();
        if (!in_query) {
            continue;
        }
        if (tok.upper == "FROM") {
            read_table_list(t, i + 1, true, out);
        } else if (tok.upper == "JOIN" || tok.upper == "STRAIGHT_JOIN") {
            read_table_list(t, i + 1, false, out);
        } else if (tok.upper == "USING" && !is_kind(t, i + 1, TokenKind::kOpenParen)) {
            read_table_list(t, i + 1, true, out);
        }
    }
}

// WITH name [(cols)] AS [NOT] [MATERIALIZED] ( ... ) [, ...] 의 CTE 이름과
// 본문 시작 인덱스.
std::pair<std::vector<std::string>, std::size_t> read_cte_names(const Tokens& t) {
    std::vector<std::string> names;
    std::size_t i = 1;
    if (is_word(t, i, "RECURSIVE")) {
        ++i;
    }
    while (i < t.size()) {
        if (t[i].kind != TokenKind::kWord && t[i].kind != TokenKind::kQuotedIdent) {
            break;
        }
        names.push_back(t[i].text);
        ++i;
        if (is_kind(t, i, TokenKind::kOpenParen)) {
            const auto close = matching_paren(t, i);
            if (close == kNpos) {
                break;
            }
            i = close + 1;
        }
        if (!is_word(t, i, "AS")) {
            break;
        }
        ++i;
        if (is_word(t, i, "NOT")) {
            ++i;
        }
        if (is_word(t, i, "MATERIALIZED")) {
            ++i;
        }
        if (!is_kind(t, i, TokenKind::kOpenParen)) {
            break;
        }
        const auto close = matching_paren(t, i);
        if (close == kNpos) {
            break;
        }
        i = close + 1;
        if (is_kind(t, i, TokenKind::kComma)) {
            ++i;
            continue;
        }
        break;
    }
    return {names, i};
}

// WITH 구문 안에 쓰기 키워드가 있는지. 함수 호출(REPLACE(...))과 FOR UPDATE 는 제외.
bool contains_write_keyword(const Tokens& t) {
    static const std::unordered_set<std::string> kWrites = {
        "INSERT", "UPDATE", "DELETE", "MERGE", "DROP", "ALTER", "CREATE",
        "TRUNCATE", "GRANT", "REVOKE", "REPLACE", "UPSERT",
    };
    for (std::size_t i = 0; i < t.size(); ++i) {
        if (t[i].kind != TokenKind::kWord || !kWrites.contains(t[i].upper)) {
            continue;
        }
        if (is_kind(t, i + 1, TokenKind::kOpenParen)) {
            continue;
        }
        if (t[i].upper == "UPDATE" && i > 0 && is_word(t, i - 1, "FOR")) {
            continue;
        }
        return true;
    }
    return false;
}

SqlCommand keyword_to_command(const std::string& keyword) {
    static const std::unordered_map<std::string, SqlCommand> kKeywordMap = {
        {"SELECT",   SqlCommand::kSelect},
        {"VALUES",   SqlCommand::kSelect},
        {"INSERT",   SqlCommand::kInsert},
        {"REPLACE",  SqlCommand::kInsert},
        {"UPDATE",   SqlCommand::kUpdate},
        {"DELETE",   SqlCommand::kDelete},
        {"DROP",     SqlCommand::kDrop},
        {"TRUNCATE", SqlCommand::kTruncate},
        {"ALTER",    SqlCommand::kAlter},
        {"CREATE",   SqlCommand::kCreate},
        {"GRANT",    SqlCommand::kGrant},
        {"REVOKE",   SqlCommand::kRevoke},
        {"CALL",     SqlCommand::kCall},
        {"PREPARE",  SqlCommand::kPrepare},
        {"EXECUTE",  SqlCommand::kExecute},
        {"EXEC",     SqlCommand::kExecute},
    };

    const auto it = kKeywordMap.find(keyword);
    if (it != kKeywordMap.end()) {
        return it->second;
    }
    return SqlCommand::kUnknown;
}

ParseError invalid(std::string message, std::string_view sql) {
    return ParseError{ParseErrorCode::kInvalidSql, std::move(message), std::string(sql.substr(0, 80))};
}

// DELETE/UPDATE 공통: 최상위 WHERE 및 ORDER/LIMIT/RETURNING 위치로 술어를 채운다.
// 반환: FROM 원천이 끝나는 토큰 인덱스 (WHERE 또는 꼬리절 시작)
std::size_t fill_where(std::string_view clean, const Tokens& t, std::size_t from, ParsedQuery& q) {
    const auto where_idx = find_at_depth(t, from, 0, {"WHERE"});
    const auto tail_idx  = find_at_depth(t, where_idx == kNpos ? from : where_idx + 1, 0,
                                         {"ORDER", "LIMIT", "RETURNING"});
    const auto end_idx = (tail_idx == kNpos) ? t.size() : tail_idx;

    if (tail_idx != kNpos && !is_word(t, tail_idx, "RETURNING")) {
        q.row_limited = true;
    }
    if (where_idx != kNpos) {
        q.has_where_clause = true;
        q.where_clause     = slice(clean, t, where_idx + 1, end_idx);
        return where_idx;
    }
    return end_idx;
}

// 최상위 JOIN / 쉼표 존재 여부 (다중 테이블 판정).
bool has_join_or_comma(const Tokens& t, std::size_t first, std::size_t last) {
    for (std::size_t i = first; i < last && i < t.size(); ++i) {
        if (t[i].depth != 0) {
            continue;
        }
        if (t[i].kind == TokenKind::kComma) {
            return true;
        }
        if (t[i].kind == TokenKind::kWord &&
            (t[i].upper == "JOIN" || t[i].upper == "STRAIGHT_JOIN")) {
            return true;
        }
    }
    return false;
}

std::expected<void, ParseError>
parse_delete(std::string_view clean, const Tokens& t, ParsedQuery& q) {
    std::size_t i = 1;
    while (is_word(t, i, "LOW_PRIORITY") || is_word(t, i, "QUICK") || is_word(t, i, "IGNORE")) {
        ++i;
    }

    std::size_t from_idx = kNpos;
    if (is_word(t, i, "FROM")) {
        from_idx = i;
    } else {
        // DELETE t1[, t2] FROM t1 JOIN t2 ... (MySQL 다중 테이블)
        from_idx = find_at_depth(t, i, 0, {"FROM"});
        if (from_idx == kNpos) {
            return std::unexpected(invalid("DELETE without FROM", clean));
        }
        if (auto first = read_qualified_name(t, i)) {
            q.target_table = first->first;
        }
        q.is_multi_table = true;
    }

    std::size_t src = from_idx + 1;
    while (is_word(t, src, "ONLY")) {
        ++src;
    }
    if (q.target_table.empty()) {
        auto name = read_qualified_name(t, src);
        if (!name) {
            return std::unexpected(invalid("DELETE target table not found", clean));
        }
        q.target_table = name->first;
    }

    const auto src_end = fill_where(clean, t, src, q);

    // PostgreSQL DELETE ... USING u → 카운트 원천에서는 "t, u"
    const auto using_idx = find_at_depth(t, src, 0, {"USING"});
    if (using_idx != kNpos && using_idx < src_end &&
        !is_kind(t, using_idx + 1, TokenKind::kOpenParen)) {
        q.from_clause = slice(clean, t, src, using_idx) + ", " + slice(clean, t, using_idx + 1, src_end);
        q.is_multi_table = true;
    } else {
        q.from_clause = slice(clean, t, src, src_end);
    }
    if (has_join_or_comma(t, src, src_end)) {
        q.is_multi_table = true;
    }

    add_table(q.tables, q.target_table);
    collect_table_refs(t, q.tables);
    return {};
}

std::expected<void, ParseError>
parse_update(std::string_view clean, const Tokens& t, ParsedQuery& q) {
    std::size_t i = 1;
    if (is_word(t, i, "OR")) {
        i += 2;  // UPDATE OR ROLLBACK/ABORT/REPLACE/FAIL/IGNORE (SQLite)
    }
    while (is_word(t, i, "LOW_PRIORITY") || is_word(t, i, "IGNORE") || is_word(t, i, "ONLY")) {
        ++i;
    }

    const auto set_idx = find_at_depth(t, i, 0, {"SET"});
    if (set_idx == kNpos) {
        return std::unexpected(invalid("UPDATE without SET", clean));
    }
    auto name = read_qualified_name(t, i);
    if (!name) {
        return std::unexpected(invalid("UPDATE target table not found", clean));
    }
    q.target_table = name->first;
    add_table(q.tables, q.target_table);
    read_table_list(t, i, true, q.tables);

    q.from_clause    = slice(clean, t, i, set_idx);
    q.is_multi_table = has_join_or_comma(t, i, set_idx);

    const auto src_end = fill_where(clean, t, set_idx + 1, q);

    // PostgreSQL/SQLite UPDATE ... SET ... FROM other
    const auto pg_from = find_at_depth(t, set_idx + 1, 0, {"FROM"});
    if (pg_from != kNpos && pg_from < src_end) {
        q.from_clause += ", " + slice(clean, t, pg_from + 1, src_end);
        q.is_multi_table = true;
    }

    collect_table_refs(t, q.tables);
    return {};
}

std::expected<void, ParseError>
parse_insert(std::string_view clean, const Tokens& t, ParsedQuery& q) {
    std::size_t i = 1;
    if (is_word(t, i, "OR")) {
        i += 2;  // INSERT OR REPLACE/IGNORE (SQLite)
    }
    while (is_word(t, i, "LOW_PRIORITY") || is_word(t, i, "DELAYED") ||
           is_word(t, i, "HIGH_PRIORITY") || is_word(t, i, "IGNORE")) {
        ++i;
    }

    if (is_word(t, i, "ALL") || is_word(t, i, "FIRST")) {
        // 다중 테이블 INSERT: 모든 INTO 대상 수집, 원천은 마지막 최상위 SELECT
        q.is_multi_table = true;
        for (std::size_t k = i; k < t.size(); ++k) {
            if (is_word(t, k, "INTO") && t[k].depth == 0) {
                if (auto n = read_qualified_name(t, k + 1)) {
                    if (q.target_table.empty()) {
                        q.target_table = n->first;
                    }
                    add_table(q.tables, n->first);
                }
            }
        }
        const auto sel = find_at_depth(t, i, 0, {"SELECT"});
        if (sel == kNpos || q.target_table.empty()) {
            return std::unexpected(invalid("Unrecognized multi-table INSERT", clean));
        }
        q.insert_source     = InsertSource::kSelect;
        q.insert_select_sql = slice(clean, t, sel, t.size());
        collect_table_refs(t, q.tables);
        return {};
    }

    if (is_word(t, i, "INTO")) {
        ++i;
    }
    auto name = read_qualified_name(t, i);
    if (!name) {
        return std::unexpected(invalid("INSERT target table not found", clean));
    }
    q.target_table = name->first;
    add_table(q.tables, q.target_table);
    i = name->second;

    if (is_word(t, i, "AS")) {
        i += 2;
    }
    if (is_kind(t, i, TokenKind::kOpenParen) &&
        !is_word(t, i + 1, "SELECT") && !is_word(t, i + 1, "WITH")) {
        const auto close = matching_paren(t, i);
        if (close == kNpos) {
            return std::unexpected(invalid("Unbalanced INSERT column list", clean));
        }
        i = close + 1;
    }
    while (is_word(t, i, "OVERRIDING")) {
        i += 3;  // OVERRIDING SYSTEM|USER VALUE
    }

    if (is_word(t, i, "VALUES") || is_word(t, i, "VALUE")) {
        std::uint64_t rows = 0;
        for (std::size_t k = i + 1; k < t.size(); ++k) {
            if (t[k].depth != 0) {
                continue;
            }
            if (t[k].kind == TokenKind::kWord &&
                (t[k].upper == "ON" || t[k].upper == "RETURNING" || t[k].upper == "AS")) {
                break;
            }
            if (t[k].kind == TokenKind::kOpenParen) {
                ++rows;
            }
        }
        if (rows == 0) {
            return std::unexpected(invalid("INSERT VALUES without value rows", clean));
        }
        q.insert_source     = InsertSource::kValues;
        q.insert_value_rows = rows;
    } else if (is_word(t, i, "DEFAULT") && is_word(t, i + 1, "VALUES")) {
        q.insert_source     = InsertSource::kDefaultValues;
        q.insert_value_rows = 1;
    } else if (is_word(t, i, "SET")) {
        // MySQL INSERT ... SET col = v
        q.insert_source     = InsertSource::kValues;
        q.insert_value_rows = 1;
    } else if (is_word(t, i, "SELECT") || is_word(t, i, "WITH") ||
               is_kind(t, i, TokenKind::kOpenParen)) {
        std::size_t end = t.size();
        for (std::size_t k = i; k < t.size(); ++k) {
            if (t[k].depth != 0 || t[k].kind != TokenKind::kWord) {
                continue;
            }
            if (t[k].upper == "RETURNING" ||
                (t[k].upper == "ON" && (is_word(t, k + 1, "CONFLICT") || is_word(t, k + 1, "DUPLICATE")))) {
                end = k;
                break;
            }
        }
        std::size_t first = i;
        std::size_t last  = end;
        // 전체를 감싸는 괄호 한 겹 제거: INSERT INTO t (SELECT ...)
        if (is_kind(t, first, TokenKind::kOpenParen) && matching_paren(t, first) == last - 1) {
            ++first;
            --last;
        }
        q.insert_source     = InsertSource::kSelect;
        q.insert_select_sql = slice(clean, t, first, last);
    } else {
        return std::unexpected(invalid("Unrecognized INSERT source", clean));
    }

    collect_table_refs(t, q.tables);
    return {};
}

// DROP/TRUNCATE/ALTER/CREATE/GRANT/REVOKE 대상 테이블
void parse_ddl(const Tokens& t, ParsedQuery& q) {
    std::size_t i = 1;

    const auto read_names_after = [&](std::size_t k, bool allow_list) {
        while (is_word(t, k, "IF") || is_word(t, k, "NOT") || is_word(t, k, "EXISTS") ||
               is_word(t, k, "ONLY")) {
            ++k;
        }
        std::vector<std::string> names;
        while (k < t.size()) {
            auto n = read_qualified_name(t, k);
            if (!n) {
                break;
            }
            names.push_back(n->first);
            k = n->second;
            if (allow_list && is_kind(t, k, TokenKind::kComma)) {
                ++k;
                continue;
            }
            break;
        }
        if (!names.empty() && q.target_table.empty()) {
            q.target_table = names.front();
        }
        for (auto& n : names) {
            add_table(q.tables, std::move(n));
        }
        if (names.size() > 1) {
            q.is_multi_table = true;
        }
    };

    switch (q.command) {
        case SqlCommand::kDrop:
            while (is_word(t, i, "TEMPORARY")) {
                ++i;
            }
            if (is_word(t, i, "TABLE")) {
                read_names_after(i + 1, true);
            } else if (is_word(t, i, "INDEX")) {
                const auto on = find_at_depth(t, i, 0, {"ON"});
                if (on != kNpos) {
                    read_names_after(on + 1, false);
                }
            }
            break;

        case SqlCommand::kTruncate:
            if (is_word(t, i, "TABLE")) {
                ++i;
            }
            read_names_after(i, true);
            break;

        case SqlCommand::kAlter:
            if (is_word(t, i, "TABLE")) {
                read_names_after(i + 1, false);
            }
            break;

        case SqlCommand::kCreate: {
            const auto table_kw = find_at_depth(t, i, 0, {"TABLE", "INDEX", "VIEW", "TRIGGER"});
            if (table_kw != kNpos && t[table_kw].upper == "TABLE") {
                read_names_after(table_kw + 1, false);
            } else if (table_kw != kNpos &&
                       (t[table_kw].upper == "INDEX" || t[table_kw].upper == "TRIGGER")) {
                const auto on = find_at_depth(t, table_kw, 0, {"ON"});
                if (on != kNpos) {
                    read_names_after(on + 1, false);
                }
            }
            collect_table_refs(t, q.tables);
            break;
        }

        case SqlCommand::kGrant:
        case SqlCommand::kRevoke: {
            const auto on = find_at_depth(t, i, 0, {"ON"});
            if (on != kNpos) {
                std::size_t k = on + 1;
                if (is_word(t, k, "TABLE")) {
                    ++k;
                }
                read_names_after(k, true);
            }
            break;
        }

        default:
            break;
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// SqlParser::parse 구현
// ---------------------------------------------------------------------------
std::expected<ParsedQuery, ParseError>
SqlParser::parse(std::string_view sql) const {
    // 1. 빈 입력 검사
    if (trim(sql).empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kEmptyInput,
            "Empty SQL input",
            std::string(sql)
        });
    }

    // 2. 주석 제거 후 토큰화 (따옴표/괄호 불균형은 여기서 실패)
    const std::string clean = remove_comments(sql);
    auto tokenized = tokenize(clean);
    if (!tokenized) {
        spdlog::warn("sql_parser: {} (fail-close) sql_prefix='{}'",
                     tokenized.error().message, std::string(sql.substr(0, 80)));
        return std::unexpected(tokenized.error());
    }
    Tokens tokens = std::move(*tokenized);

    // 3. 끝 세미콜론 제거. 남은 세미콜론은 복수 구문으로 판정한다.
    //
    // [보안 원칙] 복수 구문은 piggyback 의 주요 벡터이며, 첫 구문만 분류하면
    // 뒤 구문이 분류 없이 실행된다. 파싱 단계에서 fail-close.
    while (!tokens.empty() && tokens.back().kind == TokenKind::kSemicolon) {
        tokens.pop_back();
    }
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::kSemicolon) {
            spdlog::warn("sql_parser: multi-statement detected (semicolon outside string/comment), "
                         "fail-close applied. sql_prefix='{}'",
                         std::string(sql.substr(0, 80)));
            return std::unexpected(ParseError{
                ParseErrorCode::kMultiStatement,
                "Multi-statement SQL detected: semicolon outside string or comment",
                std::string(sql)
            });
        }
    }

    if (tokens.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kEmptyInput,
            "SQL is empty after comment removal",
            std::string(sql)
        });
    }

    ParsedQuery q;
    q.raw_sql       = std::string(sql);
    q.statement_sql = std::string(trim(std::string_view(clean).substr(0, tokens.back().end)));

    // 4. 첫 키워드로 분류
    if (tokens.front().kind != TokenKind::kWord) {
        // "(SELECT ...)" 등 괄호로 시작하는 구문
        if (tokens.front().kind == TokenKind::kOpenParen && is_word(tokens, 1, "SELECT") &&
            !contains_write_keyword(tokens)) {
            q.command = SqlCommand::kSelect;
            collect_table_refs(tokens, q.tables);
        }
        return q;
    }

    const std::string& first_kw = tokens.front().upper;
    q.command = keyword_to_command(first_kw);

    if (first_kw == "WITH") {
        // 쓰기 키워드가 없는 WITH 만 SELECT 로 인정한다. 쓰기 CTE 는 kUnknown.
        auto [cte_names, body] = read_cte_names(tokens);
        if (contains_write_keyword(tokens)) {
            q.command = SqlCommand::kUnknown;
            return q;
        }
        q.command = SqlCommand::kSelect;
        collect_table_refs(tokens, q.tables);
        std::erase_if(q.tables, [&](const std::string& name) {
            const auto upper = to_upper(name);
            return std::any_of(cte_names.begin(), cte_names.end(),
                               [&](const std::string& c) { return to_upper(c) == upper; });
        });
        q.has_where_clause = find_at_depth(tokens, body, 0, {"WHERE"}) != kNpos;
        return q;
    }

    // 5. 명령별 상세 추출
    std::expected<void, ParseError> detail{};
    switch (q.command) {
        case SqlCommand::kSelect:
            collect_table_refs(tokens, q.tables);
            q.has_where_clause = find_at_depth(tokens, 0, 0, {"WHERE"}) != kNpos;
            break;

        case SqlCommand::kDelete:
            detail = parse_delete(clean, tokens, q);
            break;

        case SqlCommand::kUpdate:
            detail = parse_update(clean, tokens, q);
            break;

        case SqlCommand::kInsert:
            detail = parse_insert(clean, tokens, q);
            break;

        case SqlCommand::kDrop:
        case SqlCommand::kTruncate:
        case SqlCommand::kAlter:
        case SqlCommand::kCreate:
        case SqlCommand::kGrant:
        case SqlCommand::kRevoke:
            parse_ddl(tokens, q);
            break;

        case SqlCommand::kCall:
        case SqlCommand::kPrepare:
        case SqlCommand::kExecute:
        case SqlCommand::kUnknown:
            // 분석 불가: 분류기가 CRITICAL 로 처리한다
            break;
    }

    if (!detail) {
        spdlog::warn("sql_parser: {} (fail-close) sql_prefix='{}'",
                     detail.error().message, std::string(sql.substr(0, 80)));
        return std::unexpected(detail.error());
    }

    return q;
}
