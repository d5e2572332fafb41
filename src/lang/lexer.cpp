#include <scribe/lang/lexer.hpp>
#include <cctype>
#include <cstring>

namespace scribe {

// ---------------------------------------------------------------------------
// Keyword table and token classification
// ---------------------------------------------------------------------------

const std::unordered_map<std::string, RubyTokenType>& ruby_keywords() {
    static const std::unordered_map<std::string, RubyTokenType> table = {
        {"class",    RubyTokenType::KwClass},
        {"module",   RubyTokenType::KwModule},
        {"def",      RubyTokenType::KwDef},
        {"end",      RubyTokenType::KwEnd},
        {"do",       RubyTokenType::KwDo},
        {"if",       RubyTokenType::KwIf},
        {"unless",   RubyTokenType::KwUnless},
        {"while",    RubyTokenType::KwWhile},
        {"until",    RubyTokenType::KwUntil},
        {"for",      RubyTokenType::KwFor},
        {"case",     RubyTokenType::KwCase},
        {"when",     RubyTokenType::KwWhen},
        {"begin",    RubyTokenType::KwBegin},
        {"rescue",   RubyTokenType::KwRescue},
        {"ensure",   RubyTokenType::KwEnsure},
        {"else",     RubyTokenType::KwElse},
        {"elsif",    RubyTokenType::KwElsif},
        {"then",     RubyTokenType::KwThen},
        {"return",   RubyTokenType::KwReturn},
        {"yield",    RubyTokenType::KwYield},
        {"and",      RubyTokenType::KwAnd},
        {"or",       RubyTokenType::KwOr},
        {"not",      RubyTokenType::KwNot},
        {"in",       RubyTokenType::KwIn},
        {"alias",    RubyTokenType::KwAlias},
        {"undef",    RubyTokenType::KwUndef},
        {"defined?", RubyTokenType::KwDefined},
        {"break",    RubyTokenType::KwBreak},
        {"next",     RubyTokenType::KwNext},
        {"redo",     RubyTokenType::KwRedo},
        {"retry",    RubyTokenType::KwRetry},
        {"self",     RubyTokenType::KwSelf},
        {"super",    RubyTokenType::KwSuper},
        {"true",     RubyTokenType::KwTrue},
        {"false",    RubyTokenType::KwFalse},
        {"nil",      RubyTokenType::KwNil},
        {"__FILE__", RubyTokenType::KwFile},
        {"__LINE__", RubyTokenType::KwLine},
    };
    return table;
}

TokenCategory token_category(RubyTokenType t) {
    switch (t) {
    case RubyTokenType::Integer:
    case RubyTokenType::Float:
    case RubyTokenType::String:
    case RubyTokenType::XString:
    case RubyTokenType::Regexp:
    case RubyTokenType::Symbol:
        return TokenCategory::Value;
    case RubyTokenType::DString:
    case RubyTokenType::DXString:
    case RubyTokenType::DRegexp:
        return TokenCategory::Node;
    case RubyTokenType::Identifier:
    case RubyTokenType::Fid:
    case RubyTokenType::Constant:
    case RubyTokenType::Gvar:
    case RubyTokenType::Ivar:
    case RubyTokenType::Cvar:
        return TokenCategory::Identifier;
    case RubyTokenType::Comma:
    case RubyTokenType::LParen:
    case RubyTokenType::RParen:
    case RubyTokenType::LBrace:
    case RubyTokenType::RBrace:
    case RubyTokenType::LBracket:
    case RubyTokenType::RBracket:
    case RubyTokenType::Semicolon:
    case RubyTokenType::Dot:
    case RubyTokenType::DoubleColon:
        return TokenCategory::Punct;
    case RubyTokenType::Op:
        return TokenCategory::Operator;
    case RubyTokenType::Whitespace:
    case RubyTokenType::Newline:
        return TokenCategory::Whitespace;
    case RubyTokenType::Eof:
    case RubyTokenType::Unknown:
        return TokenCategory::Other;
    default:
        return TokenCategory::Keyword;
    }
}

bool is_literal_keyword(RubyTokenType t) {
    return t == RubyTokenType::KwTrue || t == RubyTokenType::KwFalse ||
           t == RubyTokenType::KwSelf || t == RubyTokenType::KwSuper ||
           t == RubyTokenType::KwNil;
}

bool is_statement_keyword(RubyTokenType t) {
    return token_category(t) == TokenCategory::Keyword && !is_literal_keyword(t);
}

const char* ruby_token_name(RubyTokenType t) {
    switch (t) {
    case RubyTokenType::Integer:     return "Integer";
    case RubyTokenType::Float:       return "Float";
    case RubyTokenType::String:      return "String";
    case RubyTokenType::XString:     return "XString";
    case RubyTokenType::Regexp:      return "Regexp";
    case RubyTokenType::Symbol:      return "Symbol";
    case RubyTokenType::DString:     return "DString";
    case RubyTokenType::DXString:    return "DXString";
    case RubyTokenType::DRegexp:     return "DRegexp";
    case RubyTokenType::Identifier:  return "Identifier";
    case RubyTokenType::Fid:         return "Fid";
    case RubyTokenType::Constant:    return "Constant";
    case RubyTokenType::Gvar:        return "Gvar";
    case RubyTokenType::Ivar:        return "Ivar";
    case RubyTokenType::Cvar:        return "Cvar";
    case RubyTokenType::Comma:       return "Comma";
    case RubyTokenType::LParen:      return "LParen";
    case RubyTokenType::RParen:      return "RParen";
    case RubyTokenType::LBrace:      return "LBrace";
    case RubyTokenType::RBrace:      return "RBrace";
    case RubyTokenType::LBracket:    return "LBracket";
    case RubyTokenType::RBracket:    return "RBracket";
    case RubyTokenType::Semicolon:   return "Semicolon";
    case RubyTokenType::Dot:         return "Dot";
    case RubyTokenType::DoubleColon: return "DoubleColon";
    case RubyTokenType::Op:          return "Op";
    case RubyTokenType::Whitespace:  return "Whitespace";
    case RubyTokenType::Newline:     return "Newline";
    case RubyTokenType::Eof:         return "Eof";
    case RubyTokenType::Unknown:     return "Unknown";
    default:
        // Keywords: generic name
        return "Keyword";
    }
}

std::string render_tokens(const TokenList& tokens) {
    std::string out;
    for (const auto& t : tokens) out += t.text;
    return out;
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

using RT = RubyTokenType;

// Longest operators first so the scan below can take the first prefix match
const char* const kOperators[] = {
    "**=", "<=>", "===", "...", "<<=", ">>=", "&&=", "||=",
    "==", "!=", "=~", "!~", ">=", "<=", "&&", "||", "<<", ">>", "**",
    "=>", "->", "..", "+=", "-=", "*=", "/=", "%=", "|=", "&=", "^=",
    "=", "+", "-", "*", "/", "%", "<", ">", "!", "&", "|", "^", "~", "?", ":",
};

// Method names that may follow ':' to form an operator symbol
const char* const kSymbolOperators[] = {
    "[]=", "[]", "<=>", "===", "==", "=~", "!=", "!~", "<=", ">=", "<<", ">>",
    "**", "+@", "-@", "+", "-", "*", "/", "%", "<", ">", "!", "&", "|", "^", "~",
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    TokenList tokens;
    std::vector<Comment> comments;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_at(size_t offset) const {
        return (pos + offset < source.size()) ? source[pos + offset] : '\0';
    }

    bool starts_with(const char* s) const {
        return source.compare(pos, std::strlen(s), s) == 0;
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void emit(RT type, const std::string& text, SourcePos p) {
        tokens.push_back({type, text, p});
    }

    ScribeError error_at(const std::string& msg, const SourcePos& p) const {
        return ScribeError{ScribeError::Parse, msg, "", p.file, p.line};
    }

    // Last token that is not layout
    const RubyToken* last_significant() const {
        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
            if (it->type != RT::Whitespace) return &*it;
        }
        return nullptr;
    }

    // Whether the next token starts an operand (decides '/' regex vs divide)
    bool value_expected() const {
        auto* prev = last_significant();
        if (!prev) return true;
        switch (prev->type) {
        case RT::Op:
        case RT::Comma:
        case RT::LParen:
        case RT::LBracket:
        case RT::LBrace:
        case RT::Semicolon:
        case RT::Newline:
            return true;
        default:
            return is_statement_keyword(prev->type) && prev->type != RT::KwEnd;
        }
    }

    bool after_dot() const {
        auto* prev = last_significant();
        return prev && (prev->type == RT::Dot || prev->type == RT::DoubleColon);
    }

    Result<LexResult> run() {
        while (!at_end()) {
            auto p = current_pos();
            char c = peek();

            if (c == ' ' || c == '\t' || c == '\r' || (c == '\\' && peek_at(1) == '\n')) {
                lex_whitespace(p);
                continue;
            }

            if (c == '\n') {
                advance();
                emit(RT::Newline, "\n", p);
                continue;
            }

            if (c == '#') {
                lex_line_comment(p);
                continue;
            }

            if (c == '=' && col == 1 && starts_with("=begin")) {
                lex_block_comment(p);
                continue;
            }

            if (c == '\'' || c == '"' || c == '`') {
                SCRIBE_TRY(lex_string(p, c));
                continue;
            }

            if (c == '/' && value_expected()) {
                SCRIBE_TRY(lex_regexp(p));
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(c))) {
                lex_number(p);
                continue;
            }

            // Unary sign on a numeric literal, as in `[1, -5]`
            if ((c == '-' || c == '+') &&
                std::isdigit(static_cast<unsigned char>(peek_at(1))) && value_expected()) {
                lex_number(p);
                continue;
            }

            if (c == '@' || c == '$') {
                lex_variable(p);
                continue;
            }

            if (c == ':' && peek_at(1) != ':' && lex_symbol(p)) {
                continue;
            }

            if (is_ident_start(c)) {
                lex_identifier(p);
                continue;
            }

            lex_operator(p);
        }

        emit(RT::Eof, "", current_pos());

        LexResult result;
        result.tokens = std::move(tokens);
        result.comments = std::move(comments);
        return Result<LexResult>::ok(std::move(result));
    }

    void lex_whitespace(SourcePos p) {
        std::string text;
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r') {
                text += advance();
            } else if (c == '\\' && peek_at(1) == '\n') {
                text += advance();
                text += advance();
            } else {
                break;
            }
        }
        emit(RT::Whitespace, text, p);
    }

    void lex_line_comment(SourcePos p) {
        advance(); // #
        std::string text;
        while (!at_end() && peek() != '\n') {
            text += advance();
        }
        if (!text.empty() && text.back() == '\r') text.pop_back();
        if (!text.empty() && text[0] == ' ') text.erase(0, 1);
        comments.push_back({CommentKind::Line, text, p, p.line});
    }

    void lex_block_comment(SourcePos p) {
        // Skip the rest of the =begin line
        while (!at_end() && peek() != '\n') advance();
        if (!at_end()) advance();

        std::string text;
        int end_line = line;
        while (!at_end()) {
            if (col == 1 && starts_with("=end")) {
                end_line = line;
                while (!at_end() && peek() != '\n') advance();
                break;
            }
            end_line = line;
            text += advance();
        }
        if (!text.empty() && text.back() == '\n') text.pop_back();
        comments.push_back({CommentKind::Block, text, p, end_line});
    }

    // Scan a delimited body up to the unescaped closing `delim`, tracking
    // #{...} nesting. Returns false when the input ends first.
    bool scan_delimited(char delim, std::string& text, bool& interpolated) {
        int interp_depth = 0;
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                text += advance();
                if (!at_end()) text += advance();
                continue;
            }
            if (delim != '\'' && c == '#' && peek_at(1) == '{') {
                interpolated = true;
                ++interp_depth;
                text += advance();
                text += advance();
                continue;
            }
            if (interp_depth > 0 && c == '}') {
                --interp_depth;
                text += advance();
                continue;
            }
            if (interp_depth == 0 && c == delim) {
                text += advance();
                return true;
            }
            text += advance();
        }
        return false;
    }

    Status lex_string(SourcePos p, char quote) {
        std::string text(1, advance());
        bool interpolated = false;
        if (!scan_delimited(quote, text, interpolated)) {
            return error_at("unterminated string literal", p);
        }
        if (quote == '`') {
            emit(interpolated ? RT::DXString : RT::XString, text, p);
        } else {
            emit(interpolated ? RT::DString : RT::String, text, p);
        }
        return ok_status();
    }

    Status lex_regexp(SourcePos p) {
        std::string text(1, advance());
        bool interpolated = false;
        if (!scan_delimited('/', text, interpolated)) {
            return error_at("unterminated regular expression", p);
        }
        while (!at_end() && std::strchr("imxounse", peek()) && peek() != '\0') {
            text += advance();
        }
        emit(interpolated ? RT::DRegexp : RT::Regexp, text, p);
        return ok_status();
    }

    void lex_number(SourcePos p) {
        std::string text;
        if (peek() == '-' || peek() == '+') text += advance();

        if (peek() == '0' && std::strchr("xXbBoO", peek_at(1)) && peek_at(1) != '\0') {
            text += advance();
            text += advance();
            while (!at_end() && (std::isxdigit(static_cast<unsigned char>(peek())) ||
                                  peek() == '_')) {
                text += advance();
            }
            emit(RT::Integer, text, p);
            return;
        }

        while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) ||
                              peek() == '_')) {
            text += advance();
        }

        bool is_float = false;
        if (!at_end() && peek() == '.' &&
            std::isdigit(static_cast<unsigned char>(peek_at(1)))) {
            is_float = true;
            text += advance(); // .
            while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) ||
                                  peek() == '_')) {
                text += advance();
            }
        }

        // Exponent
        if (!at_end() && (peek() == 'e' || peek() == 'E')) {
            char sign = peek_at(1);
            size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
            if (std::isdigit(static_cast<unsigned char>(peek_at(digit_at)))) {
                is_float = true;
                for (size_t i = 0; i < digit_at; ++i) text += advance();
                while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
                    text += advance();
                }
            }
        }

        emit(is_float ? RT::Float : RT::Integer, text, p);
    }

    void lex_variable(SourcePos p) {
        std::string text;
        RT type;
        if (peek() == '$') {
            type = RT::Gvar;
            text += advance();
            if (!at_end() && !is_ident_start(peek())) {
                // $0, $!, $: and friends
                text += advance();
                emit(type, text, p);
                return;
            }
        } else if (peek_at(1) == '@') {
            type = RT::Cvar;
            text += advance();
            text += advance();
        } else {
            type = RT::Ivar;
            text += advance();
        }
        while (!at_end() && is_ident_char(peek())) {
            text += advance();
        }
        if (text.size() == 1 || (type == RT::Cvar && text.size() == 2)) {
            emit(RT::Unknown, text, p);
            return;
        }
        emit(type, text, p);
    }

    // ':name', ':"quoted"' or an operator symbol. Returns false when the
    // colon is an ordinary operator (ternary, hash label).
    bool lex_symbol(SourcePos p) {
        char next = peek_at(1);
        if (is_ident_start(next) || next == '@' || next == '$') {
            std::string text(1, advance()); // :
            while (!at_end() && (is_ident_char(peek()) || peek() == '@' || peek() == '$')) {
                text += advance();
            }
            if (!at_end() && (peek() == '?' || peek() == '!' || peek() == '=') &&
                peek_at(1) != '=' && peek_at(1) != '>' && peek_at(1) != '~') {
                text += advance();
            }
            emit(RT::Symbol, text, p);
            return true;
        }
        if (next == '"' || next == '\'') {
            std::string text(1, advance()); // :
            char quote = peek();
            text += advance();
            bool interpolated = false;
            if (!scan_delimited(quote, text, interpolated)) {
                emit(RT::Unknown, text, p);
                return true;
            }
            emit(RT::Symbol, text, p);
            return true;
        }
        if (!value_expected()) return false;
        for (const char* op : kSymbolOperators) {
            if (source.compare(pos + 1, std::strlen(op), op) == 0) {
                std::string text(1, advance());
                for (size_t i = 0; i < std::strlen(op); ++i) text += advance();
                emit(RT::Symbol, text, p);
                return true;
            }
        }
        return false;
    }

    void lex_identifier(SourcePos p) {
        std::string text;
        while (!at_end() && is_ident_char(peek())) {
            text += advance();
        }

        bool suffixed = false;
        if (!at_end() && (peek() == '?' || peek() == '!') &&
            peek_at(1) != '=' && peek_at(1) != ':') {
            text += advance();
            suffixed = true;
        }

        if (!after_dot()) {
            auto& kws = ruby_keywords();
            auto it = kws.find(text);
            if (it != kws.end()) {
                emit(it->second, text, p);
                return;
            }
        }

        if (suffixed) {
            emit(RT::Fid, text, p);
        } else if (std::isupper(static_cast<unsigned char>(text[0]))) {
            emit(RT::Constant, text, p);
        } else {
            emit(RT::Identifier, text, p);
        }
    }

    void lex_operator(SourcePos p) {
        char c = peek();
        switch (c) {
        case '(': advance(); emit(RT::LParen, "(", p); return;
        case ')': advance(); emit(RT::RParen, ")", p); return;
        case '[': advance(); emit(RT::LBracket, "[", p); return;
        case ']': advance(); emit(RT::RBracket, "]", p); return;
        case '{': advance(); emit(RT::LBrace, "{", p); return;
        case '}': advance(); emit(RT::RBrace, "}", p); return;
        case ',': advance(); emit(RT::Comma, ",", p); return;
        case ';': advance(); emit(RT::Semicolon, ";", p); return;
        default: break;
        }

        if (starts_with("::")) {
            advance();
            advance();
            emit(RT::DoubleColon, "::", p);
            return;
        }
        if (c == '.' && !starts_with("..")) {
            advance();
            emit(RT::Dot, ".", p);
            return;
        }

        for (const char* op : kOperators) {
            if (starts_with(op)) {
                std::string text;
                for (size_t i = 0; i < std::strlen(op); ++i) text += advance();
                emit(RT::Op, text, p);
                return;
            }
        }

        emit(RT::Unknown, std::string(1, advance()), p);
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<LexResult> lex(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace scribe
