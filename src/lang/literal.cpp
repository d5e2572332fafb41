#include <scribe/lang/literal.hpp>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace scribe {

namespace {

using RT = RubyTokenType;

std::string strip_underscores(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '_') out += c;
    }
    return out;
}

std::optional<int64_t> parse_integer(const std::string& text) {
    std::string digits = strip_underscores(text);
    bool negative = false;
    size_t start = 0;
    if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
        negative = digits[0] == '-';
        start = 1;
    }

    int base = 10;
    if (digits.size() > start + 1 && digits[start] == '0') {
        char prefix = digits[start + 1];
        if (prefix == 'x' || prefix == 'X') { base = 16; start += 2; }
        else if (prefix == 'b' || prefix == 'B') { base = 2; start += 2; }
        else if (prefix == 'o' || prefix == 'O') { base = 8; start += 2; }
        else if (prefix == 'd' || prefix == 'D') { base = 10; start += 2; }
        else { base = 8; start += 1; }
    }
    if (start >= digits.size()) return std::nullopt;

    uint64_t magnitude = 0;
    const char* first = digits.data() + start;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, magnitude, base);
    if (ec != std::errc() || ptr != last) return std::nullopt;

    if (negative) {
        if (magnitude > static_cast<uint64_t>(INT64_MAX) + 1) return std::nullopt;
        return static_cast<int64_t>(0 - magnitude);
    }
    if (magnitude > static_cast<uint64_t>(INT64_MAX)) return std::nullopt;
    return static_cast<int64_t>(magnitude);
}

std::optional<double> parse_float(const std::string& text) {
    std::string digits = strip_underscores(text);
    if (digits.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(digits.c_str(), &end);
    if (end != digits.c_str() + digits.size() || errno == ERANGE) return std::nullopt;
    return v;
}

std::string format_float(double v) {
    std::ostringstream ss;
    ss.precision(15);
    ss << v;
    if (std::strtod(ss.str().c_str(), nullptr) != v) {
        ss.str("");
        ss.precision(17);
        ss << v;
    }
    std::string out = ss.str();
    if (out.find_first_of(".eEn") == std::string::npos) out += ".0";
    return out;
}

// Text between the surrounding delimiters, no escape processing
std::string unwrap(const std::string& text) {
    return text.size() >= 2 ? text.substr(1, text.size() - 2) : std::string();
}

std::string symbol_name(const std::string& text) {
    std::string name = text.empty() ? text : text.substr(1);
    if (name.size() >= 2 && (name.front() == '"' || name.front() == '\'') &&
        name.back() == name.front()) {
        name = unwrap(name);
    }
    return name;
}

std::optional<RegexLiteral> parse_regexp(const std::string& text) {
    if (text.size() < 2 || text.front() != '/') return std::nullopt;
    auto close = text.rfind('/');
    if (close == 0) return std::nullopt;
    return RegexLiteral{text.substr(1, close - 1), text.substr(close + 1)};
}

bool is_value_keyword(RT t) {
    return t == RT::KwTrue || t == RT::KwFalse || t == RT::KwNil;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Value rendering
// ---------------------------------------------------------------------------

std::string literal_text(const LiteralValue& v) {
    struct Visitor {
        std::string operator()(const NilLiteral&) const { return ""; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_float(d); }
        std::string operator()(const std::string& s) const { return s; }
        std::string operator()(const SymbolLiteral& s) const { return s.name; }
        std::string operator()(const RegexLiteral& r) const {
            return "/" + r.pattern + "/" + r.flags;
        }
        std::string operator()(const RawText& r) const { return r.text; }
    };
    return std::visit(Visitor{}, v);
}

std::string render_literal(const LiteralValue& v) {
    if (std::holds_alternative<NilLiteral>(v)) return "nil";
    if (auto* s = std::get_if<std::string>(&v)) return "'" + *s + "'";
    if (auto* sym = std::get_if<SymbolLiteral>(&v)) return ":" + sym->name;
    return literal_text(v);
}

// ---------------------------------------------------------------------------
// TokenFilter
// ---------------------------------------------------------------------------

TokenFilter::TokenFilter() {
    add(TokenGroup::Value);
}

TokenFilter::TokenFilter(std::initializer_list<Item> items) {
    if (items.size() == 0) {
        add(TokenGroup::Value);
        return;
    }
    for (const auto& item : items) {
        if (item.is_group) {
            add(item.group);
        } else {
            add(item.type);
        }
    }
}

TokenFilter& TokenFilter::add(RubyTokenType t) {
    types_.insert(t);
    return *this;
}

TokenFilter& TokenFilter::add(TokenGroup g) {
    switch (g) {
    case TokenGroup::Value:
        values_ = true;
        nodes_ = true;
        break;
    case TokenGroup::Node:
        nodes_ = true;
        break;
    case TokenGroup::String:
        types_.insert({RT::String, RT::DString, RT::XString, RT::DXString});
        break;
    case TokenGroup::Attr:
        types_.insert({RT::Symbol, RT::String});
        break;
    case TokenGroup::Identifier:
        types_.insert({RT::Identifier, RT::Fid, RT::Gvar});
        break;
    case TokenGroup::Number:
        types_.insert({RT::Float, RT::Integer});
        break;
    }
    return *this;
}

bool TokenFilter::accepts(RubyTokenType t) const {
    if (types_.count(t)) return true;
    TokenCategory cat = token_category(t);
    if (values_ && (cat == TokenCategory::Value || is_value_keyword(t))) return true;
    if (nodes_ && cat == TokenCategory::Node) return true;
    return false;
}

// ---------------------------------------------------------------------------
// Single token
// ---------------------------------------------------------------------------

std::optional<LiteralValue> extract_literal(const RubyToken& token,
                                            const TokenFilter& filter) {
    if (!filter.accepts(token.type)) return std::nullopt;

    switch (token.type) {
    case RT::String:
    case RT::DString:
    case RT::XString:
    case RT::DXString:
        return LiteralValue{unwrap(token.text)};
    case RT::Symbol:
        return LiteralValue{SymbolLiteral{symbol_name(token.text)}};
    case RT::Float:
        if (auto v = parse_float(token.text)) return LiteralValue{*v};
        break;
    case RT::Integer:
        if (auto v = parse_integer(token.text)) return LiteralValue{*v};
        break;
    case RT::Regexp:
        if (auto re = parse_regexp(token.text)) return LiteralValue{*re};
        break;
    case RT::KwTrue:
        return LiteralValue{true};
    case RT::KwFalse:
        return LiteralValue{false};
    case RT::KwNil:
        return LiteralValue{NilLiteral{}};
    default:
        break;
    }
    return LiteralValue{RawText{token.text}};
}

// ---------------------------------------------------------------------------
// Comma-delimited list
// ---------------------------------------------------------------------------

std::vector<LiteralValue> extract_literal_list(const TokenList& tokens,
                                               const TokenFilter& filter) {
    std::vector<std::vector<LiteralValue>> groups(1);
    int depth = 0;          // nesting not owned by a leading wrapper
    int wrapper_depth = 0;  // '(' right after a comma boundary
    bool need_comma = false;
    bool after_comma = true;
    bool stop = false;

    for (const auto& token : tokens) {
        auto value = extract_literal(token, filter);
        auto& current = groups.back();
        bool carry = !current.empty() && value.has_value();

        switch (token.type) {
        case RT::Comma:
            if (depth == 0) {
                if (!current.empty()) groups.emplace_back();
                need_comma = false;
                after_comma = true;
            } else if (carry) {
                current.push_back(RawText{token.text});
            }
            break;

        case RT::LParen:
            if (after_comma) {
                ++wrapper_depth;
            } else {
                ++depth;
                if (carry) current.push_back(RawText{token.text});
            }
            break;

        case RT::RParen:
            if (wrapper_depth > 0) {
                --wrapper_depth;
            } else {
                if (depth > 0 && value) current.push_back(RawText{token.text});
                --depth;
            }
            break;

        case RT::LBrace:
        case RT::LBracket:
        case RT::KwDo:
            ++depth;
            if (value) current.push_back(RawText{token.text});
            break;

        case RT::RBrace:
        case RT::RBracket:
        case RT::KwEnd:
            if (value) current.push_back(RawText{token.text});
            --depth;
            break;

        default: {
            // A trailing modifier such as `if x == 5` is not part of the list
            if (is_statement_keyword(token.type) || token.type == RT::Eof) {
                stop = true;
                break;
            }

            bool layout = token_category(token.type) == TokenCategory::Whitespace;
            if (!layout) after_comma = false;
            if (depth == 0) {
                if (need_comma || layout) continue;
                if (value) {
                    current.push_back(std::move(*value));
                } else {
                    current.clear();
                    need_comma = true;
                }
            } else if (carry) {
                need_comma = true;
                current.push_back(RawText{token.text});
            }
            break;
        }
        }

        if (stop) break;
        if (wrapper_depth == 0 && depth < 0) break;
    }

    std::vector<LiteralValue> out;
    for (auto& group : groups) {
        if (group.empty()) continue;
        if (group.size() == 1) {
            out.push_back(std::move(group.front()));
            continue;
        }
        std::string joined;
        for (const auto& v : group) joined += literal_text(v);
        out.push_back(RawText{std::move(joined)});
    }
    return out;
}

} // namespace scribe
