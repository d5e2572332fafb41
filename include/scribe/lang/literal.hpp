#pragma once

#include <scribe/lang/ruby_token.hpp>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace scribe {

// ---------------------------------------------------------------------------
// Literal values
// ---------------------------------------------------------------------------

struct NilLiteral {
    bool operator==(const NilLiteral&) const { return true; }
    bool operator!=(const NilLiteral&) const { return false; }
};

struct SymbolLiteral {
    std::string name;

    bool operator==(const SymbolLiteral& o) const { return name == o.name; }
    bool operator!=(const SymbolLiteral& o) const { return name != o.name; }
};

struct RegexLiteral {
    std::string pattern;
    std::string flags;

    bool operator==(const RegexLiteral& o) const {
        return pattern == o.pattern && flags == o.flags;
    }
    bool operator!=(const RegexLiteral& o) const { return !(*this == o); }
};

// Identifier/constant text, or a joined span of nested list content
struct RawText {
    std::string text;

    bool operator==(const RawText& o) const { return text == o.text; }
    bool operator!=(const RawText& o) const { return text != o.text; }
};

using LiteralValue = std::variant<NilLiteral, bool, int64_t, double, std::string,
                                  SymbolLiteral, RegexLiteral, RawText>;

// Plain text of a value: strings as-is, symbol names without ':', numbers in
// decimal, "true"/"false", "" for nil, "/pattern/flags" for regexes
std::string literal_text(const LiteralValue& v);

// Source form of a value: 'string', :symbol, 42, 1.5, /re/i, true, nil
std::string render_literal(const LiteralValue& v);

// ---------------------------------------------------------------------------
// Token filters
// ---------------------------------------------------------------------------

enum class TokenGroup {
    Value,       // every Value-category token plus true/false/nil
    Node,        // interpolated strings and regexes
    String,      // String, DString, XString, DXString
    Attr,        // Symbol, String
    Identifier,  // Identifier, Fid, Gvar
    Number       // Float, Integer
};

// Set of token types a literal may be extracted from. An empty filter means
// TokenGroup::Value; accepting Value implies accepting Node.
class TokenFilter {
public:
    struct Item {
        Item(RubyTokenType t) : is_group(false), type(t) {}
        Item(TokenGroup g) : is_group(true), group(g) {}

        bool is_group;
        RubyTokenType type = RubyTokenType::Unknown;
        TokenGroup group = TokenGroup::Value;
    };

    TokenFilter();
    TokenFilter(std::initializer_list<Item> items);

    TokenFilter& add(RubyTokenType t);
    TokenFilter& add(TokenGroup g);

    bool accepts(RubyTokenType t) const;

private:
    std::set<RubyTokenType> types_;
    bool values_ = false;
    bool nodes_ = false;
};

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

// The value of a single token, or nullopt when the token's type is not
// accepted by the filter. Identifiers and constants stay as RawText.
std::optional<LiteralValue> extract_literal(const RubyToken& token,
                                            const TokenFilter& filter = TokenFilter());

// The values of a comma-delimited token region, in order. Entries whose
// tokens are not accepted are dropped; parsing stops at the first keyword
// that is not a literal keyword and at an unbalanced closing delimiter.
std::vector<LiteralValue> extract_literal_list(const TokenList& tokens,
                                               const TokenFilter& filter = TokenFilter());

} // namespace scribe
