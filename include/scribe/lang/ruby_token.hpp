#pragma once

#include <scribe/lang/token.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace scribe {

enum class RubyTokenType {
    // Values
    Integer,
    Float,
    String,        // 'single' or "double" without interpolation
    XString,       // `shell`
    Regexp,        // /pattern/flags
    Symbol,        // :name

    // Nodes (interpolated forms)
    DString,       // "with #{interp}"
    DXString,      // `shell #{interp}`
    DRegexp,       // /re #{interp}/

    // Identifiers
    Identifier,
    Fid,           // foo? foo!
    Constant,
    Gvar,          // $global
    Ivar,          // @ivar
    Cvar,          // @@cvar

    // Keywords
    KwClass,
    KwModule,
    KwDef,
    KwEnd,
    KwDo,
    KwIf,
    KwUnless,
    KwWhile,
    KwUntil,
    KwFor,
    KwCase,
    KwWhen,
    KwBegin,
    KwRescue,
    KwEnsure,
    KwElse,
    KwElsif,
    KwThen,
    KwReturn,
    KwYield,
    KwAnd,
    KwOr,
    KwNot,
    KwIn,
    KwAlias,
    KwUndef,
    KwDefined,
    KwBreak,
    KwNext,
    KwRedo,
    KwRetry,
    KwSelf,
    KwSuper,
    KwTrue,
    KwFalse,
    KwNil,
    KwFile,        // __FILE__
    KwLine,        // __LINE__

    // Punctuation
    Comma,
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Semicolon,
    Dot,
    DoubleColon,
    Op,            // any other operator; text carries the lexeme

    // Layout
    Whitespace,
    Newline,

    // Special
    Eof,
    Unknown
};

enum class TokenCategory {
    Value,
    Node,
    Identifier,
    Keyword,
    Punct,
    Operator,
    Whitespace,
    Other
};

using RubyToken = Token<RubyTokenType>;
using TokenList = std::vector<RubyToken>;

TokenCategory token_category(RubyTokenType t);

// true, false, self, super, nil: keywords that may appear inside a value list
bool is_literal_keyword(RubyTokenType t);

// Every other keyword ends a value list (e.g. a trailing `if` modifier)
bool is_statement_keyword(RubyTokenType t);

// Keyword lookup: identifier text -> keyword type
const std::unordered_map<std::string, RubyTokenType>& ruby_keywords();

// Token type name for diagnostics
const char* ruby_token_name(RubyTokenType t);

// Concatenated token text
std::string render_tokens(const TokenList& tokens);

} // namespace scribe
