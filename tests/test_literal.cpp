#include <catch2/catch.hpp>
#include <scribe/lang/lexer.hpp>
#include <scribe/lang/literal.hpp>

using namespace scribe;

using RT = RubyTokenType;

static RubyToken tok(RT type, const std::string& text) {
    return RubyToken{type, text, SourcePos{"<test>", 1, 1}};
}

// First token of the lexed source
static RubyToken first_token(const std::string& src) {
    auto r = lex(src);
    REQUIRE(r.is_ok());
    return r.value().tokens.front();
}

// ===== Value mapping =====

TEST_CASE("plain string drops its delimiters", "[literal]") {
    auto v = extract_literal(tok(RT::String, "'hello'"));
    REQUIRE(v.has_value());
    REQUIRE(*v == LiteralValue{std::string("hello")});

    auto dq = extract_literal(tok(RT::String, "\"a\\nb\""));
    REQUIRE(*dq == LiteralValue{std::string("a\\nb")}); // no escape processing
}

TEST_CASE("interpolated and shell strings drop their delimiters", "[literal]") {
    REQUIRE(*extract_literal(tok(RT::DString, "\"x#{y}\"")) ==
            LiteralValue{std::string("x#{y}")});
    REQUIRE(*extract_literal(tok(RT::XString, "`ls`")) == LiteralValue{std::string("ls")});
}

TEST_CASE("symbol becomes a symbolic atom", "[literal]") {
    auto v = extract_literal(tok(RT::Symbol, ":name"));
    REQUIRE(v.has_value());
    REQUIRE(std::holds_alternative<SymbolLiteral>(*v));
    REQUIRE(std::get<SymbolLiteral>(*v).name == "name");

    auto quoted = extract_literal(tok(RT::Symbol, ":\"two words\""));
    REQUIRE(std::get<SymbolLiteral>(*quoted).name == "two words");
}

TEST_CASE("numbers are parsed", "[literal]") {
    REQUIRE(*extract_literal(tok(RT::Integer, "42")) == LiteralValue{int64_t(42)});
    REQUIRE(*extract_literal(tok(RT::Integer, "1_000")) == LiteralValue{int64_t(1000)});
    REQUIRE(*extract_literal(tok(RT::Integer, "0x1F")) == LiteralValue{int64_t(31)});
    REQUIRE(*extract_literal(tok(RT::Integer, "0b101")) == LiteralValue{int64_t(5)});
    REQUIRE(*extract_literal(tok(RT::Integer, "017")) == LiteralValue{int64_t(15)});

    auto f = extract_literal(tok(RT::Float, "3.5"));
    REQUIRE(std::holds_alternative<double>(*f));
    REQUIRE(std::get<double>(*f) == Approx(3.5));
    REQUIRE(std::get<double>(*extract_literal(tok(RT::Float, "2.5e-3"))) == Approx(0.0025));
}

TEST_CASE("overflowing integer degrades to raw text", "[literal]") {
    auto v = extract_literal(tok(RT::Integer, "99999999999999999999999"));
    REQUIRE(v.has_value());
    REQUIRE(*v == LiteralValue{RawText{"99999999999999999999999"}});
}

TEST_CASE("regexp keeps pattern and flags", "[literal]") {
    auto v = extract_literal(tok(RT::Regexp, "/ab+c/i"));
    REQUIRE(v.has_value());
    REQUIRE(*v == LiteralValue{RegexLiteral{"ab+c", "i"}});

    auto plain = extract_literal(tok(RT::Regexp, "/x/"));
    REQUIRE(*plain == LiteralValue{RegexLiteral{"x", ""}});
}

TEST_CASE("literal keywords map to their values", "[literal]") {
    REQUIRE(*extract_literal(tok(RT::KwTrue, "true")) == LiteralValue{true});
    REQUIRE(*extract_literal(tok(RT::KwFalse, "false")) == LiteralValue{false});
    REQUIRE(*extract_literal(tok(RT::KwNil, "nil")) == LiteralValue{NilLiteral{}});
}

TEST_CASE("literal keywords are absent under a non-matching filter", "[literal]") {
    TokenFilter numbers{TokenGroup::Number};
    REQUIRE_FALSE(extract_literal(tok(RT::KwTrue, "true"), numbers).has_value());
    REQUIRE_FALSE(extract_literal(tok(RT::KwNil, "nil"), numbers).has_value());
}

// ===== Filters =====

TEST_CASE("default filter accepts values and nodes only", "[literal]") {
    TokenFilter f;
    REQUIRE(f.accepts(RT::String));
    REQUIRE(f.accepts(RT::Integer));
    REQUIRE(f.accepts(RT::Symbol));
    REQUIRE(f.accepts(RT::DString));
    REQUIRE(f.accepts(RT::DRegexp));
    REQUIRE_FALSE(f.accepts(RT::Identifier));
    REQUIRE_FALSE(f.accepts(RT::Constant));
    REQUIRE_FALSE(f.accepts(RT::Comma));
    REQUIRE_FALSE(f.accepts(RT::KwSelf));
}

TEST_CASE("empty filter list means the value group", "[literal]") {
    TokenFilter f{};
    REQUIRE(f.accepts(RT::Float));
    REQUIRE(f.accepts(RT::DXString));
}

TEST_CASE("node group does not accept plain values", "[literal]") {
    TokenFilter f{TokenGroup::Node};
    REQUIRE(f.accepts(RT::DString));
    REQUIRE_FALSE(f.accepts(RT::String));
}

TEST_CASE("group filters expand before matching", "[literal]") {
    TokenFilter str{TokenGroup::String};
    REQUIRE(str.accepts(RT::String));
    REQUIRE(str.accepts(RT::DString));
    REQUIRE(str.accepts(RT::XString));
    REQUIRE(str.accepts(RT::DXString));
    REQUIRE_FALSE(str.accepts(RT::Symbol));

    TokenFilter attr{TokenGroup::Attr};
    REQUIRE(attr.accepts(RT::Symbol));
    REQUIRE(attr.accepts(RT::String));
    REQUIRE_FALSE(attr.accepts(RT::DString));

    TokenFilter ident{TokenGroup::Identifier};
    REQUIRE(ident.accepts(RT::Identifier));
    REQUIRE(ident.accepts(RT::Fid));
    REQUIRE(ident.accepts(RT::Gvar));
    REQUIRE_FALSE(ident.accepts(RT::Constant));

    TokenFilter num{TokenGroup::Number};
    REQUIRE(num.accepts(RT::Integer));
    REQUIRE(num.accepts(RT::Float));
    REQUIRE_FALSE(num.accepts(RT::String));
}

TEST_CASE("filters mix groups and single types", "[literal]") {
    TokenFilter f{TokenGroup::Number, RT::Constant};
    REQUIRE(f.accepts(RT::Integer));
    REQUIRE(f.accepts(RT::Constant));
    REQUIRE_FALSE(f.accepts(RT::String));

    auto v = extract_literal(tok(RT::Constant, "Foo::Bar"), f);
    REQUIRE(*v == LiteralValue{RawText{"Foo::Bar"}});
}

TEST_CASE("unaccepted token gives no value", "[literal]") {
    REQUIRE_FALSE(extract_literal(tok(RT::Identifier, "foo")).has_value());
    REQUIRE_FALSE(extract_literal(tok(RT::Comma, ",")).has_value());
}

TEST_CASE("identifiers stay raw text", "[literal]") {
    auto v = extract_literal(tok(RT::Identifier, "foo"), TokenFilter{TokenGroup::Identifier});
    REQUIRE(*v == LiteralValue{RawText{"foo"}});
}

TEST_CASE("extraction from lexed tokens", "[literal]") {
    REQUIRE(*extract_literal(first_token("'x'")) == LiteralValue{std::string("x")});
    REQUIRE(*extract_literal(first_token(":sym")) == LiteralValue{SymbolLiteral{"sym"}});
    REQUIRE(*extract_literal(first_token("12")) == LiteralValue{int64_t(12)});
}

// ===== Rendering =====

TEST_CASE("literal_text renders plain text", "[literal]") {
    REQUIRE(literal_text(std::string("abc")) == "abc");
    REQUIRE(literal_text(SymbolLiteral{"s"}) == "s");
    REQUIRE(literal_text(int64_t(-7)) == "-7");
    REQUIRE(literal_text(1.5) == "1.5");
    REQUIRE(literal_text(2.0) == "2.0");
    REQUIRE(literal_text(true) == "true");
    REQUIRE(literal_text(NilLiteral{}) == "");
    REQUIRE(literal_text(RegexLiteral{"a.b", "m"}) == "/a.b/m");
    REQUIRE(literal_text(RawText{"A::B"}) == "A::B");
}

TEST_CASE("render_literal renders source form", "[literal]") {
    REQUIRE(render_literal(std::string("abc")) == "'abc'");
    REQUIRE(render_literal(SymbolLiteral{"s"}) == ":s");
    REQUIRE(render_literal(NilLiteral{}) == "nil");
    REQUIRE(render_literal(false) == "false");
    REQUIRE(render_literal(int64_t(3)) == "3");
}
