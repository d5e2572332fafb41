#include <catch2/catch.hpp>
#include <scribe/handlers/handler.hpp>

using namespace scribe;

static Statement statement_of(const std::string& src) {
    auto r = parse_statements(src);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    return r.value().front();
}

static HandlerResult nothing(HandlerContext&) {
    return HandlerResult::ok({});
}

static HandlerDescriptor descriptor(const std::string& name, MatchRule rule,
                                    const std::string& family = "ruby") {
    return HandlerDescriptor{name, family, std::move(rule), nothing};
}

static MatchRule pattern_of(const std::string& expr) {
    auto r = MatchRule::pattern(expr);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Match rules =====

TEST_CASE("token rule matches the first token type", "[handler]") {
    auto rule = MatchRule::token(RubyTokenType::KwClass);
    REQUIRE(rule.kind() == MatchRule::TokenType);
    REQUIRE(rule.matches(statement_of("class Foo; end")));
    REQUIRE_FALSE(rule.matches(statement_of("module Foo; end")));
    REQUIRE_FALSE(rule.matches(statement_of("x = class_name")));
}

TEST_CASE("text rule matches the first token exactly", "[handler]") {
    auto rule = MatchRule::text("attr_reader");
    REQUIRE(rule.kind() == MatchRule::Text);
    REQUIRE(rule.matches(statement_of("attr_reader :a")));
    REQUIRE_FALSE(rule.matches(statement_of("attr_readers :a")));
    REQUIRE_FALSE(rule.matches(statement_of("x.attr_reader :a")));
}

TEST_CASE("pattern rule searches the statement text", "[handler]") {
    auto rule = pattern_of("^attr_(reader|writer)\\b");
    REQUIRE(rule.kind() == MatchRule::Pattern);
    REQUIRE(rule.matches(statement_of("attr_writer :a")));
    REQUIRE_FALSE(rule.matches(statement_of("attr_accessor :a")));

    auto anywhere = pattern_of("Struct\\.new");
    REQUIRE(anywhere.matches(statement_of("Point = Struct.new(:x, :y)")));
}

TEST_CASE("invalid pattern is rejected", "[handler]") {
    auto r = MatchRule::pattern("attr_(reader");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::InvalidArg);
    REQUIRE(r.error().message.find("attr_(reader") != std::string::npos);
}

TEST_CASE("empty statement matches nothing", "[handler]") {
    Statement empty;
    REQUIRE_FALSE(MatchRule::token(RubyTokenType::KwDef).matches(empty));
    REQUIRE_FALSE(pattern_of(".*").matches(empty));
}

TEST_CASE("rules describe themselves", "[handler]") {
    REQUIRE(MatchRule::text("private").describe() == "text(private)");
    REQUIRE(pattern_of("^x").describe() == "pattern(/^x/)");
    REQUIRE(MatchRule::token(RubyTokenType::KwDef).describe().rfind("token(", 0) == 0);
}

// ===== Registry =====

TEST_CASE("register and select in registration order", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("second_match", pattern_of("Foo"))).is_ok());
    REQUIRE(reg.register_handler(descriptor("class", MatchRule::token(RubyTokenType::KwClass)))
                .is_ok());
    REQUIRE(reg.register_handler(descriptor("other", MatchRule::text("module"))).is_ok());
    REQUIRE(reg.size() == 3);

    auto selected = reg.select(statement_of("class Foo; end"));
    REQUIRE(selected.size() == 2);
    REQUIRE(selected[0]->name == "second_match");
    REQUIRE(selected[1]->name == "class");
}

TEST_CASE("unmatched statement selects nothing", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("class", MatchRule::token(RubyTokenType::KwClass)))
                .is_ok());
    REQUIRE(reg.select(statement_of("puts 1")).empty());
}

TEST_CASE("duplicate name in a family is rejected", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("class", MatchRule::text("class"))).is_ok());
    auto dup = reg.register_handler(descriptor("class", MatchRule::text("klass")));
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == ScribeError::Duplicate);
    REQUIRE(reg.size() == 1);

    // Same name in another family is fine
    REQUIRE(reg.register_handler(descriptor("class", MatchRule::text("class"), "ruby18"))
                .is_ok());
    REQUIRE(reg.size() == 2);
}

TEST_CASE("families are selected independently", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("a", MatchRule::text("x"), "ruby")).is_ok());
    REQUIRE(reg.register_handler(descriptor("b", MatchRule::text("x"), "ruby18")).is_ok());

    auto st = statement_of("x");
    REQUIRE(reg.select(st, "ruby").at(0)->name == "a");
    REQUIRE(reg.select(st, "ruby18").at(0)->name == "b");
    REQUIRE(reg.select(st, "c").empty());

    REQUIRE(reg.families() == std::vector<std::string>{"ruby", "ruby18"});
    REQUIRE(reg.handlers("ruby18").size() == 1);
    REQUIRE(reg.handlers("missing").empty());
}

TEST_CASE("descriptor pointers survive later registrations", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("first", MatchRule::text("x"))).is_ok());
    const HandlerDescriptor* first = reg.handlers("ruby").front();
    for (int i = 0; i < 64; ++i) {
        REQUIRE(reg.register_handler(descriptor("h" + std::to_string(i), MatchRule::text("y")))
                    .is_ok());
    }
    REQUIRE(first->name == "first");
}

TEST_CASE("clear empties every family", "[handler]") {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler(descriptor("a", MatchRule::text("x"))).is_ok());
    reg.clear();
    REQUIRE(reg.size() == 0);
    REQUIRE(reg.families().empty());
}

TEST_CASE("instance is process wide", "[handler]") {
    REQUIRE(&HandlerRegistry::instance() == &HandlerRegistry::instance());
}
