#include <catch2/catch.hpp>
#include <scribe/lang/statement.hpp>

using namespace scribe;

static std::vector<Statement> parse_ok(const std::string& src) {
    auto r = parse_statements(src, "test.rb");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

TEST_CASE("empty source has no statements", "[statement]") {
    REQUIRE(parse_ok("").empty());
    REQUIRE(parse_ok("\n\n  \n").empty());
}

TEST_CASE("one statement per line", "[statement]") {
    auto sts = parse_ok("a = 1\nb = 2\nputs a\n");
    REQUIRE(sts.size() == 3);
    REQUIRE(sts[0].to_string() == "a = 1");
    REQUIRE(sts[1].line() == 2);
    REQUIRE(sts[2].to_string() == "puts a");
}

TEST_CASE("semicolons separate statements", "[statement]") {
    auto sts = parse_ok("a; b; c");
    REQUIRE(sts.size() == 3);
    REQUIRE(sts[2].to_string() == "c");
}

TEST_CASE("class body becomes a nested block", "[statement]") {
    auto sts = parse_ok(
        "class Foo < Bar\n"
        "  def a; end\n"
        "  X = 1\n"
        "end\n");
    REQUIRE(sts.size() == 1);
    REQUIRE(sts[0].to_string() == "class Foo < Bar");
    REQUIRE(sts[0].has_block());
    REQUIRE(sts[0].block.size() == 2);
    REQUIRE(sts[0].block[0].to_string() == "def a");
    REQUIRE(sts[0].block[1].to_string() == "X = 1");
}

TEST_CASE("nested modules nest blocks", "[statement]") {
    auto sts = parse_ok(
        "module A\n"
        "  module B\n"
        "    def x\n"
        "      if y then 1 end\n"
        "    end\n"
        "  end\n"
        "end\n");
    REQUIRE(sts.size() == 1);
    const auto& b = sts[0].block.at(0);
    REQUIRE(b.to_string() == "module B");
    const auto& x = b.block.at(0);
    REQUIRE(x.first_line() == "def x");
    REQUIRE(x.block.size() == 1);
}

TEST_CASE("do block keeps its parameters in the head", "[statement]") {
    auto sts = parse_ok(
        "items.each do |a, b|\n"
        "  puts a\n"
        "end\n"
        "after\n");
    REQUIRE(sts.size() == 2);
    REQUIRE(sts[0].to_string() == "items.each do |a, b|");
    REQUIRE(sts[0].block.size() == 1);
    REQUIRE(sts[1].to_string() == "after");
}

TEST_CASE("while loop head keeps its do", "[statement]") {
    auto sts = parse_ok("while x do\n  y\nend\n");
    REQUIRE(sts.size() == 1);
    REQUIRE(sts[0].to_string() == "while x do");
    REQUIRE(sts[0].block.size() == 1);
}

TEST_CASE("conditional after assignment opens a block", "[statement]") {
    auto sts = parse_ok("x = if a\n  1\nelse\n  2\nend\nnext_one\n");
    REQUIRE(sts.size() == 2);
    REQUIRE(sts[0].first_line() == "x = if a");
    REQUIRE(sts[1].to_string() == "next_one");
}

TEST_CASE("trailing modifier does not open a block", "[statement]") {
    auto sts = parse_ok("return if done\nfoo\n");
    REQUIRE(sts.size() == 2);
    REQUIRE_FALSE(sts[0].has_block());
}

TEST_CASE("trailing operator or comma continues the line", "[statement]") {
    auto sts = parse_ok("attr_reader :a,\n  :b\nx = 1 +\n  2\n");
    REQUIRE(sts.size() == 2);
    REQUIRE(sts[0].to_string() == "attr_reader :a,\n  :b");
    REQUIRE(sts[1].line() == 3);
}

TEST_CASE("bracketed expressions span lines", "[statement]") {
    auto sts = parse_ok("foo(1,\n    2)\nbar\n");
    REQUIRE(sts.size() == 2);
    REQUIRE(sts[1].to_string() == "bar");
}

// ===== Comments =====

TEST_CASE("comment block above a statement becomes its docstring", "[statement]") {
    auto sts = parse_ok(
        "# First line\n"
        "# Second line\n"
        "def hello; end\n");
    REQUIRE(sts.size() == 1);
    REQUIRE(sts[0].comments.has_value());
    REQUIRE(*sts[0].comments == "First line\nSecond line");
    REQUIRE(sts[0].comments_line == 1);
}

TEST_CASE("comment separated by a blank line is not attached", "[statement]") {
    auto sts = parse_ok("# stray\n\ndef hello; end\n");
    REQUIRE_FALSE(sts[0].comments.has_value());
}

TEST_CASE("trailing comment is not a docstring", "[statement]") {
    auto sts = parse_ok("a = 1 # note\nb = 2\n");
    REQUIRE(sts.size() == 2);
    REQUIRE_FALSE(sts[1].comments.has_value());
}

TEST_CASE("block comment attaches to the next statement", "[statement]") {
    auto sts = parse_ok("=begin\nDocs here\n=end\nclass A; end\n");
    REQUIRE(sts.size() == 1);
    REQUIRE(sts[0].comments.has_value());
    REQUIRE(*sts[0].comments == "Docs here");
}

TEST_CASE("comments inside a block attach to inner statements", "[statement]") {
    auto sts = parse_ok(
        "class A\n"
        "  # The value\n"
        "  X = 1\n"
        "end\n");
    REQUIRE(sts[0].block.size() == 1);
    REQUIRE(*sts[0].block[0].comments == "The value");
}

// ===== Errors =====

TEST_CASE("missing end is a parse error", "[statement]") {
    auto r = parse_statements("class A\n  def b\n  end\n", "open.rb");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Parse);
    REQUIRE(r.error().message.find("missing 'end'") != std::string::npos);
    REQUIRE(r.error().file == "open.rb");
    REQUIRE(r.error().line == 1);
}

TEST_CASE("unmatched end is a parse error", "[statement]") {
    auto r = parse_statements("foo\nend\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("unmatched 'end'") != std::string::npos);
    REQUIRE(r.error().line == 2);
}
