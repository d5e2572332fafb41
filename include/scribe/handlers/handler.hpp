#pragma once

#include <scribe/code/code_object.hpp>
#include <scribe/lang/statement.hpp>
#include <scribe/result.hpp>
#include <deque>
#include <functional>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace scribe {

class HandlerContext;

// How a handler recognizes its statements. One rule per handler.
class MatchRule {
public:
    enum Kind { TokenType, Text, Pattern };

    // First token has this type
    static MatchRule token(RubyTokenType type);

    // First token's text equals `text` exactly
    static MatchRule text(std::string text);

    // ECMAScript regex found anywhere in the statement's rendered text.
    // InvalidArg error when the expression does not compile.
    static Result<MatchRule> pattern(const std::string& expr);

    Kind kind() const { return kind_; }
    const std::string& source() const { return text_; }

    bool matches(const Statement& st) const;

    // "token(KwClass)", "text(attr_reader)", "pattern(/.../)"
    std::string describe() const;

private:
    MatchRule() = default;

    Kind kind_ = TokenType;
    RubyTokenType type_ = RubyTokenType::Unknown;
    std::string text_;
    std::regex regex_;
};

using HandlerResult = Result<std::vector<CodeObject*>>;
using HandlerRoutine = std::function<HandlerResult(HandlerContext&)>;

struct HandlerDescriptor {
    std::string name;
    std::string family = "ruby";
    MatchRule match;
    HandlerRoutine process;  // empty for an unimplemented handler
};

// Handlers grouped by family, each family in registration order.
// Descriptor pointers stay valid until clear().
class HandlerRegistry {
public:
    // Duplicate error when the family already has a handler of that name
    Status register_handler(HandlerDescriptor descriptor);

    // Every handler of `family` whose rule matches, in registration order
    std::vector<const HandlerDescriptor*> select(const Statement& st,
                                                 const std::string& family = "ruby") const;

    std::vector<const HandlerDescriptor*> handlers(const std::string& family) const;
    std::vector<std::string> families() const;
    size_t size() const;

    void clear();

    // Process-wide registry for handlers installed at startup
    static HandlerRegistry& instance();

private:
    std::map<std::string, std::deque<HandlerDescriptor>> families_;
};

} // namespace scribe
