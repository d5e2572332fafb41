#include <scribe/handlers/handler.hpp>

namespace scribe {

// ---------------------------------------------------------------------------
// MatchRule
// ---------------------------------------------------------------------------

MatchRule MatchRule::token(RubyTokenType type) {
    MatchRule r;
    r.kind_ = TokenType;
    r.type_ = type;
    r.text_ = ruby_token_name(type);
    return r;
}

MatchRule MatchRule::text(std::string text) {
    MatchRule r;
    r.kind_ = Text;
    r.text_ = std::move(text);
    return r;
}

Result<MatchRule> MatchRule::pattern(const std::string& expr) {
    MatchRule r;
    r.kind_ = Pattern;
    r.text_ = expr;
    try {
        r.regex_ = std::regex(expr, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return ScribeError{ScribeError::InvalidArg,
            "invalid handler pattern /" + expr + "/: " + e.what()};
    }
    return Result<MatchRule>::ok(std::move(r));
}

bool MatchRule::matches(const Statement& st) const {
    if (st.tokens.empty()) return false;
    const auto& first = st.tokens.front();
    switch (kind_) {
    case TokenType:
        return first.type == type_;
    case Text:
        return first.text == text_;
    case Pattern:
        return std::regex_search(st.to_string(), regex_);
    }
    return false;
}

std::string MatchRule::describe() const {
    switch (kind_) {
    case TokenType: return "token(" + text_ + ")";
    case Text:      return "text(" + text_ + ")";
    case Pattern:   return "pattern(/" + text_ + "/)";
    }
    return "";
}

// ---------------------------------------------------------------------------
// HandlerRegistry
// ---------------------------------------------------------------------------

Status HandlerRegistry::register_handler(HandlerDescriptor descriptor) {
    auto& list = families_[descriptor.family];
    for (const auto& h : list) {
        if (h.name == descriptor.name) {
            return ScribeError{ScribeError::Duplicate,
                "handler '" + descriptor.name + "' is already registered in family '" +
                descriptor.family + "'"};
        }
    }
    list.push_back(std::move(descriptor));
    return ok_status();
}

std::vector<const HandlerDescriptor*> HandlerRegistry::select(const Statement& st,
                                                              const std::string& family) const {
    std::vector<const HandlerDescriptor*> out;
    auto it = families_.find(family);
    if (it == families_.end()) return out;
    for (const auto& h : it->second) {
        if (h.match.matches(st)) out.push_back(&h);
    }
    return out;
}

std::vector<const HandlerDescriptor*> HandlerRegistry::handlers(const std::string& family) const {
    std::vector<const HandlerDescriptor*> out;
    auto it = families_.find(family);
    if (it == families_.end()) return out;
    for (const auto& h : it->second) out.push_back(&h);
    return out;
}

std::vector<std::string> HandlerRegistry::families() const {
    std::vector<std::string> out;
    for (const auto& [name, list] : families_) {
        if (!list.empty()) out.push_back(name);
    }
    return out;
}

size_t HandlerRegistry::size() const {
    size_t n = 0;
    for (const auto& [name, list] : families_) n += list.size();
    return n;
}

void HandlerRegistry::clear() {
    families_.clear();
}

HandlerRegistry& HandlerRegistry::instance() {
    static HandlerRegistry registry;
    return registry;
}

} // namespace scribe
