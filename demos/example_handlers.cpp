#include "example_handlers.hpp"

#include <scribe/handlers/processor.hpp>

namespace scribe::examples {

namespace {

using RT = RubyTokenType;

// Statement tokens without whitespace and line breaks
TokenList significant(const TokenList& tokens) {
    TokenList out;
    for (const auto& t : tokens) {
        if (t.type != RT::Whitespace && t.type != RT::Newline) out.push_back(t);
    }
    return out;
}

// Reads `A::B::C` or `::A` starting at i. Empty when no constant is there.
std::string read_constant_path(const TokenList& toks, size_t& i) {
    std::string path;
    if (i < toks.size() && toks[i].type == RT::DoubleColon) {
        path = "::";
        ++i;
    }
    while (i < toks.size() && toks[i].type == RT::Constant) {
        path += toks[i].text;
        ++i;
        if (i + 1 < toks.size() && toks[i].type == RT::DoubleColon &&
            toks[i + 1].type == RT::Constant) {
            path += "::";
            ++i;
        } else {
            break;
        }
    }
    return path == "::" ? "" : path;
}

struct QualifiedName {
    Reference ns;
    std::string name;
};

// "A::B::C" written inside the current namespace -> (ref to A::B, "C")
QualifiedName split_path(HandlerContext& h, const std::string& path) {
    auto sep = path.rfind("::");
    if (sep == std::string::npos) return {Reference(h.ns()), path};
    std::string prefix = path.substr(0, sep);
    std::string name = path.substr(sep + 2);
    if (prefix.empty()) return {Reference(h.registry().root()), name};
    return {h.registry().reference(h.ns(), prefix, CodeObjectType::Module), name};
}

// Right-hand side of `NAME = value`, trimmed
std::string assignment_value(const TokenList& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].type != RT::Op || tokens[i].text != "=") continue;
        std::string text = render_tokens(TokenList(tokens.begin() + i + 1, tokens.end()));
        auto first = text.find_first_not_of(" \t\n");
        auto last = text.find_last_not_of(" \t\n");
        return first == std::string::npos ? "" : text.substr(first, last - first + 1);
    }
    return "";
}

Visibility visibility_from(const std::string& word) {
    if (word == "private") return Visibility::Private;
    if (word == "protected") return Visibility::Protected;
    return Visibility::Public;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

HandlerResult handle_module(HandlerContext& h) {
    auto toks = significant(h.statement().tokens);
    size_t i = 1;
    std::string path = read_constant_path(toks, i);
    if (path.empty()) return h.undocumentable("module name is not a constant");

    auto q = split_path(h, path);
    auto mod = h.registry().define_module(q.ns, q.name);
    if (mod.is_err()) return std::move(mod).error();

    h.register_object(mod.value());
    SCRIBE_TRY(h.parse_block(BlockOptions{mod.value()}));
    return HandlerResult::ok({mod.value()});
}

HandlerResult handle_class(HandlerContext& h) {
    auto toks = significant(h.statement().tokens);

    // class << self
    if (toks.size() >= 2 && toks[1].type == RT::Op && toks[1].text == "<<") {
        if (toks.size() < 3 || toks[2].type != RT::KwSelf) {
            return h.undocumentable("only `class << self' singleton blocks are documented");
        }
        SCRIBE_TRY(h.parse_block(BlockOptions{h.ns(), Scope::Class}));
        return HandlerResult::ok({});
    }

    size_t i = 1;
    std::string path = read_constant_path(toks, i);
    if (path.empty()) return h.undocumentable("class name is not a constant");

    Reference superclass;
    if (i < toks.size() && toks[i].type == RT::Op && toks[i].text == "<") {
        ++i;
        std::string super_path = read_constant_path(toks, i);
        if (!super_path.empty()) {
            superclass = h.registry().reference(h.ns(), super_path, CodeObjectType::Class);
        }
    }

    auto q = split_path(h, path);
    auto cls = h.registry().define_class(q.ns, q.name, std::move(superclass));
    if (cls.is_err()) return std::move(cls).error();

    h.register_object(cls.value());
    SCRIBE_TRY(h.parse_block(BlockOptions{cls.value()}));
    return HandlerResult::ok({cls.value()});
}

HandlerResult handle_method(HandlerContext& h) {
    auto toks = significant(h.statement().tokens);
    size_t i = 1;
    Scope scope = h.scope();
    if (i + 1 < toks.size() && toks[i].type == RT::KwSelf && toks[i + 1].type == RT::Dot) {
        scope = Scope::Class;
        i += 2;
    }
    if (i >= toks.size() || token_category(toks[i].type) == TokenCategory::Punct) {
        return h.undocumentable("method name is missing");
    }

    std::string name = toks[i].text;
    // def name=(value)
    if (i + 1 < toks.size() && toks[i + 1].type == RT::Op && toks[i + 1].text == "=" &&
        toks[i + 1].pos.line == toks[i].pos.line &&
        toks[i + 1].pos.col == toks[i].pos.col + static_cast<int>(name.size())) {
        name += "=";
    }

    auto meth = h.registry().define_method(Reference(h.ns()), name, scope);
    if (meth.is_err()) return std::move(meth).error();

    MethodObject* m = meth.value();
    m->visibility = h.visibility();
    m->signature = h.statement().first_line();
    h.register_object(m);

    // Definitions inside the body belong to the namespace but are dynamic
    CodeObject* outer = h.owner();
    auto body = h.parse_block(BlockOptions{nullptr, Scope::Instance, m});
    h.set_owner(outer);
    if (body.is_err()) return std::move(body).error();
    return HandlerResult::ok({m});
}

HandlerResult handle_visibility(HandlerContext& h) {
    const auto& tokens = h.statement().tokens;
    Visibility vis = visibility_from(tokens.front().text);

    TokenList args(tokens.begin() + 1, tokens.end());
    auto names = h.tokval_list(args, TokenFilter{TokenGroup::Attr});
    if (names.empty()) {
        h.set_visibility(vis);
        return HandlerResult::ok({});
    }

    std::vector<CodeObject*> changed;
    const char* sep = h.scope() == Scope::Class ? "." : "#";
    for (const auto& v : names) {
        auto* obj = h.registry().at(h.ns()->path() + sep + literal_text(v));
        if (obj && obj->type() == CodeObjectType::Method) {
            static_cast<MethodObject*>(obj)->visibility = vis;
            changed.push_back(obj);
        }
    }
    return HandlerResult::ok(std::move(changed));
}

HandlerResult handle_attribute(HandlerContext& h) {
    const auto& tokens = h.statement().tokens;
    const std::string& kind = tokens.front().text;
    bool reader = kind != "attr_writer";
    bool writer = kind != "attr_reader";

    TokenList args(tokens.begin() + 1, tokens.end());
    auto names = h.tokval_list(args, TokenFilter{TokenGroup::Attr});
    if (names.empty()) return h.undocumentable("no attribute names given");

    std::vector<CodeObject*> objs;
    for (const auto& v : names) {
        std::string name = literal_text(v);
        if (reader) {
            auto m = h.registry().define_method(Reference(h.ns()), name, h.scope());
            if (m.is_err()) return std::move(m).error();
            m.value()->visibility = h.visibility();
            m.value()->signature = "def " + name;
            objs.push_back(m.value());
        }
        if (writer) {
            auto m = h.registry().define_method(Reference(h.ns()), name + "=", h.scope());
            if (m.is_err()) return std::move(m).error();
            m.value()->visibility = h.visibility();
            m.value()->signature = "def " + name + "=(value)";
            objs.push_back(m.value());
        }
    }
    return HandlerResult::ok(h.register_objects(std::move(objs)));
}

HandlerResult handle_constant(HandlerContext& h) {
    const auto& tokens = h.statement().tokens;
    auto c = h.registry().define_constant(Reference(h.ns()), tokens.front().text,
                                          assignment_value(tokens));
    if (c.is_err()) return std::move(c).error();
    return HandlerResult::ok({h.register_object(c.value())});
}

HandlerResult handle_class_variable(HandlerContext& h) {
    const auto& tokens = h.statement().tokens;
    auto cv = h.registry().define_class_variable(Reference(h.ns()), tokens.front().text,
                                                 assignment_value(tokens));
    if (cv.is_err()) return std::move(cv).error();
    return HandlerResult::ok({h.register_object(cv.value())});
}

} // anonymous namespace

Status install_example_handlers(HandlerRegistry& registry, const std::string& family) {
    auto visibility = MatchRule::pattern("^(public|protected|private)\\b");
    if (visibility.is_err()) return std::move(visibility).error();
    auto attribute = MatchRule::pattern("^attr_(reader|writer|accessor)\\b");
    if (attribute.is_err()) return std::move(attribute).error();
    auto constant = MatchRule::pattern("^[A-Z]\\w*\\s*=[^=~>]");
    if (constant.is_err()) return std::move(constant).error();
    auto class_variable = MatchRule::pattern("^@@\\w+\\s*=[^=~>]");
    if (class_variable.is_err()) return std::move(class_variable).error();

    SCRIBE_TRY(registry.register_handler(
        {"module", family, MatchRule::token(RT::KwModule), handle_module}));
    SCRIBE_TRY(registry.register_handler(
        {"class", family, MatchRule::token(RT::KwClass), handle_class}));
    SCRIBE_TRY(registry.register_handler(
        {"method", family, MatchRule::token(RT::KwDef), handle_method}));
    SCRIBE_TRY(registry.register_handler(
        {"visibility", family, std::move(visibility).value(), handle_visibility}));
    SCRIBE_TRY(registry.register_handler(
        {"attribute", family, std::move(attribute).value(), handle_attribute}));
    SCRIBE_TRY(registry.register_handler(
        {"constant", family, std::move(constant).value(), handle_constant}));
    SCRIBE_TRY(registry.register_handler(
        {"class_variable", family, std::move(class_variable).value(), handle_class_variable}));
    return ok_status();
}

} // namespace scribe::examples
