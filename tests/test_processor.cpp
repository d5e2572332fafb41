#include <catch2/catch.hpp>
#include <scribe/handlers/processor.hpp>
#include <scribe/log.hpp>

using namespace scribe;

using RT = RubyTokenType;

// ===== Test handlers =====

static std::string second_word(const Statement& st) {
    for (size_t i = 1; i < st.tokens.size(); ++i) {
        if (st.tokens[i].type != RT::Whitespace) return st.tokens[i].text;
    }
    return "";
}

static MatchRule pattern_of(const std::string& expr) {
    auto r = MatchRule::pattern(expr);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static HandlerResult module_handler(HandlerContext& h) {
    auto mod = h.registry().define_module(h.ns(), second_word(h.statement()));
    if (mod.is_err()) return std::move(mod).error();
    auto* m = h.register_object(mod.value());
    SCRIBE_TRY(h.parse_block({m}));
    return HandlerResult::ok({m});
}

static HandlerResult method_handler(HandlerContext& h) {
    auto meth = h.registry().define_method(h.ns(), second_word(h.statement()), h.scope());
    if (meth.is_err()) return std::move(meth).error();
    auto* m = h.register_object(meth.value());
    m->visibility = h.visibility();

    CodeObject* outer = h.owner();
    auto body = h.parse_block({nullptr, Scope::Instance, m});
    h.set_owner(outer);
    if (body.is_err()) return std::move(body).error();
    return HandlerResult::ok({m});
}

static HandlerResult constant_handler(HandlerContext& h) {
    const auto& name = h.statement().tokens.front().text;
    auto c = h.registry().define_constant(h.ns(), name, "v");
    if (c.is_err()) return std::move(c).error();
    return HandlerResult::ok({h.register_object(c.value())});
}

// Enters a method body and leaves the owner there
static HandlerResult dsl_handler(HandlerContext& h) {
    auto meth = h.registry().define_method(h.ns(), "dsl_body");
    if (meth.is_err()) return std::move(meth).error();
    auto* m = h.register_object(meth.value());
    SCRIBE_TRY(h.parse_block({nullptr, Scope::Instance, m}));
    return HandlerResult::ok({m});
}

static HandlerRegistry test_handlers() {
    HandlerRegistry reg;
    REQUIRE(reg.register_handler({"module", "ruby", MatchRule::token(RT::KwModule),
                                  module_handler}).is_ok());
    REQUIRE(reg.register_handler({"method", "ruby", MatchRule::token(RT::KwDef),
                                  method_handler}).is_ok());
    REQUIRE(reg.register_handler({"constant", "ruby", pattern_of("^[A-Z]\\w*\\s*="),
                                  constant_handler}).is_ok());
    REQUIRE(reg.register_handler({"dsl", "ruby", MatchRule::text("dsl"), dsl_handler}).is_ok());
    REQUIRE(reg.register_handler({"private", "ruby", MatchRule::text("private"),
        [](HandlerContext& h) -> HandlerResult {
            h.set_visibility(Visibility::Private);
            return HandlerResult::ok({});
        }}).is_ok());
    REQUIRE(reg.register_handler({"boom_a", "ruby", MatchRule::text("boom"),
        [](HandlerContext&) -> HandlerResult {
            return ScribeError{ScribeError::InvalidArg, "first failure"};
        }}).is_ok());
    REQUIRE(reg.register_handler({"boom_b", "ruby", MatchRule::text("boom"),
        [](HandlerContext&) -> HandlerResult {
            return ScribeError{ScribeError::Parse, "second failure"};
        }}).is_ok());
    REQUIRE(reg.register_handler({"boom_c", "ruby", MatchRule::text("boom"),
        [](HandlerContext& h) -> HandlerResult {
            auto c = h.registry().define_constant(h.ns(), "BOOM", "1");
            if (c.is_err()) return std::move(c).error();
            return HandlerResult::ok({h.register_object(c.value())});
        }}).is_ok());
    REQUIRE(reg.register_handler({"stub", "ruby", MatchRule::text("stub"), nullptr}).is_ok());
    REQUIRE(reg.register_handler({"undoc", "ruby", MatchRule::text("undoc"),
        [](HandlerContext& h) -> HandlerResult {
            return h.undocumentable("no name given");
        }}).is_ok());
    return reg;
}

static std::vector<Statement> statements_of(const std::string& src) {
    auto r = parse_statements(src, "test.rb");
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

struct ProcessorFixture {
    Registry reg;
    HandlerRegistry handlers = test_handlers();
    Processor proc{reg, handlers, "test.rb"};
    TraversalContext ctx = proc.top_level_context();

    void run(const std::string& src) {
        auto sts = statements_of(src);
        REQUIRE(proc.parse(sts, ctx).is_ok());
    }
};

// ===== Traversal =====

TEST_CASE("parse requires a namespace", "[processor]") {
    Registry reg;
    HandlerRegistry handlers;
    Processor proc(reg, handlers, "test.rb");
    TraversalContext ctx;
    auto r = proc.parse(statements_of("x"), ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::InvalidArg);
}

TEST_CASE("top level context starts at the root", "[processor]") {
    ProcessorFixture f;
    REQUIRE(f.ctx.ns == f.reg.root());
    REQUIRE(f.ctx.owner == f.reg.root());
    REQUIRE(f.ctx.visibility == Visibility::Public);
    REQUIRE(f.ctx.scope == Scope::Instance);
    REQUIRE_FALSE(f.ctx.is_dynamic());
}

TEST_CASE("nested blocks build nested namespaces", "[processor]") {
    ProcessorFixture f;
    f.run("module A\n"
          "  module B\n"
          "    X = 1\n"
          "  end\n"
          "end\n");
    auto* x = f.reg.at("A::B::X");
    REQUIRE(x != nullptr);
    REQUIRE(x->ns() == f.reg.at("A::B"));
    REQUIRE(f.ctx.ns == f.reg.root());
    REQUIRE(f.ctx.owner == f.reg.root());
    REQUIRE(f.proc.diagnostics().empty());
}

TEST_CASE("block traversal restores the outer visibility", "[processor]") {
    ProcessorFixture f;
    f.run("module A\n"
          "  private\n"
          "  def hidden; end\n"
          "end\n"
          "def open; end\n");
    auto* hidden = static_cast<MethodObject*>(f.reg.at("A#hidden"));
    auto* open = static_cast<MethodObject*>(f.reg.at("#open"));
    REQUIRE(hidden != nullptr);
    REQUIRE(open != nullptr);
    REQUIRE(hidden->visibility == Visibility::Private);
    REQUIRE(open->visibility == Visibility::Public);
    REQUIRE(f.ctx.visibility == Visibility::Public);
}

TEST_CASE("objects inside a method body are dynamic", "[processor]") {
    ProcessorFixture f;
    f.run("module A\n"
          "  def build\n"
          "    X = 1\n"
          "  end\n"
          "  Y = 2\n"
          "end\n");
    REQUIRE(f.reg.at("A::X")->dynamic);
    REQUIRE_FALSE(f.reg.at("A::Y")->dynamic);
    REQUIRE_FALSE(f.reg.at("A")->dynamic);
    REQUIRE_FALSE(f.reg.at("A#build")->dynamic);
}

TEST_CASE("owner set by a block without a namespace persists", "[processor]") {
    ProcessorFixture f;
    f.run("module A\n"
          "  dsl do\n"
          "    X = 1\n"
          "  end\n"
          "  Y = 2\n"
          "end\n"
          "Z = 3\n");
    REQUIRE(f.reg.at("A::X")->dynamic);
    REQUIRE(f.reg.at("A::Y")->dynamic);
    REQUIRE_FALSE(f.reg.at("Z")->dynamic);
}

TEST_CASE("failing statement inside a block still restores the context", "[processor]") {
    Registry reg;
    HandlerRegistry handlers;
    REQUIRE(handlers.register_handler({"singleton", "ruby", MatchRule::token(RT::KwModule),
        [](HandlerContext& h) -> HandlerResult {
            auto mod = h.registry().define_module(h.ns(), second_word(h.statement()));
            if (mod.is_err()) return std::move(mod).error();
            auto* m = h.register_object(mod.value());
            SCRIBE_TRY(h.parse_block({m, Scope::Class}));
            return HandlerResult::ok({m});
        }}).is_ok());
    REQUIRE(handlers.register_handler({"stub", "ruby", MatchRule::text("stub"),
                                       nullptr}).is_ok());

    Processor proc(reg, handlers, "test.rb");
    auto ctx = proc.top_level_context();
    ctx.visibility = Visibility::Private;

    log::set_level(log::Error);
    auto r = proc.parse(statements_of("module M\n  stub\nend\n"), ctx);
    log::set_level(log::Info);
    REQUIRE(r.is_ok());

    REQUIRE(reg.at("M") != nullptr);
    REQUIRE(ctx.ns == reg.root());
    REQUIRE(ctx.owner == reg.root());
    REQUIRE(ctx.visibility == Visibility::Private);
    REQUIRE(ctx.scope == Scope::Instance);
    REQUIRE(proc.diagnostics().size() == 1);
    REQUIRE(proc.diagnostics()[0].code == ScribeError::Unimplemented);
    REQUIRE(proc.diagnostics()[0].handler == "stub");
}

TEST_CASE("parse_block on a statement without a block", "[processor]") {
    ProcessorFixture f;
    f.run("module Empty; end\nX = 1\n");
    REQUIRE(f.reg.at("Empty") != nullptr);
    REQUIRE(f.reg.at("X")->ns() == f.reg.root());
}

// ===== Registration =====

TEST_CASE("reopened namespace keeps its first location unless documented", "[processor]") {
    ProcessorFixture f;
    f.run("module A; end\n"
          "module A; end\n");
    auto* a = f.reg.at("A");
    REQUIRE(a->file == "test.rb");
    REQUIRE(a->line == 1);

    f.run("# Docs for A\n"
          "module A; end\n");
    REQUIRE(a->line == 2);
    REQUIRE(a->docstring == "Docs for A");
}

TEST_CASE("members take the latest location and keep their first source", "[processor]") {
    ProcessorFixture f;
    f.run("X = 1\nX = 2\n");
    auto* x = f.reg.at("X");
    REQUIRE(x->line == 2);
    REQUIRE(x->file == "test.rb");
    REQUIRE(x->source == "X = 1");
}

TEST_CASE("comment above a statement becomes the docstring", "[processor]") {
    ProcessorFixture f;
    f.run("# The answer\nANSWER = 42\n");
    REQUIRE(f.reg.at("ANSWER")->docstring == "The answer");
}

// ===== Failures =====

TEST_CASE("failing handler does not stop the others", "[processor]") {
    ProcessorFixture f;
    log::set_level(log::Error);
    f.run("boom\nZ = 1\n");
    log::set_level(log::Info);

    REQUIRE(f.reg.at("BOOM") != nullptr);
    REQUIRE(f.reg.at("Z") != nullptr);
    REQUIRE(f.proc.diagnostics().size() == 1);
    const auto& d = f.proc.diagnostics().front();
    REQUIRE(d.code == ScribeError::InvalidArg);
    REQUIRE(d.handler == "boom_a");
    REQUIRE(d.message == "first failure");
    REQUIRE(d.file == "test.rb");
    REQUIRE(d.line == 1);
}

TEST_CASE("process returns the first error", "[processor]") {
    ProcessorFixture f;
    auto sts = statements_of("boom");
    auto r = f.proc.process(sts.front(), f.ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "first failure");
    REQUIRE(r.error().file == "test.rb");
    REQUIRE(r.error().line == 1);
}

TEST_CASE("handler without a routine is unimplemented", "[processor]") {
    ProcessorFixture f;
    log::set_level(log::Error);
    f.run("stub\n");
    log::set_level(log::Info);

    REQUIRE(f.proc.diagnostics().size() == 1);
    const auto& d = f.proc.diagnostics().front();
    REQUIRE(d.code == ScribeError::Unimplemented);
    REQUIRE(d.handler == "stub");
    REQUIRE(d.message.find("no process routine") != std::string::npos);
}

TEST_CASE("undocumentable statement is recorded", "[processor]") {
    ProcessorFixture f;
    auto sts = statements_of("X = 1\nundoc\n");
    auto r = f.proc.process(sts[1], f.ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScribeError::Undocumentable);
    REQUIRE(r.error().hint == "`undoc'");
    REQUIRE(r.error().line == 2);

    log::set_level(log::Error);
    REQUIRE(f.proc.parse(sts, f.ctx).is_ok());
    log::set_level(log::Info);
    REQUIRE(f.proc.diagnostics().size() == 1);
    REQUIRE(f.proc.diagnostics()[0].code == ScribeError::Undocumentable);
    REQUIRE(f.proc.diagnostics()[0].line == 2);
    REQUIRE(f.reg.at("X") != nullptr);
}

TEST_CASE("unmatched statement produces nothing", "[processor]") {
    ProcessorFixture f;
    auto sts = statements_of("puts 1");
    auto r = f.proc.process(sts.front(), f.ctx);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("process returns objects from every matching handler", "[processor]") {
    ProcessorFixture f;
    auto sts = statements_of("module M\n  X = 1\nend\n");
    auto r = f.proc.process(sts.front(), f.ctx);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0] == f.reg.at("M"));
    REQUIRE(f.reg.at("M::X") != nullptr);
}

// ===== Forward references =====

TEST_CASE("registration parks objects in unknown namespaces", "[processor]") {
    ProcessorFixture f;
    auto later = f.reg.reference(f.reg.root(), "Later", CodeObjectType::Module);
    auto meth = f.reg.define_method(later, "go");
    REQUIRE(meth.is_ok());

    auto sts = statements_of("go");
    HandlerDescriptor desc{"go", "ruby", MatchRule::text("go"), nullptr};
    HandlerContext h(f.proc, desc, sts.front(), f.ctx);

    log::set_level(log::Error);
    h.register_object(meth.value());
    log::set_level(log::Info);
    REQUIRE(f.reg.pending_count() == 1);
    REQUIRE(meth.value()->ns_ref().is_speculative());

    f.run("module Later; end\n");
    REQUIRE(meth.value()->ns() == f.reg.at("Later"));
    REQUIRE(f.reg.pending_count() == 0);
}

TEST_CASE("disabled resolver leaves references alone", "[processor]") {
    ProcessorFixture f;
    f.proc.resolver().set_enabled(false);
    auto meth = f.reg.define_method(
        f.reg.reference(f.reg.root(), "Later", CodeObjectType::Module), "go");

    auto sts = statements_of("go");
    HandlerDescriptor desc{"go", "ruby", MatchRule::text("go"), nullptr};
    HandlerContext h(f.proc, desc, sts.front(), f.ctx);
    h.register_object(meth.value());
    REQUIRE(f.reg.pending_count() == 0);
    REQUIRE_FALSE(meth.value()->ns_ref().is_speculative());
}
