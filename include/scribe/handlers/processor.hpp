#pragma once

#include <scribe/code/builtins.hpp>
#include <scribe/code/registry.hpp>
#include <scribe/handlers/context.hpp>
#include <scribe/handlers/handler.hpp>
#include <scribe/handlers/resolver.hpp>
#include <scribe/lang/literal.hpp>
#include <scribe/lang/statement.hpp>
#include <scribe/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scribe {

class Processor;

// Options for HandlerContext::parse_block. With `ns` set, the block is
// traversed inside that namespace and the outer context is restored after.
struct BlockOptions {
    NamespaceObject* ns = nullptr;
    Scope scope = Scope::Instance;
    CodeObject* owner = nullptr;
};

// A handler failure recorded while parsing a statement stream
struct Diagnostic {
    ScribeError::Code code = ScribeError::Unimplemented;
    std::string handler;
    std::string message;
    std::string file;
    int line = 0;
};

// ---------------------------------------------------------------------------
// Per-invocation view handed to a handler routine
// ---------------------------------------------------------------------------

class HandlerContext {
public:
    HandlerContext(Processor& processor, const HandlerDescriptor& handler,
                   const Statement& statement, TraversalContext& ctx);

    const Statement& statement() const { return statement_; }
    const HandlerDescriptor& handler() const { return handler_; }

    NamespaceObject* ns() const { return ctx_.ns; }
    void set_ns(NamespaceObject* ns) { ctx_.ns = ns; }
    CodeObject* owner() const { return ctx_.owner; }
    void set_owner(CodeObject* owner) { ctx_.owner = owner; }
    Visibility visibility() const { return ctx_.visibility; }
    void set_visibility(Visibility v) { ctx_.visibility = v; }
    Scope scope() const { return ctx_.scope; }
    void set_scope(Scope s) { ctx_.scope = s; }

    TraversalContext& context() { return ctx_; }
    Registry& registry();
    Processor& processor() { return processor_; }

    // Resolves the object's references, stamps file/line/source/docstring
    // and the dynamic flag. Returns its argument for chaining.
    template<typename T>
    T* register_object(T* obj) {
        register_one(obj);
        return obj;
    }

    std::vector<CodeObject*> register_objects(std::vector<CodeObject*> objs);

    // Processes the statement's nested block under `opts`
    Status parse_block(const BlockOptions& opts = BlockOptions());

    std::optional<LiteralValue> tokval(const RubyToken& token,
                                       const TokenFilter& filter = TokenFilter()) const;
    std::vector<LiteralValue> tokval_list(const TokenList& tokens,
                                          const TokenFilter& filter = TokenFilter()) const;

    // Undocumentable error located at the current statement
    ScribeError undocumentable(const std::string& message) const;

private:
    void register_one(CodeObject* obj);

    Processor& processor_;
    const HandlerDescriptor& handler_;
    const Statement& statement_;
    TraversalContext& ctx_;
};

// ---------------------------------------------------------------------------
// Processor: dispatches the statements of one file to matching handlers
// ---------------------------------------------------------------------------

class Processor {
public:
    Processor(Registry& registry, const HandlerRegistry& handlers, std::string file,
              std::string family = "ruby");

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    // Root namespace and owner, public instance scope
    TraversalContext top_level_context() const;

    // Processes each statement in order. Handler failures are logged and
    // recorded in diagnostics(); they never stop the stream. Fails only
    // when the context has no namespace.
    Status parse(const std::vector<Statement>& statements, TraversalContext& ctx);

    // Runs every matching handler. An unmatched statement gives an empty
    // list. When handlers fail, the remaining ones still run and the first
    // error is returned.
    HandlerResult process(const Statement& st, TraversalContext& ctx);

    const std::string& file() const { return file_; }
    const std::string& family() const { return family_; }

    Registry& registry() { return registry_; }
    BuiltinSet& builtins() { return builtins_; }
    ForwardResolver& resolver() { return resolver_; }

    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

private:
    Registry& registry_;
    const HandlerRegistry& handlers_;
    std::string file_;
    std::string family_;
    BuiltinSet builtins_;
    ForwardResolver resolver_;
    std::vector<Diagnostic> diagnostics_;
    std::string failed_handler_;  // handler behind the last error from process()
};

} // namespace scribe
