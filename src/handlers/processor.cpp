#include <scribe/handlers/processor.hpp>
#include <scribe/log.hpp>

namespace scribe {

// ---------------------------------------------------------------------------
// HandlerContext
// ---------------------------------------------------------------------------

HandlerContext::HandlerContext(Processor& processor, const HandlerDescriptor& handler,
                               const Statement& statement, TraversalContext& ctx)
    : processor_(processor), handler_(handler), statement_(statement), ctx_(ctx) {}

Registry& HandlerContext::registry() {
    return processor_.registry();
}

void HandlerContext::register_one(CodeObject* obj) {
    if (!obj) return;

    processor_.resolver().verify_object_loaded(*obj, processor_.file());

    bool documented = statement_.comments.has_value();
    if (obj->is_namespace()) {
        // Reopened modules and classes keep the location of their first
        // definition unless this one carries documentation
        if (documented || obj->file.empty()) {
            obj->file = processor_.file();
            obj->line = statement_.line();
        }
    } else {
        obj->file = processor_.file();
        obj->line = statement_.line();
        if (obj->source.empty()) obj->source = statement_.to_string();
    }

    if (documented) obj->docstring = *statement_.comments;
    obj->dynamic = ctx_.is_dynamic();
}

std::vector<CodeObject*> HandlerContext::register_objects(std::vector<CodeObject*> objs) {
    for (auto* obj : objs) register_one(obj);
    return objs;
}

Status HandlerContext::parse_block(const BlockOptions& opts) {
    std::optional<ContextGuard> guard;
    if (opts.ns) {
        guard.emplace(ctx_);
        ctx_.ns = opts.ns;
        ctx_.visibility = Visibility::Public;
        ctx_.scope = opts.scope;
    }
    ctx_.owner = opts.owner ? opts.owner : ctx_.ns;

    if (!statement_.has_block()) return ok_status();
    return processor_.parse(statement_.block, ctx_);
}

std::optional<LiteralValue> HandlerContext::tokval(const RubyToken& token,
                                                   const TokenFilter& filter) const {
    return extract_literal(token, filter);
}

std::vector<LiteralValue> HandlerContext::tokval_list(const TokenList& tokens,
                                                      const TokenFilter& filter) const {
    return extract_literal_list(tokens, filter);
}

ScribeError HandlerContext::undocumentable(const std::string& message) const {
    return ScribeError{ScribeError::Undocumentable, message,
        "`" + statement_.first_line() + "'", processor_.file(), statement_.line()};
}

// ---------------------------------------------------------------------------
// Processor
// ---------------------------------------------------------------------------

Processor::Processor(Registry& registry, const HandlerRegistry& handlers, std::string file,
                     std::string family)
    : registry_(registry), handlers_(handlers), file_(std::move(file)),
      family_(std::move(family)), resolver_(registry_, builtins_) {}

TraversalContext Processor::top_level_context() const {
    TraversalContext ctx;
    ctx.ns = registry_.root();
    ctx.owner = ctx.ns;
    return ctx;
}

Status Processor::parse(const std::vector<Statement>& statements, TraversalContext& ctx) {
    if (!ctx.ns) {
        return ScribeError{ScribeError::InvalidArg,
            "traversal context has no namespace", "start from top_level_context()", file_, 0};
    }

    for (const auto& st : statements) {
        auto result = process(st, ctx);
        if (result.is_ok()) continue;

        const auto& err = result.error();
        Diagnostic d;
        d.code = err.code;
        d.message = err.message;
        d.file = err.file.empty() ? file_ : err.file;
        d.line = err.line ? err.line : st.line();
        d.handler = failed_handler_;

        if (err.code == ScribeError::Undocumentable) {
            log::warn("in file `%s':%d: cannot document `%s': %s",
                      d.file.c_str(), d.line, st.first_line().c_str(), err.message.c_str());
        } else {
            log::error("%s", err.format().c_str());
        }
        diagnostics_.push_back(std::move(d));
    }
    return ok_status();
}

HandlerResult Processor::process(const Statement& st, TraversalContext& ctx) {
    std::vector<CodeObject*> produced;
    std::optional<ScribeError> first_error;
    std::string first_handler;

    for (const auto* handler : handlers_.select(st, family_)) {
        log::debug("%s:%d: %s (%s)", file_.c_str(), st.line(), handler->name.c_str(),
                   handler->match.describe().c_str());

        if (!handler->process) {
            if (!first_error) {
                first_error = ScribeError{ScribeError::Unimplemented,
                    "handler '" + handler->name + "' has no process routine",
                    "register the handler with a process function", file_, st.line()};
                first_handler = handler->name;
            }
            continue;
        }

        HandlerContext hctx(*this, *handler, st, ctx);
        auto result = handler->process(hctx);
        if (result.is_err()) {
            if (!first_error) {
                first_error = std::move(result).error();
                first_handler = handler->name;
                if (first_error->file.empty()) {
                    first_error->file = file_;
                    first_error->line = st.line();
                }
            }
            continue;
        }
        for (auto* obj : result.value()) produced.push_back(obj);
    }

    if (first_error) {
        failed_handler_ = first_handler;
        return std::move(*first_error);
    }
    return HandlerResult::ok(std::move(produced));
}

} // namespace scribe
