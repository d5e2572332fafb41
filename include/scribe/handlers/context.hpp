#pragma once

#include <scribe/code/code_object.hpp>

namespace scribe {

// Where the traversal currently is. `ns` is the nearest enclosing module or
// class; `owner` is the nearest enclosing container of any kind, e.g. a
// method body or a block passed to a DSL call.
struct TraversalContext {
    NamespaceObject* ns = nullptr;
    CodeObject* owner = nullptr;
    Visibility visibility = Visibility::Public;
    Scope scope = Scope::Instance;

    // Objects found while owner != ns are documented as dynamic
    bool is_dynamic() const { return owner != ns; }
};

// Saves ns, visibility and scope on construction. On destruction restores
// them and resets owner to the restored ns.
class ContextGuard {
public:
    explicit ContextGuard(TraversalContext& ctx)
        : ctx_(ctx), ns_(ctx.ns), visibility_(ctx.visibility), scope_(ctx.scope) {}

    ~ContextGuard() {
        ctx_.ns = ns_;
        ctx_.visibility = visibility_;
        ctx_.scope = scope_;
        ctx_.owner = ns_;
    }

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    TraversalContext& ctx_;
    NamespaceObject* ns_;
    Visibility visibility_;
    Scope scope_;
};

} // namespace scribe
