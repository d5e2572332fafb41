#pragma once

#include <scribe/code/builtins.hpp>
#include <scribe/code/registry.hpp>
#include <functional>
#include <string>
#include <vector>

namespace scribe {

enum class ResolveState {
    Resolved,     // found in the registry, reference rewritten in place
    Builtin,      // core name, left unresolved without a diagnostic
    Speculative,  // still missing; object parked under the missing path
    Skipped       // diagnostics disabled, or nothing to resolve
};

const char* resolve_state_name(ResolveState s);

struct ResolveOutcome {
    ResolveState state = ResolveState::Skipped;
    int attempts = 0;
    std::string path;
};

// Called before each lookup with the missing path, so a driver can load the
// file that defines it.
using LoadOrderHook = std::function<void(const std::string& path)>;

class ForwardResolver {
public:
    static constexpr int MAX_ATTEMPTS = 3;

    ForwardResolver(Registry& registry, const BuiltinSet& builtins);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }

    void set_load_hook(LoadOrderHook hook) { hook_ = std::move(hook); }

    // Runs load_order() on every reference the object holds
    std::vector<ResolveOutcome> verify_object_loaded(CodeObject& obj,
                                                     const std::string& current_file);

    // Never fails; see ResolveState for the possible outcomes
    ResolveOutcome load_order(Reference& ref, CodeObject& obj,
                              const std::string& current_file);

private:
    Registry& registry_;
    const BuiltinSet& builtins_;
    LoadOrderHook hook_;
    bool enabled_ = true;
};

} // namespace scribe
