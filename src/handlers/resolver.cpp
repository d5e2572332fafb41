#include <scribe/handlers/resolver.hpp>
#include <scribe/log.hpp>

namespace scribe {

const char* resolve_state_name(ResolveState s) {
    switch (s) {
        case ResolveState::Resolved:    return "resolved";
        case ResolveState::Builtin:     return "builtin";
        case ResolveState::Speculative: return "speculative";
        case ResolveState::Skipped:     return "skipped";
    }
    return "skipped";
}

ForwardResolver::ForwardResolver(Registry& registry, const BuiltinSet& builtins)
    : registry_(registry), builtins_(builtins) {}

std::vector<ResolveOutcome> ForwardResolver::verify_object_loaded(
        CodeObject& obj, const std::string& current_file) {
    std::vector<ResolveOutcome> out;
    for (auto* ref : obj.references()) {
        out.push_back(load_order(*ref, obj, current_file));
    }
    return out;
}

ResolveOutcome ForwardResolver::load_order(Reference& ref, CodeObject& obj,
                                           const std::string& current_file) {
    ResolveOutcome outcome;
    outcome.path = ref.path();
    if (!enabled_ || !ref.is_set() || ref.is_resolved()) return outcome;

    while (outcome.attempts < MAX_ATTEMPTS) {
        ++outcome.attempts;
        if (hook_) hook_(outcome.path);
        if (auto* found = registry_.at(outcome.path)) {
            ref.resolve(found);
            outcome.state = ResolveState::Resolved;
            return outcome;
        }
    }

    if (builtins_.contains(outcome.path) || builtins_.contains(ref.written_name())) {
        outcome.state = ResolveState::Builtin;
        return outcome;
    }

    ref.set_speculative(true);
    registry_.add_pending(outcome.path, &obj);
    outcome.state = ResolveState::Speculative;

    log::warn("The %s %s has not yet been recognized.",
              code_object_type_name(ref.type()), outcome.path.c_str());
    log::warn("If this class/method is part of your source tree, "
              "this will affect your documentation results.");
    log::warn("You can correct this issue by loading the source file for this object "
              "before `%s'", current_file.c_str());
    log::warn("%s", "");
    return outcome;
}

} // namespace scribe
