#include <scribe/code/code_object.hpp>

namespace scribe {

const char* code_object_type_name(CodeObjectType t) {
    switch (t) {
        case CodeObjectType::Root:          return "root";
        case CodeObjectType::Module:        return "module";
        case CodeObjectType::Class:         return "class";
        case CodeObjectType::Method:        return "method";
        case CodeObjectType::Constant:      return "constant";
        case CodeObjectType::ClassVariable: return "class variable";
    }
    return "object";
}

Reference::Reference(CodeObject* object) {
    if (object) target_ = Resolved{object};
}

Reference Reference::unresolved(std::string path, CodeObjectType type,
                                std::string written) {
    Reference ref;
    ref.target_ = Unresolved{std::move(path), type, std::move(written)};
    return ref;
}

bool Reference::is_set() const {
    return !std::holds_alternative<std::monostate>(target_);
}

bool Reference::is_resolved() const {
    return std::holds_alternative<Resolved>(target_);
}

CodeObject* Reference::get() const {
    if (auto* r = std::get_if<Resolved>(&target_)) return r->object;
    return nullptr;
}

std::string Reference::path() const {
    if (auto* r = std::get_if<Resolved>(&target_)) return r->object->path();
    if (auto* u = std::get_if<Unresolved>(&target_)) return u->path;
    return "";
}

CodeObjectType Reference::type() const {
    if (auto* r = std::get_if<Resolved>(&target_)) return r->object->type();
    if (auto* u = std::get_if<Unresolved>(&target_)) return u->type;
    return CodeObjectType::Root;
}

std::string Reference::written_name() const {
    if (auto* u = std::get_if<Unresolved>(&target_)) return u->written;
    return "";
}

void Reference::resolve(CodeObject* object) {
    target_ = Resolved{object};
    speculative_ = false;
}

} // namespace scribe
