#include <scribe/code/code_object.hpp>
#include <algorithm>

namespace scribe {

const char* visibility_name(Visibility v) {
    switch (v) {
        case Visibility::Public:    return "public";
        case Visibility::Protected: return "protected";
        case Visibility::Private:   return "private";
    }
    return "public";
}

const char* scope_name(Scope s) {
    return s == Scope::Class ? "class" : "instance";
}

// ---------------------------------------------------------------------------
// CodeObject
// ---------------------------------------------------------------------------

CodeObject::CodeObject(CodeObjectType type, std::string name, Reference ns)
    : type_(type), name_(std::move(name)), ns_(std::move(ns)) {}

std::string CodeObject::ns_path() const {
    return ns_.path();
}

std::string CodeObject::path() const {
    std::string prefix = ns_path();
    if (prefix.empty()) return name_;
    return prefix + "::" + name_;
}

NamespaceObject* CodeObject::ns() const {
    auto* obj = ns_.get();
    if (obj && obj->is_namespace()) return static_cast<NamespaceObject*>(obj);
    return nullptr;
}

std::vector<Reference*> CodeObject::references() {
    if (!ns_.is_set()) return {};
    return {&ns_};
}

// ---------------------------------------------------------------------------
// Namespaces
// ---------------------------------------------------------------------------

void NamespaceObject::add_child(CodeObject* child) {
    if (std::find(children_.begin(), children_.end(), child) == children_.end()) {
        children_.push_back(child);
    }
}

CodeObject* NamespaceObject::child(const std::string& name) const {
    for (auto* c : children_) {
        if (c->name() == name) return c;
    }
    return nullptr;
}

RootObject::RootObject()
    : NamespaceObject(CodeObjectType::Root, "root", Reference()) {}

ModuleObject::ModuleObject(std::string name, Reference ns)
    : NamespaceObject(CodeObjectType::Module, std::move(name), std::move(ns)) {}

ClassObject::ClassObject(std::string name, Reference ns, Reference superclass)
    : NamespaceObject(CodeObjectType::Class, std::move(name), std::move(ns)),
      superclass_(std::move(superclass)) {}

std::vector<Reference*> ClassObject::references() {
    auto refs = CodeObject::references();
    if (superclass_.is_set()) refs.push_back(&superclass_);
    return refs;
}

// ---------------------------------------------------------------------------
// Members
// ---------------------------------------------------------------------------

MethodObject::MethodObject(std::string name, Reference ns, Scope scope)
    : CodeObject(CodeObjectType::Method, std::move(name), std::move(ns)),
      scope_(scope) {}

std::string MethodObject::path() const {
    return ns_path() + (scope_ == Scope::Class ? "." : "#") + name_;
}

ConstantObject::ConstantObject(std::string name, Reference ns, std::string v)
    : CodeObject(CodeObjectType::Constant, std::move(name), std::move(ns)),
      value(std::move(v)) {}

ClassVariableObject::ClassVariableObject(std::string name, Reference ns, std::string v)
    : CodeObject(CodeObjectType::ClassVariable, std::move(name), std::move(ns)),
      value(std::move(v)) {}

} // namespace scribe
