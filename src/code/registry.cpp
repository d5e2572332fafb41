#include <scribe/code/registry.hpp>

namespace scribe {

namespace {

std::string child_path(const Reference& ns, const std::string& name) {
    std::string prefix = ns.path();
    return prefix.empty() ? name : prefix + "::" + name;
}

std::string method_path(const Reference& ns, const std::string& name, Scope scope) {
    return ns.path() + (scope == Scope::Class ? "." : "#") + name;
}

} // anonymous namespace

Registry::Registry() : root_(std::make_unique<RootObject>()) {}

Registry::~Registry() = default;

CodeObject* Registry::at(const std::string& path) const {
    if (path.empty()) return root_.get();
    auto it = by_path_.find(path);
    return it == by_path_.end() ? nullptr : it->second;
}

template<typename T>
Result<T*> Registry::existing(CodeObject* found, CodeObjectType type,
                              const std::string& path) {
    if (found->type() != type) {
        return ScribeError{ScribeError::Duplicate,
            path + " is already defined as a " + code_object_type_name(found->type()),
            std::string("cannot redefine it as a ") + code_object_type_name(type),
            found->file, found->line};
    }
    return Result<T*>::ok(static_cast<T*>(found));
}

template<typename T>
Result<T*> Registry::insert(std::unique_ptr<T> obj) {
    T* raw = obj.get();
    by_path_[raw->path()] = raw;
    objects_.push_back(std::move(obj));
    if (auto* ns = raw->ns()) ns->add_child(raw);
    adopt_pending(raw);
    return Result<T*>::ok(raw);
}

Result<ModuleObject*> Registry::define_module(const Reference& ns, const std::string& name) {
    std::string path = child_path(ns, name);
    if (auto* found = at(path)) {
        return existing<ModuleObject>(found, CodeObjectType::Module, path);
    }
    return insert(std::make_unique<ModuleObject>(name, ns));
}

Result<ClassObject*> Registry::define_class(const Reference& ns, const std::string& name,
                                            Reference superclass) {
    std::string path = child_path(ns, name);
    if (auto* found = at(path)) {
        auto cls = existing<ClassObject>(found, CodeObjectType::Class, path);
        if (cls.is_ok() && superclass.is_set() && !cls.value()->superclass().is_set()) {
            cls.value()->superclass() = std::move(superclass);
        }
        return cls;
    }
    return insert(std::make_unique<ClassObject>(name, ns, std::move(superclass)));
}

Result<MethodObject*> Registry::define_method(const Reference& ns, const std::string& name,
                                              Scope scope) {
    std::string path = method_path(ns, name, scope);
    if (auto* found = at(path)) {
        return existing<MethodObject>(found, CodeObjectType::Method, path);
    }
    return insert(std::make_unique<MethodObject>(name, ns, scope));
}

Result<ConstantObject*> Registry::define_constant(const Reference& ns, const std::string& name,
                                                  const std::string& value) {
    std::string path = child_path(ns, name);
    if (auto* found = at(path)) {
        auto c = existing<ConstantObject>(found, CodeObjectType::Constant, path);
        if (c.is_ok()) c.value()->value = value;
        return c;
    }
    return insert(std::make_unique<ConstantObject>(name, ns, value));
}

Result<ClassVariableObject*> Registry::define_class_variable(const Reference& ns,
                                                             const std::string& name,
                                                             const std::string& value) {
    std::string path = child_path(ns, name);
    if (auto* found = at(path)) {
        auto c = existing<ClassVariableObject>(found, CodeObjectType::ClassVariable, path);
        if (c.is_ok()) c.value()->value = value;
        return c;
    }
    return insert(std::make_unique<ClassVariableObject>(name, ns, value));
}

Reference Registry::reference(NamespaceObject* ns, const std::string& name,
                              CodeObjectType type) const {
    if (name.compare(0, 2, "::") == 0) {
        std::string absolute = name.substr(2);
        if (auto* obj = at(absolute)) return Reference(obj);
        return Reference::unresolved(absolute, type, name);
    }

    if (!ns) ns = root_.get();
    for (NamespaceObject* n = ns; n; n = n->ns()) {
        std::string prefix = n->path();
        if (auto* obj = at(prefix.empty() ? name : prefix + "::" + name)) {
            return Reference(obj);
        }
    }
    if (auto* obj = at(name)) return Reference(obj);

    std::string prefix = ns->path();
    return Reference::unresolved(prefix.empty() ? name : prefix + "::" + name, type, name);
}

void Registry::add_pending(const std::string& path, CodeObject* waiting) {
    auto& list = pending_[path];
    for (auto* w : list) {
        if (w == waiting) return;
    }
    list.push_back(waiting);
}

size_t Registry::pending_count() const {
    size_t n = 0;
    for (const auto& [path, list] : pending_) n += list.size();
    return n;
}

void Registry::adopt_pending(CodeObject* obj) {
    auto it = pending_.find(obj->path());
    if (it == pending_.end()) return;

    auto waiting = std::move(it->second);
    pending_.erase(it);

    for (auto* w : waiting) {
        for (auto* ref : w->references()) {
            if (!ref->is_resolved() && ref->path() == obj->path()) {
                ref->resolve(obj);
            }
        }
        if (obj->is_namespace() && w->ns_ref().get() == obj) {
            static_cast<NamespaceObject*>(obj)->add_child(w);
        }
    }
}

std::vector<CodeObject*> Registry::all() const {
    std::vector<CodeObject*> out;
    out.reserve(objects_.size());
    for (const auto& obj : objects_) out.push_back(obj.get());
    return out;
}

void Registry::clear() {
    pending_.clear();
    by_path_.clear();
    objects_.clear();
    root_ = std::make_unique<RootObject>();
}

} // namespace scribe
