#pragma once

#include <scribe/code/code_object.hpp>
#include <scribe/result.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace scribe {

// Owns every documentation object of a run, indexed by path. Objects are
// never destroyed before the registry, so raw pointers handed out stay
// valid until clear().
class Registry {
public:
    Registry();
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    RootObject* root() const { return root_.get(); }

    // Object at an exact path ("" is the root), nullptr when unknown
    CodeObject* at(const std::string& path) const;

    // Each define_* returns the existing object when the path is already
    // defined with the same type, and a Duplicate error when it is defined
    // with another type.
    Result<ModuleObject*> define_module(const Reference& ns, const std::string& name);
    Result<ClassObject*> define_class(const Reference& ns, const std::string& name,
                                      Reference superclass = Reference());
    Result<MethodObject*> define_method(const Reference& ns, const std::string& name,
                                        Scope scope = Scope::Instance);
    Result<ConstantObject*> define_constant(const Reference& ns, const std::string& name,
                                            const std::string& value);
    Result<ClassVariableObject*> define_class_variable(const Reference& ns,
                                                       const std::string& name,
                                                       const std::string& value);

    // Lexical lookup of `name` (which may contain "::") from `ns` outwards.
    // Unknown names give an unresolved reference qualified by `ns`.
    Reference reference(NamespaceObject* ns, const std::string& name,
                        CodeObjectType type = CodeObjectType::Class) const;

    // Park `waiting` until an object is defined at `path`
    void add_pending(const std::string& path, CodeObject* waiting);
    size_t pending_count() const;

    // All objects except the root, in creation order
    std::vector<CodeObject*> all() const;
    size_t size() const { return objects_.size(); }

    void clear();

private:
    template<typename T>
    Result<T*> insert(std::unique_ptr<T> obj);

    template<typename T>
    Result<T*> existing(CodeObject* found, CodeObjectType type, const std::string& path);

    void adopt_pending(CodeObject* obj);

    std::unique_ptr<RootObject> root_;
    std::vector<std::unique_ptr<CodeObject>> objects_;
    std::unordered_map<std::string, CodeObject*> by_path_;
    std::unordered_map<std::string, std::vector<CodeObject*>> pending_;
};

} // namespace scribe
