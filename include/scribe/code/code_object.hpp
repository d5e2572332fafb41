#pragma once

#include <scribe/code/reference.hpp>
#include <string>
#include <vector>

namespace scribe {

enum class Visibility { Public, Protected, Private };
enum class Scope { Instance, Class };

const char* visibility_name(Visibility v);
const char* scope_name(Scope s);

class NamespaceObject;

// ---------------------------------------------------------------------------
// Base documentation object
// ---------------------------------------------------------------------------

class CodeObject : public ReferenceHolder {
public:
    CodeObject(CodeObjectType type, std::string name, Reference ns);
    ~CodeObject() override = default;

    CodeObject(const CodeObject&) = delete;
    CodeObject& operator=(const CodeObject&) = delete;

    CodeObjectType type() const { return type_; }
    const std::string& name() const { return name_; }

    // Fully qualified path: A::B, A::B#meth, A::B.class_meth, A::CONST
    virtual std::string path() const;

    virtual bool is_namespace() const { return false; }

    Reference& ns_ref() { return ns_; }
    const Reference& ns_ref() const { return ns_; }

    // Resolved enclosing namespace, nullptr while unresolved
    NamespaceObject* ns() const;

    std::vector<Reference*> references() override;

    // Provenance and narrative, filled in at registration
    std::string file;
    int line = 0;
    std::string docstring;
    std::string source;
    bool dynamic = false;

protected:
    // Path of the enclosing namespace ("" at top level)
    std::string ns_path() const;

    CodeObjectType type_;
    std::string name_;
    Reference ns_;
};

// ---------------------------------------------------------------------------
// Namespaces
// ---------------------------------------------------------------------------

class NamespaceObject : public CodeObject {
public:
    using CodeObject::CodeObject;

    bool is_namespace() const override { return true; }

    const std::vector<CodeObject*>& children() const { return children_; }

    // No-op when already a child
    void add_child(CodeObject* child);

    // First child with the given name, any type
    CodeObject* child(const std::string& name) const;

private:
    std::vector<CodeObject*> children_;
};

class RootObject : public NamespaceObject {
public:
    RootObject();

    std::string path() const override { return ""; }
    std::vector<Reference*> references() override { return {}; }
};

class ModuleObject : public NamespaceObject {
public:
    ModuleObject(std::string name, Reference ns);
};

class ClassObject : public NamespaceObject {
public:
    ClassObject(std::string name, Reference ns, Reference superclass);

    Reference& superclass() { return superclass_; }
    const Reference& superclass() const { return superclass_; }

    std::vector<Reference*> references() override;

private:
    Reference superclass_;
};

// ---------------------------------------------------------------------------
// Members
// ---------------------------------------------------------------------------

class MethodObject : public CodeObject {
public:
    MethodObject(std::string name, Reference ns, Scope scope);

    std::string path() const override;

    Scope scope() const { return scope_; }

    Visibility visibility = Visibility::Public;
    std::string signature;  // "def name(args)" as written

private:
    Scope scope_;
};

class ConstantObject : public CodeObject {
public:
    ConstantObject(std::string name, Reference ns, std::string value);

    std::string value;
};

class ClassVariableObject : public CodeObject {
public:
    ClassVariableObject(std::string name, Reference ns, std::string value);

    std::string value;
};

} // namespace scribe
