#pragma once

#include <string>
#include <variant>
#include <vector>

namespace scribe {

class CodeObject;

enum class CodeObjectType {
    Root,
    Module,
    Class,
    Method,
    Constant,
    ClassVariable
};

const char* code_object_type_name(CodeObjectType t);

// A link to another code object that may not have been documented yet.
// Resolution rewrites the reference in place.
class Reference {
public:
    struct Resolved {
        CodeObject* object = nullptr;
    };
    struct Unresolved {
        std::string path;
        CodeObjectType type = CodeObjectType::Class;
        std::string written;  // name as it appeared in the source
    };

    Reference() = default;

    // Implicit so a resolved object can be passed wherever a reference is
    // expected; nullptr gives an unset reference.
    Reference(CodeObject* object);

    static Reference unresolved(std::string path, CodeObjectType type,
                                std::string written = "");

    // False for a default-constructed reference (no link at all)
    bool is_set() const;
    bool is_resolved() const;

    // nullptr while unresolved
    CodeObject* get() const;

    // Path of the target, resolved or not
    std::string path() const;

    // Expected type of the target
    CodeObjectType type() const;

    // Name as written at the reference site ("" once resolved)
    std::string written_name() const;

    void resolve(CodeObject* object);

    // Marked when the reference was given up on after load-order retries
    bool is_speculative() const { return speculative_; }
    void set_speculative(bool v) { speculative_ = v; }

private:
    std::variant<std::monostate, Resolved, Unresolved> target_;
    bool speculative_ = false;
};

// Capability of objects that link to other objects through references
class ReferenceHolder {
public:
    virtual ~ReferenceHolder() = default;
    virtual std::vector<Reference*> references() = 0;
};

} // namespace scribe
