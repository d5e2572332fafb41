#include <scribe/code/builtins.hpp>

namespace scribe {

namespace {

const char* const CORE_CLASSES[] = {
    "Array", "BasicObject", "Binding", "Class", "Complex", "Data", "Dir",
    "Encoding", "Enumerator", "FalseClass", "Fiber", "File", "Float", "Hash",
    "Integer", "IO", "MatchData", "Method", "Module", "NilClass", "Numeric",
    "Object", "Proc", "Random", "Range", "Rational", "Regexp", "Set",
    "String", "Struct", "Symbol", "Thread", "Time", "TrueClass",
    "UnboundMethod",
};

const char* const CORE_MODULES[] = {
    "Comparable", "Enumerable", "Errno", "FileTest", "GC", "Kernel",
    "Marshal", "Math", "ObjectSpace", "Process", "Signal",
};

const char* const CORE_EXCEPTIONS[] = {
    "ArgumentError", "EncodingError", "EOFError", "Exception", "FiberError",
    "FloatDomainError", "FrozenError", "IndexError", "Interrupt", "IOError",
    "KeyError", "LoadError", "LocalJumpError", "NameError",
    "NoMatchingPatternError", "NoMemoryError", "NoMethodError",
    "NotImplementedError", "RangeError", "RegexpError", "RuntimeError",
    "ScriptError", "SecurityError", "SignalException", "StandardError",
    "StopIteration", "SyntaxError", "SystemCallError", "SystemExit",
    "SystemStackError", "ThreadError", "TypeError", "ZeroDivisionError",
};

} // anonymous namespace

BuiltinSet::BuiltinSet() {
    for (const char* n : CORE_CLASSES) names_.insert(n);
    for (const char* n : CORE_MODULES) names_.insert(n);
    for (const char* n : CORE_EXCEPTIONS) names_.insert(n);
}

bool BuiltinSet::contains(const std::string& name) const {
    if (name.compare(0, 2, "::") == 0) return names_.count(name.substr(2)) > 0;
    return names_.count(name) > 0;
}

void BuiltinSet::add(const std::string& name) {
    if (!name.empty()) names_.insert(name);
}

void BuiltinSet::add(const std::vector<std::string>& names) {
    for (const auto& n : names) add(n);
}

} // namespace scribe
