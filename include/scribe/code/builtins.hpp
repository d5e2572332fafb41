#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace scribe {

// Names of core classes, modules and exceptions that are never defined in a
// documented source tree. Unresolved references to them are not reported.
class BuiltinSet {
public:
    // Core names only
    BuiltinSet();

    bool contains(const std::string& name) const;

    void add(const std::string& name);
    void add(const std::vector<std::string>& names);

    size_t size() const { return names_.size(); }

private:
    std::unordered_set<std::string> names_;
};

} // namespace scribe
