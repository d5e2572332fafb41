#pragma once

#include <scribe/code/registry.hpp>
#include <scribe/result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace scribe {

// SQLite-backed copy of a Registry, so a later run can start from the
// objects documented by an earlier one.
class RegistryStore {
public:
    RegistryStore();
    ~RegistryStore();
    RegistryStore(RegistryStore&&) noexcept;
    RegistryStore& operator=(RegistryStore&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;
    static std::string default_path();

    // Replace the stored objects with the registry's, in one transaction
    Status save(const Registry& registry);

    // Define every stored object in `registry`, in saved order. References
    // to paths that were never saved stay unresolved.
    Status load(Registry& registry);

    Result<int64_t> object_count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace scribe
