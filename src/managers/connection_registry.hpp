#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct RegistryRow {
    std::string connection_id;
    std::string target;
    int64_t registered_at = 0;      // epoch seconds
};

// Durable table of tracked connections: <dir>/connection_registry (YAML).
// At most one row per connection id. Every read-modify-write holds an
// exclusive flock on <dir>/connection_registry.lock, so concurrent processes
// cannot lose each other's updates. Readers rely on the atomic rename and
// take no lock.
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(const fs::path& dir);

    // Replace any row for the target's id with a fresh one stamped now.
    Result<void> register_connection(const std::string& target);
    Result<void> register_at(const std::string& target, int64_t registered_at);

    // Remove the target's row. No-op if absent.
    Result<void> unregister(const std::string& target);

    std::optional<std::string> lookup_target(const std::string& connection_id) const;
    std::optional<int64_t> lookup_registered_at(const std::string& connection_id) const;

    // All rows in file order. A corrupt file reads as empty.
    std::vector<RegistryRow> rows() const;
    size_t size() const { return rows().size(); }

    // Bulk removal; returns how many rows were dropped.
    Result<size_t> remove_ids(const std::vector<std::string>& connection_ids);

    // Rewrite keeping only rows for which `keep` is true; returns rows dropped.
    Result<size_t> retain_if(const std::function<bool(const RegistryRow&)>& keep);

    const fs::path& path() const { return registry_path_; }

private:
    fs::path dir_;
    fs::path registry_path_;
    fs::path lock_path_;

    std::vector<RegistryRow> read_rows() const;
    Result<void> write_rows(const std::vector<RegistryRow>& rows) const;
};
