#pragma once

#include <string>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include "connection_registry.hpp"

namespace fs = std::filesystem;

struct LastTarget {
    std::string target;
    int64_t timestamp = 0;
};

// Most recently connected target: <cache_dir>/last_connected_target (YAML).
// When the file is missing or unreadable, the newest registry row stands in.
class LastTargetTracker {
public:
    LastTargetTracker(const fs::path& cache_dir, const ConnectionRegistry& registry);

    // Errors: InvalidTargetFormat (empty), CacheWriteFailed.
    Result<void> set(const std::string& target);

    // Errors: NoLastTarget.
    Result<LastTarget> get() const;

    const fs::path& path() const { return path_; }

private:
    fs::path dir_;
    fs::path path_;
    const ConnectionRegistry& registry_;
};
