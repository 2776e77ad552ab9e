#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct CacheEntry {
    std::string device_type;
    int64_t timestamp = 0;          // epoch seconds of detection
    std::string method;             // "ai", "rule", "manual", ...
    std::string version;            // cache format version
    std::string target;
};

struct CacheListing {
    std::string target;
    std::string device_type;
    std::string method;
    int64_t age_secs = 0;
    bool expired = false;
};

struct CacheStats {
    int total = 0;
    int valid = 0;
    int expired = 0;
    int invalid = 0;
    int64_t expiry_secs = 0;
    std::string cache_dir;
};

// Per-instance lookup counters.
struct CacheCounters {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t writes = 0;

    uint64_t total_requests() const { return hits + misses; }
    int hit_rate() const {
        return total_requests() == 0 ? 0 : static_cast<int>(hits * 100 / total_requests());
    }
};

struct CacheCleanupReport {
    int cleaned = 0;
    int total = 0;
};

// Device type per target, one YAML file per target:
// <dir>/device-<connection_id>.cache. Writes are atomic (temp + rename).
// Entries with a foreign format version or missing fields are deleted on
// sight and read as misses. Expired entries stay on disk until
// cleanup_expired() or the size cap removes them.
class DeviceTypeCache {
public:
    explicit DeviceTypeCache(const CacheSettings& settings);

    // Normalizes and validates `device_type`, trims the cache if it is over
    // capacity, then writes the entry stamped now.
    // Errors: InvalidTargetFormat (empty target), InvalidDeviceType, CacheWriteFailed.
    Result<void> save(const std::string& target, const std::string& device_type,
                      const std::string& method = "manual");

    // Parsed entry, or nullopt on miss. Corrupt or foreign-version files are deleted.
    std::optional<CacheEntry> load(const std::string& target);

    // True when there is no usable entry or it is older than the expiry.
    bool is_expired(const std::string& target);

    // Device type of a fresh entry; CacheMiss when the caller must re-detect.
    Result<std::string> get_valid(const std::string& target);

    // Delete the entry. CacheMiss if there was none.
    Result<void> clear(const std::string& target);

    // Structurally valid entries, with age and expiry state.
    std::vector<CacheListing> list_all() const;

    CacheStats stats() const;

    // Delete expired, empty and malformed entries.
    CacheCleanupReport cleanup_expired();

    // Delete the oldest files (by mtime) when over capacity, with slack so the
    // next writes do not trigger another pass. Returns files deleted.
    int manage_size();

    // Read recently modified entries to pull them into the OS page cache.
    // Returns files read; errors are ignored.
    int warm() const;

    const CacheCounters& counters() const { return counters_; }

    fs::path path_for(const std::string& target) const;
    const fs::path& dir() const { return dir_; }
    int64_t expiry_secs() const { return expiry_secs_; }

    // Lowercase, trimmed; "" and "null" become "unknown".
    static std::string normalize_device_type(const std::string& raw);
    // [a-z0-9._-]{1,50}
    static bool is_valid_device_type(const std::string& device_type);

private:
    fs::path dir_;
    int64_t expiry_secs_;
    int max_size_;
    CacheCounters counters_;

    std::vector<fs::path> cache_files() const;
};

// Parse one cache file. nullopt if unreadable, empty or missing a required
// field. Version is returned as stored, not checked.
std::optional<CacheEntry> read_cache_file(const fs::path& path);
