#include "device_cache.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection_id.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <chrono>

DeviceTypeCache::DeviceTypeCache(const CacheSettings& settings)
    : dir_(settings.dir),
      expiry_secs_(settings.expiry_secs),
      max_size_(settings.max_size) {}

fs::path DeviceTypeCache::path_for(const std::string& target) const {
    return dir_ / (std::string(CACHE_FILE_PREFIX) + connection_id(target) + CACHE_FILE_SUFFIX);
}

std::string DeviceTypeCache::normalize_device_type(const std::string& raw) {
    std::string s = to_lower(raw);
    trim(s);
    if (s.empty() || s == "null") return "unknown";
    return s;
}

bool DeviceTypeCache::is_valid_device_type(const std::string& device_type) {
    if (device_type.empty() ||
        device_type.size() > static_cast<size_t>(DEVICE_TYPE_MAX_LEN)) {
        return false;
    }
    return std::all_of(device_type.begin(), device_type.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    });
}

std::optional<CacheEntry> read_cache_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) return std::nullopt;

        CacheEntry e;
        e.device_type = root["device_type"].as<std::string>("");
        e.method = root["method"].as<std::string>("");
        e.version = root["version"].as<std::string>("");
        e.target = root["target"].as<std::string>("");
        if (!root["timestamp"]) return std::nullopt;
        e.timestamp = root["timestamp"].as<int64_t>();

        if (e.device_type.empty() || e.version.empty()) return std::nullopt;
        return e;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

std::vector<fs::path> DeviceTypeCache::cache_files() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return files;

    const std::string prefix = CACHE_FILE_PREFIX;
    const std::string suffix = CACHE_FILE_SUFFIX;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.size() <= prefix.size() + suffix.size()) continue;
        if (name.rfind(prefix, 0) != 0) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        files.push_back(it->path());
    }
    return files;
}

Result<void> DeviceTypeCache::save(const std::string& target, const std::string& device_type,
                                   const std::string& method) {
    if (target.empty()) {
        return Result<void>::Err(ErrorKind::InvalidTargetFormat, "Empty target");
    }

    std::string type = normalize_device_type(device_type);
    if (!is_valid_device_type(type)) {
        return Result<void>::Err(ErrorKind::InvalidDeviceType,
                                 "Invalid device type: " + device_type);
    }

    fs::path path = path_for(target);
    if (!platform::ensure_private_dir(dir_)) {
        return Result<void>::Err(ErrorKind::CacheWriteFailed,
                                 "Cannot create cache directory " + dir_.string());
    }

    manage_size();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "device_type" << YAML::Value << type;
    out << YAML::Key << "timestamp" << YAML::Value << now_epoch();
    out << YAML::Key << "method" << YAML::Value << (method.empty() ? "manual" : method);
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << CACHE_VERSION;
    out << YAML::Key << "target" << YAML::Value << YAML::DoubleQuoted << target;
    out << YAML::EndMap;

    if (!platform::write_file_atomic(path, std::string(out.c_str()) + "\n")) {
        hostmux_log(fmt::format("cache: write failed {}", path.string()));
        return Result<void>::Err(ErrorKind::CacheWriteFailed,
                                 "Failed to write cache file " + path.string());
    }

    counters_.writes++;
    hostmux_log(fmt::format("cache: saved {} -> {} ({})", target, type, method));
    return Result<void>::Ok();
}

std::optional<CacheEntry> DeviceTypeCache::load(const std::string& target) {
    fs::path path = path_for(target);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        counters_.misses++;
        return std::nullopt;
    }

    auto entry = read_cache_file(path);
    if (!entry) {
        hostmux_log(fmt::format("cache: corrupt entry {}, deleting", path.string()));
        remove_quietly(path);
        counters_.misses++;
        return std::nullopt;
    }

    if (entry->version != CACHE_VERSION) {
        hostmux_log(fmt::format("cache: version {} != {}, deleting {}",
                                entry->version, CACHE_VERSION, path.string()));
        remove_quietly(path);
        counters_.misses++;
        return std::nullopt;
    }

    counters_.hits++;
    return entry;
}

bool DeviceTypeCache::is_expired(const std::string& target) {
    auto entry = load(target);
    if (!entry) return true;

    int64_t age = now_epoch() - entry->timestamp;
    return age > expiry_secs_;
}

Result<std::string> DeviceTypeCache::get_valid(const std::string& target) {
    auto entry = load(target);
    if (!entry) {
        return Result<std::string>::Err(ErrorKind::CacheMiss, "No cached device type for " + target);
    }
    if (now_epoch() - entry->timestamp > expiry_secs_) {
        return Result<std::string>::Err(ErrorKind::CacheMiss,
                                        "Cached device type expired for " + target);
    }
    return Result<std::string>::Ok(entry->device_type);
}

Result<void> DeviceTypeCache::clear(const std::string& target) {
    fs::path path = path_for(target);
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        return Result<void>::Err(ErrorKind::CacheMiss, "No cache entry for " + target);
    }
    hostmux_log(fmt::format("cache: cleared {}", target));
    return Result<void>::Ok();
}

std::vector<CacheListing> DeviceTypeCache::list_all() const {
    std::vector<CacheListing> out;
    int64_t now = now_epoch();

    for (const auto& file : cache_files()) {
        auto entry = read_cache_file(file);
        if (!entry || entry->target.empty()) continue;

        CacheListing l;
        l.target = entry->target;
        l.device_type = entry->device_type;
        l.method = entry->method;
        l.age_secs = now - entry->timestamp;
        l.expired = l.age_secs > expiry_secs_;
        out.push_back(l);
    }

    std::sort(out.begin(), out.end(),
              [](const CacheListing& a, const CacheListing& b) { return a.target < b.target; });
    return out;
}

CacheStats DeviceTypeCache::stats() const {
    CacheStats s;
    s.expiry_secs = expiry_secs_;
    s.cache_dir = dir_.string();
    int64_t now = now_epoch();

    for (const auto& file : cache_files()) {
        s.total++;
        auto entry = read_cache_file(file);
        if (!entry || entry->version != CACHE_VERSION) {
            s.invalid++;
        } else if (now - entry->timestamp > expiry_secs_) {
            s.expired++;
        } else {
            s.valid++;
        }
    }
    return s;
}

CacheCleanupReport DeviceTypeCache::cleanup_expired() {
    CacheCleanupReport report;
    int64_t now = now_epoch();

    for (const auto& file : cache_files()) {
        report.total++;
        auto entry = read_cache_file(file);
        bool doomed = !entry || entry->version != CACHE_VERSION ||
                      now - entry->timestamp > expiry_secs_;
        if (doomed) {
            remove_quietly(file);
            report.cleaned++;
        }
    }

    if (report.cleaned > 0) {
        hostmux_log(fmt::format("cache: cleaned {}/{} entries", report.cleaned, report.total));
    }
    return report;
}

int DeviceTypeCache::manage_size() {
    auto files = cache_files();
    int count = static_cast<int>(files.size());
    if (count <= max_size_) return 0;

    int to_delete = std::min(count, count - max_size_ + CACHE_EVICT_SLACK);
    hostmux_log(fmt::format("cache: {} entries exceed {}, deleting {} oldest",
                            count, max_size_, to_delete));

    std::vector<std::pair<fs::file_time_type, fs::path>> by_age;
    for (const auto& f : files) {
        std::error_code ec;
        auto mtime = fs::last_write_time(f, ec);
        if (ec) mtime = fs::file_time_type::min();
        by_age.emplace_back(mtime, f);
    }
    std::sort(by_age.begin(), by_age.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (int i = 0; i < to_delete; i++) {
        remove_quietly(by_age[i].second);
    }
    return to_delete;
}

int DeviceTypeCache::warm() const {
    int warmed = 0;
    auto cutoff = fs::file_time_type::clock::now() - std::chrono::seconds(CACHE_WARM_WINDOW_SECS);

    for (const auto& file : cache_files()) {
        if (warmed >= CACHE_WARM_MAX_FILES) break;
        std::error_code ec;
        auto mtime = fs::last_write_time(file, ec);
        if (ec || mtime < cutoff) continue;

        std::ifstream in(file, std::ios::binary);
        if (!in) continue;
        char buf[512];
        while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {}
        warmed++;
    }
    return warmed;
}
