#include "last_target.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

LastTargetTracker::LastTargetTracker(const fs::path& cache_dir, const ConnectionRegistry& registry)
    : dir_(cache_dir), path_(cache_dir / LAST_TARGET_FILE), registry_(registry) {}

Result<void> LastTargetTracker::set(const std::string& target) {
    if (target.empty()) {
        return Result<void>::Err(ErrorKind::InvalidTargetFormat, "Empty target");
    }
    if (!platform::ensure_private_dir(dir_)) {
        return Result<void>::Err(ErrorKind::CacheWriteFailed,
                                 "Cannot create cache directory " + dir_.string());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "target" << YAML::Value << YAML::DoubleQuoted << target;
    out << YAML::Key << "timestamp" << YAML::Value << now_epoch();
    out << YAML::EndMap;

    if (!platform::write_file_atomic(path_, std::string(out.c_str()) + "\n")) {
        return Result<void>::Err(ErrorKind::CacheWriteFailed,
                                 "Failed to write " + path_.string());
    }
    return Result<void>::Ok();
}

Result<LastTarget> LastTargetTracker::get() const {
    std::error_code ec;
    if (fs::is_regular_file(path_, ec)) {
        try {
            YAML::Node root = YAML::LoadFile(path_.string());
            LastTarget last;
            last.target = root["target"].as<std::string>("");
            last.timestamp = root["timestamp"].as<int64_t>(0);
            if (!last.target.empty()) return Result<LastTarget>::Ok(last);
        } catch (const YAML::Exception& e) {
            hostmux_log(fmt::format("last target: unreadable {}: {}", path_.string(), e.what()));
        }
    }

    // Fall back to the newest registration
    LastTarget newest;
    for (const auto& row : registry_.rows()) {
        if (row.target.empty()) continue;
        if (newest.target.empty() || row.registered_at > newest.timestamp) {
            newest.target = row.target;
            newest.timestamp = row.registered_at;
        }
    }
    if (!newest.target.empty()) return Result<LastTarget>::Ok(newest);

    return Result<LastTarget>::Err(ErrorKind::NoLastTarget, "No previous connection");
}
