#include "connection_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/connection_id.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <set>

ConnectionRegistry::ConnectionRegistry(const fs::path& dir)
    : dir_(dir),
      registry_path_(dir / REGISTRY_FILE),
      lock_path_(dir / REGISTRY_LOCK_FILE) {}

std::vector<RegistryRow> ConnectionRegistry::read_rows() const {
    std::vector<RegistryRow> rows;

    std::error_code ec;
    if (!fs::exists(registry_path_, ec)) {
        return rows;
    }

    try {
        YAML::Node root = YAML::LoadFile(registry_path_.string());

        if (root["connections"] && root["connections"].IsSequence()) {
            for (const auto& n : root["connections"]) {
                RegistryRow r;
                r.connection_id = n["id"].as<std::string>("");
                r.target = n["target"].as<std::string>("");
                r.registered_at = n["registered_at"].as<int64_t>(0);
                if (r.connection_id.empty() || r.target.empty()) continue;
                rows.push_back(r);
            }
        }
    } catch (const std::exception& e) {
        // Corrupt registry reads as empty; the next write replaces it
        hostmux_log(fmt::format("registry: unreadable {}: {}", registry_path_.string(), e.what()));
        return {};
    }

    return rows;
}

Result<void> ConnectionRegistry::write_rows(const std::vector<RegistryRow>& rows) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "connections" << YAML::Value << YAML::BeginSeq;

    for (const auto& r : rows) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << r.connection_id;
        out << YAML::Key << "target" << YAML::Value << YAML::DoubleQuoted << r.target;
        out << YAML::Key << "registered_at" << YAML::Value << r.registered_at;
        out << YAML::EndMap;
    }

    out << YAML::EndSeq;
    out << YAML::EndMap;

    if (!platform::write_file_atomic(registry_path_, std::string(out.c_str()) + "\n")) {
        return Result<void>::Err(ErrorKind::RegistryIOError,
                                 "Failed to write registry " + registry_path_.string());
    }
    return Result<void>::Ok();
}

Result<void> ConnectionRegistry::register_connection(const std::string& target) {
    return register_at(target, now_epoch());
}

Result<void> ConnectionRegistry::register_at(const std::string& target, int64_t registered_at) {
    if (!platform::ensure_private_dir(dir_)) {
        return Result<void>::Err(ErrorKind::RegistryIOError,
                                 "Cannot create " + dir_.string());
    }

    FileLock lock(lock_path_.string());
    if (!lock.held()) {
        return Result<void>::Err(ErrorKind::RegistryIOError,
                                 "Cannot lock " + lock_path_.string());
    }

    std::string id = connection_id(target);
    auto rows = read_rows();
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&](const RegistryRow& r) { return r.connection_id == id; }),
               rows.end());
    rows.push_back({id, target, registered_at});

    auto result = write_rows(rows);
    if (result.is_ok()) {
        hostmux_log(fmt::format("registry: registered {} -> {}", target, id));
    }
    return result;
}

Result<void> ConnectionRegistry::unregister(const std::string& target) {
    auto removed = remove_ids({connection_id(target)});
    if (removed.is_err()) return Result<void>::Err(removed.kind, removed.error);
    if (removed.value > 0) {
        hostmux_log(fmt::format("registry: unregistered {}", target));
    }
    return Result<void>::Ok();
}

std::optional<std::string> ConnectionRegistry::lookup_target(const std::string& id) const {
    for (const auto& r : read_rows()) {
        if (r.connection_id == id) return r.target;
    }
    return std::nullopt;
}

std::optional<int64_t> ConnectionRegistry::lookup_registered_at(const std::string& id) const {
    for (const auto& r : read_rows()) {
        if (r.connection_id == id) return r.registered_at;
    }
    return std::nullopt;
}

std::vector<RegistryRow> ConnectionRegistry::rows() const {
    return read_rows();
}

Result<size_t> ConnectionRegistry::remove_ids(const std::vector<std::string>& connection_ids) {
    std::set<std::string> doomed(connection_ids.begin(), connection_ids.end());
    return retain_if([&](const RegistryRow& r) { return doomed.count(r.connection_id) == 0; });
}

Result<size_t> ConnectionRegistry::retain_if(const std::function<bool(const RegistryRow&)>& keep) {
    std::error_code ec;
    if (!fs::exists(registry_path_, ec)) {
        return Result<size_t>::Ok(0);
    }

    FileLock lock(lock_path_.string());
    if (!lock.held()) {
        return Result<size_t>::Err(ErrorKind::RegistryIOError,
                                   "Cannot lock " + lock_path_.string());
    }

    auto rows = read_rows();
    size_t before = rows.size();
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&](const RegistryRow& r) { return !keep(r); }),
               rows.end());
    size_t dropped = before - rows.size();
    if (dropped == 0) return Result<size_t>::Ok(0);

    auto result = write_rows(rows);
    if (result.is_err()) return Result<size_t>::Err(result.kind, result.error);
    return Result<size_t>::Ok(dropped);
}
