#include "control_socket_store.hpp"
#include "connection_id.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>

ControlSocketStore::ControlSocketStore(const fs::path& dir) : dir_(dir) {}

bool ControlSocketStore::ensure_dir() const {
    return platform::ensure_private_dir(dir_);
}

fs::path ControlSocketStore::path_for(const std::string& target) const {
    return path_for_id(connection_id(target));
}

fs::path ControlSocketStore::path_for_id(const std::string& id) const {
    return dir_ / (std::string(SOCKET_PREFIX) + id);
}

bool ControlSocketStore::exists(const std::string& target) const {
    return platform::is_socket(path_for(target).string());
}

void ControlSocketStore::remove(const std::string& target) const {
    remove_path(path_for(target));
}

void ControlSocketStore::remove_path(const fs::path& socket) const {
    std::error_code ec;
    fs::remove(socket, ec);
}

std::vector<SocketFile> ControlSocketStore::list() const {
    std::vector<SocketFile> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return out;

    const std::string prefix = SOCKET_PREFIX;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0) continue;
        if (!platform::is_socket(it->path().string())) continue;
        out.push_back({name.substr(prefix.size()), it->path()});
    }
    return out;
}
