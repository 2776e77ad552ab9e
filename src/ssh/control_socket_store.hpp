#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

struct SocketFile {
    std::string connection_id;
    fs::path path;
};

// Directory of control sockets, one per target: <dir>/ssh-<connection_id>.
// A socket file may outlive its master process, so presence alone says
// nothing about liveness.
class ControlSocketStore {
public:
    explicit ControlSocketStore(const fs::path& dir);

    // Create the directory with owner-only permissions.
    bool ensure_dir() const;

    fs::path path_for(const std::string& target) const;
    fs::path path_for_id(const std::string& connection_id) const;

    // Socket file present (and actually a socket).
    bool exists(const std::string& target) const;

    // Remove the socket file. Missing file is not an error.
    void remove(const std::string& target) const;
    void remove_path(const fs::path& socket) const;

    // Every ssh-* socket file currently in the directory.
    std::vector<SocketFile> list() const;

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};
