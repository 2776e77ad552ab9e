#pragma once

#include <string>

// Unix-domain socket helpers for control socket bookkeeping.

namespace platform {

// True if `path` exists and is a socket file.
bool is_socket(const std::string& path);

// True if some process is listening on the unix socket at `path`
// (a connect() succeeds). A socket file left behind by a dead process
// refuses connections and is not in use.
bool socket_in_use(const std::string& path);

// Age in seconds since the file's last modification, or -1 if it cannot be read.
long long file_age_secs(const std::string& path);

} // namespace platform
