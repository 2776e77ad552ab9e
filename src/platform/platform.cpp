#include "platform.hpp"
#include <cstdlib>
#include <random>
#include <atomic>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path self_exe() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return p;
}

fs::path temp_dir() {
    std::error_code ec;
    auto p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.rfind("~/", 0) == 0) return home_dir() / path.substr(2);
    return fs::path(path);
}

fs::path sibling_temp(const fs::path& dest) {
    // pid + per-process sequence + random: unique across threads and processes
    static std::atomic<unsigned> sequence{0};
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(10000, 99999);
    return dest.parent_path() /
           (dest.filename().string() + ".tmp." + std::to_string(getpid()) + "." +
            std::to_string(sequence.fetch_add(1)) + "." + std::to_string(dist(rng)));
}

bool write_file_atomic(const fs::path& dest, const std::string& content) {
    fs::path tmp = sibling_temp(dest);
    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, dest, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool ensure_private_dir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return true;
    fs::create_directories(dir, ec);
    if (ec) return false;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    return true;
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
