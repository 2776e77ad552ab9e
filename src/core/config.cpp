#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_config_path() {
    const char* env = std::getenv("HOSTMUX_CONFIG");
    if (env && *env) return fs::path(env);
    return platform::home_dir() / ".hostmux" / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Config Config::defaults() {
    Config c;
    c.ssh_.control_dir = (platform::home_dir() / ".ssh" / "hostmux-sockets").string();
    c.ssh_.binary = "ssh";
    c.ssh_.timeout = SSH_DEFAULT_TIMEOUT_SECS;
    c.ssh_.connect_timeout = SSH_DEFAULT_CONNECT_TIMEOUT_SECS;
    c.ssh_.control_persist = SSH_DEFAULT_CONTROL_PERSIST_SECS;
    c.ssh_.max_connections = DEFAULT_MAX_CONNECTIONS;
    c.cache_.dir = (platform::home_dir() / ".cache" / "hostmux" / "devices").string();
    c.cache_.expiry_secs = DEFAULT_CACHE_EXPIRY_SECS;
    c.cache_.max_size = DEFAULT_CACHE_MAX_SIZE;
    return c;
}

// Positive integer from a YAML scalar; anything else keeps the fallback.
static int positive_int(const YAML::Node& node, int fallback) {
    if (!node || !node.IsScalar()) return fallback;
    int v = safe_stoi(node.as<std::string>(""), -1);
    return v > 0 ? v : fallback;
}

static int positive_env(const char* name, int fallback) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    int v = safe_stoi(env, -1);
    return v > 0 ? v : fallback;
}

static std::string string_env(const char* name, const std::string& fallback) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    return platform::expand_home(env).string();
}

void Config::apply_environment() {
    ssh_.control_dir = string_env("SSH_CONTROL_DIR", ssh_.control_dir);
    ssh_.timeout = positive_env("SSH_TIMEOUT", ssh_.timeout);
    ssh_.connect_timeout = positive_env("SSH_CONNECT_TIMEOUT", ssh_.connect_timeout);
    ssh_.control_persist = positive_env("SSH_CONTROL_PERSIST", ssh_.control_persist);
    ssh_.max_connections = positive_env("SSH_MAX_CONNECTIONS", ssh_.max_connections);
    ssh_.binary = string_env("HOSTMUX_SSH_BIN", ssh_.binary);

    cache_.dir = string_env("HOSTMUX_CACHE_DIR", cache_.dir);
    cache_.expiry_secs = positive_env("HOSTMUX_CACHE_EXPIRY",
                                      static_cast<int>(cache_.expiry_secs));
    cache_.max_size = positive_env("HOSTMUX_CACHE_MAX_SIZE", cache_.max_size);
}

Result<Config> Config::load_from(const fs::path& path) {
    Config config = defaults();

    if (fs::exists(path)) {
        try {
            YAML::Node root = YAML::LoadFile(path.string());

            if (root["ssh"] && root["ssh"].IsMap()) {
                const auto& n = root["ssh"];
                if (n["control_dir"] && n["control_dir"].IsScalar()) {
                    config.ssh_.control_dir =
                        platform::expand_home(n["control_dir"].as<std::string>()).string();
                }
                if (n["binary"] && n["binary"].IsScalar()) {
                    config.ssh_.binary = n["binary"].as<std::string>();
                }
                config.ssh_.timeout = positive_int(n["timeout"], config.ssh_.timeout);
                config.ssh_.connect_timeout =
                    positive_int(n["connect_timeout"], config.ssh_.connect_timeout);
                config.ssh_.control_persist =
                    positive_int(n["control_persist"], config.ssh_.control_persist);
                config.ssh_.max_connections =
                    positive_int(n["max_connections"], config.ssh_.max_connections);
            }

            if (root["cache"] && root["cache"].IsMap()) {
                const auto& n = root["cache"];
                if (n["dir"] && n["dir"].IsScalar()) {
                    config.cache_.dir =
                        platform::expand_home(n["dir"].as<std::string>()).string();
                }
                config.cache_.expiry_secs =
                    positive_int(n["expiry"], static_cast<int>(config.cache_.expiry_secs));
                config.cache_.max_size = positive_int(n["max_size"], config.cache_.max_size);
            }
        } catch (const YAML::Exception& e) {
            return Result<Config>::Err(ErrorKind::ConfigError,
                                       "Failed to parse " + path.string() + ": " + e.what());
        }
    }

    config.apply_environment();
    return Result<Config>::Ok(config);
}

Result<Config> Config::load() {
    return load_from(get_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "Failed to create " + config_path.parent_path().string());
    }

    const char* default_config = R"(# hostmux configuration
# Environment variables of the same meaning override these values.

ssh:
  control_dir: "~/.ssh/hostmux-sockets"   # SSH_CONTROL_DIR
  binary: "ssh"                          # HOSTMUX_SSH_BIN
  timeout: 10                            # SSH_TIMEOUT, health checks and commands
  connect_timeout: 30                    # SSH_CONNECT_TIMEOUT, master connect
  control_persist: 600                   # SSH_CONTROL_PERSIST
  max_connections: 10                    # SSH_MAX_CONNECTIONS

cache:
  dir: "~/.cache/hostmux/devices"        # HOSTMUX_CACHE_DIR
  expiry: 86400                          # HOSTMUX_CACHE_EXPIRY (seconds)
  max_size: 1000                         # HOSTMUX_CACHE_MAX_SIZE (entries)
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}
