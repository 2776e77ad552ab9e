#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Defaults, then ~/.hostmux/config.yaml, then environment overrides.
    static Result<Config> load();

    // Load from an explicit YAML file (missing file = defaults), then environment.
    static Result<Config> load_from(const fs::path& path);

    // Built-in defaults only; no file or environment lookups.
    static Config defaults();

    const SshSettings& ssh() const { return ssh_; }
    const CacheSettings& cache() const { return cache_; }

    fs::path control_dir() const { return fs::path(ssh_.control_dir); }
    fs::path cache_dir() const { return fs::path(cache_.dir); }

public:
    Config() = default;

private:
    SshSettings ssh_;
    CacheSettings cache_;

    void apply_environment();
};

// Config file location: $HOSTMUX_CONFIG, else ~/.hostmux/config.yaml
fs::path get_config_path();
bool config_exists();

// Write a commented default config unless one already exists.
Result<void> create_default_config();
