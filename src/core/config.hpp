#pragma once

#include <string>
#include <filesystem>
#include <chrono>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Per-session settings handed to HorizonsSession at construction.
struct SessionConfig {
    std::string host = HORIZONS_HOST;
    int port = HORIZONS_PORT;
    std::chrono::milliseconds step_timeout{STEP_TIMEOUT_SECS * 1000};
    std::chrono::seconds connect_timeout{CONNECT_TIMEOUT_SECS};
    bool verbose = false;
};

class Config {
public:
    // Load ~/.celestial_echo/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path. A missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const HorizonsConfig& horizons() const { return horizons_; }
    const QueryDefaults& query() const { return query_; }
    const LogConfig& log() const { return log_; }
    const StoreConfig& store() const { return store_; }

    SessionConfig session() const;

    Config();

private:
    HorizonsConfig horizons_;
    QueryDefaults query_;
    LogConfig log_;
    StoreConfig store_;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
fs::path get_default_store_path();

// Create default config
Result<void> create_default_config();
