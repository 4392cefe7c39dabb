#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".celestial_echo";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

fs::path get_default_store_path() {
    return get_config_dir() / "events.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# celestial_echo configuration

horizons:
  host: "horizons.jpl.nasa.gov"
  port: 6775
  step_timeout: 30                 # seconds to wait for each prompt
  connect_timeout: 30

query:
  step_size: "7d"
  quantity_code: "21"              # one-way light time

log:
  verbose: false                   # echo the remote transcript to stderr

store:
  path: "~/.celestial_echo/events.yaml"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to write config: ") + e.what());
    }
}

static HorizonsConfig parse_horizons_config(const YAML::Node& node) {
    HorizonsConfig h;
    h.host = node["host"].as<std::string>(HORIZONS_HOST);
    h.port = node["port"].as<int>(HORIZONS_PORT);
    h.step_timeout = node["step_timeout"].as<int>(STEP_TIMEOUT_SECS);
    h.connect_timeout = node["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
    return h;
}

static QueryDefaults parse_query_defaults(const YAML::Node& node) {
    QueryDefaults q;
    q.step_size = node["step_size"].as<std::string>(DEFAULT_STEP_SIZE);
    q.quantity_code = node["quantity_code"].as<std::string>(DEFAULT_QUANTITY_CODE);
    return q;
}

Config::Config()
    : horizons_(parse_horizons_config(YAML::Node())),
      query_(parse_query_defaults(YAML::Node())) {
    store_.path = get_default_store_path().string();
}

SessionConfig Config::session() const {
    SessionConfig s;
    s.host = horizons_.host;
    s.port = horizons_.port;
    s.step_timeout = std::chrono::seconds(horizons_.step_timeout);
    s.connect_timeout = std::chrono::seconds(horizons_.connect_timeout);
    s.verbose = log_.verbose;
    return s;
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.horizons_ = parse_horizons_config(root["horizons"] ? root["horizons"] : YAML::Node());
        config.query_ = parse_query_defaults(root["query"] ? root["query"] : YAML::Node());

        if (root["log"]) {
            config.log_.verbose = root["log"]["verbose"].as<bool>(false);
        }
        if (root["store"] && root["store"]["path"]) {
            config.store_.path = platform::expand_home(
                root["store"]["path"].as<std::string>()).string();
        }

        if (config.horizons_.port <= 0 || config.horizons_.port > 65535) {
            return Result<Config>::Err("Invalid horizons.port in " + path.string());
        }
        if (config.horizons_.step_timeout <= 0) {
            return Result<Config>::Err("horizons.step_timeout must be positive");
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}
