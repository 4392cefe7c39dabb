#pragma once

#include <string>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct HorizonsConfig {
    std::string host;
    int port = 6775;
    int step_timeout = 30;          // seconds, applied to every phase independently
    int connect_timeout = 30;       // seconds
};

struct QueryDefaults {
    std::string step_size = "7d";
    std::string quantity_code = "21";   // one-way light time
};

struct LogConfig {
    bool verbose = false;           // mirror the remote transcript to stderr
};

struct StoreConfig {
    std::string path;               // events.yaml location
};
