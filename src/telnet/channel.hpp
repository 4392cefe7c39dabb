#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include <core/types.hpp>

// Bidirectional text stream to the remote service. The session only ever
// talks to this interface so a scripted channel can stand in for the
// network in tests.
class Channel {
public:
    virtual ~Channel() = default;

    virtual Result<void> send(const std::string& text) = 0;

    // Wait at most `wait` for new text. Returns Ok("") when nothing arrived
    // in time and Err once the stream is closed or broken.
    virtual Result<std::string> read_available(std::chrono::milliseconds wait) = 0;

    // Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using ChannelPtr = std::unique_ptr<Channel>;

using ChannelOpener = std::function<Result<ChannelPtr>(
    const std::string& host, int port, std::chrono::seconds connect_timeout)>;

// Closes the channel on every exit path of the owning scope.
class ChannelGuard {
public:
    explicit ChannelGuard(Channel& channel) : channel_(channel) {}
    ~ChannelGuard() { channel_.close(); }

    ChannelGuard(const ChannelGuard&) = delete;
    ChannelGuard& operator=(const ChannelGuard&) = delete;

private:
    Channel& channel_;
};
