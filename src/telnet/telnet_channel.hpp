#pragma once

#include <string>
#include <platform/socket_util.hpp>
#include "channel.hpp"

// Strips telnet IAC sequences out of the byte stream and refuses every
// option the server offers or requests, leaving plain NVT text.
class TelnetFilter {
public:
    // Returns the text portion of `raw`. Negotiation answers that must go
    // back to the server are appended to `replies`.
    std::string feed(const std::string& raw, std::string& replies);

private:
    enum class State { Data, Iac, Option, Subneg, SubnegIac };
    State state_ = State::Data;
    unsigned char option_cmd_ = 0;
};

class TelnetChannel : public Channel {
public:
    explicit TelnetChannel(socket_t sock);
    ~TelnetChannel() override;

    TelnetChannel(const TelnetChannel&) = delete;
    TelnetChannel& operator=(const TelnetChannel&) = delete;

    Result<void> send(const std::string& text) override;
    Result<std::string> read_available(std::chrono::milliseconds wait) override;
    void close() override;
    bool is_open() const override { return sock_ != CELESTIAL_INVALID_SOCKET; }

private:
    socket_t sock_;
    TelnetFilter filter_;

    Result<void> send_raw(const std::string& bytes);
};

// Default ChannelOpener: resolve, connect and wrap the socket.
Result<ChannelPtr> open_telnet_channel(const std::string& host, int port,
                                       std::chrono::seconds connect_timeout);
