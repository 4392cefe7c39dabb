#include "telnet_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#ifndef _WIN32
#  include <sys/socket.h>
#endif
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace {

constexpr unsigned char IAC  = 255;
constexpr unsigned char DONT = 254;
constexpr unsigned char DO   = 253;
constexpr unsigned char WONT = 252;
constexpr unsigned char WILL = 251;
constexpr unsigned char SB   = 250;
constexpr unsigned char SE   = 240;

#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

} // namespace

std::string TelnetFilter::feed(const std::string& raw, std::string& replies) {
    std::string text;
    text.reserve(raw.size());

    for (char ch : raw) {
        auto c = static_cast<unsigned char>(ch);
        switch (state_) {
            case State::Data:
                if (c == IAC) {
                    state_ = State::Iac;
                } else if (c != 0) {
                    text += ch;
                }
                break;
            case State::Iac:
                if (c == IAC) {
                    text += ch;
                    state_ = State::Data;
                } else if (c == WILL || c == WONT || c == DO || c == DONT) {
                    option_cmd_ = c;
                    state_ = State::Option;
                } else if (c == SB) {
                    state_ = State::Subneg;
                } else {
                    state_ = State::Data;
                }
                break;
            case State::Option:
                // Refuse everything: WILL -> DONT, DO -> WONT.
                if (option_cmd_ == WILL) {
                    replies += static_cast<char>(IAC);
                    replies += static_cast<char>(DONT);
                    replies += ch;
                } else if (option_cmd_ == DO) {
                    replies += static_cast<char>(IAC);
                    replies += static_cast<char>(WONT);
                    replies += ch;
                }
                state_ = State::Data;
                break;
            case State::Subneg:
                if (c == IAC) state_ = State::SubnegIac;
                break;
            case State::SubnegIac:
                state_ = (c == SE) ? State::Data : State::Subneg;
                break;
        }
    }
    return text;
}

TelnetChannel::TelnetChannel(socket_t sock) : sock_(sock) {}

TelnetChannel::~TelnetChannel() {
    close();
}

void TelnetChannel::close() {
    if (sock_ == CELESTIAL_INVALID_SOCKET) return;
    platform::close_socket(sock_);
    sock_ = CELESTIAL_INVALID_SOCKET;
    echo_log("TelnetChannel: closed");
}

Result<void> TelnetChannel::send(const std::string& text) {
    // A literal 0xFF in user text must be doubled on the wire.
    std::string bytes;
    bytes.reserve(text.size());
    for (char ch : text) {
        bytes += ch;
        if (static_cast<unsigned char>(ch) == IAC) bytes += ch;
    }
    return send_raw(bytes);
}

Result<void> TelnetChannel::send_raw(const std::string& bytes) {
    if (!is_open()) {
        return Result<void>::Err("Channel is closed");
    }

    size_t sent = 0;
    while (sent < bytes.size()) {
        auto n = ::send(sock_, bytes.data() + sent, bytes.size() - sent, SEND_FLAGS);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                if (platform::poll_socket(sock_, POLLOUT, CONNECT_TIMEOUT_SECS * 1000) <= 0) {
                    return Result<void>::Err("Send timed out");
                }
                continue;
            }
            return Result<void>::Err(fmt::format("Send failed: {}", std::strerror(errno)));
        }
        sent += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<std::string> TelnetChannel::read_available(std::chrono::milliseconds wait) {
    if (!is_open()) {
        return Result<std::string>::Err("Channel is closed");
    }

    int revents = platform::poll_socket(sock_, POLLIN, static_cast<int>(wait.count()));
    if (revents < 0) {
        return Result<std::string>::Err(fmt::format("Poll failed: {}", std::strerror(errno)));
    }
    if (revents == 0) {
        return Result<std::string>::Ok("");
    }

    char buf[TELNET_READ_BUF_SIZE];
    auto n = ::recv(sock_, buf, sizeof(buf), 0);
    if (n == 0) {
        return Result<std::string>::Err("Connection closed by remote host");
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return Result<std::string>::Ok("");
        }
        return Result<std::string>::Err(fmt::format("Read failed: {}", std::strerror(errno)));
    }

    std::string replies;
    std::string text = filter_.feed(std::string(buf, static_cast<size_t>(n)), replies);
    if (!replies.empty()) {
        auto r = send_raw(replies);
        if (r.is_err()) {
            return Result<std::string>::Err(r.error);
        }
    }
    return Result<std::string>::Ok(text);
}

Result<ChannelPtr> open_telnet_channel(const std::string& host, int port,
                                       std::chrono::seconds connect_timeout) {
    echo_log(fmt::format("TelnetChannel: connecting to {}:{}", host, port));
    auto sock = platform::connect_tcp(host, port,
        static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(connect_timeout).count()));
    if (sock.is_err()) {
        echo_log("TelnetChannel: " + sock.error);
        return Result<ChannelPtr>::Err(sock.error);
    }
    echo_log("TelnetChannel: connected");
    return Result<ChannelPtr>::Ok(std::make_unique<TelnetChannel>(sock.value));
}
