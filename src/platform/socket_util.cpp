#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno == EINTR) return 0;
#endif
    if (ret < 0) return -1;
    return (ret > 0) ? pfd.revents : 0;
}

// Try one resolved address. Returns the connected socket or an error string.
static Result<socket_t> connect_addr(const struct addrinfo* ai, int timeout_ms) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock == CELESTIAL_INVALID_SOCKET) {
        return Result<socket_t>::Err("Failed to create socket");
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = std::strerror(errno);
        close_socket(sock);
        return Result<socket_t>::Err("Failed to connect: " + err);
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents <= 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection timed out");
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return Result<socket_t>::Err("Connection failed: " + std::string(std::strerror(sock_err)));
        }
    }
    return Result<socket_t>::Ok(sock);
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}",
                                                 host, gai_strerror(rc)));
    }

    std::string last_error = "no usable address";
    for (const struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        auto attempt = connect_addr(ai, timeout_ms);
        if (attempt.is_ok()) {
            freeaddrinfo(res);
            return attempt;
        }
        last_error = attempt.error;
    }
    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("{}:{}: {}", host, port, last_error));
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

} // namespace platform
