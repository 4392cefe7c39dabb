#pragma once

// Cross-platform socket utilities.

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define CELESTIAL_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define CELESTIAL_INVALID_SOCKET (-1)
#endif

#include <string>
#include <core/types.hpp>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, 0 on timeout, -1 on error.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection, waiting at most
// timeout_ms for the handshake to complete.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
