#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <sys/types.h>
#  include <netdb.h>
#  include <arpa/inet.h>
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
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

std::optional<std::string> resolve_host_ip(const std::string& host) {
    init_networking();
    for (int family : {AF_INET, AF_INET6}) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = family;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) continue;

        char buf[INET6_ADDRSTRLEN] = {0};
        int rc = getnameinfo(res->ai_addr, static_cast<socklen_t>(res->ai_addrlen),
                             buf, sizeof(buf), nullptr, 0, NI_NUMERICHOST);
        freeaddrinfo(res);
        if (rc == 0) return std::string(buf);
    }
    return std::nullopt;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0 || !res) {
        return Result<socket_t>::Err("Failed to resolve host: " + host,
                                     ErrorKind::PortUnreachable);
    }

    std::string last_error = "no usable address";
    bool timed_out = false;

    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == FLEETSH_INVALID_SOCKET) continue;

        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                timed_out = true;
                last_error = "connection timed out";
                close_socket(sock);
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                close_socket(sock);
                continue;
            }
        }

        freeaddrinfo(res);
        return Result<socket_t>::Ok(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(
        fmt::format("Cannot connect to {}:{}: {}", host, port, last_error),
        timed_out ? ErrorKind::Timeout : ErrorKind::PortUnreachable);
}

bool port_open(const std::string& host, int port, int timeout_ms) {
    auto r = connect_tcp(host, port, timeout_ms);
    if (r.is_err()) return false;
    close_socket(r.value);
    return true;
}

} // namespace platform
