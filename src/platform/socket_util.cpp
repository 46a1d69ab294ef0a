#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

#include <cerrno>
#include <cstring>

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

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        err = "Failed to resolve host: " + host;
        return BRICKDEV_INVALID_SOCKET;
    }

    socket_t sock = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (sock == BRICKDEV_INVALID_SOCKET) {
        freeaddrinfo(res);
        err = "Failed to create socket";
        return BRICKDEV_INVALID_SOCKET;
    }

    // libssh2 runs non-blocking on this socket
    set_nonblocking(sock);

    int ret = connect(sock, res->ai_addr, static_cast<int>(res->ai_addrlen));
    freeaddrinfo(res);

#ifdef _WIN32
    bool in_progress = (ret != 0 && WSAGetLastError() == WSAEWOULDBLOCK);
#else
    bool in_progress = (ret < 0 && errno == EINPROGRESS);
#endif
    if (ret != 0 && !in_progress) {
        err = "Failed to connect: " + std::string(strerror(errno));
        close_socket(sock);
        return BRICKDEV_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (in_progress) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            err = "Connection timed out: " + host;
            close_socket(sock);
            return BRICKDEV_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            err = "Connection failed: " + std::string(strerror(sock_err));
            close_socket(sock);
            return BRICKDEV_INVALID_SOCKET;
        }
    }

    // Keepalive so a brick that drops off Wi-Fi is noticed by the next probe
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE,
               reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));
    int nodelay = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY,
               reinterpret_cast<const char*>(&nodelay), sizeof(nodelay));

    return sock;
}

std::string resolve_ipv4(const std::string& host) {
    init_networking();

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
        return "";
    }

    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(res->ai_addr);
    const char* out = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    freeaddrinfo(res);
    return out ? std::string(buf) : std::string();
}

} // namespace platform
