#include "PortProbe.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace {

// Resolves address to an IPv4 socket address; literals skip the resolver.
bool resolve(const std::string& address, uint16_t port, struct sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1) return true;

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(address.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out.sin_addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

} // namespace

bool is_valid_probe_address(const std::string& address) {
    if (address.empty() || address.size() > 253) return false;
    for (char c : address) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

int poll_timeout(std::chrono::steady_clock::time_point deadline, std::chrono::steady_clock::time_point now) {
    if (now >= deadline) return 0;
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
    return static_cast<int>(left.count());
}

bool probe_port(const std::string& address, uint16_t port, std::chrono::milliseconds timeout) {
    if (!is_valid_probe_address(address)) {
        throw std::invalid_argument("malformed probe address '" + address + "'");
    }
    if (port == 0) {
        throw std::invalid_argument("probe port must be between 1 and 65535");
    }

    struct sockaddr_in addr;
    if (!resolve(address, port, addr)) return false;

    int s = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (s < 0) return false;

    int res = connect(s, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (res == 0) {
        ::close(s);
        return true;
    }
    if (errno != EINPROGRESS) {
        ::close(s);
        return false;
    }

    struct pollfd pfd{};
    pfd.fd = s;
    pfd.events = POLLOUT;
    // an interrupted poll resumes with what is left of the timeout
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int ready;
    do {
        ready = poll(&pfd, 1, poll_timeout(deadline, std::chrono::steady_clock::now()));
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        ::close(s);
        return false;
    }

    // the handshake result is parked in SO_ERROR
    int soerr = 0;
    socklen_t len = sizeof(soerr);
    bool ok = getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len) == 0 && soerr == 0;
    ::close(s);
    return ok;
}
