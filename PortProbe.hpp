#ifndef PORT_PROBE_HPP
#define PORT_PROBE_HPP

#include <chrono>
#include <cstdint>
#include <string>

// True iff a TCP handshake with address:port completes within timeout.
// Refused, unreachable, unresolvable and timed out all return false.
// Throws std::invalid_argument for a malformed address or port 0.
// timeout bounds the handshake only: a host name is resolved first with the
// system resolver, which has its own timeouts (resolv.conf). IPv4 literals
// never touch the resolver.
bool probe_port(const std::string& address, uint16_t port, std::chrono::milliseconds timeout);

// Milliseconds left until deadline as a poll() timeout: rounded up, never
// negative.
int poll_timeout(std::chrono::steady_clock::time_point deadline, std::chrono::steady_clock::time_point now);

// Syntax check applied by probe_port: letters, digits, '.', '-' and '_',
// 1 to 253 characters.
bool is_valid_probe_address(const std::string& address);

#endif // PORT_PROBE_HPP
