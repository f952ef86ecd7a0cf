// POSIX TCP helpers shared by the SSH and Telnet transports.
#pragma once
#include "sshdeck/Errors.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace sshdeck {
namespace net {

// Resolves and connects with a deadline. Polls the abort flag so another thread can
// interrupt the attempt. Returns the connected (blocking) socket, or -1 with err set
// to DnsFailure, ConnectionRefused, Timeout or Cancelled.
int tcpConnect(const std::string& host, std::uint16_t port,
               std::chrono::milliseconds timeout,
               const std::atomic<bool>& aborted,
               Error& err);

// Enables TCP keepalive (idle 60s, interval 10s, 3 probes where supported).
void enableKeepalive(int fd);

// Waits for the socket to become readable/writable. Returns >0 when ready,
// 0 on timeout, <0 on error.
int waitFd(int fd, bool forRead, bool forWrite, int timeoutMs);

// Unblocks threads waiting on the socket without releasing the descriptor.
void shutdownFd(int fd);
void closeFd(int& fd);

} // namespace net
} // namespace sshdeck
