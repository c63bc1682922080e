#include "probes/icmp_prober.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace linkwatch::probes {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::string ErrnoMessage(const int error_number) {
  return std::generic_category().message(error_number);
}

class ScopedFd {
public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    Reset();
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  ScopedFd& operator=(ScopedFd&& other) noexcept {
    if (this != &other) {
      Reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  int get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct IcmpSocket {
  ScopedFd fd;
  // Raw sockets deliver the IP header and every ICMP packet on the host.
  bool raw = false;
};

bool OpenIcmpSocket(IcmpSocket& sock, std::string& error) {
  const int dgram_fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
  if (dgram_fd >= 0) {
    sock.fd.Reset(dgram_fd);
    sock.raw = false;
    return true;
  }
  const int dgram_errno = errno;

  const int raw_fd = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
  if (raw_fd >= 0) {
    sock.fd.Reset(raw_fd);
    sock.raw = true;
    return true;
  }
  const int raw_errno = errno;

  error = "cannot open ICMP socket (datagram: " + ErrnoMessage(dgram_errno) +
          ", raw: " + ErrnoMessage(raw_errno) +
          "); allow the group in net.ipv4.ping_group_range or grant CAP_NET_RAW";
  return false;
}

bool ResolveIpv4(const std::string& host, sockaddr_in& address, std::string& error) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo* raw_result = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw_result);
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> result(raw_result, &::freeaddrinfo);
  if (rc != 0) {
    error = "cannot resolve '" + host + "': " + ::gai_strerror(rc);
    return false;
  }
  if (result == nullptr || result->ai_addr == nullptr ||
      result->ai_addrlen < static_cast<socklen_t>(sizeof(sockaddr_in))) {
    error = "cannot resolve '" + host + "': no IPv4 address";
    return false;
  }

  std::memcpy(&address, result->ai_addr, sizeof(sockaddr_in));
  return true;
}

std::string FormatAddress(const sockaddr_in& address) {
  char text[INET_ADDRSTRLEN] = {};
  if (::inet_ntop(AF_INET, &address.sin_addr, text, sizeof(text)) == nullptr) {
    return "?";
  }
  return text;
}

std::vector<std::uint8_t> BuildEchoRequest(const std::uint16_t identifier,
                                           const std::uint16_t sequence,
                                           const std::size_t payload_bytes) {
  std::vector<std::uint8_t> packet(sizeof(icmphdr) + payload_bytes);
  for (std::size_t i = 0; i < payload_bytes; ++i) {
    packet[sizeof(icmphdr) + i] = static_cast<std::uint8_t>(i & 0xFFU);
  }

  icmphdr header{};
  header.type = ICMP_ECHO;
  header.code = 0;
  header.un.echo.id = htons(identifier);
  header.un.echo.sequence = htons(sequence);
  header.checksum = 0;
  std::memcpy(packet.data(), &header, sizeof(header));

  header.checksum = InternetChecksum(packet.data(), packet.size());
  std::memcpy(packet.data(), &header, sizeof(header));
  return packet;
}

enum class WaitResult {
  kReply,
  kTimeout,
  kError,
};

WaitResult WaitForEchoReply(const IcmpSocket& sock, const std::uint16_t identifier,
                            const std::uint16_t sequence, const SteadyClock::time_point deadline,
                            std::string& error) {
  std::uint8_t buffer[2048];
  while (true) {
    const auto now = SteadyClock::now();
    if (now >= deadline) {
      return WaitResult::kTimeout;
    }
    const auto remaining =
        std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();

    pollfd pfd{};
    pfd.fd = sock.fd.get();
    pfd.events = POLLIN;
    const int ready = ::poll(
        &pfd, 1,
        static_cast<int>(std::min<std::int64_t>(remaining, std::numeric_limits<int>::max())));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "poll failed: " + ErrnoMessage(errno);
      return WaitResult::kError;
    }
    if (ready == 0) {
      return WaitResult::kTimeout;
    }

    const ssize_t received = ::recv(sock.fd.get(), buffer, sizeof(buffer), 0);
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      error = "recv failed: " + ErrnoMessage(errno);
      return WaitResult::kError;
    }

    std::size_t offset = 0;
    if (sock.raw) {
      if (static_cast<std::size_t>(received) < sizeof(iphdr)) {
        continue;
      }
      iphdr ip_header{};
      std::memcpy(&ip_header, buffer, sizeof(ip_header));
      offset = static_cast<std::size_t>(ip_header.ihl) * 4U;
    }
    if (static_cast<std::size_t>(received) < offset + sizeof(icmphdr)) {
      continue;
    }

    icmphdr reply{};
    std::memcpy(&reply, buffer + offset, sizeof(reply));
    if (reply.type != ICMP_ECHOREPLY || ntohs(reply.un.echo.sequence) != sequence) {
      continue;
    }
    // The kernel rewrites the id on datagram sockets, so only raw replies
    // can be matched on it.
    if (sock.raw && ntohs(reply.un.echo.id) != identifier) {
      continue;
    }
    return WaitResult::kReply;
  }
}

} // namespace

std::uint16_t InternetChecksum(const void* data, const std::size_t length) {
  const auto* bytes = static_cast<const std::uint8_t*>(data);
  std::uint32_t sum = 0;
  std::size_t i = 0;
  for (; i + 1 < length; i += 2) {
    std::uint16_t word = 0;
    std::memcpy(&word, bytes + i, sizeof(word));
    sum += word;
  }
  if (i < length) {
    std::uint16_t word = 0;
    std::memcpy(&word, bytes + i, 1);
    sum += word;
  }
  while ((sum >> 16U) != 0U) {
    sum = (sum & 0xFFFFU) + (sum >> 16U);
  }
  return static_cast<std::uint16_t>(~sum);
}

IcmpProber::IcmpProber(IcmpProberOptions options)
    : options_(std::move(options)),
      identifier_(static_cast<std::uint16_t>(::getpid() & 0xFFFF)) {}

bool IcmpProber::CheckSocketPermission(std::string& error) {
  IcmpSocket sock;
  return OpenIcmpSocket(sock, error);
}

health::ProbeOutcome IcmpProber::Probe(const ProbeRequest& request) {
  sockaddr_in address{};
  std::string error;
  if (!ResolveIpv4(options_.target, address, error)) {
    return health::ProbeOutcome::Failure(request.fired_at, health::FailureKind::kUnresolvable,
                                         error);
  }

  IcmpSocket sock;
  if (!OpenIcmpSocket(sock, error)) {
    return health::ProbeOutcome::Failure(request.fired_at, health::FailureKind::kOther, error);
  }

  const auto deadline = SteadyClock::now() + options_.timeout;
  std::optional<std::chrono::microseconds> best_rtt;
  std::string last_error;

  for (std::uint32_t attempt = 0; attempt < options_.count && SteadyClock::now() < deadline;
       ++attempt) {
    const std::uint16_t sequence = next_sequence_.fetch_add(1);
    const auto packet = BuildEchoRequest(identifier_, sequence, options_.payload_bytes);

    const auto sent_at = SteadyClock::now();
    const ssize_t sent = ::sendto(sock.fd.get(), packet.data(), packet.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    if (sent < 0) {
      last_error = "sendto " + FormatAddress(address) + " failed: " + ErrnoMessage(errno);
      continue;
    }

    std::string wait_error;
    switch (WaitForEchoReply(sock, identifier_, sequence, deadline, wait_error)) {
    case WaitResult::kReply: {
      const auto rtt =
          std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - sent_at);
      best_rtt = best_rtt.has_value() ? std::min(best_rtt.value(), rtt) : rtt;
      break;
    }
    case WaitResult::kTimeout:
      break;
    case WaitResult::kError:
      last_error = std::move(wait_error);
      break;
    }
  }

  if (best_rtt.has_value()) {
    return health::ProbeOutcome::Success(request.fired_at, best_rtt.value());
  }
  if (!last_error.empty()) {
    return health::ProbeOutcome::Failure(request.fired_at, health::FailureKind::kOther,
                                         last_error);
  }
  return health::ProbeOutcome::Failure(
      request.fired_at, health::FailureKind::kTimeout,
      "no echo reply from " + FormatAddress(address) + " within " +
          std::to_string(options_.timeout.count()) + " ms");
}

} // namespace linkwatch::probes
