#include <f1ts/transport.hpp>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace f1ts {

const char* to_string(SendStatus s) {
  switch (s) {
    case SendStatus::Sent:         return "sent";
    case SendStatus::Backpressure: return "backpressure";
    case SendStatus::Error:        return "error";
  }
  return "unknown";
}

namespace {

std::optional<sockaddr_in> parse_ipv4(const std::string& host, std::uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string h = host == "localhost" ? std::string("127.0.0.1") : host;
  if (::inet_pton(AF_INET, h.c_str(), &addr.sin_addr) != 1) return std::nullopt;
  return addr;
}

bool set_non_blocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

class UdpSink final : public DatagramSink {
public:
  UdpSink(int fd, sockaddr_in peer) : fd_(fd), peer_(peer) {}
  ~UdpSink() override { close(); }
  UdpSink(const UdpSink&) = delete;
  UdpSink& operator=(const UdpSink&) = delete;

  SendStatus send(std::span<const std::uint8_t> datagram) override {
    if (fd_ < 0) return SendStatus::Error;
    const ssize_t n = ::sendto(fd_, datagram.data(), datagram.size(), 0,
                               reinterpret_cast<const sockaddr*>(&peer_), sizeof(peer_));
    if (n == static_cast<ssize_t>(datagram.size())) return SendStatus::Sent;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS)) {
      return SendStatus::Backpressure;
    }
    if (n < 0) spdlog::error("udp send failed: {}", std::strerror(errno));
    return SendStatus::Error;
  }

  void close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool is_open() const override { return fd_ >= 0; }

private:
  int fd_{-1};
  sockaddr_in peer_{};
};

class UdpSource final : public DatagramSource {
public:
  UdpSource(int fd, std::uint16_t port) : fd_(fd), port_(port) {}
  ~UdpSource() override { close(); }
  UdpSource(const UdpSource&) = delete;
  UdpSource& operator=(const UdpSource&) = delete;

  bool receive(std::span<std::uint8_t> buf, std::size_t& out_len,
               std::chrono::milliseconds timeout) override {
    if (fd_ < 0) return false;
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0 || !(pfd.revents & POLLIN)) return false;

    const ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0, nullptr, nullptr);
    if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        spdlog::warn("udp receive failed: {}", std::strerror(errno));
      }
      return false;
    }
    out_len = static_cast<std::size_t>(n);
    return true;
  }

  void close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  std::uint16_t port() const override { return port_; }

private:
  int fd_{-1};
  std::uint16_t port_{0};
};

} // namespace

std::unique_ptr<DatagramSink> make_udp_sink(const std::string& host, std::uint16_t port) {
  const auto peer = parse_ipv4(host, port);
  if (!peer) {
    spdlog::error("invalid IPv4 destination '{}'", host);
    return nullptr;
  }
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    spdlog::error("cannot create UDP socket: {}", std::strerror(errno));
    return nullptr;
  }
  if (!set_non_blocking(fd)) {
    spdlog::error("cannot set O_NONBLOCK: {}", std::strerror(errno));
    ::close(fd);
    return nullptr;
  }
  spdlog::info("UDP transport ready, streaming to {}:{}", host, port);
  return std::make_unique<UdpSink>(fd, *peer);
}

std::unique_ptr<DatagramSource> make_udp_source(std::uint16_t port, const std::string& bind_host) {
  const auto addr = parse_ipv4(bind_host, port);
  if (!addr) {
    spdlog::error("invalid IPv4 bind address '{}'", bind_host);
    return nullptr;
  }
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    spdlog::error("cannot create UDP socket: {}", std::strerror(errno));
    return nullptr;
  }
  int reuse = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&*addr), sizeof(*addr)) < 0) {
    spdlog::error("cannot bind UDP {}:{}: {}", bind_host, port, std::strerror(errno));
    ::close(fd);
    return nullptr;
  }
  if (!set_non_blocking(fd)) {
    spdlog::warn("cannot set O_NONBLOCK on receive socket: {}", std::strerror(errno));
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  std::uint16_t actual = port;
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) actual = ntohs(bound.sin_port);
  return std::make_unique<UdpSource>(fd, actual);
}

} // namespace f1ts
