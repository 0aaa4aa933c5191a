#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace f1ts {

enum class SendStatus {
  Sent,
  Backpressure,  // EAGAIN / EWOULDBLOCK / ENOBUFS: the datagram was not queued
  Error,
};

const char* to_string(SendStatus s);

// Outbound datagram channel. Implementations never block in send().
class DatagramSink {
public:
  virtual ~DatagramSink() = default;

  virtual SendStatus send(std::span<const std::uint8_t> datagram) = 0;
  // Idempotent.
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

// Inbound datagram channel.
class DatagramSource {
public:
  virtual ~DatagramSource() = default;

  // Waits up to `timeout` for one datagram; writes its size into `out_len`.
  // Returns false on timeout or when closed.
  virtual bool receive(std::span<std::uint8_t> buf, std::size_t& out_len,
                       std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
  virtual std::uint16_t port() const = 0;
};

// IPv4 non-blocking UDP sender to host:port (dotted quad or "localhost").
// nullptr when the socket cannot be created or the address does not parse.
std::unique_ptr<DatagramSink> make_udp_sink(const std::string& host, std::uint16_t port);

// UDP receiver bound to `bind_host`:port. Port 0 picks an ephemeral port (see port()).
std::unique_ptr<DatagramSource> make_udp_source(std::uint16_t port,
                                                const std::string& bind_host = "0.0.0.0");

} // namespace f1ts
