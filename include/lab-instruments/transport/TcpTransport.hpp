#pragma once
#include "lab-instruments/transport/Transport.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace labinst {
namespace transport {

/// SCPI over a raw TCP socket (port 5025 on most LAN instruments)
class LAB_INSTRUMENTS_API TcpTransport : public Transport {
public:
  explicit TcpTransport(
      std::string terminator = "\n",
      std::chrono::milliseconds send_timeout = std::chrono::milliseconds(5000));
  ~TcpTransport() override;

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  void connect(const Address &address,
               std::chrono::milliseconds timeout) override;
  void send(const std::string &command) override;
  std::string receive(std::chrono::milliseconds timeout) override;
  void flush_input() override;
  void close() override;
  bool is_open() const override;
  std::string name() const override { return "lan"; }

  const std::string &terminator() const { return terminator_; }

private:
  int checked_fd(const char *operation) const;
  bool extract_line(std::string &line);

  std::string terminator_;
  std::chrono::milliseconds send_timeout_;
  std::string peer_; // host:port, for logs

  // close() may run on another thread: it takes fd_ first and shuts the
  // socket down to wake any poll(), then releases it under io_mutex_.
  std::atomic<int> fd_{-1};
  std::mutex io_mutex_;
  std::string rx_buffer_;
};

} // namespace transport
} // namespace labinst
