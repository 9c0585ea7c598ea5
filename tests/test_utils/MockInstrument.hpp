#pragma once
#include "lab-instruments/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace labinst {
namespace test {

/// Loopback TCP server that speaks line-based SCPI for tests.
///
/// Every received line is recorded. A line with a configured response gets
/// it back followed by the terminator; several responses for one command
/// are returned in order, the last one repeating. "*OPC?" answers "1"
/// unless overridden. Unknown lines get no reply, like a real instrument
/// receiving a set command.
class MockInstrument {
public:
  explicit MockInstrument(std::string terminator = "\n");
  ~MockInstrument();

  MockInstrument(const MockInstrument &) = delete;
  MockInstrument &operator=(const MockInstrument &) = delete;

  /// Listen on 127.0.0.1 with an ephemeral port; returns the port
  uint16_t start();
  void stop();

  uint16_t port() const { return port_; }
  Address address() const { return Address{"127.0.0.1", port_}; }

  void set_response(const std::string &command, const std::string &response);
  void set_responses(const std::string &command,
                     const std::vector<std::string> &responses);
  void set_delay(const std::string &command, std::chrono::milliseconds delay);
  /// Swallow the command without replying, even if a response is set
  void set_silent(const std::string &command);
  /// Drop the connection when the command arrives
  void set_disconnect(const std::string &command);
  /// Lines sent as soon as a client connects
  void set_banner(const std::vector<std::string> &lines);
  /// Written without a terminator after the banner and after every line
  void set_prompt(const std::string &prompt);

  std::vector<std::string> get_command_history() const;
  /// Every byte received, terminators included
  std::string raw_received() const;
  size_t command_count() const;
  size_t connection_count() const;
  void clear_history();

  /// Block until at least `count` commands were received
  bool wait_for_commands(size_t count, std::chrono::milliseconds timeout);

private:
  void serve();
  void handle_client(int client_fd);
  void handle_line(int client_fd, const std::string &line, bool &keep_open);
  void write_line(int client_fd, const std::string &line);
  void write_raw(int client_fd, const std::string &data);

  std::string terminator_;
  uint16_t port_{0};
  int listen_fd_{-1};
  std::atomic<bool> running_{false};
  std::thread server_thread_;

  mutable std::mutex mutex_;
  std::condition_variable received_cv_;
  std::vector<std::string> command_history_;
  std::string raw_received_;
  size_t connection_count_{0};
  std::map<std::string, std::deque<std::string>> responses_;
  std::map<std::string, std::chrono::milliseconds> delays_;
  std::set<std::string> silent_;
  std::set<std::string> disconnect_;
  std::vector<std::string> banner_;
  std::string prompt_;
};

} // namespace test
} // namespace labinst
