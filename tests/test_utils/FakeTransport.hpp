#pragma once
#include "lab-instruments/Errors.hpp"
#include "lab-instruments/transport/Transport.hpp"

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace labinst {
namespace test {

/// In-memory transport for session tests. Sending a command with a
/// configured response queues that response for the next receive().
class FakeTransport : public transport::Transport {
public:
  void set_response(const std::string &command, const std::string &reply) {
    responses_[command] = reply;
  }

  /// Queue a reply that arrives without being asked for
  void push_reply(const std::string &reply) { pending_.push_back(reply); }
  /// Queue a reply that lands just after the next flush_input()
  void deliver_on_flush(const std::string &reply) { late_.push_back(reply); }

  void fail_next_send() { fail_next_send_ = true; }
  void fail_next_receive() { fail_next_receive_ = true; }
  void fail_connect() { fail_connect_ = true; }

  const std::vector<std::string> &sent() const { return sent_; }
  size_t flush_count() const { return flush_count_; }
  size_t close_count() const { return close_count_; }
  const Address &connected_to() const { return connected_to_; }

  void connect(const Address &address,
               std::chrono::milliseconds timeout) override {
    (void)timeout;
    if (fail_connect_) {
      throw ConnectionError("Connection refused");
    }
    connected_to_ = address;
    open_ = true;
  }

  void send(const std::string &command) override {
    if (!open_) {
      throw TransportError("Not connected");
    }
    if (fail_next_send_) {
      fail_next_send_ = false;
      throw TransportError("Broken pipe");
    }
    sent_.push_back(command);
    auto it = responses_.find(command);
    if (it != responses_.end()) {
      pending_.push_back(it->second);
    }
  }

  std::string receive(std::chrono::milliseconds timeout) override {
    if (!open_) {
      throw TransportError("Not connected");
    }
    if (fail_next_receive_) {
      fail_next_receive_ = false;
      throw TransportError("Connection reset by peer");
    }
    if (pending_.empty()) {
      throw TimeoutError("No reply within " + std::to_string(timeout.count()) +
                         " ms");
    }
    std::string reply = pending_.front();
    pending_.pop_front();
    return reply;
  }

  void flush_input() override {
    ++flush_count_;
    pending_.clear();
    pending_.insert(pending_.end(), late_.begin(), late_.end());
    late_.clear();
  }

  void close() override {
    ++close_count_;
    open_ = false;
  }

  bool is_open() const override { return open_; }
  std::string name() const override { return "fake"; }

private:
  std::map<std::string, std::string> responses_;
  std::deque<std::string> pending_;
  std::vector<std::string> late_;
  std::vector<std::string> sent_;
  Address connected_to_;
  bool open_{false};
  bool fail_next_send_{false};
  bool fail_next_receive_{false};
  bool fail_connect_{false};
  size_t flush_count_{0};
  size_t close_count_{0};
};

} // namespace test
} // namespace labinst
