#pragma once
#include "lab-instruments/config/CapabilityTable.hpp"
#include "lab-instruments/export.h"
#include "lab-instruments/scpi/CommandFormatter.hpp"
#include "lab-instruments/scpi/ReplyParser.hpp"
#include "lab-instruments/transport/Transport.hpp"
#include "lab-instruments/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace labinst {

enum class SessionState { Disconnected, Connected, Busy, Closed };

LAB_INSTRUMENTS_API std::string to_string(SessionState state);

/// One connected instrument, driven through its capability table.
///
/// Lifecycle: Disconnected -> Connected -> (Busy while a query reply is
/// pending) -> Connected -> Closed. A closed session cannot be reopened;
/// create a new one instead.
///
/// After a TimeoutError the next command first resynchronises with the
/// instrument so a late reply is never taken for a new answer.
///
/// Not thread-safe, except that close() may be called from another thread
/// to abort a blocked query.
class LAB_INSTRUMENTS_API Session {
public:
  /// Open a TCP session. Port and terminator defaults come from the table.
  static std::unique_ptr<Session>
  connect(const Address &address, std::shared_ptr<const CapabilityTable> table,
          const Timeouts &timeouts);

  /// Same, with the table's default timeouts
  static std::unique_ptr<Session>
  connect(const Address &address,
          std::shared_ptr<const CapabilityTable> table);

  /// Wrap an unopened transport; call open() before use.
  /// Throws ArgumentError for timeouts outside 1..INT_MAX ms.
  Session(std::unique_ptr<transport::Transport> transport,
          std::shared_ptr<const CapabilityTable> table, Address address,
          Timeouts timeouts);
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// Connect the transport and discard any greeting banner
  void open();

  /// Idempotent; safe from failure paths and from other threads
  void close();

  SessionState state() const { return state_.load(); }
  bool is_open() const;
  const Address &address() const { return address_; }
  const Timeouts &timeouts() const { return timeouts_; }
  const CapabilityTable &table() const { return *table_; }

  // Raw command exchange. send() of a query enters Busy; receive() leaves
  // it. Anything else while Busy is a ProtocolError.
  void send(const scpi::Command &command);
  std::string receive();
  std::string query(const scpi::Command &command);
  void write(const std::string &command);
  std::string query(const std::string &command);

  // Capability-table driven operations
  bool has_operation(const std::string &op) const;
  void set(const std::string &op, double magnitude, const std::string &unit,
           std::optional<int> channel = std::nullopt);
  void set_token(const std::string &op, const std::string &token,
                 std::optional<int> channel = std::nullopt);
  double get(const std::string &op, const std::string &unit = "",
             std::optional<int> channel = std::nullopt);
  std::string get_text(const std::string &op,
                       std::optional<int> channel = std::nullopt);
  bool get_state(const std::string &op,
                 std::optional<int> channel = std::nullopt);
  std::vector<double> get_list(const std::string &op,
                               std::optional<int> channel = std::nullopt);
  void action(const std::string &op,
              std::optional<int> channel = std::nullopt);

  // Signal generators
  void set_frequency(double magnitude, const std::string &unit = "GHz");
  double get_frequency(const std::string &unit = "GHz");
  void set_power(double magnitude, const std::string &unit = "dBm");
  double get_power(const std::string &unit = "dBm");

  // Power supplies
  void set_voltage(double magnitude, const std::string &unit = "V");
  void set_voltage_limit(double magnitude, const std::string &unit = "V");
  void set_current(double magnitude, const std::string &unit = "A");
  void set_current_limit(double magnitude, const std::string &unit = "A");
  void output_on();
  void output_off();

  // Meters
  double measure_dc_voltage(const std::string &unit = "V");
  double measure_voltage(const std::string &unit = "V");
  double measure_current(const std::string &unit = "A");

  // IEEE 488.2 common commands
  void reset();
  std::string get_id();
  scpi::Identity identity();
  void wait_for_completion();

  /// Pop one entry from the instrument error queue
  scpi::ErrorQueueEntry next_error();

  /// Pop entries until "0, No error" (at most max_entries)
  std::vector<scpi::ErrorQueueEntry> drain_errors(size_t max_entries = 32);

  /// Throws DeviceError for the first queued error, if any
  void check_errors();

private:
  const Operation &lookup(const std::string &op, OperationKind kind) const;
  const Operation &lookup_query(const std::string &op,
                                ReturnType returns) const;
  void ensure_ready(const char *operation) const;
  void run_setup(const Operation &op, std::optional<int> channel);
  scpi::Command query_command(const Operation &op,
                              std::optional<int> channel) const;
  scpi::NumberStyle number_style(const Operation &op) const;
  double reply_to_base(const Operation &op, const std::string &reply) const;
  void fail_transport();
  std::string read_line(std::chrono::milliseconds timeout);
  void resynchronise();

  std::unique_ptr<transport::Transport> transport_;
  std::shared_ptr<const CapabilityTable> table_;
  Address address_;
  Timeouts timeouts_;
  std::string label_; // for logs
  std::atomic<SessionState> state_{SessionState::Disconnected};
  bool flush_pending_{false};
};

} // namespace labinst
