#include "lab-instruments/session/Session.hpp"
#include "lab-instruments/Errors.hpp"
#include "lab-instruments/Logger.hpp"
#include "lab-instruments/transport/TcpTransport.hpp"
#include "lab-instruments/units/UnitNormalizer.hpp"

#include <algorithm>
#include <chrono>
#include <climits>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <utility>

namespace labinst {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on lines drained while waiting for a quiet line
constexpr int MAX_STALE_LINES = 256;

constexpr std::chrono::milliseconds MAX_TIMEOUT{INT_MAX};

bool valid_timeout(std::chrono::milliseconds timeout) {
  return timeout.count() > 0 && timeout <= MAX_TIMEOUT;
}

std::chrono::milliseconds time_left(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool is_completion_reply(const std::string &line) {
  try {
    return scpi::parse_number(line) == 1.0;
  } catch (const ParseError &) {
    return false;
  }
}

} // namespace

std::string to_string(SessionState state) {
  switch (state) {
  case SessionState::Disconnected:
    return "disconnected";
  case SessionState::Connected:
    return "connected";
  case SessionState::Busy:
    return "busy";
  case SessionState::Closed:
    return "closed";
  }
  return "unknown";
}

std::unique_ptr<Session>
Session::connect(const Address &address,
                 std::shared_ptr<const CapabilityTable> table,
                 const Timeouts &timeouts) {
  if (!table) {
    throw ArgumentError("A session needs a capability table");
  }
  auto transport = std::make_unique<transport::TcpTransport>(
      table->connection().terminator, timeouts.io_timeout);
  auto session = std::make_unique<Session>(std::move(transport),
                                           std::move(table), address, timeouts);
  session->open();
  return session;
}

std::unique_ptr<Session>
Session::connect(const Address &address,
                 std::shared_ptr<const CapabilityTable> table) {
  if (!table) {
    throw ArgumentError("A session needs a capability table");
  }
  Timeouts timeouts = table->connection().timeouts;
  return connect(address, std::move(table), timeouts);
}

Session::Session(std::unique_ptr<transport::Transport> transport,
                 std::shared_ptr<const CapabilityTable> table, Address address,
                 Timeouts timeouts)
    : transport_(std::move(transport)), table_(std::move(table)),
      address_(std::move(address)), timeouts_(timeouts) {
  if (!transport_) {
    throw ArgumentError("A session needs a transport");
  }
  if (!table_) {
    throw ArgumentError("A session needs a capability table");
  }
  if (!valid_timeout(timeouts_.connect_timeout) ||
      !valid_timeout(timeouts_.io_timeout)) {
    throw ArgumentError(fmt::format(
        "Session timeouts must be between 1 and {} ms", MAX_TIMEOUT.count()));
  }
  label_ = fmt::format("{}@{}", table_->instrument().model,
                       address_.to_string());
}

Session::~Session() { close(); }

void Session::open() {
  SessionState current = state_.load();
  if (current != SessionState::Disconnected) {
    throw ProtocolError(fmt::format("Cannot open {}: session is {}", label_,
                                    to_string(current)));
  }

  // A failed connect leaves the session Disconnected
  transport_->connect(address_, timeouts_.connect_timeout);

  SessionState expected = SessionState::Disconnected;
  if (!state_.compare_exchange_strong(expected, SessionState::Connected)) {
    // close() ran while we were connecting
    transport_->close();
    throw TransportError(fmt::format("Session {} was closed", label_));
  }
  LOG_INFO(label_, "OPEN", "Session open ({} over {})", table_->label(),
           transport_->name());

  // Telnet-style instruments greet with a fixed number of lines
  int banner_lines = table_->connection().banner_lines;
  for (int i = 0; i < banner_lines; ++i) {
    try {
      std::string line = read_line(timeouts_.io_timeout);
      LOG_DEBUG(label_, "OPEN", "Banner: {}", line);
    } catch (const TimeoutError &) {
      LOG_WARN(label_, "OPEN", "Expected {} banner lines, got {}",
               banner_lines, i);
      flush_pending_ = true;
      break;
    } catch (const TransportError &) {
      fail_transport();
      throw;
    }
  }
}

void Session::close() {
  SessionState previous = state_.exchange(SessionState::Closed);
  if (previous == SessionState::Closed) {
    return;
  }
  transport_->close();
  if (previous == SessionState::Busy) {
    LOG_WARN(label_, "CLOSE", "Closed with a query reply pending");
  } else if (previous == SessionState::Connected) {
    LOG_INFO(label_, "CLOSE", "Session closed");
  }
}

bool Session::is_open() const {
  SessionState current = state_.load();
  return current == SessionState::Connected || current == SessionState::Busy;
}

void Session::ensure_ready(const char *operation) const {
  switch (state_.load()) {
  case SessionState::Connected:
    return;
  case SessionState::Busy:
    throw ProtocolError(fmt::format(
        "Cannot {} on {}: a query reply is still pending", operation, label_));
  case SessionState::Disconnected:
    throw TransportError(
        fmt::format("Cannot {}: {} is not connected", operation, label_));
  case SessionState::Closed:
    throw TransportError(
        fmt::format("Cannot {}: {} is closed", operation, label_));
  }
}

void Session::fail_transport() {
  LOG_ERROR(label_, "TRANSPORT", "Link failed, closing session");
  close();
}

void Session::send(const scpi::Command &command) {
  ensure_ready("send");

  if (flush_pending_) {
    resynchronise();
  }

  if (command.expects_reply()) {
    SessionState expected = SessionState::Connected;
    if (!state_.compare_exchange_strong(expected, SessionState::Busy)) {
      // Lost a race with close() on another thread
      ensure_ready("send");
      throw ProtocolError(fmt::format("Cannot send to {}", label_));
    }
  }

  try {
    transport_->send(command.text());
  } catch (const TransportError &) {
    fail_transport();
    throw;
  }
}

std::string Session::receive() {
  SessionState current = state_.load();
  if (current == SessionState::Connected) {
    throw ProtocolError(
        fmt::format("receive() on {} with no query pending", label_));
  }
  if (current != SessionState::Busy) {
    throw TransportError(
        fmt::format("Cannot receive: {} is {}", label_, to_string(current)));
  }

  std::string reply;
  try {
    reply = read_line(timeouts_.io_timeout);
  } catch (const TimeoutError &ex) {
    LOG_WARN(label_, "RECV", "{}", ex.what());
    flush_pending_ = true;
    SessionState expected = SessionState::Busy;
    state_.compare_exchange_strong(expected, SessionState::Connected);
    throw;
  } catch (const TransportError &) {
    fail_transport();
    throw;
  }

  SessionState expected = SessionState::Busy;
  state_.compare_exchange_strong(expected, SessionState::Connected);
  return reply;
}

std::string Session::read_line(std::chrono::milliseconds timeout) {
  const std::string &prompt = table_->connection().prompt;
  auto deadline = Clock::now() + timeout;
  while (true) {
    std::string line = transport_->receive(timeout);
    if (prompt.empty()) {
      return line;
    }

    // The prompt is sent without a terminator, so it leads the next line
    bool prompted = false;
    while (line.compare(0, prompt.size(), prompt) == 0) {
      line.erase(0, prompt.size());
      prompted = true;
    }
    if (!prompted || !scpi::strip_reply(line).empty()) {
      return line;
    }

    timeout = time_left(deadline);
    if (timeout.count() == 0) {
      throw TimeoutError(
          fmt::format("Only a prompt from {} before the deadline", label_));
    }
  }
}

// A reply to a timed-out query may still be in flight, so flushing what
// has arrived is not enough. With an operation-complete query available,
// everything read before its "1" is stale. Otherwise drain until the line
// stays quiet for a full I/O timeout.
void Session::resynchronise() {
  transport_->flush_input();
  const Operation *marker = table_->find("wait_for_completion");
  int discarded = 0;

  try {
    if (marker && marker->kind == OperationKind::Query) {
      auto deadline = Clock::now() + timeouts_.io_timeout;
      transport_->send(query_command(*marker, std::nullopt).text());
      while (true) {
        auto left = time_left(deadline);
        if (left.count() == 0) {
          throw TimeoutError(fmt::format(
              "{} did not answer {} while resynchronising", label_,
              marker->verb));
        }
        std::string line = read_line(left);
        if (is_completion_reply(line)) {
          break;
        }
        LOG_DEBUG(label_, "RESYNC", "Discarded stale reply: {}", line);
        ++discarded;
      }
    } else {
      for (int i = 0; i < MAX_STALE_LINES; ++i) {
        try {
          std::string line = read_line(timeouts_.io_timeout);
          LOG_DEBUG(label_, "RESYNC", "Discarded stale reply: {}", line);
          ++discarded;
        } catch (const TimeoutError &) {
          break;
        }
      }
    }
  } catch (const TimeoutError &ex) {
    LOG_WARN(label_, "RESYNC", "{}", ex.what());
    throw;
  } catch (const TransportError &) {
    fail_transport();
    throw;
  }

  flush_pending_ = false;
  LOG_DEBUG(label_, "RESYNC", "Back in step ({} stale lines dropped)",
            discarded);
}

std::string Session::query(const scpi::Command &command) {
  if (!command.expects_reply()) {
    throw ArgumentError(
        fmt::format("'{}' is not a query; use send()", command.text()));
  }
  send(command);
  return receive();
}

void Session::write(const std::string &command) {
  if (command.empty()) {
    throw ArgumentError("Empty command");
  }
  if (command.find('?') != std::string::npos) {
    throw ArgumentError(
        fmt::format("'{}' is a query; use query() to read its reply", command));
  }
  send(scpi::Command(command, false));
}

std::string Session::query(const std::string &command) {
  if (command.find('?') == std::string::npos) {
    throw ArgumentError(
        fmt::format("'{}' is not a query; use write()", command));
  }
  return query(scpi::Command(command, true));
}

bool Session::has_operation(const std::string &op) const {
  return table_->has(op);
}

const Operation &Session::lookup(const std::string &op,
                                 OperationKind kind) const {
  const Operation &entry = table_->at(op);
  if (entry.kind != kind) {
    throw ArgumentError(fmt::format("{}: '{}' is a {} operation, not {}",
                                    table_->label(), op, to_string(entry.kind),
                                    to_string(kind)));
  }
  return entry;
}

const Operation &Session::lookup_query(const std::string &op,
                                       ReturnType returns) const {
  const Operation &entry = lookup(op, OperationKind::Query);
  if (entry.returns != returns) {
    throw ArgumentError(fmt::format("{}: '{}' returns {}, not {}",
                                    table_->label(), op,
                                    to_string(entry.returns),
                                    to_string(returns)));
  }
  return entry;
}

void Session::run_setup(const Operation &op, std::optional<int> channel) {
  for (const auto &command : op.setup) {
    send(scpi::format_action(scpi::expand_verb(command, channel)));
  }
}

scpi::Command Session::query_command(const Operation &op,
                                     std::optional<int> channel) const {
  std::string verb = scpi::expand_verb(op.verb, channel);
  if (op.raw) {
    return scpi::Command(verb, true);
  }
  return scpi::format_query(verb);
}

scpi::NumberStyle Session::number_style(const Operation &op) const {
  scpi::NumberStyle style;
  style.format = op.number_format;
  style.decimals = op.decimals;
  style.separator = op.separator;
  return style;
}

double Session::reply_to_base(const Operation &op,
                              const std::string &reply) const {
  double value = op.reply_field
                     ? scpi::parse_number_field(reply, *op.reply_field)
                     : scpi::parse_number(reply);
  if (op.quantity && op.wire_unit) {
    value = units::to_base(value, *op.wire_unit, *op.quantity);
  }
  return value;
}

void Session::set(const std::string &op, double magnitude,
                  const std::string &unit, std::optional<int> channel) {
  const Operation &entry = lookup(op, OperationKind::Set);

  double value = magnitude;
  if (entry.quantity) {
    QuantityKind kind = *entry.quantity;
    units::require_unit(unit, kind);
    if (!entry.units.empty() &&
        std::find(entry.units.begin(), entry.units.end(), unit) ==
            entry.units.end()) {
      throw UnitError(fmt::format("{}: {} does not accept '{}' (accepted: {})",
                                  table_->label(), op, unit,
                                  fmt::join(entry.units, ", ")));
    }
    double base = units::to_base(magnitude, unit, kind);
    scpi::check_range(op, base, entry.min, entry.max);
    value = entry.wire_unit ? units::from_base(base, kind, *entry.wire_unit)
                           : base;
  } else {
    if (!unit.empty()) {
      throw UnitError(fmt::format("{}: {} takes a plain number, not '{}'",
                                  table_->label(), op, unit));
    }
    scpi::check_range(op, magnitude, entry.min, entry.max);
  }

  scpi::Command command = scpi::format_set(
      scpi::expand_verb(entry.verb, channel), value, number_style(entry));

  LOG_DEBUG(label_, op, "{} {} -> {}", magnitude, unit, command.text());
  run_setup(entry, channel);
  send(command);
}

void Session::set_token(const std::string &op, const std::string &token,
                        std::optional<int> channel) {
  const Operation &entry = lookup(op, OperationKind::State);
  scpi::Command command =
      scpi::format_enum(scpi::expand_verb(entry.verb, channel), token,
                        entry.tokens, entry.separator);

  LOG_DEBUG(label_, op, "{}", command.text());
  run_setup(entry, channel);
  send(command);
}

double Session::get(const std::string &op, const std::string &unit,
                    std::optional<int> channel) {
  const Operation &entry = lookup_query(op, ReturnType::Number);

  std::string target = unit;
  if (entry.quantity) {
    if (target.empty()) {
      target = units::base_unit(*entry.quantity);
    }
    units::require_unit(target, *entry.quantity);
  } else if (!unit.empty()) {
    throw UnitError(fmt::format("{}: {} returns a plain number, not '{}'",
                                table_->label(), op, unit));
  }

  scpi::Command command = query_command(entry, channel);
  run_setup(entry, channel);
  std::string reply = query(command);

  double base = reply_to_base(entry, reply);
  double result =
      entry.quantity ? units::from_base(base, *entry.quantity, target) : base;
  LOG_DEBUG(label_, op, "{} -> {} {}", scpi::strip_reply(reply), result,
            target);
  return result;
}

std::string Session::get_text(const std::string &op,
                              std::optional<int> channel) {
  const Operation &entry = lookup(op, OperationKind::Query);
  scpi::Command command = query_command(entry, channel);
  run_setup(entry, channel);
  return scpi::parse_identifier(query(command));
}

bool Session::get_state(const std::string &op, std::optional<int> channel) {
  const Operation &entry = lookup_query(op, ReturnType::Bool);
  scpi::Command command = query_command(entry, channel);
  run_setup(entry, channel);
  return scpi::parse_bool(query(command));
}

std::vector<double> Session::get_list(const std::string &op,
                                      std::optional<int> channel) {
  const Operation &entry = lookup_query(op, ReturnType::List);
  scpi::Command command = query_command(entry, channel);
  run_setup(entry, channel);
  std::vector<double> values = scpi::parse_number_list(query(command));
  LOG_DEBUG(label_, op, "Read {} values", values.size());
  return values;
}

void Session::action(const std::string &op, std::optional<int> channel) {
  const Operation &entry = lookup(op, OperationKind::Action);
  scpi::Command command =
      scpi::format_action(scpi::expand_verb(entry.verb, channel));
  LOG_DEBUG(label_, op, "{}", command.text());
  run_setup(entry, channel);
  send(command);
}

void Session::set_frequency(double magnitude, const std::string &unit) {
  set("set_frequency", magnitude, unit);
}

double Session::get_frequency(const std::string &unit) {
  return get("get_frequency", unit);
}

void Session::set_power(double magnitude, const std::string &unit) {
  set("set_power", magnitude, unit);
}

double Session::get_power(const std::string &unit) {
  return get("get_power", unit);
}

void Session::set_voltage(double magnitude, const std::string &unit) {
  set("set_voltage", magnitude, unit);
}

void Session::set_voltage_limit(double magnitude, const std::string &unit) {
  set("set_voltage_limit", magnitude, unit);
}

void Session::set_current(double magnitude, const std::string &unit) {
  set("set_current", magnitude, unit);
}

void Session::set_current_limit(double magnitude, const std::string &unit) {
  set("set_current_limit", magnitude, unit);
}

void Session::output_on() { set_token("output", "ON"); }

void Session::output_off() { set_token("output", "OFF"); }

double Session::measure_dc_voltage(const std::string &unit) {
  return get("measure_dc_voltage", unit);
}

double Session::measure_voltage(const std::string &unit) {
  return get("measure_voltage", unit);
}

double Session::measure_current(const std::string &unit) {
  return get("measure_current", unit);
}

void Session::reset() { action("reset"); }

std::string Session::get_id() { return get_text("get_id"); }

scpi::Identity Session::identity() { return scpi::parse_identity(get_id()); }

void Session::wait_for_completion() {
  double done = get("wait_for_completion");
  if (done != 1.0) {
    LOG_WARN(label_, "OPC", "Unexpected operation-complete reply {}", done);
  }
}

scpi::ErrorQueueEntry Session::next_error() {
  const Operation &entry = lookup("next_error", OperationKind::Query);
  return scpi::parse_error_entry(query(query_command(entry, std::nullopt)));
}

std::vector<scpi::ErrorQueueEntry> Session::drain_errors(size_t max_entries) {
  std::vector<scpi::ErrorQueueEntry> entries;
  while (entries.size() < max_entries) {
    scpi::ErrorQueueEntry entry = next_error();
    if (entry.ok()) {
      return entries;
    }
    LOG_WARN(label_, "ERRORS", "{},\"{}\"", entry.code, entry.description);
    entries.push_back(entry);
  }
  LOG_WARN(label_, "ERRORS", "Stopped draining after {} entries",
           max_entries);
  return entries;
}

void Session::check_errors() {
  const Operation &entry = lookup("next_error", OperationKind::Query);
  try {
    scpi::parse_error_queue(query(query_command(entry, std::nullopt)));
  } catch (const DeviceError &ex) {
    LOG_WARN(label_, "ERRORS", "{}", ex.what());
    throw;
  }
}

} // namespace labinst
