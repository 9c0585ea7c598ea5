#include "lab-instruments/Errors.hpp"
#include "lab-instruments/Logger.hpp"
#include "lab-instruments/config/CapabilityTable.hpp"
#include "lab-instruments/session/Session.hpp"

#include <chrono>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace labinst;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_VALIDATION = 2;
constexpr int EXIT_INSTRUMENT = 3;

struct Options {
  std::string table_path;
  std::string host;
  std::optional<uint16_t> port;
  std::optional<int> channel;
  std::optional<long> connect_timeout_ms;
  std::optional<long> io_timeout_ms;
  std::string log_level = "warn";
  std::string log_file;
  bool json = false;
  std::vector<std::string> args;
};

void print_usage() {
  std::cout << "Usage: lab-instrument <command> [args] --table <file> "
               "--host <host[:port]> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  id                         Query the *IDN? identity\n";
  std::cout << "  reset                      Reset the instrument\n";
  std::cout << "  set <op> <value> [unit]    Run a numeric set operation\n";
  std::cout << "  state <op> <token>         Run an enumerated operation\n";
  std::cout << "  get <op> [unit]            Run a query operation\n";
  std::cout << "  action <op>                Run an operation without args\n";
  std::cout << "  write <command>            Send a raw SCPI command\n";
  std::cout << "  query <command>            Send a raw SCPI query\n";
  std::cout << "  errors                     Drain the error queue\n";
  std::cout << "  describe                   Print the capability table\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --table <file>             Capability table (YAML)\n";
  std::cout << "  --host <host[:port]>       Instrument address\n";
  std::cout << "  --port <port>              Override the table's port\n";
  std::cout << "  --channel <n>              Channel for {ch} operations\n";
  std::cout << "  --connect-timeout <ms>     Connect timeout\n";
  std::cout << "  --io-timeout <ms>          Reply timeout\n";
  std::cout << "  --log-level <level>        trace|debug|info|warn|error\n";
  std::cout << "  --log-file <path>          Also log to a rotating file\n";
  std::cout << "  --json                     Print results as JSON\n";
  std::cout << "\nExamples:\n";
  std::cout << "  lab-instrument set set_frequency 5 GHz "
               "--table hittite_hmc_t2240.yaml --host 192.168.0.159\n";
  std::cout << "  lab-instrument get measure_rms_voltage --channel 2 "
               "--table siglent_sds1104xe.yaml --host 192.168.0.10\n";
}

long parse_integer(const std::string &flag, const std::string &text) {
  char *end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') {
    throw ArgumentError("Invalid value for " + flag + ": " + text);
  }
  return value;
}

long parse_timeout(const std::string &flag, const std::string &text) {
  long value = parse_integer(flag, text);
  if (value <= 0 || value > INT_MAX) {
    throw ArgumentError(flag + " must be between 1 and " +
                        std::to_string(INT_MAX) + " ms");
  }
  return value;
}

double parse_double(const std::string &text) {
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (text.empty() || *end != '\0') {
    throw ArgumentError("Invalid number: " + text);
  }
  return value;
}

// Returns false on a usage error
bool parse_options(int argc, char **argv, Options &opts) {
  for (int i = 0; i < argc; i++) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--json") {
      opts.json = true;
    } else if (arg.rfind("--", 0) == 0 && !has_value) {
      std::cerr << "Error: " << arg << " requires a value\n";
      return false;
    } else if (arg == "--table") {
      opts.table_path = argv[++i];
    } else if (arg == "--host") {
      opts.host = argv[++i];
    } else if (arg == "--port") {
      long port = parse_integer(arg, argv[++i]);
      if (port <= 0 || port > 65535) {
        throw ArgumentError("Port out of range: " + std::to_string(port));
      }
      opts.port = static_cast<uint16_t>(port);
    } else if (arg == "--channel") {
      opts.channel = static_cast<int>(parse_integer(arg, argv[++i]));
    } else if (arg == "--connect-timeout") {
      opts.connect_timeout_ms = parse_timeout(arg, argv[++i]);
    } else if (arg == "--io-timeout") {
      opts.io_timeout_ms = parse_timeout(arg, argv[++i]);
    } else if (arg == "--log-level") {
      opts.log_level = argv[++i];
    } else if (arg == "--log-file") {
      opts.log_file = argv[++i];
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Error: unknown option " << arg << "\n";
      return false;
    } else {
      opts.args.push_back(arg);
    }
  }
  return true;
}

bool require_args(const Options &opts, size_t count, const char *usage) {
  if (opts.args.size() < count) {
    std::cerr << "Usage: lab-instrument " << usage << "\n";
    return false;
  }
  return true;
}

std::unique_ptr<Session> open_session(const Options &opts,
                                      std::shared_ptr<CapabilityTable> table) {
  if (opts.host.empty()) {
    throw ArgumentError("--host is required");
  }

  Address address = Address::parse(opts.host, table->connection().port);
  if (opts.port) {
    address.port = *opts.port;
  }

  Timeouts timeouts = table->connection().timeouts;
  if (opts.connect_timeout_ms) {
    timeouts.connect_timeout =
        std::chrono::milliseconds(*opts.connect_timeout_ms);
  }
  if (opts.io_timeout_ms) {
    timeouts.io_timeout = std::chrono::milliseconds(*opts.io_timeout_ms);
  }

  return Session::connect(address, std::move(table), timeouts);
}

void print_value(const Options &opts, const std::string &op,
                 const nlohmann::json &value) {
  if (opts.json) {
    nlohmann::json out;
    out["operation"] = op;
    out["value"] = value;
    std::cout << out.dump() << "\n";
  } else if (value.is_string()) {
    std::cout << value.get<std::string>() << "\n";
  } else {
    std::cout << value.dump() << "\n";
  }
}

void run_get(Session &session, const Options &opts) {
  const std::string &op = opts.args[1];
  std::string unit = opts.args.size() > 2 ? opts.args[2] : "";

  switch (session.table().at(op).returns) {
  case ReturnType::Text:
    print_value(opts, op, session.get_text(op, opts.channel));
    break;
  case ReturnType::Bool:
    print_value(opts, op, session.get_state(op, opts.channel));
    break;
  case ReturnType::List:
    print_value(opts, op, session.get_list(op, opts.channel));
    break;
  default: {
    double value = session.get(op, unit, opts.channel);
    if (opts.json) {
      nlohmann::json out;
      out["operation"] = op;
      out["value"] = value;
      if (!unit.empty())
        out["unit"] = unit;
      std::cout << out.dump() << "\n";
    } else {
      std::cout << value << (unit.empty() ? "" : " " + unit) << "\n";
    }
    break;
  }
  }
}

void run_errors(Session &session, const Options &opts) {
  auto entries = session.drain_errors();
  if (opts.json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &entry : entries) {
      out.push_back(entry.to_json());
    }
    std::cout << out.dump() << "\n";
  } else if (entries.empty()) {
    std::cout << "No errors\n";
  } else {
    for (const auto &entry : entries) {
      std::cout << entry.code << ", \"" << entry.description << "\"\n";
    }
  }
}

int run_command(const Options &opts) {
  const std::string &command = opts.args[0];

  if (opts.table_path.empty()) {
    std::cerr << "Error: --table is required\n";
    return EXIT_USAGE;
  }
  auto table = std::make_shared<CapabilityTable>(
      CapabilityTable::load_file(opts.table_path));

  if (command == "describe") {
    std::cout << table->to_json().dump(2) << "\n";
    return 0;
  }

  if (command == "set" && !require_args(opts, 3, "set <op> <value> [unit]"))
    return EXIT_USAGE;
  if (command == "state" && !require_args(opts, 3, "state <op> <token>"))
    return EXIT_USAGE;
  if (command == "get" && !require_args(opts, 2, "get <op> [unit]"))
    return EXIT_USAGE;
  if (command == "action" && !require_args(opts, 2, "action <op>"))
    return EXIT_USAGE;
  if (command == "write" && !require_args(opts, 2, "write <command>"))
    return EXIT_USAGE;
  if (command == "query" && !require_args(opts, 2, "query <command>"))
    return EXIT_USAGE;

  auto session = open_session(opts, table);

  if (command == "id") {
    if (opts.json) {
      std::cout << session->identity().to_json().dump() << "\n";
    } else {
      std::cout << session->get_id() << "\n";
    }
  } else if (command == "reset") {
    session->reset();
  } else if (command == "set") {
    std::string unit = opts.args.size() > 3 ? opts.args[3] : "";
    session->set(opts.args[1], parse_double(opts.args[2]), unit, opts.channel);
  } else if (command == "state") {
    session->set_token(opts.args[1], opts.args[2], opts.channel);
  } else if (command == "get") {
    run_get(*session, opts);
  } else if (command == "action") {
    session->action(opts.args[1], opts.channel);
  } else if (command == "write") {
    session->write(opts.args[1]);
  } else if (command == "query") {
    print_value(opts, opts.args[1], session->query(opts.args[1]));
  } else if (command == "errors") {
    run_errors(*session, opts);
  }

  session->close();
  return 0;
}

bool known_command(const std::string &command) {
  for (const char *name : {"id", "reset", "set", "state", "get", "action",
                           "write", "query", "errors", "describe"}) {
    if (command == name)
      return true;
  }
  return false;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return EXIT_USAGE;
  }

  std::string command = argv[1];
  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }
  if (!known_command(command)) {
    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return EXIT_USAGE;
  }

  Options opts;
  try {
    if (!parse_options(argc - 1, argv + 1, opts)) {
      return EXIT_USAGE;
    }
  } catch (const ArgumentError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_USAGE;
  }

  InstrumentLogger::instance().init(opts.log_file,
                                    parse_log_level(opts.log_level));

  try {
    return run_command(opts);
  } catch (const DeviceError &e) {
    LOG_ERROR("MAIN", command, "{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_INSTRUMENT;
  } catch (const ArgumentError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_VALIDATION;
  } catch (const UnitError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_VALIDATION;
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_VALIDATION;
  } catch (const InstrumentError &e) {
    LOG_ERROR("MAIN", command, "{}", e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_INSTRUMENT;
  }
}
