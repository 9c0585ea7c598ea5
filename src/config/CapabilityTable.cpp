#include "lab-instruments/config/CapabilityTable.hpp"
#include "lab-instruments/Errors.hpp"
#include "lab-instruments/Logger.hpp"
#include "lab-instruments/config/CapabilityValidator.hpp"
#include "lab-instruments/units/UnitNormalizer.hpp"

#include <fmt/format.h>
#include <utility>

namespace labinst {

namespace {

Operation make_operation(const std::string &name, OperationKind kind,
                         const std::string &verb, ReturnType returns,
                         const std::string &description) {
  Operation op;
  op.name = name;
  op.kind = kind;
  op.verb = verb;
  op.returns = returns;
  op.description = description;
  return op;
}

std::vector<std::string> read_strings(const YAML::Node &node) {
  std::vector<std::string> out;
  if (node && node.IsSequence()) {
    for (const auto &item : node) {
      out.push_back(item.as<std::string>());
    }
  }
  return out;
}

Operation parse_operation(const std::string &name, const YAML::Node &node) {
  Operation op;
  op.name = name;
  op.kind = *parse_operation_kind(node["kind"].as<std::string>());
  op.verb = node["verb"].as<std::string>();

  if (node["description"])
    op.description = node["description"].as<std::string>();
  if (node["quantity"])
    op.quantity = units::parse_kind(node["quantity"].as<std::string>());
  op.units = read_strings(node["units"]);
  if (node["min"])
    op.min = node["min"].as<double>();
  if (node["max"])
    op.max = node["max"].as<double>();
  if (node["decimals"])
    op.decimals = node["decimals"].as<int>();
  if (node["number_format"] &&
      node["number_format"].as<std::string>() == "scientific") {
    op.number_format = NumberFormat::Scientific;
  }
  if (node["wire_unit"])
    op.wire_unit = node["wire_unit"].as<std::string>();
  if (node["separator"])
    op.separator = node["separator"].as<std::string>();
  op.tokens = read_strings(node["tokens"]);
  op.setup = read_strings(node["setup"]);

  if (node["returns"]) {
    op.returns = *parse_return_type(node["returns"].as<std::string>());
  } else if (op.kind == OperationKind::Query) {
    op.returns = ReturnType::Number;
  }
  if (node["reply_field"])
    op.reply_field = node["reply_field"].as<int>();
  if (node["raw"])
    op.raw = node["raw"].as<bool>();

  return op;
}

std::string describe_errors(const ValidationResult &result) {
  std::string out;
  for (const auto &err : result.errors) {
    out += fmt::format("\n  - {}: {}", err.path, err.message);
  }
  return out;
}

} // namespace

CapabilityTable::CapabilityTable(InstrumentMetadata instrument,
                                 ConnectionDefaults connection)
    : instrument_(std::move(instrument)), connection_(std::move(connection)) {
  if (connection_.ieee488) {
    add_ieee488_defaults();
  }
}

CapabilityTable CapabilityTable::load_file(const std::string &path) {
  LOG_DEBUG("CONFIG", "LOAD", "Loading capability table: {}", path);
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    LOG_ERROR("CONFIG", "LOAD", "Failed to load {}: {}", path, ex.what());
    throw ConfigError(
        fmt::format("Cannot load capability table {}: {}", path, ex.what()));
  }

  try {
    return from_yaml(doc);
  } catch (const ConfigError &ex) {
    LOG_ERROR("CONFIG", "LOAD", "{}: {}", path, ex.what());
    throw ConfigError(fmt::format("{}: {}", path, ex.what()));
  }
}

CapabilityTable CapabilityTable::from_yaml_string(const std::string &yaml) {
  YAML::Node doc;
  try {
    doc = YAML::Load(yaml);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(fmt::format("Invalid capability YAML: {}", ex.what()));
  }
  return from_yaml(doc);
}

CapabilityTable CapabilityTable::from_yaml(const YAML::Node &doc) {
  try {
    return build(doc);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(fmt::format("Invalid capability table: {}", ex.what()));
  }
}

CapabilityTable CapabilityTable::build(const YAML::Node &doc) {
  ValidationResult result = CapabilityValidator::validate(doc);
  if (!result.valid) {
    throw ConfigError("Invalid capability table:" + describe_errors(result));
  }

  InstrumentMetadata instrument;
  instrument.vendor = doc["instrument"]["vendor"].as<std::string>();
  instrument.model = doc["instrument"]["model"].as<std::string>();
  if (doc["instrument"]["description"]) {
    instrument.description =
        doc["instrument"]["description"].as<std::string>();
  }

  ConnectionDefaults connection;
  if (const YAML::Node conn = doc["connection"]) {
    if (conn["port"])
      connection.port = static_cast<uint16_t>(conn["port"].as<int>());
    if (conn["terminator"]) {
      connection.terminator = *CapabilityValidator::decode_terminator(
          conn["terminator"].as<std::string>());
    }
    if (conn["connect_timeout_ms"]) {
      connection.timeouts.connect_timeout =
          std::chrono::milliseconds(conn["connect_timeout_ms"].as<long>());
    }
    if (conn["io_timeout_ms"]) {
      connection.timeouts.io_timeout =
          std::chrono::milliseconds(conn["io_timeout_ms"].as<long>());
    }
    if (conn["banner_lines"])
      connection.banner_lines = conn["banner_lines"].as<int>();
    if (conn["prompt"])
      connection.prompt = conn["prompt"].as<std::string>();
    if (conn["ieee488"])
      connection.ieee488 = conn["ieee488"].as<bool>();
  }

  CapabilityTable table(std::move(instrument), std::move(connection));
  for (const auto &kv : doc["operations"]) {
    auto name = kv.first.as<std::string>();
    table.add_operation(parse_operation(name, kv.second));
  }

  LOG_DEBUG("CONFIG", "LOAD", "Loaded {} with {} operations", table.label(),
            table.size());
  return table;
}

std::string CapabilityTable::label() const {
  return fmt::format("{} {}", instrument_.vendor, instrument_.model);
}

bool CapabilityTable::has(const std::string &name) const {
  return operations_.count(name) > 0;
}

const Operation *CapabilityTable::find(const std::string &name) const {
  auto it = operations_.find(name);
  if (it == operations_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Operation &CapabilityTable::at(const std::string &name) const {
  const Operation *op = find(name);
  if (!op) {
    throw ArgumentError(
        fmt::format("{} does not support operation '{}'", label(), name));
  }
  return *op;
}

std::vector<std::string> CapabilityTable::operation_names() const {
  std::vector<std::string> names;
  names.reserve(operations_.size());
  for (const auto &[name, _] : operations_) {
    names.push_back(name);
  }
  return names;
}

void CapabilityTable::add_operation(Operation op) {
  std::string name = op.name;
  operations_[name] = std::move(op);
}

void CapabilityTable::add_ieee488_defaults() {
  add_operation(make_operation("get_id", OperationKind::Query, "*IDN",
                               ReturnType::Text, "Identification string"));
  add_operation(make_operation("reset", OperationKind::Action, "*RST",
                               ReturnType::None, "Reset to defaults"));
  add_operation(make_operation("clear_status", OperationKind::Action, "*CLS",
                               ReturnType::None, "Clear status and errors"));
  add_operation(make_operation("wait_for_completion", OperationKind::Query,
                               "*OPC", ReturnType::Number,
                               "Block until pending operations finish"));
  add_operation(make_operation("next_error", OperationKind::Query,
                               "SYST:ERR", ReturnType::Text,
                               "Pop one error queue entry"));
}

nlohmann::json CapabilityTable::to_json() const {
  nlohmann::json j;
  j["instrument"]["vendor"] = instrument_.vendor;
  j["instrument"]["model"] = instrument_.model;
  if (instrument_.description) {
    j["instrument"]["description"] = *instrument_.description;
  }

  j["connection"]["port"] = connection_.port;
  j["connection"]["terminator"] = connection_.terminator;
  j["connection"]["connect_timeout_ms"] =
      connection_.timeouts.connect_timeout.count();
  j["connection"]["io_timeout_ms"] = connection_.timeouts.io_timeout.count();
  j["connection"]["banner_lines"] = connection_.banner_lines;
  if (!connection_.prompt.empty()) {
    j["connection"]["prompt"] = connection_.prompt;
  }
  j["connection"]["ieee488"] = connection_.ieee488;

  nlohmann::json ops = nlohmann::json::object();
  for (const auto &[name, op] : operations_) {
    nlohmann::json o;
    o["kind"] = to_string(op.kind);
    o["verb"] = op.verb;
    if (op.description)
      o["description"] = *op.description;
    if (op.quantity) {
      o["quantity"] = units::kind_name(*op.quantity);
      o["units"] = op.units.empty() ? units::units_for(*op.quantity) : op.units;
    }
    if (op.min)
      o["min"] = *op.min;
    if (op.max)
      o["max"] = *op.max;
    if (op.wire_unit)
      o["wire_unit"] = *op.wire_unit;
    if (!op.tokens.empty())
      o["tokens"] = op.tokens;
    if (!op.setup.empty())
      o["setup"] = op.setup;
    if (op.returns != ReturnType::None)
      o["returns"] = to_string(op.returns);
    if (op.reply_field)
      o["reply_field"] = *op.reply_field;
    if (op.raw)
      o["raw"] = true;
    ops[name] = o;
  }
  j["operations"] = ops;
  return j;
}

} // namespace labinst
