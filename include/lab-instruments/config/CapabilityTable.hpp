#pragma once
#include "lab-instruments/export.h"
#include "lab-instruments/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace labinst {

/// Per-model mapping from abstract operation names to SCPI verbs and
/// accepted arguments. Loaded from YAML; immutable once handed to a
/// Session.
class LAB_INSTRUMENTS_API CapabilityTable {
public:
  CapabilityTable() = default;
  CapabilityTable(InstrumentMetadata instrument, ConnectionDefaults connection);

  /// Load and validate a YAML table. Throws ConfigError.
  static CapabilityTable load_file(const std::string &path);
  static CapabilityTable from_yaml_string(const std::string &yaml);
  static CapabilityTable from_yaml(const YAML::Node &doc);

  const InstrumentMetadata &instrument() const { return instrument_; }
  const ConnectionDefaults &connection() const { return connection_; }

  /// "Vendor Model", for logs
  std::string label() const;

  bool has(const std::string &name) const;

  /// nullptr if the model has no such operation
  const Operation *find(const std::string &name) const;

  /// Throws ArgumentError if the model has no such operation
  const Operation &at(const std::string &name) const;

  std::vector<std::string> operation_names() const;
  size_t size() const { return operations_.size(); }

  /// Add or replace an operation
  void add_operation(Operation op);

  nlohmann::json to_json() const;

private:
  static CapabilityTable build(const YAML::Node &doc);

  // The common IEEE 488.2 commands every SCPI instrument understands
  void add_ieee488_defaults();

  InstrumentMetadata instrument_;
  ConnectionDefaults connection_;
  std::map<std::string, Operation> operations_;
};

} // namespace labinst
