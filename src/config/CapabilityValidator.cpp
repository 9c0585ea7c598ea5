#include "lab-instruments/config/CapabilityValidator.hpp"
#include "lab-instruments/units/UnitNormalizer.hpp"

#include <climits>
#include <set>
#include <string>
#include <vector>

namespace labinst {

namespace {

const std::set<std::string> OPERATION_FIELDS = {
    "kind",     "verb",      "description",   "quantity",  "units",
    "min",      "max",       "decimals",      "number_format",
    "wire_unit", "separator", "tokens",       "setup",     "returns",
    "reply_field", "raw"};

const std::set<std::string> CONNECTION_FIELDS = {
    "port",          "terminator",   "connect_timeout_ms",
    "io_timeout_ms", "banner_lines", "prompt",
    "ieee488"};

std::string node_path(const std::vector<std::string> &path) {
  if (path.empty()) {
    return "/";
  }
  std::string out;
  for (const auto &p : path) {
    out += "/" + p;
  }
  return out;
}

void add_error(ValidationResult &result, const std::vector<std::string> &path,
               const std::string &msg) {
  result.valid = false;
  result.errors.push_back({node_path(path), msg});
}

std::vector<std::string> child(std::vector<std::string> path,
                               const std::string &key) {
  path.push_back(key);
  return path;
}

template <typename T>
bool read_as(const YAML::Node &node, T &out) {
  if (!node.IsScalar()) {
    return false;
  }
  try {
    out = node.as<T>();
    return true;
  } catch (const YAML::BadConversion &) {
    return false;
  }
}

void require_string(const YAML::Node &parent, const char *key,
                    const std::vector<std::string> &path,
                    ValidationResult &result, bool required) {
  const YAML::Node node = parent[key];
  if (!node) {
    if (required) {
      add_error(result, path,
                std::string("Missing required field '") + key + "'");
    }
    return;
  }
  std::string value;
  if (!read_as(node, value) || value.empty()) {
    add_error(result, child(path, key), "must be a non-empty string");
  }
}

void validate_connection(const YAML::Node &conn, ValidationResult &result) {
  std::vector<std::string> path = {"connection"};
  if (!conn.IsMap()) {
    add_error(result, path, "connection must be a map");
    return;
  }

  for (const auto &kv : conn) {
    std::string key;
    if (!read_as(kv.first, key)) {
      add_error(result, path, "connection keys must be strings");
      continue;
    }
    if (CONNECTION_FIELDS.count(key) == 0) {
      add_error(result, child(path, key), "Unknown connection field");
    }
  }

  if (conn["port"]) {
    int port = 0;
    if (!read_as(conn["port"], port) || port <= 0 || port > 65535) {
      add_error(result, child(path, "port"),
                "port must be an integer in 1..65535");
    }
  }
  if (conn["terminator"]) {
    std::string text;
    if (!read_as(conn["terminator"], text) ||
        !CapabilityValidator::decode_terminator(text)) {
      add_error(result, child(path, "terminator"),
                "terminator must be LF, CR, CRLF or a non-empty string");
    }
  }
  for (const char *key : {"connect_timeout_ms", "io_timeout_ms"}) {
    if (conn[key]) {
      long value = 0;
      if (!read_as(conn[key], value) || value <= 0 || value > INT_MAX) {
        add_error(result, child(path, key),
                  "timeout must be a positive number of milliseconds "
                  "(at most 2147483647)");
      }
    }
  }
  if (conn["banner_lines"]) {
    int lines = 0;
    if (!read_as(conn["banner_lines"], lines) || lines < 0) {
      add_error(result, child(path, "banner_lines"),
                "banner_lines must be a non-negative integer");
    }
  }
  if (conn["prompt"]) {
    std::string prompt;
    if (!read_as(conn["prompt"], prompt) || prompt.empty()) {
      add_error(result, child(path, "prompt"),
                "prompt must be a non-empty string");
    }
  }
  if (conn["ieee488"]) {
    bool flag = false;
    if (!read_as(conn["ieee488"], flag)) {
      add_error(result, child(path, "ieee488"), "ieee488 must be a boolean");
    }
  }
}

void validate_operation(const std::string &name, const YAML::Node &op,
                        ValidationResult &result) {
  std::vector<std::string> path = {"operations", name};
  if (!op.IsMap()) {
    add_error(result, path, "operation must be a map");
    return;
  }

  for (const auto &kv : op) {
    std::string key;
    if (!read_as(kv.first, key)) {
      add_error(result, path, "operation keys must be strings");
      continue;
    }
    if (OPERATION_FIELDS.count(key) == 0) {
      add_error(result, child(path, key), "Unknown operation field");
    }
  }

  std::optional<OperationKind> kind;
  if (!op["kind"]) {
    add_error(result, path, "Missing required field 'kind'");
  } else {
    std::string text;
    if (read_as(op["kind"], text)) {
      kind = parse_operation_kind(text);
    }
    if (!kind) {
      add_error(result, child(path, "kind"),
                "kind must be one of: set, query, state, action");
    }
  }

  require_string(op, "verb", path, result, true);

  std::optional<QuantityKind> quantity;
  if (op["quantity"]) {
    std::string text;
    if (read_as(op["quantity"], text)) {
      quantity = units::parse_kind(text);
    }
    if (!quantity) {
      add_error(result, child(path, "quantity"),
                "quantity must be one of: frequency, power, voltage, current");
    }
  }

  if (op["units"]) {
    if (!op["units"].IsSequence() || op["units"].size() == 0) {
      add_error(result, child(path, "units"),
                "units must be a non-empty sequence");
    } else if (!op["quantity"]) {
      add_error(result, child(path, "units"), "units require a quantity");
    } else if (quantity) {
      for (size_t i = 0; i < op["units"].size(); ++i) {
        std::string unit;
        if (!read_as(op["units"][i], unit) ||
            !units::is_unit_of(unit, *quantity)) {
          add_error(result, child(child(path, "units"), std::to_string(i)),
                    "not a " + units::kind_name(*quantity) + " unit");
        }
      }
    }
  }

  if (op["wire_unit"]) {
    std::string unit;
    if (!op["quantity"]) {
      add_error(result, child(path, "wire_unit"),
                "wire_unit requires a quantity");
    } else if (quantity && (!read_as(op["wire_unit"], unit) ||
                            !units::is_unit_of(unit, *quantity))) {
      add_error(result, child(path, "wire_unit"),
                "not a " + units::kind_name(*quantity) + " unit");
    }
  }

  double min = 0.0;
  double max = 0.0;
  bool has_min = false;
  bool has_max = false;
  if (op["min"]) {
    has_min = read_as(op["min"], min);
    if (!has_min) {
      add_error(result, child(path, "min"), "min must be a number");
    }
  }
  if (op["max"]) {
    has_max = read_as(op["max"], max);
    if (!has_max) {
      add_error(result, child(path, "max"), "max must be a number");
    }
  }
  if (has_min && has_max && min > max) {
    add_error(result, path, "min is greater than max");
  }

  if (op["decimals"]) {
    int decimals = 0;
    if (!read_as(op["decimals"], decimals) || decimals < 0 || decimals > 17) {
      add_error(result, child(path, "decimals"),
                "decimals must be an integer in 0..17");
    }
  }

  if (op["number_format"]) {
    std::string format;
    if (!read_as(op["number_format"], format) ||
        (format != "fixed" && format != "scientific")) {
      add_error(result, child(path, "number_format"),
                "number_format must be 'fixed' or 'scientific'");
    }
  }

  if (op["separator"]) {
    std::string separator;
    if (!read_as(op["separator"], separator)) {
      add_error(result, child(path, "separator"),
                "separator must be a string");
    }
  }

  if (kind == OperationKind::State) {
    if (!op["tokens"] || !op["tokens"].IsSequence() ||
        op["tokens"].size() == 0) {
      add_error(result, path,
                "state operations need a non-empty 'tokens' list");
    }
  }
  if (op["tokens"] && op["tokens"].IsSequence()) {
    for (size_t i = 0; i < op["tokens"].size(); ++i) {
      std::string token;
      if (!read_as(op["tokens"][i], token) || token.empty()) {
        add_error(result, child(child(path, "tokens"), std::to_string(i)),
                  "token must be a non-empty string");
      }
    }
  }

  if (op["setup"]) {
    if (!op["setup"].IsSequence()) {
      add_error(result, child(path, "setup"), "setup must be a sequence");
    } else {
      for (size_t i = 0; i < op["setup"].size(); ++i) {
        std::string command;
        auto entry_path = child(child(path, "setup"), std::to_string(i));
        if (!read_as(op["setup"][i], command) || command.empty()) {
          add_error(result, entry_path, "setup entry must be a string");
        } else if (command.find('?') != std::string::npos) {
          add_error(result, entry_path, "setup entries cannot be queries");
        }
      }
    }
  }

  std::optional<ReturnType> returns;
  if (op["returns"]) {
    std::string text;
    if (read_as(op["returns"], text)) {
      returns = parse_return_type(text);
    }
    if (!returns) {
      add_error(result, child(path, "returns"),
                "returns must be one of: none, number, text, bool, list");
    }
  }
  if (kind == OperationKind::Query && returns == ReturnType::None) {
    add_error(result, child(path, "returns"),
              "query operations must return a value");
  }
  if (kind && kind != OperationKind::Query && returns &&
      returns != ReturnType::None) {
    add_error(result, child(path, "returns"),
              "only query operations return a value");
  }

  if (op["raw"]) {
    bool raw = false;
    if (!read_as(op["raw"], raw)) {
      add_error(result, child(path, "raw"), "raw must be a boolean");
    } else if (raw && kind && kind != OperationKind::Query) {
      add_error(result, child(path, "raw"), "only queries can be raw");
    }
  }

  if (op["reply_field"]) {
    int field = 0;
    if (!read_as(op["reply_field"], field)) {
      add_error(result, child(path, "reply_field"),
                "reply_field must be an integer");
    }
  }
}

} // namespace

std::optional<std::string>
CapabilityValidator::decode_terminator(const std::string &text) {
  if (text == "LF")
    return std::string("\n");
  if (text == "CR")
    return std::string("\r");
  if (text == "CRLF")
    return std::string("\r\n");

  std::string decoded;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size()) {
      char next = text[i + 1];
      if (next == 'n') {
        decoded += '\n';
        ++i;
        continue;
      }
      if (next == 'r') {
        decoded += '\r';
        ++i;
        continue;
      }
    }
    decoded += text[i];
  }
  if (decoded.empty()) {
    return std::nullopt;
  }
  return decoded;
}

ValidationResult CapabilityValidator::validate(const YAML::Node &doc) {
  ValidationResult result;

  if (!doc.IsMap()) {
    add_error(result, {}, "Capability table must be a map");
    return result;
  }

  for (const char *key : {"instrument", "operations"}) {
    if (!doc[key]) {
      add_error(result, {},
                std::string("Missing required field '") + key + "'");
    }
  }

  if (doc["instrument"]) {
    if (!doc["instrument"].IsMap()) {
      add_error(result, {"instrument"}, "instrument must be a map");
    } else {
      require_string(doc["instrument"], "vendor", {"instrument"}, result,
                     true);
      require_string(doc["instrument"], "model", {"instrument"}, result,
                     true);
    }
  }

  if (doc["connection"]) {
    validate_connection(doc["connection"], result);
  }

  if (doc["operations"]) {
    if (!doc["operations"].IsMap()) {
      add_error(result, {"operations"}, "operations must be a map");
    } else if (doc["operations"].size() == 0) {
      add_error(result, {"operations"}, "operations must not be empty");
    } else {
      for (const auto &kv : doc["operations"]) {
        std::string name;
        if (!read_as(kv.first, name) || name.empty()) {
          add_error(result, {"operations"},
                    "operation names must be non-empty strings");
          continue;
        }
        validate_operation(name, kv.second, result);
      }
    }
  }

  return result;
}

ValidationResult
CapabilityValidator::validate_file(const std::string &yaml_path) {
  try {
    return validate(YAML::LoadFile(yaml_path));
  } catch (const YAML::Exception &ex) {
    ValidationResult result;
    add_error(result, {}, std::string("Cannot load YAML: ") + ex.what());
    return result;
  }
}

} // namespace labinst
