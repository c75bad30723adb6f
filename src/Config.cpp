#include "GatewayConfig.hpp"
#include "ModbusError.hpp"
#include "log.hpp"
#include <fstream>
#include <iterator>
#include <set>

namespace ptg {

namespace {

int reject(const char* what, const std::string& detail) {
  ptg::log::log_error(__FILE__, __LINE__, "config: %s '%s'", what, detail.c_str());
  return static_cast<int>(Err::PARSE_ERROR);
}

// Integer member in [lo, hi]; an absent key leaves out untouched. Floats and
// values that do not fit are rejected rather than narrowed.
bool read_int(const nlohmann::json& obj, const char* key, long long lo, long long hi, int& out) {
  if (!obj.contains(key)) return true;
  const nlohmann::json& v = obj[key];
  if (!v.is_number_integer()) return false;
  long long n = 0;
  if (v.is_number_unsigned()) {
    unsigned long long u = v.get<unsigned long long>();
    if (u > static_cast<unsigned long long>(hi)) return false;
    n = static_cast<long long>(u);
  } else {
    n = v.get<long long>();
  }
  if (n < lo || n > hi) return false;
  out = static_cast<int>(n);
  return true;
}

bool load_file(const char* path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
  return true;
}

int parse_item(const nlohmann::json& it, ItemCfg& ic) {
  if (!it.is_object()) return reject("item is not an object", it.dump());
  ic.name = it.value("name", std::string());
  if (ic.name.empty()) return reject("item without name", it.dump());

  const std::string attr = it.value("attribute", std::string());
  if (!find_attribute(attr, ic.attribute)) return reject("unknown attribute", attr);
  const AttributeInfo& info = attribute_info(ic.attribute);

  if (info.unit == UnitKind::TAG) {
    ic.unit_id = 0;
    if (!read_int(it, "unit_id", 1, 247, ic.unit_id) || ic.unit_id == 0) {
      return reject("unit_id must be an integer in [1,247] for", ic.name);
    }
  } else if (it.contains("unit_id")) {
    return reject("unit_id not allowed for", ic.name);
  }

  switch (info.indexing) {
    case Indexing::PHASE: {
      const std::string p = it.value("phase", std::string());
      if (!parse_phase(p, ic.phase)) return reject("phase must be A|B|C for", ic.name);
      break;
    }
    case Indexing::LINE_VOLTAGE: {
      const std::string lv = it.value("line_voltage", std::string());
      if (!parse_line_voltage(lv, ic.line_voltage)) {
        return reject("line_voltage must be A_B|B_C|C_A|A_N|B_N|C_N for", ic.name);
      }
      break;
    }
    case Indexing::NODE_SLOT:
      ic.node = 0;
      if (!read_int(it, "node", 1, kNodeSlots, ic.node) || ic.node == 0) {
        return reject("node must be an integer in [1,100] for", ic.name);
      }
      break;
    case Indexing::NONE:
      break;
  }
  return 0;
}

} // namespace

int parse_gateway_config(const nlohmann::json& cfg, GatewayConfig& out) {
  if (!cfg.is_object()) return reject("root is not an object", cfg.dump());
  GatewayConfig gc;
  try {
    gc.transport = cfg.value("transport", std::string("tcp"));
    if (gc.transport != "tcp") return reject("invalid transport (expected tcp)", gc.transport);

    if (cfg.contains("tcp")) {
      const nlohmann::json& t = cfg["tcp"];
      if (!t.is_object()) return reject("tcp is not an object", t.dump());
      gc.host = t.value("host", gc.host);
      if (!read_int(t, "port", 1, 65535, gc.port)) return reject("port must be an integer in [1,65535]", t["port"].dump());
      if (!read_int(t, "timeout_ms", 1, 2147483647LL, gc.timeout_ms)) {
        return reject("timeout_ms must be a positive integer", t["timeout_ms"].dump());
      }
    }
    if (gc.host.empty()) return reject("empty host", gc.host);

    if (!(cfg.contains("items") && cfg["items"].is_array() && !cfg["items"].empty())) {
      return reject("items must be a non-empty array", cfg.value("items", nlohmann::json()).dump());
    }
    std::set<std::string> names;
    for (const auto& it : cfg["items"]) {
      ItemCfg ic;
      int rc = parse_item(it, ic);
      if (rc != 0) return rc;
      if (!names.insert(ic.name).second) return reject("duplicate item name", ic.name);
      gc.items.push_back(ic);
    }
  } catch (const nlohmann::json::exception& e) {
    // value() throws type_error when a key holds the wrong JSON type
    return reject("invalid value", e.what());
  }

  ptg::log::log_info(__FILE__, __LINE__, "config: transport=%s host=%s port=%d timeout_ms=%d items=%d",
                     gc.transport.c_str(), gc.host.c_str(), gc.port, gc.timeout_ms,
                     static_cast<int>(gc.items.size()));
  out = gc;
  return 0;
}

int load_gateway_config(const char* path, GatewayConfig& out) {
  if (!path) return reject("config path", "(null)");
  std::string text;
  if (!load_file(path, text)) return reject("cannot read config", path);
  nlohmann::json cfg;
  try {
    cfg = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    return reject("invalid JSON", e.what());
  }
  return parse_gateway_config(cfg, out);
}

} // namespace ptg
