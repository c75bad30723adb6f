#include "IoHandler.hpp"
#include "ModbusError.hpp"
#include "PowerTagGateway.hpp"
#include "log.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>
#include <unordered_map>
#include <memory>
#include <utility>
#include <vector>

using nlohmann::json;

namespace ptg {

struct IoContext {
  GatewayConfig config;
  std::unordered_map<std::string, std::size_t> index;   // item name -> config.items
  ClientFactory factory;
  std::unique_ptr<PowerTagGateway> gateway;
};

static int open_gateway(IoContext& ctx) {
  ctx.gateway.reset();
  std::unique_ptr<IModbusClient> client = ctx.factory(ctx.config);
  if (!client) return static_cast<int>(Err::IO_ERROR);
  client->set_timeout_ms(ctx.config.timeout_ms);
  return PowerTagGateway::open(std::move(client), ctx.gateway);
}

static const ItemCfg* find_item(IoContext& ctx, const char* name) {
  auto it = ctx.index.find(name);
  return it == ctx.index.end() ? nullptr : &ctx.config.items[it->second];
}

// Unit and register span an item reads; unit is -1 while the synthesis
// table is unknown.
static int resolve_item(const IoContext& ctx, const ItemCfg& ic, int& unit, RegisterSpan& span) {
  const AttributeInfo& info = attribute_info(ic.attribute);
  switch (info.unit) {
    case UnitKind::GATEWAY: unit = kGatewayUnit; break;
    case UnitKind::TAG: unit = ic.unit_id; break;
    case UnitKind::SYNTHESIS_TABLE: unit = ctx.gateway ? ctx.gateway->synthesis_unit() : -1; break;
  }
  switch (info.indexing) {
    case Indexing::PHASE: return resolve_address(ic.attribute, ic.phase, span);
    case Indexing::LINE_VOLTAGE: return resolve_address(ic.attribute, ic.line_voltage, span);
    case Indexing::NODE_SLOT: return resolve_node_slot(ic.node, span);
    case Indexing::NONE: break;
  }
  return resolve_address(ic.attribute, span);
}

template <typename T>
static json to_json(const Reading<T>& r) {
  return r.present ? json(r.value) : json(nullptr);
}

// json would print infinities as null, which reads as absence.
static json to_json(const Reading<float>& r) {
  if (!r.present) return json(nullptr);
  if (std::isinf(r.value)) return json(r.value > 0 ? "inf" : "-inf");
  return json(r.value);
}

static json to_json(const Reading<DateTime>& r) {
  return r.present ? json(format_datetime(r.value)) : json(nullptr);
}

static json to_json(const AlarmStatus& a) {
  return json{
    {"has_alarm", a.has_alarm},
    {"alarm_voltage_loss", a.alarm_voltage_loss},
    {"alarm_current_overload", a.alarm_current_overload},
    {"alarm_overload_45_percent", a.alarm_overload_45_percent},
    {"alarm_load_current_loss", a.alarm_load_current_loss},
    {"alarm_overvoltage", a.alarm_overvoltage},
    {"alarm_undervoltage", a.alarm_undervoltage},
    {"alarm_heattag_alarm", a.alarm_heattag_alarm},
    {"alarm_heattag_maintenance", a.alarm_heattag_maintenance},
    {"alarm_heattag_replacement", a.alarm_heattag_replacement},
  };
}

static json to_json(const ProductTypeEntry* p) {
  if (!p) return json(nullptr);
  return json{{"code", p->code}, {"reference", p->reference}, {"label", p->label}};
}

static json error_json(int rc) {
  json e = {{"code", rc}, {"name", error_name(rc)}};
  if (is_modbus_exception(rc)) {
    std::uint8_t code = decode_modbus_exception(rc);
    e["exception"] = {{"code", code}, {"name", modbus_exception_to_string(code)}};
  }
  return json{{"error", e}};
}

template <typename V>
static int fetch(int rc, const V& v, json& out) {
  if (rc == 0) out = to_json(v);
  return rc;
}

// v is filled by the call that produced rc, so it must be taken by reference.
template <typename E>
static int fetch_enum(int rc, const E& v, json& out) {
  if (rc == 0) out = to_string(v);
  return rc;
}

static int fetch_flag(int rc, const bool& v, json& out) {
  if (rc == 0) out = v;
  return rc;
}

static int read_attribute(PowerTagGateway& gw, const ItemCfg& ic, json& out) {
  const int tag = ic.unit_id;
  Reading<float> f;
  Reading<std::uint16_t> u16;
  Reading<std::uint32_t> u32;
  Reading<std::uint64_t> u64;
  Reading<std::string> s;
  Reading<DateTime> dt;
  bool flag = false;

  switch (ic.attribute) {
    case Attribute::hardware_version: return fetch(gw.hardware_version(s), s, out);
    case Attribute::serial_number: return fetch(gw.serial_number(s), s, out);
    case Attribute::firmware_version: return fetch(gw.firmware_version(s), s, out);
    case Attribute::status: {
      Reading<GatewayStatus> st;
      int rc = gw.status(st);
      if (rc == 0) out = st.present ? json(to_string(st.value)) : json(nullptr);
      return rc;
    }
    case Attribute::date_time: return fetch(gw.date_time(dt), dt, out);

    case Attribute::tag_current: return fetch(gw.tag_current(tag, ic.phase, f), f, out);
    case Attribute::tag_voltage: return fetch(gw.tag_voltage(tag, ic.line_voltage, f), f, out);
    case Attribute::tag_power_active: return fetch(gw.tag_power_active(tag, ic.phase, f), f, out);
    case Attribute::tag_power_active_total: return fetch(gw.tag_power_active_total(tag, f), f, out);
    case Attribute::tag_power_apparent_total: return fetch(gw.tag_power_apparent_total(tag, f), f, out);
    case Attribute::tag_power_factor_total: return fetch(gw.tag_power_factor_total(tag, f), f, out);
    case Attribute::tag_energy_active_total: return fetch(gw.tag_energy_active_total(tag, u64), u64, out);
    case Attribute::tag_energy_active_partial: return fetch(gw.tag_energy_active_partial(tag, u64), u64, out);
    case Attribute::tag_power_active_demand_total:
      return fetch(gw.tag_power_active_demand_total(tag, f), f, out);
    case Attribute::tag_power_active_demand_total_maximum:
      return fetch(gw.tag_power_active_demand_total_maximum(tag, f), f, out);
    case Attribute::tag_power_active_demand_total_maximum_timestamp:
      return fetch(gw.tag_power_active_demand_total_maximum_timestamp(tag, dt), dt, out);
    case Attribute::tag_alarm_valid: return fetch_flag(gw.tag_is_alarm_valid(tag, flag), flag, out);
    case Attribute::tag_alarm: {
      AlarmStatus a;
      return fetch(gw.tag_alarm(tag, a), a, out);
    }
    case Attribute::tag_current_at_voltage_loss:
      return fetch(gw.tag_current_at_voltage_loss(tag, ic.phase, f), f, out);
    case Attribute::tag_load_operating_time: return fetch(gw.tag_load_operating_time(tag, u32), u32, out);
    case Attribute::tag_load_operating_time_active_power_threshold:
      return fetch(gw.tag_load_operating_time_active_power_threshold(tag, f), f, out);
    case Attribute::tag_load_operating_time_start:
      return fetch(gw.tag_load_operating_time_start(tag, dt), dt, out);

    case Attribute::tag_name: return fetch(gw.tag_name(tag, s), s, out);
    case Attribute::tag_circuit: return fetch(gw.tag_circuit(tag, s), s, out);
    case Attribute::tag_usage: {
      DeviceUsage v = DeviceUsage::INVALID;
      return fetch_enum(gw.tag_usage(tag, v), v, out);
    }
    case Attribute::tag_phase_sequence: {
      PhaseSequence v = PhaseSequence::INVALID;
      return fetch_enum(gw.tag_phase_sequence(tag, v), v, out);
    }
    case Attribute::tag_position: {
      Position v = Position::INVALID;
      return fetch_enum(gw.tag_position(tag, v), v, out);
    }
    case Attribute::tag_circuit_diagnostic: {
      Position v = Position::INVALID;
      return fetch_enum(gw.tag_circuit_diagnostic(tag, v), v, out);
    }
    case Attribute::tag_rated_current: return fetch(gw.tag_rated_current(tag, u16), u16, out);
    case Attribute::tag_rated_voltage: return fetch(gw.tag_rated_voltage(tag, f), f, out);
    case Attribute::tag_reset_peak_demands: return static_cast<int>(Err::UNSUPPORTED);
    case Attribute::tag_power_supply_type: {
      Position v = Position::INVALID;
      return fetch_enum(gw.tag_power_supply_type(tag, v), v, out);
    }

    case Attribute::tag_product_type: {
      const ProductTypeEntry* p = nullptr;
      return fetch(gw.tag_product_type(tag, p), p, out);
    }
    case Attribute::tag_slave_address: return fetch(gw.tag_slave_address(tag, u16), u16, out);
    case Attribute::tag_rf_id: return fetch(gw.tag_rf_id(tag, u64), u64, out);
    case Attribute::tag_product_identifier: return fetch(gw.tag_product_identifier(tag, u16), u16, out);
    case Attribute::tag_vendor_name: return fetch(gw.tag_vendor_name(tag, s), s, out);
    case Attribute::tag_product_code: return fetch(gw.tag_product_code(tag, s), s, out);
    case Attribute::tag_firmware_revision: return fetch(gw.tag_firmware_revision(tag, s), s, out);
    case Attribute::tag_hardware_revision: return fetch(gw.tag_hardware_revision(tag, s), s, out);
    case Attribute::tag_serial_number: return fetch(gw.tag_serial_number(tag, s), s, out);
    case Attribute::tag_product_range: return fetch(gw.tag_product_range(tag, s), s, out);
    case Attribute::tag_product_model: return fetch(gw.tag_product_model(tag, s), s, out);
    case Attribute::tag_product_family: return fetch(gw.tag_product_family(tag, s), s, out);

    case Attribute::tag_radio_communication_valid:
      return fetch_flag(gw.tag_radio_communication_valid(tag, flag), flag, out);
    case Attribute::tag_wireless_communication_valid:
      return fetch_flag(gw.tag_wireless_communication_valid(tag, flag), flag, out);
    case Attribute::tag_radio_per_gateway: return fetch(gw.tag_radio_per_gateway(tag, f), f, out);
    case Attribute::tag_radio_rssi_inside_gateway: return fetch(gw.tag_radio_rssi_inside_gateway(tag, f), f, out);
    case Attribute::tag_radio_lqi_gateway: return fetch(gw.tag_radio_lqi_gateway(tag, u16), u16, out);
    case Attribute::tag_radio_per_tag: return fetch(gw.tag_radio_per_tag(tag, f), f, out);
    case Attribute::tag_radio_rssi_inside_tag: return fetch(gw.tag_radio_rssi_inside_tag(tag, f), f, out);
    case Attribute::tag_radio_lqi_tag: return fetch(gw.tag_radio_lqi_tag(tag, u16), u16, out);
    case Attribute::tag_radio_per_maximum: return fetch(gw.tag_radio_per_maximum(tag, f), f, out);
    case Attribute::tag_radio_rssi_minimum: return fetch(gw.tag_radio_rssi_minimum(tag, f), f, out);
    case Attribute::tag_radio_lqi_minimum: return fetch(gw.tag_radio_lqi_minimum(tag, u16), u16, out);

    case Attribute::product_id: return fetch(gw.product_id(u16), u16, out);
    case Attribute::manufacturer: return fetch(gw.manufacturer(s), s, out);
    case Attribute::product_code: return fetch(gw.product_code(s), s, out);
    case Attribute::product_range: return fetch(gw.product_range(s), s, out);
    case Attribute::product_model: return fetch(gw.product_model(s), s, out);
    case Attribute::name: return fetch(gw.name(s), s, out);
    case Attribute::product_vendor_url: return fetch(gw.product_vendor_url(s), s, out);
    case Attribute::modbus_address_of_node: return fetch(gw.modbus_address_of_node(ic.node, u16), u16, out);
  }
  return static_cast<int>(Err::UNSUPPORTED);
}

static int write_attribute(PowerTagGateway& gw, const ItemCfg& ic, const json& v) {
  switch (ic.attribute) {
    case Attribute::tag_name:
      if (!v.is_string()) return static_cast<int>(Err::PARSE_ERROR);
      return gw.set_tag_name(ic.unit_id, v.get<std::string>());
    case Attribute::tag_circuit:
      if (!v.is_string()) return static_cast<int>(Err::PARSE_ERROR);
      return gw.set_tag_circuit(ic.unit_id, v.get<std::string>());
    case Attribute::tag_reset_peak_demands: {
      // true or 1 triggers the reset
      bool go = false;
      if (v.is_boolean()) go = v.get<bool>();
      else if (v.is_number_integer()) go = (v.get<long long>() == 1);
      else return static_cast<int>(Err::PARSE_ERROR);
      if (!go) return static_cast<int>(Err::INVALID_ARG);
      return gw.tag_reset_peak_demands(ic.unit_id);
    }
    default:
      return static_cast<int>(Err::UNSUPPORTED);
  }
}

static void* create_from_config(const GatewayConfig& config, ClientFactory factory) {
  if (!factory) return nullptr;
  std::unique_ptr<IoContext> ctx(new IoContext());
  ctx->config = config;
  ctx->factory = std::move(factory);
  for (std::size_t i = 0; i < ctx->config.items.size(); ++i) {
    ctx->index.emplace(ctx->config.items[i].name, i);
  }

  int rc = open_gateway(*ctx);
  if (rc != 0) {
    ptg::log::log_warn(__FILE__, __LINE__,
                       "gateway %s:%d not available (%s, %d); reads fail until connection.reconnect",
                       ctx->config.host.c_str(), ctx->config.port, error_name(rc), rc);
  }
  return ctx.release();
}

void* create_instance(const json& cfg, ClientFactory factory) {
  GatewayConfig config;
  if (parse_gateway_config(cfg, config) != 0) return nullptr;
  return create_from_config(config, std::move(factory));
}

} // namespace ptg

static bool write_str(char* out, int outSize, const std::string& s) {
  if (!out || outSize <= 0) return false;
  size_t len = s.size();
  size_t n = (len >= static_cast<size_t>(outSize)) ? static_cast<size_t>(outSize - 1) : len;
  std::memcpy(out, s.data(), n);
  out[n] = '\0';
  return n == len;
}

static void write_json(char* out, int outSize, const json& j) {
  if (!out) return;
  // replace: non-UTF-8 tag strings must not throw
  std::string s = j.dump(-1, ' ', false, json::error_handler_t::replace);
  if (!write_str(out, outSize, s)) {
    ptg::log::log_warn(__FILE__, __LINE__, "output truncated to %d bytes (need %d)",
                       outSize - 1, static_cast<int>(s.size()));
  }
}

extern "C" {

PTG_API IoHandle CreateIoInstance(void* /*user_param*/, const char* jsonConfigPath) {
  if (!jsonConfigPath) {
    ptg::log::log_error(__FILE__, __LINE__, "CreateIoInstance: jsonConfigPath=nullptr");
    return nullptr;
  }
  ptg::GatewayConfig config;
  if (ptg::load_gateway_config(jsonConfigPath, config) != 0) return nullptr;
  return ptg::create_from_config(config, [](const ptg::GatewayConfig& c) {
    return ptg::make_tcp_client(c.host, c.port);
  });
}

PTG_API void DestroyIoInstance(IoHandle h) {
  auto* ctx = reinterpret_cast<ptg::IoContext*>(h);
  delete ctx;
}

PTG_API int ReadItem(IoHandle h, const char* name, /*out*/char* outJson, int outSize) {
  auto* ctx = reinterpret_cast<ptg::IoContext*>(h);
  if (!ctx || !name) return static_cast<int>(ptg::Err::INVALID_ARG);
  const ptg::ItemCfg* ic = ptg::find_item(*ctx, name);
  int rc = static_cast<int>(ptg::Err::NOT_FOUND);
  json value;
  if (ic) {
    if (!ctx->gateway) rc = static_cast<int>(ptg::Err::NOT_CONNECTED);
    else if (!ptg::attribute_info(ic->attribute).readable) rc = static_cast<int>(ptg::Err::UNSUPPORTED);
    else rc = ptg::read_attribute(*ctx->gateway, *ic, value);
  }
  if (rc != 0) {
    ptg::log::log_debug(__FILE__, __LINE__, "ReadItem %s: %s (%d)", name, ptg::error_name(rc), rc);
    write_json(outJson, outSize, ptg::error_json(rc));
    return rc;
  }
  write_json(outJson, outSize, value);
  return 0;
}

PTG_API int WriteItem(IoHandle h, const char* name, const char* valueJson) {
  auto* ctx = reinterpret_cast<ptg::IoContext*>(h);
  if (!ctx || !name || !valueJson) return static_cast<int>(ptg::Err::INVALID_ARG);
  const ptg::ItemCfg* ic = ptg::find_item(*ctx, name);
  if (!ic) return static_cast<int>(ptg::Err::NOT_FOUND);
  if (!ptg::attribute_info(ic->attribute).writable) return static_cast<int>(ptg::Err::UNSUPPORTED);
  if (!ctx->gateway) return static_cast<int>(ptg::Err::NOT_CONNECTED);

  json v;
  try { v = json::parse(valueJson); }
  catch (const json::parse_error&) { return static_cast<int>(ptg::Err::PARSE_ERROR); }
  return ptg::write_attribute(*ctx->gateway, *ic, v);
}

PTG_API int CallMethod(IoHandle h, const char* method, const char* paramsJson, /*out*/char* outJson, int outSize) {
  auto* ctx = reinterpret_cast<ptg::IoContext*>(h);
  if (!ctx || !method) return static_cast<int>(ptg::Err::INVALID_ARG);
  std::string m(method);

  if (m == "connection.reconnect") {
    int rc = ptg::open_gateway(*ctx);
    if (rc != 0) {
      write_json(outJson, outSize, ptg::error_json(rc));
      return rc;
    }
    write_json(outJson, outSize, json{{"ok", true}, {"synthesis_unit", ctx->gateway->synthesis_unit()}});
    return 0;
  }

  if (m == "gateway.describe") {
    json items = json::array();
    for (const ptg::ItemCfg& ic : ctx->config.items) {
      const ptg::AttributeInfo& info = ptg::attribute_info(ic.attribute);
      int unit = -1;
      ptg::RegisterSpan span;
      int rc = ptg::resolve_item(*ctx, ic, unit, span);
      if (rc != 0) return rc;
      items.push_back({
        {"name", ic.name},
        {"attribute", info.name},
        {"unit_id", unit < 0 ? json(nullptr) : json(unit)},
        {"address", span.address},
        {"count", span.count},
        {"type", ptg::wire_type_name(span.type)},
        {"writable", info.writable},
      });
    }
    json out = {
      {"synthesis_unit", ctx->gateway ? json(ctx->gateway->synthesis_unit()) : json(nullptr)},
      {"items", items},
    };
    write_json(outJson, outSize, out);
    return 0;
  }

  if (m == "logger.set") {
    json p;
    try { p = json::parse(paramsJson ? paramsJson : "{}"); }
    catch (const json::parse_error&) { return static_cast<int>(ptg::Err::PARSE_ERROR); }
    if (!p.is_object() || !p.contains("level") || !p["level"].is_string()) {
      return static_cast<int>(ptg::Err::PARSE_ERROR);
    }
    const std::string level = p["level"].get<std::string>();
    ptg::log::Level lv;
    if (!ptg::log::try_parse_level(level.c_str(), lv)) {
      ptg::log::log_error(__FILE__, __LINE__, "logger.set: unknown level '%s'", level.c_str());
      return static_cast<int>(ptg::Err::PARSE_ERROR);
    }
    ptg::log::set_level(lv);
    write_json(outJson, outSize, json{{"ok", true}, {"level", ptg::log::level_name(lv)}});
    return 0;
  }

  return static_cast<int>(ptg::Err::UNSUPPORTED);
}

} // extern "C"
