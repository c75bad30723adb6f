#include "AddressMap.hpp"
#include "ModbusError.hpp"
#include "../log.hpp"
#include <cstring>

namespace ptg {

namespace {

using A = Attribute;
using U = UnitKind;
using W = WireType;
using I = Indexing;

// Register map of the PowerTag Link gateway (firmware 001.008.007 and later).
// Order follows the Attribute enum; attribute_info() relies on it.
const AttributeInfo kAttributes[] = {
  {A::hardware_version, "hardware_version", U::GATEWAY, 0x0050, 6, W::STRING, I::NONE, true, false, 0},
  {A::serial_number, "serial_number", U::GATEWAY, 0x0064, 6, W::STRING, I::NONE, true, false, 0},
  {A::firmware_version, "firmware_version", U::GATEWAY, 0x0078, 6, W::STRING, I::NONE, true, false, 0},
  {A::status, "status", U::GATEWAY, 0x009E, 1, W::UINT16, I::NONE, true, false, 0},
  {A::date_time, "date_time", U::GATEWAY, 0x0073, 4, W::DATETIME, I::NONE, true, false, 0},

  {A::tag_current, "tag_current", U::TAG, 0x0BB7, 2, W::FLOAT32, I::PHASE, true, false, 0},
  {A::tag_voltage, "tag_voltage", U::TAG, 0x0BCB, 2, W::FLOAT32, I::LINE_VOLTAGE, true, false, 0},
  {A::tag_power_active, "tag_power_active", U::TAG, 0x0BED, 2, W::FLOAT32, I::PHASE, true, false, 0},
  {A::tag_power_active_total, "tag_power_active_total", U::TAG, 0x0BF3, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_power_apparent_total, "tag_power_apparent_total", U::TAG, 0x0C03, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_power_factor_total, "tag_power_factor_total", U::TAG, 0x0C0B, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_energy_active_total, "tag_energy_active_total", U::TAG, 0x0C83, 4, W::UINT64, I::NONE, true, false, 0},
  // FIXME: same register as the total counter; confirm the partial counter
  // address against the device documentation before relying on it.
  {A::tag_energy_active_partial, "tag_energy_active_partial", U::TAG, 0x0C83, 4, W::UINT64, I::NONE, true, false, 0},
  {A::tag_power_active_demand_total, "tag_power_active_demand_total", U::TAG, 0x0EB5, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_power_active_demand_total_maximum, "tag_power_active_demand_total_maximum", U::TAG, 0x0EB9, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_power_active_demand_total_maximum_timestamp, "tag_power_active_demand_total_maximum_timestamp", U::TAG, 0x0EBB, 4, W::DATETIME, I::NONE, true, false, 0},
  {A::tag_alarm_valid, "tag_alarm_valid", U::TAG, 0x0CE1, 1, W::BITMAP, I::NONE, true, false, 0},
  {A::tag_alarm, "tag_alarm", U::TAG, 0x0CE3, 1, W::BITMAP, I::NONE, true, false, 0},
  {A::tag_current_at_voltage_loss, "tag_current_at_voltage_loss", U::TAG, 0x0CE5, 2, W::FLOAT32, I::PHASE, true, false, 0},
  {A::tag_load_operating_time, "tag_load_operating_time", U::TAG, 0x0CEB, 2, W::UINT32, I::NONE, true, false, 0},
  {A::tag_load_operating_time_active_power_threshold, "tag_load_operating_time_active_power_threshold", U::TAG, 0x0CED, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_load_operating_time_start, "tag_load_operating_time_start", U::TAG, 0x0CEF, 4, W::DATETIME, I::NONE, true, false, 0},
  {A::tag_name, "tag_name", U::TAG, 0x7918, 10, W::STRING, I::NONE, true, true, 20},
  {A::tag_circuit, "tag_circuit", U::TAG, 0x7922, 3, W::STRING, I::NONE, true, true, 5},
  {A::tag_usage, "tag_usage", U::TAG, 0x7925, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_phase_sequence, "tag_phase_sequence", U::TAG, 0x7926, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_position, "tag_position", U::TAG, 0x7927, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_circuit_diagnostic, "tag_circuit_diagnostic", U::TAG, 0x7928, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_rated_current, "tag_rated_current", U::TAG, 0x7929, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_rated_voltage, "tag_rated_voltage", U::TAG, 0x792B, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_reset_peak_demands, "tag_reset_peak_demands", U::TAG, 0x792E, 1, W::UINT16, I::NONE, false, true, 0},
  {A::tag_power_supply_type, "tag_power_supply_type", U::TAG, 0x792F, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_product_type, "tag_product_type", U::TAG, 0x7930, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_slave_address, "tag_slave_address", U::TAG, 0x7931, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_rf_id, "tag_rf_id", U::TAG, 0x7932, 4, W::UINT64, I::NONE, true, false, 0},
  {A::tag_product_identifier, "tag_product_identifier", U::TAG, 0x7937, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_vendor_name, "tag_vendor_name", U::TAG, 0x7944, 16, W::STRING, I::NONE, true, false, 0},
  {A::tag_product_code, "tag_product_code", U::TAG, 0x7954, 16, W::STRING, I::NONE, true, false, 0},
  {A::tag_firmware_revision, "tag_firmware_revision", U::TAG, 0x7964, 6, W::STRING, I::NONE, true, false, 0},
  {A::tag_hardware_revision, "tag_hardware_revision", U::TAG, 0x796A, 6, W::STRING, I::NONE, true, false, 0},
  {A::tag_serial_number, "tag_serial_number", U::TAG, 0x7970, 10, W::STRING, I::NONE, true, false, 0},
  {A::tag_product_range, "tag_product_range", U::TAG, 0x797A, 8, W::STRING, I::NONE, true, false, 0},
  {A::tag_product_model, "tag_product_model", U::TAG, 0x7982, 8, W::STRING, I::NONE, true, false, 0},
  {A::tag_product_family, "tag_product_family", U::TAG, 0x798A, 8, W::STRING, I::NONE, true, false, 0},
  {A::tag_radio_communication_valid, "tag_radio_communication_valid", U::TAG, 0x79A8, 1, W::BITMAP, I::NONE, true, false, 0},
  {A::tag_wireless_communication_valid, "tag_wireless_communication_valid", U::TAG, 0x79A9, 1, W::BITMAP, I::NONE, true, false, 0},
  {A::tag_radio_per_gateway, "tag_radio_per_gateway", U::TAG, 0x79AF, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_rssi_inside_gateway, "tag_radio_rssi_inside_gateway", U::TAG, 0x79B1, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_lqi_gateway, "tag_radio_lqi_gateway", U::TAG, 0x79B3, 1, W::UINT16, I::NONE, true, false, 0},
  {A::tag_radio_per_tag, "tag_radio_per_tag", U::TAG, 0x79B4, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_rssi_inside_tag, "tag_radio_rssi_inside_tag", U::TAG, 0x79B6, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_lqi_tag, "tag_radio_lqi_tag", U::TAG, 0x79B8, 1, W::UINT16, I::NONE, true, false, 0},
  // The min/max radio figures share registers with the per-tag ones in the
  // published map. Kept as published until checked on hardware.
  {A::tag_radio_per_maximum, "tag_radio_per_maximum", U::TAG, 0x79B4, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_rssi_minimum, "tag_radio_rssi_minimum", U::TAG, 0x79B6, 2, W::FLOAT32, I::NONE, true, false, 0},
  {A::tag_radio_lqi_minimum, "tag_radio_lqi_minimum", U::TAG, 0x79B8, 1, W::UINT16, I::NONE, true, false, 0},

  {A::product_id, "product_id", U::SYNTHESIS_TABLE, 0x0001, 1, W::UINT16, I::NONE, true, false, 0},
  {A::manufacturer, "manufacturer", U::SYNTHESIS_TABLE, 0x0002, 16, W::STRING, I::NONE, true, false, 0},
  {A::product_code, "product_code", U::SYNTHESIS_TABLE, 0x0012, 16, W::STRING, I::NONE, true, false, 0},
  {A::product_range, "product_range", U::SYNTHESIS_TABLE, 0x0022, 8, W::STRING, I::NONE, true, false, 0},
  {A::product_model, "product_model", U::SYNTHESIS_TABLE, 0x002A, 8, W::STRING, I::NONE, true, false, 0},
  {A::name, "name", U::SYNTHESIS_TABLE, 0x0032, 10, W::STRING, I::NONE, true, false, 0},
  {A::product_vendor_url, "product_vendor_url", U::SYNTHESIS_TABLE, 0x003C, 17, W::STRING, I::NONE, true, false, 0},
  {A::modbus_address_of_node, "modbus_address_of_node", U::SYNTHESIS_TABLE, 0x012C, 1, W::UINT16, I::NODE_SLOT, true, false, 0},
};

constexpr int kAttributeCount = static_cast<int>(sizeof(kAttributes) / sizeof(kAttributes[0]));

int index_mismatch(const AttributeInfo& info, const char* given) {
  ptg::log::log_error(__FILE__, __LINE__, "%s: cannot be addressed by %s", info.name, given);
  return static_cast<int>(Err::INVALID_ARG);
}

RegisterSpan span_at(const AttributeInfo& info, int offset) {
  RegisterSpan s;
  s.address = static_cast<std::uint16_t>(info.base + offset);
  s.count = info.count;
  s.type = info.type;
  return s;
}

} // namespace

const char* to_string(Phase p) {
  switch (p) {
    case Phase::A: return "A";
    case Phase::B: return "B";
    case Phase::C: return "C";
  }
  return "?";
}

const char* to_string(LineVoltage lv) {
  switch (lv) {
    case LineVoltage::A_B: return "A_B";
    case LineVoltage::B_C: return "B_C";
    case LineVoltage::C_A: return "C_A";
    case LineVoltage::A_N: return "A_N";
    case LineVoltage::B_N: return "B_N";
    case LineVoltage::C_N: return "C_N";
  }
  return "?";
}

bool parse_phase(const std::string& s, Phase& out) {
  static const Phase all[] = {Phase::A, Phase::B, Phase::C};
  for (Phase p : all) {
    if (s == to_string(p)) { out = p; return true; }
  }
  return false;
}

bool parse_line_voltage(const std::string& s, LineVoltage& out) {
  static const LineVoltage all[] = {LineVoltage::A_B, LineVoltage::B_C, LineVoltage::C_A,
                                    LineVoltage::A_N, LineVoltage::B_N, LineVoltage::C_N};
  for (LineVoltage lv : all) {
    if (s == to_string(lv)) { out = lv; return true; }
  }
  return false;
}

const AttributeInfo& attribute_info(Attribute a) {
  return kAttributes[static_cast<int>(a)];
}

const AttributeInfo* attribute_table(int& count) {
  count = kAttributeCount;
  return kAttributes;
}

bool find_attribute(const std::string& name, Attribute& out) {
  for (const AttributeInfo& info : kAttributes) {
    if (name == info.name) { out = info.attribute; return true; }
  }
  return false;
}

int resolve_address(Attribute a, RegisterSpan& out) {
  const AttributeInfo& info = attribute_info(a);
  if (info.indexing != Indexing::NONE) return index_mismatch(info, "no index");
  out = span_at(info, 0);
  return 0;
}

int resolve_address(Attribute a, Phase phase, RegisterSpan& out) {
  const AttributeInfo& info = attribute_info(a);
  if (info.indexing != Indexing::PHASE) return index_mismatch(info, "phase");
  out = span_at(info, static_cast<int>(phase));
  return 0;
}

int resolve_address(Attribute a, LineVoltage lv, RegisterSpan& out) {
  const AttributeInfo& info = attribute_info(a);
  if (info.indexing != Indexing::LINE_VOLTAGE) return index_mismatch(info, "line voltage");
  out = span_at(info, static_cast<int>(lv));
  return 0;
}

int resolve_node_slot(int slot, RegisterSpan& out) {
  if (slot < 1 || slot > kNodeSlots) {
    ptg::log::log_error(__FILE__, __LINE__, "node slot %d outside [1, %d]", slot, kNodeSlots);
    return static_cast<int>(Err::INVALID_ARG);
  }
  out = span_at(attribute_info(Attribute::modbus_address_of_node), slot - 1);
  return 0;
}

} // namespace ptg
