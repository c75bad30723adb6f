#pragma once

#include <cstdint>
#include <string>
#include "RegisterCodec.hpp"

namespace ptg {

constexpr int kGatewayUnit = 255;
constexpr int kSynthesisUnitFirst = 247;   // discovery probes downward from here
constexpr int kSynthesisUnitLast = 2;
constexpr int kNodeSlots = 100;

// Register offset from the attribute base, in words.
enum class Phase { A = 0, B = 2, C = 4 };
enum class LineVoltage { A_B = 0, B_C = 2, C_A = 4, A_N = 8, B_N = 10, C_N = 12 };

const char* to_string(Phase p);
const char* to_string(LineVoltage lv);
bool parse_phase(const std::string& s, Phase& out);
bool parse_line_voltage(const std::string& s, LineVoltage& out);

enum class Attribute {
  // gateway, unit 255
  hardware_version,
  serial_number,
  firmware_version,
  status,
  date_time,
  // wireless tag, unit = tag id
  tag_current,
  tag_voltage,
  tag_power_active,
  tag_power_active_total,
  tag_power_apparent_total,
  tag_power_factor_total,
  tag_energy_active_total,
  tag_energy_active_partial,
  tag_power_active_demand_total,
  tag_power_active_demand_total_maximum,
  tag_power_active_demand_total_maximum_timestamp,
  tag_alarm_valid,
  tag_alarm,
  tag_current_at_voltage_loss,
  tag_load_operating_time,
  tag_load_operating_time_active_power_threshold,
  tag_load_operating_time_start,
  tag_name,
  tag_circuit,
  tag_usage,
  tag_phase_sequence,
  tag_position,
  tag_circuit_diagnostic,
  tag_rated_current,
  tag_rated_voltage,
  tag_reset_peak_demands,
  tag_power_supply_type,
  tag_product_type,
  tag_slave_address,
  tag_rf_id,
  tag_product_identifier,
  tag_vendor_name,
  tag_product_code,
  tag_firmware_revision,
  tag_hardware_revision,
  tag_serial_number,
  tag_product_range,
  tag_product_model,
  tag_product_family,
  tag_radio_communication_valid,
  tag_wireless_communication_valid,
  tag_radio_per_gateway,
  tag_radio_rssi_inside_gateway,
  tag_radio_lqi_gateway,
  tag_radio_per_tag,
  tag_radio_rssi_inside_tag,
  tag_radio_lqi_tag,
  tag_radio_per_maximum,
  tag_radio_rssi_minimum,
  tag_radio_lqi_minimum,
  // synthesis table, discovered unit
  product_id,
  manufacturer,
  product_code,
  product_range,
  product_model,
  name,
  product_vendor_url,
  modbus_address_of_node,
};

enum class UnitKind { GATEWAY, TAG, SYNTHESIS_TABLE };
enum class Indexing { NONE, PHASE, LINE_VOLTAGE, NODE_SLOT };

struct AttributeInfo {
  Attribute attribute;
  const char* name;
  UnitKind unit;
  std::uint16_t base;
  std::uint16_t count;
  WireType type;
  Indexing indexing;
  bool readable;
  bool writable;
  int max_chars;     // writable strings only
};

struct RegisterSpan {
  std::uint16_t address{0};
  std::uint16_t count{0};
  WireType type{WireType::UINT16};
};

const AttributeInfo& attribute_info(Attribute a);
const AttributeInfo* attribute_table(int& count);
// Lookup by snake_case name; false if unknown.
bool find_attribute(const std::string& name, Attribute& out);

// Each returns 0, or INVALID_ARG if the index kind does not match the
// attribute or the node slot is outside [1, 100].
int resolve_address(Attribute a, RegisterSpan& out);
int resolve_address(Attribute a, Phase phase, RegisterSpan& out);
int resolve_address(Attribute a, LineVoltage lv, RegisterSpan& out);
int resolve_node_slot(int slot, RegisterSpan& out);

} // namespace ptg
