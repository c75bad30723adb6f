#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "AddressMap.hpp"
#include "DomainTypes.hpp"
#include "IModbusClient.hpp"
#include "RegisterCodec.hpp"

namespace ptg {

// Typed accessors for a PowerTag Link gateway, its wireless tags and its
// synthesis table. Every call is exactly one register read or write on the
// owned client and returns 0 or a negative ptg::Err / device exception code.
// Not thread-safe: callers serialize access.
class PowerTagGateway {
public:
  // Connects the client and locates the synthesis table. On failure out is
  // left empty and the client is closed.
  static int open(std::unique_ptr<IModbusClient> client, std::unique_ptr<PowerTagGateway>& out);

  ~PowerTagGateway();
  PowerTagGateway(const PowerTagGateway&) = delete;
  PowerTagGateway& operator=(const PowerTagGateway&) = delete;

  int synthesis_unit() const { return synthesis_unit_; }
  IModbusClient& client() { return *client_; }

  // Gateway identification and status
  int hardware_version(Reading<std::string>& out);
  int serial_number(Reading<std::string>& out);
  int firmware_version(Reading<std::string>& out);
  int status(Reading<GatewayStatus>& out);
  int date_time(Reading<DateTime>& out);

  // Metering
  int tag_current(int tag, Phase phase, Reading<float>& out);
  int tag_voltage(int tag, LineVoltage lv, Reading<float>& out);
  int tag_power_active(int tag, Phase phase, Reading<float>& out);
  int tag_power_active_total(int tag, Reading<float>& out);
  int tag_power_apparent_total(int tag, Reading<float>& out);
  int tag_power_factor_total(int tag, Reading<float>& out);

  // Energy (Wh)
  int tag_energy_active_total(int tag, Reading<std::uint64_t>& out);
  int tag_energy_active_partial(int tag, Reading<std::uint64_t>& out);

  // Demand
  int tag_power_active_demand_total(int tag, Reading<float>& out);
  int tag_power_active_demand_total_maximum(int tag, Reading<float>& out);
  int tag_power_active_demand_total_maximum_timestamp(int tag, Reading<DateTime>& out);

  // Alarms
  int tag_is_alarm_valid(int tag, bool& out);
  int tag_alarm(int tag, AlarmStatus& out);
  int tag_current_at_voltage_loss(int tag, Phase phase, Reading<float>& out);

  // Load operating time
  int tag_load_operating_time(int tag, Reading<std::uint32_t>& out);
  int tag_load_operating_time_active_power_threshold(int tag, Reading<float>& out);
  int tag_load_operating_time_start(int tag, Reading<DateTime>& out);

  // Configuration
  int tag_name(int tag, Reading<std::string>& out);
  int set_tag_name(int tag, const std::string& name);          // at most 20 chars
  int tag_circuit(int tag, Reading<std::string>& out);
  int set_tag_circuit(int tag, const std::string& circuit);    // at most 5 chars
  int tag_usage(int tag, DeviceUsage& out);
  int tag_phase_sequence(int tag, PhaseSequence& out);
  int tag_position(int tag, Position& out);
  int tag_circuit_diagnostic(int tag, Position& out);
  int tag_rated_current(int tag, Reading<std::uint16_t>& out);
  int tag_rated_voltage(int tag, Reading<float>& out);
  int tag_reset_peak_demands(int tag);
  int tag_power_supply_type(int tag, Position& out);

  // Device identification; product type is nullptr for codes not in the table.
  int tag_product_type(int tag, const ProductTypeEntry*& out);
  int tag_slave_address(int tag, Reading<std::uint16_t>& out);
  int tag_rf_id(int tag, Reading<std::uint64_t>& out);
  int tag_product_identifier(int tag, Reading<std::uint16_t>& out);
  int tag_vendor_name(int tag, Reading<std::string>& out);
  int tag_product_code(int tag, Reading<std::string>& out);
  int tag_firmware_revision(int tag, Reading<std::string>& out);
  int tag_hardware_revision(int tag, Reading<std::string>& out);
  int tag_serial_number(int tag, Reading<std::string>& out);
  int tag_product_range(int tag, Reading<std::string>& out);
  int tag_product_model(int tag, Reading<std::string>& out);
  int tag_product_family(int tag, Reading<std::string>& out);

  // Radio diagnostics
  int tag_radio_communication_valid(int tag, bool& out);
  int tag_wireless_communication_valid(int tag, bool& out);
  int tag_radio_per_tag(int tag, Reading<float>& out);
  int tag_radio_rssi_inside_tag(int tag, Reading<float>& out);
  int tag_radio_lqi_tag(int tag, Reading<std::uint16_t>& out);
  int tag_radio_per_gateway(int tag, Reading<float>& out);
  int tag_radio_rssi_inside_gateway(int tag, Reading<float>& out);
  int tag_radio_lqi_gateway(int tag, Reading<std::uint16_t>& out);
  int tag_radio_per_maximum(int tag, Reading<float>& out);
  int tag_radio_rssi_minimum(int tag, Reading<float>& out);
  int tag_radio_lqi_minimum(int tag, Reading<std::uint16_t>& out);

  // Synthesis table
  int product_id(Reading<std::uint16_t>& out);
  int manufacturer(Reading<std::string>& out);
  int product_code(Reading<std::string>& out);
  int product_range(Reading<std::string>& out);
  int product_model(Reading<std::string>& out);
  int name(Reading<std::string>& out);
  int product_vendor_url(Reading<std::string>& out);
  int modbus_address_of_node(int node, Reading<std::uint16_t>& out);

private:
  PowerTagGateway(std::unique_ptr<IModbusClient> client, int synthesis_unit);

  int read_span(int unit, const RegisterSpan& span, std::vector<std::uint16_t>& regs);
  int write_span(int unit, std::uint16_t address, const std::vector<std::uint16_t>& words);

  int read_u16(int unit, const RegisterSpan& span, Reading<std::uint16_t>& out);
  int read_u32(int unit, const RegisterSpan& span, Reading<std::uint32_t>& out);
  int read_u64(int unit, const RegisterSpan& span, Reading<std::uint64_t>& out);
  int read_f32(int unit, const RegisterSpan& span, Reading<float>& out);
  int read_string(int unit, const RegisterSpan& span, Reading<std::string>& out);
  int read_datetime(int unit, const RegisterSpan& span, Reading<DateTime>& out);
  int read_bitmap(int unit, const RegisterSpan& span, std::uint16_t& out);

  // Same, for attributes without an index.
  int read_u16(int unit, Attribute a, Reading<std::uint16_t>& out);
  int read_u32(int unit, Attribute a, Reading<std::uint32_t>& out);
  int read_u64(int unit, Attribute a, Reading<std::uint64_t>& out);
  int read_f32(int unit, Attribute a, Reading<float>& out);
  int read_string(int unit, Attribute a, Reading<std::string>& out);
  int read_datetime(int unit, Attribute a, Reading<DateTime>& out);
  int read_bitmap(int unit, Attribute a, std::uint16_t& out);

  int write_string(int unit, Attribute a, const std::string& s);

  std::unique_ptr<IModbusClient> client_;
  const int synthesis_unit_;
};

} // namespace ptg
