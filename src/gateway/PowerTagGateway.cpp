#include "PowerTagGateway.hpp"
#include "ModbusError.hpp"
#include "UnitDiscovery.hpp"
#include "../log.hpp"
#include <utility>

namespace ptg {

int PowerTagGateway::open(std::unique_ptr<IModbusClient> client, std::unique_ptr<PowerTagGateway>& out) {
  out.reset();
  if (!client) return static_cast<int>(Err::INVALID_ARG);
  int rc = client->connect();
  if (rc != 0) {
    ptg::log::log_error(__FILE__, __LINE__, "connect failed: %s (%d)", error_name(rc), rc);
    return rc;
  }
  int unit = 0;
  rc = find_synthesis_table_unit(*client, unit);
  if (rc != 0) {
    client->close();
    return rc;
  }
  out.reset(new PowerTagGateway(std::move(client), unit));
  return 0;
}

PowerTagGateway::PowerTagGateway(std::unique_ptr<IModbusClient> client, int synthesis_unit)
: client_(std::move(client)), synthesis_unit_(synthesis_unit) {}

PowerTagGateway::~PowerTagGateway() {
  if (client_) client_->close();
}

// ---- transport ---------------------------------------------------------

int PowerTagGateway::read_span(int unit, const RegisterSpan& span, std::vector<std::uint16_t>& regs) {
  if (!is_valid_unit(unit)) {
    ptg::log::log_error(__FILE__, __LINE__, "read 0x%04X: unit %d outside [1,247] and not 255",
                        span.address, unit);
    return static_cast<int>(Err::INVALID_ARG);
  }
  ptg::log::log_trace(__FILE__, __LINE__, "read unit=%d addr=0x%04X count=%d",
                      unit, span.address, span.count);
  return client_->read_holding_regs(unit, span.address, span.count, regs);
}

int PowerTagGateway::write_span(int unit, std::uint16_t address, const std::vector<std::uint16_t>& words) {
  if (!is_valid_unit(unit)) {
    ptg::log::log_error(__FILE__, __LINE__, "write 0x%04X: unit %d outside [1,247] and not 255",
                        address, unit);
    return static_cast<int>(Err::INVALID_ARG);
  }
  ptg::log::log_debug(__FILE__, __LINE__, "write unit=%d addr=0x%04X count=%d",
                      unit, address, static_cast<int>(words.size()));
  return client_->write_multiple_regs(unit, address, static_cast<int>(words.size()), words.data());
}

// ---- typed reads -------------------------------------------------------

int PowerTagGateway::read_u16(int unit, const RegisterSpan& span, Reading<std::uint16_t>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_u16(regs, out);
}

int PowerTagGateway::read_u32(int unit, const RegisterSpan& span, Reading<std::uint32_t>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_u32(regs, out);
}

int PowerTagGateway::read_u64(int unit, const RegisterSpan& span, Reading<std::uint64_t>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_u64(regs, out);
}

int PowerTagGateway::read_f32(int unit, const RegisterSpan& span, Reading<float>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_f32(regs, out);
}

int PowerTagGateway::read_string(int unit, const RegisterSpan& span, Reading<std::string>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_string(regs, span.count, out);
}

int PowerTagGateway::read_datetime(int unit, const RegisterSpan& span, Reading<DateTime>& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_datetime(regs, out);
}

int PowerTagGateway::read_bitmap(int unit, const RegisterSpan& span, std::uint16_t& out) {
  std::vector<std::uint16_t> regs;
  int rc = read_span(unit, span, regs);
  if (rc != 0) return rc;
  return decode_bitmap(regs, out);
}

int PowerTagGateway::read_u16(int unit, Attribute a, Reading<std::uint16_t>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_u16(unit, span, out);
}

int PowerTagGateway::read_u32(int unit, Attribute a, Reading<std::uint32_t>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_u32(unit, span, out);
}

int PowerTagGateway::read_u64(int unit, Attribute a, Reading<std::uint64_t>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_u64(unit, span, out);
}

int PowerTagGateway::read_f32(int unit, Attribute a, Reading<float>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_f32(unit, span, out);
}

int PowerTagGateway::read_string(int unit, Attribute a, Reading<std::string>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_string(unit, span, out);
}

int PowerTagGateway::read_datetime(int unit, Attribute a, Reading<DateTime>& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_datetime(unit, span, out);
}

int PowerTagGateway::read_bitmap(int unit, Attribute a, std::uint16_t& out) {
  RegisterSpan span;
  int rc = resolve_address(a, span);
  return rc != 0 ? rc : read_bitmap(unit, span, out);
}

int PowerTagGateway::write_string(int unit, Attribute a, const std::string& s) {
  const AttributeInfo& info = attribute_info(a);
  if (static_cast<int>(s.size()) > info.max_chars) {
    ptg::log::log_error(__FILE__, __LINE__, "%s: %d characters, at most %d allowed",
                        info.name, static_cast<int>(s.size()), info.max_chars);
    return static_cast<int>(Err::INVALID_ARG);
  }
  RegisterSpan span;
  int rc = resolve_address(a, span);
  if (rc != 0) return rc;
  std::vector<std::uint16_t> words;
  rc = encode_string(s, span.count, words);
  if (rc != 0) return rc;
  return write_span(unit, span.address, words);
}

// ---- gateway -----------------------------------------------------------

int PowerTagGateway::hardware_version(Reading<std::string>& out) {
  return read_string(kGatewayUnit, Attribute::hardware_version, out);
}

int PowerTagGateway::serial_number(Reading<std::string>& out) {
  return read_string(kGatewayUnit, Attribute::serial_number, out);
}

int PowerTagGateway::firmware_version(Reading<std::string>& out) {
  return read_string(kGatewayUnit, Attribute::firmware_version, out);
}

int PowerTagGateway::status(Reading<GatewayStatus>& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(kGatewayUnit, Attribute::status, raw);
  if (rc != 0) return rc;
  return gateway_status_from_raw(raw, out);
}

int PowerTagGateway::date_time(Reading<DateTime>& out) {
  return read_datetime(kGatewayUnit, Attribute::date_time, out);
}

// ---- metering ----------------------------------------------------------

int PowerTagGateway::tag_current(int tag, Phase phase, Reading<float>& out) {
  RegisterSpan span;
  int rc = resolve_address(Attribute::tag_current, phase, span);
  return rc != 0 ? rc : read_f32(tag, span, out);
}

int PowerTagGateway::tag_voltage(int tag, LineVoltage lv, Reading<float>& out) {
  RegisterSpan span;
  int rc = resolve_address(Attribute::tag_voltage, lv, span);
  return rc != 0 ? rc : read_f32(tag, span, out);
}

int PowerTagGateway::tag_power_active(int tag, Phase phase, Reading<float>& out) {
  RegisterSpan span;
  int rc = resolve_address(Attribute::tag_power_active, phase, span);
  return rc != 0 ? rc : read_f32(tag, span, out);
}

int PowerTagGateway::tag_power_active_total(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_power_active_total, out);
}

int PowerTagGateway::tag_power_apparent_total(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_power_apparent_total, out);
}

int PowerTagGateway::tag_power_factor_total(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_power_factor_total, out);
}

int PowerTagGateway::tag_energy_active_total(int tag, Reading<std::uint64_t>& out) {
  return read_u64(tag, Attribute::tag_energy_active_total, out);
}

int PowerTagGateway::tag_energy_active_partial(int tag, Reading<std::uint64_t>& out) {
  return read_u64(tag, Attribute::tag_energy_active_partial, out);
}

int PowerTagGateway::tag_power_active_demand_total(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_power_active_demand_total, out);
}

int PowerTagGateway::tag_power_active_demand_total_maximum(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_power_active_demand_total_maximum, out);
}

int PowerTagGateway::tag_power_active_demand_total_maximum_timestamp(int tag, Reading<DateTime>& out) {
  return read_datetime(tag, Attribute::tag_power_active_demand_total_maximum_timestamp, out);
}

// ---- alarms ------------------------------------------------------------

int PowerTagGateway::tag_is_alarm_valid(int tag, bool& out) {
  std::uint16_t bits = 0;
  int rc = read_bitmap(tag, Attribute::tag_alarm_valid, bits);
  if (rc != 0) return rc;
  out = (bits & 0x0001) != 0;
  return 0;
}

int PowerTagGateway::tag_alarm(int tag, AlarmStatus& out) {
  std::uint16_t bits = 0;
  int rc = read_bitmap(tag, Attribute::tag_alarm, bits);
  if (rc != 0) return rc;
  out = AlarmStatus::from_bitmap(bits);
  return 0;
}

int PowerTagGateway::tag_current_at_voltage_loss(int tag, Phase phase, Reading<float>& out) {
  RegisterSpan span;
  int rc = resolve_address(Attribute::tag_current_at_voltage_loss, phase, span);
  return rc != 0 ? rc : read_f32(tag, span, out);
}

int PowerTagGateway::tag_load_operating_time(int tag, Reading<std::uint32_t>& out) {
  return read_u32(tag, Attribute::tag_load_operating_time, out);
}

int PowerTagGateway::tag_load_operating_time_active_power_threshold(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_load_operating_time_active_power_threshold, out);
}

int PowerTagGateway::tag_load_operating_time_start(int tag, Reading<DateTime>& out) {
  return read_datetime(tag, Attribute::tag_load_operating_time_start, out);
}

// ---- configuration -----------------------------------------------------

int PowerTagGateway::tag_name(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_name, out);
}

int PowerTagGateway::set_tag_name(int tag, const std::string& name) {
  return write_string(tag, Attribute::tag_name, name);
}

int PowerTagGateway::tag_circuit(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_circuit, out);
}

int PowerTagGateway::set_tag_circuit(int tag, const std::string& circuit) {
  return write_string(tag, Attribute::tag_circuit, circuit);
}

int PowerTagGateway::tag_usage(int tag, DeviceUsage& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_usage, raw);
  if (rc != 0) return rc;
  return device_usage_from_raw(raw, out);
}

int PowerTagGateway::tag_phase_sequence(int tag, PhaseSequence& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_phase_sequence, raw);
  if (rc != 0) return rc;
  return phase_sequence_from_raw(raw, out);
}

int PowerTagGateway::tag_position(int tag, Position& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_position, raw);
  if (rc != 0) return rc;
  return position_from_raw(raw, out);
}

int PowerTagGateway::tag_circuit_diagnostic(int tag, Position& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_circuit_diagnostic, raw);
  if (rc != 0) return rc;
  return position_from_raw(raw, out);
}

int PowerTagGateway::tag_rated_current(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_rated_current, out);
}

int PowerTagGateway::tag_rated_voltage(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_rated_voltage, out);
}

int PowerTagGateway::tag_reset_peak_demands(int tag) {
  RegisterSpan span;
  int rc = resolve_address(Attribute::tag_reset_peak_demands, span);
  if (rc != 0) return rc;
  std::vector<std::uint16_t> words;
  encode_u16(present<std::uint16_t>(1), words);
  return write_span(tag, span.address, words);
}

int PowerTagGateway::tag_power_supply_type(int tag, Position& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_power_supply_type, raw);
  if (rc != 0) return rc;
  return position_from_raw(raw, out);
}

// ---- device identification ---------------------------------------------

int PowerTagGateway::tag_product_type(int tag, const ProductTypeEntry*& out) {
  Reading<std::uint16_t> raw;
  int rc = read_u16(tag, Attribute::tag_product_type, raw);
  if (rc != 0) return rc;
  out = raw.present ? find_product_type(raw.value) : nullptr;
  return 0;
}

int PowerTagGateway::tag_slave_address(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_slave_address, out);
}

int PowerTagGateway::tag_rf_id(int tag, Reading<std::uint64_t>& out) {
  return read_u64(tag, Attribute::tag_rf_id, out);
}

int PowerTagGateway::tag_product_identifier(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_product_identifier, out);
}

int PowerTagGateway::tag_vendor_name(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_vendor_name, out);
}

int PowerTagGateway::tag_product_code(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_product_code, out);
}

int PowerTagGateway::tag_firmware_revision(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_firmware_revision, out);
}

int PowerTagGateway::tag_hardware_revision(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_hardware_revision, out);
}

int PowerTagGateway::tag_serial_number(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_serial_number, out);
}

int PowerTagGateway::tag_product_range(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_product_range, out);
}

int PowerTagGateway::tag_product_model(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_product_model, out);
}

int PowerTagGateway::tag_product_family(int tag, Reading<std::string>& out) {
  return read_string(tag, Attribute::tag_product_family, out);
}

// ---- radio diagnostics -------------------------------------------------

int PowerTagGateway::tag_radio_communication_valid(int tag, bool& out) {
  std::uint16_t bits = 0;
  int rc = read_bitmap(tag, Attribute::tag_radio_communication_valid, bits);
  if (rc != 0) return rc;
  out = bits != 0;
  return 0;
}

int PowerTagGateway::tag_wireless_communication_valid(int tag, bool& out) {
  std::uint16_t bits = 0;
  int rc = read_bitmap(tag, Attribute::tag_wireless_communication_valid, bits);
  if (rc != 0) return rc;
  out = bits != 0;
  return 0;
}

int PowerTagGateway::tag_radio_per_tag(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_per_tag, out);
}

int PowerTagGateway::tag_radio_rssi_inside_tag(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_rssi_inside_tag, out);
}

int PowerTagGateway::tag_radio_lqi_tag(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_radio_lqi_tag, out);
}

int PowerTagGateway::tag_radio_per_gateway(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_per_gateway, out);
}

int PowerTagGateway::tag_radio_rssi_inside_gateway(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_rssi_inside_gateway, out);
}

int PowerTagGateway::tag_radio_lqi_gateway(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_radio_lqi_gateway, out);
}

int PowerTagGateway::tag_radio_per_maximum(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_per_maximum, out);
}

int PowerTagGateway::tag_radio_rssi_minimum(int tag, Reading<float>& out) {
  return read_f32(tag, Attribute::tag_radio_rssi_minimum, out);
}

int PowerTagGateway::tag_radio_lqi_minimum(int tag, Reading<std::uint16_t>& out) {
  return read_u16(tag, Attribute::tag_radio_lqi_minimum, out);
}

// ---- synthesis table ---------------------------------------------------

int PowerTagGateway::product_id(Reading<std::uint16_t>& out) {
  return read_u16(synthesis_unit_, Attribute::product_id, out);
}

int PowerTagGateway::manufacturer(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::manufacturer, out);
}

int PowerTagGateway::product_code(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::product_code, out);
}

int PowerTagGateway::product_range(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::product_range, out);
}

int PowerTagGateway::product_model(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::product_model, out);
}

int PowerTagGateway::name(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::name, out);
}

int PowerTagGateway::product_vendor_url(Reading<std::string>& out) {
  return read_string(synthesis_unit_, Attribute::product_vendor_url, out);
}

int PowerTagGateway::modbus_address_of_node(int node, Reading<std::uint16_t>& out) {
  RegisterSpan span;
  int rc = resolve_node_slot(node, span);
  return rc != 0 ? rc : read_u16(synthesis_unit_, span, out);
}

} // namespace ptg
