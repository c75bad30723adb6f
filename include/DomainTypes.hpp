#pragma once

#include <cstdint>
#include "RegisterCodec.hpp"

namespace ptg {

// Closed enumerations. INVALID is the device's own "invalid" code (the 16-bit
// not-available word), distinct from a failed read.
enum class DeviceUsage {
  main_incomer = 1,
  sub_head_of_group = 2,
  heating = 3,
  cooling = 4,
  hvac = 5,
  ventilation = 6,
  lighting = 7,
  office_equipment = 8,
  cooking = 9,
  food_refrigeration = 10,
  elevators = 11,
  computers = 12,
  renewable_energy_production = 13,
  genset = 14,
  compressed_air = 15,
  vapor = 16,
  machine = 17,
  process = 18,
  water = 19,
  other_sockets = 20,
  other = 21,
  INVALID = -1,
};

enum class PhaseSequence {
  A = 1,
  B = 2,
  C = 3,
  ABC = 4,
  ACB = 5,
  BCA = 6,
  BAC = 7,
  CAB = 8,
  CBA = 9,
  INVALID = -1,
};

enum class Position {
  not_configured = 0,
  top = 1,
  bottom = 2,
  not_applicable = 3,
  INVALID = -1,
};

// Panel server status register; no invalid code.
enum class GatewayStatus {
  nominal = 0,
  degraded = 1,
  out_of_order = 2,
};

// Return 0, or UNKNOWN_ENUM_CODE for a code the device map does not list.
int device_usage_from_raw(const Reading<std::uint16_t>& raw, DeviceUsage& out);
int phase_sequence_from_raw(const Reading<std::uint16_t>& raw, PhaseSequence& out);
int position_from_raw(const Reading<std::uint16_t>& raw, Position& out);
// Absent raw stays absent.
int gateway_status_from_raw(const Reading<std::uint16_t>& raw, Reading<GatewayStatus>& out);

const char* to_string(DeviceUsage v);
const char* to_string(PhaseSequence v);
const char* to_string(Position v);
const char* to_string(GatewayStatus v);

enum class ProductType {
  A9MEM1520, A9MEM1521, A9MEM1522, A9MEM1540, A9MEM1541, A9MEM1542,
  A9MEM1560, A9MEM1561, A9MEM1562, A9MEM1563, A9MEM1570, A9MEM1571,
  A9MEM1572, LV434020, LV434021, LV434022, LV434023, A9MEM1543,
  A9XMC2D3, A9XMC1D3, A9MEM1564, A9MEM1573, A9MEM1574, A9MEM1590,
  A9MEM1591, A9MEM1592, A9MEM1593, A9MEM1580, A9XMWRD, SMT10020,
};

struct ProductTypeEntry {
  ProductType type;
  std::uint16_t code;
  const char* reference;
  const char* label;
};

// Linear search of the product table; nullptr when the code is not listed.
// New products can show up before the table knows them, so no match is not
// an error.
const ProductTypeEntry* find_product_type(std::uint16_t code);
const ProductTypeEntry* product_types(int& count);

// Tag alarm bitmap (register 0xCE3).
struct AlarmStatus {
  bool has_alarm{false};
  bool alarm_voltage_loss{false};
  bool alarm_current_overload{false};
  bool alarm_overload_45_percent{false};
  bool alarm_load_current_loss{false};
  bool alarm_overvoltage{false};
  bool alarm_undervoltage{false};
  bool alarm_heattag_alarm{false};
  bool alarm_heattag_maintenance{false};
  bool alarm_heattag_replacement{false};

  static AlarmStatus from_bitmap(std::uint16_t bitmap);
};

namespace alarm_bits {
constexpr std::uint16_t kVoltageLoss        = 0x0001;
constexpr std::uint16_t kCurrentOverload    = 0x0002;
// 0x0004 reserved
constexpr std::uint16_t kOverload45Percent  = 0x0008;
constexpr std::uint16_t kLoadCurrentLoss    = 0x0010;
constexpr std::uint16_t kOvervoltage        = 0x0020;
constexpr std::uint16_t kUndervoltage       = 0x0040;
constexpr std::uint16_t kHeattagAlarm       = 0x0100;
constexpr std::uint16_t kHeattagMaintenance = 0x0400;
constexpr std::uint16_t kHeattagReplacement = 0x0800;
} // namespace alarm_bits

} // namespace ptg
