#include "DomainTypes.hpp"
#include "ModbusError.hpp"
#include "../log.hpp"

namespace ptg {

namespace {

const ProductTypeEntry kProductTypes[] = {
  {ProductType::A9MEM1520, 41,  "A9MEM1520", "PowerTag M63 1P"},
  {ProductType::A9MEM1521, 42,  "A9MEM1521", "PowerTag M63 1P+N Top"},
  {ProductType::A9MEM1522, 43,  "A9MEM1522", "PowerTag M63 1P+N Bottom"},
  {ProductType::A9MEM1540, 44,  "A9MEM1540", "PowerTag M63 3P"},
  {ProductType::A9MEM1541, 45,  "A9MEM1541", "PowerTag M63 3P+N Top"},
  {ProductType::A9MEM1542, 46,  "A9MEM1542", "PowerTag M63 3P+N Bottom"},
  {ProductType::A9MEM1560, 81,  "A9MEM1560", "PowerTag F63 1P+N"},
  {ProductType::A9MEM1561, 82,  "A9MEM1561", "PowerTag P63 1P+N Top"},
  {ProductType::A9MEM1562, 83,  "A9MEM1562", "PowerTag P63 1P+N Bottom"},
  {ProductType::A9MEM1563, 84,  "A9MEM1563", "PowerTag P63 1P+N Bottom"},
  {ProductType::A9MEM1570, 85,  "A9MEM1570", "PowerTag F63 3P+N"},
  {ProductType::A9MEM1571, 86,  "A9MEM1571", "PowerTag P63 3P+N Top"},
  {ProductType::A9MEM1572, 87,  "A9MEM1572", "PowerTag P63 3P+N Bottom"},
  {ProductType::LV434020,  92,  "LV434020",  "PowerTag M250 3P"},
  {ProductType::LV434021,  93,  "LV434021",  "PowerTag M250 4P"},
  {ProductType::LV434022,  94,  "LV434022",  "PowerTag M630 3P"},
  {ProductType::LV434023,  95,  "LV434023",  "PowerTag M630 4P"},
  {ProductType::A9MEM1543, 96,  "A9MEM1543", "PowerTag M63 3P 230 V"},
  {ProductType::A9XMC2D3,  97,  "A9XMC2D3",  "PowerTag C 2DI 230 V"},
  {ProductType::A9XMC1D3,  98,  "A9XMC1D3",  "PowerTag C IO 230 V"},
  {ProductType::A9MEM1564, 101, "A9MEM1564", "PowerTag F63 1P+N 110 V"},
  {ProductType::A9MEM1573, 102, "A9MEM1573", "PowerTag F63 3P"},
  {ProductType::A9MEM1574, 103, "A9MEM1574", "PowerTag F63 3P+N 110/230 V"},
  {ProductType::A9MEM1590, 104, "A9MEM1590", "PowerTag R200"},
  {ProductType::A9MEM1591, 105, "A9MEM1591", "PowerTag R600"},
  {ProductType::A9MEM1592, 106, "A9MEM1592", "PowerTag R1000"},
  {ProductType::A9MEM1593, 107, "A9MEM1593", "PowerTag R2000"},
  {ProductType::A9MEM1580, 121, "A9MEM1580", "PowerTag F160"},
  {ProductType::A9XMWRD,   170, "A9XMWRD",   "PowerTag Link display"},
  {ProductType::SMT10020,  171, "SMT10020",  "HeatTag sensor"},
};

int unknown_code(const char* what, std::uint16_t code) {
  ptg::log::log_warn(__FILE__, __LINE__, "%s: unknown code %u", what, static_cast<unsigned>(code));
  return static_cast<int>(Err::UNKNOWN_ENUM_CODE);
}

} // namespace

int device_usage_from_raw(const Reading<std::uint16_t>& raw, DeviceUsage& out) {
  if (!raw.present) { out = DeviceUsage::INVALID; return 0; }
  if (raw.value < 1 || raw.value > 21) return unknown_code("device usage", raw.value);
  out = static_cast<DeviceUsage>(raw.value);
  return 0;
}

int phase_sequence_from_raw(const Reading<std::uint16_t>& raw, PhaseSequence& out) {
  if (!raw.present) { out = PhaseSequence::INVALID; return 0; }
  if (raw.value < 1 || raw.value > 9) return unknown_code("phase sequence", raw.value);
  out = static_cast<PhaseSequence>(raw.value);
  return 0;
}

int position_from_raw(const Reading<std::uint16_t>& raw, Position& out) {
  if (!raw.present) { out = Position::INVALID; return 0; }
  if (raw.value > 3) return unknown_code("position", raw.value);
  out = static_cast<Position>(raw.value);
  return 0;
}

int gateway_status_from_raw(const Reading<std::uint16_t>& raw, Reading<GatewayStatus>& out) {
  if (!raw.present) { out = absent<GatewayStatus>(); return 0; }
  if (raw.value > 2) return unknown_code("gateway status", raw.value);
  out = present(static_cast<GatewayStatus>(raw.value));
  return 0;
}

const char* to_string(DeviceUsage v) {
  switch (v) {
    case DeviceUsage::main_incomer: return "main_incomer";
    case DeviceUsage::sub_head_of_group: return "sub_head_of_group";
    case DeviceUsage::heating: return "heating";
    case DeviceUsage::cooling: return "cooling";
    case DeviceUsage::hvac: return "hvac";
    case DeviceUsage::ventilation: return "ventilation";
    case DeviceUsage::lighting: return "lighting";
    case DeviceUsage::office_equipment: return "office_equipment";
    case DeviceUsage::cooking: return "cooking";
    case DeviceUsage::food_refrigeration: return "food_refrigeration";
    case DeviceUsage::elevators: return "elevators";
    case DeviceUsage::computers: return "computers";
    case DeviceUsage::renewable_energy_production: return "renewable_energy_production";
    case DeviceUsage::genset: return "genset";
    case DeviceUsage::compressed_air: return "compressed_air";
    case DeviceUsage::vapor: return "vapor";
    case DeviceUsage::machine: return "machine";
    case DeviceUsage::process: return "process";
    case DeviceUsage::water: return "water";
    case DeviceUsage::other_sockets: return "other_sockets";
    case DeviceUsage::other: return "other";
    case DeviceUsage::INVALID: return "INVALID";
  }
  return "INVALID";
}

const char* to_string(PhaseSequence v) {
  switch (v) {
    case PhaseSequence::A: return "A";
    case PhaseSequence::B: return "B";
    case PhaseSequence::C: return "C";
    case PhaseSequence::ABC: return "ABC";
    case PhaseSequence::ACB: return "ACB";
    case PhaseSequence::BCA: return "BCA";
    case PhaseSequence::BAC: return "BAC";
    case PhaseSequence::CAB: return "CAB";
    case PhaseSequence::CBA: return "CBA";
    case PhaseSequence::INVALID: return "INVALID";
  }
  return "INVALID";
}

const char* to_string(Position v) {
  switch (v) {
    case Position::not_configured: return "not_configured";
    case Position::top: return "top";
    case Position::bottom: return "bottom";
    case Position::not_applicable: return "not_applicable";
    case Position::INVALID: return "INVALID";
  }
  return "INVALID";
}

const char* to_string(GatewayStatus v) {
  switch (v) {
    case GatewayStatus::nominal: return "nominal";
    case GatewayStatus::degraded: return "degraded";
    case GatewayStatus::out_of_order: return "out_of_order";
  }
  return "unknown";
}

const ProductTypeEntry* find_product_type(std::uint16_t code) {
  for (const ProductTypeEntry& e : kProductTypes) {
    if (e.code == code) return &e;
  }
  return nullptr;
}

const ProductTypeEntry* product_types(int& count) {
  count = static_cast<int>(sizeof(kProductTypes) / sizeof(kProductTypes[0]));
  return kProductTypes;
}

AlarmStatus AlarmStatus::from_bitmap(std::uint16_t bitmap) {
  AlarmStatus a;
  a.alarm_voltage_loss = (bitmap & alarm_bits::kVoltageLoss) != 0;
  a.alarm_current_overload = (bitmap & alarm_bits::kCurrentOverload) != 0;
  a.alarm_overload_45_percent = (bitmap & alarm_bits::kOverload45Percent) != 0;
  a.alarm_load_current_loss = (bitmap & alarm_bits::kLoadCurrentLoss) != 0;
  a.alarm_overvoltage = (bitmap & alarm_bits::kOvervoltage) != 0;
  a.alarm_undervoltage = (bitmap & alarm_bits::kUndervoltage) != 0;
  a.alarm_heattag_alarm = (bitmap & alarm_bits::kHeattagAlarm) != 0;
  a.alarm_heattag_maintenance = (bitmap & alarm_bits::kHeattagMaintenance) != 0;
  a.alarm_heattag_replacement = (bitmap & alarm_bits::kHeattagReplacement) != 0;

  const std::uint16_t named = alarm_bits::kVoltageLoss | alarm_bits::kCurrentOverload |
                              alarm_bits::kOverload45Percent | alarm_bits::kLoadCurrentLoss |
                              alarm_bits::kOvervoltage | alarm_bits::kUndervoltage |
                              alarm_bits::kHeattagAlarm | alarm_bits::kHeattagMaintenance |
                              alarm_bits::kHeattagReplacement;
  a.has_alarm = (bitmap & named) != 0;
  return a;
}

} // namespace ptg
