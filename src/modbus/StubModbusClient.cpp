#include "StubModbusClient.hpp"
#include "ModbusError.hpp"

namespace ptg {

namespace {
constexpr std::uint8_t kIllegalDataAddress = 0x02;
constexpr std::uint8_t kGatewayTargetFailed = 0x0B;
}

StubModbusClient::StubModbusClient()
: connected_(false), timeout_ms_(1000) {}

int StubModbusClient::connect() {
  connected_ = true;
  return 0;
}

void StubModbusClient::close() { connected_ = false; }

void StubModbusClient::set_timeout_ms(int ms) { timeout_ms_ = ms; (void)timeout_ms_; }

int StubModbusClient::read_holding_regs(int unit, int addr, int count, std::vector<std::uint16_t>& out) {
  ++read_calls_;
  last_unit_ = unit;
  last_addr_ = addr;
  out.clear();
  if (forced_rc_ != 0) return forced_rc_;
  if (!connected_) return static_cast<int>(Err::NOT_CONNECTED);
  if (addr < 0 || count <= 0) return static_cast<int>(Err::INVALID_ARG);
  auto u = units_.find(unit);
  if (u == units_.end()) return make_modbus_exception(kGatewayTargetFailed);
  int n = count - short_reads_;
  if (n < 0) n = 0;
  for (int i = 0; i < count; ++i) {
    if (u->second.find(addr + i) == u->second.end()) return make_modbus_exception(kIllegalDataAddress);
  }
  for (int i = 0; i < n; ++i) out.push_back(u->second[addr + i]);
  return 0;
}

int StubModbusClient::write_multiple_regs(int unit, int addr, int count, const std::uint16_t* v) {
  ++write_calls_;
  last_unit_ = unit;
  last_addr_ = addr;
  last_write_.clear();
  if (forced_rc_ != 0) return forced_rc_;
  if (!connected_) return static_cast<int>(Err::NOT_CONNECTED);
  if (!v || addr < 0 || count <= 0) return static_cast<int>(Err::INVALID_ARG);
  auto u = units_.find(unit);
  if (u == units_.end()) return make_modbus_exception(kGatewayTargetFailed);
  for (int i = 0; i < count; ++i) {
    u->second[addr + i] = v[i];
    last_write_.push_back(v[i]);
  }
  return 0;
}

void StubModbusClient::add_unit(int unit) { units_[unit]; }

void StubModbusClient::seed_hr(int unit, int addr, std::uint16_t v) { units_[unit][addr] = v; }

void StubModbusClient::seed_hr(int unit, int addr, const std::vector<std::uint16_t>& words) {
  for (std::size_t i = 0; i < words.size(); ++i) units_[unit][addr + static_cast<int>(i)] = words[i];
}

std::uint16_t StubModbusClient::holding(int unit, int addr) const {
  auto u = units_.find(unit);
  if (u == units_.end()) return 0;
  auto r = u->second.find(addr);
  return r == u->second.end() ? 0 : r->second;
}

} // namespace ptg
