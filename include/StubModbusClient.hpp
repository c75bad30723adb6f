#pragma once

#include <cstdint>
#include <map>
#include <vector>
#include "IModbusClient.hpp"

namespace ptg {

// In-memory gateway simulator. Each added unit owns a sparse holding-register
// image; unknown units answer with GATEWAY_TARGET_FAILED (0x0B) and unseeded
// registers with ILLEGAL_DATA_ADDRESS (0x02), the way the gateway does.
class StubModbusClient : public IModbusClient {
public:
  StubModbusClient();

  int connect() override;
  void close() override;
  void set_timeout_ms(int ms) override;

  int read_holding_regs(int unit, int addr, int count, std::vector<std::uint16_t>& out) override;
  int write_multiple_regs(int unit, int addr, int count, const std::uint16_t* v) override;

  // Seeding helpers; seeding a register also adds its unit.
  void add_unit(int unit);
  void seed_hr(int unit, int addr, std::uint16_t v);
  void seed_hr(int unit, int addr, const std::vector<std::uint16_t>& words);
  std::uint16_t holding(int unit, int addr) const;

  // Every operation returns rc until cleared with 0.
  void fail_with(int rc) { forced_rc_ = rc; }
  // Reads return this many words fewer than requested.
  void set_short_reads(int missing) { short_reads_ = missing; }

  int read_calls() const { return read_calls_; }
  int write_calls() const { return write_calls_; }
  int last_unit() const { return last_unit_; }
  int last_address() const { return last_addr_; }
  const std::vector<std::uint16_t>& last_write() const { return last_write_; }

private:
  bool connected_;
  int timeout_ms_;
  int forced_rc_{0};
  int short_reads_{0};
  int read_calls_{0};
  int write_calls_{0};
  int last_unit_{-1};
  int last_addr_{-1};
  std::vector<std::uint16_t> last_write_;
  std::map<int, std::map<int, std::uint16_t>> units_;
};

} // namespace ptg
