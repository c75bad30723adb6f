#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "ModbusError.hpp"

namespace ptg {

// Synchronous register transport. One request is in flight at a time; callers
// serialize access. Failures are reported as ptg::Err codes or, for device
// exception responses, make_modbus_exception(code).
class IModbusClient {
public:
  virtual ~IModbusClient() {}

  // lifecycle
  virtual int connect() = 0;          // 0 on success
  virtual void close() = 0;
  virtual void set_timeout_ms(int ms) = 0;

  // FC3; out holds the words the device actually returned
  virtual int read_holding_regs(int unit, int addr, int count, std::vector<std::uint16_t>& out) = 0;
  // FC16
  virtual int write_multiple_regs(int unit, int addr, int count, const std::uint16_t* v) = 0;
};

// Modbus TCP client backed by libmodbus.
std::unique_ptr<IModbusClient> make_tcp_client(const std::string& host, int port);

} // namespace ptg
