#include "IModbusClient.hpp"
#include "ModbusError.hpp"
#include "../log.hpp"
#include <cerrno>
#include <string>
#include <utility>
#include <vector>
#include <modbus.h>

namespace ptg {

namespace {

// libmodbus reports exception responses as MODBUS_ENOBASE + exception code.
int map_errno(int err) {
  if (err > MODBUS_ENOBASE && err <= EMBXGTAR) {
    return make_modbus_exception(static_cast<std::uint8_t>(err - MODBUS_ENOBASE));
  }
  switch (err) {
    case ETIMEDOUT: return static_cast<int>(Err::IO_TIMEOUT);
    case EMBBADDATA:
    case EMBBADEXC:
    case EMBMDATA:
    case EMBBADSLAVE: return static_cast<int>(Err::MALFORMED_RESPONSE);
    case ECONNRESET:
    case ECONNREFUSED:
    case EPIPE:
    case ENOTCONN:
    case EBADF: return static_cast<int>(Err::NOT_CONNECTED);
    default: return static_cast<int>(Err::IO_ERROR);
  }
}

class TcpModbusClient : public IModbusClient {
public:
  TcpModbusClient(std::string host, int port)
  : host_(std::move(host)), port_(port), ctx_(nullptr), timeout_ms_(5000) {}
  ~TcpModbusClient() override { close(); }

  int connect() override {
    close();
    ctx_ = modbus_new_tcp(host_.c_str(), port_);
    if (!ctx_) return static_cast<int>(Err::IO_ERROR);
    set_timeout_ms(timeout_ms_);
    if (modbus_connect(ctx_) == -1) {
      int err = errno;
      ptg::log::log_warn(__FILE__, __LINE__, "modbus_connect %s:%d failed: %s",
                         host_.c_str(), port_, modbus_strerror(err));
      modbus_free(ctx_); ctx_ = nullptr; return static_cast<int>(Err::NOT_CONNECTED);
    }
    ptg::log::log_debug(__FILE__, __LINE__, "connected to %s:%d", host_.c_str(), port_);
    return 0;
  }
  void close() override {
    if (ctx_) { modbus_close(ctx_); modbus_free(ctx_); ctx_ = nullptr; }
  }
  void set_timeout_ms(int ms) override {
    timeout_ms_ = ms;
    if (ctx_) {
      modbus_set_response_timeout(ctx_, static_cast<uint32_t>(ms / 1000),
                                  static_cast<uint32_t>((ms % 1000) * 1000));
    }
  }

  int read_holding_regs(int unit, int addr, int count, std::vector<std::uint16_t>& out) override {
    out.clear();
    if (!ctx_) return static_cast<int>(Err::NOT_CONNECTED);
    if (modbus_set_slave(ctx_, unit) == -1) return static_cast<int>(Err::INVALID_ARG);
    out.resize(static_cast<std::size_t>(count));
    int n = modbus_read_registers(ctx_, addr, count, out.data());
    if (n == -1) {
      int err = errno;
      out.clear();
      ptg::log::log_warn(__FILE__, __LINE__, "read unit=%d addr=0x%04X count=%d failed: %s",
                         unit, addr, count, modbus_strerror(err));
      return map_errno(err);
    }
    out.resize(static_cast<std::size_t>(n));
    return 0;
  }

  int write_multiple_regs(int unit, int addr, int count, const std::uint16_t* v) override {
    if (!ctx_) return static_cast<int>(Err::NOT_CONNECTED);
    if (modbus_set_slave(ctx_, unit) == -1) return static_cast<int>(Err::INVALID_ARG);
    int n = modbus_write_registers(ctx_, addr, count, v);
    if (n == -1) {
      int err = errno;
      ptg::log::log_warn(__FILE__, __LINE__, "write unit=%d addr=0x%04X count=%d failed: %s",
                         unit, addr, count, modbus_strerror(err));
      return map_errno(err);
    }
    return (n == count) ? 0 : static_cast<int>(Err::MALFORMED_RESPONSE);
  }

private:
  std::string host_; int port_;
  modbus_t* ctx_;
  int timeout_ms_;
};

} // namespace

std::unique_ptr<IModbusClient> make_tcp_client(const std::string& host, int port) {
  return std::unique_ptr<IModbusClient>(new TcpModbusClient(host, port));
}

} // namespace ptg
