#pragma once

#include <cstdint>

namespace ptg {

// Negative error codes returned by every fallible operation; 0 is success.
enum class Err : int {
  OK                        = 0,
  INVALID_ARG               = -1,
  NOT_FOUND                 = -2,
  IO_TIMEOUT                = -3,
  IO_ERROR                  = -4,
  NOT_CONNECTED             = -5,
  UNSUPPORTED               = -6,
  PARSE_ERROR               = -7,
  MALFORMED_RESPONSE        = -10,
  UNKNOWN_ENUM_CODE         = -11,
  INVALID_TIMESTAMP         = -12,
  SYNTHESIS_TABLE_NOT_FOUND = -13,
};

// Device exception responses are folded into [-3455, -3201].
constexpr int kModbusExceptionBase = -3200;

inline int make_modbus_exception(std::uint8_t code) {
  return kModbusExceptionBase - static_cast<int>(code);
}

inline bool is_modbus_exception(int rc) {
  return rc <= kModbusExceptionBase - 1 && rc >= kModbusExceptionBase - 255;
}

inline std::uint8_t decode_modbus_exception(int rc) {
  return static_cast<std::uint8_t>(kModbusExceptionBase - rc);
}

inline bool is_transport_error(int rc) {
  return rc == static_cast<int>(Err::IO_TIMEOUT) ||
         rc == static_cast<int>(Err::IO_ERROR) ||
         rc == static_cast<int>(Err::NOT_CONNECTED);
}

inline const char* modbus_exception_to_string(std::uint8_t code) {
  switch (code) {
    case 1: return "ILLEGAL_FUNCTION";
    case 2: return "ILLEGAL_DATA_ADDRESS";
    case 3: return "ILLEGAL_DATA_VALUE";
    case 4: return "SLAVE_DEVICE_FAILURE";
    case 5: return "ACKNOWLEDGE";
    case 6: return "SLAVE_DEVICE_BUSY";
    case 8: return "MEMORY_PARITY_ERROR";
    case 10: return "GATEWAY_PATH_UNAVAILABLE";
    case 11: return "GATEWAY_TARGET_FAILED";
    default: return "UNKNOWN";
  }
}

inline const char* error_name(int rc) {
  if (is_modbus_exception(rc)) return "DEVICE_EXCEPTION";
  switch (static_cast<Err>(rc)) {
    case Err::OK: return "OK";
    case Err::INVALID_ARG: return "INVALID_ARG";
    case Err::NOT_FOUND: return "NOT_FOUND";
    case Err::IO_TIMEOUT: return "IO_TIMEOUT";
    case Err::IO_ERROR: return "IO_ERROR";
    case Err::NOT_CONNECTED: return "NOT_CONNECTED";
    case Err::UNSUPPORTED: return "UNSUPPORTED";
    case Err::PARSE_ERROR: return "PARSE_ERROR";
    case Err::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
    case Err::UNKNOWN_ENUM_CODE: return "UNKNOWN_ENUM_CODE";
    case Err::INVALID_TIMESTAMP: return "INVALID_TIMESTAMP";
    case Err::SYNTHESIS_TABLE_NOT_FOUND: return "SYNTHESIS_TABLE_NOT_FOUND";
  }
  return "UNKNOWN";
}

} // namespace ptg
