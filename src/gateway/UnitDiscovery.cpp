#include "UnitDiscovery.hpp"
#include "AddressMap.hpp"
#include "ModbusError.hpp"
#include "../log.hpp"
#include <vector>

namespace ptg {

bool is_valid_unit(int unit) {
  return (unit >= 1 && unit <= 247) || unit == kGatewayUnit;
}

int find_synthesis_table_unit(IModbusClient& client, int& unit) {
  RegisterSpan probe;
  int rc = resolve_address(Attribute::product_id, probe);
  if (rc != 0) return rc;

  std::vector<std::uint16_t> regs;
  for (int candidate = kSynthesisUnitFirst; candidate >= kSynthesisUnitLast; --candidate) {
    rc = client.read_holding_regs(candidate, probe.address, probe.count, regs);
    if (rc == 0 && static_cast<int>(regs.size()) != probe.count) {
      rc = static_cast<int>(Err::MALFORMED_RESPONSE);
    }
    ptg::log::log_trace(__FILE__, __LINE__, "probe unit %d: %s (%d)", candidate, error_name(rc), rc);
    if (rc == 0) {
      ptg::log::log_info(__FILE__, __LINE__, "synthesis table found at unit %d", candidate);
      unit = candidate;
      return 0;
    }
    if (rc == static_cast<int>(Err::NOT_CONNECTED)) {
      ptg::log::log_error(__FILE__, __LINE__, "synthesis table discovery aborted at unit %d: not connected", candidate);
      return rc;
    }
  }
  ptg::log::log_error(__FILE__, __LINE__, "no synthesis table in units [%d, %d]",
                      kSynthesisUnitLast, kSynthesisUnitFirst);
  return static_cast<int>(Err::SYNTHESIS_TABLE_NOT_FOUND);
}

} // namespace ptg
