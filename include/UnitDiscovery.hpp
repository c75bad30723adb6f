#pragma once

#include "IModbusClient.hpp"

namespace ptg {

// Unit ids accepted on the wire: wireless tags [1, 247] and the gateway (255).
bool is_valid_unit(int unit);

// Probes units 247 down to 2 with a one-word read of the synthesis-table
// product id and stores the first unit that answers. Device exceptions,
// timeouts and I/O errors move on to the next candidate; NOT_CONNECTED aborts
// and is returned as is. SYNTHESIS_TABLE_NOT_FOUND when nothing answers.
int find_synthesis_table_unit(IModbusClient& client, int& unit);

} // namespace ptg
