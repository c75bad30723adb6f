#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "AddressMap.hpp"

namespace ptg {

// One named binding of an attribute to its unit and register index.
struct ItemCfg {
  std::string name;
  Attribute attribute{Attribute::status};
  int unit_id{0};                               // tag attributes only
  Phase phase{Phase::A};                        // Indexing::PHASE
  LineVoltage line_voltage{LineVoltage::A_B};   // Indexing::LINE_VOLTAGE
  int node{0};                                  // Indexing::NODE_SLOT
};

struct GatewayConfig {
  std::string transport{"tcp"};
  std::string host{"127.0.0.1"};
  int port{502};
  int timeout_ms{5000};
  std::vector<ItemCfg> items;
};

// Both return 0 or PARSE_ERROR; the first violation is logged at ERROR.
int parse_gateway_config(const nlohmann::json& cfg, GatewayConfig& out);
int load_gateway_config(const char* path, GatewayConfig& out);

} // namespace ptg
