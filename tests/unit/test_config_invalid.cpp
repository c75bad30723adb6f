#include "GatewayConfig.hpp"
#include "IoHandler.hpp"
#include "ModbusError.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using nlohmann::json;

static void write_text(const char* path, const std::string& s) {
  std::ofstream ofs(path, std::ios::binary); ofs << s; ofs.close();
}

static int parse(const std::string& text) {
  ptg::GatewayConfig gc;
  return ptg::parse_gateway_config(json::parse(text), gc);
}

int main() {
  const int kParse = static_cast<int>(ptg::Err::PARSE_ERROR);

  // 1) Invalid transport
  write_text("invalid_transport.json", R"({"transport":"rtu","items":[{"name":"a","attribute":"status"}]})");
  assert(CreateIoInstance(nullptr, "invalid_transport.json") == nullptr);

  // 2) Empty items
  write_text("empty_items.json", R"({"transport":"tcp","tcp":{"host":"127.0.0.1","port":502},"items":[]})");
  assert(CreateIoInstance(nullptr, "empty_items.json") == nullptr);

  // 3) Unknown attribute
  write_text("bad_attribute.json", R"({"items":[{"name":"x","attribute":"tag_frequency","unit_id":1}]})");
  assert(CreateIoInstance(nullptr, "bad_attribute.json") == nullptr);

  // 4) Invalid unit_id for a tag attribute
  write_text("bad_unit_id.json", R"({"items":[{"name":"x","attribute":"tag_name","unit_id":0}]})");
  assert(CreateIoInstance(nullptr, "bad_unit_id.json") == nullptr);

  // 5) Not JSON, missing file
  write_text("not_json.json", "{items:");
  assert(CreateIoInstance(nullptr, "not_json.json") == nullptr);
  assert(CreateIoInstance(nullptr, "does_not_exist.json") == nullptr);
  assert(CreateIoInstance(nullptr, nullptr) == nullptr);

  // index requirements
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_current","unit_id":5}]})") == kParse);
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_current","unit_id":5,"phase":"D"}]})") == kParse);
  assert(parse(R"({"items":[{"name":"v","attribute":"tag_voltage","unit_id":5,"line_voltage":"AB"}]})") == kParse);
  assert(parse(R"({"items":[{"name":"n","attribute":"modbus_address_of_node","node":101}]})") == kParse);
  assert(parse(R"({"items":[{"name":"n","attribute":"modbus_address_of_node","node":0}]})") == kParse);
  // unit_id belongs to tag attributes only
  assert(parse(R"({"items":[{"name":"g","attribute":"status","unit_id":5}]})") == kParse);
  // tcp section
  assert(parse(R"({"tcp":{"port":0},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"tcp":{"port":70000},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"tcp":{"timeout_ms":0},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"tcp":{"port":"502"},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  // numbers that do not fit or are not integers are rejected, never narrowed
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_name","unit_id":4294967446}]})") == kParse);
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_name","unit_id":150.9}]})") == kParse);
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_name","unit_id":-106}]})") == kParse);
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_name","unit_id":"150"}]})") == kParse);
  assert(parse(R"({"items":[{"name":"n","attribute":"modbus_address_of_node","node":4294967297}]})") == kParse);
  assert(parse(R"({"tcp":{"port":4294967798},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"tcp":{"port":502.5},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"tcp":{"timeout_ms":18446744073709551615},"items":[{"name":"g","attribute":"status"}]})") == kParse);
  assert(parse(R"({"items":[{"name":"i","attribute":"tag_name","unit_id":247}]})") == 0);
  // names
  assert(parse(R"({"items":[{"attribute":"status"}]})") == kParse);
  assert(parse(R"({"items":[{"name":"g","attribute":"status"},{"name":"g","attribute":"date_time"}]})") == kParse);
  assert(parse(R"([1,2,3])") == kParse);

  // valid config with defaults
  {
    ptg::GatewayConfig gc;
    assert(ptg::parse_gateway_config(json::parse(R"({
      "items":[
        {"name":"kitchen.current.b","attribute":"tag_current","unit_id":150,"phase":"B"},
        {"name":"kitchen.voltage.cn","attribute":"tag_voltage","unit_id":150,"line_voltage":"C_N"},
        {"name":"node.7","attribute":"modbus_address_of_node","node":7},
        {"name":"gw.firmware","attribute":"firmware_version"}
      ]})"), gc) == 0);
    assert(gc.transport == "tcp" && gc.host == "127.0.0.1" && gc.port == 502 && gc.timeout_ms == 5000);
    assert(gc.items.size() == 4);
    assert(gc.items[0].attribute == ptg::Attribute::tag_current && gc.items[0].unit_id == 150);
    assert(gc.items[0].phase == ptg::Phase::B);
    assert(gc.items[1].line_voltage == ptg::LineVoltage::C_N);
    assert(gc.items[2].node == 7);
    assert(gc.items[3].attribute == ptg::Attribute::firmware_version);
  }
  // load from file
  {
    write_text("ok.json", R"({"transport":"tcp","tcp":{"host":"10.0.0.7","port":1502,"timeout_ms":250},"items":[{"name":"ok","attribute":"status"}]})");
    ptg::GatewayConfig gc;
    assert(ptg::load_gateway_config("ok.json", gc) == 0);
    assert(gc.host == "10.0.0.7" && gc.port == 1502 && gc.timeout_ms == 250);
    assert(ptg::load_gateway_config("not_json.json", gc) == kParse);
  }

  std::remove("invalid_transport.json");
  std::remove("empty_items.json");
  std::remove("bad_attribute.json");
  std::remove("bad_unit_id.json");
  std::remove("not_json.json");
  std::remove("ok.json");
  std::puts("unit_config_invalid: ok");
  return 0;
}
