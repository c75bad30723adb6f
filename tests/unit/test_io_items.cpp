#include "IoHandler.hpp"
#include "StubModbusClient.hpp"
#include "ModbusError.hpp"
#include <cassert>
#include <cstdio>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

static const int kTag = 150;

// Last client handed out by the factory; the handle owns it.
static ptg::StubModbusClient* g_stub = nullptr;
static bool g_gateway_up = true;

static std::unique_ptr<ptg::IModbusClient> make_gateway(const ptg::GatewayConfig& cfg) {
  assert(cfg.host == "192.168.1.20" && cfg.port == 502);
  std::unique_ptr<ptg::StubModbusClient> stub(new ptg::StubModbusClient());
  if (g_gateway_up) stub->seed_hr(210, 0x0001, 1);
  stub->seed_hr(210, 0x012C, kTag);
  stub->seed_hr(ptg::kGatewayUnit, 0x0073, {0xFFFF, 0xFFFF, 0xFFFF, 0xFFFF});
  stub->seed_hr(kTag, 0x0BB7, {0x4148, 0x0000});
  stub->seed_hr(kTag, 0x0BB9, {0x7FC0, 0x0000});
  stub->seed_hr(kTag, 0x0BBB, {0x7F80, 0x0000});
  stub->seed_hr(kTag, 0x0BCB, {0xFF80, 0x0000});
  stub->seed_hr(kTag, 0x0CE1, 0x0001);
  stub->seed_hr(kTag, 0x79A8, 0x0001);
  stub->seed_hr(kTag, 0x79A9, 0x0000);
  stub->seed_hr(kTag, 0x0C83, {0x0000, 0x0000, 0x0001, 0x86A0});
  stub->seed_hr(kTag, 0x0CE3, 0x0021);
  stub->seed_hr(kTag, 0x0CEF, {0x0017, 0x060F, 0x0E1E, 0xB043});
  stub->seed_hr(kTag, 0x7918, {0x4B69, 0x7463, 0x6865, 0x6E00, 0, 0, 0, 0, 0, 0});
  stub->seed_hr(kTag, 0x7925, 3);
  stub->seed_hr(kTag, 0x7926, 0xFFFF);
  stub->seed_hr(kTag, 0x7927, 1);
  stub->seed_hr(kTag, 0x7930, 45);
  stub->seed_hr(kTag, 0x792E, 0);
  g_stub = stub.get();
  return std::move(stub);
}

static json read_item(IoHandle h, const char* name) {
  char buf[1024] = {0};
  int rc = ReadItem(h, name, buf, sizeof(buf));
  assert(rc == 0);
  return json::parse(buf);
}

static json call(IoHandle h, const char* method, const char* params, int expect_rc) {
  char buf[8192] = {0};
  int rc = CallMethod(h, method, params, buf, sizeof(buf));
  assert(rc == expect_rc);
  return buf[0] ? json::parse(buf) : json();
}

int main() {
  json cfg = {
    {"transport", "tcp"},
    {"tcp", {{"host", "192.168.1.20"}, {"port", 502}, {"timeout_ms", 1500}}},
    {"items", json::array({
      {{"name", "kitchen.current.a"}, {"attribute", "tag_current"}, {"unit_id", kTag}, {"phase", "A"}},
      {{"name", "kitchen.current.b"}, {"attribute", "tag_current"}, {"unit_id", kTag}, {"phase", "B"}},
      {{"name", "kitchen.energy"}, {"attribute", "tag_energy_active_total"}, {"unit_id", kTag}},
      {{"name", "kitchen.alarm"}, {"attribute", "tag_alarm"}, {"unit_id", kTag}},
      {{"name", "kitchen.op_start"}, {"attribute", "tag_load_operating_time_start"}, {"unit_id", kTag}},
      {{"name", "kitchen.name"}, {"attribute", "tag_name"}, {"unit_id", kTag}},
      {{"name", "kitchen.usage"}, {"attribute", "tag_usage"}, {"unit_id", kTag}},
      {{"name", "kitchen.phases"}, {"attribute", "tag_phase_sequence"}, {"unit_id", kTag}},
      {{"name", "kitchen.product"}, {"attribute", "tag_product_type"}, {"unit_id", kTag}},
      {{"name", "kitchen.reset"}, {"attribute", "tag_reset_peak_demands"}, {"unit_id", kTag}},
      {{"name", "gw.clock"}, {"attribute", "date_time"}},
      {{"name", "node.1"}, {"attribute", "modbus_address_of_node"}, {"node", 1}},
      {{"name", "kitchen.position"}, {"attribute", "tag_position"}, {"unit_id", kTag}},
      {{"name", "kitchen.alarm_valid"}, {"attribute", "tag_alarm_valid"}, {"unit_id", kTag}},
      {{"name", "kitchen.radio_valid"}, {"attribute", "tag_radio_communication_valid"}, {"unit_id", kTag}},
      {{"name", "kitchen.wireless_valid"}, {"attribute", "tag_wireless_communication_valid"}, {"unit_id", kTag}},
      {{"name", "kitchen.current.c"}, {"attribute", "tag_current"}, {"unit_id", kTag}, {"phase", "C"}},
      {{"name", "kitchen.voltage.ab"}, {"attribute", "tag_voltage"}, {"unit_id", kTag}, {"line_voltage", "A_B"}}
    })}
  };

  IoHandle h = ptg::create_instance(cfg, make_gateway);
  assert(h);

  // rendering per type
  assert(read_item(h, "kitchen.current.a").get<double>() == 12.5);
  assert(read_item(h, "kitchen.current.b").is_null());
  assert(read_item(h, "kitchen.energy").get<std::uint64_t>() == 100000u);
  assert(read_item(h, "gw.clock").is_null());
  assert(read_item(h, "kitchen.op_start").get<std::string>() == "2023-06-15T14:30:45.123");
  assert(read_item(h, "kitchen.name").get<std::string>() == "Kitchen");
  assert(read_item(h, "kitchen.usage").get<std::string>() == "heating");
  assert(read_item(h, "kitchen.phases").get<std::string>() == "INVALID");
  assert(read_item(h, "node.1").get<int>() == kTag);

  // enums and flags carry the value the read produced
  assert(read_item(h, "kitchen.position").get<std::string>() == "top");
  assert(read_item(h, "kitchen.alarm_valid").get<bool>());
  assert(read_item(h, "kitchen.radio_valid").get<bool>());
  assert(!read_item(h, "kitchen.wireless_valid").get<bool>());
  g_stub->seed_hr(kTag, 0x7925, 21);
  assert(read_item(h, "kitchen.usage").get<std::string>() == "other");
  g_stub->seed_hr(kTag, 0x7925, 3);
  g_stub->seed_hr(kTag, 0x0CE1, 0x0000);
  assert(!read_item(h, "kitchen.alarm_valid").get<bool>());

  // infinities are values, not absence
  assert(read_item(h, "kitchen.current.c").get<std::string>() == "inf");
  assert(read_item(h, "kitchen.voltage.ab").get<std::string>() == "-inf");
  {
    json a = read_item(h, "kitchen.alarm");
    assert(a["has_alarm"].get<bool>());
    assert(a["alarm_voltage_loss"].get<bool>());
    assert(a["alarm_overvoltage"].get<bool>());
    assert(!a["alarm_undervoltage"].get<bool>());
  }
  {
    json p = read_item(h, "kitchen.product");
    assert(p["code"].get<int>() == 45);
    assert(p["reference"].get<std::string>() == "A9MEM1541");
    g_stub->seed_hr(kTag, 0x7930, 7);
    assert(read_item(h, "kitchen.product").is_null());
  }

  // writes
  {
    assert(WriteItem(h, "kitchen.name", "\"Office\"") == 0);
    assert(g_stub->last_address() == 0x7918);
    assert(read_item(h, "kitchen.name").get<std::string>() == "Office");
    assert(WriteItem(h, "kitchen.name", "\"abcdefghijklmnopqrstu\"") == static_cast<int>(ptg::Err::INVALID_ARG));
    assert(WriteItem(h, "kitchen.name", "42") == static_cast<int>(ptg::Err::PARSE_ERROR));
    assert(WriteItem(h, "kitchen.name", "not json") == static_cast<int>(ptg::Err::PARSE_ERROR));

    assert(WriteItem(h, "kitchen.reset", "true") == 0);
    assert(g_stub->last_address() == 0x792E && g_stub->holding(kTag, 0x792E) == 1);
    assert(WriteItem(h, "kitchen.reset", "false") == static_cast<int>(ptg::Err::INVALID_ARG));

    assert(WriteItem(h, "kitchen.current.a", "1.0") == static_cast<int>(ptg::Err::UNSUPPORTED));
    assert(WriteItem(h, "nope", "1") == static_cast<int>(ptg::Err::NOT_FOUND));

    char buf[128] = {0};
    assert(ReadItem(h, "kitchen.reset", buf, sizeof(buf)) == static_cast<int>(ptg::Err::UNSUPPORTED));
  }

  // describe
  {
    json d = call(h, "gateway.describe", "{}", 0);
    assert(d["synthesis_unit"].get<int>() == 210);
    assert(d["items"].size() == 18);
    const json& first = d["items"][0];
    assert(first["name"].get<std::string>() == "kitchen.current.a");
    assert(first["unit_id"].get<int>() == kTag);
    assert(first["address"].get<int>() == 0x0BB7 && first["count"].get<int>() == 2);
    assert(first["type"].get<std::string>() == "float32");
    const json& node = d["items"][11];
    assert(node["unit_id"].get<int>() == 210 && node["address"].get<int>() == 0x012C);
  }

  // logger.set
  {
    json r = call(h, "logger.set", R"({"level":"debug"})", 0);
    assert(r["level"].get<std::string>() == "DEBUG");
    call(h, "logger.set", R"({"lvl":"debug"})", static_cast<int>(ptg::Err::PARSE_ERROR));
    call(h, "logger.set", "{", static_cast<int>(ptg::Err::PARSE_ERROR));
    call(h, "logger.set", R"({"level":"verbose"})", static_cast<int>(ptg::Err::PARSE_ERROR));
    call(h, "logger.set", R"({"level":"warn"})", 0);
  }

  // gateway lost: reconnect fails and reads report NOT_CONNECTED until it is back
  {
    g_gateway_up = false;
    json r = call(h, "connection.reconnect", "{}", static_cast<int>(ptg::Err::SYNTHESIS_TABLE_NOT_FOUND));
    assert(r["error"]["name"].get<std::string>() == "SYNTHESIS_TABLE_NOT_FOUND");
    char buf[128] = {0};
    assert(ReadItem(h, "kitchen.energy", buf, sizeof(buf)) == static_cast<int>(ptg::Err::NOT_CONNECTED));
    assert(json::parse(buf)["error"]["code"].get<int>() == static_cast<int>(ptg::Err::NOT_CONNECTED));
    assert(WriteItem(h, "kitchen.name", "\"x\"") == static_cast<int>(ptg::Err::NOT_CONNECTED));
    json d = call(h, "gateway.describe", "{}", 0);
    assert(d["synthesis_unit"].is_null());

    g_gateway_up = true;
    r = call(h, "connection.reconnect", "{}", 0);
    assert(r["ok"].get<bool>() && r["synthesis_unit"].get<int>() == 210);
    assert(read_item(h, "kitchen.energy").get<std::uint64_t>() == 100000u);
  }

  // truncated output is still NUL terminated
  {
    char small[4] = {'x', 'x', 'x', 'x'};
    assert(ReadItem(h, "kitchen.name", small, sizeof(small)) == 0);
    assert(small[3] == '\0');
  }

  call(h, "diagnostics.snapshot", "{}", static_cast<int>(ptg::Err::UNSUPPORTED));
  DestroyIoInstance(h);

  // an unreachable gateway still yields a handle
  {
    g_gateway_up = false;
    IoHandle down = ptg::create_instance(cfg, make_gateway);
    assert(down);
    char buf[128] = {0};
    assert(ReadItem(down, "kitchen.energy", buf, sizeof(buf)) == static_cast<int>(ptg::Err::NOT_CONNECTED));
    DestroyIoInstance(down);
  }

  std::puts("unit_io_items: ok");
  return 0;
}
