#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include "export.hpp"
#include "GatewayConfig.hpp"
#include "IModbusClient.hpp"

namespace ptg {

// Creates the transport for a parsed configuration; CreateIoInstance uses
// make_tcp_client.
using ClientFactory = std::function<std::unique_ptr<IModbusClient>(const GatewayConfig&)>;

// C++ entry point behind CreateIoInstance. Returns nullptr on an invalid
// configuration. A gateway that cannot be opened yet still yields a handle;
// reads then fail with NOT_CONNECTED until connection.reconnect succeeds.
PTG_API void* create_instance(const nlohmann::json& cfg, ClientFactory factory);

} // namespace ptg

extern "C" {

using IoHandle = void*;

PTG_API IoHandle CreateIoInstance(void* user_param, const char* jsonConfigPath);
PTG_API void DestroyIoInstance(IoHandle h);
PTG_API int ReadItem(IoHandle h, const char* name, /*out*/char* outJson, int outSize);
PTG_API int WriteItem(IoHandle h, const char* name, const char* valueJson);
PTG_API int CallMethod(IoHandle h, const char* method, const char* paramsJson, /*out*/char* outJson, int outSize);

} // extern "C"
