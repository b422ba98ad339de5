#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace oms {

// What the reconciler does with an open order the broker reports but the
// engine never placed (for example one entered in the broker's own UI).
enum class ForeignOrderPolicy {
  Adopt,   // Synthesize a new internal order and bind it
  Ignore,  // Log and drop
};

const char* toString(ForeignOrderPolicy policy);

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Every tunable of the engine, with working defaults for a local
//         paper-trading gateway.
//
// @details
// Sources, later wins:
//   1. the defaults below
//   2. an optional JSON file (keys are the field names)
//   3. environment variables:
//        OMS_BROKER_HOST, OMS_BROKER_PORT, OMS_BROKER_CLIENT_ID,
//        OMS_IPC_CMD_ENDPOINT, OMS_IPC_PUB_ENDPOINT, OMS_LEDGER_PATH
//
// The default account/exchange/currency key the positions that fills
// create; a broker position snapshot for the same key then merges with them.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string broker_host{"127.0.0.1"};
  int broker_port{7497};
  int broker_client_id{1};

  std::chrono::milliseconds broker_call_timeout{5000};
  std::chrono::milliseconds unbound_event_window{2000};

  int default_list_limit{100};
  ForeignOrderPolicy foreign_order_policy{ForeignOrderPolicy::Adopt};

  std::string default_account{"DU000000"};
  std::string default_exchange{"SMART"};
  std::string default_currency{"USD"};

  std::string ipc_command_endpoint{"tcp://*:5555"};
  std::string ipc_telemetry_endpoint{"tcp://*:5556"};

  // Empty: the ledger lives in memory only.
  std::string ledger_path;

  // Simulated broker settings (executable only).
  bool sim_auto_fill{false};
  double sim_market_price{100.0};
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads the real process environment.
std::optional<std::string> processEnv(const char* name);

// -----------------------------------------------------------------------------
// Loading
// -----------------------------------------------------------------------------
// All functions throw ConfigError with the offending key and value.
// -----------------------------------------------------------------------------

// Overlays the keys present in `j` onto `base`. Unknown keys are rejected.
EngineConfig configFromJson(const nlohmann::json& j,
                            EngineConfig base = EngineConfig{});

void applyEnvironment(EngineConfig& config, const EnvLookup& env);

void validateConfig(const EngineConfig& config);

// Defaults, then the file at `path` (if given), then the environment; the
// result is validated.
EngineConfig loadConfig(const std::optional<std::string>& path,
                        const EnvLookup& env = processEnv);

}  // namespace oms
