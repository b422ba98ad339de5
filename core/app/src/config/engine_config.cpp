#include "oms/config/engine_config.hpp"
#include "oms/domain/error_code.hpp"

#include <cstdlib>
#include <fstream>
#include <set>

namespace oms {

namespace {

ForeignOrderPolicy parsePolicy(const std::string& text) {
  if (text == "adopt") return ForeignOrderPolicy::Adopt;
  if (text == "ignore") return ForeignOrderPolicy::Ignore;
  throw ConfigError("foreign_order_policy must be 'adopt' or 'ignore', got '" +
                    text + "'");
}

int parseInt(const char* name, const std::string& text) {
  try {
    std::size_t consumed = 0;
    const int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
      throw ConfigError(std::string(name) + " is not an integer: '" + text +
                        "'");
    }
    return value;
  } catch (const std::logic_error&) {
    throw ConfigError(std::string(name) + " is not an integer: '" + text +
                      "'");
  }
}

template <typename T>
T field(const nlohmann::json& j, const char* key) {
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

}  // namespace

const char* toString(ForeignOrderPolicy policy) {
  return policy == ForeignOrderPolicy::Adopt ? "adopt" : "ignore";
}

std::optional<std::string> processEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// -----------------------------------------------------------------------------
// configFromJson
// -----------------------------------------------------------------------------
EngineConfig configFromJson(const nlohmann::json& j, EngineConfig base) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  static const std::set<std::string> kKnownKeys = {
      "broker_host",          "broker_port",
      "broker_client_id",     "broker_call_timeout_ms",
      "unbound_event_window_ms", "default_list_limit",
      "foreign_order_policy", "default_account",
      "default_exchange",     "default_currency",
      "ipc_command_endpoint", "ipc_telemetry_endpoint",
      "ledger_path",          "sim_auto_fill",
      "sim_market_price",
  };
  for (const auto& [key, value] : j.items()) {
    if (kKnownKeys.count(key) == 0) {
      throw ConfigError("unknown config key '" + key + "'");
    }
  }

  EngineConfig c = std::move(base);
  if (j.contains("broker_host")) c.broker_host = field<std::string>(j, "broker_host");
  if (j.contains("broker_port")) c.broker_port = field<int>(j, "broker_port");
  if (j.contains("broker_client_id")) c.broker_client_id = field<int>(j, "broker_client_id");
  if (j.contains("broker_call_timeout_ms")) {
    c.broker_call_timeout =
        std::chrono::milliseconds(field<std::int64_t>(j, "broker_call_timeout_ms"));
  }
  if (j.contains("unbound_event_window_ms")) {
    c.unbound_event_window =
        std::chrono::milliseconds(field<std::int64_t>(j, "unbound_event_window_ms"));
  }
  if (j.contains("default_list_limit")) c.default_list_limit = field<int>(j, "default_list_limit");
  if (j.contains("foreign_order_policy")) {
    c.foreign_order_policy = parsePolicy(field<std::string>(j, "foreign_order_policy"));
  }
  if (j.contains("default_account")) c.default_account = field<std::string>(j, "default_account");
  if (j.contains("default_exchange")) c.default_exchange = field<std::string>(j, "default_exchange");
  if (j.contains("default_currency")) c.default_currency = field<std::string>(j, "default_currency");
  if (j.contains("ipc_command_endpoint")) c.ipc_command_endpoint = field<std::string>(j, "ipc_command_endpoint");
  if (j.contains("ipc_telemetry_endpoint")) c.ipc_telemetry_endpoint = field<std::string>(j, "ipc_telemetry_endpoint");
  if (j.contains("ledger_path")) c.ledger_path = field<std::string>(j, "ledger_path");
  if (j.contains("sim_auto_fill")) c.sim_auto_fill = field<bool>(j, "sim_auto_fill");
  if (j.contains("sim_market_price")) c.sim_market_price = field<double>(j, "sim_market_price");
  return c;
}

// -----------------------------------------------------------------------------
// applyEnvironment
// -----------------------------------------------------------------------------
void applyEnvironment(EngineConfig& config, const EnvLookup& env) {
  if (auto v = env("OMS_BROKER_HOST")) config.broker_host = *v;
  if (auto v = env("OMS_BROKER_PORT")) config.broker_port = parseInt("OMS_BROKER_PORT", *v);
  if (auto v = env("OMS_BROKER_CLIENT_ID")) {
    config.broker_client_id = parseInt("OMS_BROKER_CLIENT_ID", *v);
  }
  if (auto v = env("OMS_IPC_CMD_ENDPOINT")) config.ipc_command_endpoint = *v;
  if (auto v = env("OMS_IPC_PUB_ENDPOINT")) config.ipc_telemetry_endpoint = *v;
  if (auto v = env("OMS_LEDGER_PATH")) config.ledger_path = *v;
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
void validateConfig(const EngineConfig& c) {
  if (c.broker_host.empty()) {
    throw ConfigError("broker_host must not be empty");
  }
  if (c.broker_port <= 0 || c.broker_port > 65535) {
    throw ConfigError("broker_port out of range: " + std::to_string(c.broker_port));
  }
  if (c.broker_call_timeout.count() <= 0) {
    throw ConfigError("broker_call_timeout_ms must be positive");
  }
  if (c.unbound_event_window.count() <= 0) {
    throw ConfigError("unbound_event_window_ms must be positive");
  }
  if (c.default_list_limit <= 0) {
    throw ConfigError("default_list_limit must be positive");
  }
  if (c.default_account.empty()) {
    throw ConfigError("default_account must not be empty");
  }
  if (c.ipc_command_endpoint.empty() || c.ipc_telemetry_endpoint.empty()) {
    throw ConfigError("IPC endpoints must not be empty");
  }
  if (c.sim_market_price <= 0.0) {
    throw ConfigError("sim_market_price must be positive");
  }
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
EngineConfig loadConfig(const std::optional<std::string>& path,
                        const EnvLookup& env) {
  EngineConfig config;

  if (path) {
    std::ifstream in(*path);
    if (!in) {
      throw ConfigError("cannot open config file '" + *path + "'");
    }
    nlohmann::json doc;
    try {
      doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigError("config file '" + *path + "' is not valid JSON: " +
                        e.what());
    }
    config = configFromJson(doc, std::move(config));
  }

  applyEnvironment(config, env);
  validateConfig(config);
  return config;
}

}  // namespace oms
