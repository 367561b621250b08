#include "ledger/config/ledger_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ledger {

namespace {

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' has the wrong type: " + e.what());
  }
}

LedgerConfig fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("config must be a JSON object");
  }

  LedgerConfig cfg;

  std::int64_t timeout_ms = cfg.lock_timeout.count();
  readKey(j, "lock_timeout_ms", timeout_ms);
  if (timeout_ms <= 0) {
    throw std::runtime_error("lock_timeout_ms must be positive");
  }
  cfg.lock_timeout = std::chrono::milliseconds(timeout_ms);

  readKey(j, "command_endpoint", cfg.command_endpoint);
  readKey(j, "telemetry_endpoint", cfg.telemetry_endpoint);
  readKey(j, "audit_journal_path", cfg.audit_journal_path);
  readKey(j, "snapshot_path", cfg.snapshot_path);
  std::int64_t default_page = static_cast<std::int64_t>(cfg.default_page_size);
  std::int64_t max_page = static_cast<std::int64_t>(cfg.max_page_size);
  readKey(j, "default_page_size", default_page);
  readKey(j, "max_page_size", max_page);
  if (default_page <= 0 || max_page <= 0) {
    throw std::runtime_error("page sizes must be positive");
  }
  cfg.default_page_size = static_cast<std::size_t>(default_page);
  cfg.max_page_size = static_cast<std::size_t>(max_page);
  if (cfg.default_page_size > cfg.max_page_size) {
    throw std::runtime_error("default_page_size exceeds max_page_size");
  }

  return cfg;
}

}  // namespace

LedgerConfig parseConfig(const std::string& json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error(std::string("config is not valid JSON: ") +
                             e.what());
  }
  return fromJson(j);
}

LedgerConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace ledger
