#include "solidcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <cstdlib>
#include <set>
#include <sstream>

namespace solidcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

bool is_hex_seed(std::string_view text) {
  if (text.size() != 64) {
    return false;
  }
  for (char c : text) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    const bool upper = c >= 'A' && c <= 'F';
    if (!digit && !lower && !upper) {
      return false;
    }
  }
  return true;
}

TokenConfig parse_token(const toml::table& root) {
  TokenConfig cfg;
  if (auto* token = root["token"].as_table()) {
    cfg.name = get_str_or(*token, "name", cfg.name);
    cfg.symbol = get_str_or(*token, "symbol", cfg.symbol);
    cfg.decimals = get_int_or(*token, "decimals", cfg.decimals);
  }
  return cfg;
}

ChainConfig parse_chain(const toml::table& root) {
  ChainConfig cfg;
  if (auto* chain = root["chain"].as_table()) {
    cfg.start_block = get_int_or(*chain, "start_block", cfg.start_block);
  }
  return cfg;
}

std::vector<AccountConfig> parse_accounts(const toml::table& root) {
  std::vector<AccountConfig> accounts;
  if (auto* arr = root["accounts"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* account_tbl = elem.as_table()) {
        AccountConfig account;
        account.name = get_str_or(*account_tbl, "name", "");
        account.seed = get_str_or(*account_tbl, "seed", "");
        account.balance = get_int_or(*account_tbl, "balance", 0);
        accounts.push_back(std::move(account));
      }
    }
  }
  return accounts;
}

BootstrapConfig parse_bootstrap(const toml::table& root) {
  BootstrapConfig cfg;
  if (auto* bootstrap = root["bootstrap"].as_table()) {
    cfg.deployer = get_str_or(*bootstrap, "deployer", cfg.deployer);
    cfg.pool_currency = get_int_or(*bootstrap, "pool_currency", cfg.pool_currency);
    if (auto* arr = (*bootstrap)["allocations"].as_array()) {
      for (const auto& elem : *arr) {
        if (auto* alloc_tbl = elem.as_table()) {
          cfg.allocations.push_back(AllocationConfig{
              .account = get_str_or(*alloc_tbl, "account", ""),
              .amount = get_int_or(*alloc_tbl, "amount", 0),
          });
        }
      }
    }
  }
  return cfg;
}

LockConfig parse_lock(const toml::table& root) {
  LockConfig cfg;
  if (auto* lock = root["lock"].as_table()) {
    cfg.enabled = get_bool_or(*lock, "enabled", cfg.enabled);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    const auto threshold = get_int_or(*persistence, "wal_flush_threshold",
                                      static_cast<std::int64_t>(cfg.wal_flush_threshold));
    cfg.wal_flush_threshold = threshold > 0 ? static_cast<std::size_t>(threshold) : 0;
    cfg.snapshot_on_exit = get_bool_or(*persistence, "snapshot_on_exit", cfg.snapshot_on_exit);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.token = parse_token(root);
  cfg.chain = parse_chain(root);
  cfg.accounts = parse_accounts(root);
  cfg.bootstrap = parse_bootstrap(root);
  cfg.lock = parse_lock(root);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

template <typename ParseResult>
LoadResult finish(ParseResult& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

const AccountConfig* EngineConfig::find_account(std::string_view name) const {
  for (const auto& account : accounts) {
    if (account.name == name) {
      return &account;
    }
  }
  return nullptr;
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  return finish(parse_result);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  return finish(parse_result);
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.token.name.empty()) {
    errors.push_back({"token.name", "name cannot be empty"});
  }
  if (config.token.symbol.empty()) {
    errors.push_back({"token.symbol", "symbol cannot be empty"});
  }
  if (config.token.decimals < 0 || config.token.decimals > 18) {
    errors.push_back({"token.decimals", "must be between 0 and 18"});
  }

  if (config.chain.start_block < 1) {
    errors.push_back({"chain.start_block", "must be at least 1"});
  }

  if (config.accounts.empty()) {
    errors.push_back({"accounts", "at least one account is required"});
  }

  std::set<std::string> names;
  std::set<std::string> seeds;
  for (std::size_t i = 0; i < config.accounts.size(); ++i) {
    const auto& account = config.accounts[i];
    const std::string prefix = "accounts[" + std::to_string(i) + "]";

    if (account.name.empty()) {
      errors.push_back({prefix + ".name", "name cannot be empty"});
    } else if (account.name == kTokenName || account.name == kLockName) {
      errors.push_back({prefix + ".name", "'" + account.name + "' is reserved"});
    } else if (!names.insert(account.name).second) {
      errors.push_back({prefix + ".name", "duplicate account '" + account.name + "'"});
    }

    if (!is_hex_seed(account.seed)) {
      errors.push_back({prefix + ".seed", "must be 64 hex digits"});
    } else if (!seeds.insert(account.seed).second) {
      errors.push_back({prefix + ".seed", "seed shared with another account"});
    }

    if (account.balance < 0) {
      errors.push_back({prefix + ".balance", "must not be negative"});
    }
  }

  const auto* deployer = config.find_account(config.bootstrap.deployer);
  if (!deployer) {
    errors.push_back({"bootstrap.deployer", "unknown account '" + config.bootstrap.deployer + "'"});
  }
  if (config.bootstrap.pool_currency < 0) {
    errors.push_back({"bootstrap.pool_currency", "must not be negative"});
  } else if (deployer && config.bootstrap.pool_currency > deployer->balance) {
    errors.push_back({"bootstrap.pool_currency", "exceeds the deployer's balance"});
  }

  for (std::size_t i = 0; i < config.bootstrap.allocations.size(); ++i) {
    const auto& allocation = config.bootstrap.allocations[i];
    const std::string prefix = "bootstrap.allocations[" + std::to_string(i) + "]";
    if (allocation.account != kTokenName && !config.find_account(allocation.account)) {
      errors.push_back({prefix + ".account", "unknown account '" + allocation.account + "'"});
    }
    if (allocation.amount <= 0) {
      errors.push_back({prefix + ".amount", "must be positive"});
    }
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }
  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }
  if (config.persistence.wal_flush_threshold == 0) {
    errors.push_back({"persistence.wal_flush_threshold", "must be greater than 0"});
  }

  return errors;
}

std::vector<std::filesystem::path> ConfigLoader::default_search_paths() {
  std::vector<std::filesystem::path> paths{
      "solidcore.toml",
      "/etc/solidcore/solidcore.toml",
  };
  if (const char* home = std::getenv("HOME")) {
    paths.push_back(std::filesystem::path(home) / ".config" / "solidcore" / "solidcore.toml");
  }
  return paths;
}

std::optional<std::filesystem::path> ConfigLoader::find_default() {
  for (const auto& path : default_search_paths()) {
    if (std::filesystem::exists(path)) {
      return path;
    }
  }
  return std::nullopt;
}

std::string ConfigLoader::generate_default() {
  return R"(# SolidCore configuration
# Generated default configuration

[token]
name = "Solid Value"
symbol = "SOLID"
decimals = 9

[chain]
start_block = 1

[[accounts]]
name = "deployer"
seed = "0101010101010101010101010101010101010101010101010101010101010101"
balance = 10000000

[[accounts]]
name = "alice"
seed = "0202020202020202020202020202020202020202020202020202020202020202"
balance = 1000000

[[accounts]]
name = "bob"
seed = "0303030303030303030303030303030303030303030303030303030303030303"
balance = 1000000

[bootstrap]
deployer = "deployer"
pool_currency = 1000000   # seeds the pool's currency reserve

[[bootstrap.allocations]]
account = "token"         # the pool's unit reserve
amount = 500000

[[bootstrap.allocations]]
account = "deployer"
amount = 100000

[lock]
enabled = true

[persistence]
wal_path = "/var/lib/solidcore/calls.wal"
snapshot_dir = "/var/lib/solidcore/snapshots"
wal_flush_threshold = 65536
snapshot_on_exit = true

[telemetry]
enabled = true
)";
}

}  // namespace config
}  // namespace solidcore
