#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace solidcore {
namespace config {

// Reserved names in the address book; accounts may not use them.
inline constexpr std::string_view kTokenName = "token";
inline constexpr std::string_view kLockName = "lock";

struct TokenConfig {
  std::string name{"Solid Value"};
  std::string symbol{"SOLID"};
  std::int64_t decimals{9};
};

struct ChainConfig {
  std::int64_t start_block{1};
};

struct AccountConfig {
  std::string name;
  std::string seed;  // 64 hex digits, ed25519 seed
  std::int64_t balance{0};
};

struct AllocationConfig {
  std::string account;  // account name, or "token" for the pool
  std::int64_t amount{0};
};

struct BootstrapConfig {
  std::string deployer{"deployer"};
  std::int64_t pool_currency{0};
  std::vector<AllocationConfig> allocations;
};

struct LockConfig {
  bool enabled{true};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/solidcore/calls.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/solidcore/snapshots"};
  std::size_t wal_flush_threshold{1 << 16};
  bool snapshot_on_exit{true};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct EngineConfig {
  TokenConfig token;
  ChainConfig chain;
  std::vector<AccountConfig> accounts;
  BootstrapConfig bootstrap;
  LockConfig lock;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;

  [[nodiscard]] const AccountConfig* find_account(std::string_view name) const;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();

  // ./solidcore.toml, /etc/solidcore/solidcore.toml, then $HOME/.config/solidcore/solidcore.toml.
  static std::vector<std::filesystem::path> default_search_paths();
  static std::optional<std::filesystem::path> find_default();
};

}  // namespace config
}  // namespace solidcore
