#include "test_config.hpp"

#include <cassert>
#include <string>
#include <vector>

#include "solidcore/config/config_loader.hpp"

namespace solidcore::tests {

namespace {

bool has_error(const std::vector<config::ValidationError>& errors, const std::string& field) {
  for (const auto& error : errors) {
    if (error.field == field) {
      return true;
    }
  }
  return false;
}

}  // namespace

void test_config_defaults() {
  const auto result =
      config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  assert(result.success);
  assert(result.errors.empty());

  const auto& cfg = result.config;
  assert(cfg.token.symbol == "SOLID");
  assert(cfg.token.decimals == 9);
  assert(cfg.chain.start_block == 1);
  assert(cfg.accounts.size() == 3);
  assert(cfg.find_account("alice") != nullptr);
  assert(cfg.find_account("alice")->balance == 1000000);
  assert(cfg.find_account("mallory") == nullptr);
  assert(cfg.bootstrap.deployer == "deployer");
  assert(cfg.bootstrap.pool_currency == 1000000);
  assert(cfg.bootstrap.allocations.size() == 2);
  assert(cfg.bootstrap.allocations[0].account == "token");
  assert(cfg.lock.enabled);
  assert(cfg.persistence.wal_flush_threshold == 65536);
  assert(cfg.persistence.snapshot_on_exit);
  assert(cfg.telemetry.enabled);

  // Omitted tables keep their defaults.
  const auto minimal = config::ConfigLoader::load_from_string(R"(
[[accounts]]
name = "deployer"
seed = "0101010101010101010101010101010101010101010101010101010101010101"
balance = 5

[persistence]
wal_path = "calls.wal"
snapshot_dir = "snapshots"
snapshot_on_exit = false
)");
  assert(minimal.success);
  assert(minimal.config.token.name == "Solid Value");
  assert(minimal.config.bootstrap.pool_currency == 0);
  assert(minimal.config.persistence.wal_path == "calls.wal");
  assert(!minimal.config.persistence.snapshot_on_exit);

  const auto paths = config::ConfigLoader::default_search_paths();
  assert(!paths.empty());
  assert(paths.front() == "solidcore.toml");
}

void test_config_validation() {
  const auto parse_error = config::ConfigLoader::load_from_string("[token\nname = 1");
  assert(!parse_error.success);
  assert(!parse_error.raw_error.empty());

  const auto missing = config::ConfigLoader::load("/nonexistent/solidcore.toml");
  assert(!missing.success);
  assert(missing.raw_error.find("not found") != std::string::npos);

  const auto result = config::ConfigLoader::load_from_string(R"(
[token]
symbol = ""
decimals = 40

[chain]
start_block = 0

[[accounts]]
name = "token"
seed = "0101010101010101010101010101010101010101010101010101010101010101"

[[accounts]]
name = "alice"
seed = "not-hex"
balance = -1

[[accounts]]
name = "alice"
seed = "0101010101010101010101010101010101010101010101010101010101010101"
balance = 10

[bootstrap]
deployer = "alice"
pool_currency = 50

[[bootstrap.allocations]]
account = "carol"
amount = 0

[persistence]
wal_flush_threshold = 0
)");
  assert(!result.success);
  const auto& errors = result.errors;
  assert(has_error(errors, "token.symbol"));
  assert(has_error(errors, "token.decimals"));
  assert(has_error(errors, "chain.start_block"));
  assert(has_error(errors, "accounts[0].name"));
  assert(has_error(errors, "accounts[1].seed"));
  assert(has_error(errors, "accounts[1].balance"));
  assert(has_error(errors, "accounts[2].name"));
  assert(has_error(errors, "accounts[2].seed"));
  assert(has_error(errors, "bootstrap.pool_currency"));
  assert(has_error(errors, "bootstrap.allocations[0].account"));
  assert(has_error(errors, "bootstrap.allocations[0].amount"));
  assert(has_error(errors, "persistence.wal_flush_threshold"));
  assert(!has_error(errors, "bootstrap.deployer"));
}

}  // namespace solidcore::tests
