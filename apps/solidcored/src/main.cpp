#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "solidcore/auth/authenticator.hpp"
#include "solidcore/chain/runtime.hpp"
#include "solidcore/common/block_clock.hpp"
#include "solidcore/common/error.hpp"
#include "solidcore/config/config_loader.hpp"
#include "solidcore/ingest/call.hpp"
#include "solidcore/ingest/call_dispatcher.hpp"
#include "solidcore/ingest/call_script.hpp"
#include "solidcore/lock/liquidity_lock.hpp"
#include "solidcore/replay/replay_driver.hpp"
#include "solidcore/replay/state_image.hpp"
#include "solidcore/snapshot/snapshot_store.hpp"
#include "solidcore/telemetry/telemetry_sink.hpp"
#include "solidcore/token/solid_token.hpp"
#include "solidcore/wal/wal_writer.hpp"

namespace {

using namespace solidcore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [call_script]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./solidcore.toml or generates defaults\n"
            << "  call_script: Calls to apply after state is restored\n";
}

std::optional<config::EngineConfig> load_config(int argc, char* argv[]) {
  std::optional<std::filesystem::path> config_path;
  if (argc > 1) {
    config_path = std::filesystem::path{argv[1]};
  } else {
    config_path = config::ConfigLoader::find_default();
  }

  config::LoadResult result;
  if (!config_path) {
    std::cout << "No config file found, using defaults\n";
    result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
  } else {
    std::cout << "Loading config from: " << *config_path << "\n";
    result = config::ConfigLoader::load(*config_path);
  }

  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return std::move(result.config);
}

struct Identity {
  std::string name;
  common::Address address;
  auth::KeyPair keys;
};

// Mints configured balances and provisions the token. Restoring a snapshot overwrites all of
// it, so genesis always runs first.
void run_genesis(const config::EngineConfig& cfg, const std::vector<Identity>& identities,
                 const ingest::AddressBook& book, chain::Runtime& runtime,
                 token::SolidToken& token) {
  for (std::size_t i = 0; i < identities.size(); ++i) {
    const auto balance = static_cast<common::Amount>(cfg.accounts[i].balance);
    if (balance > 0) {
      runtime.bank().mint(identities[i].address, balance);
    }
  }

  std::vector<token::Allocation> allocations;
  for (const auto& allocation : cfg.bootstrap.allocations) {
    allocations.push_back(token::Allocation{
        .account = *book.find(allocation.account),
        .amount = static_cast<common::Amount>(allocation.amount),
    });
  }
  token.provision(*book.find(cfg.bootstrap.deployer),
                  static_cast<common::Amount>(cfg.bootstrap.pool_currency), allocations);
}

void print_state(const ingest::AddressBook& book, const std::vector<Identity>& identities,
                 const chain::Runtime& runtime, const token::SolidToken& token,
                 const lock::LiquidityLock* liquidity_lock) {
  const auto reserves = token.get_reserves();
  std::cout << "State at block " << runtime.current_block() << "\n";
  std::cout << "  " << token.name() << " (" << token.symbol() << "), supply "
            << token.total_supply() << "\n";
  std::cout << "  Backing reserve: " << token.solid_value() << "\n";
  if (token.total_supply() > 0) {
    std::cout << "  Unit value: " << token.unit_value() << "\n";
  } else {
    std::cout << "  Unit value: undefined\n";
  }
  std::cout << "  Pool reserves: currency " << reserves.currency << ", units " << reserves.units
            << "\n";
  if (liquidity_lock) {
    std::cout << "  Liquidity lock: " << lock::to_string(liquidity_lock->state()) << ", balance "
              << liquidity_lock->locked_balance() << ", unlock block "
              << liquidity_lock->unlock_block() << "\n";
  }
  for (const auto& identity : identities) {
    std::cout << "  " << book.name_of(identity.address) << ": units "
              << token.balance_of(identity.address) << ", currency "
              << runtime.bank().balance_of(identity.address) << "\n";
  }
}

void print_telemetry(telemetry::TelemetrySink& sink) {
  const auto rejections = sink.rejection_counts();
  const auto summaries = sink.drain();
  std::cout << "Telemetry\n";
  for (const auto& summary : summaries) {
    std::cout << "  " << ingest::to_string(static_cast<ingest::CallKind>(summary.kind))
              << ": accepted " << summary.accepted << ", rejected " << summary.rejected
              << ", mean " << summary.mean_ns << "ns, p99 " << summary.p99_ns << "ns\n";
  }
  for (const auto& [code, count] : rejections) {
    std::cout << "  rejected with " << common::to_string(static_cast<common::ErrorCode>(code))
              << ": " << count << "\n";
  }
}

int run(const config::EngineConfig& cfg, const std::optional<std::filesystem::path>& script_path) {
  std::cout << "Config loaded successfully\n";
  std::cout << "  Token: " << cfg.token.name << " (" << cfg.token.symbol << ")\n";
  std::cout << "  Accounts: " << cfg.accounts.size() << "\n";
  std::cout << "  WAL path: " << cfg.persistence.wal_path << "\n";

  auth::Authenticator authenticator;
  ingest::AddressBook book;
  std::vector<Identity> identities;
  for (const auto& account : cfg.accounts) {
    const auto keys = auth::Authenticator::keypair_from_seed(auth::seed_from_hex(account.seed));
    const auto address = authenticator.register_key(keys.public_key);
    book.add(account.name, address);
    identities.push_back(Identity{.name = account.name, .address = address, .keys = keys});
  }
  std::cout << "  Auth: " << authenticator.account_count() << " registered accounts\n";

  const auto deployer = *book.find(cfg.bootstrap.deployer);
  const auto token_address = auth::derive_contract_address(deployer, 0);
  const auto lock_address = auth::derive_contract_address(deployer, 1);
  book.add(std::string(config::kTokenName), token_address);

  common::ManualBlockClock clock{static_cast<common::BlockNumber>(cfg.chain.start_block)};
  chain::Runtime runtime{clock};

  token::SolidToken token{token::TokenMetadata{.name = cfg.token.name,
                                               .symbol = cfg.token.symbol,
                                               .decimals = static_cast<std::uint8_t>(cfg.token.decimals)},
                          token_address, deployer, runtime};
  std::cout << "  Token deployed at " << token_address.to_hex() << "\n";

  std::optional<lock::LiquidityLock> liquidity_lock;
  if (cfg.lock.enabled) {
    liquidity_lock.emplace(lock_address, deployer, runtime);
    book.add(std::string(config::kLockName), lock_address);
    std::cout << "  Liquidity lock deployed at " << lock_address.to_hex() << "\n";
  }
  lock::LiquidityLock* lock_ptr = liquidity_lock ? &*liquidity_lock : nullptr;

  telemetry::TelemetrySink telemetry;
  ingest::CallDispatcher dispatcher{authenticator, token, lock_ptr, clock,
                                    cfg.telemetry.enabled ? &telemetry : nullptr};

  run_genesis(cfg, identities, book, runtime, token);

  if (!cfg.persistence.wal_path.parent_path().empty()) {
    std::filesystem::create_directories(cfg.persistence.wal_path.parent_path());
  }
  // Opening the writer first cuts off any torn tail before replay reads the log.
  wal::Writer wal{cfg.persistence.wal_path, cfg.persistence.wal_flush_threshold};
  snapshot::Store snapshot{cfg.persistence.snapshot_dir};

  const replay::StateRefs state{
      .clock = clock, .bank = runtime.bank(), .token = token, .liquidity_lock = lock_ptr};

  replay::Driver replay;
  replay.configure(snapshot.directory(), cfg.persistence.wal_path);
  replay.set_snapshot_handler([&](common::SequenceId sequence, std::span<const std::byte> image) {
    replay::restore(state, image);
    std::cout << "Restored snapshot at WAL sequence " << sequence << "\n";
  });
  replay.set_call_handler([&](common::SequenceId sequence, const ingest::SignedCall& signed_call) {
    const auto result = dispatcher.apply(signed_call.call);
    if (!result.accepted) {
      std::cerr << "Replay diverged at WAL sequence " << sequence << ": " << result.message
                << "\n";
    }
  });
  const auto stats = replay.execute();
  std::cout << "Replayed " << stats.calls_replayed << " calls from the WAL\n";

  dispatcher.set_accepted_sink([&wal](const ingest::SignedCall& signed_call) {
    const auto payload = ingest::encode(signed_call);
    wal.append(payload);
  });

  if (script_path) {
    const auto calls = ingest::load_call_script(*script_path, book);
    std::cout << "Applying " << calls.size() << " calls from " << *script_path << "\n";
    for (const auto& scripted : calls) {
      const auto& call = scripted.call;
      const Identity* signer = nullptr;
      for (const auto& identity : identities) {
        if (identity.address == call.caller) {
          signer = &identity;
        }
      }
      if (!signer) {
        std::cerr << "line " << scripted.line << ": caller " << call.caller.to_hex()
                  << " has no configured key\n";
        continue;
      }

      const auto result = dispatcher.submit(ingest::sign_call(call, signer->keys.secret_key));
      std::cout << "  [" << scripted.line << "] @" << call.block << " " << signer->name << " "
                << ingest::to_string(call.kind) << ": ";
      if (result.accepted) {
        std::cout << "ok";
        if (result.output > 0) {
          std::cout << " (" << result.output << ")";
        }
        std::cout << "\n";
      } else {
        std::cout << "rejected " << result.message << "\n";
      }
    }
  }

  wal.sync();
  if (cfg.persistence.snapshot_on_exit) {
    const auto image = replay::capture(state);
    snapshot.persist(wal.last_sequence(), image);
    std::cout << "Snapshot persisted at WAL sequence " << wal.last_sequence() << "\n";
  }

  std::cout << "Events emitted this run: " << runtime.events().size() << "\n";
  print_state(book, identities, runtime, token, lock_ptr);
  if (cfg.telemetry.enabled) {
    print_telemetry(telemetry);
  }
  std::cout << "Calls accepted: " << dispatcher.accepted_count()
            << ", rejected: " << dispatcher.rejected_count() << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  auto cfg = load_config(argc, argv);
  if (!cfg) {
    return 1;
  }

  std::optional<std::filesystem::path> script_path;
  if (argc > 2) {
    script_path = std::filesystem::path{argv[2]};
  }

  try {
    return run(*cfg, script_path);
  } catch (const common::LedgerError& e) {
    std::cerr << "Bootstrap failed: " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "solidcored: " << e.what() << "\n";
  }
  return 1;
}
