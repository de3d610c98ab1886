#include "solidcore/token/solid_token.hpp"

#include <string>
#include <utility>

#include "solidcore/auth/authenticator.hpp"
#include "solidcore/common/checked_math.hpp"
#include "solidcore/common/error.hpp"
#include "solidcore/state/journal.hpp"
#include "solidcore/swap/swap_engine.hpp"

namespace solidcore {
namespace token {

namespace {
constexpr std::uint64_t kCustodianNonce = 1;
}

SolidToken::SolidToken(TokenMetadata metadata, common::Address self, common::Address deployer,
                       chain::Runtime& runtime)
    : metadata_(std::move(metadata)),
      self_(self),
      deployer_(deployer),
      runtime_(runtime),
      ledger_(runtime.journal()),
      same_block_(runtime.journal(), runtime.clock()),
      custodian_(std::make_unique<custodian::ReserveCustodian>(
          auth::derive_contract_address(self, kCustodianNonce), self, runtime)) {}

void SolidToken::provision(const common::Address& caller, common::Amount value,
                           std::span<const Allocation> allocations) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "provision");
  state::Transaction tx(runtime_.journal());

  if (caller != deployer_) {
    common::fail(common::ErrorCode::kUnauthorized, caller.to_hex() + " is not the deployer");
  }
  if (provisioned_) {
    common::fail(common::ErrorCode::kAlreadyProvisioned);
  }

  if (value > 0) {
    collect(caller, value);
  }
  for (const auto& allocation : allocations) {
    ledger_.mint(allocation.account, allocation.amount);
    runtime_.events().emit(self_, events::TransferEvent{
                                      .from = common::kNullAddress,
                                      .to = allocation.account,
                                      .amount = allocation.amount,
                                  });
  }
  set_provisioned(true);

  tx.commit();
}

bool SolidToken::transfer(const common::Address& caller, const common::Address& to,
                          common::Amount amount) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "transfer");
  state::Transaction tx(runtime_.journal());

  if (to == self_) {
    sell_locked(caller, amount);
  } else {
    if (to.is_null()) {
      common::fail(common::ErrorCode::kZeroAddress, "transfer to the null address");
    }
    internal_move(caller, caller, to, amount);
  }

  tx.commit();
  return true;
}

bool SolidToken::approve(const common::Address& caller, const common::Address& spender,
                         common::Amount amount) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "approve");
  state::Transaction tx(runtime_.journal());

  ledger_.approve(caller, spender, amount);
  runtime_.events().emit(self_, events::ApprovalEvent{
                                    .owner = caller,
                                    .spender = spender,
                                    .amount = amount,
                                });

  tx.commit();
  return true;
}

bool SolidToken::transfer_from(const common::Address& caller, const common::Address& from,
                               const common::Address& to, common::Amount amount) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "transfer_from");
  state::Transaction tx(runtime_.journal());

  if (from.is_null() || to.is_null()) {
    common::fail(common::ErrorCode::kZeroAddress, "transfer_from involving the null address");
  }
  ledger_.spend_allowance(from, caller, amount);
  internal_move(caller, from, to, amount);

  tx.commit();
  return true;
}

common::Amount SolidToken::receive(const common::Address& caller, common::Amount value) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "buy");
  state::Transaction tx(runtime_.journal());

  if (value == 0) {
    common::fail(common::ErrorCode::kZeroValueNotAllowed, "buy without currency");
  }

  // Priced against the reserves as they were before this call's currency arrives.
  const auto units = swap::quote(value, swap::Direction::kBuy, get_reserves());
  if (units == 0) {
    common::fail(common::ErrorCode::kBuyTooLow, std::to_string(value) + " buys no units");
  }

  collect(caller, value);
  internal_move(caller, self_, caller, units);
  runtime_.events().emit(self_, events::SwapEvent{
                                    .sender = caller,
                                    .currency_in = value,
                                    .units_in = 0,
                                    .currency_out = 0,
                                    .units_out = units,
                                });

  tx.commit();
  return units;
}

common::Amount SolidToken::sell(const common::Address& caller, common::Amount amount) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "sell");
  state::Transaction tx(runtime_.journal());
  const auto payout = sell_locked(caller, amount);
  tx.commit();
  return payout;
}

common::Amount SolidToken::sell_locked(const common::Address& caller, common::Amount amount) {
  if (amount == 0) {
    common::fail(common::ErrorCode::kSellTooLow, "nothing to sell");
  }

  const auto reserves = get_reserves();
  const auto payout = swap::quote(amount, swap::Direction::kSell, reserves);
  if (payout == 0) {
    common::fail(common::ErrorCode::kSellTooLow, std::to_string(amount) + " units pay nothing");
  }
  if (reserves.currency < payout) {
    common::fail(common::ErrorCode::kInsufficientReserve,
                 "pool holds " + std::to_string(reserves.currency) + ", owes " +
                     std::to_string(payout));
  }

  // Units are taken before the payout leaves the contract.
  internal_move(caller, caller, self_, amount);
  if (!runtime_.bank().transfer(self_, caller, payout)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 "payout of " + std::to_string(payout) + " to " + caller.to_hex());
  }
  runtime_.events().emit(self_, events::SwapEvent{
                                    .sender = caller,
                                    .currency_in = 0,
                                    .units_in = amount,
                                    .currency_out = payout,
                                    .units_out = 0,
                                });
  return payout;
}

void SolidToken::enhance_token_value(const common::Address& caller, common::Amount value) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "enhance_token_value");
  state::Transaction tx(runtime_.journal());

  if (value == 0) {
    common::fail(common::ErrorCode::kZeroValueNotAllowed, "enhancement without currency");
  }
  collect(caller, value);
  custodian_->deposit(self_, value);
  runtime_.events().emit(self_, events::ValueEnhancedEvent{.contributor = caller, .amount = value});

  tx.commit();
}

common::Amount SolidToken::retrieve_token_value(const common::Address& caller,
                                                common::Amount amount) {
  guard::ReentrancyGuard::Scope lock(reentrancy_, "retrieve_token_value");
  state::Transaction tx(runtime_.journal());

  if (amount == 0) {
    common::fail(common::ErrorCode::kZeroValueNotAllowed, "nothing to retrieve");
  }
  const auto supply = ledger_.total_supply();
  if (supply == 0) {
    common::fail(common::ErrorCode::kUndefinedValue, "no units in circulation");
  }
  const auto balance = ledger_.balance_of(caller);
  if (balance < amount) {
    common::fail(common::ErrorCode::kInsufficientBalance,
                 caller.to_hex() + " holds " + std::to_string(balance) + ", needs " +
                     std::to_string(amount));
  }

  // The divisor is the supply before the burn.
  const auto payout = common::mul_div(custodian_->reserve_balance(), amount, supply);
  internal_move(caller, caller, common::kNullAddress, amount);
  custodian_->withdraw(self_, caller, payout);
  runtime_.events().emit(self_, events::ValueRetrievedEvent{.retriever = caller, .amount = payout});

  tx.commit();
  return payout;
}

common::Amount SolidToken::balance_of(const common::Address& account) const {
  return ledger_.balance_of(account);
}

common::Amount SolidToken::allowance(const common::Address& owner,
                                     const common::Address& spender) const {
  return ledger_.allowance(owner, spender);
}

common::Amount SolidToken::total_supply() const noexcept {
  return ledger_.total_supply();
}

common::Amount SolidToken::solid_value() const {
  return custodian_->reserve_balance();
}

common::Amount SolidToken::unit_value() const {
  const auto supply = ledger_.total_supply();
  if (supply == 0) {
    common::fail(common::ErrorCode::kUndefinedValue, "no units in circulation");
  }
  return solid_value() / supply;
}

common::Reserves SolidToken::get_reserves() const {
  return common::Reserves{
      .currency = runtime_.bank().balance_of(self_),
      .units = ledger_.balance_of(self_),
  };
}

common::Amount SolidToken::get_amount_out(common::Amount value, bool is_buy) const {
  return swap::quote(value, is_buy, get_reserves());
}

void SolidToken::internal_move(const common::Address& caller, const common::Address& from,
                               const common::Address& to, common::Amount amount) {
  same_block_.enforce(caller);
  ledger_.update(from, to, amount);
  runtime_.events().emit(self_, events::TransferEvent{.from = from, .to = to, .amount = amount});
}

void SolidToken::collect(const common::Address& caller, common::Amount value) {
  if (!runtime_.bank().transfer(caller, self_, value)) {
    common::fail(common::ErrorCode::kTransferFailed,
                 caller.to_hex() + " cannot fund " + std::to_string(value));
  }
}

void SolidToken::set_provisioned(bool provisioned) {
  const auto previous = provisioned_;
  provisioned_ = provisioned;
  runtime_.journal().record([this, previous] { provisioned_ = previous; });
}

void SolidToken::save(common::ByteWriter& out) const {
  out.put<std::uint8_t>(provisioned_ ? 1 : 0);
  ledger_.save(out);
  same_block_.save(out);
}

void SolidToken::load(common::ByteReader& in) {
  provisioned_ = in.get<std::uint8_t>() != 0;
  ledger_.load(in);
  same_block_.load(in);
}

}  // namespace token
}  // namespace solidcore
