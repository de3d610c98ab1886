#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace solidcore {
namespace state {

// Undo log shared by every mutable store of a runtime. Writes made while at least one
// Transaction is open record how to revert them; writes made outside any transaction are
// not journaled.
class Journal {
 public:
  using Undo = std::function<void()>;

  Journal() = default;
  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  void record(Undo undo);

  [[nodiscard]] bool active() const noexcept { return depth_ > 0; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
  [[nodiscard]] std::size_t pending() const noexcept { return undo_log_.size(); }

 private:
  friend class Transaction;

  std::size_t open() noexcept;
  void close_commit() noexcept;
  void close_rollback(std::size_t mark) noexcept;

  std::vector<Undo> undo_log_{};
  std::size_t depth_{0};
};

// RAII scope: reverts every journaled write made since construction unless commit() is
// called. Nested scopes roll back only to their own mark; a committed inner scope is still
// reverted if an outer scope rolls back.
class Transaction {
 public:
  explicit Transaction(Journal& journal) noexcept;
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;
  ~Transaction();

  void commit() noexcept;

 private:
  Journal& journal_;
  std::size_t mark_;
  bool closed_{false};
};

}  // namespace state
}  // namespace solidcore
