#include "solidcore/state/journal.hpp"

#include <utility>

namespace solidcore {
namespace state {

void Journal::record(Undo undo) {
  if (depth_ == 0) {
    return;
  }
  undo_log_.push_back(std::move(undo));
}

std::size_t Journal::open() noexcept {
  ++depth_;
  return undo_log_.size();
}

void Journal::close_commit() noexcept {
  --depth_;
  if (depth_ == 0) {
    undo_log_.clear();
  }
}

void Journal::close_rollback(std::size_t mark) noexcept {
  while (undo_log_.size() > mark) {
    auto undo = std::move(undo_log_.back());
    undo_log_.pop_back();
    undo();
  }
  --depth_;
  if (depth_ == 0) {
    undo_log_.clear();
  }
}

Transaction::Transaction(Journal& journal) noexcept
    : journal_(journal), mark_(journal.open()) {}

Transaction::~Transaction() {
  if (!closed_) {
    journal_.close_rollback(mark_);
  }
}

void Transaction::commit() noexcept {
  if (closed_) {
    return;
  }
  closed_ = true;
  journal_.close_commit();
}

}  // namespace state
}  // namespace solidcore
