#include "test_journal.hpp"

#include <cassert>

#include "solidcore/state/journal.hpp"

namespace solidcore::tests {

namespace {

// Journaled integer cell.
struct Cell {
  state::Journal& journal;
  int value{0};

  void set(int next) {
    const int previous = value;
    value = next;
    journal.record([this, previous] { value = previous; });
  }
};

}  // namespace

void test_journal_rollback() {
  state::Journal journal;
  Cell cell{journal};

  // Outside a transaction nothing is recorded.
  cell.set(1);
  assert(journal.pending() == 0);
  assert(!journal.active());

  {
    state::Transaction tx(journal);
    cell.set(2);
    cell.set(3);
    assert(journal.pending() == 2);
  }
  assert(cell.value == 1);
  assert(journal.pending() == 0);

  {
    state::Transaction tx(journal);
    cell.set(4);
    tx.commit();
  }
  assert(cell.value == 4);
  assert(journal.pending() == 0);
  assert(journal.depth() == 0);
}

void test_journal_nested_scopes() {
  state::Journal journal;
  Cell cell{journal};

  {
    state::Transaction outer(journal);
    cell.set(1);
    {
      state::Transaction inner(journal);
      assert(journal.depth() == 2);
      cell.set(2);
    }
    // Only the inner write was reverted.
    assert(cell.value == 1);
    {
      state::Transaction inner(journal);
      cell.set(5);
      inner.commit();
    }
    assert(cell.value == 5);
    // Outer rollback reverts the committed inner scope as well.
  }
  assert(cell.value == 0);
  assert(journal.depth() == 0);
  assert(journal.pending() == 0);
}

}  // namespace solidcore::tests
