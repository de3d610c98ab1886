#pragma once

namespace solidcore::tests {

void test_wal_roundtrip();
void test_wal_torn_tail();
void test_snapshot_store();
void test_persistence_replay();

}  // namespace solidcore::tests
