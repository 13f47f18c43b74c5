#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>

#include <kgraph/status.hpp>
#include <kgraph/types.hpp>

namespace kgraph::internal {

/**
 * Append-only audit log in the kgraph_mutation_log column family.
 *
 * Key: 8-byte big-endian sequence number. Value: EncodeMutation().
 *
 * Sequence numbers are assigned under a mutex that is held until the write is
 * durable, so sequence order equals commit order and a reader that has seen
 * seq N will never later observe a new entry below N. A rolled-back
 * transaction does not consume a number.
 */
class MutationLog {
 public:
  MutationLog(rocksdb::TransactionDB* db, rocksdb::ColumnFamilyHandle* cf);

  MutationLog(const MutationLog&) = delete;
  MutationLog& operator=(const MutationLog&) = delete;

  /** Load the last assigned sequence number. Call once after opening. */
  Status Init();

  /**
   * Stage `entry` into `txn` and commit the transaction. On success
   * entry->seq and entry->recorded_at_us are filled in. The mutation and its
   * log record become visible together or not at all.
   */
  Status CommitWith(rocksdb::Transaction* txn, MutationEntry* entry);

  /** Append `entry` with its own write (used for failed mutations). */
  Status Append(MutationEntry* entry);

  /** Entries with seq > after_seq, ascending, at most `limit` (0 = all). */
  Status Scan(uint64_t after_seq, uint64_t limit, const rocksdb::Snapshot* snapshot,
              std::vector<MutationEntry>* out) const;

  uint64_t LastSeq() const;

 private:
  rocksdb::TransactionDB* db_;
  rocksdb::ColumnFamilyHandle* cf_;

  mutable std::mutex mu_;
  uint64_t last_seq_ = 0;
};

}  // namespace kgraph::internal
