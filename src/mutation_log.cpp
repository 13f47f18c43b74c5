#include <kgraph/mutation_log.hpp>

#include <memory>

#include <kgraph/codec.hpp>
#include <kgraph/internal.hpp>

namespace kgraph::internal {

MutationLog::MutationLog(rocksdb::TransactionDB* db, rocksdb::ColumnFamilyHandle* cf)
    : db_(db), cf_(cf) {}

Status MutationLog::Init() {
  rocksdb::ReadOptions ro;
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf_));
  it->SeekToLast();

  uint64_t last = 0;
  if (it->Valid()) {
    std::string_view key(it->key().data(), it->key().size());
    if (!DecodeU64BE(key, &last)) {
      return Status::StoreError("mutation log key is not a big-endian uint64");
    }
  }
  if (!it->status().ok()) return Status::FromRocksDB(it->status());

  std::lock_guard<std::mutex> lock(mu_);
  last_seq_ = last;
  return Status::OK();
}

Status MutationLog::CommitWith(rocksdb::Transaction* txn, MutationEntry* entry) {
  if (!txn || !entry) return Status::Validation("txn or entry is null");

  // Held across Commit(): a seq is only consumed by a commit that succeeds,
  // and seq order is commit order. Commits are serialized store-wide.
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t seq = last_seq_ + 1;
  entry->seq = seq;
  entry->recorded_at_us = WallClockMicros();

  rocksdb::Status s = txn->Put(cf_, rocksdb::Slice(EncodeU64BE(seq)),
                               rocksdb::Slice(EncodeMutation(*entry)));
  if (!s.ok()) return Status::FromRocksDB(s);

  s = txn->Commit();
  if (!s.ok()) {
    entry->seq = 0;
    return Status::FromRocksDB(s);
  }

  last_seq_ = seq;
  return Status::OK();
}

Status MutationLog::Append(MutationEntry* entry) {
  if (!entry) return Status::Validation("entry is null");

  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t seq = last_seq_ + 1;
  entry->seq = seq;
  entry->recorded_at_us = WallClockMicros();

  rocksdb::WriteOptions wo;
  rocksdb::Status s = db_->Put(wo, cf_, rocksdb::Slice(EncodeU64BE(seq)),
                               rocksdb::Slice(EncodeMutation(*entry)));
  if (!s.ok()) {
    entry->seq = 0;
    return Status::FromRocksDB(s);
  }

  last_seq_ = seq;
  return Status::OK();
}

Status MutationLog::Scan(uint64_t after_seq, uint64_t limit,
                         const rocksdb::Snapshot* snapshot,
                         std::vector<MutationEntry>* out) const {
  if (!out) return Status::Validation("out is null");
  out->clear();
  if (after_seq == UINT64_MAX) return Status::OK();

  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf_));
  for (it->Seek(rocksdb::Slice(EncodeU64BE(after_seq + 1))); it->Valid(); it->Next()) {
    uint64_t seq = 0;
    if (!DecodeU64BE(std::string_view(it->key().data(), it->key().size()), &seq)) {
      return Status::StoreError("mutation log key is not a big-endian uint64");
    }

    MutationEntry entry;
    Status st = DecodeMutation(
        seq, std::string_view(it->value().data(), it->value().size()), &entry);
    if (!st.ok()) return st;
    out->push_back(std::move(entry));

    if (limit != 0 && out->size() >= limit) break;
  }
  if (!it->status().ok()) return Status::FromRocksDB(it->status());

  return Status::OK();
}

uint64_t MutationLog::LastSeq() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_seq_;
}

}  // namespace kgraph::internal
