#pragma once

#include <string>
#include <vector>

#include <rocksdb/utilities/transaction_db.h>

#include <kgraph/traversal.hpp>

namespace kgraph::internal {

/**
 * GraphReader over a RocksDB snapshot taken at construction and released at
 * destruction. Every read through one instance sees the same committed graph.
 */
class SnapshotGraphReader : public GraphReader {
 public:
  SnapshotGraphReader(rocksdb::TransactionDB* db,
                      rocksdb::ColumnFamilyHandle* nodes_cf,
                      rocksdb::ColumnFamilyHandle* edges_out_cf,
                      rocksdb::ColumnFamilyHandle* edges_in_cf);
  ~SnapshotGraphReader() override;

  SnapshotGraphReader(const SnapshotGraphReader&) = delete;
  SnapshotGraphReader& operator=(const SnapshotGraphReader&) = delete;

  Status GetNode(const std::string& slug, Node* out) const override;
  Status OutgoingEdges(const std::string& slug, std::vector<Edge>* out) const override;
  Status IncomingEdges(const std::string& slug, std::vector<Edge>* out) const override;

  Status GetEdge(const std::string& src_slug, const std::string& dst_slug,
                 const std::string& edge_type, Edge* out) const;

  const rocksdb::ReadOptions& read_options() const { return ro_; }
  const rocksdb::Snapshot* snapshot() const { return snapshot_; }

 private:
  rocksdb::TransactionDB* db_;
  rocksdb::ColumnFamilyHandle* nodes_cf_;
  rocksdb::ColumnFamilyHandle* edges_out_cf_;
  rocksdb::ColumnFamilyHandle* edges_in_cf_;
  const rocksdb::Snapshot* snapshot_;
  rocksdb::ReadOptions ro_;
};

}  // namespace kgraph::internal
