#include <kgraph/snapshot_reader.hpp>

#include <memory>

#include <kgraph/codec.hpp>
#include <kgraph/internal.hpp>

namespace kgraph::internal {

SnapshotGraphReader::SnapshotGraphReader(rocksdb::TransactionDB* db,
                                         rocksdb::ColumnFamilyHandle* nodes_cf,
                                         rocksdb::ColumnFamilyHandle* edges_out_cf,
                                         rocksdb::ColumnFamilyHandle* edges_in_cf)
    : db_(db),
      nodes_cf_(nodes_cf),
      edges_out_cf_(edges_out_cf),
      edges_in_cf_(edges_in_cf),
      snapshot_(db->GetSnapshot()) {
  ro_.snapshot = snapshot_;
}

SnapshotGraphReader::~SnapshotGraphReader() {
  db_->ReleaseSnapshot(snapshot_);
}

Status SnapshotGraphReader::GetNode(const std::string& slug, Node* out) const {
  if (!out) return Status::Validation("out is null");

  std::string raw;
  rocksdb::Status s = db_->Get(ro_, nodes_cf_, rocksdb::Slice(slug), &raw);
  if (s.IsNotFound()) return Status::NotFound("node not found: " + slug);
  if (!s.ok()) return Status::FromRocksDB(s);

  return DecodeNode(slug, raw, out);
}

Status SnapshotGraphReader::GetEdge(const std::string& src_slug,
                                    const std::string& dst_slug,
                                    const std::string& edge_type, Edge* out) const {
  if (!out) return Status::Validation("out is null");

  std::string raw;
  rocksdb::Status s = db_->Get(ro_, edges_out_cf_,
                               rocksdb::Slice(MakeEdgeKey(src_slug, dst_slug, edge_type)),
                               &raw);
  if (s.IsNotFound()) {
    return Status::NotFound("edge not found: " + src_slug + "->" + dst_slug + ":" + edge_type);
  }
  if (!s.ok()) return Status::FromRocksDB(s);

  return DecodeEdge(src_slug, dst_slug, edge_type, raw, out);
}

Status SnapshotGraphReader::OutgoingEdges(const std::string& slug,
                                          std::vector<Edge>* out) const {
  if (!out) return Status::Validation("out is null");
  out->clear();

  const std::string prefix = EdgeKeyPrefix(slug);
  rocksdb::Slice prefix_slice(prefix);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro_, edges_out_cf_));
  for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
    if (!it->key().starts_with(prefix_slice)) break;

    std::string src, dst, type;
    std::string_view key(it->key().data(), it->key().size());
    if (!ParseEdgeKey(key, &src, &dst, &type)) {
      return Status::StoreError("malformed edge key in kgraph_edges_out");
    }

    Edge edge;
    Status st = DecodeEdge(src, dst, type,
                           std::string_view(it->value().data(), it->value().size()), &edge);
    if (!st.ok()) return st;
    out->push_back(std::move(edge));
  }
  if (!it->status().ok()) return Status::FromRocksDB(it->status());

  return Status::OK();
}

Status SnapshotGraphReader::IncomingEdges(const std::string& slug,
                                          std::vector<Edge>* out) const {
  if (!out) return Status::Validation("out is null");
  out->clear();

  const std::string prefix = EdgeKeyPrefix(slug);
  rocksdb::Slice prefix_slice(prefix);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro_, edges_in_cf_));
  for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
    if (!it->key().starts_with(prefix_slice)) break;

    std::string dst, src, type;
    std::string_view key(it->key().data(), it->key().size());
    if (!ParseEdgeKey(key, &dst, &src, &type)) {
      return Status::StoreError("malformed edge key in kgraph_edges_in");
    }

    // The record lives under the outgoing key.
    Edge edge;
    Status st = GetEdge(src, dst, type, &edge);
    if (st.IsNotFound()) {
      return Status::StoreError("edge index out of sync for " + src + "->" + dst + ":" + type);
    }
    if (!st.ok()) return st;
    out->push_back(std::move(edge));
  }
  if (!it->status().ok()) return Status::FromRocksDB(it->status());

  return Status::OK();
}

}  // namespace kgraph::internal
