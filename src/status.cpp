#include <kgraph/status.hpp>

#include <rocksdb/status.h>

namespace kgraph {

Status Status::FromRocksDB(const rocksdb::Status& s) {
  if (s.ok()) return Status::OK();
  if (s.IsNotFound()) return Status::NotFound(s.ToString());
  return Status::StoreError(s.ToString());
}

std::string_view Status::CodeName() const {
  switch (code_) {
    case Code::kOk: return "ok";
    case Code::kNotFound: return "not_found";
    case Code::kValidation: return "validation_error";
    case Code::kDimensionMismatch: return "dimension_mismatch";
    case Code::kSelfLoop: return "self_loop";
    case Code::kDuplicateEdge: return "duplicate_edge";
    case Code::kDanglingReference: return "dangling_reference";
    case Code::kDepthLimitExceeded: return "depth_limit_exceeded";
    case Code::kEmbeddingFailed: return "embedding_failed";
    case Code::kStoreError: return "store_error";
  }
  return "unknown";
}

std::string Status::ToString() const {
  if (ok()) return "OK";
  std::string out;
  switch (code_) {
    case Code::kNotFound: out = "NotFound"; break;
    case Code::kValidation: out = "ValidationError"; break;
    case Code::kDimensionMismatch: out = "DimensionMismatch"; break;
    case Code::kSelfLoop: out = "SelfLoopError"; break;
    case Code::kDuplicateEdge: out = "DuplicateEdgeError"; break;
    case Code::kDanglingReference: out = "DanglingReferenceError"; break;
    case Code::kDepthLimitExceeded: out = "DepthLimitExceeded"; break;
    case Code::kEmbeddingFailed: out = "EmbeddingFailed"; break;
    case Code::kStoreError: out = "StoreError"; break;
    case Code::kOk: break;
  }
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace kgraph
