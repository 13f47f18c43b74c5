#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rocksdb {
class Status;
}  // namespace rocksdb

namespace kgraph {

/**
 * Outcome of a kgraph operation.
 *
 * Shaped after rocksdb::Status: cheap to copy, ok() on success, an error code
 * plus a human-readable message otherwise. Codes mirror the engine's error
 * taxonomy rather than the storage layer's.
 */
class Status {
 public:
  enum class Code : uint8_t {
    kOk = 0,
    kNotFound,
    kValidation,
    kDimensionMismatch,
    kSelfLoop,
    kDuplicateEdge,
    kDanglingReference,
    kDepthLimitExceeded,
    kEmbeddingFailed,
    kStoreError,
  };

  Status() = default;

  static Status OK() { return Status(); }
  static Status NotFound(std::string_view msg = {}) { return Status(Code::kNotFound, msg); }
  static Status Validation(std::string_view msg) { return Status(Code::kValidation, msg); }
  static Status DimensionMismatch(std::string_view msg) {
    return Status(Code::kDimensionMismatch, msg);
  }
  static Status SelfLoop(std::string_view msg) { return Status(Code::kSelfLoop, msg); }
  static Status DuplicateEdge(std::string_view msg) { return Status(Code::kDuplicateEdge, msg); }
  static Status DanglingReference(std::string_view msg) {
    return Status(Code::kDanglingReference, msg);
  }
  static Status DepthLimitExceeded(std::string_view msg) {
    return Status(Code::kDepthLimitExceeded, msg);
  }
  static Status EmbeddingFailed(std::string_view msg) {
    return Status(Code::kEmbeddingFailed, msg);
  }
  static Status StoreError(std::string_view msg) { return Status(Code::kStoreError, msg); }

  /** Map a storage-layer status. NotFound stays NotFound; every other
   *  failure becomes StoreError carrying the RocksDB description. */
  static Status FromRocksDB(const rocksdb::Status& s);

  bool ok() const { return code_ == Code::kOk; }
  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  bool IsNotFound() const { return code_ == Code::kNotFound; }
  // Wrong vector dimensionality is a kind of malformed input.
  bool IsValidationError() const {
    return code_ == Code::kValidation || code_ == Code::kDimensionMismatch;
  }
  bool IsDimensionMismatch() const { return code_ == Code::kDimensionMismatch; }
  bool IsSelfLoop() const { return code_ == Code::kSelfLoop; }
  bool IsDuplicateEdge() const { return code_ == Code::kDuplicateEdge; }
  bool IsDanglingReference() const { return code_ == Code::kDanglingReference; }
  bool IsDepthLimitExceeded() const { return code_ == Code::kDepthLimitExceeded; }
  bool IsEmbeddingFailed() const { return code_ == Code::kEmbeddingFailed; }
  bool IsStoreError() const { return code_ == Code::kStoreError; }

  /** Low-cardinality name of the code, suitable for span attributes and
   *  mutation log entries. */
  std::string_view CodeName() const;

  std::string ToString() const;

  bool operator==(const Status& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }
  bool operator!=(const Status& other) const { return !(*this == other); }

 private:
  Status(Code code, std::string_view msg) : code_(code), message_(msg) {}

  Code code_ = Code::kOk;
  std::string message_;
};

}  // namespace kgraph
