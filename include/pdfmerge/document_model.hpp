/**
 * @file document_model.hpp
 * @brief Abstract PDF document model consumed by the validator and the merge
 *        engine.
 *
 * The byte-level PDF parser/writer sits behind three interfaces:
 *   DocumentModel   -- Load(bytes, mode) and CreateOutput()
 *   Document        -- one parsed input (read-only after load)
 *   OutputDocument  -- the growing merged document
 *
 * Page copying is split in two steps so copies may run concurrently while
 * the page order of the output stays under the caller's control:
 *   CopyPages()   materializes pages inside the output (not yet in its page
 *                 tree); safe to call from several threads at once
 *   AppendPages() links a copied batch at the end of the page tree
 *
 * Backends report failures as DocumentFailure values; no backend exception
 * crosses these interfaces.
 */

#ifndef PDFMERGE_DOCUMENT_MODEL_HPP_
#define PDFMERGE_DOCUMENT_MODEL_HPP_

#include "pdfmerge/vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pdfmerge {

using ByteBuffer = std::vector<uint8_t>;
using SharedBytes = std::shared_ptr<const ByteBuffer>;

/// Strict parsing refuses damaged cross-reference data; lenient parsing lets
/// the backend reconstruct it (slower).
enum class ParseMode : uint8_t {
  kStrict = 0,
  kLenient,
};

inline const char* ToString(ParseMode m) noexcept {
  return m == ParseMode::kStrict ? "strict" : "lenient";
}

enum class DocumentError : uint8_t {
  kLoadFailed = 0,
  kCopyFailed,
  kOptimizeFailed,
  kSaveFailed,
};

inline const char* ToString(DocumentError e) noexcept {
  switch (e) {
    case DocumentError::kLoadFailed: return "LOAD_FAILED";
    case DocumentError::kCopyFailed: return "COPY_FAILED";
    case DocumentError::kOptimizeFailed: return "OPTIMIZE_FAILED";
    case DocumentError::kSaveFailed: return "SAVE_FAILED";
  }
  return "DOCUMENT_UNKNOWN";
}

struct DocumentFailure {
  DocumentError code{DocumentError::kLoadFailed};
  std::string message;
};

struct OptimizeOptions {
  bool remove_unused_resources{true};
  bool coalesce_content_streams{true};
  bool remove_annotations{false};
};

struct SaveOptions {
  bool use_object_streams{true};
  bool compress_streams{true};
};

// ============================================================================
// Document
// ============================================================================

class Document {
 public:
  virtual ~Document() = default;

  virtual uint32_t PageCount() const = 0;
  virtual bool IsEncrypted() const = 0;
  virtual bool HasXfa() const = 0;
  virtual bool IsLinearized() const = 0;
  /// Header version such as "1.7"; empty when unknown.
  virtual std::string Version() const = 0;
};

/// Pages copied into an OutputDocument but not yet linked into its page tree.
class CopiedPages {
 public:
  virtual ~CopiedPages() = default;
  virtual uint32_t Count() const = 0;
};

// ============================================================================
// OutputDocument
// ============================================================================

class OutputDocument {
 public:
  virtual ~OutputDocument() = default;

  /**
   * @brief Copy the given source pages (zero-based, in the given order) into
   *        this document. Thread-safe against concurrent CopyPages calls.
   *
   * The source document must stay alive until Save() returns; the output
   * keeps its own reference.
   */
  virtual expected<std::unique_ptr<CopiedPages>, DocumentFailure> CopyPages(
      const std::shared_ptr<Document>& src, const std::vector<uint32_t>& indices) = 0;

  /// Link a copied batch at the end of the page tree.
  virtual expected<void, DocumentFailure> AppendPages(std::unique_ptr<CopiedPages> pages) = 0;

  virtual uint32_t PageCount() const = 0;

  virtual expected<void, DocumentFailure> Optimize(const OptimizeOptions& opts) = 0;

  virtual expected<ByteBuffer, DocumentFailure> Save(const SaveOptions& opts) = 0;
};

// ============================================================================
// DocumentModel
// ============================================================================

class DocumentModel {
 public:
  virtual ~DocumentModel() = default;

  /// The document may reference @p bytes for its whole lifetime.
  virtual expected<std::shared_ptr<Document>, DocumentFailure> Load(const SharedBytes& bytes,
                                                                    ParseMode mode) = 0;

  virtual expected<std::unique_ptr<OutputDocument>, DocumentFailure> CreateOutput() = 0;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_DOCUMENT_MODEL_HPP_
