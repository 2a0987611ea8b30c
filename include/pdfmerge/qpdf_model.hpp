/**
 * @file qpdf_model.hpp
 * @brief DocumentModel backed by qpdf.
 *
 * - Load: QPDF::processMemoryFile over the caller's shared buffer (not
 *   copied; the document keeps the buffer alive). Strict mode disables
 *   qpdf's xref recovery. Inherited page attributes are pushed down once at
 *   load time so later page copies do not write to the source.
 * - CopyPages: copyForeignObject per page, serialized by the output's mutex
 *   because qpdf objects are not thread-safe.
 * - Save: QPDFWriter to memory, object streams generated on request.
 *
 * qpdf copies foreign stream data lazily at write time, so every source
 * document used by CopyPages is retained until Save() returns.
 */

#ifndef PDFMERGE_QPDF_MODEL_HPP_
#define PDFMERGE_QPDF_MODEL_HPP_

#include "pdfmerge/document_model.hpp"
#include "pdfmerge/log.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pdfmerge {

// ============================================================================
// QpdfDocument
// ============================================================================

class QpdfDocument final : public Document {
 public:
  QpdfDocument(SharedBytes bytes, std::unique_ptr<QPDF> pdf)
      : bytes_(std::move(bytes)), pdf_(std::move(pdf)) {
    QPDFPageDocumentHelper helper(*pdf_);
    pages_ = helper.getAllPages();
    encrypted_ = pdf_->isEncrypted();
    linearized_ = pdf_->isLinearized();
    version_ = pdf_->getPDFVersion();
    QPDFObjectHandle acroform = pdf_->getRoot().getKey("/AcroForm");
    has_xfa_ = acroform.isDictionary() && acroform.hasKey("/XFA");
  }

  uint32_t PageCount() const override { return static_cast<uint32_t>(pages_.size()); }
  bool IsEncrypted() const override { return encrypted_; }
  bool HasXfa() const override { return has_xfa_; }
  bool IsLinearized() const override { return linearized_; }
  std::string Version() const override { return version_; }

  QPDFPageObjectHelper& Page(uint32_t index) { return pages_[index]; }

 private:
  SharedBytes bytes_;
  std::unique_ptr<QPDF> pdf_;
  std::vector<QPDFPageObjectHelper> pages_;
  std::string version_;
  bool encrypted_{false};
  bool linearized_{false};
  bool has_xfa_{false};
};

// ============================================================================
// QpdfOutputDocument
// ============================================================================

class QpdfCopiedPages final : public CopiedPages {
 public:
  explicit QpdfCopiedPages(std::vector<QPDFObjectHandle> pages) : pages_(std::move(pages)) {}
  uint32_t Count() const override { return static_cast<uint32_t>(pages_.size()); }
  std::vector<QPDFObjectHandle>& Pages() { return pages_; }

 private:
  std::vector<QPDFObjectHandle> pages_;
};

class QpdfOutputDocument final : public OutputDocument {
 public:
  QpdfOutputDocument() : pdf_(std::make_unique<QPDF>()) {
    pdf_->emptyPDF();
    pdf_->setSuppressWarnings(true);
  }

  expected<std::unique_ptr<CopiedPages>, DocumentFailure> CopyPages(
      const std::shared_ptr<Document>& src, const std::vector<uint32_t>& indices) override {
    using R = expected<std::unique_ptr<CopiedPages>, DocumentFailure>;
    auto* qsrc = dynamic_cast<QpdfDocument*>(src.get());
    if (qsrc == nullptr) {
      return R::error(DocumentFailure{DocumentError::kCopyFailed, "foreign document backend"});
    }

    std::lock_guard<std::mutex> lock(mtx_);
    try {
      std::vector<QPDFObjectHandle> copied;
      copied.reserve(indices.size());
      for (uint32_t idx : indices) {
        if (idx >= qsrc->PageCount()) {
          return R::error(DocumentFailure{DocumentError::kCopyFailed, "page index out of range"});
        }
        copied.push_back(pdf_->copyForeignObject(qsrc->Page(idx).getObjectHandle()));
      }
      RetainLocked(src);
      std::unique_ptr<CopiedPages> batch = std::make_unique<QpdfCopiedPages>(std::move(copied));
      return R::success(std::move(batch));
    } catch (const std::exception& e) {
      return R::error(DocumentFailure{DocumentError::kCopyFailed, e.what()});
    }
  }

  expected<void, DocumentFailure> AppendPages(std::unique_ptr<CopiedPages> pages) override {
    auto* qpages = dynamic_cast<QpdfCopiedPages*>(pages.get());
    if (qpages == nullptr) {
      return expected<void, DocumentFailure>::error(
          DocumentFailure{DocumentError::kCopyFailed, "foreign page batch"});
    }

    std::lock_guard<std::mutex> lock(mtx_);
    try {
      QPDFPageDocumentHelper helper(*pdf_);
      for (auto& oh : qpages->Pages()) {
        helper.addPage(QPDFPageObjectHelper(oh), false);
        ++page_count_;
      }
      return expected<void, DocumentFailure>::success();
    } catch (const std::exception& e) {
      return expected<void, DocumentFailure>::error(
          DocumentFailure{DocumentError::kCopyFailed, e.what()});
    }
  }

  uint32_t PageCount() const override {
    std::lock_guard<std::mutex> lock(mtx_);
    return page_count_;
  }

  expected<void, DocumentFailure> Optimize(const OptimizeOptions& opts) override {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
      QPDFPageDocumentHelper helper(*pdf_);
      if (opts.remove_annotations) {
        for (auto& page : helper.getAllPages()) {
          page.getObjectHandle().removeKey("/Annots");
        }
      }
      if (opts.remove_unused_resources) {
        helper.removeUnreferencedResources();
      }
      if (opts.coalesce_content_streams) {
        for (auto& page : helper.getAllPages()) {
          page.coalesceContentStreams();
        }
      }
      return expected<void, DocumentFailure>::success();
    } catch (const std::exception& e) {
      return expected<void, DocumentFailure>::error(
          DocumentFailure{DocumentError::kOptimizeFailed, e.what()});
    }
  }

  expected<ByteBuffer, DocumentFailure> Save(const SaveOptions& opts) override {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
      QPDFWriter writer(*pdf_);
      writer.setOutputMemory();
      writer.setObjectStreamMode(opts.use_object_streams ? qpdf_o_generate : qpdf_o_disable);
      writer.setCompressStreams(opts.compress_streams);
      writer.write();
      std::shared_ptr<Buffer> buf = writer.getBufferSharedPointer();
      const uint8_t* data = buf->getBuffer();
      ByteBuffer out(data, data + buf->getSize());
      sources_.clear();
      return expected<ByteBuffer, DocumentFailure>::success(std::move(out));
    } catch (const std::exception& e) {
      return expected<ByteBuffer, DocumentFailure>::error(
          DocumentFailure{DocumentError::kSaveFailed, e.what()});
    }
  }

 private:
  void RetainLocked(const std::shared_ptr<Document>& src) {
    for (const auto& s : sources_) {
      if (s == src) return;
    }
    sources_.push_back(src);
  }

  mutable std::mutex mtx_;
  std::unique_ptr<QPDF> pdf_;
  std::vector<std::shared_ptr<Document>> sources_;
  uint32_t page_count_{0U};
};

// ============================================================================
// QpdfDocumentModel
// ============================================================================

class QpdfDocumentModel final : public DocumentModel {
 public:
  expected<std::shared_ptr<Document>, DocumentFailure> Load(const SharedBytes& bytes,
                                                            ParseMode mode) override {
    using R = expected<std::shared_ptr<Document>, DocumentFailure>;
    if (!bytes || bytes->empty()) {
      return R::error(DocumentFailure{DocumentError::kLoadFailed, "empty buffer"});
    }
    try {
      auto pdf = std::make_unique<QPDF>();
      pdf->setSuppressWarnings(true);
      pdf->setAttemptRecovery(mode == ParseMode::kLenient);
      pdf->processMemoryFile("input.pdf", reinterpret_cast<const char*>(bytes->data()),
                             bytes->size());
      QPDFPageDocumentHelper(*pdf).pushInheritedAttributesToPage();
      if (pdf->anyWarnings()) {
        PDFMERGE_LOG_DEBUG("Validator", "qpdf recovered from %zu warning(s) (%s)",
                           pdf->getWarnings().size(), ToString(mode));
      }
      std::shared_ptr<Document> doc = std::make_shared<QpdfDocument>(bytes, std::move(pdf));
      return R::success(std::move(doc));
    } catch (const std::exception& e) {
      return R::error(DocumentFailure{DocumentError::kLoadFailed, e.what()});
    }
  }

  expected<std::unique_ptr<OutputDocument>, DocumentFailure> CreateOutput() override {
    using R = expected<std::unique_ptr<OutputDocument>, DocumentFailure>;
    try {
      std::unique_ptr<OutputDocument> out = std::make_unique<QpdfOutputDocument>();
      return R::success(std::move(out));
    } catch (const std::exception& e) {
      return R::error(DocumentFailure{DocumentError::kLoadFailed, e.what()});
    }
  }
};

}  // namespace pdfmerge

#endif  // PDFMERGE_QPDF_MODEL_HPP_
