/**
 * @file test_qpdf_model.cpp
 * @brief Tests for qpdf_model.hpp, and the engine end to end on real PDFs.
 */

#include "pdfmerge/merge_engine.hpp"
#include "pdfmerge/qpdf_model.hpp"
#include "pdfmerge/validator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include <memory>
#include <string>
#include <vector>

namespace {

/// A PDF whose page i draws the text "<prefix><i+1>".
pdfmerge::SharedBytes BuildPdf(const std::string& prefix, uint32_t pages, bool annotate = false) {
  QPDF pdf;
  pdf.emptyPDF();
  QPDFPageDocumentHelper dh(pdf);
  for (uint32_t i = 1U; i <= pages; ++i) {
    const std::string label = prefix + std::to_string(i);
    QPDFObjectHandle page = pdf.makeIndirectObject(
        QPDFObjectHandle::parse("<< /Type /Page /MediaBox [0 0 612 792] /Resources << >> >>"));
    page.replaceKey("/Contents",
                    QPDFObjectHandle::newStream(&pdf, "BT 72 720 Td (" + label + ") Tj ET"));
    if (annotate) {
      QPDFObjectHandle annot = pdf.makeIndirectObject(QPDFObjectHandle::parse(
          "<< /Type /Annot /Subtype /Text /Rect [10 10 30 30] /Contents (note) >>"));
      page.replaceKey("/Annots", QPDFObjectHandle::newArray({annot}));
    }
    dh.addPage(QPDFPageObjectHelper(page), false);
  }
  QPDFWriter w(pdf);
  w.setOutputMemory();
  w.setObjectStreamMode(qpdf_o_disable);
  w.write();
  std::shared_ptr<Buffer> buf = w.getBufferSharedPointer();
  const uint8_t* data = buf->getBuffer();
  return std::make_shared<pdfmerge::ByteBuffer>(data, data + buf->getSize());
}

/// Same document with its startxref offset pointing at the file header.
pdfmerge::SharedBytes BreakXref(const pdfmerge::SharedBytes& good) {
  std::string text(good->begin(), good->end());
  const size_t p = text.rfind("startxref");
  REQUIRE(p != std::string::npos);
  size_t digits = p + 9U;
  while (digits < text.size() && (text[digits] == '\r' || text[digits] == '\n')) ++digits;
  size_t end = digits;
  while (end < text.size() && text[end] >= '0' && text[end] <= '9') ++end;
  text.replace(digits, end - digits, std::string(end - digits - 1U, ' ') + "0");
  return std::make_shared<pdfmerge::ByteBuffer>(text.begin(), text.end());
}

std::vector<std::string> PageTexts(const pdfmerge::ByteBuffer& bytes) {
  QPDF pdf;
  pdf.processMemoryFile("out.pdf", reinterpret_cast<const char*>(bytes.data()), bytes.size());
  std::vector<std::string> out;
  for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
    std::string text;
    for (auto& stream : page.getPageContents()) {
      std::shared_ptr<Buffer> data = stream.getStreamData();
      text.append(reinterpret_cast<const char*>(data->getBuffer()), data->getSize());
    }
    const size_t open = text.find('(');
    const size_t close = text.find(')', open);
    out.push_back(open == std::string::npos ? std::string() : text.substr(open + 1U, close - open - 1U));
  }
  return out;
}

size_t AnnotatedPages(const pdfmerge::ByteBuffer& bytes) {
  QPDF pdf;
  pdf.processMemoryFile("out.pdf", reinterpret_cast<const char*>(bytes.data()), bytes.size());
  size_t n = 0U;
  for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
    if (page.getObjectHandle().hasKey("/Annots")) ++n;
  }
  return n;
}

}  // namespace

// ============================================================================
// QpdfDocumentModel
// ============================================================================

TEST_CASE("QpdfDocumentModel loads page count and version", "[qpdf]") {
  pdfmerge::QpdfDocumentModel model;
  auto doc = model.Load(BuildPdf("p", 3U), pdfmerge::ParseMode::kStrict);
  REQUIRE(doc.has_value());
  CHECK(doc.value()->PageCount() == 3U);
  CHECK_FALSE(doc.value()->IsEncrypted());
  CHECK_FALSE(doc.value()->HasXfa());
  CHECK_FALSE(doc.value()->Version().empty());
}

TEST_CASE("QpdfDocumentModel rejects garbage", "[qpdf]") {
  pdfmerge::QpdfDocumentModel model;
  std::string junk = "this is not a pdf at all";
  auto bytes = std::make_shared<pdfmerge::ByteBuffer>(junk.begin(), junk.end());
  auto doc = model.Load(bytes, pdfmerge::ParseMode::kLenient);
  CHECK_FALSE(doc.has_value());
  CHECK(doc.get_error().code == pdfmerge::DocumentError::kLoadFailed);

  auto empty = model.Load(std::make_shared<pdfmerge::ByteBuffer>(), pdfmerge::ParseMode::kStrict);
  CHECK_FALSE(empty.has_value());
}

TEST_CASE("QpdfDocumentModel repairs a broken xref only in lenient mode", "[qpdf]") {
  pdfmerge::QpdfDocumentModel model;
  pdfmerge::SharedBytes broken = BreakXref(BuildPdf("r", 2U));

  auto strict = model.Load(broken, pdfmerge::ParseMode::kStrict);
  CHECK_FALSE(strict.has_value());

  auto lenient = model.Load(broken, pdfmerge::ParseMode::kLenient);
  REQUIRE(lenient.has_value());
  CHECK(lenient.value()->PageCount() == 2U);
}

TEST_CASE("Validator falls back to lenient parsing on qpdf", "[qpdf][validator]") {
  pdfmerge::QpdfDocumentModel model;
  pdfmerge::Validator validator(model);
  auto r = validator.Check(BreakXref(BuildPdf("v", 2U)));
  REQUIRE(r.has_value());
  CHECK(r.value().page_count == 2U);
  CHECK(r.value().parse_mode == pdfmerge::ParseMode::kLenient);
}

TEST_CASE("QpdfOutputDocument appends copied batches in call order", "[qpdf]") {
  pdfmerge::QpdfDocumentModel model;
  auto a = model.Load(BuildPdf("a", 3U), pdfmerge::ParseMode::kStrict);
  auto b = model.Load(BuildPdf("b", 2U), pdfmerge::ParseMode::kStrict);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  auto created = model.CreateOutput();
  REQUIRE(created.has_value());
  std::unique_ptr<pdfmerge::OutputDocument> out = std::move(created.value());

  auto b_all = out->CopyPages(b.value(), {0U, 1U});
  auto a_tail = out->CopyPages(a.value(), {1U, 2U});
  auto a_head = out->CopyPages(a.value(), {0U});
  REQUIRE(b_all.has_value());
  REQUIRE(a_tail.has_value());
  REQUIRE(a_head.has_value());
  CHECK(out->PageCount() == 0U);

  REQUIRE(out->AppendPages(std::move(a_head.value())).has_value());
  REQUIRE(out->AppendPages(std::move(a_tail.value())).has_value());
  REQUIRE(out->AppendPages(std::move(b_all.value())).has_value());
  CHECK(out->PageCount() == 5U);

  auto bad = out->CopyPages(a.value(), {7U});
  CHECK_FALSE(bad.has_value());

  // Sources go out of scope here; the output keeps them for Save().
  a = decltype(a)::error(pdfmerge::DocumentFailure{});
  b = decltype(b)::error(pdfmerge::DocumentFailure{});

  auto saved = out->Save(pdfmerge::SaveOptions{});
  REQUIRE(saved.has_value());
  CHECK(PageTexts(saved.value()) == std::vector<std::string>{"a1", "a2", "a3", "b1", "b2"});
}

TEST_CASE("QpdfOutputDocument removes annotations when asked", "[qpdf]") {
  pdfmerge::QpdfDocumentModel model;
  auto src = model.Load(BuildPdf("n", 2U, true), pdfmerge::ParseMode::kStrict);
  REQUIRE(src.has_value());

  for (bool remove : {false, true}) {
    auto created = model.CreateOutput();
    REQUIRE(created.has_value());
    std::unique_ptr<pdfmerge::OutputDocument> out = std::move(created.value());
    auto pages = out->CopyPages(src.value(), {0U, 1U});
    REQUIRE(pages.has_value());
    REQUIRE(out->AppendPages(std::move(pages.value())).has_value());

    pdfmerge::OptimizeOptions opts;
    opts.remove_annotations = remove;
    REQUIRE(out->Optimize(opts).has_value());
    auto saved = out->Save(pdfmerge::SaveOptions{});
    REQUIRE(saved.has_value());
    CHECK(AnnotatedPages(saved.value()) == (remove ? 0U : 2U));
  }
}

// ============================================================================
// Engine on qpdf
// ============================================================================

TEST_CASE("MergeEngine merges real PDFs in order", "[qpdf][engine]") {
  pdfmerge::QpdfDocumentModel model;
  pdfmerge::PoolConfig pc;
  pc.size = 4U;
  pc.min_workers = 1U;
  pc.health_check_ms = 0U;
  pc.metrics_interval_ms = 0U;
  pdfmerge::WorkerPool pool(pc);
  pool.Start();
  pdfmerge::Validator validator(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::EngineConfig ec;
  ec.sub_batch_size = 2U;
  pdfmerge::MergeEngine engine(model, pool, validator, registry, nullptr, ec);

  std::string junk(200U, 'x');
  auto not_pdf = std::make_shared<pdfmerge::ByteBuffer>(junk.begin(), junk.end());

  pdfmerge::MergeOptions opts;
  opts.use_object_streams = true;
  auto result = engine.ProcessPdfs(
      {BuildPdf("a", 5U), not_pdf, BreakXref(BuildPdf("b", 2U)), BuildPdf("c", 3U)}, opts);
  (void)pool.Shutdown();

  REQUIRE(result.has_value());
  const pdfmerge::MergeOutput& out = result.value();
  CHECK(out.stats.total_pages == 10U);
  CHECK(out.stats.files_merged == 3U);
  REQUIRE(out.warnings.size() == 1U);
  CHECK(out.warnings[0].find("File 2 skipped") == 0U);
  CHECK(PageTexts(out.data) ==
        std::vector<std::string>{"a1", "a2", "a3", "a4", "a5", "b1", "b2", "c1", "c2", "c3"});
}

TEST_CASE("MergeEngine output of a file merged with itself validates", "[qpdf][engine]") {
  pdfmerge::QpdfDocumentModel model;
  pdfmerge::PoolConfig pc;
  pc.size = 2U;
  pc.min_workers = 1U;
  pc.health_check_ms = 0U;
  pc.metrics_interval_ms = 0U;
  pdfmerge::WorkerPool pool(pc);
  pool.Start();
  pdfmerge::Validator validator(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::MergeEngine engine(model, pool, validator, registry);

  const uint32_t n = 4U;
  pdfmerge::SharedBytes single = BuildPdf("s", n);
  auto result = engine.ProcessPdfs({single, single}, pdfmerge::MergeOptions{});
  (void)pool.Shutdown();

  REQUIRE(result.has_value());
  CHECK(result.value().warnings.empty());
  CHECK(result.value().stats.total_pages == 2U * n);

  auto merged = std::make_shared<pdfmerge::ByteBuffer>(result.value().data);
  pdfmerge::ValidationResult check = validator.Check(merged);
  REQUIRE(check.has_value());
  CHECK(check.value().page_count == 2U * n);
  CHECK(check.value().parse_mode == pdfmerge::ParseMode::kStrict);
  CHECK(PageTexts(*merged) ==
        std::vector<std::string>{"s1", "s2", "s3", "s4", "s1", "s2", "s3", "s4"});
}
