/**
 * @file test_validator.cpp
 * @brief Catch2 tests for pdfmerge::Validator and ValidationCache.
 */

#include "pdfmerge/validator.hpp"

#include "fake_document_model.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

pdfmerge::SharedBytes Bytes(const std::string& text) {
  return std::make_shared<pdfmerge::ByteBuffer>(text.begin(), text.end());
}

}  // namespace

// ============================================================================
// Structural checks
// ============================================================================

TEST_CASE("validator - small buffers are rejected before loading", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);

  auto r = v.Check(Bytes("%PDF-1.7\n%%EOF\n"));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error().code == pdfmerge::ValidationError::kTooSmall);

  auto none = v.Check(nullptr);
  REQUIRE_FALSE(none.has_value());
  CHECK(none.get_error().code == pdfmerge::ValidationError::kTooSmall);
  CHECK(model.b.loads.load() == 0U);
}

TEST_CASE("validator - missing header signature", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  auto r = v.Check(Bytes(std::string(300U, 'z')));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error().code == pdfmerge::ValidationError::kInvalidHeader);
  CHECK(r.get_error().message == "Invalid PDF header");
  CHECK(model.b.loads.load() == 0U);
}

TEST_CASE("validator - header found after leading junk inside the window", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  std::string text = std::string(500U, '\n') + fake::AsText(*fake::MakePdf("p", 2U));
  auto r = v.Check(Bytes(text));
  REQUIRE(r.has_value());
  CHECK(r.value().page_count == 2U);
}

TEST_CASE("validator - header beyond the window is rejected", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  std::string text = std::string(2000U, ' ') + fake::AsText(*fake::MakePdf("p", 2U));
  auto r = v.Check(Bytes(text));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error().code == pdfmerge::ValidationError::kInvalidHeader);
}

TEST_CASE("validator - missing EOF marker is recorded but not fatal", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  std::string text = "%PDF-1.7\nPAGES:x1\n" + std::string(200U, ' ');
  auto r = v.Check(Bytes(text));
  REQUIRE(r.has_value());
  CHECK(r.value().missing_eof);
  CHECK(r.value().page_count == 1U);
}

TEST_CASE("validator - stats of a good file", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  pdfmerge::SharedBytes pdf = fake::MakePdf("p", 4U);
  auto r = v.Check(pdf);
  REQUIRE(r.has_value());
  const pdfmerge::PdfStats& s = r.value();
  CHECK(s.page_count == 4U);
  CHECK(s.file_size == pdf->size());
  CHECK_FALSE(s.missing_eof);
  CHECK_FALSE(s.is_encrypted);
  CHECK(s.parse_mode == pdfmerge::ParseMode::kStrict);
  CHECK(s.version == "1.7");
  CHECK(model.b.strict_loads.load() == 1U);
  CHECK(model.b.lenient_loads.load() == 0U);
}

// ============================================================================
// Parse fallback
// ============================================================================

TEST_CASE("validator - lenient retry after strict failure", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  auto r = v.Check(fake::MakePdf("p", 2U, "LENIENT_ONLY"));
  REQUIRE(r.has_value());
  CHECK(r.value().parse_mode == pdfmerge::ParseMode::kLenient);
  CHECK(model.b.strict_loads.load() == 1U);
  CHECK(model.b.lenient_loads.load() == 1U);
}

TEST_CASE("validator - load failure in both modes", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  auto r = v.Check(fake::MakePdf("p", 2U, "CORRUPT"));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error().code == pdfmerge::ValidationError::kLoadFailed);
  CHECK(r.get_error().message.find("damaged xref") != std::string::npos);
}

TEST_CASE("validator - zero pages", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  auto r = v.Check(fake::MakePdf(std::vector<std::string>{}, "", 200U));
  REQUIRE_FALSE(r.has_value());
  CHECK(r.get_error().code == pdfmerge::ValidationError::kEmptyDocument);
}

// ============================================================================
// Cache
// ============================================================================

TEST_CASE("validator - Validate caches results by buffer id", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::SharedBytes good = fake::MakePdf("p", 3U);
  pdfmerge::SharedBytes bad = fake::MakePdf("p", 3U, "CORRUPT");
  pdfmerge::BufferId a = registry.Register(good);
  pdfmerge::BufferId b = registry.Register(bad);

  REQUIRE(v.Validate(a, good).has_value());
  REQUIRE_FALSE(v.Validate(b, bad).has_value());
  const uint32_t loads = model.b.loads.load();

  auto again = v.Validate(a, good);
  REQUIRE(again.has_value());
  CHECK(again.value().page_count == 3U);
  CHECK_FALSE(v.Validate(b, bad).has_value());
  CHECK(model.b.loads.load() == loads);
  CHECK(v.Cache().Size() == 2U);

  v.Drop(a);
  CHECK(v.Cache().Size() == 1U);
  REQUIRE(v.Validate(a, good).has_value());
  CHECK(model.b.loads.load() == loads + 1U);

  CHECK(v.Cache().Clear() == 2U);
  CHECK(v.Cache().Size() == 0U);
}

TEST_CASE("validator - released and re-registered slot does not hit stale entry", "[validator]") {
  fake::FakeDocumentModel model;
  pdfmerge::Validator v(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::SharedBytes bad = fake::MakePdf("p", 1U, "CORRUPT");
  pdfmerge::SharedBytes good = fake::MakePdf("q", 2U);

  pdfmerge::BufferId first = registry.Register(bad);
  REQUIRE_FALSE(v.Validate(first, bad).has_value());
  registry.Release(first);

  pdfmerge::BufferId second = registry.Register(good);
  CHECK(second.slot == first.slot);
  CHECK(second != first);
  auto r = v.Validate(second, good);
  REQUIRE(r.has_value());
  CHECK(r.value().page_count == 2U);
}
