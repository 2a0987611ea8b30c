// Copyright (c) 2024 pdfmerge contributors. MIT License.
/**
 * @file main.cpp
 * @brief Merge local PDF files through the same engine the server uses.
 *
 * Usage: merge_cli [--config file] [--no-optimize] [--no-object-streams]
 *                  [--remove-annotations] -o out.pdf in1.pdf in2.pdf ...
 *
 * Exit status: 0 merged, 1 usage or I/O error, 2 merge failed.
 */

#include "pdfmerge/buffer_registry.hpp"
#include "pdfmerge/config.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/memory_governor.hpp"
#include "pdfmerge/merge_engine.hpp"
#include "pdfmerge/qpdf_model.hpp"
#include "pdfmerge/service_config.hpp"
#include "pdfmerge/validator.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <memory>
#include <string>
#include <vector>

// ============================================================================
// File I/O
// ============================================================================

static pdfmerge::SharedBytes ReadWholeFile(const char* path) {
  std::FILE* fp = std::fopen(path, "rb");
  if (fp == nullptr) return nullptr;
  auto buf = std::make_shared<pdfmerge::ByteBuffer>();
  uint8_t chunk[64 * 1024];
  size_t n = 0;
  while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0U) {
    buf->insert(buf->end(), chunk, chunk + n);
  }
  const bool failed = std::ferror(fp) != 0;
  (void)std::fclose(fp);
  if (failed) return nullptr;
  return buf;
}

static bool WriteWholeFile(const char* path, const pdfmerge::ByteBuffer& data) {
  std::FILE* fp = std::fopen(path, "wb");
  if (fp == nullptr) return false;
  const size_t n = std::fwrite(data.data(), 1, data.size(), fp);
  const bool closed = std::fclose(fp) == 0;
  return n == data.size() && closed;
}

// ============================================================================
// Progress bar
// ============================================================================

static void DrawProgress(const pdfmerge::ProgressSnapshot& snap, void* /*ctx*/) {
  static constexpr int kWidth = 30;
  const int filled = static_cast<int>(snap.overall_progress * kWidth / 100.0);
  char bar[kWidth + 1];
  for (int i = 0; i < kWidth; ++i) bar[i] = (i < filled) ? '#' : '.';
  bar[kWidth] = '\0';
  std::fprintf(stderr, "\r[%s] %5.1f%% %-14s file %u/%u  eta %" PRIu64 "s   ", bar,
               snap.overall_progress, pdfmerge::ToString(snap.stage), snap.file_index,
               snap.total_files, snap.eta_ms / 1000U);
  if (snap.stage == pdfmerge::Stage::kComplete) std::fputc('\n', stderr);
}

static void PrintUsage(const char* prog) {
  std::printf("Usage: %s [--config file] [--no-optimize] [--no-object-streams]\n"
              "          [--remove-annotations] -o out.pdf in1.pdf in2.pdf ...\n",
              prog);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  pdfmerge::log::Init();

  const char* config_path = nullptr;
  const char* out_path = nullptr;
  bool optimize = true;
  bool object_streams = true;
  bool remove_annotations = false;
  std::vector<const char*> inputs;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
      out_path = argv[++i];
    } else if (std::strcmp(argv[i], "--no-optimize") == 0) {
      optimize = false;
    } else if (std::strcmp(argv[i], "--no-object-streams") == 0) {
      object_streams = false;
    } else if (std::strcmp(argv[i], "--remove-annotations") == 0) {
      remove_annotations = true;
    } else if (argv[i][0] == '-') {
      PrintUsage(argv[0]);
      return 1;
    } else {
      inputs.push_back(argv[i]);
    }
  }
  if (out_path == nullptr || inputs.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  pdfmerge::MultiConfig store;
  if (config_path != nullptr) {
    auto loaded = store.LoadFile(config_path);
    if (!loaded.has_value()) {
      PDFMERGE_LOG_ERROR("Cli", "cannot load config '%s': %s", config_path,
                         pdfmerge::ToString(loaded.get_error()));
      return 1;
    }
  }
  pdfmerge::ServiceConfig cfg = pdfmerge::LoadServiceConfig(store);
  pdfmerge::log::SetLevel(cfg.log_level);
  cfg.pool.health_check_ms = 0U;
  cfg.pool.metrics_interval_ms = 0U;

  std::vector<pdfmerge::SharedBytes> buffers;
  buffers.reserve(inputs.size());
  for (const char* path : inputs) {
    pdfmerge::SharedBytes bytes = ReadWholeFile(path);
    if (!bytes) {
      PDFMERGE_LOG_ERROR("Cli", "cannot read '%s'", path);
      return 1;
    }
    buffers.push_back(bytes);
  }

  pdfmerge::MemoryGovernor governor(cfg.memory);
  cfg.pool.memory_sample_fn = governor.Sampler();
  cfg.pool.memory_sample_ctx = governor.SamplerContext();
  pdfmerge::WorkerPool pool(cfg.pool);
  pool.Start();

  pdfmerge::QpdfDocumentModel model;
  pdfmerge::Validator validator(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::MergeEngine engine(model, pool, validator, registry, &governor, cfg.engine);

  pdfmerge::MergeOptions opts;
  opts.optimize = optimize && cfg.optimize_output;
  opts.use_object_streams = object_streams && cfg.use_object_streams;
  opts.optimize_options.remove_annotations = remove_annotations;
  opts.max_processing_ms = cfg.limits.max_processing_ms;

  pdfmerge::MergeResult result = engine.ProcessPdfs(buffers, opts, &DrawProgress, nullptr);
  // A timed-out run can leave a task inside the model; wait for it before teardown.
  if (!pool.Shutdown().clean) pool.WaitForWorkers();

  if (!result.has_value()) {
    std::fputc('\n', stderr);
    std::fprintf(stderr, "merge failed: %s (%s)\n", result.get_error().message.c_str(),
                 pdfmerge::ToString(result.get_error().code));
    return 2;
  }

  const pdfmerge::MergeOutput& out = result.value();
  for (const std::string& w : out.warnings) {
    std::fprintf(stderr, "warning: %s\n", w.c_str());
  }
  if (!WriteWholeFile(out_path, out.data)) {
    PDFMERGE_LOG_ERROR("Cli", "cannot write '%s'", out_path);
    return 1;
  }

  std::printf("%s: %u pages from %u/%zu file(s), %" PRIu64 " -> %" PRIu64
              " bytes (ratio %.2f), %" PRIu64 " ms\n",
              out_path, out.stats.total_pages, out.stats.files_merged, inputs.size(),
              out.stats.total_size, out.stats.output_size, out.stats.compression_ratio,
              out.stats.processing_ms);
  pdfmerge::log::Shutdown();
  return 0;
}
