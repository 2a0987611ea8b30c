// Copyright (c) 2024 pdfmerge contributors. MIT License.
/**
 * @file main.cpp
 * @brief PDF merge HTTP server.
 *
 * Usage: merge_server [config.ini|config.json|config.yaml]
 *
 * Wiring:
 *   MultiConfig -> ServiceConfig -> WorkerPool, MemoryGovernor, ResultCache
 *   QpdfDocumentModel + Validator + BufferRegistry -> MergeEngine
 *   MergeEngine -> MergeService -> HttpServer (sockpp)
 *   ShutdownManager: SIGINT/SIGTERM stop listener, pool, then monitors
 */

#include "pdfmerge/buffer_registry.hpp"
#include "pdfmerge/config.hpp"
#include "pdfmerge/http_server.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/memory_governor.hpp"
#include "pdfmerge/merge_engine.hpp"
#include "pdfmerge/merge_service.hpp"
#include "pdfmerge/qpdf_model.hpp"
#include "pdfmerge/result_cache.hpp"
#include "pdfmerge/service_config.hpp"
#include "pdfmerge/shutdown.hpp"
#include "pdfmerge/validator.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <cstdio>
#include <cstdlib>

#include <string>

// ============================================================================
// Shutdown steps (registered first-to-last, executed last-to-first)
// ============================================================================

struct Monitors {
  pdfmerge::MemoryGovernor* governor;
  pdfmerge::ResultCache* cache;
};

static void StopMonitors(int /*signo*/, void* ctx) {
  auto* m = static_cast<Monitors*>(ctx);
  m->cache->StopSweeping();
  m->governor->StopMonitoring();
}

static void StopPool(int /*signo*/, void* ctx) {
  auto* pool = static_cast<pdfmerge::WorkerPool*>(ctx);
  const pdfmerge::PoolShutdownReport r = pool->Shutdown();
  if (!r.clean) {
    PDFMERGE_LOG_WARN("Server", "%u merge worker(s) still busy at exit", r.abandoned_workers);
  }
}

struct Frontend {
  pdfmerge::MergeService* service;
  pdfmerge::HttpServer* server;
};

static void StopFrontend(int /*signo*/, void* ctx) {
  auto* f = static_cast<Frontend*>(ctx);
  f->service->AbortInFlight();
  f->server->Stop();
}

// ============================================================================
// Pool events
// ============================================================================

static void OnPoolEvent(const pdfmerge::PoolEvent& ev, void* /*ctx*/) {
  switch (ev.type) {
    case pdfmerge::PoolEventType::kQueueWarning:
      PDFMERGE_LOG_WARN("Pool", "queue stalled for %llu ms",
                        static_cast<unsigned long long>(ev.wait_ms));
      break;
    case pdfmerge::PoolEventType::kMetrics:
      if (ev.metrics != nullptr) {
        PDFMERGE_LOG_INFO("Pool", "workers=%u active=%u queue=%u avg_wait=%.1fms cpu=%.0fms",
                          ev.metrics->total_workers, ev.metrics->active_workers,
                          ev.metrics->queue_length, ev.metrics->average_wait_ms,
                          ev.metrics->cpu_time_ms);
      }
      break;
    default:
      break;
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  pdfmerge::log::Init();

  pdfmerge::MultiConfig store;
  if (argc > 1) {
    auto loaded = store.LoadFile(argv[1]);
    if (!loaded.has_value()) {
      PDFMERGE_LOG_ERROR("Server", "cannot load config '%s': %s", argv[1],
                         pdfmerge::ToString(loaded.get_error()));
      return EXIT_FAILURE;
    }
  }

  pdfmerge::ServiceConfig cfg = pdfmerge::LoadServiceConfig(store);
  std::string reason;
  auto valid = pdfmerge::ValidateServiceConfig(cfg, &reason);
  if (!valid.has_value()) {
    PDFMERGE_LOG_ERROR("Server", "invalid configuration: %s", reason.c_str());
    return EXIT_FAILURE;
  }
  pdfmerge::log::SetLevel(cfg.log_level);

  pdfmerge::ShutdownManager shutdown;
  if (!shutdown.IsValid()) {
    PDFMERGE_LOG_ERROR("Server", "shutdown manager unavailable");
    return EXIT_FAILURE;
  }

  // -- memory and cache ------------------------------------------------------
  pdfmerge::MemoryGovernor governor(cfg.memory);
  pdfmerge::ResultCache cache(cfg.cache);
  if (cache.Enabled()) {
    auto hook = governor.AddReclaimHook("result-cache", &pdfmerge::ResultCache::ReclaimHook, &cache);
    if (!hook.has_value()) {
      PDFMERGE_LOG_WARN("Server", "cache reclaim hook: %s", pdfmerge::ToString(hook.get_error()));
    }
  }

  // -- merge pipeline --------------------------------------------------------
  cfg.pool.memory_sample_fn = governor.Sampler();
  cfg.pool.memory_sample_ctx = governor.SamplerContext();
  pdfmerge::WorkerPool pool(cfg.pool);
  pool.SetEventCallback(&OnPoolEvent, nullptr);

  pdfmerge::QpdfDocumentModel model;
  pdfmerge::Validator validator(model);
  pdfmerge::BufferRegistry registry;
  pdfmerge::MergeEngine engine(model, pool, validator, registry, &governor, cfg.engine);
  pdfmerge::MergeService service(engine, pool, cfg, &governor, &cache);
  pdfmerge::HttpServer server(service, cfg.server);

  // -- start -----------------------------------------------------------------
  pool.Start();
  auto mon = governor.StartMonitoring();
  if (!mon.has_value()) {
    PDFMERGE_LOG_WARN("Server", "memory monitor not started: %s", pdfmerge::ToString(mon.get_error()));
  }
  if (cache.Enabled()) {
    auto sweep = cache.StartSweeping();
    if (!sweep.has_value()) {
      PDFMERGE_LOG_WARN("Server", "cache sweeper not started: %s",
                        pdfmerge::ToString(sweep.get_error()));
    }
  }

  auto started = server.Start();
  if (!started.has_value()) {
    PDFMERGE_LOG_ERROR("Server", "cannot start listener: %s", pdfmerge::ToString(started.get_error()));
    (void)pool.Shutdown();
    return EXIT_FAILURE;
  }

  Monitors monitors{&governor, &cache};
  Frontend frontend{&service, &server};
  (void)shutdown.Register("monitors", &StopMonitors, &monitors);
  (void)shutdown.Register("merge pool", &StopPool, &pool);
  (void)shutdown.Register("listener", &StopFrontend, &frontend);

  auto sig = shutdown.InstallSignalHandlers();
  if (!sig.has_value()) {
    PDFMERGE_LOG_ERROR("Server", "signal handlers: %s", pdfmerge::ToString(sig.get_error()));
    server.Stop();
    (void)pool.Shutdown();
    return EXIT_FAILURE;
  }

  PDFMERGE_LOG_INFO("Server", "ready: max %u files, %llu MiB per file, %llu MiB total",
                    cfg.limits.max_files,
                    static_cast<unsigned long long>(cfg.limits.max_file_size / pdfmerge::kMiB),
                    static_cast<unsigned long long>(cfg.limits.max_total_size / pdfmerge::kMiB));

  shutdown.WaitForShutdown();

  // Abandoned workers may still be inside the model or validator.
  if (!pool.WaitForWorkers(0U)) {
    PDFMERGE_LOG_WARN("Server", "waiting for abandoned merge workers to finish");
    pool.WaitForWorkers();
  }

  const pdfmerge::ServiceCounters sc = service.GetCounters();
  PDFMERGE_LOG_INFO("Server", "served %llu request(s), %llu merge(s), %llu cache hit(s)",
                    static_cast<unsigned long long>(sc.requests),
                    static_cast<unsigned long long>(sc.merges),
                    static_cast<unsigned long long>(sc.cache_hits));
  pdfmerge::log::Shutdown();
  return EXIT_SUCCESS;
}
