/**
 * @file service_config.hpp
 * @brief Deployment profile of the merge service: one struct with named
 *        fields and defaults, loaded from a ConfigStore and validated once.
 *
 * Sections: [server] [limits] [pool] [memory] [engine] [cache] [log].
 * Absent keys keep their defaults; sizes are given in MiB in the file.
 */

#ifndef PDFMERGE_SERVICE_CONFIG_HPP_
#define PDFMERGE_SERVICE_CONFIG_HPP_

#include "pdfmerge/config.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/memory_governor.hpp"
#include "pdfmerge/merge_engine.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/result_cache.hpp"
#include "pdfmerge/vocabulary.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <cstdint>

#include <string>

namespace pdfmerge {

struct ServerConfig {
  uint16_t port{3001U};
  int32_t backlog{64};
  uint32_t request_threads{4U};
  uint64_t max_request_bytes{101ULL * kMiB};
  uint32_t max_header_bytes{16U * 1024U};
  uint32_t read_timeout_ms{30000U};
};

struct RequestLimits {
  uint32_t max_files{20U};
  uint32_t min_files{2U};
  uint64_t max_file_size{50ULL * kMiB};
  uint64_t max_total_size{100ULL * kMiB};
  uint32_t max_processing_ms{180000U};
};

struct ServiceConfig {
  ServerConfig server;
  RequestLimits limits;
  PoolConfig pool;
  MemoryGovernorConfig memory;
  EngineConfig engine;
  bool use_object_streams{true};
  bool optimize_output{true};
  ResultCacheConfig cache;
  log::Level log_level{log::Level::kInfo};
};

namespace detail {

inline uint32_t GetU32(const ConfigStore& s, const char* sec, const char* key, uint32_t def) {
  const int64_t v = s.GetInt(sec, key, static_cast<int64_t>(def));
  if (v < 0) return 0U;
  if (v > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
  return static_cast<uint32_t>(v);
}

inline uint64_t GetMiB(const ConfigStore& s, const char* sec, const char* key, uint64_t def_bytes) {
  const int64_t v = s.GetInt(sec, key, static_cast<int64_t>(def_bytes / kMiB));
  return v <= 0 ? 0U : static_cast<uint64_t>(v) * kMiB;
}

}  // namespace detail

/// Build a ServiceConfig from @p store. Never fails; see ValidateServiceConfig.
inline ServiceConfig LoadServiceConfig(const ConfigStore& store) {
  using detail::GetMiB;
  using detail::GetU32;
  ServiceConfig c;

  c.server.port = store.GetPort("server", "port", c.server.port);
  c.server.backlog = static_cast<int32_t>(store.GetInt("server", "backlog", c.server.backlog));
  c.server.request_threads = GetU32(store, "server", "request_threads", c.server.request_threads);
  c.server.max_header_bytes = GetU32(store, "server", "max_header_bytes", c.server.max_header_bytes);
  c.server.read_timeout_ms = GetU32(store, "server", "read_timeout_ms", c.server.read_timeout_ms);

  c.limits.max_files = GetU32(store, "limits", "max_files", c.limits.max_files);
  c.limits.min_files = GetU32(store, "limits", "min_files", c.limits.min_files);
  c.limits.max_file_size = GetMiB(store, "limits", "max_file_size_mb", c.limits.max_file_size);
  c.limits.max_total_size = GetMiB(store, "limits", "max_total_size_mb", c.limits.max_total_size);
  c.limits.max_processing_ms =
      GetU32(store, "limits", "max_processing_ms", c.limits.max_processing_ms);

  // Multipart framing and form fields on top of the raw file bytes.
  c.server.max_request_bytes = c.limits.max_total_size + kMiB;
  c.server.max_request_bytes =
      GetMiB(store, "server", "max_request_mb", c.server.max_request_bytes);

  c.pool.size = GetU32(store, "pool", "size", c.pool.size);
  c.pool.min_workers = GetU32(store, "pool", "min_workers", c.pool.min_workers);
  c.pool.max_queue_size = GetU32(store, "pool", "max_queue_size", c.pool.max_queue_size);
  c.pool.prewarm_workers = GetU32(store, "pool", "prewarm_workers", c.pool.prewarm_workers);
  c.pool.worker_idle_timeout_ms =
      GetU32(store, "pool", "worker_idle_timeout_ms", c.pool.worker_idle_timeout_ms);
  c.pool.health_check_ms = GetU32(store, "pool", "health_check_ms", c.pool.health_check_ms);
  c.pool.scale_cooldown_ms = GetU32(store, "pool", "scale_cooldown_ms", c.pool.scale_cooldown_ms);
  c.pool.scale_down_idle_ms =
      GetU32(store, "pool", "scale_down_idle_ms", c.pool.scale_down_idle_ms);
  c.pool.queue_warning_ms = GetU32(store, "pool", "queue_warning_ms", c.pool.queue_warning_ms);
  c.pool.metrics_interval_ms =
      GetU32(store, "pool", "metrics_interval_ms", c.pool.metrics_interval_ms);
  c.pool.shutdown_timeout_ms =
      GetU32(store, "pool", "shutdown_timeout_ms", c.pool.shutdown_timeout_ms);

  c.memory.ceiling_bytes = GetMiB(store, "memory", "ceiling_mb", c.memory.ceiling_bytes);
  c.memory.threshold = store.GetDouble("memory", "threshold", c.memory.threshold);
  c.memory.monitor_interval_ms =
      GetU32(store, "memory", "monitor_interval_ms", c.memory.monitor_interval_ms);
  c.pool.memory_ceiling_bytes = c.memory.ceiling_bytes;

  c.engine.max_concurrent_operations =
      GetU32(store, "engine", "max_concurrent_operations", c.engine.max_concurrent_operations);
  c.engine.sub_batch_size = GetU32(store, "engine", "sub_batch_size", c.engine.sub_batch_size);
  c.engine.memory_check_interval_files = GetU32(store, "engine", "memory_check_interval_files",
                                                c.engine.memory_check_interval_files);
  c.engine.large_file_threshold_bytes =
      GetMiB(store, "engine", "large_file_threshold_mb", c.engine.large_file_threshold_bytes);
  c.engine.yield_delay_ms = GetU32(store, "engine", "yield_delay_ms", c.engine.yield_delay_ms);
  c.use_object_streams = store.GetBool("engine", "use_object_streams", c.use_object_streams);
  c.optimize_output = store.GetBool("engine", "optimize_output", c.optimize_output);

  c.cache.enabled = store.GetBool("cache", "enabled", c.cache.enabled);
  c.cache.ttl_ms = GetU32(store, "cache", "ttl_ms", c.cache.ttl_ms);
  c.cache.max_entries = GetU32(store, "cache", "max_entries", c.cache.max_entries);
  c.cache.max_bytes = GetMiB(store, "cache", "max_bytes_mb", c.cache.max_bytes);
  c.cache.sweep_interval_ms = GetU32(store, "cache", "sweep_interval_ms", c.cache.sweep_interval_ms);

  log::Level level = c.log_level;
  if (log::ParseLevel(store.GetString("log", "level", "info"), level)) {
    c.log_level = level;
  } else {
    PDFMERGE_LOG_WARN("Server", "unknown log level '%s', keeping info",
                      store.GetString("log", "level", ""));
  }
  return c;
}

/// Checked once at startup; the first inconsistency is reported.
inline expected<void, ConfigError> ValidateServiceConfig(const ServiceConfig& c,
                                                         std::string* reason = nullptr) {
  auto fail = [reason](const char* why) {
    if (reason != nullptr) *reason = why;
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  };
  if (c.server.request_threads == 0U) return fail("server.request_threads must be > 0");
  if (c.limits.min_files == 0U) return fail("limits.min_files must be > 0");
  if (c.limits.min_files > c.limits.max_files) return fail("limits.min_files > limits.max_files");
  if (c.limits.max_file_size == 0U) return fail("limits.max_file_size_mb must be > 0");
  if (c.limits.max_file_size > c.limits.max_total_size) {
    return fail("limits.max_file_size_mb exceeds limits.max_total_size_mb");
  }
  if (c.server.max_request_bytes < c.limits.max_total_size) {
    return fail("server.max_request_mb below limits.max_total_size_mb");
  }
  if (c.pool.size == 0U) return fail("pool.size must be > 0");
  if (c.pool.min_workers > c.pool.size) return fail("pool.min_workers > pool.size");
  if (c.pool.max_queue_size == 0U) return fail("pool.max_queue_size must be > 0");
  if (!(c.memory.threshold > 0.0 && c.memory.threshold <= 1.0)) {
    return fail("memory.threshold must be in (0, 1]");
  }
  if (c.memory.ceiling_bytes == 0U) return fail("memory.ceiling_mb must be > 0");
  if (c.engine.max_concurrent_operations == 0U) {
    return fail("engine.max_concurrent_operations must be > 0");
  }
  if (c.engine.sub_batch_size == 0U) return fail("engine.sub_batch_size must be > 0");
  if (c.cache.enabled && c.cache.ttl_ms == 0U) return fail("cache.ttl_ms must be > 0");
  return expected<void, ConfigError>::success();
}

}  // namespace pdfmerge

#endif  // PDFMERGE_SERVICE_CONFIG_HPP_
