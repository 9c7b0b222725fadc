#pragma once

#include <cstddef>
#include <cstdint>

namespace mediaxfer::constants {

constexpr size_t MIB = 1024 * 1024;

// Retry defaults
constexpr uint32_t DEFAULT_RETRY_ATTEMPTS = 3;
constexpr uint32_t DEFAULT_RETRY_BASE_DELAY_MS = 500;

// Upload defaults
constexpr size_t DEFAULT_UPLOAD_PART_SIZE_MB = 16;
constexpr size_t MIN_PART_SIZE_MB = 5;                  // S3 minimum part size
constexpr size_t DEFAULT_UPLOAD_PARTS_IN_FLIGHT = 8;
constexpr uint32_t MAX_MULTIPART_PARTS = 10000;

// Download defaults
constexpr size_t DEFAULT_DOWNLOAD_PART_SIZE_MB = 16;
constexpr uint32_t MAX_DOWNLOAD_PARTS = 10000;          // part size grows past this

// Concurrency defaults (computed limits never go below these)
constexpr size_t MIN_IO_CONCURRENCY = 4;
constexpr size_t MIN_METADATA_CONCURRENCY = 2;
constexpr size_t FALLBACK_CPU_COUNT = 2;
constexpr const char* CGROUP_CPU_MAX_PATH = "/sys/fs/cgroup/cpu.max";

// Presigned URLs
constexpr uint32_t DEFAULT_PRESIGN_TTL_SECONDS = 3600;
constexpr uint32_t MAX_PRESIGN_TTL_SECONDS = 604800;   // 7 days, SigV4 limit

// Integrity scan defaults
constexpr size_t DEFAULT_SCAN_LIMIT = 200;
constexpr size_t DEFAULT_DEEP_CHECK_CONCURRENCY = 4;
constexpr const char* DEFAULT_REQUIRED_KEYS = "videoLocation,master_m3u8";

// Additional-data keys the integrity rules look at
constexpr const char* KEY_MASTER_MANIFEST = "master_m3u8";
constexpr const char* KEY_MEDIA_LOCATION = "videoLocation";

// Metrics
constexpr size_t DEFAULT_METRICS_QUEUE_CAPACITY = 1024;
constexpr size_t DEFAULT_METRICS_INTERVAL_SECS = 15;

// HTTP request defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECS = 120;

constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";
constexpr const char* DEFAULT_REGION = "us-east-1";

} // namespace mediaxfer::constants
