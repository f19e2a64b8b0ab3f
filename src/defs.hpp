// Constants and definitions
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace offload {

// Directories
constexpr const char *BASE_DIR = "/etc/offload/";
constexpr const char *CONFIG_FILENAME = "offload.conf";
constexpr const char *PROFILES_FILENAME = "profiles.conf";
constexpr const char *DEFAULT_LOG_FILE = "/var/log/offload.log";
constexpr const char *DEFAULT_STORE_ROOT = "/mnt/nas/Photos";
constexpr const char *DEFAULT_STAGING_ROOT = "/var/lib/offload/staging";
constexpr const char *DEFAULT_AUDIT_DIR = "/var/lib/offload/audit";

// Transfer artifacts
constexpr const char *PART_SUFFIX = ".offload-part";
constexpr const char *AUDIT_FILE_NAME = ".offload-audit.json";
// Present in a day-folder until its import has verified
constexpr const char *INCOMPLETE_MARKER = ".offload-incomplete";

// Destination template token
constexpr const char *DATE_TOKEN = "{date}";
constexpr const char *IMPORT_DATE_FORMAT = "%Y%m%d";

// Identification
constexpr int DEFAULT_CONFIDENCE_THRESHOLD = 50;
constexpr int MIN_CONFIDENCE_THRESHOLD = 1;
constexpr int DEFAULT_METADATA_SAMPLES = 3;
constexpr std::size_t METADATA_SCAN_BYTES = 256 * 1024;
constexpr std::size_t METADATA_MIN_RUN = 4;

// Transfer / verification
constexpr std::size_t COPY_CHUNK_BYTES = 1 << 20;
constexpr int DEFAULT_TRANSFER_RETRIES = 3;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 500;
constexpr int MAX_RETRY_BACKOFF_MS = 60 * 1000;
constexpr int DEFAULT_DIGEST_WORKERS = 4;
constexpr int DEFAULT_PROBE_TIMEOUT_MS = 3000;

// Volume entries that never belong to an import
const std::vector<std::string> SYSTEM_ENTRIES = {
    "System Volume Information", "$RECYCLE.BIN", "lost+found"};

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_UNIDENTIFIED = 10;
constexpr int EXIT_COLLISION = 11;
constexpr int EXIT_NO_DESTINATION = 12;
constexpr int EXIT_TRANSFER = 13;
constexpr int EXIT_VERIFICATION = 14;
constexpr int EXIT_CANCELLED = 15;
constexpr int EXIT_INTERNAL = 20;

} // namespace offload
