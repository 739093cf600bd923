#pragma once

#include <cstdint>
#include <string>

namespace stitchfs::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    /// Upper bound for a single request body, i.e. one chunk.
    std::uint64_t max_body_bytes{67108864};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Filesystem roots for staged chunks and assembled files.
struct StorageConfig {
    std::string staging_path{"data/staging"};
    std::string destination_path{"data/uploads"};
    /// Prefix of the public reference path returned by finalize.
    std::string public_prefix{"/uploads"};
};

/// @brief Assembly behavior.
struct AssemblyConfig {
    int max_chunks{1000};
    /// Assemble under a temporary name and rename on success instead of writing in place.
    bool atomic_publish{false};
    /// Serialize finalize calls per session with an in-process lock table.
    bool session_locking{true};
};

/// @brief Periodic reaping of abandoned staging directories.
struct JanitorConfig {
    bool enabled{true};
    int sweep_interval_seconds{300};
    int max_session_age_seconds{86400};
    int max_sessions_per_sweep{200};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for StitchFS.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    AssemblyConfig assembly;
    JanitorConfig janitor;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
/// @throws std::invalid_argument when a value is out of range.
Config LoadConfig(const std::string& path);

}  // namespace stitchfs::core
