#pragma once

#include <cstdint>
#include <string>

namespace flashdrop::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{67108864};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8000};
    int threads{4};
    std::string cors_allow_origin{"*"};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Directory layout and size limits for stored objects and chunks.
struct StorageConfig {
    std::string object_path{"data/uploads"};
    std::string chunk_path{"data/chunks"};
    std::string temp_path{"data/tmp"};
    std::string metadata_path{"data/metadata.json"};
    std::uint64_t max_file_bytes{1073741824};
};

/// @brief Retention windows and reaper cadence, all in seconds.
struct RetentionConfig {
    int file_ttl_seconds{86400};
    int sweep_interval_seconds{3600};
    int orphan_chunk_ttl_seconds{86400};
    int session_ttl_seconds{86400};
};

/// @brief Short identifier shape and collision-retry bounds.
struct IdentifierConfig {
    int length{6};
    int max_length{12};
    int attempts_per_length{8};
};

/// @brief Public site settings used when rendering share links and previews.
struct SiteConfig {
    std::string public_url{"http://localhost:8000"};
    std::string name{"FlashDrop"};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for FlashDrop.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    RetentionConfig retention;
    IdentifierConfig identifiers;
    SiteConfig site;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);

}  // namespace flashdrop::core
