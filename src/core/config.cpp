#include "flashdrop/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

#include "flashdrop/core/logger.h"

namespace flashdrop::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(int value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

void RequirePath(const std::string& value, const char* key) {
    if (IsBlank(value)) {
        throw std::invalid_argument(std::string(key) + " must not be empty");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8000);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.cors_allow_origin = cfg->getString("server.cors_allow_origin", "*");
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 67108864));

    config.storage.object_path = cfg->getString("storage.object_path", "data/uploads");
    config.storage.chunk_path = cfg->getString("storage.chunk_path", "data/chunks");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");
    config.storage.metadata_path = cfg->getString("storage.metadata_path", "data/metadata.json");
    config.storage.max_file_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("storage.max_file_bytes", 1073741824));

    config.retention.file_ttl_seconds = cfg->getInt("retention.file_ttl_seconds", 86400);
    config.retention.sweep_interval_seconds =
        cfg->getInt("retention.sweep_interval_seconds", 3600);
    config.retention.orphan_chunk_ttl_seconds =
        cfg->getInt("retention.orphan_chunk_ttl_seconds", 86400);
    config.retention.session_ttl_seconds = cfg->getInt("retention.session_ttl_seconds", 86400);

    config.identifiers.length = cfg->getInt("identifiers.length", 6);
    config.identifiers.max_length = cfg->getInt("identifiers.max_length", 12);
    config.identifiers.attempts_per_length = cfg->getInt("identifiers.attempts_per_length", 8);

    config.site.public_url = cfg->getString("site.public_url", "http://localhost:8000");
    config.site.name = cfg->getString("site.name", "FlashDrop");

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    ParseLogLevel(config.observability.log_level);
    RequirePositive(config.server.threads, "server.threads");
    RequirePath(config.storage.object_path, "storage.object_path");
    RequirePath(config.storage.chunk_path, "storage.chunk_path");
    RequirePath(config.storage.temp_path, "storage.temp_path");
    RequirePath(config.storage.metadata_path, "storage.metadata_path");
    if (config.storage.max_file_bytes == 0) {
        throw std::invalid_argument("storage.max_file_bytes must be positive");
    }
    RequirePositive(config.retention.file_ttl_seconds, "retention.file_ttl_seconds");
    RequirePositive(config.retention.sweep_interval_seconds, "retention.sweep_interval_seconds");
    RequirePositive(config.retention.orphan_chunk_ttl_seconds,
                    "retention.orphan_chunk_ttl_seconds");
    RequirePositive(config.retention.session_ttl_seconds, "retention.session_ttl_seconds");
    RequirePositive(config.identifiers.length, "identifiers.length");
    RequirePositive(config.identifiers.attempts_per_length, "identifiers.attempts_per_length");
    if (config.identifiers.max_length < config.identifiers.length) {
        throw std::invalid_argument("identifiers.max_length must be >= identifiers.length");
    }
    if (config.server.tls.enabled) {
        // Fail fast so TLS mode cannot start without key material.
        RequirePath(config.server.tls.certificate, "server.tls.certificate");
        RequirePath(config.server.tls.private_key, "server.tls.private_key");
    }
    return config;
}

}  // namespace flashdrop::core
