#include "stitchfs/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

#include "stitchfs/core/logger.h"

namespace stitchfs::core {

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

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 67108864));

    config.storage.staging_path = cfg->getString("storage.staging_path", "data/staging");
    config.storage.destination_path = cfg->getString("storage.destination_path", "data/uploads");
    config.storage.public_prefix = cfg->getString("storage.public_prefix", "/uploads");

    config.assembly.max_chunks = cfg->getInt("assembly.max_chunks", 1000);
    config.assembly.atomic_publish = cfg->getBool("assembly.atomic_publish", false);
    config.assembly.session_locking = cfg->getBool("assembly.session_locking", true);

    config.janitor.enabled = cfg->getBool("janitor.enabled", true);
    config.janitor.sweep_interval_seconds = cfg->getInt("janitor.sweep_interval_seconds", 300);
    config.janitor.max_session_age_seconds = cfg->getInt("janitor.max_session_age_seconds", 86400);
    config.janitor.max_sessions_per_sweep = cfg->getInt("janitor.max_sessions_per_sweep", 200);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (config.server.tls.enabled &&
        (IsBlank(config.server.tls.certificate) || IsBlank(config.server.tls.private_key))) {
        throw std::invalid_argument(
            "server.tls.enabled=true requires server.tls.certificate and server.tls.private_key");
    }
    if (IsBlank(config.storage.staging_path)) {
        throw std::invalid_argument("storage.staging_path must not be empty");
    }
    if (IsBlank(config.storage.destination_path)) {
        throw std::invalid_argument("storage.destination_path must not be empty");
    }
    RequirePositive(config.assembly.max_chunks, "assembly.max_chunks");
    RequirePositive(config.janitor.sweep_interval_seconds, "janitor.sweep_interval_seconds");
    RequirePositive(config.janitor.max_session_age_seconds, "janitor.max_session_age_seconds");
    RequirePositive(config.janitor.max_sessions_per_sweep, "janitor.max_sessions_per_sweep");
    ParseLogLevel(config.observability.log_level);
    return config;
}

}  // namespace stitchfs::core
