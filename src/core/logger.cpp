#include "stitchfs/core/logger.h"

#include <sstream>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSONString.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace stitchfs::core {

namespace {

Poco::Logger& ServiceLogger() {
    return Poco::Logger::get("stitchfs");
}

}  // namespace

int ParseLogLevel(const std::string& level) {
    try {
        return Poco::Logger::parseLevel(level);
    } catch (const Poco::InvalidArgumentException&) {
        throw std::invalid_argument("unknown log level: " + level);
    }
}

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    ServiceLogger().setChannel(channel);
    ServiceLogger().setLevel(ParseLogLevel(level));
}

void LogInfo(const std::string& message) { ServiceLogger().information(message); }
void LogWarning(const std::string& message) { ServiceLogger().warning(message); }
void LogError(const std::string& message) { ServiceLogger().error(message); }
void LogDebug(const std::string& message) { ServiceLogger().debug(message); }

void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms) {
    if (!ServiceLogger().information()) {
        return;
    }
    Poco::JSON::Object line(Poco::JSON_PRESERVE_KEY_ORDER);
    line.set("event", "http_request");
    line.set("request_id", request_id);
    line.set("method", method);
    line.set("target", target);
    line.set("remote", remote);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    std::ostringstream out;
    line.stringify(out);
    ServiceLogger().information(out.str());
}

}  // namespace stitchfs::core
