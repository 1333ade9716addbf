#include "chunkfs/core/logger.h"

#include <sstream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/Exception.h>
#include <Poco/FormattingChannel.h>
#include <Poco/JSON/Object.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace chunkfs::core {

namespace {
constexpr const char* kRootName = "chunkfs";

Poco::Logger& RootLogger() { return Poco::Logger::get(kRootName); }
Poco::Logger& HttpLogger() { return Poco::Logger::get("chunkfs.http"); }
Poco::Logger& UploadLogger() { return Poco::Logger::get("chunkfs.upload"); }

std::string Stringify(const Poco::JSON::Object& line) {
    std::ostringstream out;
    line.stringify(out);
    return out.str();
}
}  // namespace

int ParseLogLevel(const std::string& level) {
    try {
        return Poco::Logger::parseLevel(level);
    } catch (const Poco::InvalidArgumentException&) {
        return Poco::Message::PRIO_INFORMATION;
    }
}

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel());
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %s: %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    // Applies to "chunkfs" and every "chunkfs.*" logger, including ones created earlier.
    Poco::Logger::setChannel(kRootName, channel);
    Poco::Logger::setLevel(kRootName, ParseLogLevel(level));
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogWarning(const std::string& message) { RootLogger().warning(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms) {
    auto& logger = HttpLogger();
    const bool failed = status >= 500;
    if (!logger.is(failed ? Poco::Message::PRIO_ERROR : Poco::Message::PRIO_INFORMATION)) {
        return;
    }
    Poco::JSON::Object line(true);
    line.set("event", "http_request");
    line.set("request_id", request_id);
    line.set("method", method);
    line.set("target", target);
    line.set("remote", remote);
    line.set("status", status);
    line.set("latency_ms", static_cast<Poco::Int64>(latency_ms));
    if (failed) {
        logger.error(Stringify(line));
    } else {
        logger.information(Stringify(line));
    }
}

void LogSessionEvent(const std::string& event,
                     const std::string& session_id,
                     const std::string& detail) {
    auto& logger = UploadLogger();
    if (!logger.information()) {
        return;
    }
    Poco::JSON::Object line(true);
    line.set("event", event);
    if (!session_id.empty()) {
        line.set("session_id", session_id);
    }
    if (!detail.empty()) {
        line.set("detail", detail);
    }
    logger.information(Stringify(line));
}

}  // namespace chunkfs::core
