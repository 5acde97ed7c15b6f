#include "cpeip/logging.hpp"

// 標準出力または syslog へ出力するだけの最小限のロガー。

#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

#ifndef _WIN32
#include <syslog.h>
#endif

namespace cpeip::log {

namespace {

Level g_level = Level::Error;
bool g_syslog = false;
std::mutex g_mutex;

#ifndef _WIN32
int toSyslogPriority(Level level) {
    switch (level) {
        case Level::Debug:   return LOG_DEBUG;
        case Level::Verbose: return LOG_NOTICE;
        case Level::Info:    return LOG_INFO;
        default:             return LOG_ERR;
    }
}

const char* toString(Level level) {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Verbose: return "VERBOSE";
        case Level::Info:    return "INFO";
        default:             return "ERROR";
    }
}

int toFacility(const std::string& name) {
    if (name == "LOCAL1") return LOG_LOCAL1;
    if (name == "LOCAL2") return LOG_LOCAL2;
    if (name == "LOCAL3") return LOG_LOCAL3;
    if (name == "LOCAL4") return LOG_LOCAL4;
    if (name == "LOCAL5") return LOG_LOCAL5;
    if (name == "LOCAL6") return LOG_LOCAL6;
    if (name == "LOCAL7") return LOG_LOCAL7;
    if (name == "USER") return LOG_USER;
    if (name == "DAEMON") return LOG_DAEMON;
    return LOG_LOCAL0;
}
#endif

} // namespace

void init(const std::string& id, const std::string& syslog_facility, Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    g_syslog = false;
#ifdef _WIN32
    // Windows には syslog がないので常に標準出力へ出す
    (void)id;
    (void)syslog_facility;
#else
    if (syslog_facility.empty()) {
        return;
    }
    // openlog は ident のポインタを保持するため静的領域へコピーしておく。
    static char ident[64] = {};
    id.copy(ident, sizeof(ident) - 1);
    ::openlog(ident, LOG_CONS | LOG_PID, toFacility(syslog_facility));
    g_syslog = true;
#endif
}

Level level() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_level;
}

void setLevel(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
}

void write(Level level, std::ostringstream& msg) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (level < g_level) {
        return;
    }
#ifndef _WIN32
    if (g_syslog) {
        ::syslog(toSyslogPriority(level), "%s", msg.str().c_str());
        return;
    }
#endif

    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t now_t = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
#ifdef _WIN32
    ::localtime_s(&timeinfo, &now_t);
#else
    ::localtime_r(&now_t, &timeinfo);
#endif
    char buffer[32] = {};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
    std::printf("%s.%03d %s: %s\n", buffer, static_cast<int>(millis), toString(level), msg.str().c_str());
}

} // namespace cpeip::log
