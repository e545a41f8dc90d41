#ifndef TOKENMATCHER_LOGGER_H
#define TOKENMATCHER_LOGGER_H

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <experimental/source_location>
#include <syslog.h>
#include <string>

namespace log_priv {
    inline bool open_log() {
        openlog("token-matcher", LOG_CONS, LOG_USER);
        return true;
    }

    inline void write(int priority, const std::string &log_string, const std::experimental::source_location &location) {
        const static bool opened = open_log();
        (void) opened;

        auto final = fmt::format("SOURCE_FILE={}:SOURCE_FUNCTION={},SOURCE_LINE={},MESSAGE={}",
                                 location.file_name(),
                                 location.function_name(),
                                 location.line(),
                                 log_string);
        syslog(priority, "%s", final.c_str());
    }
}

inline void log(const std::string &log_string,
                const std::experimental::source_location location = std::experimental::source_location::current()) {
    log_priv::write(LOG_DEBUG, log_string, location);
}

inline void log(const auto &var1, const auto &var2, const auto &var3,
                const std::experimental::source_location location = std::experimental::source_location::current()) {
    log(fmt::format("{} {} {}", var1, var2, var3), location);
}

inline void log(const auto &var1, const auto &var2,
                const std::experimental::source_location location = std::experimental::source_location::current()) {
    log(fmt::format("{} {}", var1, var2), location);
}

inline void log_error(const std::string &log_string,
                      const std::experimental::source_location location = std::experimental::source_location::current()) {
    log_priv::write(LOG_ERR, log_string, location);
}

#endif //TOKENMATCHER_LOGGER_H
