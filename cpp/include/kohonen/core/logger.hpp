#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#define KOHONEN_LOG(module, level) \
    BOOST_LOG_SEV(::kohonen::Logger::instance().get(module), level)

namespace kohonen {

enum Severity {
    SEV_DEBUG = 7,
    SEV_INFO = 6,
    SEV_NOTICE = 5,
    SEV_WARNING = 4,
    SEV_ERROR = 3,
    SEV_CRIT = 2,
};

enum Module {
    MOD_DATASET = 0,
    MOD_SOM,
    MOD_IO,
    MOD_EXPERIMENT,
};

/**
 * @brief Severity loggers, one per module, backed by Boost.Log.
 *
 * Until init() is called only records at SEV_NOTICE or more severe are
 * let through to the default sink.
 */
class Logger {
public:
    struct Config {
        bool enable_console_logging = true;
        bool enable_file_logging = false;
        std::string log_path = "kohonen.log";
        Severity min_severity = SEV_INFO;
    };

    static Logger& instance();

    /**
     * @brief Install console/file sinks and the severity filter.
     *
     * Sinks from an earlier call are removed first.
     */
    void init(const Config& config);

    boost::log::sources::severity_logger<Severity>& get(Module module);

private:
    Logger();

    std::map<Module, boost::log::sources::severity_logger<Severity>> loggers_;
};

template <typename CharT, typename TraitsT>
inline std::basic_ostream<CharT, TraitsT>& operator<<(
    std::basic_ostream<CharT, TraitsT>& strm, Severity lvl) {
    static const char* const str[] = {
        "", "", "CRIT", "ERROR", "WARNING", "NOTICE", "INFO", "DEBUG",
    };
    if (static_cast<std::size_t>(lvl) < (sizeof(str) / sizeof(*str)))
        strm << str[lvl];
    else
        strm << static_cast<int>(lvl);
    return strm;
}

template <typename CharT, typename TraitsT>
inline std::basic_ostream<CharT, TraitsT>& operator<<(
    std::basic_ostream<CharT, TraitsT>& strm, Module module) {
    static const char* const str[] = {"dataset", "som", "io", "experiment"};
    if (static_cast<std::size_t>(module) < (sizeof(str) / sizeof(*str)))
        strm << str[module];
    else
        strm << static_cast<int>(module);
    return strm;
}

}  // namespace kohonen
