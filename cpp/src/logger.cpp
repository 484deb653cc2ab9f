#include <kohonen/core/logger.hpp>

#include <iostream>
#include <vector>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace kohonen {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    static const std::vector<Module> modules = {
        MOD_DATASET,
        MOD_SOM,
        MOD_IO,
        MOD_EXPERIMENT,
    };

    for (Module module : modules) {
        loggers_[module].add_attribute(
            "Module", logging::attributes::constant<Module>(module));
    }

    // Keep the default sink quiet until init() is called
    logging::core::get()->set_filter(
        expr::attr<Severity>("Severity") <= SEV_NOTICE);
}

logging::sources::severity_logger<Severity>& Logger::get(Module module) {
    return loggers_[module];
}

void Logger::init(const Config& config) {
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    if (config.enable_file_logging) {
        logging::add_file_log(
            keywords::file_name = config.log_path + std::string(".%N"),
            keywords::rotation_size = 10 * 1024 * 1024,
            keywords::open_mode = std::ios_base::app,
            keywords::format = (
                expr::stream
                << expr::format_date_time<boost::posix_time::ptime>(
                       "TimeStamp", "[%Y-%m-%d %H:%M:%S]")
                << " [" << expr::attr<Module>("Module") << "]"
                << " [" << expr::attr<Severity>("Severity") << "]"
                << " " << expr::smessage));
    }

    if (config.enable_console_logging) {
        logging::add_console_log(
            std::clog,
            keywords::format = (
                expr::stream
                << expr::format_date_time<boost::posix_time::ptime>(
                       "TimeStamp", "[%Y-%m-%d %H:%M:%S]")
                << " [" << expr::attr<Module>("Module") << "]"
                << " [" << expr::attr<Severity>("Severity") << "]"
                << " " << expr::smessage));
    }

    logging::core::get()->set_filter(
        expr::attr<Severity>("Severity") <= config.min_severity);
}

}  // namespace kohonen
