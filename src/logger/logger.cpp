#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace tutor::logging {

namespace {

const char* const LOG_FORMAT_TIMESTAMP = "%Y-%m-%d %H:%M:%S.%f";

} // namespace

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", LOG_FORMAT_TIMESTAMP)
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>(
          keywords::file_name = log_path.string(),
          keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
          keywords::open_mode = std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    if (console) {
      auto console_sink = boost::log::add_console_log(std::clog, keywords::auto_flush = true);
      console_sink->set_formatter(formatter);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: "
                            << (log_file.empty() ? std::string("<none>") : log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

std::optional<severity_level> parse_log_level(const std::string& name) {
  if (name == "trace") return boost::log::trivial::trace;
  if (name == "debug") return boost::log::trivial::debug;
  if (name == "info") return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error") return boost::log::trivial::error;
  if (name == "fatal") return boost::log::trivial::fatal;
  return std::nullopt;
}

} // namespace tutor::logging
