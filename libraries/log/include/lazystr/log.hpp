#pragma once
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <filesystem>
#include <string>

#define LOG(LEVEL)                                                                         \
BOOST_LOG_SEV(::boost::log::trivial::logger::get(), boost::log::trivial::LEVEL)            \
  << boost::log::add_value("Line", __LINE__)                                               \
  << boost::log::add_value("File", std::filesystem::path(__FILE__).filename().string())    \

namespace lazystr {

/**
 * Parses a severity name ("trace" through "fatal"). Returns false when the
 * name is not a known level.
 */
bool parse_log_level( const std::string& name, boost::log::trivial::severity_level& level );

void initialize_logging( const std::filesystem::path& p, const std::string& file_pattern, const std::string& level = "info", bool color = true );

} // lazystr
