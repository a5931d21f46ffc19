#pragma once
#include <lazystr/exception.hpp>
#include <lazystr/string/render_config.hpp>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>

#define NULL_TEXT_OPTION         "null-text"
#define DEFAULT_CHARSET_OPTION   "default-charset"
#define LOG_LEVEL_OPTION         "log-level"
#define LOG_LEVEL_DEFAULT        "info"
#define LOG_COLOR_OPTION         "log-color"
#define LOG_DIR_OPTION           "log-dir"
#define LOG_FILE_PATTERN_OPTION  "log-file-pattern"
#define LOG_FILE_PATTERN_DEFAULT "lazystr_%3N.log"

namespace lazystr {

LAZYSTR_DECLARE_EXCEPTION( config_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( invalid_config, config_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( config_file_error, config_exception );

struct logging_config
{
   std::string           level        = LOG_LEVEL_DEFAULT;
   bool                  color        = true;
   std::filesystem::path directory;
   std::string           file_pattern = LOG_FILE_PATTERN_DEFAULT;
};

struct config
{
   render_config  render;
   logging_config log;
};

/**
 * Read configuration from a YAML document.
 *
 * Options are looked up in their own section ("render" or "log") first and
 * then in the "global" section. Missing options keep their defaults.
 *
 * - Throws invalid_config if an option has the wrong type or an unknown log level
 */
config load_config( const YAML::Node& root );

/**
 * Read configuration from a YAML file.
 *
 * - Throws config_file_error if the file cannot be read or parsed
 */
config load_config_file( const std::filesystem::path& file );

void initialize_logging( const logging_config& log );

} // lazystr
