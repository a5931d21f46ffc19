#include <lazystr/config.hpp>
#include <lazystr/log.hpp>

namespace lazystr {

namespace detail {

template< typename T >
T get_option( const std::string& key, const T& default_value, const YAML::Node& section, const YAML::Node& global )
{
   try
   {
      if ( section && section[ key ] )
         return section[ key ].as< T >();

      if ( global && global[ key ] )
         return global[ key ].as< T >();
   }
   catch ( const YAML::Exception& ex )
   {
      LAZYSTR_THROW( invalid_config, "invalid value for option ${option}: ${reason}", ("option", key)("reason", ex.what()) );
   }

   return default_value;
}

} // detail

config load_config( const YAML::Node& root )
{
   config cfg;

   const YAML::Node none;
   const bool is_map = root && root.IsMap();

   const YAML::Node global = is_map ? root[ "global" ] : none;
   const YAML::Node render = is_map ? root[ "render" ] : none;
   const YAML::Node log    = is_map ? root[ "log" ]    : none;

   cfg.render.null_text       = detail::get_option< std::string >( NULL_TEXT_OPTION, cfg.render.null_text, render, global );
   cfg.render.default_charset = detail::get_option< std::string >( DEFAULT_CHARSET_OPTION, cfg.render.default_charset, render, global );

   cfg.log.level        = detail::get_option< std::string >( LOG_LEVEL_OPTION, cfg.log.level, log, global );
   cfg.log.color        = detail::get_option< bool >( LOG_COLOR_OPTION, cfg.log.color, log, global );
   cfg.log.directory    = detail::get_option< std::string >( LOG_DIR_OPTION, cfg.log.directory.string(), log, global );
   cfg.log.file_pattern = detail::get_option< std::string >( LOG_FILE_PATTERN_OPTION, cfg.log.file_pattern, log, global );

   boost::log::trivial::severity_level level;
   LAZYSTR_ASSERT( parse_log_level( cfg.log.level, level ), invalid_config, "unknown log level ${level}", ("level", cfg.log.level) );

   LAZYSTR_ASSERT( !cfg.render.default_charset.empty(), invalid_config, "default charset cannot be empty" );

   return cfg;
}

config load_config_file( const std::filesystem::path& file )
{
   YAML::Node root;

   try
   {
      root = YAML::LoadFile( file.string() );
   }
   catch ( const YAML::Exception& ex )
   {
      LAZYSTR_THROW( config_file_error, "unable to read config file ${file}: ${reason}", ("file", file.string())("reason", ex.what()) );
   }

   LOG(info) << "Loaded configuration from " << file.string();
   return load_config( root );
}

void initialize_logging( const logging_config& log )
{
   initialize_logging( log.directory, log.file_pattern, log.level, log.color );
}

} // lazystr
