#include <lazystr/config.hpp>
#include <lazystr/log.hpp>
#include <lazystr/string/builder.hpp>
#include <lazystr/string/coercion.hpp>
#include <lazystr/string/dispatch.hpp>
#include <lazystr/string/interpolated_string.hpp>
#include <lazystr/string/json.hpp>
#include <lazystr/string/value.hpp>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>

#define HELP_OPTION   "help"
#define CONFIG_OPTION "config"

using namespace boost;

int main( int argc, char** argv )
{
   int retcode = EXIT_SUCCESS;

   try
   {
      program_options::options_description options;
      options.add_options()
         (HELP_OPTION   ",h", "Print this help message and exit")
         (CONFIG_OPTION ",c", program_options::value< std::string >(), "A YAML configuration file");

      program_options::variables_map args;
      program_options::store( program_options::parse_command_line( argc, argv, options ), args );
      program_options::notify( args );

      if ( args.count( HELP_OPTION ) )
      {
         std::cout << options << std::endl;
         return EXIT_SUCCESS;
      }

      lazystr::config cfg;
      if ( args.count( CONFIG_OPTION ) )
         cfg = lazystr::load_config_file( args[ CONFIG_OPTION ].as< std::string >() );

      lazystr::initialize_logging( cfg.log );

      std::string my_name = "Pythagoras";
      int my_age = 2300;
      int renders = 0;

      lazystr::interpolated_string greeting(
         { "Hello world, my name is ", ", and I am ", " years old. Rendered ", " time(s)." },
         { my_name, my_age, [&renders]() { return ++renders; } }
      );

      std::cout << greeting << std::endl;
      greeting.write_to( std::cout, cfg.render ) << std::endl;

      auto shout = lazystr::dispatch::invoke( greeting, "to_upper_case" );
      std::cout << lazystr::to_string( shout, cfg.render ) << std::endl;

      lazystr::interpolated_string markup( { "<em>", "</em>" }, { "5 < 7 & 7 > 5" } );
      lazystr::markup_builder builder( std::cout, cfg.render );
      markup.build( builder );
      std::cout << std::endl;

      std::cout << nlohmann::json( markup ).dump() << std::endl;
   }
   catch ( const program_options::error& e )
   {
      std::cerr << "Invalid argument: " << e.what() << std::endl;
      retcode = EXIT_FAILURE;
   }
   catch ( const lazystr::config_exception& e )
   {
      LOG(error) << "Invalid configuration: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const lazystr::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }
   catch ( const boost::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << boost::diagnostic_information( e );
      retcode = EXIT_FAILURE;
   }
   catch ( const std::exception& e )
   {
      LOG(fatal) << "An unexpected error has occurred: " << e.what();
      retcode = EXIT_FAILURE;
   }

   return retcode;
}
