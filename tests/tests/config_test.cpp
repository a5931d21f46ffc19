#include <boost/test/unit_test.hpp>
#include <boost/filesystem.hpp>

#include <lazystr/config.hpp>

#include <fstream>

using namespace lazystr;

struct config_fixture
{
   config_fixture()
   {
      _temp = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
      boost::filesystem::create_directory( _temp );
   }

   ~config_fixture()
   {
      boost::filesystem::remove_all( _temp );
   }

   boost::filesystem::path _temp;
};

BOOST_FIXTURE_TEST_SUITE( config_tests, config_fixture )

BOOST_AUTO_TEST_CASE( default_config_tests )
{
   auto cfg = load_config( YAML::Node() );
   BOOST_REQUIRE_EQUAL( cfg.render.null_text, "null" );
   BOOST_REQUIRE_EQUAL( cfg.render.default_charset, "UTF-8" );
   BOOST_REQUIRE_EQUAL( cfg.log.level, LOG_LEVEL_DEFAULT );
   BOOST_REQUIRE( cfg.log.color );
   BOOST_REQUIRE( cfg.log.directory.empty() );
   BOOST_REQUIRE_EQUAL( cfg.log.file_pattern, LOG_FILE_PATTERN_DEFAULT );

   BOOST_TEST_MESSAGE( "A document that is not a map keeps the defaults" );
   auto scalar = load_config( YAML::Load( "just a scalar" ) );
   BOOST_REQUIRE_EQUAL( scalar.render.null_text, "null" );
}

BOOST_AUTO_TEST_CASE( section_lookup_tests )
{
   auto root = YAML::Load(
      "global:\n"
      "  null-text: none\n"
      "  log-level: warning\n"
      "render:\n"
      "  default-charset: ISO-8859-1\n"
      "log:\n"
      "  log-level: debug\n"
      "  log-color: false\n"
      "  log-dir: /tmp/lazystr\n"
   );

   auto cfg = load_config( root );

   BOOST_TEST_MESSAGE( "Options fall back to the global section" );
   BOOST_REQUIRE_EQUAL( cfg.render.null_text, "none" );
   BOOST_REQUIRE_EQUAL( cfg.render.default_charset, "ISO-8859-1" );

   BOOST_TEST_MESSAGE( "Section options take precedence over global options" );
   BOOST_REQUIRE_EQUAL( cfg.log.level, "debug" );
   BOOST_REQUIRE( !cfg.log.color );
   BOOST_REQUIRE_EQUAL( cfg.log.directory.string(), "/tmp/lazystr" );
   BOOST_REQUIRE_EQUAL( cfg.log.file_pattern, LOG_FILE_PATTERN_DEFAULT );
}

BOOST_AUTO_TEST_CASE( invalid_config_tests )
{
   BOOST_REQUIRE_THROW( load_config( YAML::Load( "log:\n  log-level: loud\n" ) ), invalid_config );
   BOOST_REQUIRE_THROW( load_config( YAML::Load( "log:\n  log-color: maybe\n" ) ), invalid_config );
   BOOST_REQUIRE_THROW( load_config( YAML::Load( "render:\n  default-charset: ''\n" ) ), invalid_config );
   BOOST_REQUIRE_THROW( load_config( YAML::Load( "render:\n  null-text: [a, b]\n" ) ), config_exception );
}

BOOST_AUTO_TEST_CASE( config_file_tests )
{
   auto file = _temp / "config.yml";
   {
      std::ofstream out( file.string() );
      out << "render:\n  null-text: \"-\"\n";
   }

   auto cfg = load_config_file( file.string() );
   BOOST_REQUIRE_EQUAL( cfg.render.null_text, "-" );

   BOOST_REQUIRE_THROW( load_config_file( ( _temp / "missing.yml" ).string() ), config_file_error );

   auto broken = _temp / "broken.yml";
   {
      std::ofstream out( broken.string() );
      out << "render: [unclosed\n";
   }
   BOOST_REQUIRE_THROW( load_config_file( broken.string() ), config_file_error );
}

BOOST_AUTO_TEST_SUITE_END()
