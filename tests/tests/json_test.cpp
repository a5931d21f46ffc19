#include <boost/test/unit_test.hpp>

#include <lazystr/string/exceptions.hpp>
#include <lazystr/string/json.hpp>

using namespace lazystr;

struct json_fixture {};

BOOST_FIXTURE_TEST_SUITE( json_tests, json_fixture )

BOOST_AUTO_TEST_CASE( serialize_tests )
{
   interpolated_string inner( { "(", ")" }, { 2 } );
   interpolated_string s( { "a", "b", "c", "d" }, { list{ 1, true, nullptr }, inner, 2.5 } );

   nlohmann::json j = s;

   BOOST_TEST_MESSAGE( "The record holds fragments and values" );
   BOOST_REQUIRE( j.is_object() );
   BOOST_REQUIRE_EQUAL( j[ "fragments" ].size(), 4 );
   BOOST_REQUIRE_EQUAL( j[ "values" ].size(), 3 );
   BOOST_REQUIRE( j[ "values" ][ 0 ].is_array() );
   BOOST_REQUIRE( j[ "values" ][ 1 ].is_object() );
   BOOST_REQUIRE_EQUAL( j[ "values" ][ 1 ][ "fragments" ][ 0 ].get< std::string >(), "(" );

   BOOST_TEST_MESSAGE( "A restored string renders the same text and structure" );
   auto restored = j.get< interpolated_string >();
   BOOST_REQUIRE_EQUAL( restored.to_string(), s.to_string() );
   BOOST_REQUIRE( restored.fragments() == s.fragments() );
   BOOST_REQUIRE_EQUAL( restored.value_count(), s.value_count() );
   BOOST_REQUIRE( restored.get_value( 1 ).is< interpolated_string >() );

   BOOST_TEST_MESSAGE( "The empty instance survives a round trip" );
   nlohmann::json empty = interpolated_string::empty_instance();
   BOOST_REQUIRE_EQUAL( empty.dump(), "{\"fragments\":[\"\"],\"values\":[]}" );
   BOOST_REQUIRE( empty.get< interpolated_string >().fragments() == interpolated_string::empty_instance().fragments() );
}

BOOST_AUTO_TEST_CASE( unserializable_tests )
{
   interpolated_string with_closure( { "" }, { []() { return 1; } } );
   BOOST_REQUIRE_THROW( nlohmann::json j = with_closure, unserializable_value );

   interpolated_string nested( { "" }, { list{ interpolated_string( { "" }, { []( std::ostream& ) {} } ) } } );
   BOOST_REQUIRE_THROW( nlohmann::json j = nested, unserializable_value );
   BOOST_REQUIRE_THROW( nlohmann::json( nested ).dump(), serialization_exception );

   value streamable = object( std::string( "opaque" ) );
   BOOST_REQUIRE_THROW( nlohmann::json j = streamable, unserializable_value );

   BOOST_TEST_MESSAGE( "Plain values still serialize" );
   nlohmann::json plain = value( list{ 1, "two" } );
   BOOST_REQUIRE_EQUAL( plain.dump(), "[1,\"two\"]" );
}

BOOST_AUTO_TEST_CASE( malformed_record_tests )
{
   BOOST_REQUIRE_THROW( nlohmann::json::parse( "[]" ).get< interpolated_string >(), malformed_record );
   BOOST_REQUIRE_THROW( nlohmann::json::parse( "{\"values\":[]}" ).get< interpolated_string >(), malformed_record );
   BOOST_REQUIRE_THROW( nlohmann::json::parse( "{\"fragments\":[]}" ).get< interpolated_string >(), malformed_record );
   BOOST_REQUIRE_THROW( nlohmann::json::parse( "{\"fragments\":[1],\"values\":[]}" ).get< interpolated_string >(), malformed_record );

   BOOST_TEST_MESSAGE( "Records must keep the fragment and value counts consistent" );
   BOOST_REQUIRE_THROW( nlohmann::json::parse( "{\"fragments\":[\"a\"],\"values\":[1,2]}" ).get< interpolated_string >(), malformed_interpolated_string );
}

BOOST_AUTO_TEST_SUITE_END()
