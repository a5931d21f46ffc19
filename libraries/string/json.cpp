#include <lazystr/string/json.hpp>
#include <lazystr/util.hpp>

namespace lazystr {

void to_json( nlohmann::json& j, const value& v )
{
   std::visit( overloaded {
      [&]( std::nullptr_t )               { j = nullptr; },
      [&]( bool b )                       { j = b; },
      [&]( int64_t i )                    { j = i; },
      [&]( uint64_t u )                   { j = u; },
      [&]( double d )                     { j = d; },
      [&]( const std::string& s )         { j = s; },
      [&]( const list& l )
      {
         j = nlohmann::json::array();
         for ( const auto& e : l )
         {
            nlohmann::json element;
            to_json( element, e );
            j.push_back( std::move( element ) );
         }
      },
      [&]( const interpolated_string& s ) { to_json( j, s ); },
      [&]( const closure& )
      {
         LAZYSTR_THROW( unserializable_value, "closures cannot be serialized" );
      },
      [&]( const object& o )
      {
         LAZYSTR_THROW( unserializable_value, "object of type ${type} cannot be serialized", ("type", o.type_name()) );
      }
   }, v.as_variant() );
}

void from_json( const nlohmann::json& j, value& v )
{
   switch ( j.type() )
   {
      case nlohmann::json::value_t::null:
         v = value();
         break;
      case nlohmann::json::value_t::boolean:
         v = value( j.get< bool >() );
         break;
      case nlohmann::json::value_t::number_integer:
         v = value( j.get< int64_t >() );
         break;
      case nlohmann::json::value_t::number_unsigned:
         v = value( j.get< uint64_t >() );
         break;
      case nlohmann::json::value_t::number_float:
         v = value( j.get< double >() );
         break;
      case nlohmann::json::value_t::string:
         v = value( j.get< std::string >() );
         break;
      case nlohmann::json::value_t::array:
      {
         list l;
         l.reserve( j.size() );
         for ( const auto& e : j )
         {
            value element;
            from_json( e, element );
            l.push_back( std::move( element ) );
         }
         v = value( std::move( l ) );
         break;
      }
      case nlohmann::json::value_t::object:
      {
         interpolated_string s;
         from_json( j, s );
         v = value( std::move( s ) );
         break;
      }
      default:
         LAZYSTR_THROW( malformed_record, "json type ${type} cannot be read as a value", ("type", j.type_name()) );
   }
}

void to_json( nlohmann::json& j, const interpolated_string& s )
{
   j = nlohmann::json::object();
   j[ "fragments" ] = s.fragments();

   auto& values = j[ "values" ] = nlohmann::json::array();
   for ( const auto& v : s.values() )
   {
      nlohmann::json element;
      to_json( element, v );
      values.push_back( std::move( element ) );
   }
}

void from_json( const nlohmann::json& j, interpolated_string& s )
{
   LAZYSTR_ASSERT( j.is_object(), malformed_record, "an interpolated string record must be a json object" );
   LAZYSTR_ASSERT( j.contains( "fragments" ) && j.at( "fragments" ).is_array(), malformed_record,
      "an interpolated string record requires a fragments array" );
   LAZYSTR_ASSERT( j.contains( "values" ) && j.at( "values" ).is_array(), malformed_record,
      "an interpolated string record requires a values array" );

   std::vector< std::string > fragments;
   for ( const auto& f : j.at( "fragments" ) )
   {
      LAZYSTR_ASSERT( f.is_string(), malformed_record, "interpolated string fragments must be strings" );
      fragments.push_back( f.get< std::string >() );
   }

   std::vector< value > values;
   for ( const auto& e : j.at( "values" ) )
   {
      value element;
      from_json( e, element );
      values.push_back( std::move( element ) );
   }

   s = interpolated_string( std::move( fragments ), std::move( values ) );
}

} // lazystr
