#include <lazystr/string/interpolated_string.hpp>

#include <lazystr/log.hpp>
#include <lazystr/string/builder.hpp>
#include <lazystr/string/coercion.hpp>
#include <lazystr/string/exceptions.hpp>
#include <lazystr/string/value.hpp>

#include <boost/locale/encoding.hpp>

#include <algorithm>
#include <ios>
#include <sstream>

namespace lazystr {

interpolated_string::interpolated_string() :
   _fragments( std::make_shared< const std::vector< std::string > >( 1 ) ),
   _values( std::make_shared< const std::vector< value > >() )
{}

interpolated_string::interpolated_string( std::string text ) :
   _fragments( std::make_shared< const std::vector< std::string > >( 1, std::move( text ) ) ),
   _values( std::make_shared< const std::vector< value > >() )
{}

interpolated_string::interpolated_string( std::vector< std::string > fragments, std::vector< value > values )
{
   LAZYSTR_ASSERT( fragments.size() == values.size() || fragments.size() == values.size() + 1,
      malformed_interpolated_string,
      "an interpolated string with ${fragments} fragments cannot hold ${values} values",
      ("fragments", fragments.size())("values", values.size()) );

   _fragments = std::make_shared< const std::vector< std::string > >( std::move( fragments ) );
   _values    = std::make_shared< const std::vector< value > >( std::move( values ) );
}

const interpolated_string& interpolated_string::empty_instance()
{
   static const interpolated_string instance;
   return instance;
}

const std::vector< std::string >& interpolated_string::fragments() const
{
   return *_fragments;
}

const std::vector< value >& interpolated_string::values() const
{
   return *_values;
}

std::size_t interpolated_string::value_count() const
{
   return _values->size();
}

const value& interpolated_string::get_value( std::size_t idx ) const
{
   LAZYSTR_ASSERT( idx < _values->size(), index_out_of_bounds,
      "value index ${index} is out of bounds, value count is ${count}",
      ("index", idx)("count", _values->size()) );
   return (*_values)[ idx ];
}

std::ostream& interpolated_string::write_to( std::ostream& out, const render_config& config ) const
{
   const auto& fragments = *_fragments;
   const auto& values = *_values;
   std::size_t number_of_values = values.size();

   for ( std::size_t i = 0; i < fragments.size(); i++ )
   {
      out << fragments[ i ];
      detail::check_sink_state( out );

      if ( i < number_of_values )
         write_value( out, values[ i ], config );
   }

   return out;
}

std::string interpolated_string::to_string( const render_config& config ) const
{
   std::ostringstream buffer;

   try
   {
      write_to( buffer, config );
   }
   catch ( const sink_failure& ex )
   {
      LOG( error ) << "In memory render of an interpolated string failed: " << ex.what();
      LAZYSTR_THROW( string_writer_failure, "unable to render interpolated string to memory: ${reason}", ("reason", ex.what()) );
   }
   catch ( const std::ios_base::failure& ex )
   {
      LOG( error ) << "In memory render of an interpolated string failed: " << ex.what();
      LAZYSTR_THROW( string_writer_failure, "unable to render interpolated string to memory: ${reason}", ("reason", ex.what()) );
   }

   return buffer.str();
}

void interpolated_string::build( builder& b ) const
{
   const auto& fragments = *_fragments;
   const auto& values = *_values;
   std::size_t number_of_values = values.size();

   for ( std::size_t i = 0; i < fragments.size(); i++ )
   {
      b.yield_literal( fragments[ i ] );

      if ( i < number_of_values )
         b.yield_value( values[ i ] );
   }
}

interpolated_string interpolated_string::concat( const interpolated_string& that ) const
{
   std::vector< std::string > fragments( *_fragments );
   std::vector< value > values( *_values );

   const auto& that_fragments = *that._fragments;
   auto first = that_fragments.begin();

   if ( fragments.size() > values.size() && first != that_fragments.end() )
   {
      // Merge onto the trailing literal to avoid an empty bridging fragment
      fragments.back() += *first;
      ++first;
   }

   fragments.insert( fragments.end(), first, that_fragments.end() );
   values.insert( values.end(), that._values->begin(), that._values->end() );

   return interpolated_string( std::move( fragments ), std::move( values ) );
}

interpolated_string interpolated_string::concat( const std::string& that ) const
{
   return concat( interpolated_string( that ) );
}

bool interpolated_string::equals( const interpolated_string& that ) const
{
   return to_string() == that.to_string();
}

int interpolated_string::compare( const interpolated_string& that ) const
{
   return compare( that.to_string() );
}

int interpolated_string::compare( const std::string& that ) const
{
   int result = to_string().compare( that );
   return ( result > 0 ) - ( result < 0 );
}

std::size_t interpolated_string::hash_code() const
{
   return std::hash< std::string >()( to_string() );
}

std::size_t interpolated_string::length() const
{
   return to_string().size();
}

char interpolated_string::char_at( std::size_t index ) const
{
   std::string text = to_string();
   LAZYSTR_ASSERT( index < text.size(), index_out_of_bounds,
      "index ${index} is out of bounds for length ${length}",
      ("index", index)("length", text.size()) );
   return text[ index ];
}

std::string interpolated_string::sub_sequence( std::size_t start, std::size_t end ) const
{
   std::string text = to_string();
   LAZYSTR_ASSERT( start <= end && end <= text.size(), index_out_of_bounds,
      "range [${start}, ${end}) is out of bounds for length ${length}",
      ("start", start)("end", end)("length", text.size()) );
   return text.substr( start, end - start );
}

std::regex interpolated_string::to_pattern( std::regex::flag_type flags ) const
{
   return std::regex( to_string(), flags );
}

std::vector< std::byte > interpolated_string::get_bytes( const render_config& config ) const
{
   std::string text = to_string( config );
   std::string encoded;

   try
   {
      encoded = boost::locale::conv::from_utf( text, config.default_charset, boost::locale::conv::stop );
   }
   catch ( const boost::locale::conv::invalid_charset_error& )
   {
      LAZYSTR_THROW( unsupported_encoding, "unsupported encoding ${charset}", ("charset", config.default_charset) );
   }
   catch ( const boost::locale::conv::conversion_error& )
   {
      LAZYSTR_THROW( unencodable_text, "rendered text cannot be encoded as ${charset}", ("charset", config.default_charset) );
   }

   std::vector< std::byte > bytes( encoded.size() );
   std::transform( encoded.begin(), encoded.end(), bytes.begin(), []( char c ) { return static_cast< std::byte >( c ); } );
   return bytes;
}

std::vector< std::byte > interpolated_string::get_bytes( const std::string& charset ) const
{
   render_config config = default_render_config();
   config.default_charset = charset;
   return get_bytes( config );
}

interpolated_string operator+( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.concat( rhs );
}

interpolated_string operator+( const interpolated_string& lhs, const std::string& rhs )
{
   return lhs.concat( rhs );
}

bool operator==( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.equals( rhs );
}

bool operator!=( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return !lhs.equals( rhs );
}

bool operator<( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.compare( rhs ) < 0;
}

bool operator<=( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.compare( rhs ) <= 0;
}

bool operator>( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.compare( rhs ) > 0;
}

bool operator>=( const interpolated_string& lhs, const interpolated_string& rhs )
{
   return lhs.compare( rhs ) >= 0;
}

std::ostream& operator<<( std::ostream& out, const interpolated_string& s )
{
   return s.write_to( out );
}

std::size_t hash_value( const interpolated_string& s )
{
   return s.hash_code();
}

} // lazystr
