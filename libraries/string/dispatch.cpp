#include <lazystr/string/dispatch.hpp>

#include <lazystr/log.hpp>

#include <boost/algorithm/string.hpp>

#include <regex>

namespace lazystr::dispatch {

namespace detail {

void expect_arguments( const std::string& method, const arguments& args, std::size_t min, std::size_t max )
{
   LAZYSTR_ASSERT( args.size() >= min && args.size() <= max, invalid_method_arguments,
      "method ${method} takes ${min} to ${max} arguments, ${count} given",
      ("method", method)("min", min)("max", max)("count", args.size()) );
}

std::size_t index_argument( const std::string& method, const arguments& args, std::size_t i )
{
   const auto& v = args[ i ];

   if ( v.is< uint64_t >() )
      return std::size_t( v.get< uint64_t >() );

   if ( v.is< int64_t >() && v.get< int64_t >() >= 0 )
      return std::size_t( v.get< int64_t >() );

   LAZYSTR_THROW( invalid_method_arguments, "argument ${position} of ${method} must be a non-negative integer",
      ("position", i)("method", method) );
}

std::string text_argument( const std::string& method, const arguments& args, std::size_t i )
{
   const auto& v = args[ i ];

   if ( v.is< std::string >() )
      return v.get< std::string >();

   if ( v.is< interpolated_string >() )
      return v.get< interpolated_string >().to_string();

   LAZYSTR_THROW( invalid_method_arguments, "argument ${position} of ${method} must be text",
      ("position", i)("method", method) );
}

bool is_text( const value& v )
{
   return v.is< std::string >() || v.is< interpolated_string >();
}

int64_t sign( int c )
{
   return ( c > 0 ) - ( c < 0 );
}

method_table< std::string > make_text_methods()
{
   method_table< std::string > table;

   table.register_method( "length", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "length", args, 0, 0 );
      return uint64_t( text.size() );
   } );

   table.register_method( "is_empty", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "is_empty", args, 0, 0 );
      return text.empty();
   } );

   table.register_method( "char_at", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "char_at", args, 1, 1 );
      auto index = index_argument( "char_at", args, 0 );
      LAZYSTR_ASSERT( index < text.size(), index_out_of_bounds,
         "index ${index} is out of bounds for length ${length}", ("index", index)("length", text.size()) );
      return text[ index ];
   } );

   auto substring = []( const std::string& method )
   {
      return [method]( const std::string& text, const arguments& args ) -> value
      {
         expect_arguments( method, args, 1, 2 );
         auto start = index_argument( method, args, 0 );
         auto end = args.size() > 1 ? index_argument( method, args, 1 ) : text.size();
         LAZYSTR_ASSERT( start <= end && end <= text.size(), index_out_of_bounds,
            "range [${start}, ${end}) is out of bounds for length ${length}",
            ("start", start)("end", end)("length", text.size()) );
         return text.substr( start, end - start );
      };
   };

   table.register_method( "sub_sequence", substring( "sub_sequence" ) );
   table.register_method( "substring", substring( "substring" ) );

   table.register_method( "to_upper_case", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "to_upper_case", args, 0, 0 );
      return boost::algorithm::to_upper_copy( text );
   } );

   table.register_method( "to_lower_case", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "to_lower_case", args, 0, 0 );
      return boost::algorithm::to_lower_copy( text );
   } );

   table.register_method( "trim", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "trim", args, 0, 0 );
      return boost::algorithm::trim_copy( text );
   } );

   table.register_method( "starts_with", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "starts_with", args, 1, 1 );
      return boost::algorithm::starts_with( text, text_argument( "starts_with", args, 0 ) );
   } );

   table.register_method( "ends_with", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "ends_with", args, 1, 1 );
      return boost::algorithm::ends_with( text, text_argument( "ends_with", args, 0 ) );
   } );

   table.register_method( "contains", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "contains", args, 1, 1 );
      return boost::algorithm::contains( text, text_argument( "contains", args, 0 ) );
   } );

   table.register_method( "index_of", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "index_of", args, 1, 2 );
      auto from = args.size() > 1 ? index_argument( "index_of", args, 1 ) : 0;
      auto pos = text.find( text_argument( "index_of", args, 0 ), from );
      return pos == std::string::npos ? int64_t( -1 ) : int64_t( pos );
   } );

   table.register_method( "replace", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "replace", args, 2, 2 );
      auto target = text_argument( "replace", args, 0 );
      LAZYSTR_ASSERT( !target.empty(), invalid_method_arguments, "replace requires a non-empty target" );
      return boost::algorithm::replace_all_copy( text, target, text_argument( "replace", args, 1 ) );
   } );

   table.register_method( "split", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "split", args, 1, 1 );
      auto separator = text_argument( "split", args, 0 );
      LAZYSTR_ASSERT( !separator.empty(), invalid_method_arguments, "split requires a non-empty separator" );

      std::vector< std::string > parts;
      boost::algorithm::iter_split( parts, text, boost::algorithm::first_finder( separator ) );

      list result;
      for ( auto& part : parts )
         result.emplace_back( std::move( part ) );
      return value( std::move( result ) );
   } );

   table.register_method( "reverse", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "reverse", args, 0, 0 );
      return std::string( text.rbegin(), text.rend() );
   } );

   table.register_method( "matches", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "matches", args, 1, 1 );
      return std::regex_match( text, std::regex( text_argument( "matches", args, 0 ) ) );
   } );

   table.register_method( "equals", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "equals", args, 1, 1 );
      return is_text( args[ 0 ] ) && text == text_argument( "equals", args, 0 );
   } );

   table.register_method( "compare_to", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "compare_to", args, 1, 1 );
      return sign( text.compare( text_argument( "compare_to", args, 0 ) ) );
   } );

   table.register_method( "to_string", []( const std::string& text, const arguments& args ) -> value
   {
      expect_arguments( "to_string", args, 0, 0 );
      return text;
   } );

   return table;
}

method_table< interpolated_string > make_native_methods()
{
   method_table< interpolated_string > table;

   table.register_method( "length", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "length", args, 0, 0 );
      return uint64_t( s.length() );
   } );

   table.register_method( "char_at", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "char_at", args, 1, 1 );
      return s.char_at( index_argument( "char_at", args, 0 ) );
   } );

   table.register_method( "sub_sequence", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "sub_sequence", args, 1, 2 );
      auto start = index_argument( "sub_sequence", args, 0 );
      if ( args.size() == 1 )
      {
         // Render once so the end is the length of the same text
         auto text = s.to_string();
         LAZYSTR_ASSERT( start <= text.size(), index_out_of_bounds,
            "range [${start}, ${end}) is out of bounds for length ${length}",
            ("start", start)("end", text.size())("length", text.size()) );
         return text.substr( start );
      }

      return s.sub_sequence( start, index_argument( "sub_sequence", args, 1 ) );
   } );

   table.register_method( "to_string", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "to_string", args, 0, 0 );
      return s.to_string();
   } );

   table.register_method( "value_count", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "value_count", args, 0, 0 );
      return uint64_t( s.value_count() );
   } );

   table.register_method( "get_value", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "get_value", args, 1, 1 );
      return s.get_value( index_argument( "get_value", args, 0 ) );
   } );

   table.register_method( "plus", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "plus", args, 1, 1 );

      if ( args[ 0 ].is< interpolated_string >() )
         return s.concat( args[ 0 ].get< interpolated_string >() );

      return s.concat( text_argument( "plus", args, 0 ) );
   } );

   table.register_method( "equals", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "equals", args, 1, 1 );
      return args[ 0 ].is< interpolated_string >() && s.equals( args[ 0 ].get< interpolated_string >() );
   } );

   table.register_method( "compare_to", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "compare_to", args, 1, 1 );
      return int64_t( s.compare( text_argument( "compare_to", args, 0 ) ) );
   } );

   table.register_method( "hash_code", []( const interpolated_string& s, const arguments& args ) -> value
   {
      expect_arguments( "hash_code", args, 0, 0 );
      return uint64_t( s.hash_code() );
   } );

   return table;
}

} // detail

const method_table< interpolated_string >& native_methods()
{
   static const method_table< interpolated_string > table = detail::make_native_methods();
   return table;
}

const method_table< std::string >& text_methods()
{
   static const method_table< std::string > table = detail::make_text_methods();
   return table;
}

dispatch_result invoke_native( const interpolated_string& s, const std::string& name, const arguments& args )
{
   return native_methods().call( s, name, args );
}

dispatch_result invoke_text( const std::string& text, const std::string& name, const arguments& args )
{
   return text_methods().call( text, name, args );
}

value invoke( const interpolated_string& s, const std::string& name, const arguments& args )
{
   auto result = invoke_native( s, name, args );
   if ( auto v = std::get_if< value >( &result ) )
      return std::move( *v );

   LOG( debug ) << "Forwarding " << name << " to the rendered text of an interpolated string";

   auto forwarded = invoke_text( s.to_string(), name, args );
   if ( auto v = std::get_if< value >( &forwarded ) )
      return std::move( *v );

   LAZYSTR_THROW( missing_method, "no method ${name} on an interpolated string or its rendered text", ("name", name) );
}

} // lazystr::dispatch
