#include <lazystr/string/builder.hpp>
#include <lazystr/string/coercion.hpp>

namespace lazystr {

builder::~builder() = default;

markup_builder::markup_builder( std::ostream& out, render_config config ) :
   _out( out ),
   _config( std::move( config ) )
{}

markup_builder::~markup_builder() = default;

void markup_builder::yield_literal( const std::string& text )
{
   _out << escape_markup( text );
   detail::check_sink_state( _out );
}

void markup_builder::yield_value( const value& v )
{
   _out << escape_markup( to_string( v, _config ) );
   detail::check_sink_state( _out );
}

void markup_builder::yield_unescaped( const std::string& text )
{
   _out << text;
   detail::check_sink_state( _out );
}

std::string escape_markup( const std::string& text )
{
   std::string result;
   result.reserve( text.size() );

   for ( char c : text )
   {
      switch ( c )
      {
         case '&':
            result += "&amp;";
            break;
         case '<':
            result += "&lt;";
            break;
         case '>':
            result += "&gt;";
            break;
         case '"':
            result += "&quot;";
            break;
         case '\'':
            result += "&apos;";
            break;
         default:
            result += c;
      }
   }

   return result;
}

} // lazystr
