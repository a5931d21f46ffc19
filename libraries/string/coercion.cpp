#include <lazystr/string/coercion.hpp>
#include <lazystr/util.hpp>

#include <sstream>

namespace lazystr {

namespace detail {

void check_sink_state( std::ostream& out )
{
   LAZYSTR_ASSERT( !out.fail(), sink_failure, "output sink failed while rendering" );
}

void write_closure( std::ostream& out, const closure& c, const render_config& config )
{
   switch ( c.parameter_count() )
   {
      case 0:
         write_value( out, c.call(), config );
         break;
      case 1:
         c.call( out );
         break;
      default:
         LAZYSTR_THROW( closure_arity_error,
            "trying to evaluate an interpolated string containing a closure taking ${parameters} parameters",
            ("parameters", c.parameter_count()) );
   }
}

void write_list( std::ostream& out, const list& l, const render_config& config )
{
   out << "[";
   for ( std::size_t i = 0; i < l.size(); i++ )
   {
      if ( i > 0 )
         out << ", ";
      write_value( out, l[ i ], config );
   }
   out << "]";
}

// Independent of any formatting flags set on the sink
std::string format_double( double d )
{
   std::ostringstream ss;
   ss << d;
   return ss.str();
}

} // detail

const render_config& default_render_config()
{
   static const render_config config;
   return config;
}

std::ostream& write_value( std::ostream& out, const value& v, const render_config& config )
{
   std::visit( overloaded {
      [&]( std::nullptr_t )               { out << config.null_text; },
      [&]( bool b )                       { out << ( b ? "true" : "false" ); },
      [&]( int64_t i )                    { out << std::to_string( i ); },
      [&]( uint64_t u )                   { out << std::to_string( u ); },
      [&]( double d )                     { out << detail::format_double( d ); },
      [&]( const std::string& s )         { out << s; },
      [&]( const list& l )                { detail::write_list( out, l, config ); },
      [&]( const interpolated_string& s ) { s.write_to( out, config ); },
      [&]( const closure& c )             { detail::write_closure( out, c, config ); },
      [&]( const object& o )              { o.write( out ); }
   }, v.as_variant() );

   detail::check_sink_state( out );
   return out;
}

std::string to_string( const value& v, const render_config& config )
{
   std::ostringstream ss;
   write_value( ss, v, config );
   return ss.str();
}

} // lazystr
