#include <lazystr/exception.hpp>

#include <sstream>

namespace lazystr {

namespace detail {

std::string substitute( const std::string& format, const nlohmann::json& details )
{
   std::string result;
   result.reserve( format.size() );

   std::size_t pos = 0;
   while ( pos < format.size() )
   {
      auto open = format.find( "${", pos );
      if ( open == std::string::npos )
         break;

      result.append( format, pos, open - pos );

      if ( open + 2 < format.size() && format[ open + 2 ] == '$' )
      {
         result.append( format, open, 3 );
         pos = open + 3;
         continue;
      }

      auto close = format.find( '}', open + 2 );
      if ( close == std::string::npos )
      {
         pos = open;
         break;
      }

      auto it = details.find( format.substr( open + 2, close - open - 2 ) );
      if ( it == details.end() )
         result.append( format, open, close - open + 1 );
      else if ( it->is_string() )
         result += it->get< std::string >();
      else
         result += it->dump();

      pos = close + 1;
   }

   if ( pos < format.size() )
      result.append( format, pos, std::string::npos );

   return result;
}

} // detail

exception::exception( std::string format ) :
   _format( std::move( format ) ),
   _message( _format )
{}

const char* exception::what() const noexcept
{
   return _message.c_str();
}

const std::string& exception::get_message() const
{
   return _message;
}

const nlohmann::json& exception::get_json() const
{
   return _details;
}

std::string exception::get_stacktrace() const
{
   std::stringstream ss;
   if ( auto trace = boost::get_error_info< detail::exception_stacktrace >( *this ) )
      ss << *trace;
   return ss.str();
}

} // lazystr
