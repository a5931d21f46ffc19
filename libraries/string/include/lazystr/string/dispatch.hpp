#pragma once
#include <lazystr/string/exceptions.hpp>
#include <lazystr/string/interpolated_string.hpp>
#include <lazystr/string/value.hpp>

#include <boost/container/flat_map.hpp>

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace lazystr::dispatch {

using arguments = std::vector< value >;

/**
 * Returned when the receiver has no method of the requested name.
 */
struct unsupported_operation
{
   std::string name;
};

using dispatch_result = std::variant< value, unsupported_operation >;

/**
 * A registry of named methods callable on a Receiver.
 *
 * Methods are looked up by name only. A registered method validates its own
 * arguments and throws invalid_method_arguments when they do not fit.
 */
template< typename Receiver >
class method_table
{
   public:
      using method = std::function< value( const Receiver&, const arguments& ) >;

      void register_method( const std::string& name, method m )
      {
         _methods.insert_or_assign( name, std::move( m ) );
      }

      bool method_exists( const std::string& name ) const
      {
         return _methods.find( name ) != _methods.end();
      }

      dispatch_result call( const Receiver& receiver, const std::string& name, const arguments& args ) const
      {
         auto it = _methods.find( name );
         if ( it == _methods.end() )
            return unsupported_operation{ name };

         return it->second( receiver, args );
      }

   private:
      boost::container::flat_map< std::string, method > _methods;
};

/**
 * Methods implemented by interpolated_string itself.
 */
const method_table< interpolated_string >& native_methods();

/**
 * Methods of plain text, the target of forwarded calls.
 */
const method_table< std::string >& text_methods();

dispatch_result invoke_native( const interpolated_string& s, const std::string& name, const arguments& args = {} );
dispatch_result invoke_text( const std::string& text, const std::string& name, const arguments& args = {} );

/**
 * Call a method on an interpolated string.
 *
 * The call is handled natively when possible. Otherwise the string is
 * rendered and the call is forwarded to the rendered text.
 *
 * - Throws missing_method if neither supports name
 * - Throws invalid_method_arguments if the arguments do not fit the method
 */
value invoke( const interpolated_string& s, const std::string& name, const arguments& args = {} );

} // lazystr::dispatch
