#pragma once

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

#define _DETAIL_LAZYSTR_CAPTURE_VA_ARGS( ... ) lazystr_captures __VA_ARGS__

/**
 * Throw exc_name with a message template and an optional bubble list of
 * details, for example:
 *
 *    LAZYSTR_THROW( index_out_of_bounds, "index ${index} out of range", ("index", i) );
 *
 * Every detail is stored as json and substituted into its ${key} slot.
 */
#define LAZYSTR_THROW( exc_name, msg, ... )                                          \
do {                                                                                 \
   exc_name lazystr_thrown( msg );                                                   \
   lazystr::detail::capture_list lazystr_captures( lazystr_thrown );                 \
   _DETAIL_LAZYSTR_CAPTURE_VA_ARGS( __VA_ARGS__ );                                   \
   BOOST_THROW_EXCEPTION(                                                            \
      lazystr_thrown                                                                 \
      << lazystr::detail::exception_stacktrace( boost::stacktrace::stacktrace() )    \
   );                                                                                \
} while( 0 )

#define LAZYSTR_ASSERT( cond, exc_name, msg, ... )     \
   do {                                                \
      if( !(cond) )                                    \
      {                                                \
         LAZYSTR_THROW( exc_name, msg, __VA_ARGS__ );  \
      }                                                \
   } while( 0 )

#define LAZYSTR_DECLARE_EXCEPTION( exc_name ) \
   LAZYSTR_DECLARE_DERIVED_EXCEPTION( exc_name, lazystr::exception )

#define LAZYSTR_DECLARE_DERIVED_EXCEPTION( exc_name, base )                     \
   struct exc_name : public base                                                \
   {                                                                            \
      exc_name() = default;                                                     \
      explicit exc_name( std::string format ) : base( std::move( format ) ) {}  \
   };

namespace lazystr {

namespace detail {

using exception_stacktrace = boost::error_info< struct stacktrace_tag, boost::stacktrace::stacktrace >;

/**
 * Replace each ${key} in format with the matching entry of details.
 *
 * Strings are inserted without quotes, everything else as compact json.
 * Unknown keys and an unterminated ${ are left as written, and ${$ is kept
 * as a literal ${.
 */
std::string substitute( const std::string& format, const nlohmann::json& details );

} // detail

class exception : public virtual boost::exception, public virtual std::exception
{
   public:
      exception() = default;
      explicit exception( std::string format );

      const char* what() const noexcept override;

      const std::string& get_message() const;
      const nlohmann::json& get_json() const;
      std::string get_stacktrace() const;

      /**
       * Record a detail and substitute it into the message.
       */
      template< typename T >
      exception& capture( const std::string& key, const T& t )
      {
         _details[ key ] = t;
         _message = detail::substitute( _format, _details );
         return *this;
      }

   private:
      std::string    _format;
      std::string    _message;
      nlohmann::json _details = nlohmann::json::object();
};

namespace detail {

// Receives the bubble list of LAZYSTR_THROW: ("key", value)("key", value)...
class capture_list
{
   public:
      explicit capture_list( exception& e ) : _e( e ) {}

      capture_list& operator()()
      {
         return *this;
      }

      template< typename T >
      capture_list& operator()( const std::string& key, const T& t )
      {
         _e.capture( key, t );
         return *this;
      }

   private:
      exception& _e;
};

} // detail

} // lazystr
