#pragma once
#include <lazystr/string/exceptions.hpp>
#include <lazystr/string/interpolated_string.hpp>

#include <boost/callable_traits/args.hpp>
#include <boost/callable_traits/return_type.hpp>
#include <boost/core/demangle.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <variant>
#include <vector>

namespace lazystr {

class value;

using list = std::vector< value >;

namespace detail {

template< typename T, typename = void >
struct has_call_operator : std::false_type {};

template< typename T >
struct has_call_operator< T, std::void_t< decltype( &T::operator() ) > > : std::true_type {};

template< typename T >
constexpr bool is_closure_like_v =
   std::is_function_v< std::remove_pointer_t< T > > || has_call_operator< T >::value;

struct object_concept
{
   virtual ~object_concept() = default;

   virtual void write( std::ostream& out ) const = 0;
   virtual std::string type_name() const = 0;
};

template< typename T >
struct object_model final : object_concept
{
   template< typename U >
   explicit object_model( U&& u ) : _t( std::forward< U >( u ) ) {}

   void write( std::ostream& out ) const override
   {
      out << _t;
   }

   std::string type_name() const override
   {
      return boost::core::demangle( typeid( T ).name() );
   }

   T _t;
};

} // detail

/**
 * A deferred computation embedded in an interpolated string.
 *
 * The parameter count is taken from the callable's signature and decides how
 * the closure is rendered:
 *
 * - 0 parameters: the closure is called and its result is rendered in place
 * - 1 parameter:  the closure is called with the output stream and writes to it
 * - otherwise:    rendering fails with closure_arity_error
 *
 * Generic lambdas have no fixed signature and cannot be wrapped.
 */
class closure final
{
   public:
      using nullary_function = std::function< value() >;
      using sink_function    = std::function< void( std::ostream& ) >;

      template< typename F, typename = std::enable_if_t< detail::is_closure_like_v< std::decay_t< F > > > >
      closure( F&& f );

      std::size_t parameter_count() const;

      value call() const;
      void call( std::ostream& out ) const;

   private:
      std::size_t      _parameter_count = 0;
      nullary_function _nullary;
      sink_function    _unary;
};

/**
 * An arbitrary embedded object, rendered with its operator<<.
 */
class object final
{
   public:
      template< typename T, typename = std::enable_if_t< !std::is_same_v< std::decay_t< T >, object > > >
      explicit object( T&& t ) :
         _impl( std::make_shared< detail::object_model< std::decay_t< T > > >( std::forward< T >( t ) ) )
      {}

      void write( std::ostream& out ) const;
      std::string type_name() const;

   private:
      std::shared_ptr< const detail::object_concept > _impl;
};

/**
 * A value embedded in an interpolated string.
 */
class value final
{
   public:
      using variant_type = std::variant<
         std::nullptr_t,
         bool,
         int64_t,
         uint64_t,
         double,
         std::string,
         list,
         interpolated_string,
         closure,
         object >;

      value();
      value( std::nullptr_t );
      value( bool b );
      value( char c );
      value( const char* s );
      value( std::string s );
      value( list l );
      value( interpolated_string s );
      value( closure c );
      value( object o );

      template< typename T, std::enable_if_t< std::is_integral_v< T > && std::is_signed_v< T > && !std::is_same_v< T, char >, int > = 0 >
      value( T i ) : _v( int64_t( i ) ) {}

      template< typename T, std::enable_if_t< std::is_integral_v< T > && std::is_unsigned_v< T > && !std::is_same_v< T, bool > && !std::is_same_v< T, char >, int > = 0 >
      value( T u ) : _v( uint64_t( u ) ) {}

      template< typename T, std::enable_if_t< std::is_floating_point_v< T >, int > = 0 >
      value( T d ) : _v( double( d ) ) {}

      template< typename F, std::enable_if_t< detail::is_closure_like_v< std::decay_t< F > >, int > = 0 >
      value( F&& f ) : _v( closure( std::forward< F >( f ) ) ) {}

      bool is_null() const;

      template< typename T >
      bool is() const
      {
         return std::holds_alternative< T >( _v );
      }

      /**
       * Throws bad_value_access if the value does not hold a T.
       */
      template< typename T >
      const T& get() const
      {
         auto ptr = std::get_if< T >( &_v );
         LAZYSTR_ASSERT( ptr != nullptr, bad_value_access, "value does not hold a ${type}",
            ("type", boost::core::demangle( typeid( T ).name() )) );
         return *ptr;
      }

      const variant_type& as_variant() const;

   private:
      variant_type _v;
};

template< typename F, typename >
closure::closure( F&& f )
{
   using callable_type = std::decay_t< F >;
   using args_type     = boost::callable_traits::args_t< callable_type >;
   using result_type   = boost::callable_traits::return_type_t< callable_type >;

   constexpr std::size_t arity = std::tuple_size_v< args_type >;
   _parameter_count = arity;

   if constexpr ( arity == 0 )
   {
      if constexpr ( std::is_void_v< result_type > )
      {
         _nullary = [fn = callable_type( std::forward< F >( f ) )]() mutable -> value
         {
            fn();
            return value();
         };
      }
      else
      {
         _nullary = [fn = callable_type( std::forward< F >( f ) )]() mutable -> value
         {
            return value( fn() );
         };
      }
   }
   else if constexpr ( arity == 1 )
   {
      _unary = [fn = callable_type( std::forward< F >( f ) )]( std::ostream& out ) mutable
      {
         fn( out );
      };
   }
}

} // lazystr
