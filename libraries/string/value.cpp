#include <lazystr/string/value.hpp>

namespace lazystr {

std::size_t closure::parameter_count() const
{
   return _parameter_count;
}

value closure::call() const
{
   LAZYSTR_ASSERT( _parameter_count == 0, closure_arity_error,
      "closure taking ${parameters} parameters called without arguments", ("parameters", _parameter_count) );
   return _nullary();
}

void closure::call( std::ostream& out ) const
{
   LAZYSTR_ASSERT( _parameter_count == 1, closure_arity_error,
      "closure taking ${parameters} parameters called with an output stream", ("parameters", _parameter_count) );
   _unary( out );
}

void object::write( std::ostream& out ) const
{
   _impl->write( out );
}

std::string object::type_name() const
{
   return _impl->type_name();
}

value::value() : _v( nullptr ) {}
value::value( std::nullptr_t ) : _v( nullptr ) {}
value::value( bool b ) : _v( b ) {}
value::value( char c ) : _v( std::string( 1, c ) ) {}
value::value( const char* s ) : _v( nullptr )
{
   if ( s != nullptr )
      _v = std::string( s );
}

value::value( std::string s ) : _v( std::move( s ) ) {}
value::value( list l ) : _v( std::move( l ) ) {}
value::value( interpolated_string s ) : _v( std::move( s ) ) {}
value::value( closure c ) : _v( std::move( c ) ) {}
value::value( object o ) : _v( std::move( o ) ) {}

bool value::is_null() const
{
   return std::holds_alternative< std::nullptr_t >( _v );
}

const value::variant_type& value::as_variant() const
{
   return _v;
}

} // lazystr
