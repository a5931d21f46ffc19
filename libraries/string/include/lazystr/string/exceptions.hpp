#pragma once
#include <lazystr/exception.hpp>

namespace lazystr {

LAZYSTR_DECLARE_EXCEPTION( interpolation_exception );

// Construction exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( malformed_interpolated_string, interpolation_exception );

// Render exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( configuration_error, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( closure_arity_error, configuration_error );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( sink_failure, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( string_writer_failure, interpolation_exception );

// Text exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( index_out_of_bounds, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( bad_value_access, interpolation_exception );

// Encoding exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( encoding_exception, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( unsupported_encoding, encoding_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( unencodable_text, encoding_exception );

// Dispatch exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( missing_method, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( invalid_method_arguments, interpolation_exception );

// Serialization exceptions
LAZYSTR_DECLARE_DERIVED_EXCEPTION( serialization_exception, interpolation_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( unserializable_value, serialization_exception );
LAZYSTR_DECLARE_DERIVED_EXCEPTION( malformed_record, serialization_exception );

} // lazystr
