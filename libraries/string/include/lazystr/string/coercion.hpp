#pragma once
#include <lazystr/string/render_config.hpp>
#include <lazystr/string/value.hpp>

#include <ostream>
#include <string>

namespace lazystr {

namespace detail {

/**
 * Throws sink_failure if out has failed.
 */
void check_sink_state( std::ostream& out );

} // detail

/**
 * Write the text form of a value.
 *
 * - null is written as config.null_text
 * - booleans are written as true or false, numbers in decimal
 * - lists are written as [a, b, c], each element coerced the same way
 * - interpolated strings are rendered in place
 * - closures follow the rendering rules of interpolated_string::write_to
 * - objects are written with their operator<<
 */
std::ostream& write_value( std::ostream& out, const value& v, const render_config& config = default_render_config() );

std::string to_string( const value& v, const render_config& config = default_render_config() );

} // lazystr
