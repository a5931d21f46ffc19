#pragma once
#include <lazystr/string/interpolated_string.hpp>
#include <lazystr/string/value.hpp>

#include <nlohmann/json.hpp>

namespace lazystr {

/*
 * An interpolated string is serialized as a flat record of its fragments and
 * values:
 *
 *    { "fragments": [ "a", "b" ], "values": [ 1 ] }
 *
 * Values map to the matching json type. Lists become arrays and nested
 * interpolated strings become nested records. Closures and objects have no
 * json form and throw unserializable_value.
 */

void to_json( nlohmann::json& j, const value& v );
void from_json( const nlohmann::json& j, value& v );

void to_json( nlohmann::json& j, const interpolated_string& s );
void from_json( const nlohmann::json& j, interpolated_string& s );

} // lazystr
