#pragma once
#include <lazystr/string/render_config.hpp>

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace lazystr {

class value;
class builder;

/**
 * A string with embedded values, such as "hello there ${user} how are you?",
 * that is rendered lazily.
 *
 * An instance is an alternation of literal fragments and value slots:
 * fragments[0], values[0], fragments[1], values[1], ... There is either one
 * fragment per value, or one more fragment than values when the string ends
 * in a literal. Nothing is converted to text until the instance is rendered,
 * and every render re-evaluates the closures it holds.
 *
 * Instances are immutable. Copies share the same fragment and value arrays,
 * and every transformation returns a new instance.
 *
 * IMPORTANT: equality, ordering and hashing are defined on the *rendered*
 * text, not on the fragment/value structure. Two instances with different
 * shapes are equal when they render the same text, and an instance holding a
 * closure whose output varies between calls may compare unequal to itself.
 * Callers that need structural identity must compare fragments() and
 * values() themselves.
 */
class interpolated_string final
{
   public:
      /**
       * Constructs the empty string: a single empty fragment and no values.
       */
      interpolated_string();

      /**
       * Constructs a single fragment string with no values.
       */
      explicit interpolated_string( std::string text );

      /**
       * Constructs a string from its fragments and values.
       *
       * - Throws malformed_interpolated_string unless
       *   fragments.size() == values.size() or fragments.size() == values.size() + 1
       */
      interpolated_string( std::vector< std::string > fragments, std::vector< value > values );

      interpolated_string( const interpolated_string& ) = default;
      interpolated_string( interpolated_string&& ) = default;
      ~interpolated_string() = default;

      interpolated_string& operator=( const interpolated_string& ) = default;
      interpolated_string& operator=( interpolated_string&& ) = default;

      /**
       * The shared empty string.
       */
      static const interpolated_string& empty_instance();

      const std::vector< std::string >& fragments() const;
      const std::vector< value >& values() const;

      std::size_t value_count() const;

      /**
       * Throws index_out_of_bounds if idx >= value_count()
       */
      const value& get_value( std::size_t idx ) const;

      /**
       * Render the string to out.
       *
       * - Zero parameter closures are called and their result is rendered
       * - Single parameter closures are called with out and write to it directly
       * - Closures taking more parameters throw closure_arity_error
       * - A stream that throws (see std::ios::exceptions) propagates its failure,
       *   otherwise a failed stream throws sink_failure
       */
      std::ostream& write_to( std::ostream& out, const render_config& config = default_render_config() ) const;

      /**
       * Render the string to a new std::string.
       *
       * Failures of the in-memory stream are reported as string_writer_failure.
       */
      std::string to_string( const render_config& config = default_render_config() ) const;

      /**
       * Emit the fragments and values, in order, to a structured output builder.
       */
      void build( builder& b ) const;

      /**
       * Append that to this string without rendering either.
       *
       * When this string ends in a literal, its last fragment is joined with
       * the first fragment of that so no empty bridging fragment is created.
       */
      interpolated_string concat( const interpolated_string& that ) const;
      interpolated_string concat( const std::string& that ) const;

      bool equals( const interpolated_string& that ) const;
      int compare( const interpolated_string& that ) const;
      int compare( const std::string& that ) const;
      std::size_t hash_code() const;

      std::size_t length() const;
      char char_at( std::size_t index ) const;
      std::string sub_sequence( std::size_t start, std::size_t end ) const;

      /**
       * Compile the rendered text as a regular expression. std::regex_error
       * is propagated as is.
       */
      std::regex to_pattern( std::regex::flag_type flags = std::regex::ECMAScript ) const;

      /**
       * Encode the rendered text.
       *
       * - Throws unsupported_encoding if the charset is unknown
       * - Throws unencodable_text if the text cannot be represented in the charset
       */
      std::vector< std::byte > get_bytes( const render_config& config = default_render_config() ) const;
      std::vector< std::byte > get_bytes( const std::string& charset ) const;

   private:
      std::shared_ptr< const std::vector< std::string > > _fragments;
      std::shared_ptr< const std::vector< value > >       _values;
};

interpolated_string operator+( const interpolated_string& lhs, const interpolated_string& rhs );
interpolated_string operator+( const interpolated_string& lhs, const std::string& rhs );

bool operator==( const interpolated_string& lhs, const interpolated_string& rhs );
bool operator!=( const interpolated_string& lhs, const interpolated_string& rhs );
bool operator< ( const interpolated_string& lhs, const interpolated_string& rhs );
bool operator<=( const interpolated_string& lhs, const interpolated_string& rhs );
bool operator> ( const interpolated_string& lhs, const interpolated_string& rhs );
bool operator>=( const interpolated_string& lhs, const interpolated_string& rhs );

std::ostream& operator<<( std::ostream& out, const interpolated_string& s );

std::size_t hash_value( const interpolated_string& s );

} // lazystr

namespace std {

template<>
struct hash< lazystr::interpolated_string >
{
   std::size_t operator()( const lazystr::interpolated_string& s ) const
   {
      return s.hash_code();
   }
};

} // std

// Constructing an interpolated_string needs a complete value
#include <lazystr/string/value.hpp>
