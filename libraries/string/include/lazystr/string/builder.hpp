#pragma once
#include <lazystr/string/render_config.hpp>

#include <ostream>
#include <string>

namespace lazystr {

class value;

/**
 * Receives the pieces of an interpolated string as discrete events so a
 * structured document can keep literals and values as separate nodes.
 */
class builder
{
   public:
      virtual ~builder();

      virtual void yield_literal( const std::string& text ) = 0;
      virtual void yield_value( const value& v ) = 0;
};

/**
 * Writes yielded text to a stream with markup special characters escaped.
 * Values are coerced to text before escaping.
 */
class markup_builder final : public builder
{
   public:
      explicit markup_builder( std::ostream& out, render_config config = default_render_config() );
      ~markup_builder() override;

      void yield_literal( const std::string& text ) override;
      void yield_value( const value& v ) override;

      /**
       * Write text as is, without escaping.
       */
      void yield_unescaped( const std::string& text );

   private:
      std::ostream& _out;
      render_config _config;
};

std::string escape_markup( const std::string& text );

} // lazystr
