#pragma once

#include <string>

namespace lazystr {

struct render_config
{
   // Text written for a null value
   std::string null_text       = "null";
   // Charset used by get_bytes() when none is named
   std::string default_charset = "UTF-8";
};

const render_config& default_render_config();

} // lazystr
