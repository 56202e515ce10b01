#pragma once
#include <string>
#include <string_view>

namespace tether::url {

// encode_reserved also escapes the characters that delimit paths and
// queries ('/', '&', '=', ...), for use inside a query component.
std::string percent_encode(std::string_view input, bool encode_reserved = false);
// plus_as_space decodes '+' as a space, as in form-encoded query strings.
// A '%' not followed by two hex digits is kept as is.
std::string percent_decode(std::string_view input, bool plus_as_space = false);

} // namespace tether::url
